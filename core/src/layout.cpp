// Flux - Particle Layout Implementation

#include <flux/layout.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <sstream>
#include <utility>

namespace flux {

namespace {

constexpr const char* LIFECYCLE_FIELDS[] = {"age", "alive", "scale"};

bool isLifecycleName(const std::string& name) {
    for (const char* f : LIFECYCLE_FIELDS) {
        if (name == f) return true;
    }
    return false;
}

uint32_t alignUp(uint32_t value, uint32_t alignment) {
    return (value + alignment - 1) / alignment * alignment;
}

} // namespace

// =============================================================================
// Field Types
// =============================================================================

uint32_t fieldTypeSize(FieldType type) {
    switch (type) {
        case FieldType::F32: return 4;
        case FieldType::Vec2: return 8;
        case FieldType::Vec3: return 12;
        case FieldType::Vec4: return 16;
        case FieldType::U32: return 4;
        case FieldType::I32: return 4;
    }
    return 4;
}

uint32_t fieldTypeAlign(FieldType type) {
    switch (type) {
        case FieldType::Vec2: return 8;
        case FieldType::Vec3:
        case FieldType::Vec4: return 16;
        default: return 4;
    }
}

uint32_t componentCount(FieldType type) {
    switch (type) {
        case FieldType::Vec2: return 2;
        case FieldType::Vec3: return 3;
        case FieldType::Vec4: return 4;
        default: return 1;
    }
}

const char* wgslTypeName(FieldType type) {
    switch (type) {
        case FieldType::F32: return "f32";
        case FieldType::Vec2: return "vec2<f32>";
        case FieldType::Vec3: return "vec3<f32>";
        case FieldType::Vec4: return "vec4<f32>";
        case FieldType::U32: return "u32";
        case FieldType::I32: return "i32";
    }
    return "f32";
}

const char* fieldTypeName(FieldType type) {
    switch (type) {
        case FieldType::F32: return "f32";
        case FieldType::Vec2: return "vec2";
        case FieldType::Vec3: return "vec3";
        case FieldType::Vec4: return "vec4";
        case FieldType::U32: return "u32";
        case FieldType::I32: return "i32";
    }
    return "f32";
}

std::optional<FieldType> parseFieldType(std::string_view name) {
    if (name == "f32" || name == "float") return FieldType::F32;
    if (name == "vec2" || name == "vec2<f32>" || name == "vec2f") return FieldType::Vec2;
    if (name == "vec3" || name == "vec3<f32>" || name == "vec3f") return FieldType::Vec3;
    if (name == "vec4" || name == "vec4<f32>" || name == "vec4f") return FieldType::Vec4;
    if (name == "u32" || name == "uint") return FieldType::U32;
    if (name == "i32" || name == "int") return FieldType::I32;
    return std::nullopt;
}

FieldType valueType(const Value& value) {
    switch (value.index()) {
        case 0: return FieldType::F32;
        case 1: return FieldType::I32;
        case 2: return FieldType::U32;
        case 3: return FieldType::Vec2;
        case 4: return FieldType::Vec3;
        default: return FieldType::Vec4;
    }
}

Value defaultValue(FieldType type) {
    switch (type) {
        case FieldType::F32: return 0.0f;
        case FieldType::Vec2: return glm::vec2(0.0f);
        case FieldType::Vec3: return glm::vec3(0.0f);
        case FieldType::Vec4: return glm::vec4(0.0f);
        case FieldType::U32: return 0u;
        case FieldType::I32: return int32_t(0);
    }
    return 0.0f;
}

void writeValue(uint8_t* dst, const Value& value) {
    std::visit([dst](const auto& v) {
        std::memcpy(dst, &v, sizeof(v));
    }, value);
}

Value readValue(const uint8_t* src, FieldType type) {
    switch (type) {
        case FieldType::F32: { float v; std::memcpy(&v, src, 4); return v; }
        case FieldType::Vec2: { glm::vec2 v; std::memcpy(&v, src, 8); return v; }
        case FieldType::Vec3: { glm::vec3 v; std::memcpy(&v, src, 12); return v; }
        case FieldType::Vec4: { glm::vec4 v; std::memcpy(&v, src, 16); return v; }
        case FieldType::U32: { uint32_t v; std::memcpy(&v, src, 4); return v; }
        case FieldType::I32: { int32_t v; std::memcpy(&v, src, 4); return v; }
    }
    return 0.0f;
}

std::string wgslFloat(float v) {
    if (!std::isfinite(v)) {
        return v > 0 ? "3.4e38" : (v < 0 ? "-3.4e38" : "0.0");
    }
    std::ostringstream ss;
    ss.precision(9);
    ss << v;
    std::string s = ss.str();
    if (s.find_first_of(".eE") == std::string::npos) {
        s += ".0";
    }
    return s;
}

std::string wgslLiteral(const Value& value) {
    switch (value.index()) {
        case 0: return wgslFloat(std::get<float>(value));
        case 1: return std::to_string(std::get<int32_t>(value)) + "i";
        case 2: return std::to_string(std::get<uint32_t>(value)) + "u";
        case 3: {
            const auto& v = std::get<glm::vec2>(value);
            return "vec2<f32>(" + wgslFloat(v.x) + ", " + wgslFloat(v.y) + ")";
        }
        case 4: {
            const auto& v = std::get<glm::vec3>(value);
            return "vec3<f32>(" + wgslFloat(v.x) + ", " + wgslFloat(v.y) + ", " + wgslFloat(v.z) + ")";
        }
        default: {
            const auto& v = std::get<glm::vec4>(value);
            return "vec4<f32>(" + wgslFloat(v.x) + ", " + wgslFloat(v.y) + ", " +
                   wgslFloat(v.z) + ", " + wgslFloat(v.w) + ")";
        }
    }
}

bool isValidIdentifier(std::string_view name) {
    if (name.empty()) return false;
    if (!(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_')) return false;
    if (name.size() >= 2 && name[0] == '_' && name[1] == '_') return false;
    if (name.rfind("_pad", 0) == 0) return false;
    for (char c : name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
    }
    return true;
}

// =============================================================================
// ParticleSchema
// =============================================================================

ParticleSchema ParticleSchema::basic() {
    ParticleSchema schema;
    schema.field("position", FieldType::Vec3);
    schema.field("velocity", FieldType::Vec3);
    return schema;
}

ParticleSchema& ParticleSchema::field(const std::string& name, FieldType type) {
    m_fields.push_back({name, fieldTypeName(type), type});
    return *this;
}

ParticleSchema& ParticleSchema::field(const std::string& name, const std::string& typeName) {
    m_fields.push_back({name, typeName, parseFieldType(typeName)});
    return *this;
}

ParticleSchema& ParticleSchema::color(const std::string& name) {
    if (!hasField(name)) {
        field(name, FieldType::Vec3);
    }
    m_colorField = name;
    return *this;
}

bool ParticleSchema::hasField(const std::string& name) const {
    return std::any_of(m_fields.begin(), m_fields.end(),
                       [&](const FieldDecl& f) { return f.name == name; });
}

std::optional<BuildError> ParticleSchema::validate() const {
    for (size_t i = 0; i < m_fields.size(); ++i) {
        const FieldDecl& f = m_fields[i];
        if (!f.type) {
            return makeError(ErrorKind::UnsupportedFieldType,
                             "field '" + f.name + "' has unsupported type '" + f.typeName + "'");
        }
        if (!isValidIdentifier(f.name)) {
            return makeError(ErrorKind::InvalidSchema, "invalid field name '" + f.name + "'");
        }
        if (isLifecycleName(f.name)) {
            return makeError(ErrorKind::InvalidSchema,
                             "field name '" + f.name + "' is reserved for the lifecycle tail");
        }
        for (size_t j = 0; j < i; ++j) {
            if (m_fields[j].name == f.name) {
                return makeError(ErrorKind::InvalidSchema, "duplicate field '" + f.name + "'");
            }
        }
    }

    for (const char* required : {"position", "velocity"}) {
        auto it = std::find_if(m_fields.begin(), m_fields.end(),
                               [&](const FieldDecl& f) { return f.name == required; });
        if (it == m_fields.end()) {
            return makeError(ErrorKind::InvalidSchema,
                             std::string("schema requires a '") + required + "' field");
        }
        if (it->type != FieldType::Vec3) {
            return makeError(ErrorKind::InvalidSchema,
                             std::string("'") + required + "' must be vec3");
        }
    }

    for (const FieldDecl& f : m_fields) {
        if (f.name == "particle_type" && f.type != FieldType::U32) {
            return makeError(ErrorKind::InvalidSchema, "'particle_type' must be u32");
        }
        if (f.name == m_colorField && f.type != FieldType::Vec3) {
            return makeError(ErrorKind::InvalidSchema,
                             "color field '" + f.name + "' must be vec3");
        }
    }
    return std::nullopt;
}

// =============================================================================
// ParticleLayout
// =============================================================================

std::optional<ParticleLayout> ParticleLayout::build(const ParticleSchema& schema, BuildError* error) {
    if (auto err = schema.validate()) {
        if (error) *error = *err;
        return std::nullopt;
    }

    std::vector<std::pair<std::string, FieldType>> ordered;
    for (const FieldDecl& f : schema.fields()) {
        ordered.emplace_back(f.name, *f.type);
    }
    if (!schema.hasField("particle_type")) {
        ordered.emplace_back("particle_type", FieldType::U32);
    }
    ordered.emplace_back("age", FieldType::F32);
    ordered.emplace_back("alive", FieldType::U32);
    ordered.emplace_back("scale", FieldType::F32);

    ParticleLayout layout;
    layout.m_colorField = schema.colorField();

    uint32_t offset = 0;
    uint32_t padIndex = 0;
    auto addPadding = [&](uint32_t bytes) {
        if (bytes == 0) return;
        LayoutSlot pad;
        pad.name = "_pad" + std::to_string(padIndex++);
        pad.type = FieldType::F32;
        pad.offset = offset;
        pad.size = bytes;
        pad.padding = true;
        layout.m_slots.push_back(pad);
        offset += bytes;
    };

    for (const auto& [name, type] : ordered) {
        uint32_t align = fieldTypeAlign(type);
        addPadding(alignUp(offset, align) - offset);

        LayoutSlot slot;
        slot.name = name;
        slot.type = type;
        slot.offset = offset;
        slot.size = fieldTypeSize(type);
        layout.m_slots.push_back(slot);
        offset += slot.size;
    }
    addPadding(alignUp(offset, 16) - offset);
    layout.m_stride = offset;

    // Must hold for every schema; reaching this is a layout engine bug
    bool consistent = layout.m_stride % 16 == 0;
    for (const LayoutSlot& slot : layout.m_slots) {
        if (!slot.padding && slot.offset % fieldTypeAlign(slot.type) != 0) {
            consistent = false;
        }
    }
    if (!consistent) {
        if (error) {
            *error = makeError(ErrorKind::InvalidSchema, "internal error: layout violates alignment");
        }
        return std::nullopt;
    }
    return layout;
}

const LayoutSlot* ParticleLayout::find(const std::string& name) const {
    for (const LayoutSlot& slot : m_slots) {
        if (!slot.padding && slot.name == name) {
            return &slot;
        }
    }
    return nullptr;
}

std::optional<uint32_t> ParticleLayout::offsetOf(const std::string& name) const {
    const LayoutSlot* slot = find(name);
    if (!slot) return std::nullopt;
    return slot->offset;
}

std::optional<FieldType> ParticleLayout::typeOf(const std::string& name) const {
    const LayoutSlot* slot = find(name);
    if (!slot) return std::nullopt;
    return slot->type;
}

std::vector<std::string> ParticleLayout::fieldNames() const {
    std::vector<std::string> names;
    for (const LayoutSlot& slot : m_slots) {
        if (!slot.padding) names.push_back(slot.name);
    }
    return names;
}

std::string ParticleLayout::toWgsl(const std::string& structName) const {
    std::ostringstream ss;
    ss << "struct " << structName << " {\n";
    for (const LayoutSlot& slot : m_slots) {
        ss << "    " << slot.name << ": ";
        if (slot.padding) {
            uint32_t words = slot.size / 4;
            if (words == 1) {
                ss << "f32";
            } else {
                ss << "array<f32, " << words << ">";
            }
        } else {
            ss << wgslTypeName(slot.type);
        }
        ss << ",\n";
    }
    ss << "};\n";
    return ss.str();
}

// =============================================================================
// ParticleRecord
// =============================================================================

ParticleRecord::ParticleRecord(const ParticleLayout& layout)
    : ParticleRecord(std::make_shared<ParticleLayout>(layout)) {
}

ParticleRecord::ParticleRecord(std::shared_ptr<const ParticleLayout> layout)
    : m_layout(std::move(layout))
    , m_bytes(m_layout->stride(), 0) {
    reset();
}

bool ParticleRecord::set(const std::string& name, const Value& value) {
    const LayoutSlot* slot = m_layout->find(name);
    if (!slot || slot->type != valueType(value)) {
        return false;
    }
    writeValue(m_bytes.data() + slot->offset, value);
    return true;
}

std::optional<Value> ParticleRecord::value(const std::string& name) const {
    const LayoutSlot* slot = m_layout->find(name);
    if (!slot) return std::nullopt;
    return readValue(m_bytes.data() + slot->offset, slot->type);
}

void ParticleRecord::reset() {
    std::fill(m_bytes.begin(), m_bytes.end(), uint8_t(0));
    set("alive", 1u);
    set("scale", 1.0f);
}

void ParticleRecord::load(const uint8_t* src) {
    std::memcpy(m_bytes.data(), src, m_bytes.size());
}

// =============================================================================
// ParticleBatch
// =============================================================================

ParticleBatch::ParticleBatch(const ParticleLayout& layout, uint32_t count)
    : ParticleBatch(std::make_shared<ParticleLayout>(layout), count) {
}

ParticleBatch::ParticleBatch(std::shared_ptr<const ParticleLayout> layout, uint32_t count)
    : m_layout(std::move(layout))
    , m_count(count)
    , m_bytes(static_cast<size_t>(m_layout->stride()) * count, 0) {
}

void ParticleBatch::write(uint32_t index, const ParticleRecord& record) {
    if (index >= m_count) return;
    std::memcpy(m_bytes.data() + static_cast<size_t>(index) * stride(), record.data(), stride());
}

ParticleRecord ParticleBatch::read(uint32_t index) const {
    ParticleRecord record(m_layout);
    if (index < m_count) {
        record.load(m_bytes.data() + static_cast<size_t>(index) * stride());
    }
    return record;
}

} // namespace flux
