// Flux - Uniform Block Implementation

#include <flux/uniforms.h>
#include <algorithm>
#include <cstring>
#include <sstream>

namespace flux {

namespace {

const char* HEADER_NAMES[] = {"view_proj", "time", "delta_time", "frame", "particle_count"};

bool isHeaderName(const std::string& name) {
    for (const char* h : HEADER_NAMES) {
        if (name == h) return true;
    }
    return false;
}

} // namespace

// =============================================================================
// UniformLayout
// =============================================================================

std::optional<UniformLayout> UniformLayout::build(const std::vector<UniformDecl>& custom,
                                                  const std::vector<UniformDecl>& ruleParams,
                                                  BuildError* error) {
    auto fail = [error](ErrorKind kind, const std::string& msg) -> std::optional<UniformLayout> {
        if (error) *error = makeError(kind, msg);
        return std::nullopt;
    };

    UniformLayout layout;
    uint32_t offset = HEADER_SIZE;
    uint32_t padIndex = 0;

    auto append = [&](const UniformDecl& decl) {
        FieldType type = decl.type();
        uint32_t align = fieldTypeAlign(type);
        uint32_t aligned = (offset + align - 1) / align * align;
        while (offset < aligned) {
            layout.m_slots.push_back({"_pad" + std::to_string(padIndex++), FieldType::F32, offset, 4, true});
            offset += 4;
        }
        layout.m_slots.push_back({decl.name, type, offset, fieldTypeSize(type), false});
        layout.m_decls.push_back(decl);
        offset += fieldTypeSize(type);
    };

    std::vector<std::string> seen;
    for (const auto* group : {&custom, &ruleParams}) {
        for (const UniformDecl& decl : *group) {
            if (!isValidIdentifier(decl.name) || isHeaderName(decl.name)) {
                return fail(ErrorKind::InvalidSchema, "invalid uniform name '" + decl.name + "'");
            }
            if (std::find(seen.begin(), seen.end(), decl.name) != seen.end()) {
                return fail(ErrorKind::InvalidSchema, "duplicate uniform '" + decl.name + "'");
            }
            seen.push_back(decl.name);
            append(decl);
        }
    }

    while (offset % 16 != 0) {
        layout.m_slots.push_back({"_pad" + std::to_string(padIndex++), FieldType::F32, offset, 4, true});
        offset += 4;
    }
    layout.m_size = offset;
    return layout;
}

const UniformSlot* UniformLayout::find(const std::string& name) const {
    for (const UniformSlot& slot : m_slots) {
        if (!slot.padding && slot.name == name) {
            return &slot;
        }
    }
    return nullptr;
}

std::string UniformLayout::toWgsl(const std::string& structName) const {
    std::ostringstream ss;
    ss << "struct " << structName << " {\n";
    ss << "    view_proj: mat4x4<f32>,\n";
    ss << "    time: f32,\n";
    ss << "    delta_time: f32,\n";
    ss << "    frame: u32,\n";
    ss << "    particle_count: u32,\n";
    for (const UniformSlot& slot : m_slots) {
        ss << "    " << slot.name << ": " << (slot.padding ? "f32" : wgslTypeName(slot.type)) << ",\n";
    }
    ss << "};\n";
    return ss.str();
}

// =============================================================================
// UniformBlock
// =============================================================================

UniformBlock::UniformBlock(const UniformLayout& layout)
    : m_layout(layout)
    , m_bytes(layout.size(), 0) {
    setViewProjection(glm::mat4(1.0f));
    for (const UniformDecl& decl : layout.declarations()) {
        const UniformSlot* slot = layout.find(decl.name);
        writeValue(m_bytes.data() + slot->offset, decl.initial);
    }
    markDirty(0, size());
}

bool UniformBlock::set(const std::string& name, const Value& value) {
    const UniformSlot* slot = m_layout.find(name);
    if (!slot) {
        m_error = makeError(ErrorKind::UnknownParameter, "unknown uniform '" + name + "'");
        return false;
    }
    if (slot->type != valueType(value)) {
        m_error = makeError(ErrorKind::TypeMismatch,
                            "uniform '" + name + "' expects " + wgslTypeName(slot->type) +
                            ", got " + wgslTypeName(valueType(value)));
        return false;
    }
    writeValue(m_bytes.data() + slot->offset, value);
    markDirty(slot->offset, slot->offset + slot->size);
    return true;
}

std::optional<Value> UniformBlock::get(const std::string& name) const {
    const UniformSlot* slot = m_layout.find(name);
    if (!slot) return std::nullopt;
    return readValue(m_bytes.data() + slot->offset, slot->type);
}

void UniformBlock::setViewProjection(const glm::mat4& viewProj) {
    std::memcpy(m_bytes.data() + UniformLayout::VIEW_PROJ_OFFSET, &viewProj[0][0], 64);
}

void UniformBlock::setTime(float time, float deltaTime) {
    std::memcpy(m_bytes.data() + UniformLayout::TIME_OFFSET, &time, 4);
    std::memcpy(m_bytes.data() + UniformLayout::DELTA_TIME_OFFSET, &deltaTime, 4);
}

void UniformBlock::setFrame(uint32_t frame) {
    std::memcpy(m_bytes.data() + UniformLayout::FRAME_OFFSET, &frame, 4);
}

void UniformBlock::setParticleCount(uint32_t count) {
    std::memcpy(m_bytes.data() + UniformLayout::PARTICLE_COUNT_OFFSET, &count, 4);
}

void UniformBlock::markDirty(uint32_t begin, uint32_t end) {
    if (!hasDirtyRange()) {
        m_dirtyBegin = begin;
        m_dirtyEnd = end;
        return;
    }
    m_dirtyBegin = std::min(m_dirtyBegin, begin);
    m_dirtyEnd = std::max(m_dirtyEnd, end);
}

void UniformBlock::clearDirty() {
    m_dirtyBegin = 0;
    m_dirtyEnd = 0;
}

} // namespace flux
