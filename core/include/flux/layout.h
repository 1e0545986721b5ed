#pragma once

/**
 * @file layout.h
 * @brief Particle schema and GPU struct layout
 *
 * A ParticleSchema is an ordered list of named, typed fields. ParticleLayout
 * turns it into byte offsets that follow WGSL host-shareable alignment rules,
 * the matching WGSL `Particle` struct text, and a stride that is always a
 * multiple of 16. ParticleRecord and ParticleBatch write host values into
 * correctly padded GPU records.
 *
 * @par Example
 * @code
 * ParticleSchema schema = ParticleSchema::basic();
 * schema.field("mass", FieldType::F32).color();
 *
 * BuildError err;
 * auto layout = ParticleLayout::build(schema, &err);
 * ParticleRecord rec(*layout);
 * rec.set("position", glm::vec3(0.0f, 1.0f, 0.0f));
 * @endcode
 */

#include <flux/error.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace flux {

// =============================================================================
// Field Types & Values
// =============================================================================

enum class FieldType {
    F32,
    Vec2,
    Vec3,
    Vec4,
    U32,
    I32
};

/// Host value for any schema or uniform field
using Value = std::variant<float, int32_t, uint32_t, glm::vec2, glm::vec3, glm::vec4>;

/// Sentinel for "no particle" in index fields (bonds, links)
constexpr uint32_t NO_PARTICLE = 0xFFFFFFFFu;

uint32_t fieldTypeSize(FieldType type);
uint32_t fieldTypeAlign(FieldType type);
uint32_t componentCount(FieldType type);

/// WGSL spelling ("f32", "vec3<f32>", ...)
const char* wgslTypeName(FieldType type);

/// Short spelling used in config files ("f32", "vec3", ...)
const char* fieldTypeName(FieldType type);

/// Accepts both short and WGSL spellings; nullopt for anything else
std::optional<FieldType> parseFieldType(std::string_view name);

FieldType valueType(const Value& value);
Value defaultValue(FieldType type);

/// Write @p value at @p dst using its GPU byte representation
void writeValue(uint8_t* dst, const Value& value);

/// Read a value of @p type from GPU bytes
Value readValue(const uint8_t* src, FieldType type);

/// WGSL literal for a value ("1.5", "vec3<f32>(0.0, 1.0, 0.0)", "3u", "-2i")
std::string wgslLiteral(const Value& value);

/// WGSL float literal that always parses as f32 ("2.0", "0.001", "1e-06")
std::string wgslFloat(float v);

/// True if @p name is a usable WGSL identifier for a user field
bool isValidIdentifier(std::string_view name);

// =============================================================================
// Particle Schema
// =============================================================================

struct FieldDecl {
    std::string name;
    std::string typeName;           ///< As declared
    std::optional<FieldType> type;  ///< Empty when typeName is not a supported type
};

class ParticleSchema {
public:
    /// @brief Schema with the two required fields: position and velocity
    static ParticleSchema basic();

    ParticleSchema& field(const std::string& name, FieldType type);
    ParticleSchema& field(const std::string& name, const std::string& typeName);

    /// @brief Mark a vec3 field as the particle color (added if not declared)
    ParticleSchema& color(const std::string& name = "color");

    const std::vector<FieldDecl>& fields() const { return m_fields; }
    bool hasField(const std::string& name) const;
    bool hasColor() const { return !m_colorField.empty(); }
    const std::string& colorField() const { return m_colorField; }

    /// @brief Check names, types, required fields and the color annotation
    std::optional<BuildError> validate() const;

private:
    std::vector<FieldDecl> m_fields;
    std::string m_colorField;
};

// =============================================================================
// Particle Layout
// =============================================================================

struct LayoutSlot {
    std::string name;
    FieldType type = FieldType::F32;
    uint32_t offset = 0;
    uint32_t size = 0;
    bool padding = false;
};

class ParticleLayout {
public:
    /// @brief Derive offsets, padding and stride
    /// @return nullopt on an invalid schema (details in @p error)
    static std::optional<ParticleLayout> build(const ParticleSchema& schema,
                                               BuildError* error = nullptr);

    uint32_t stride() const { return m_stride; }

    /// All slots in memory order, padding included
    const std::vector<LayoutSlot>& slots() const { return m_slots; }

    /// Named slot lookup (padding slots are not searchable)
    const LayoutSlot* find(const std::string& name) const;
    bool has(const std::string& name) const { return find(name) != nullptr; }
    std::optional<uint32_t> offsetOf(const std::string& name) const;
    std::optional<FieldType> typeOf(const std::string& name) const;

    /// Named fields in declaration order, lifecycle tail included
    std::vector<std::string> fieldNames() const;

    bool hasColor() const { return !m_colorField.empty(); }
    const std::string& colorField() const { return m_colorField; }

    /// @brief WGSL struct declaration
    std::string toWgsl(const std::string& structName = "Particle") const;

private:
    std::vector<LayoutSlot> m_slots;
    uint32_t m_stride = 0;
    std::string m_colorField;
};

// =============================================================================
// Host Records
// =============================================================================

/**
 * @brief One particle in GPU byte form
 *
 * Padding bytes are always zero. A fresh record is alive with scale 1.
 * Records and batches share ownership of their layout, so they stay valid
 * after the simulation that produced them rebuilds.
 */
class ParticleRecord {
public:
    explicit ParticleRecord(const ParticleLayout& layout);
    explicit ParticleRecord(std::shared_ptr<const ParticleLayout> layout);

    /// @brief Set a named field
    /// @return false for unknown names or a value of the wrong type
    bool set(const std::string& name, const Value& value);

    std::optional<Value> value(const std::string& name) const;

    template<typename T>
    T get(const std::string& name) const {
        auto v = value(name);
        if (v && std::holds_alternative<T>(*v)) {
            return std::get<T>(*v);
        }
        return T{};
    }

    /// @brief Zero everything, then apply lifecycle defaults
    void reset();

    void load(const uint8_t* src);
    const uint8_t* data() const { return m_bytes.data(); }
    uint32_t size() const { return static_cast<uint32_t>(m_bytes.size()); }
    const ParticleLayout& layout() const { return *m_layout; }

private:
    std::shared_ptr<const ParticleLayout> m_layout;
    std::vector<uint8_t> m_bytes;
};

/// @brief Contiguous array of particle records ready for upload
class ParticleBatch {
public:
    ParticleBatch(const ParticleLayout& layout, uint32_t count);
    ParticleBatch(std::shared_ptr<const ParticleLayout> layout, uint32_t count);

    uint32_t count() const { return m_count; }
    uint32_t stride() const { return m_layout->stride(); }

    void write(uint32_t index, const ParticleRecord& record);
    ParticleRecord read(uint32_t index) const;

    std::vector<uint8_t>& bytes() { return m_bytes; }
    const std::vector<uint8_t>& bytes() const { return m_bytes; }
    const ParticleLayout& layout() const { return *m_layout; }

private:
    std::shared_ptr<const ParticleLayout> m_layout;
    uint32_t m_count;
    std::vector<uint8_t> m_bytes;
};

} // namespace flux
