#pragma once

/**
 * @file uniforms.h
 * @brief Uniform block layout and host shadow copy
 *
 * The uniform buffer starts with a fixed header (view-projection matrix,
 * time, delta time, frame counter, particle count) followed by user-declared
 * custom uniforms in declaration order and the dynamic rule parameters
 * (`rule<i>_<name>`). Everything the host may change without rebuilding
 * shaders lives here.
 */

#include <flux/layout.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace flux {

struct UniformDecl {
    std::string name;
    Value initial = 0.0f;

    FieldType type() const { return valueType(initial); }
};

struct UniformSlot {
    std::string name;
    FieldType type = FieldType::F32;
    uint32_t offset = 0;
    uint32_t size = 0;
    bool padding = false;
};

class UniformLayout {
public:
    /// Bytes used by view_proj, time, delta_time, frame, particle_count
    static constexpr uint32_t HEADER_SIZE = 80;
    static constexpr uint32_t VIEW_PROJ_OFFSET = 0;
    static constexpr uint32_t TIME_OFFSET = 64;
    static constexpr uint32_t DELTA_TIME_OFFSET = 68;
    static constexpr uint32_t FRAME_OFFSET = 72;
    static constexpr uint32_t PARTICLE_COUNT_OFFSET = 76;

    /// @brief Lay out custom uniforms followed by rule parameters
    static std::optional<UniformLayout> build(const std::vector<UniformDecl>& custom,
                                              const std::vector<UniformDecl>& ruleParams,
                                              BuildError* error = nullptr);

    uint32_t size() const { return m_size; }
    const std::vector<UniformSlot>& slots() const { return m_slots; }
    const UniformSlot* find(const std::string& name) const;

    /// Declarations in layout order with their initial values
    const std::vector<UniformDecl>& declarations() const { return m_decls; }

    std::string toWgsl(const std::string& structName = "Uniforms") const;

private:
    std::vector<UniformSlot> m_slots;
    std::vector<UniformDecl> m_decls;
    uint32_t m_size = HEADER_SIZE;
};

/**
 * @brief Host-side shadow of the uniform buffer
 *
 * Writes by name are type checked; a rejected write leaves the bytes
 * untouched. Accepted writes extend a dirty byte range that the scheduler
 * uploads with a single queue write.
 */
class UniformBlock {
public:
    UniformBlock() = default;
    explicit UniformBlock(const UniformLayout& layout);

    /// @brief Set a custom uniform or rule parameter by name
    /// @return false on unknown name or mismatched type
    bool set(const std::string& name, const Value& value);
    std::optional<Value> get(const std::string& name) const;

    void setViewProjection(const glm::mat4& viewProj);
    void setTime(float time, float deltaTime);
    void setFrame(uint32_t frame);
    void setParticleCount(uint32_t count);

    const uint8_t* data() const { return m_bytes.data(); }
    uint32_t size() const { return static_cast<uint32_t>(m_bytes.size()); }
    const UniformLayout& layout() const { return m_layout; }

    bool hasDirtyRange() const { return m_dirtyEnd > m_dirtyBegin; }
    uint32_t dirtyBegin() const { return m_dirtyBegin; }
    uint32_t dirtyEnd() const { return m_dirtyEnd; }
    void clearDirty();

    const BuildError& lastError() const { return m_error; }

private:
    void markDirty(uint32_t begin, uint32_t end);

    UniformLayout m_layout;
    std::vector<uint8_t> m_bytes;
    uint32_t m_dirtyBegin = 0;
    uint32_t m_dirtyEnd = 0;
    BuildError m_error;
};

} // namespace flux
