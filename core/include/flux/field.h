#pragma once

/**
 * @file field.h
 * @brief Spatial fields: named voxel grids for particle communication
 *
 * Every field is a cube of F^3 voxels over [-extent, extent]^3. Scalar fields
 * hold one float per voxel, vector fields four. All fields share three GPU
 * buffers (deposit, A, B); FieldRegistry assigns ids in declaration order and
 * element offsets into those buffers.
 *
 * During the simulate pass particles sample A and deposit into an atomic
 * fixed-point accumulator. After it, the engine merges the deposits into A,
 * applies decay, and runs the separable blur (result in A).
 *
 * Voxel centers sit at (i + 0.5) / F of the extent, so a field with odd
 * resolution has a voxel centered exactly on the origin.
 */

#include <flux/error.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace flux {

enum class FieldKind {
    Scalar,
    Vector
};

constexpr uint32_t MIN_FIELD_RESOLUTION = 8;
constexpr uint32_t MAX_FIELD_RESOLUTION = 256;
constexpr uint32_t MAX_FIELDS = 16;

/// Fixed-point scale of the atomic deposit buffer
constexpr float FIELD_SCALE = 65536.0f;

struct FieldConfig {
    std::string name;
    FieldKind kind = FieldKind::Scalar;
    uint32_t resolution = 64;
    float extent = 1.0f;
    float decay = 0.99f;          ///< Multiplier per frame, clamped to [0, 1]
    float blur = 0.1f;            ///< Blur strength, clamped to [0, 1]
    uint32_t blurIterations = 1;

    uint32_t components() const { return kind == FieldKind::Vector ? 4u : 1u; }
    uint32_t voxelCount() const { return resolution * resolution * resolution; }
    uint32_t elementCount() const { return voxelCount() * components(); }
};

/// One entry of the field_params uniform array
struct FieldParamsData {
    uint32_t resolution;
    uint32_t base;
    uint32_t components;
    float extent;
    float decay;
    float blur;
    uint32_t pad0;
    uint32_t pad1;
};
static_assert(sizeof(FieldParamsData) == 32, "FieldParams must be 32 bytes");

class FieldRegistry {
public:
    /// @brief Validate and register fields (decay and blur are clamped)
    static std::optional<FieldRegistry> build(const std::vector<FieldConfig>& fields,
                                              BuildError* error = nullptr);

    bool empty() const { return m_fields.empty(); }
    uint32_t size() const { return static_cast<uint32_t>(m_fields.size()); }
    const std::vector<FieldConfig>& fields() const { return m_fields; }
    const FieldConfig& field(uint32_t id) const { return m_fields[id]; }

    std::optional<uint32_t> idOf(const std::string& name) const;
    const FieldConfig* find(const std::string& name) const;

    /// First element of field @p id in the shared buffers
    uint32_t baseOf(uint32_t id) const { return m_bases[id]; }

    /// Elements across all fields (at least 4 so buffers are never empty)
    uint32_t totalElements() const;

    std::vector<FieldParamsData> params() const;

    /// @brief Bindings, FIELD_<NAME> id constants and field helpers
    std::string declarationsWgsl(uint32_t group) const;

private:
    std::vector<FieldConfig> m_fields;
    std::vector<uint32_t> m_bases;
};

/// Field helper functions (expects field_params, field_data, field_deposit)
std::string fieldHelpersWgsl();

/// Merge/decay and blur program (entry points merge_decay, blur_ab, blur_ba)
std::string fieldEngineProgram();

/// Byte size of one per-pass parameter slot in the field engine uniform
constexpr uint32_t FIELD_PASS_SLOT = 256;

/// Per-pass parameters of the field engine program
struct FieldPassData {
    uint32_t resolution;
    uint32_t base;
    uint32_t components;
    uint32_t axis;
    float decay;
    float blur;
    uint32_t count;
    uint32_t pad;
};
static_assert(sizeof(FieldPassData) == 32, "FieldPass must be 32 bytes");

/// Number of blur passes (3 per iteration, 0 when blur is off)
uint32_t blurPassCount(const FieldConfig& config);

// =============================================================================
// Host reference
// =============================================================================

/**
 * @brief CPU mirror of one field's per-frame behavior
 *
 * Applies the same fixed-point deposit, decay, blur kernel and trilinear
 * sampling as the GPU passes. Used to predict GPU results in tests.
 */
class FieldVolume {
public:
    explicit FieldVolume(const FieldConfig& config);

    void deposit(const glm::vec3& pos, const glm::vec4& value);
    glm::vec4 sample(const glm::vec3& pos) const;

    /// Merge deposits, decay, blur
    void step();

    float voxel(uint32_t x, uint32_t y, uint32_t z, uint32_t component = 0) const;
    const std::vector<float>& data() const { return m_data; }
    const FieldConfig& config() const { return m_config; }

    /// Continuous voxel coordinate of a world position (voxel centers at integers)
    glm::vec3 gridPosition(const glm::vec3& pos) const;

private:
    uint32_t element(uint32_t x, uint32_t y, uint32_t z, uint32_t component) const;
    void blurAxis(const std::vector<float>& src, std::vector<float>& dst, uint32_t axis) const;

    FieldConfig m_config;
    std::vector<float> m_data;
    std::vector<int64_t> m_deposit;
};

} // namespace flux
