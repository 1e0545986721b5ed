#pragma once

/**
 * @file field_engine.h
 * @brief GPU storage and per-frame passes of the spatial fields
 *
 * All fields share three storage buffers sized to FieldRegistry::totalElements():
 * the atomic deposit accumulator, volume A (read by simulate) and volume B
 * (blur scratch). Each pass reads its field range from a 256-byte slot of the
 * pass uniform, selected with a dynamic offset.
 */

#include <flux/error.h>
#include <flux/field.h>
#include <flux/gpu/gpu_handle.h>
#include <flux/gpu/pipeline_builder.h>
#include <webgpu/webgpu.h>
#include <memory>
#include <optional>
#include <vector>

namespace flux::gpu {

class FieldEngine {
public:
    static std::unique_ptr<FieldEngine> create(WGPUDevice device, WGPUQueue queue,
                                               const FieldRegistry& registry,
                                               BuildError* error = nullptr);

    /// @brief Record merge/decay and blur for every field (result in A)
    void encode(WGPUCommandEncoder encoder);

    WGPUBuffer deposit() const { return m_deposit; }
    WGPUBuffer volumeA() const { return m_volumeA; }
    WGPUBuffer params() const { return m_params; }
    uint64_t paramsSize() const { return uint64_t(MAX_FIELDS) * sizeof(FieldParamsData); }

    /// @brief Copy field @p id's volume A to the host
    /// @return Empty vector on failure
    std::vector<float> readField(WGPUDevice device, WGPUQueue queue, uint32_t id) const;

    /// Passes recorded per frame across all fields
    uint32_t passCount() const { return static_cast<uint32_t>(m_passes.size()); }

private:
    struct Pass {
        uint32_t entry;      ///< 0 = merge_decay, 1 = blur_ab, 2 = blur_ba
        uint32_t slot;
        uint32_t count;
        uint32_t field;
        uint32_t axis;
    };

    /// B to A copy after an odd number of blur passes
    struct Copy {
        uint64_t offset;
        uint64_t size;
        size_t afterPass;
    };

    FieldEngine() = default;

    FieldRegistry m_registry;
    BufferHandle m_deposit;
    BufferHandle m_volumeA;
    BufferHandle m_volumeB;
    BufferHandle m_params;
    BufferHandle m_passParams;

    std::optional<ComputeProgram> m_program;
    BindGroupHandle m_bindGroup;
    std::vector<Pass> m_passes;
    std::vector<Copy> m_copies;
};

} // namespace flux::gpu
