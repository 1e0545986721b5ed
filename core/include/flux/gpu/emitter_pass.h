#pragma once

/**
 * @file emitter_pass.h
 * @brief GPU passes that revive dead particle slots
 *
 * EmitPass runs before simulate on the buffer simulate is about to read; each
 * dead slot takes a ticket from the first emitter with budget left.
 * SubEmitPass runs after simulate on the freshly written buffer and spawns
 * children at the death events simulate recorded.
 */

#include <flux/emitter.h>
#include <flux/error.h>
#include <flux/gpu/gpu_handle.h>
#include <flux/gpu/pipeline_builder.h>
#include <webgpu/webgpu.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace flux::gpu {

/// EmitParams uniform contents
struct EmitParamsData {
    uint32_t frame;
    uint32_t numEmitters;
    uint32_t numParticles;
    float time;
};
static_assert(sizeof(EmitParamsData) == 16, "EmitParams must be 16 bytes");

class EmitPass {
public:
    static std::unique_ptr<EmitPass> create(WGPUDevice device, const std::string& source,
                                            uint32_t emitterCount, uint32_t particleCount,
                                            WGPUBuffer particlesA, WGPUBuffer particlesB,
                                            BuildError* error = nullptr);

    /// @brief Upload this frame's emitter budgets and parameters
    void update(WGPUQueue queue, const std::vector<Emitter>& emitters,
                const std::vector<uint32_t>& budgets, uint32_t frame, float time);

    /// @brief Record the counter clear and the emit dispatch on parity @p readIndex
    void encode(WGPUCommandEncoder encoder, uint32_t readIndex);

    uint32_t emitterCount() const { return m_emitterCount; }

private:
    EmitPass() = default;

    uint32_t m_emitterCount = 0;
    uint32_t m_particleCount = 0;
    BufferHandle m_emitters;
    BufferHandle m_counters;
    BufferHandle m_params;
    std::optional<ComputeProgram> m_program;
    BindGroupHandle m_groups[2];
};

class SubEmitPass {
public:
    static std::unique_ptr<SubEmitPass> create(WGPUDevice device, const std::string& source,
                                               uint32_t particleCount,
                                               WGPUBuffer particlesA, WGPUBuffer particlesB,
                                               BuildError* error = nullptr);

    /// Death event buffer written by simulate
    WGPUBuffer deathBuffer() const { return m_death; }

    void update(WGPUQueue queue, uint32_t frame, float time);

    /// @brief Reset the death count and slot claims; record before simulate
    void clear(WGPUCommandEncoder encoder);

    /// @brief Record the sub-emit dispatch on the buffer simulate wrote (parity @p writeIndex)
    void encode(WGPUCommandEncoder encoder, uint32_t writeIndex);

private:
    SubEmitPass() = default;

    uint32_t m_particleCount = 0;
    BufferHandle m_death;
    BufferHandle m_claims;
    BufferHandle m_params;
    std::optional<ComputeProgram> m_program;
    BindGroupHandle m_groups[2];
};

} // namespace flux::gpu
