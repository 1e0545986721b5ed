// Flux - Emitter Passes Implementation

#include <flux/gpu/emitter_pass.h>
#include <flux/gpu/gpu_common.h>
#include <algorithm>
#include <iostream>

namespace flux::gpu {

// =============================================================================
// EmitPass
// =============================================================================

std::unique_ptr<EmitPass> EmitPass::create(WGPUDevice device, const std::string& source,
                                           uint32_t emitterCount, uint32_t particleCount,
                                           WGPUBuffer particlesA, WGPUBuffer particlesB,
                                           BuildError* error) {
    std::unique_ptr<EmitPass> pass(new EmitPass());
    pass->m_emitterCount = emitterCount;
    pass->m_particleCount = particleCount;

    const uint32_t slots = std::max(emitterCount, 1u);
    pass->m_emitters.reset(createBuffer(device, uint64_t(slots) * sizeof(EmitterGpuData),
                                        WGPUBufferUsage_Storage | WGPUBufferUsage_CopyDst, "Emitters"));
    pass->m_counters.reset(createBuffer(device, uint64_t(slots) * sizeof(uint32_t),
                                        WGPUBufferUsage_Storage | WGPUBufferUsage_CopyDst, "Emit Counters"));
    pass->m_params.reset(createBuffer(device, sizeof(EmitParamsData),
                                      WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst, "Emit Params"));
    if (!pass->m_emitters || !pass->m_counters || !pass->m_params) {
        if (error) *error = makeError(ErrorKind::Device, "emitter buffer allocation failed");
        return nullptr;
    }

    pass->m_program = PipelineBuilder(device)
        .shader(source, "emit")
        .entry("emit")
        .storage(0)
        .readOnlyStorage(1)
        .storage(2)
        .uniform(3, sizeof(EmitParamsData))
        .buildCompute(error);
    if (!pass->m_program) {
        return nullptr;
    }

    WGPUBuffer particles[2] = {particlesA, particlesB};
    for (uint32_t parity = 0; parity < 2; ++parity) {
        pass->m_groups[parity] = BindGroupBuilder(device, pass->m_program->layout())
            .buffer(0, particles[parity])
            .buffer(1, pass->m_emitters)
            .buffer(2, pass->m_counters)
            .buffer(3, pass->m_params, sizeof(EmitParamsData))
            .build("Emit");
    }
    return pass;
}

void EmitPass::update(WGPUQueue queue, const std::vector<Emitter>& emitters,
                      const std::vector<uint32_t>& budgets, uint32_t frame, float time) {
    std::vector<EmitterGpuData> data;
    data.reserve(emitters.size());
    for (size_t i = 0; i < emitters.size() && i < m_emitterCount; ++i) {
        data.push_back(packEmitter(emitters[i], i < budgets.size() ? budgets[i] : 0));
    }
    if (!data.empty()) {
        wgpuQueueWriteBuffer(queue, m_emitters, 0, data.data(), data.size() * sizeof(EmitterGpuData));
    }

    EmitParamsData params = {frame, static_cast<uint32_t>(data.size()), m_particleCount, time};
    wgpuQueueWriteBuffer(queue, m_params, 0, &params, sizeof(params));
}

void EmitPass::encode(WGPUCommandEncoder encoder, uint32_t readIndex) {
    wgpuCommandEncoderClearBuffer(encoder, m_counters, 0,
                                  uint64_t(std::max(m_emitterCount, 1u)) * sizeof(uint32_t));

    WGPUComputePassDescriptor passDesc = {};
    passDesc.label = toStringView("Emit");
    WGPUComputePassEncoder pass = wgpuCommandEncoderBeginComputePass(encoder, &passDesc);
    wgpuComputePassEncoderSetPipeline(pass, m_program->pipeline());
    wgpuComputePassEncoderSetBindGroup(pass, 0, m_groups[readIndex & 1u], 0, nullptr);
    dispatch(pass, m_particleCount);
    wgpuComputePassEncoderEnd(pass);
    wgpuComputePassEncoderRelease(pass);
}

// =============================================================================
// SubEmitPass
// =============================================================================

std::unique_ptr<SubEmitPass> SubEmitPass::create(WGPUDevice device, const std::string& source,
                                                 uint32_t particleCount,
                                                 WGPUBuffer particlesA, WGPUBuffer particlesB,
                                                 BuildError* error) {
    std::unique_ptr<SubEmitPass> pass(new SubEmitPass());
    pass->m_particleCount = particleCount;

    pass->m_death.reset(createBuffer(device, DEATH_BUFFER_SIZE,
                                     WGPUBufferUsage_Storage | WGPUBufferUsage_CopyDst | WGPUBufferUsage_CopySrc,
                                     "Death Events"));
    pass->m_claims.reset(createBuffer(device, uint64_t(particleCount) * sizeof(uint32_t),
                                      WGPUBufferUsage_Storage | WGPUBufferUsage_CopyDst, "Slot Claims"));
    pass->m_params.reset(createBuffer(device, sizeof(EmitParamsData),
                                      WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst, "Sub-Emit Params"));
    if (!pass->m_death || !pass->m_claims || !pass->m_params) {
        if (error) *error = makeError(ErrorKind::Device, "sub-emitter buffer allocation failed");
        return nullptr;
    }

    pass->m_program = PipelineBuilder(device)
        .shader(source, "sub_emit")
        .entry("sub_emit")
        .storage(0)
        .readOnlyStorage(1)
        .storage(2)
        .uniform(3, sizeof(EmitParamsData))
        .buildCompute(error);
    if (!pass->m_program) {
        return nullptr;
    }

    WGPUBuffer particles[2] = {particlesA, particlesB};
    for (uint32_t parity = 0; parity < 2; ++parity) {
        pass->m_groups[parity] = BindGroupBuilder(device, pass->m_program->layout())
            .buffer(0, particles[parity])
            .buffer(1, pass->m_death)
            .buffer(2, pass->m_claims)
            .buffer(3, pass->m_params, sizeof(EmitParamsData))
            .build("Sub-Emit");
    }
    return pass;
}

void SubEmitPass::update(WGPUQueue queue, uint32_t frame, float time) {
    EmitParamsData params = {frame, 0, m_particleCount, time};
    wgpuQueueWriteBuffer(queue, m_params, 0, &params, sizeof(params));
}

void SubEmitPass::clear(WGPUCommandEncoder encoder) {
    wgpuCommandEncoderClearBuffer(encoder, m_death, 0, DEATH_HEADER_SIZE);
    wgpuCommandEncoderClearBuffer(encoder, m_claims, 0, uint64_t(m_particleCount) * sizeof(uint32_t));
}

void SubEmitPass::encode(WGPUCommandEncoder encoder, uint32_t writeIndex) {
    WGPUComputePassDescriptor passDesc = {};
    passDesc.label = toStringView("Sub-Emit");
    WGPUComputePassEncoder pass = wgpuCommandEncoderBeginComputePass(encoder, &passDesc);
    wgpuComputePassEncoderSetPipeline(pass, m_program->pipeline());
    wgpuComputePassEncoderSetBindGroup(pass, 0, m_groups[writeIndex & 1u], 0, nullptr);
    dispatch(pass, MAX_DEATH_EVENTS);
    wgpuComputePassEncoderEnd(pass);
    wgpuComputePassEncoderRelease(pass);
}

} // namespace flux::gpu
