// Flux - Particle Buffers Implementation

#include <flux/gpu/buffers.h>
#include <flux/gpu/gpu_common.h>
#include <algorithm>
#include <iostream>

namespace flux::gpu {

std::unique_ptr<ParticleBuffers> ParticleBuffers::create(WGPUDevice device, const ParticleLayout& layout,
                                                         uint32_t count, uint32_t uniformSize,
                                                         BuildError* error) {
    if (count == 0) {
        if (error) *error = makeError(ErrorKind::InvalidConfig, "particle count must be positive");
        return nullptr;
    }

    std::unique_ptr<ParticleBuffers> buffers(new ParticleBuffers());
    buffers->m_count = count;
    buffers->m_stride = layout.stride();
    buffers->m_uniformSize = uniformSize;

    const WGPUBufferUsage particleUsage = WGPUBufferUsage_Storage | WGPUBufferUsage_CopyDst |
                                          WGPUBufferUsage_CopySrc;
    buffers->m_particles[0].reset(createBuffer(device, buffers->byteSize(), particleUsage, "Particles A"));
    buffers->m_particles[1].reset(createBuffer(device, buffers->byteSize(), particleUsage, "Particles B"));
    buffers->m_uniforms.reset(createBuffer(device, uniformSize,
                                           WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst,
                                           "Uniforms"));

    if (!buffers->m_particles[0] || !buffers->m_particles[1] || !buffers->m_uniforms) {
        std::cerr << "[Simulation] Failed to allocate particle buffers ("
                  << buffers->byteSize() << " bytes each)\n";
        if (error) *error = makeError(ErrorKind::Device, "particle buffer allocation failed");
        return nullptr;
    }
    return buffers;
}

bool ParticleBuffers::upload(WGPUQueue queue, const ParticleBatch& batch) {
    if (batch.count() != m_count || batch.stride() != m_stride) {
        std::cerr << "[Simulation] Batch of " << batch.count() << " records does not match buffer capacity "
                  << m_count << "\n";
        return false;
    }
    const auto& bytes = batch.bytes();
    wgpuQueueWriteBuffer(queue, m_particles[0], 0, bytes.data(), bytes.size());
    wgpuQueueWriteBuffer(queue, m_particles[1], 0, bytes.data(), bytes.size());
    return true;
}

void ParticleBuffers::uploadUniforms(WGPUQueue queue, UniformBlock& block) {
    if (!block.hasDirtyRange()) {
        return;
    }
    // Queue writes need 4-byte aligned offsets and sizes; every slot is 4-aligned
    uint32_t begin = block.dirtyBegin() & ~3u;
    uint32_t end = std::min((block.dirtyEnd() + 3u) & ~3u, block.size());
    wgpuQueueWriteBuffer(queue, m_uniforms, begin, block.data() + begin, end - begin);
    block.clearDirty();
}

} // namespace flux::gpu
