#pragma once

/**
 * @file buffers.h
 * @brief Ping-pong particle buffers and the shared uniform buffer
 *
 * Capacity is fixed at creation. Both particle buffers carry every usage a
 * pass needs (storage, copy source for readback, copy destination for
 * uploads). Frame f reads buffer f % 2 and writes the other one.
 */

#include <flux/error.h>
#include <flux/gpu/gpu_handle.h>
#include <flux/layout.h>
#include <flux/uniforms.h>
#include <webgpu/webgpu.h>
#include <cstdint>
#include <memory>

namespace flux::gpu {

class ParticleBuffers {
public:
    static std::unique_ptr<ParticleBuffers> create(WGPUDevice device, const ParticleLayout& layout,
                                                   uint32_t count, uint32_t uniformSize,
                                                   BuildError* error = nullptr);

    uint32_t count() const { return m_count; }
    uint32_t stride() const { return m_stride; }
    uint64_t byteSize() const { return uint64_t(m_count) * m_stride; }

    /// Buffer by parity (0 or 1)
    WGPUBuffer particles(uint32_t parity) const { return m_particles[parity & 1u]; }

    uint32_t readIndex() const { return m_read; }
    WGPUBuffer read() const { return m_particles[m_read]; }
    WGPUBuffer write() const { return m_particles[m_read ^ 1u]; }
    void swap() { m_read ^= 1u; }

    WGPUBuffer uniforms() const { return m_uniforms; }
    uint32_t uniformSize() const { return m_uniformSize; }

    /// @brief Write the same records into both particle buffers
    bool upload(WGPUQueue queue, const ParticleBatch& batch);

    /// @brief Write the dirty byte range of @p block, then clear it
    void uploadUniforms(WGPUQueue queue, UniformBlock& block);

private:
    ParticleBuffers() = default;

    BufferHandle m_particles[2];
    BufferHandle m_uniforms;
    uint32_t m_count = 0;
    uint32_t m_stride = 0;
    uint32_t m_uniformSize = 0;
    uint32_t m_read = 0;
};

} // namespace flux::gpu
