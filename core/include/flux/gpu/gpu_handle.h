#pragma once

/**
 * @file gpu_handle.h
 * @brief Move-only owners for WebGPU objects
 *
 * A GpuHandle releases its object when destroyed or reset. Every GPU object
 * a simulation creates is held in one, so dropping a failed rebuild or a
 * whole Simulation frees its buffers and pipelines without cleanup code.
 *
 * @par Example
 * @code
 * BufferHandle staging(createBuffer(device, size, WGPUBufferUsage_MapRead | WGPUBufferUsage_CopyDst));
 * ComputePipelineHandle pipeline(wgpuDeviceCreateComputePipeline(device, &desc));
 * @endcode
 */

#include <webgpu/webgpu.h>
#include <utility>

namespace flux::gpu {

template<typename T>
struct WGPUReleaseTrait;

template<>
struct WGPUReleaseTrait<WGPUInstance> {
    static void release(WGPUInstance h) { if (h) wgpuInstanceRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUAdapter> {
    static void release(WGPUAdapter h) { if (h) wgpuAdapterRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUDevice> {
    static void release(WGPUDevice h) { if (h) wgpuDeviceRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUQueue> {
    static void release(WGPUQueue h) { if (h) wgpuQueueRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUSurface> {
    static void release(WGPUSurface h) { if (h) wgpuSurfaceRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUTexture> {
    static void release(WGPUTexture h) { if (h) wgpuTextureRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUTextureView> {
    static void release(WGPUTextureView h) { if (h) wgpuTextureViewRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUBuffer> {
    static void release(WGPUBuffer h) { if (h) wgpuBufferRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPURenderPipeline> {
    static void release(WGPURenderPipeline h) { if (h) wgpuRenderPipelineRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUComputePipeline> {
    static void release(WGPUComputePipeline h) { if (h) wgpuComputePipelineRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUBindGroup> {
    static void release(WGPUBindGroup h) { if (h) wgpuBindGroupRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUBindGroupLayout> {
    static void release(WGPUBindGroupLayout h) { if (h) wgpuBindGroupLayoutRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUShaderModule> {
    static void release(WGPUShaderModule h) { if (h) wgpuShaderModuleRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUPipelineLayout> {
    static void release(WGPUPipelineLayout h) { if (h) wgpuPipelineLayoutRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUCommandEncoder> {
    static void release(WGPUCommandEncoder h) { if (h) wgpuCommandEncoderRelease(h); }
};

template<>
struct WGPUReleaseTrait<WGPUCommandBuffer> {
    static void release(WGPUCommandBuffer h) { if (h) wgpuCommandBufferRelease(h); }
};

template<typename T>
class GpuHandle {
public:
    GpuHandle() = default;
    explicit GpuHandle(T handle) : m_handle(handle) {}
    ~GpuHandle() { reset(); }

    GpuHandle(GpuHandle&& other) noexcept : m_handle(other.m_handle) {
        other.m_handle = nullptr;
    }

    GpuHandle& operator=(GpuHandle&& other) noexcept {
        if (this != &other) {
            reset();
            m_handle = other.m_handle;
            other.m_handle = nullptr;
        }
        return *this;
    }

    GpuHandle(const GpuHandle&) = delete;
    GpuHandle& operator=(const GpuHandle&) = delete;

    T get() const { return m_handle; }
    T* ptr() { return &m_handle; }
    operator T() const { return m_handle; }
    explicit operator bool() const { return m_handle != nullptr; }

    /// Release the current object and optionally adopt another
    void reset(T handle = nullptr) {
        WGPUReleaseTrait<T>::release(m_handle);
        m_handle = handle;
    }

    /// Give up ownership without releasing
    T release() {
        T h = m_handle;
        m_handle = nullptr;
        return h;
    }

private:
    T m_handle = nullptr;
};

using InstanceHandle = GpuHandle<WGPUInstance>;
using AdapterHandle = GpuHandle<WGPUAdapter>;
using DeviceHandle = GpuHandle<WGPUDevice>;
using QueueHandle = GpuHandle<WGPUQueue>;
using SurfaceHandle = GpuHandle<WGPUSurface>;
using TextureHandle = GpuHandle<WGPUTexture>;
using TextureViewHandle = GpuHandle<WGPUTextureView>;
using BufferHandle = GpuHandle<WGPUBuffer>;
using RenderPipelineHandle = GpuHandle<WGPURenderPipeline>;
using ComputePipelineHandle = GpuHandle<WGPUComputePipeline>;
using BindGroupHandle = GpuHandle<WGPUBindGroup>;
using BindGroupLayoutHandle = GpuHandle<WGPUBindGroupLayout>;
using ShaderModuleHandle = GpuHandle<WGPUShaderModule>;
using PipelineLayoutHandle = GpuHandle<WGPUPipelineLayout>;
using CommandEncoderHandle = GpuHandle<WGPUCommandEncoder>;
using CommandBufferHandle = GpuHandle<WGPUCommandBuffer>;

} // namespace flux::gpu
