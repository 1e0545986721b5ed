#pragma once

/**
 * @file context.h
 * @brief WebGPU instance, adapter, device and (optionally) window surface
 *
 * GpuContext is created once per process or window and outlives every
 * Simulation built on it. A headless context has no surface; tests and the
 * `--headless` runner use it.
 */

#include <flux/error.h>
#include <flux/gpu/gpu_handle.h>
#include <webgpu/webgpu.h>
#include <functional>
#include <memory>
#include <string>

namespace flux::gpu {

class GpuContext {
public:
    /// @brief Context without a surface
    /// @return nullptr when no adapter or device is available (details in @p error)
    static std::unique_ptr<GpuContext> createHeadless(BuildError* error = nullptr);

    /// Creates the window surface on the context's instance
    using SurfaceFactory = std::function<WGPUSurface(WGPUInstance)>;

    /// @brief Context presenting to a window surface of @p width x @p height pixels
    static std::unique_ptr<GpuContext> createForSurface(const SurfaceFactory& makeSurface,
                                                        uint32_t width, uint32_t height,
                                                        BuildError* error = nullptr);

    ~GpuContext();

    GpuContext(const GpuContext&) = delete;
    GpuContext& operator=(const GpuContext&) = delete;

    WGPUInstance instance() const { return m_instance; }
    WGPUAdapter adapter() const { return m_adapter; }
    WGPUDevice device() const { return m_device; }
    WGPUQueue queue() const { return m_queue; }
    WGPUSurface surface() const { return m_surface; }

    /// Format render pipelines must target (surface format, or RGBA8 when headless)
    WGPUTextureFormat colorFormat() const { return m_colorFormat; }

    const WGPULimits& limits() const { return m_limits; }
    const std::string& adapterName() const { return m_adapterName; }

    /// @brief (Re)configure the surface; call again after resize or loss
    bool configureSurface(uint32_t width, uint32_t height, bool vsync = true);

    /// Process pending device callbacks; @p wait blocks until queued work is done
    void poll(bool wait);

    /// Set from the device-lost callback
    bool deviceLost() const { return m_deviceLost; }

private:
    GpuContext() = default;

    bool createInstance(BuildError* error);
    bool requestAdapter(BuildError* error);
    bool requestDevice(BuildError* error);

    static void onDeviceLost(WGPUDevice const* device, WGPUDeviceLostReason reason,
                             WGPUStringView message, void* userdata1, void* userdata2);
    static void onDeviceError(WGPUDevice const* device, WGPUErrorType type,
                              WGPUStringView message, void* userdata1, void* userdata2);

    InstanceHandle m_instance;
    SurfaceHandle m_surface;
    AdapterHandle m_adapter;
    DeviceHandle m_device;
    QueueHandle m_queue;
    WGPUTextureFormat m_colorFormat = WGPUTextureFormat_RGBA8Unorm;
    WGPULimits m_limits = {};
    std::string m_adapterName;
    bool m_deviceLost = false;
};

} // namespace flux::gpu
