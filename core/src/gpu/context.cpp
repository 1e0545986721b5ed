// Flux - GPU Context Implementation

#include <flux/gpu/context.h>
#include <flux/gpu/gpu_common.h>
#include <webgpu/wgpu.h>  // wgpu-native extensions (wgpuDevicePoll)
#include <iostream>

namespace flux::gpu {

namespace {

void setError(BuildError* error, const std::string& message) {
    std::cerr << "[Device] " << message << "\n";
    if (error) *error = makeError(ErrorKind::Device, message);
}

const char* backendName(WGPUBackendType type) {
    switch (type) {
        case WGPUBackendType_Metal: return "Metal";
        case WGPUBackendType_Vulkan: return "Vulkan";
        case WGPUBackendType_D3D12: return "D3D12";
        case WGPUBackendType_D3D11: return "D3D11";
        case WGPUBackendType_OpenGL: return "OpenGL";
        default: return "Other";
    }
}

} // namespace

// =============================================================================
// Creation
// =============================================================================

std::unique_ptr<GpuContext> GpuContext::createHeadless(BuildError* error) {
    std::unique_ptr<GpuContext> ctx(new GpuContext());
    if (!ctx->createInstance(error) || !ctx->requestAdapter(error) || !ctx->requestDevice(error)) {
        return nullptr;
    }
    ctx->m_colorFormat = WGPUTextureFormat_RGBA8Unorm;
    return ctx;
}

std::unique_ptr<GpuContext> GpuContext::createForSurface(const SurfaceFactory& makeSurface,
                                                         uint32_t width, uint32_t height,
                                                         BuildError* error) {
    std::unique_ptr<GpuContext> ctx(new GpuContext());
    if (!ctx->createInstance(error)) {
        return nullptr;
    }

    ctx->m_surface.reset(makeSurface(ctx->m_instance));
    if (!ctx->m_surface) {
        setError(error, "Failed to create surface");
        return nullptr;
    }

    if (!ctx->requestAdapter(error) || !ctx->requestDevice(error)) {
        return nullptr;
    }

    WGPUSurfaceCapabilities capabilities = {};
    wgpuSurfaceGetCapabilities(ctx->m_surface, ctx->m_adapter, &capabilities);
    ctx->m_colorFormat = capabilities.formatCount > 0 ? capabilities.formats[0]
                                                       : WGPUTextureFormat_BGRA8Unorm;
    wgpuSurfaceCapabilitiesFreeMembers(capabilities);

    ctx->configureSurface(width, height);
    return ctx;
}

GpuContext::~GpuContext() {
    if (m_surface && m_device) {
        wgpuSurfaceUnconfigure(m_surface);
    }
}

bool GpuContext::createInstance(BuildError* error) {
    WGPUInstanceDescriptor desc = {};
    m_instance.reset(wgpuCreateInstance(&desc));
    if (!m_instance) {
        setError(error, "Failed to create WebGPU instance");
        return false;
    }
    return true;
}

bool GpuContext::requestAdapter(BuildError* error) {
    WGPURequestAdapterOptions options = {};
    options.compatibleSurface = m_surface;
    options.powerPreference = WGPUPowerPreference_HighPerformance;

    struct AdapterUserData {
        WGPUAdapter adapter = nullptr;
        std::string message;
        bool done = false;
    } userData;

    WGPURequestAdapterCallbackInfo callbackInfo = {};
    callbackInfo.mode = WGPUCallbackMode_AllowProcessEvents;
    callbackInfo.callback = [](WGPURequestAdapterStatus status, WGPUAdapter adapter,
                               WGPUStringView message, void* userdata1, void* userdata2) {
        auto* data = static_cast<AdapterUserData*>(userdata1);
        if (status == WGPURequestAdapterStatus_Success) {
            data->adapter = adapter;
        } else {
            data->message = fromStringView(message);
        }
        data->done = true;
    };
    callbackInfo.userdata1 = &userData;

    wgpuInstanceRequestAdapter(m_instance, &options, callbackInfo);
    while (!userData.done) {
        wgpuInstanceProcessEvents(m_instance);
    }

    if (!userData.adapter) {
        setError(error, "Adapter request failed: " +
                        (userData.message.empty() ? std::string("no adapter") : userData.message));
        return false;
    }
    m_adapter.reset(userData.adapter);

    WGPUAdapterInfo info = {};
    if (wgpuAdapterGetInfo(m_adapter, &info) == WGPUStatus_Success) {
        m_adapterName = fromStringView(info.device);
        std::cout << "[Device] Adapter: " << (m_adapterName.empty() ? "unknown" : m_adapterName)
                  << " (" << backendName(info.backendType) << ")\n";
        wgpuAdapterInfoFreeMembers(info);
    }
    return true;
}

bool GpuContext::requestDevice(BuildError* error) {
    // Ask for everything the adapter offers; larger populations need the
    // adapter's storage binding size rather than the WebGPU default
    WGPULimits adapterLimits = {};
    bool haveLimits = wgpuAdapterGetLimits(m_adapter, &adapterLimits) == WGPUStatus_Success;

    WGPUDeviceDescriptor deviceDesc = {};
    deviceDesc.label = toStringView("Flux Device");
    deviceDesc.requiredLimits = haveLimits ? &adapterLimits : nullptr;
    deviceDesc.deviceLostCallbackInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    deviceDesc.deviceLostCallbackInfo.callback = onDeviceLost;
    deviceDesc.deviceLostCallbackInfo.userdata1 = this;
    deviceDesc.uncapturedErrorCallbackInfo.callback = onDeviceError;
    deviceDesc.uncapturedErrorCallbackInfo.userdata1 = this;

    struct DeviceUserData {
        WGPUDevice device = nullptr;
        std::string message;
        bool done = false;
    } userData;

    WGPURequestDeviceCallbackInfo callbackInfo = {};
    callbackInfo.mode = WGPUCallbackMode_AllowProcessEvents;
    callbackInfo.callback = [](WGPURequestDeviceStatus status, WGPUDevice device,
                               WGPUStringView message, void* userdata1, void* userdata2) {
        auto* data = static_cast<DeviceUserData*>(userdata1);
        if (status == WGPURequestDeviceStatus_Success) {
            data->device = device;
        } else {
            data->message = fromStringView(message);
        }
        data->done = true;
    };
    callbackInfo.userdata1 = &userData;

    wgpuAdapterRequestDevice(m_adapter, &deviceDesc, callbackInfo);
    while (!userData.done) {
        wgpuInstanceProcessEvents(m_instance);
    }

    if (!userData.device) {
        setError(error, "Device request failed: " +
                        (userData.message.empty() ? std::string("unknown error") : userData.message));
        return false;
    }
    m_device.reset(userData.device);
    m_queue.reset(wgpuDeviceGetQueue(m_device));

    m_limits = {};
    if (wgpuDeviceGetLimits(m_device, &m_limits) != WGPUStatus_Success && haveLimits) {
        m_limits = adapterLimits;
    }
    return true;
}

// =============================================================================
// Surface & Events
// =============================================================================

bool GpuContext::configureSurface(uint32_t width, uint32_t height, bool vsync) {
    if (!m_surface || width == 0 || height == 0) {
        return false;
    }
    WGPUSurfaceConfiguration config = {};
    config.device = m_device;
    config.format = m_colorFormat;
    config.usage = WGPUTextureUsage_RenderAttachment;
    config.width = width;
    config.height = height;
    config.presentMode = vsync ? WGPUPresentMode_Fifo : WGPUPresentMode_Immediate;
    config.alphaMode = WGPUCompositeAlphaMode_Auto;
    wgpuSurfaceConfigure(m_surface, &config);
    return true;
}

void GpuContext::poll(bool wait) {
    wgpuDevicePoll(m_device, wait, nullptr);
}

void GpuContext::onDeviceLost(WGPUDevice const* device, WGPUDeviceLostReason reason,
                              WGPUStringView message, void* userdata1, void* userdata2) {
    // Destroying the device on shutdown reports a loss too
    if (reason == WGPUDeviceLostReason_Destroyed) return;
    auto* ctx = static_cast<GpuContext*>(userdata1);
    if (ctx) ctx->m_deviceLost = true;
    std::cerr << "[Device] Device lost: " << fromStringView(message) << "\n";
}

void GpuContext::onDeviceError(WGPUDevice const* device, WGPUErrorType type,
                               WGPUStringView message, void* userdata1, void* userdata2) {
    std::cerr << "[Device] Uncaptured error: " << fromStringView(message) << "\n";
}

} // namespace flux::gpu
