// Flux - Buffer Readback Implementation

#include <flux/gpu/readback.h>
#include <flux/gpu/gpu_common.h>
#include <webgpu/wgpu.h>
#include <cstring>
#include <iostream>

namespace flux::gpu {

bool readBuffer(WGPUDevice device, WGPUQueue queue, WGPUBuffer source,
                uint64_t offset, uint64_t size, std::vector<uint8_t>& out) {
    out.clear();
    if (!device || !queue || !source || size == 0) {
        return false;
    }

    uint64_t alignedSize = alignBufferSize(size);
    BufferHandle staging(createBuffer(device, alignedSize,
                                      WGPUBufferUsage_CopyDst | WGPUBufferUsage_MapRead,
                                      "Readback Staging"));
    if (!staging) {
        return false;
    }

    WGPUCommandEncoderDescriptor encoderDesc = {};
    CommandEncoderHandle encoder(wgpuDeviceCreateCommandEncoder(device, &encoderDesc));
    wgpuCommandEncoderCopyBufferToBuffer(encoder, source, offset, staging, 0, alignedSize);

    WGPUCommandBufferDescriptor cmdBufferDesc = {};
    CommandBufferHandle cmdBuffer(wgpuCommandEncoderFinish(encoder, &cmdBufferDesc));
    WGPUCommandBuffer raw = cmdBuffer;
    wgpuQueueSubmit(queue, 1, &raw);

    struct MapState {
        bool done = false;
        bool success = false;
    } state;

    WGPUBufferMapCallbackInfo mapCallbackInfo = {};
    mapCallbackInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    mapCallbackInfo.callback = [](WGPUMapAsyncStatus status, WGPUStringView message,
                                  void* userdata1, void* userdata2) {
        auto* s = static_cast<MapState*>(userdata1);
        s->success = (status == WGPUMapAsyncStatus_Success);
        if (!s->success) {
            std::cerr << "[Device] Readback map failed: " << fromStringView(message) << "\n";
        }
        s->done = true;
    };
    mapCallbackInfo.userdata1 = &state;

    wgpuBufferMapAsync(staging, WGPUMapMode_Read, 0, alignedSize, mapCallbackInfo);
    while (!state.done) {
        wgpuDevicePoll(device, true, nullptr);
    }
    if (!state.success) {
        return false;
    }

    const void* mapped = wgpuBufferGetConstMappedRange(staging, 0, alignedSize);
    if (!mapped) {
        wgpuBufferUnmap(staging);
        return false;
    }
    out.resize(size);
    std::memcpy(out.data(), mapped, size);
    wgpuBufferUnmap(staging);
    return true;
}

} // namespace flux::gpu
