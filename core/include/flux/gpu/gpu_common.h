#pragma once

/**
 * @file gpu_common.h
 * @brief Small WebGPU helpers shared by the GPU passes
 */

#include <flux/gpu/gpu_handle.h>
#include <webgpu/webgpu.h>
#include <cstdint>
#include <cstring>
#include <string>

namespace flux::gpu {

// =============================================================================
// Strings
// =============================================================================

inline WGPUStringView toStringView(const char* str) {
    WGPUStringView view;
    view.data = str;
    view.length = std::strlen(str);
    return view;
}

inline WGPUStringView toStringView(const std::string& str) {
    WGPUStringView view;
    view.data = str.c_str();
    view.length = str.size();
    return view;
}

/// Copy a (possibly null-terminated) WebGPU message
inline std::string fromStringView(WGPUStringView message) {
    if (!message.data) return std::string();
    size_t length = message.length == WGPU_STRLEN ? std::strlen(message.data) : message.length;
    return std::string(message.data, length);
}

// =============================================================================
// Dispatch
// =============================================================================

/// Largest workgroup count per dispatch dimension
constexpr uint32_t MAX_DISPATCH_DIM = 65535;

/// Threads per workgroup of the per-item compute programs
constexpr uint32_t WORKGROUP_SIZE = 64;

struct DispatchSize {
    uint32_t x = 1;
    uint32_t y = 1;
};

/**
 * @brief Workgroup grid covering @p items invocations
 *
 * Programs index items as gid.x + gid.y * nwg.x * workgroupSize, so a large
 * count folds into a second dimension.
 */
inline DispatchSize dispatchFor(uint32_t items, uint32_t workgroupSize = WORKGROUP_SIZE) {
    uint32_t groups = (items + workgroupSize - 1) / workgroupSize;
    if (groups == 0) groups = 1;
    DispatchSize size;
    if (groups <= MAX_DISPATCH_DIM) {
        size.x = groups;
    } else {
        size.x = MAX_DISPATCH_DIM;
        size.y = (groups + MAX_DISPATCH_DIM - 1) / MAX_DISPATCH_DIM;
    }
    return size;
}

inline void dispatch(WGPUComputePassEncoder pass, uint32_t items,
                     uint32_t workgroupSize = WORKGROUP_SIZE) {
    DispatchSize size = dispatchFor(items, workgroupSize);
    wgpuComputePassEncoderDispatchWorkgroups(pass, size.x, size.y, 1);
}

// =============================================================================
// Buffers
// =============================================================================

/// Round up to the 4-byte multiple WebGPU requires for buffer sizes and copies
inline uint64_t alignBufferSize(uint64_t size) {
    uint64_t aligned = (size + 3) & ~uint64_t(3);
    return aligned == 0 ? 4 : aligned;
}

inline WGPUBuffer createBuffer(WGPUDevice device, uint64_t size, WGPUBufferUsage usage,
                               const char* label) {
    WGPUBufferDescriptor desc = {};
    desc.label = toStringView(label);
    desc.size = alignBufferSize(size);
    desc.usage = usage;
    desc.mappedAtCreation = false;
    return wgpuDeviceCreateBuffer(device, &desc);
}

} // namespace flux::gpu
