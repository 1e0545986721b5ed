#pragma once

/**
 * @file readback.h
 * @brief Blocking copy of a GPU buffer range to host memory
 */

#include <webgpu/webgpu.h>
#include <cstdint>
#include <vector>

namespace flux::gpu {

/**
 * @brief Copy @p size bytes of @p source starting at @p offset into @p out
 *
 * Submits a copy into a staging buffer, maps it and polls the device until
 * the map completes. Offset and size must be multiples of 4.
 *
 * @return false if the map failed (out is left empty)
 */
bool readBuffer(WGPUDevice device, WGPUQueue queue, WGPUBuffer source,
                uint64_t offset, uint64_t size, std::vector<uint8_t>& out);

} // namespace flux::gpu
