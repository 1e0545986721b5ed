#pragma once

/**
 * @file shader_validator.h
 * @brief WGSL compilation inside a WebGPU validation error scope
 *
 * Generated and user WGSL is compiled with a validation scope pushed, so a
 * bad snippet becomes a BuildError carrying the validator's line and column
 * instead of an uncaptured device error.
 */

#include <flux/error.h>
#include <flux/gpu/gpu_handle.h>
#include <webgpu/webgpu.h>
#include <optional>
#include <string>

namespace flux::gpu {

/**
 * @brief Pushes an error scope on construction
 *
 * pop() returns the captured message, if any. A scope that was never popped
 * is popped by the destructor and its message logged.
 */
class ErrorScope {
public:
    explicit ErrorScope(WGPUDevice device, WGPUErrorFilter filter = WGPUErrorFilter_Validation);
    ~ErrorScope();

    ErrorScope(const ErrorScope&) = delete;
    ErrorScope& operator=(const ErrorScope&) = delete;

    std::optional<std::string> pop();

private:
    WGPUDevice m_device;
    bool m_popped = false;
};

/// @brief Find the first ":<line>:<column>" location in a validator message
bool parseLineColumn(const std::string& message, int* line, int* column);

/**
 * @brief Compile WGSL into a shader module
 * @param stage Program name stored in the error ("simulate", "render", ...)
 * @return Null handle on failure (details in @p error)
 */
ShaderModuleHandle compileShader(WGPUDevice device, const std::string& source,
                                 const std::string& stage, BuildError* error = nullptr);

} // namespace flux::gpu
