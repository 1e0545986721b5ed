// Flux - Shader Validator Implementation

#include <flux/gpu/shader_validator.h>
#include <flux/gpu/gpu_common.h>
#include <webgpu/wgpu.h>  // wgpu-native extensions (wgpuDevicePoll)
#include <iostream>
#include <regex>

namespace flux::gpu {

ErrorScope::ErrorScope(WGPUDevice device, WGPUErrorFilter filter)
    : m_device(device) {
    wgpuDevicePushErrorScope(m_device, filter);
}

ErrorScope::~ErrorScope() {
    if (!m_popped) {
        if (auto message = pop()) {
            std::cerr << "[Shader] Unhandled error: " << *message << "\n";
        }
    }
}

std::optional<std::string> ErrorScope::pop() {
    m_popped = true;

    struct PopResult {
        bool done = false;
        bool failed = false;
        std::string message;
    } result;

    WGPUPopErrorScopeCallbackInfo callbackInfo = {};
    callbackInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    callbackInfo.callback = [](WGPUPopErrorScopeStatus status, WGPUErrorType type,
                               WGPUStringView message, void* userdata1, void* userdata2) {
        auto* r = static_cast<PopResult*>(userdata1);
        if (status == WGPUPopErrorScopeStatus_Success && type != WGPUErrorType_NoError) {
            r->failed = true;
            r->message = fromStringView(message);
        }
        r->done = true;
    };
    callbackInfo.userdata1 = &result;

    wgpuDevicePopErrorScope(m_device, callbackInfo);
    while (!result.done) {
        wgpuDevicePoll(m_device, true, nullptr);
    }

    if (!result.failed) {
        return std::nullopt;
    }
    return result.message.empty() ? std::string("unknown validation error") : result.message;
}

bool parseLineColumn(const std::string& message, int* line, int* column) {
    static const std::regex LOCATION(R"(:(\d+):(\d+))");
    std::smatch match;
    if (!std::regex_search(message, match, LOCATION)) {
        return false;
    }
    if (line) *line = std::stoi(match[1].str());
    if (column) *column = std::stoi(match[2].str());
    return true;
}

ShaderModuleHandle compileShader(WGPUDevice device, const std::string& source,
                                 const std::string& stage, BuildError* error) {
    ErrorScope scope(device);

    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    wgslDesc.code = toStringView(source);

    WGPUShaderModuleDescriptor shaderDesc = {};
    shaderDesc.nextInChain = &wgslDesc.chain;
    shaderDesc.label = toStringView(stage);
    ShaderModuleHandle module(wgpuDeviceCreateShaderModule(device, &shaderDesc));

    if (auto message = scope.pop()) {
        BuildError err = makeError(ErrorKind::ShaderValidation, *message);
        err.stage = stage;
        parseLineColumn(*message, &err.line, &err.column);
        std::cerr << "[Shader] " << stage << " failed validation";
        if (err.line > 0) std::cerr << " at " << err.line << ":" << err.column;
        std::cerr << "\n" << *message << "\n";
        if (error) *error = err;
        return ShaderModuleHandle();
    }
    if (!module) {
        if (error) {
            *error = makeError(ErrorKind::ShaderValidation, "shader module creation failed");
            error->stage = stage;
        }
        return ShaderModuleHandle();
    }
    return module;
}

} // namespace flux::gpu
