#pragma once

/**
 * @file pipeline_builder.h
 * @brief Fluent construction of compute and render pipelines
 *
 * Bind group layouts are always explicit so one layout can serve several
 * bind groups (ping-pong particle buffers) and several entry points of the
 * same module (field engine passes).
 *
 * @par Example
 * @code
 * BuildError err;
 * auto program = PipelineBuilder(device)
 *     .shader(gridCountProgram(layout), "grid_count")
 *     .entry("grid_count")
 *     .readOnlyStorage(0)
 *     .uniform(1, GRID_PARAMS_SIZE)
 *     .storage(2)
 *     .buildCompute(&err);
 * @endcode
 */

#include <flux/error.h>
#include <flux/gpu/gpu_handle.h>
#include <flux/shader_builder.h>
#include <webgpu/webgpu.h>
#include <optional>
#include <string>
#include <vector>

namespace flux::gpu {

enum class BindingType {
    Uniform,
    DynamicUniform,
    Storage,
    ReadOnlyStorage
};

struct BindingEntry {
    uint32_t group;
    uint32_t binding;
    BindingType type;
    uint64_t size;  ///< Minimum binding size, 0 = unchecked
    WGPUShaderStage visibility;
};

struct ComputeProgram {
    std::vector<ComputePipelineHandle> pipelines;  ///< One per entry point, in entry() order
    std::vector<BindGroupLayoutHandle> layouts;    ///< One per group

    WGPUComputePipeline pipeline(size_t i = 0) const { return pipelines[i]; }
    WGPUBindGroupLayout layout(size_t group = 0) const { return layouts[group]; }
};

struct RenderProgram {
    RenderPipelineHandle pipeline;
    std::vector<BindGroupLayoutHandle> layouts;

    WGPUBindGroupLayout layout(size_t group = 0) const { return layouts[group]; }
};

class PipelineBuilder {
public:
    explicit PipelineBuilder(WGPUDevice device);

    PipelineBuilder& shader(const std::string& wgslSource, const std::string& stage);

    /// Add a compute entry point
    PipelineBuilder& entry(const std::string& name);

    PipelineBuilder& vertexEntry(const std::string& name);
    PipelineBuilder& fragmentEntry(const std::string& name);
    PipelineBuilder& colorTarget(WGPUTextureFormat format, BlendMode blend = BlendMode::Alpha);

    /// Following bindings go into @p index
    PipelineBuilder& group(uint32_t index);

    PipelineBuilder& uniform(uint32_t binding, uint64_t size = 0,
                             WGPUShaderStage visibility = WGPUShaderStage_Compute);
    PipelineBuilder& dynamicUniform(uint32_t binding, uint64_t size,
                                    WGPUShaderStage visibility = WGPUShaderStage_Compute);
    PipelineBuilder& storage(uint32_t binding, WGPUShaderStage visibility = WGPUShaderStage_Compute);
    PipelineBuilder& readOnlyStorage(uint32_t binding,
                                     WGPUShaderStage visibility = WGPUShaderStage_Compute);

    std::optional<ComputeProgram> buildCompute(BuildError* error = nullptr);
    std::optional<RenderProgram> buildRender(BuildError* error = nullptr);

private:
    std::vector<BindGroupLayoutHandle> createBindGroupLayouts();
    PipelineLayoutHandle createPipelineLayout(const std::vector<BindGroupLayoutHandle>& layouts);
    void fail(BuildError* error, const std::string& message) const;

    WGPUDevice m_device;
    std::string m_source;
    std::string m_stage = "shader";
    std::vector<std::string> m_entries;
    std::string m_vertexEntry = "vs_main";
    std::string m_fragmentEntry = "fs_main";
    WGPUTextureFormat m_colorFormat = WGPUTextureFormat_RGBA8Unorm;
    BlendMode m_blend = BlendMode::Alpha;
    uint32_t m_group = 0;
    std::vector<BindingEntry> m_bindings;
};

/// @brief Collects buffer bindings for one bind group
class BindGroupBuilder {
public:
    BindGroupBuilder(WGPUDevice device, WGPUBindGroupLayout layout);

    BindGroupBuilder& buffer(uint32_t binding, WGPUBuffer buffer,
                             uint64_t size = WGPU_WHOLE_SIZE, uint64_t offset = 0);

    BindGroupHandle build(const char* label = "");

private:
    WGPUDevice m_device;
    WGPUBindGroupLayout m_layout;
    std::vector<WGPUBindGroupEntry> m_entries;
};

} // namespace flux::gpu
