// Flux - Pipeline Builder Implementation

#include <flux/gpu/pipeline_builder.h>
#include <flux/gpu/gpu_common.h>
#include <flux/gpu/shader_validator.h>
#include <algorithm>
#include <iostream>

namespace flux::gpu {

PipelineBuilder::PipelineBuilder(WGPUDevice device)
    : m_device(device) {}

PipelineBuilder& PipelineBuilder::shader(const std::string& wgslSource, const std::string& stage) {
    m_source = wgslSource;
    m_stage = stage;
    return *this;
}

PipelineBuilder& PipelineBuilder::entry(const std::string& name) {
    m_entries.push_back(name);
    return *this;
}

PipelineBuilder& PipelineBuilder::vertexEntry(const std::string& name) {
    m_vertexEntry = name;
    return *this;
}

PipelineBuilder& PipelineBuilder::fragmentEntry(const std::string& name) {
    m_fragmentEntry = name;
    return *this;
}

PipelineBuilder& PipelineBuilder::colorTarget(WGPUTextureFormat format, BlendMode blend) {
    m_colorFormat = format;
    m_blend = blend;
    return *this;
}

PipelineBuilder& PipelineBuilder::group(uint32_t index) {
    m_group = index;
    return *this;
}

PipelineBuilder& PipelineBuilder::uniform(uint32_t binding, uint64_t size, WGPUShaderStage visibility) {
    m_bindings.push_back({m_group, binding, BindingType::Uniform, size, visibility});
    return *this;
}

PipelineBuilder& PipelineBuilder::dynamicUniform(uint32_t binding, uint64_t size, WGPUShaderStage visibility) {
    m_bindings.push_back({m_group, binding, BindingType::DynamicUniform, size, visibility});
    return *this;
}

PipelineBuilder& PipelineBuilder::storage(uint32_t binding, WGPUShaderStage visibility) {
    m_bindings.push_back({m_group, binding, BindingType::Storage, 0, visibility});
    return *this;
}

PipelineBuilder& PipelineBuilder::readOnlyStorage(uint32_t binding, WGPUShaderStage visibility) {
    m_bindings.push_back({m_group, binding, BindingType::ReadOnlyStorage, 0, visibility});
    return *this;
}

void PipelineBuilder::fail(BuildError* error, const std::string& message) const {
    std::cerr << "[Shader] " << m_stage << ": " << message << "\n";
    if (error) {
        *error = makeError(ErrorKind::PipelineCreation, message);
        error->stage = m_stage;
    }
}

std::vector<BindGroupLayoutHandle> PipelineBuilder::createBindGroupLayouts() {
    uint32_t groupCount = 0;
    for (const BindingEntry& b : m_bindings) {
        groupCount = std::max(groupCount, b.group + 1);
    }

    std::vector<BindGroupLayoutHandle> layouts;
    for (uint32_t g = 0; g < groupCount; ++g) {
        std::vector<WGPUBindGroupLayoutEntry> entries;
        for (const BindingEntry& binding : m_bindings) {
            if (binding.group != g) continue;

            WGPUBindGroupLayoutEntry entry = {};
            entry.binding = binding.binding;
            entry.visibility = binding.visibility;
            entry.buffer.minBindingSize = binding.size;
            switch (binding.type) {
                case BindingType::Uniform:
                    entry.buffer.type = WGPUBufferBindingType_Uniform;
                    break;
                case BindingType::DynamicUniform:
                    entry.buffer.type = WGPUBufferBindingType_Uniform;
                    entry.buffer.hasDynamicOffset = true;
                    break;
                case BindingType::Storage:
                    entry.buffer.type = WGPUBufferBindingType_Storage;
                    break;
                case BindingType::ReadOnlyStorage:
                    entry.buffer.type = WGPUBufferBindingType_ReadOnlyStorage;
                    break;
            }
            entries.push_back(entry);
        }

        WGPUBindGroupLayoutDescriptor layoutDesc = {};
        layoutDesc.entryCount = entries.size();
        layoutDesc.entries = entries.data();
        layouts.emplace_back(wgpuDeviceCreateBindGroupLayout(m_device, &layoutDesc));
    }
    return layouts;
}

PipelineLayoutHandle PipelineBuilder::createPipelineLayout(const std::vector<BindGroupLayoutHandle>& layouts) {
    std::vector<WGPUBindGroupLayout> raw;
    raw.reserve(layouts.size());
    for (const auto& l : layouts) raw.push_back(l.get());

    WGPUPipelineLayoutDescriptor desc = {};
    desc.bindGroupLayoutCount = raw.size();
    desc.bindGroupLayouts = raw.data();
    return PipelineLayoutHandle(wgpuDeviceCreatePipelineLayout(m_device, &desc));
}

std::optional<ComputeProgram> PipelineBuilder::buildCompute(BuildError* error) {
    ShaderModuleHandle module = compileShader(m_device, m_source, m_stage, error);
    if (!module) {
        return std::nullopt;
    }
    if (m_entries.empty()) {
        fail(error, "no compute entry point");
        return std::nullopt;
    }

    ErrorScope scope(m_device);
    ComputeProgram program;
    program.layouts = createBindGroupLayouts();
    PipelineLayoutHandle pipelineLayout = createPipelineLayout(program.layouts);

    for (const std::string& name : m_entries) {
        WGPUComputePipelineDescriptor desc = {};
        desc.label = toStringView(name);
        desc.layout = pipelineLayout;
        desc.compute.module = module;
        desc.compute.entryPoint = toStringView(name);
        program.pipelines.emplace_back(wgpuDeviceCreateComputePipeline(m_device, &desc));
    }

    if (auto message = scope.pop()) {
        fail(error, *message);
        return std::nullopt;
    }
    for (const auto& p : program.pipelines) {
        if (!p) {
            fail(error, "compute pipeline creation failed");
            return std::nullopt;
        }
    }
    return program;
}

std::optional<RenderProgram> PipelineBuilder::buildRender(BuildError* error) {
    ShaderModuleHandle module = compileShader(m_device, m_source, m_stage, error);
    if (!module) {
        return std::nullopt;
    }

    ErrorScope scope(m_device);
    RenderProgram program;
    program.layouts = createBindGroupLayouts();
    PipelineLayoutHandle pipelineLayout = createPipelineLayout(program.layouts);

    WGPUBlendState blendState = {};
    blendState.color.operation = WGPUBlendOperation_Add;
    blendState.alpha.operation = WGPUBlendOperation_Add;
    blendState.alpha.srcFactor = WGPUBlendFactor_One;
    blendState.alpha.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    if (m_blend == BlendMode::Additive) {
        blendState.color.srcFactor = WGPUBlendFactor_SrcAlpha;
        blendState.color.dstFactor = WGPUBlendFactor_One;
        blendState.alpha.dstFactor = WGPUBlendFactor_One;
    } else {
        blendState.color.srcFactor = WGPUBlendFactor_SrcAlpha;
        blendState.color.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    }

    WGPUColorTargetState colorTarget = {};
    colorTarget.format = m_colorFormat;
    colorTarget.writeMask = WGPUColorWriteMask_All;
    if (m_blend != BlendMode::Opaque) {
        colorTarget.blend = &blendState;
    }

    WGPUFragmentState fragmentState = {};
    fragmentState.module = module;
    fragmentState.entryPoint = toStringView(m_fragmentEntry);
    fragmentState.targetCount = 1;
    fragmentState.targets = &colorTarget;

    WGPURenderPipelineDescriptor desc = {};
    desc.label = toStringView(m_stage);
    desc.layout = pipelineLayout;
    desc.vertex.module = module;
    desc.vertex.entryPoint = toStringView(m_vertexEntry);
    desc.primitive.topology = WGPUPrimitiveTopology_TriangleList;
    desc.multisample.count = 1;
    desc.multisample.mask = ~0u;
    desc.fragment = &fragmentState;

    program.pipeline.reset(wgpuDeviceCreateRenderPipeline(m_device, &desc));

    if (auto message = scope.pop()) {
        fail(error, *message);
        return std::nullopt;
    }
    if (!program.pipeline) {
        fail(error, "render pipeline creation failed");
        return std::nullopt;
    }
    return program;
}

// =============================================================================
// BindGroupBuilder
// =============================================================================

BindGroupBuilder::BindGroupBuilder(WGPUDevice device, WGPUBindGroupLayout layout)
    : m_device(device)
    , m_layout(layout) {}

BindGroupBuilder& BindGroupBuilder::buffer(uint32_t binding, WGPUBuffer buffer,
                                           uint64_t size, uint64_t offset) {
    WGPUBindGroupEntry entry = {};
    entry.binding = binding;
    entry.buffer = buffer;
    entry.offset = offset;
    entry.size = size;
    m_entries.push_back(entry);
    return *this;
}

BindGroupHandle BindGroupBuilder::build(const char* label) {
    WGPUBindGroupDescriptor desc = {};
    desc.label = toStringView(label);
    desc.layout = m_layout;
    desc.entryCount = m_entries.size();
    desc.entries = m_entries.data();
    return BindGroupHandle(wgpuDeviceCreateBindGroup(m_device, &desc));
}

} // namespace flux::gpu
