// Flux - Field Engine Implementation

#include <flux/gpu/field_engine.h>
#include <flux/gpu/gpu_common.h>
#include <flux/gpu/readback.h>
#include <algorithm>
#include <cstring>
#include <iostream>

namespace flux::gpu {

namespace {

enum PassEntry : uint32_t {
    MERGE_DECAY = 0,
    BLUR_AB = 1,
    BLUR_BA = 2
};

} // namespace

std::unique_ptr<FieldEngine> FieldEngine::create(WGPUDevice device, WGPUQueue queue,
                                                 const FieldRegistry& registry,
                                                 BuildError* error) {
    std::unique_ptr<FieldEngine> engine(new FieldEngine());
    engine->m_registry = registry;

    const uint64_t volumeBytes = uint64_t(registry.totalElements()) * sizeof(float);
    const WGPUBufferUsage volumeUsage = WGPUBufferUsage_Storage | WGPUBufferUsage_CopyDst |
                                        WGPUBufferUsage_CopySrc;
    engine->m_deposit.reset(createBuffer(device, volumeBytes, volumeUsage, "Field Deposit"));
    engine->m_volumeA.reset(createBuffer(device, volumeBytes, volumeUsage, "Field Volume A"));
    engine->m_volumeB.reset(createBuffer(device, volumeBytes, volumeUsage, "Field Volume B"));
    engine->m_params.reset(createBuffer(device, engine->paramsSize(),
                                        WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst, "Field Params"));

    // Pass list: merge/decay, then the blur chain of each field
    for (uint32_t id = 0; id < registry.size(); ++id) {
        const FieldConfig& field = registry.field(id);
        uint32_t count = field.elementCount();
        engine->m_passes.push_back({MERGE_DECAY, static_cast<uint32_t>(engine->m_passes.size()), count, id, 0});

        uint32_t blurPasses = blurPassCount(field);
        for (uint32_t k = 0; k < blurPasses; ++k) {
            uint32_t entry = (k % 2 == 0) ? BLUR_AB : BLUR_BA;
            engine->m_passes.push_back({entry, static_cast<uint32_t>(engine->m_passes.size()), count, id, k % 3});
        }
        if (blurPasses % 2 == 1) {
            engine->m_copies.push_back({uint64_t(registry.baseOf(id)) * sizeof(float),
                                        uint64_t(count) * sizeof(float),
                                        engine->m_passes.size() - 1});
        }
    }

    const uint64_t passBytes = uint64_t(std::max<size_t>(engine->m_passes.size(), 1)) * FIELD_PASS_SLOT;
    engine->m_passParams.reset(createBuffer(device, passBytes,
                                            WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst,
                                            "Field Pass Params"));

    if (!engine->m_deposit || !engine->m_volumeA || !engine->m_volumeB ||
        !engine->m_params || !engine->m_passParams) {
        std::cerr << "[FieldEngine] Failed to allocate field buffers (" << volumeBytes << " bytes each)\n";
        if (error) *error = makeError(ErrorKind::Device, "field buffer allocation failed");
        return nullptr;
    }

    std::vector<FieldParamsData> params = registry.params();
    wgpuQueueWriteBuffer(queue, engine->m_params, 0, params.data(), params.size() * sizeof(FieldParamsData));

    std::vector<uint8_t> passData(passBytes, 0);
    for (const Pass& pass : engine->m_passes) {
        const FieldConfig& field = registry.field(pass.field);
        FieldPassData data = {};
        data.resolution = field.resolution;
        data.base = registry.baseOf(pass.field);
        data.components = field.components();
        data.decay = std::clamp(field.decay, 0.0f, 1.0f);
        data.blur = std::clamp(field.blur, 0.0f, 1.0f);
        data.count = pass.count;
        data.axis = pass.axis;
        std::memcpy(passData.data() + uint64_t(pass.slot) * FIELD_PASS_SLOT, &data, sizeof(data));
    }
    wgpuQueueWriteBuffer(queue, engine->m_passParams, 0, passData.data(), passData.size());

    engine->m_program = PipelineBuilder(device)
        .shader(fieldEngineProgram(), "field_engine")
        .entry("merge_decay")
        .entry("blur_ab")
        .entry("blur_ba")
        .dynamicUniform(0, sizeof(FieldPassData))
        .storage(1)
        .storage(2)
        .storage(3)
        .buildCompute(error);
    if (!engine->m_program) {
        return nullptr;
    }

    engine->m_bindGroup = BindGroupBuilder(device, engine->m_program->layout())
        .buffer(0, engine->m_passParams, sizeof(FieldPassData))
        .buffer(1, engine->m_deposit)
        .buffer(2, engine->m_volumeA)
        .buffer(3, engine->m_volumeB)
        .build("Field Engine");

    std::cout << "[FieldEngine] " << registry.size() << " field(s), " << engine->m_passes.size()
              << " pass(es) per frame\n";
    return engine;
}

void FieldEngine::encode(WGPUCommandEncoder encoder) {
    if (m_passes.empty()) {
        return;
    }

    WGPUComputePassDescriptor passDesc = {};
    passDesc.label = toStringView("Field Engine");
    WGPUComputePassEncoder pass = wgpuCommandEncoderBeginComputePass(encoder, &passDesc);

    size_t nextCopy = 0;
    for (size_t i = 0; i < m_passes.size(); ++i) {
        const Pass& p = m_passes[i];
        uint32_t offset = p.slot * FIELD_PASS_SLOT;
        wgpuComputePassEncoderSetPipeline(pass, m_program->pipeline(p.entry));
        wgpuComputePassEncoderSetBindGroup(pass, 0, m_bindGroup, 1, &offset);
        dispatch(pass, p.count);

        // Copies cannot be recorded inside a compute pass
        if (nextCopy < m_copies.size() && m_copies[nextCopy].afterPass == i) {
            wgpuComputePassEncoderEnd(pass);
            wgpuComputePassEncoderRelease(pass);
            const Copy& copy = m_copies[nextCopy++];
            wgpuCommandEncoderCopyBufferToBuffer(encoder, m_volumeB, copy.offset,
                                                 m_volumeA, copy.offset, copy.size);
            pass = wgpuCommandEncoderBeginComputePass(encoder, &passDesc);
        }
    }

    wgpuComputePassEncoderEnd(pass);
    wgpuComputePassEncoderRelease(pass);
}

std::vector<float> FieldEngine::readField(WGPUDevice device, WGPUQueue queue, uint32_t id) const {
    std::vector<float> values;
    if (id >= m_registry.size()) {
        return values;
    }
    const FieldConfig& field = m_registry.field(id);
    std::vector<uint8_t> bytes;
    if (!readBuffer(device, queue, m_volumeA, uint64_t(m_registry.baseOf(id)) * sizeof(float),
                    uint64_t(field.elementCount()) * sizeof(float), bytes)) {
        std::cerr << "[FieldEngine] Readback of field '" << field.name << "' failed\n";
        return values;
    }
    values.resize(field.elementCount());
    std::memcpy(values.data(), bytes.data(), bytes.size());
    return values;
}

} // namespace flux::gpu
