// Flux - Simulation Implementation

#include <flux/simulation.h>
#include <flux/gpu/buffers.h>
#include <flux/gpu/context.h>
#include <flux/gpu/emitter_pass.h>
#include <flux/gpu/field_engine.h>
#include <flux/gpu/gpu_common.h>
#include <flux/gpu/pipeline_builder.h>
#include <flux/gpu/readback.h>
#include <flux/gpu/spatial_grid.h>
#include <cmath>
#include <cstring>
#include <iostream>
#include <sstream>

namespace flux {

namespace {

bool sameLayout(const ParticleLayout& a, const ParticleLayout& b) {
    if (a.stride() != b.stride() || a.slots().size() != b.slots().size()) {
        return false;
    }
    for (size_t i = 0; i < a.slots().size(); ++i) {
        const LayoutSlot& x = a.slots()[i];
        const LayoutSlot& y = b.slots()[i];
        if (x.name != y.name || x.type != y.type || x.offset != y.offset || x.padding != y.padding) {
            return false;
        }
    }
    return true;
}

} // namespace

// =============================================================================
// SimulationBuilder
// =============================================================================

SimulationBuilder::SimulationBuilder()
    : m_schema(ParticleSchema::basic()) {
}

SimulationBuilder& SimulationBuilder::particleCount(uint32_t count) {
    m_count = count;
    return *this;
}

SimulationBuilder& SimulationBuilder::bounds(float halfExtent) {
    m_bounds = halfExtent;
    return *this;
}

SimulationBuilder& SimulationBuilder::particleSize(float size) {
    m_particleSize = size;
    return *this;
}

SimulationBuilder& SimulationBuilder::schema(const ParticleSchema& schema) {
    m_schema = schema;
    return *this;
}

SimulationBuilder& SimulationBuilder::spatial(float cellSize, uint32_t resolution) {
    m_spatial.cellSize = cellSize;
    m_spatial.resolution = resolution;
    return *this;
}

SimulationBuilder& SimulationBuilder::spatial(const SpatialConfig& config) {
    m_spatial = config;
    return *this;
}

SimulationBuilder& SimulationBuilder::spawner(const SpawnConfig& config) {
    m_spawnConfig = config;
    m_spawn = nullptr;
    return *this;
}

SimulationBuilder& SimulationBuilder::spawner(SpawnFunction fn) {
    m_spawn = std::move(fn);
    return *this;
}

SimulationBuilder& SimulationBuilder::rule(const Rule& rule) {
    m_rules.push_back(rule);
    return *this;
}

SimulationBuilder& SimulationBuilder::rules(const std::vector<Rule>& list) {
    m_rules.insert(m_rules.end(), list.begin(), list.end());
    return *this;
}

SimulationBuilder& SimulationBuilder::emitter(const Emitter& emitter) {
    m_emitters.push_back(emitter);
    return *this;
}

SimulationBuilder& SimulationBuilder::subEmitter(const SubEmitter& sub) {
    m_subEmitters.push_back(sub);
    return *this;
}

SimulationBuilder& SimulationBuilder::field(const FieldConfig& field) {
    m_fields.push_back(field);
    return *this;
}

SimulationBuilder& SimulationBuilder::uniform(const std::string& name, const Value& initial) {
    m_uniforms.push_back({name, initial});
    return *this;
}

SimulationBuilder& SimulationBuilder::customShaders(const CustomShaders& shaders) {
    m_custom = shaders;
    return *this;
}

SimulationBuilder& SimulationBuilder::lifecycle(const Lifecycle& lifecycle) {
    m_lifecycle = lifecycle;
    return *this;
}

SimulationBuilder& SimulationBuilder::startDead(bool dead) {
    m_startDead = dead;
    return *this;
}

SimulationBuilder& SimulationBuilder::update(UpdateFunction fn) {
    m_update = std::move(fn);
    return *this;
}

SimulationBuilder& SimulationBuilder::ui(UiFunction fn) {
    m_ui = std::move(fn);
    return *this;
}

SimulationBuilder& SimulationBuilder::blend(BlendMode mode) {
    m_blend = mode;
    return *this;
}

SimulationBuilder& SimulationBuilder::shape(ParticleShape shape) {
    m_shape = shape;
    return *this;
}

SimulationBuilder& SimulationBuilder::background(const glm::vec3& color) {
    m_background = color;
    return *this;
}

SimulationBuilder& SimulationBuilder::camera(const Camera& camera) {
    m_camera = camera;
    return *this;
}

std::optional<CompiledPrograms> SimulationBuilder::compile(BuildError* error) const {
    auto fail = [error](const BuildError& err) -> std::optional<CompiledPrograms> {
        std::cerr << "[Simulation] " << err.toString() << "\n";
        if (error) *error = err;
        return std::nullopt;
    };

    if (m_count == 0) {
        return fail(makeError(ErrorKind::InvalidConfig, "particle count must be positive"));
    }
    if (!(m_bounds > 0.0f)) {
        return fail(makeError(ErrorKind::InvalidConfig, "bounds must be positive"));
    }
    if (!(m_particleSize > 0.0f)) {
        return fail(makeError(ErrorKind::InvalidConfig, "particle size must be positive"));
    }

    CompiledPrograms out;

    // Lifecycle contributions follow the user's so rule indices stay stable
    ParticleSchema schema = m_schema;
    out.rules = m_rules;
    out.emitters = m_emitters;
    out.startDead = m_startDead;
    if (m_lifecycle) {
        if (m_lifecycle->needsColor() && !schema.hasColor()) {
            schema.color();
        }
        std::vector<Rule> extra = m_lifecycle->rules();
        out.rules.insert(out.rules.end(), extra.begin(), extra.end());
        out.emitters.insert(out.emitters.end(), m_lifecycle->emitters().begin(),
                            m_lifecycle->emitters().end());
        out.startDead = out.startDead || m_lifecycle->startsDead();
    }

    for (const Emitter& e : out.emitters) {
        if (auto err = validateEmitter(e)) {
            return fail(*err);
        }
    }

    BuildError err;
    auto layout = ParticleLayout::build(schema, &err);
    if (!layout) return fail(err);
    out.layout = std::move(*layout);

    auto uniforms = UniformLayout::build(m_uniforms, ruleUniforms(out.rules), &err);
    if (!uniforms) return fail(err);
    out.uniforms = std::move(*uniforms);

    auto fields = FieldRegistry::build(m_fields, &err);
    if (!fields) return fail(err);
    out.fields = std::move(*fields);

    out.shaderConfig.bounds = m_bounds;
    out.shaderConfig.spatial = m_spatial;
    out.shaderConfig.rules = out.rules;
    out.shaderConfig.subEmitters = m_subEmitters;
    out.shaderConfig.emitters = !out.emitters.empty();
    out.shaderConfig.custom = m_custom;
    out.shaderConfig.shape = m_shape;

    ShaderBuilder builder(out.layout, out.uniforms, out.fields, out.shaderConfig);
    if (auto verr = builder.validate()) {
        return fail(*verr);
    }

    out.needsNeighbors = builder.needsNeighbors();
    if (out.needsNeighbors) {
        uint32_t needed = static_cast<uint32_t>(std::ceil(2.0f * m_bounds / m_spatial.cellSize));
        if (needed > MAX_GRID_RESOLUTION) {
            std::ostringstream ss;
            ss << "bounds " << m_bounds << " at cell size " << m_spatial.cellSize << " need "
               << needed << " cells per axis (max " << MAX_GRID_RESOLUTION << ")";
            return fail(makeError(ErrorKind::InvalidConfig, ss.str()));
        }
    }

    out.plan = builder.bindGroups();
    out.simulate = builder.simulateProgram();
    out.render = builder.renderProgram();
    if (!out.emitters.empty()) {
        out.emit = builder.emitProgram();
    }
    if (!m_subEmitters.empty()) {
        out.subEmit = builder.subEmitProgram();
    }
    return out;
}

ParticleBatch SimulationBuilder::spawnBatch(const ParticleLayout& layout, bool startDead) const {
    ParticleBatch batch(layout, m_count);
    ParticleRecord record(layout);

    // A fresh spawner per batch keeps seeded spawns reproducible across rebuilds
    Spawner spawner(m_spawnConfig);
    for (uint32_t i = 0; i < m_count; ++i) {
        record.reset();
        if (m_spawn) {
            m_spawn(record, i, m_count);
        } else {
            spawner.apply(record, i, m_count);
        }
        if (startDead) {
            record.set("alive", uint32_t(0));
        }
        batch.write(i, record);
    }
    return batch;
}

std::unique_ptr<Simulation> SimulationBuilder::build(gpu::GpuContext& gpu, BuildError* error) const {
    std::unique_ptr<Simulation> sim(new Simulation(gpu, *this));
    sim->m_pipelines = sim->createPipelines(*this, error);
    if (!sim->m_pipelines) {
        return nullptr;
    }
    return sim;
}

// =============================================================================
// Simulation
// =============================================================================

struct Simulation::Pipelines {
    CompiledPrograms programs;
    UniformBlock uniforms;
    EmissionScheduler scheduler;

    std::unique_ptr<gpu::ParticleBuffers> buffers;
    std::unique_ptr<gpu::SpatialGrid> grid;
    std::unique_ptr<gpu::FieldEngine> fields;
    std::unique_ptr<gpu::EmitPass> emit;
    std::unique_ptr<gpu::SubEmitPass> subEmit;

    std::optional<gpu::ComputeProgram> simulate;
    std::vector<gpu::BindGroupHandle> simulateGroups[2];

    std::optional<gpu::RenderProgram> render;
    gpu::BindGroupHandle renderGroups[2];
    gpu::BufferHandle renderParams;
};

Simulation::Simulation(gpu::GpuContext& gpu, const SimulationBuilder& builder)
    : m_gpu(&gpu)
    , m_builder(builder)
    , m_camera(builder.m_camera) {
}

Simulation::~Simulation() = default;

std::unique_ptr<Simulation::Pipelines> Simulation::createPipelines(const SimulationBuilder& builder,
                                                                    BuildError* error) {
    auto compiled = builder.compile(error);
    if (!compiled) {
        return nullptr;
    }

    WGPUDevice device = m_gpu->device();
    WGPUQueue queue = m_gpu->queue();

    auto p = std::make_unique<Pipelines>();
    p->programs = std::move(*compiled);
    const CompiledPrograms& programs = p->programs;
    const uint32_t count = builder.m_count;
    const uint32_t uniformSize = programs.uniforms.size();

    p->uniforms = UniformBlock(programs.uniforms);
    p->scheduler = EmissionScheduler(programs.emitters);

    // -------------------------------------------------------------------------
    // Buffers
    p->buffers = gpu::ParticleBuffers::create(device, programs.layout, count, uniformSize, error);
    if (!p->buffers) {
        return nullptr;
    }
    if (!p->buffers->upload(queue, builder.spawnBatch(programs.layout, programs.startDead))) {
        if (error) *error = makeError(ErrorKind::Device, "initial particle upload failed");
        return nullptr;
    }

    WGPUBuffer particles[2] = {p->buffers->particles(0), p->buffers->particles(1)};

    if (programs.plan.grid) {
        p->grid = gpu::SpatialGrid::create(device, queue, programs.layout, programs.shaderConfig.spatial,
                                           programs.shaderConfig.bounds, count,
                                           particles[0], particles[1], error);
        if (!p->grid) return nullptr;
    }
    if (programs.plan.fields) {
        p->fields = gpu::FieldEngine::create(device, queue, programs.fields, error);
        if (!p->fields) return nullptr;
    }
    if (!programs.emit.empty()) {
        p->emit = gpu::EmitPass::create(device, programs.emit,
                                        static_cast<uint32_t>(programs.emitters.size()), count,
                                        particles[0], particles[1], error);
        if (!p->emit) return nullptr;
    }
    if (!programs.subEmit.empty()) {
        p->subEmit = gpu::SubEmitPass::create(device, programs.subEmit, count,
                                              particles[0], particles[1], error);
        if (!p->subEmit) return nullptr;
    }

    // -------------------------------------------------------------------------
    // Simulate pipeline
    gpu::PipelineBuilder simulate(device);
    simulate.shader(programs.simulate, "simulate")
        .entry("simulate")
        .group(0)
        .readOnlyStorage(0)
        .storage(1)
        .uniform(2, uniformSize);
    if (programs.plan.grid) {
        simulate.group(*programs.plan.grid)
            .uniform(0, GRID_PARAMS_SIZE)
            .readOnlyStorage(1)
            .readOnlyStorage(2);
    }
    if (programs.plan.fields) {
        simulate.group(*programs.plan.fields)
            .storage(0)
            .readOnlyStorage(1)
            .uniform(2, p->fields->paramsSize());
    }
    if (programs.plan.death) {
        simulate.group(*programs.plan.death).storage(0);
    }
    p->simulate = simulate.buildCompute(error);
    if (!p->simulate) {
        return nullptr;
    }

    for (uint32_t parity = 0; parity < 2; ++parity) {
        auto& groups = p->simulateGroups[parity];
        groups.resize(programs.plan.count);
        groups[0] = gpu::BindGroupBuilder(device, p->simulate->layout(0))
            .buffer(0, particles[parity])
            .buffer(1, particles[parity ^ 1u])
            .buffer(2, p->buffers->uniforms(), uniformSize)
            .build("Simulate");
        if (programs.plan.grid) {
            groups[*programs.plan.grid] = gpu::BindGroupBuilder(device, p->simulate->layout(*programs.plan.grid))
                .buffer(0, p->grid->params(), GRID_PARAMS_SIZE)
                .buffer(1, p->grid->sortedIndices())
                .buffer(2, p->grid->cellOffsets())
                .build("Simulate Grid");
        }
        if (programs.plan.fields) {
            groups[*programs.plan.fields] = gpu::BindGroupBuilder(device, p->simulate->layout(*programs.plan.fields))
                .buffer(0, p->fields->deposit())
                .buffer(1, p->fields->volumeA())
                .buffer(2, p->fields->params(), p->fields->paramsSize())
                .build("Simulate Fields");
        }
        if (programs.plan.death) {
            groups[*programs.plan.death] = gpu::BindGroupBuilder(device, p->simulate->layout(*programs.plan.death))
                .buffer(0, p->subEmit->deathBuffer())
                .build("Simulate Deaths");
        }
    }

    // -------------------------------------------------------------------------
    // Render pipeline
    p->renderParams.reset(gpu::createBuffer(device, sizeof(RenderParamsData),
                                            WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst,
                                            "Render Params"));
    if (!p->renderParams) {
        if (error) *error = makeError(ErrorKind::Device, "render parameter buffer allocation failed");
        return nullptr;
    }

    p->render = gpu::PipelineBuilder(device)
        .shader(programs.render, "render")
        .vertexEntry("vs_main")
        .fragmentEntry("fs_main")
        .colorTarget(m_gpu->colorFormat(), builder.m_blend)
        .readOnlyStorage(0, WGPUShaderStage_Vertex)
        .uniform(1, uniformSize, WGPUShaderStage_Vertex | WGPUShaderStage_Fragment)
        .uniform(2, sizeof(RenderParamsData), WGPUShaderStage_Vertex)
        .buildRender(error);
    if (!p->render) {
        return nullptr;
    }

    for (uint32_t parity = 0; parity < 2; ++parity) {
        p->renderGroups[parity] = gpu::BindGroupBuilder(device, p->render->layout(0))
            .buffer(0, particles[parity])
            .buffer(1, p->buffers->uniforms(), uniformSize)
            .buffer(2, p->renderParams, sizeof(RenderParamsData))
            .build("Render");
    }

    std::cout << "[Simulation] " << count << " particles, stride " << programs.layout.stride()
              << " bytes, " << programs.rules.size() << " rule(s)";
    if (p->grid) std::cout << ", grid " << p->grid->geometry().resolution << "^3";
    if (p->fields) std::cout << ", " << programs.fields.size() << " field(s)";
    if (p->emit) std::cout << ", " << programs.emitters.size() << " emitter(s)";
    if (p->subEmit) std::cout << ", sub-emitters";
    std::cout << "\n";
    return p;
}

void Simulation::fail(const BuildError& error) {
    m_error = error;
    m_hasError = true;
    std::cerr << "[Simulation] " << error.toString() << "\n";
}

// =============================================================================
// Frame scheduling
// =============================================================================

bool Simulation::frame(float deltaTime, WGPUTextureView target) {
    if (m_gpu->deviceLost()) {
        return false;
    }

    InputSnapshot snapshot = m_input.snapshot(m_camera);
    m_time += deltaTime;

    // Callbacks may rebuild, which replaces m_builder and m_pipelines
    UpdateFunction update = m_builder.m_update;
    if (update) {
        update(*this, m_time, deltaTime, snapshot);
    }
    UiFunction ui = m_builder.m_ui;
    if (ui) {
        ui(*this);
    }

    Pipelines& p = *m_pipelines;
    WGPUQueue queue = m_gpu->queue();
    const uint32_t count = p.buffers->count();

    p.uniforms.setViewProjection(m_camera.viewProjectionMatrix());
    p.uniforms.setTime(m_time, deltaTime);
    p.uniforms.setFrame(m_frame);
    p.uniforms.setParticleCount(count);
    wgpuQueueWriteBuffer(queue, p.buffers->uniforms(), 0, p.uniforms.data(), UniformLayout::HEADER_SIZE);
    p.buffers->uploadUniforms(queue, p.uniforms);

    if (p.emit) {
        const std::vector<uint32_t>& budgets = p.scheduler.advance(deltaTime);
        p.emit->update(queue, p.scheduler.emitters(), budgets, m_frame, m_time);
    }
    if (p.subEmit) {
        p.subEmit->update(queue, m_frame, m_time);
    }

    const uint32_t readIndex = p.buffers->readIndex();
    const uint32_t writeIndex = readIndex ^ 1u;

    WGPUCommandEncoderDescriptor encoderDesc = {};
    encoderDesc.label = gpu::toStringView("Flux Frame");
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(m_gpu->device(), &encoderDesc);

    if (p.grid) {
        p.grid->encode(encoder, readIndex);
    }
    if (p.emit) {
        p.emit->encode(encoder, readIndex);
    }
    if (p.subEmit) {
        p.subEmit->clear(encoder);
    }

    WGPUComputePassDescriptor passDesc = {};
    passDesc.label = gpu::toStringView("Simulate");
    WGPUComputePassEncoder pass = wgpuCommandEncoderBeginComputePass(encoder, &passDesc);
    wgpuComputePassEncoderSetPipeline(pass, p.simulate->pipeline());
    const auto& groups = p.simulateGroups[readIndex];
    for (uint32_t g = 0; g < groups.size(); ++g) {
        wgpuComputePassEncoderSetBindGroup(pass, g, groups[g], 0, nullptr);
    }
    gpu::dispatch(pass, count);
    wgpuComputePassEncoderEnd(pass);
    wgpuComputePassEncoderRelease(pass);

    if (p.subEmit) {
        p.subEmit->encode(encoder, writeIndex);
    }
    if (p.fields) {
        p.fields->encode(encoder);
    }
    if (target) {
        encodeRender(encoder, target, writeIndex);
    }

    WGPUCommandBufferDescriptor cmdDesc = {};
    cmdDesc.label = gpu::toStringView("Flux Frame");
    WGPUCommandBuffer commands = wgpuCommandEncoderFinish(encoder, &cmdDesc);
    wgpuQueueSubmit(queue, 1, &commands);
    wgpuCommandBufferRelease(commands);
    wgpuCommandEncoderRelease(encoder);

    p.buffers->swap();
    ++m_frame;
    m_input.endFrame();
    return !m_gpu->deviceLost();
}

bool Simulation::redraw(WGPUTextureView target) {
    if (m_gpu->deviceLost() || !target) {
        return false;
    }
    Pipelines& p = *m_pipelines;

    p.uniforms.setViewProjection(m_camera.viewProjectionMatrix());
    wgpuQueueWriteBuffer(m_gpu->queue(), p.buffers->uniforms(), 0, p.uniforms.data(),
                         UniformLayout::HEADER_SIZE);
    p.buffers->uploadUniforms(m_gpu->queue(), p.uniforms);

    WGPUCommandEncoderDescriptor encoderDesc = {};
    encoderDesc.label = gpu::toStringView("Flux Redraw");
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(m_gpu->device(), &encoderDesc);
    encodeRender(encoder, target, p.buffers->readIndex());

    WGPUCommandBufferDescriptor cmdDesc = {};
    WGPUCommandBuffer commands = wgpuCommandEncoderFinish(encoder, &cmdDesc);
    wgpuQueueSubmit(m_gpu->queue(), 1, &commands);
    wgpuCommandBufferRelease(commands);
    wgpuCommandEncoderRelease(encoder);

    m_input.endFrame();
    return true;
}

void Simulation::encodeRender(WGPUCommandEncoder encoder, WGPUTextureView target, uint32_t parity) {
    Pipelines& p = *m_pipelines;

    RenderParamsData params = {};
    params.aspect = m_camera.aspectRatio();
    params.particleSize = m_builder.m_particleSize;
    params.focal = m_camera.projectionMatrix()[1][1];
    wgpuQueueWriteBuffer(m_gpu->queue(), p.renderParams, 0, &params, sizeof(params));

    const glm::vec3& bg = m_builder.m_background;
    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = target;
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
    colorAttachment.loadOp = WGPULoadOp_Clear;
    colorAttachment.storeOp = WGPUStoreOp_Store;
    colorAttachment.clearValue = {bg.r, bg.g, bg.b, 1.0};

    WGPURenderPassDescriptor passDesc = {};
    passDesc.label = gpu::toStringView("Particles");
    passDesc.colorAttachmentCount = 1;
    passDesc.colorAttachments = &colorAttachment;

    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);
    wgpuRenderPassEncoderSetPipeline(pass, p.render->pipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, 0, p.renderGroups[parity & 1u], 0, nullptr);
    wgpuRenderPassEncoderDraw(pass, 6, p.buffers->count(), 0, 0);
    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);
}

void Simulation::resize(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) {
        return;
    }
    m_camera.aspect(static_cast<float>(width) / static_cast<float>(height));
    m_input.setViewport(static_cast<float>(width), static_cast<float>(height));
}

// =============================================================================
// Parameters
// =============================================================================

bool Simulation::setUniform(const std::string& name, const Value& value) {
    UniformBlock& block = m_pipelines->uniforms;
    if (!block.set(name, value)) {
        fail(block.lastError());
        return false;
    }
    return true;
}

bool Simulation::setRuleParam(uint32_t ruleIndex, const std::string& param, const Value& value) {
    const std::vector<Rule>& rules = programs().rules;
    if (ruleIndex >= rules.size()) {
        std::ostringstream ss;
        ss << "no rule at index " << ruleIndex << " (" << rules.size() << " rules)";
        fail(makeError(ErrorKind::UnknownParameter, ss.str()));
        return false;
    }

    // A neighbor radius may not outgrow the grid cell
    const char* radius = radiusParameter(rules[ruleIndex]);
    if (radius && param == radius) {
        const float* r = std::get_if<float>(&value);
        const float cellSize = programs().shaderConfig.spatial.cellSize;
        if (r && *r > cellSize) {
            std::ostringstream ss;
            ss << ruleName(rules[ruleIndex]) << " " << param << " " << *r
               << " exceeds the grid cell size " << cellSize;
            fail(makeError(ErrorKind::CellSizeTooSmall, ss.str()));
            return false;
        }
    }
    return setUniform(ruleParamName(ruleIndex, param), value);
}

std::optional<Value> Simulation::uniform(const std::string& name) const {
    return m_pipelines->uniforms.get(name);
}

bool Simulation::rebuild(const SimulationBuilder& builder) {
    BuildError err;
    std::unique_ptr<Pipelines> next = createPipelines(builder, &err);
    if (!next) {
        std::cerr << "[Simulation] Rebuild failed, keeping the running build\n";
        fail(err);
        return false;
    }

    Pipelines& old = *m_pipelines;
    if (old.buffers->count() == next->buffers->count() &&
        sameLayout(old.programs.layout, next->programs.layout)) {
        WGPUCommandEncoderDescriptor encoderDesc = {};
        encoderDesc.label = gpu::toStringView("Carry Particles");
        WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(m_gpu->device(), &encoderDesc);
        const uint64_t bytes = old.buffers->byteSize();
        wgpuCommandEncoderCopyBufferToBuffer(encoder, old.buffers->read(), 0, next->buffers->particles(0), 0, bytes);
        wgpuCommandEncoderCopyBufferToBuffer(encoder, old.buffers->read(), 0, next->buffers->particles(1), 0, bytes);
        WGPUCommandBufferDescriptor cmdDesc = {};
        WGPUCommandBuffer commands = wgpuCommandEncoderFinish(encoder, &cmdDesc);
        wgpuQueueSubmit(m_gpu->queue(), 1, &commands);
        wgpuCommandBufferRelease(commands);
        wgpuCommandEncoderRelease(encoder);
        std::cout << "[Simulation] Rebuilt, particle state carried over\n";
    } else {
        std::cout << "[Simulation] Rebuilt, particles respawned\n";
    }
    next->scheduler.adoptState(old.scheduler);

    m_pipelines = std::move(next);
    m_builder = builder;
    m_hasError = false;
    ++m_rebuildCount;
    return true;
}

// =============================================================================
// Emitters
// =============================================================================

void Simulation::triggerBurst() {
    m_pipelines->scheduler.triggerBurst();
}

bool Simulation::triggerBurst(uint32_t emitterIndex) {
    return m_pipelines->scheduler.triggerBurst(emitterIndex);
}

bool Simulation::setEmitterRate(uint32_t emitterIndex, float rate) {
    return m_pipelines->scheduler.setRate(emitterIndex, rate);
}

uint64_t Simulation::totalScheduled() const {
    return m_pipelines->scheduler.totalScheduled();
}

// =============================================================================
// State access
// =============================================================================

std::optional<ParticleBatch> Simulation::readParticles() {
    Pipelines& p = *m_pipelines;
    std::vector<uint8_t> bytes;
    if (!gpu::readBuffer(m_gpu->device(), m_gpu->queue(), p.buffers->read(), 0, p.buffers->byteSize(), bytes)) {
        fail(makeError(ErrorKind::Device, "particle readback failed"));
        return std::nullopt;
    }
    ParticleBatch batch(p.programs.layout, p.buffers->count());
    batch.bytes() = std::move(bytes);
    return batch;
}

bool Simulation::writeParticles(const ParticleBatch& batch) {
    Pipelines& p = *m_pipelines;
    if (batch.count() != p.buffers->count() || batch.stride() != p.buffers->stride()) {
        std::ostringstream ss;
        ss << "batch of " << batch.count() << " x " << batch.stride() << " B does not match "
           << p.buffers->count() << " x " << p.buffers->stride() << " B";
        fail(makeError(ErrorKind::InvalidConfig, ss.str()));
        return false;
    }
    return p.buffers->upload(m_gpu->queue(), batch);
}

std::vector<float> Simulation::readField(const std::string& name) {
    Pipelines& p = *m_pipelines;
    auto id = p.programs.fields.idOf(name);
    if (!id || !p.fields) {
        return {};
    }
    return p.fields->readField(m_gpu->device(), m_gpu->queue(), *id);
}

bool Simulation::readGrid(std::vector<uint32_t>& cellOffsets, std::vector<uint32_t>& sortedIndices) {
    Pipelines& p = *m_pipelines;
    if (!p.grid) {
        return false;
    }
    WGPUDevice device = m_gpu->device();
    WGPUQueue queue = m_gpu->queue();

    std::vector<uint8_t> bytes;
    if (!gpu::readBuffer(device, queue, p.grid->cellOffsets(), 0,
                         uint64_t(p.grid->numCells() + 1) * sizeof(uint32_t), bytes)) {
        fail(makeError(ErrorKind::Device, "cell offset readback failed"));
        return false;
    }
    cellOffsets.resize(bytes.size() / sizeof(uint32_t));
    std::memcpy(cellOffsets.data(), bytes.data(), cellOffsets.size() * sizeof(uint32_t));

    if (!gpu::readBuffer(device, queue, p.grid->sortedIndices(), 0,
                         uint64_t(p.buffers->count()) * sizeof(uint32_t), bytes)) {
        fail(makeError(ErrorKind::Device, "sorted index readback failed"));
        return false;
    }
    sortedIndices.resize(bytes.size() / sizeof(uint32_t));
    std::memcpy(sortedIndices.data(), bytes.data(), sortedIndices.size() * sizeof(uint32_t));
    return true;
}

uint32_t Simulation::particleCount() const {
    return m_pipelines->buffers->count();
}

const ParticleLayout& Simulation::layout() const {
    return m_pipelines->programs.layout;
}

const CompiledPrograms& Simulation::programs() const {
    return m_pipelines->programs;
}

} // namespace flux
