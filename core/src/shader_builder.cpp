// Flux - Shader Builder Implementation

#include <flux/shader_builder.h>
#include <flux/shader_lib.h>
#include <algorithm>
#include <sstream>

namespace flux {

namespace {

const char* ITEM_INDEX = "gid.x + gid.y * nwg.x * 64u";

const char* LIFECYCLE_HELPERS = R"(
fn is_alive(q: Particle) -> bool {
    return q.alive != 0u;
}

fn kill_particle(q: ptr<function, Particle>) {
    (*q).alive = 0u;
}

fn respawn_at(q: ptr<function, Particle>, pos: vec3<f32>, vel: vec3<f32>) {
    (*q).position = pos;
    (*q).velocity = vel;
    (*q).age = 0.0;
    (*q).alive = 1u;
    (*q).scale = 1.0;
}
)";

struct NeighborGroup {
    std::vector<RuleCode> parts;

    bool empty() const { return parts.empty(); }

    std::string radius() const {
        std::string expr = parts.front().radius;
        for (size_t i = 1; i < parts.size(); ++i) {
            expr = "max(" + expr + ", " + parts[i].radius + ")";
        }
        return expr;
    }
};

std::string emitNeighborGroup(const NeighborGroup& group, uint32_t maxNeighbors) {
    std::string setup;
    std::string loop;
    std::string post;
    for (const RuleCode& part : group.parts) {
        setup += part.setup;
        loop += "{\n" + part.neighbor + "}\n";
        post += "{\n" + part.post + "}\n";
    }
    std::ostringstream ss;
    ss << "{\n";
    ss << setup;
    ss << neighborLoopWgsl(group.radius(), indentWgsl(loop, 4), maxNeighbors);
    ss << post;
    ss << "}\n";
    return ss.str();
}

} // namespace

std::string indentWgsl(const std::string& code, int levels) {
    std::string pad(static_cast<size_t>(levels) * 4, ' ');
    std::istringstream in(code);
    std::ostringstream out;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) out << pad << line;
        out << "\n";
    }
    return out.str();
}

// =============================================================================
// Names
// =============================================================================

const char* particleShapeName(ParticleShape shape) {
    switch (shape) {
        case ParticleShape::Circle: return "circle";
        case ParticleShape::Square: return "square";
        case ParticleShape::Glow: return "glow";
    }
    return "circle";
}

std::optional<ParticleShape> parseParticleShape(const std::string& name) {
    if (name == "circle") return ParticleShape::Circle;
    if (name == "square") return ParticleShape::Square;
    if (name == "glow") return ParticleShape::Glow;
    return std::nullopt;
}

const char* blendModeName(BlendMode mode) {
    switch (mode) {
        case BlendMode::Alpha: return "alpha";
        case BlendMode::Additive: return "additive";
        case BlendMode::Opaque: return "opaque";
    }
    return "alpha";
}

std::optional<BlendMode> parseBlendMode(const std::string& name) {
    if (name == "alpha") return BlendMode::Alpha;
    if (name == "additive") return BlendMode::Additive;
    if (name == "opaque") return BlendMode::Opaque;
    return std::nullopt;
}

// =============================================================================
// ShaderBuilder
// =============================================================================

ShaderBuilder::ShaderBuilder(const ParticleLayout& layout, const UniformLayout& uniforms,
                             const FieldRegistry& fields, ShaderConfig config)
    : m_layout(&layout)
    , m_uniforms(&uniforms)
    , m_fields(&fields)
    , m_config(std::move(config)) {
}

std::optional<BuildError> ShaderBuilder::validate() const {
    RuleContext ctx;
    ctx.bounds = m_config.bounds;
    ctx.layout = m_layout;
    ctx.fields = m_fields;
    ctx.cellSize = m_config.spatial.cellSize;
    for (uint32_t i = 0; i < m_config.rules.size(); ++i) {
        ctx.index = i;
        if (auto err = validateRule(m_config.rules[i], ctx)) {
            err->message = "rule " + std::to_string(i) + " " + err->message;
            return err;
        }
    }
    for (const SubEmitter& sub : m_config.subEmitters) {
        if (auto err = validateSubEmitter(sub)) return err;
    }
    if (needsNeighbors()) {
        if (auto err = validateSpatial(m_config.spatial, maxNeighborRadius())) return err;
    }
    return std::nullopt;
}

bool ShaderBuilder::needsNeighbors() const {
    return std::any_of(m_config.rules.begin(), m_config.rules.end(),
                       [](const Rule& r) { return requiresNeighbors(r); });
}

float ShaderBuilder::maxNeighborRadius() const {
    float radius = 0.0f;
    for (const Rule& r : m_config.rules) {
        if (!requiresNeighbors(r)) continue;
        float rr = neighborRadius(r);
        // NeighborCustom with radius 0 searches one cell
        if (rr <= 0.0f) rr = m_config.spatial.cellSize;
        radius = std::max(radius, rr);
    }
    return radius;
}

BindGroupPlan ShaderBuilder::bindGroups() const {
    BindGroupPlan plan;
    if (needsNeighbors()) plan.grid = plan.count++;
    if (usesFields()) plan.fields = plan.count++;
    if (recordsDeaths()) plan.death = plan.count++;
    return plan;
}

std::string ShaderBuilder::header() const {
    std::ostringstream ss;
    ss << m_layout->toWgsl("Particle") << "\n";
    ss << m_uniforms->toWgsl("Uniforms");
    ss << wgsl::CONSTANTS;
    ss << wgsl::RANDOM;
    ss << wgsl::NOISE;
    ss << wgsl::COLOR;
    return ss.str();
}

std::string ShaderBuilder::ruleSegments(std::string& functions) const {
    RuleContext ctx;
    ctx.bounds = m_config.bounds;
    ctx.layout = m_layout;
    ctx.fields = m_fields;
    ctx.cellSize = m_config.spatial.cellSize;

    std::ostringstream body;
    NeighborGroup group;
    auto flush = [&]() {
        if (group.empty()) return;
        body << emitNeighborGroup(group, m_config.spatial.maxNeighbors);
        group.parts.clear();
    };

    for (uint32_t i = 0; i < m_config.rules.size(); ++i) {
        const Rule& rule = m_config.rules[i];
        ctx.index = i;
        RuleCode code = lowerRule(rule, ctx);
        if (!code.functions.empty()) {
            functions += "\n// " + std::string(ruleName(rule)) + " (rule " + std::to_string(i) + ")\n";
            functions += code.functions;
        }
        if (requiresNeighbors(rule)) {
            group.parts.push_back(std::move(code));
        } else {
            flush();
            body << "// " << ruleName(rule) << "\n";
            body << code.body;
        }
        if (rule.is<rules::ColorOverLife>()) {
            ctx.colorAssigned = true;
        }
    }
    flush();
    return body.str();
}

std::string ShaderBuilder::epilogue() const {
    std::ostringstream ss;
    ss << "if (!flux_integrated) {\n";
    ss << "    p.position += p.velocity * dt;\n";
    ss << "}\n";
    ss << "if (!flux_aged) {\n";
    ss << "    p.age += dt;\n";
    ss << "}\n";

    for (const SubEmitter& sub : m_config.subEmitters) {
        if (!sub.childLifetime) continue;
        ss << "if (p.particle_type == " << sub.childType << "u && p.age >= "
           << wgslFloat(*sub.childLifetime) << ") {\n";
        ss << "    kill_particle(&p);\n";
        ss << "}\n";
    }

    if (recordsDeaths()) {
        std::vector<uint32_t> parents;
        for (const SubEmitter& sub : m_config.subEmitters) {
            if (std::find(parents.begin(), parents.end(), sub.parentType) == parents.end()) {
                parents.push_back(sub.parentType);
            }
        }
        std::string cond;
        for (uint32_t t : parents) {
            if (!cond.empty()) cond += " || ";
            cond += "p.particle_type == " + std::to_string(t) + "u";
        }
        ss << "if (p.alive == 0u && (" << cond << ")) {\n";
        ss << "    let slot = atomicAdd(&death.count, 1u);\n";
        ss << "    if (slot < MAX_DEATH_EVENTS) {\n";
        ss << "        death.events[slot].position = p.position;\n";
        ss << "        death.events[slot].parent_type = p.particle_type;\n";
        ss << "        death.events[slot].velocity = p.velocity;\n";
        if (m_layout->hasColor()) {
            ss << "        death.events[slot].color = p." << m_layout->colorField() << ";\n";
        }
        ss << "    }\n";
        ss << "}\n";
    }
    return ss.str();
}

std::string ShaderBuilder::simulateProgram() const {
    BindGroupPlan plan = bindGroups();
    std::string functions;
    std::string rulesCode = ruleSegments(functions);

    std::ostringstream ss;
    ss << header();
    ss << LIFECYCLE_HELPERS;
    ss << "\n@group(0) @binding(0) var<storage, read> particles_read: array<Particle>;\n";
    ss << "@group(0) @binding(1) var<storage, read_write> particles_write: array<Particle>;\n";
    ss << "@group(0) @binding(2) var<uniform> uniforms: Uniforms;\n";

    if (plan.grid) {
        ss << gridHelpersWgsl();
        ss << gridBindingsWgsl(*plan.grid);
    }
    if (plan.fields) {
        ss << m_fields->declarationsWgsl(*plan.fields);
    }
    if (plan.death) {
        ss << deathStructsWgsl(true);
        ss << "\n@group(" << *plan.death << ") @binding(0) var<storage, read_write> death: DeathBuffer;\n";
    }
    if (!m_config.custom.computePrelude.empty()) {
        ss << "\n" << m_config.custom.computePrelude << "\n";
    }
    ss << functions;

    ss << "\n@compute @workgroup_size(64)\n";
    ss << "fn simulate(@builtin(global_invocation_id) gid: vec3<u32>,\n";
    ss << "            @builtin(num_workgroups) nwg: vec3<u32>) {\n";
    ss << "    let index = " << ITEM_INDEX << ";\n";
    ss << "    if (index >= uniforms.particle_count) {\n";
    ss << "        return;\n";
    ss << "    }\n";
    ss << "    var p = particles_read[index];\n";
    ss << "    if (p.alive == 0u) {\n";
    ss << "        particles_write[index] = p;\n";
    ss << "        return;\n";
    ss << "    }\n";
    ss << "    let dt = uniforms.delta_time;\n";
    ss << "    var flux_integrated = false;\n";
    ss << "    var flux_aged = false;\n\n";
    ss << indentWgsl(rulesCode, 1);
    ss << "\n";
    ss << indentWgsl(epilogue(), 1);
    ss << "    particles_write[index] = p;\n";
    ss << "}\n";
    return ss.str();
}

std::string ShaderBuilder::spawnColor(const std::string& target, const std::string& value) const {
    if (!m_layout->hasColor()) return "";
    return target + "." + m_layout->colorField() + " = " + value + ";\n";
}

std::string ShaderBuilder::emitProgram() const {
    std::ostringstream ss;
    ss << m_layout->toWgsl("Particle");
    ss << wgsl::CONSTANTS;
    ss << wgsl::RANDOM;
    ss << emitterStructsWgsl();
    ss << R"(
@group(0) @binding(0) var<storage, read_write> particles: array<Particle>;
@group(0) @binding(1) var<storage, read> emitters: array<EmitterData>;
@group(0) @binding(2) var<storage, read_write> emit_counters: array<atomic<u32>>;
@group(0) @binding(3) var<uniform> params: EmitParams;

fn spawn(em: EmitterData, seed: u32) -> Particle {
    var q: Particle;
    q.alive = 1u;
    q.scale = 1.0;
    q.age = 0.0;
    switch em.kind {
        case 0u: {
            q.position = em.a.xyz;
            if (em.a.w > 0.0) {
                q.velocity = rand_sphere(seed) * em.a.w;
            } else {
                q.velocity = rand_vec3(seed) * 0.5;
            }
        }
        case 1u: {
            q.position = em.a.xyz;
            q.velocity = rand_sphere(seed) * em.a.w;
        }
        case 2u: {
            q.position = em.a.xyz;
            q.velocity = rand_cone(seed, em.b.xyz, em.b.w) * em.a.w;
        }
        case 3u: {
            let dir = rand_sphere(seed);
            q.position = em.a.xyz + dir * em.b.w;
            q.velocity = dir * em.a.w;
        }
        default: {
            let t = vec3<f32>(rand(seed), rand(hash2(seed, 1u)), rand(hash2(seed, 2u)));
            q.position = mix(em.a.xyz, em.b.xyz, t);
            q.velocity = em.c.xyz;
        }
    }
    if (em.has_type != 0u) {
        q.particle_type = em.particle_type;
    }
    if (em.color.w > 0.5) {
)";
    ss << indentWgsl(spawnColor("q", "em.color.xyz"), 2);
    ss << R"(    }
    return q;
}

@compute @workgroup_size(64)
fn emit(@builtin(global_invocation_id) gid: vec3<u32>,
        @builtin(num_workgroups) nwg: vec3<u32>) {
    let index = )" << ITEM_INDEX << R"(;
    if (index >= params.num_particles) {
        return;
    }
    if (particles[index].alive != 0u) {
        return;
    }
    for (var e = 0u; e < params.num_emitters; e++) {
        let em = emitters[e];
        if (em.budget == 0u) {
            continue;
        }
        let ticket = atomicAdd(&emit_counters[e], 1u);
        if (ticket >= em.budget) {
            continue;
        }
        let seed = hash2(hash2(index, params.frame), e * 7919u + ticket);
        particles[index] = spawn(em, seed);
        return;
    }
}
)";
    return ss.str();
}

std::string ShaderBuilder::subEmitProgram() const {
    std::ostringstream ss;
    ss << m_layout->toWgsl("Particle");
    ss << wgsl::CONSTANTS;
    ss << wgsl::RANDOM;
    ss << emitterStructsWgsl();
    ss << deathStructsWgsl(false);
    ss << "\nconst SUB_EMIT_PROBE: u32 = " << SUB_EMIT_PROBE << "u;\n";
    ss << R"(
@group(0) @binding(0) var<storage, read_write> particles: array<Particle>;
@group(0) @binding(1) var<storage, read> death: DeathBuffer;
@group(0) @binding(2) var<storage, read_write> slot_claims: array<atomic<u32>>;
@group(0) @binding(3) var<uniform> params: EmitParams;

// Find a dead slot near a hashed start and claim it; NO_PARTICLE when none is free
fn claim_slot(seed: u32) -> u32 {
    let start = hash(seed) % params.num_particles;
    for (var probe = 0u; probe < SUB_EMIT_PROBE; probe++) {
        let slot = (start + probe) % params.num_particles;
        if (particles[slot].alive != 0u) {
            continue;
        }
        let claim = atomicCompareExchangeWeak(&slot_claims[slot], 0u, 1u);
        if (claim.exchanged) {
            return slot;
        }
    }
    return NO_PARTICLE;
}

@compute @workgroup_size(64)
fn sub_emit(@builtin(global_invocation_id) gid: vec3<u32>,
            @builtin(num_workgroups) nwg: vec3<u32>) {
    let e = )" << ITEM_INDEX << R"(;
    if (e >= min(death.count, MAX_DEATH_EVENTS)) {
        return;
    }
    let ev = death.events[e];
)";

    for (uint32_t s = 0; s < m_config.subEmitters.size(); ++s) {
        const SubEmitter& sub = m_config.subEmitters[s];
        float inherit = std::clamp(sub.inheritVelocity, 0.0f, 1.0f);
        std::ostringstream b;
        b << "if (ev.parent_type == " << sub.parentType << "u) {\n";
        b << "    for (var c = 0u; c < " << sub.count << "u; c++) {\n";
        b << "        let seed = hash2(hash2(e, params.frame), c * 31u + " << s * 1013u + 1u << "u);\n";
        b << "        let slot = claim_slot(seed);\n";
        b << "        if (slot == NO_PARTICLE) {\n";
        b << "            break;\n";
        b << "        }\n";
        b << "        var q: Particle;\n";
        b << "        q.alive = 1u;\n";
        b << "        q.scale = 1.0;\n";
        b << "        q.particle_type = " << sub.childType << "u;\n";
        b << "        q.position = ev.position";
        if (sub.spawnRadius > 0.0f) {
            b << " + rand_in_sphere(hash2(seed, 3u)) * " << wgslFloat(sub.spawnRadius);
        }
        b << ";\n";
        b << "        let dir = rand_cone(hash2(seed, 1u), ev.velocity, " << wgslFloat(sub.spread) << ");\n";
        b << "        let speed = rand_range(hash2(seed, 2u), " << wgslFloat(sub.speedMin) << ", "
          << wgslFloat(sub.speedMax) << ");\n";
        b << "        q.velocity = dir * speed + ev.velocity * " << wgslFloat(inherit) << ";\n";
        if (sub.childColor) {
            b << indentWgsl(spawnColor("q", wgslLiteral(*sub.childColor)), 2);
        } else {
            b << indentWgsl(spawnColor("q", "ev.color"), 2);
        }
        b << "        particles[slot] = q;\n";
        b << "    }\n";
        b << "}\n";
        ss << indentWgsl(b.str(), 1);
    }
    ss << "}\n";
    return ss.str();
}

std::string ShaderBuilder::renderProgram() const {
    std::ostringstream ss;
    ss << m_layout->toWgsl("Particle") << "\n";
    ss << m_uniforms->toWgsl("Uniforms");
    ss << wgsl::CONSTANTS;
    ss << wgsl::COLOR;
    ss << R"(
struct RenderParams {
    aspect: f32,
    particle_size: f32,
    focal: f32,
    _pad0: f32,
};

struct VertexOutput {
    @builtin(position) clip_position: vec4<f32>,
    @location(0) uv: vec2<f32>,
    @location(1) color: vec3<f32>,
    @location(2) alpha: f32,
};

@group(0) @binding(0) var<storage, read> particles: array<Particle>;
@group(0) @binding(1) var<uniform> uniforms: Uniforms;
@group(0) @binding(2) var<uniform> render: RenderParams;

@vertex
fn vs_main(@builtin(vertex_index) vertex: u32,
           @builtin(instance_index) instance: u32) -> VertexOutput {
    var corners = array<vec2<f32>, 6>(
        vec2<f32>(-1.0, -1.0),
        vec2<f32>(1.0, -1.0),
        vec2<f32>(1.0, 1.0),
        vec2<f32>(-1.0, -1.0),
        vec2<f32>(1.0, 1.0),
        vec2<f32>(-1.0, 1.0)
    );
    let p = particles[instance];
    let corner = corners[vertex];
    var out: VertexOutput;
    out.uv = corner;
    out.alpha = 1.0;
    if (p.alive == 0u) {
        out.clip_position = vec4<f32>(2.0, 2.0, 2.0, 1.0);
        out.color = vec3<f32>(0.0);
        return out;
    }
    let clip = uniforms.view_proj * vec4<f32>(p.position, 1.0);
    let size = render.particle_size * p.scale * render.focal;
    out.clip_position = clip + vec4<f32>(corner.x * size / render.aspect, corner.y * size, 0.0, 0.0);
)";
    if (m_layout->hasColor()) {
        ss << "    out.color = p." << m_layout->colorField() << ";\n";
    } else {
        ss << "    let speed = length(p.velocity);\n";
        ss << "    out.color = hsv_to_rgb(fract(0.6 - speed * 0.15), 0.7, 1.0);\n";
    }
    if (!m_config.custom.vertex.empty()) {
        ss << "    {\n" << indentWgsl(m_config.custom.vertex, 2) << "    }\n";
    }
    ss << "    return out;\n";
    ss << "}\n";

    ss << R"(
@fragment
fn fs_main(in: VertexOutput) -> @location(0) vec4<f32> {
    let d = length(in.uv);
    var color = vec4<f32>(in.color, in.alpha);
)";
    switch (m_config.shape) {
        case ParticleShape::Circle:
            ss << "    if (d > 1.0) {\n";
            ss << "        discard;\n";
            ss << "    }\n";
            ss << "    color.a *= 1.0 - smoothstep(0.8, 1.0, d);\n";
            break;
        case ParticleShape::Glow:
            ss << "    if (d > 1.0) {\n";
            ss << "        discard;\n";
            ss << "    }\n";
            ss << "    let falloff = 1.0 - d;\n";
            ss << "    color.a *= falloff * falloff;\n";
            break;
        case ParticleShape::Square:
            break;
    }
    if (!m_config.custom.fragment.empty()) {
        ss << "    {\n" << indentWgsl(m_config.custom.fragment, 2) << "    }\n";
    }
    ss << "    return color;\n";
    ss << "}\n";
    return ss.str();
}

} // namespace flux
