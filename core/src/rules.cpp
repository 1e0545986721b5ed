// Flux - Rule Catalogue Implementation

#include <flux/rules.h>
#include <flux/field.h>
#include <flux/layout.h>
#include <flux/spatial.h>
#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>

namespace flux {

namespace rules {

Typed typed(uint32_t selfType, Rule inner) {
    Typed t;
    t.selfType = selfType;
    t.inner = std::make_shared<const Rule>(std::move(inner));
    return t;
}

Typed typed(uint32_t selfType, uint32_t otherType, Rule inner) {
    Typed t = typed(selfType, std::move(inner));
    t.otherType = otherType;
    return t;
}

} // namespace rules

namespace {

// Helpers for emitting one rule's WGSL
struct Emit {
    const RuleContext& ctx;

    std::string param(const char* name) const {
        return "uniforms." + ruleParamName(ctx.index, name);
    }

    std::string var(const char* name) const {
        return "r" + std::to_string(ctx.index) + "_" + name;
    }

    std::string colorField() const {
        if (ctx.layout && ctx.layout->hasColor()) return ctx.layout->colorField();
        return "color";
    }

    bool hasF32(const std::string& name) const {
        return ctx.layout && ctx.layout->typeOf(name) == FieldType::F32;
    }
};

std::string integrateFirst() {
    return "if (!flux_integrated) {\n"
           "    p.position += p.velocity * dt;\n"
           "    flux_integrated = true;\n"
           "}\n";
}

// "if (a) {...} else if (b) {...}" over the agent states, skipping empty snippets
std::string stateChain(const std::string& field, const std::vector<rules::AgentState>& states,
                       std::string rules::AgentState::*code) {
    std::ostringstream ss;
    bool first = true;
    for (const rules::AgentState& s : states) {
        if ((s.*code).empty()) continue;
        ss << (first ? "if" : " else if") << " (p." << field << " == " << s.id << "u) {\n";
        ss << s.*code << "\n";
        ss << "}";
        first = false;
    }
    if (!first) ss << "\n";
    return ss.str();
}

std::string fieldZero(FieldType type) {
    return wgslLiteral(defaultValue(type));
}

std::optional<BuildError> invalid(const Rule& rule, const std::string& msg) {
    return makeError(ErrorKind::InvalidRule, std::string(ruleName(rule)) + ": " + msg);
}

std::optional<BuildError> requireField(const Rule& rule, const RuleContext& ctx,
                                       const std::string& name, std::initializer_list<FieldType> allowed) {
    if (!ctx.layout) return std::nullopt;
    auto type = ctx.layout->typeOf(name);
    if (!type) {
        return invalid(rule, "particle field '" + name + "' does not exist");
    }
    if (std::find(allowed.begin(), allowed.end(), *type) == allowed.end()) {
        return invalid(rule, "particle field '" + name + "' has unsupported type " + wgslTypeName(*type));
    }
    return std::nullopt;
}

std::optional<BuildError> requirePositive(const Rule& rule, const char* what, float v) {
    if (!(v > 0.0f)) {
        return invalid(rule, std::string(what) + " must be positive");
    }
    return std::nullopt;
}

} // namespace

// =============================================================================
// Queries
// =============================================================================

const char* ruleName(const Rule& rule) {
    static const char* NAMES[] = {
        "Gravity", "Acceleration", "Drag",
        "BounceWalls", "WrapWalls", "SpeedLimit",
        "Separate", "Cohere", "Align", "Collide",
        "NBodyGravity", "PointGravity", "LennardJones",
        "Pressure", "Viscosity",
        "Curl", "Turbulence", "Wander",
        "Vortex", "Spring", "Orbit",
        "Chase", "Evade", "Convert",
        "Refractory", "Diffuse", "Sync",
        "Typed", "InteractionMatrix", "BondSprings", "Agent",
        "Age", "Lifetime", "FadeOut", "ShrinkOut",
        "ColorOverLife", "RespawnBelow",
        "Custom", "NeighborCustom",
    };
    static_assert(sizeof(NAMES) / sizeof(NAMES[0]) == std::variant_size_v<Rule::Variant>,
                  "rule name table out of sync");
    return NAMES[rule.variant().index()];
}

bool requiresNeighbors(const Rule& rule) {
    return std::visit([](const auto& r) -> bool {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, rules::Typed>) {
            return r.inner && requiresNeighbors(*r.inner);
        } else {
            return std::is_same_v<T, rules::Separate> || std::is_same_v<T, rules::Cohere> ||
                   std::is_same_v<T, rules::Align> || std::is_same_v<T, rules::Collide> ||
                   std::is_same_v<T, rules::NBodyGravity> || std::is_same_v<T, rules::LennardJones> ||
                   std::is_same_v<T, rules::Pressure> || std::is_same_v<T, rules::Viscosity> ||
                   std::is_same_v<T, rules::Chase> || std::is_same_v<T, rules::Evade> ||
                   std::is_same_v<T, rules::Convert> || std::is_same_v<T, rules::Diffuse> ||
                   std::is_same_v<T, rules::InteractionMatrix> ||
                   std::is_same_v<T, rules::NeighborCustom>;
        }
    }, rule.variant());
}

float neighborRadius(const Rule& rule) {
    return std::visit([](const auto& r) -> float {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, rules::Typed>) {
            return r.inner ? neighborRadius(*r.inner) : 0.0f;
        } else if constexpr (std::is_same_v<T, rules::LennardJones>) {
            return r.cutoff;
        } else if constexpr (std::is_same_v<T, rules::InteractionMatrix>) {
            float m = 0.0f;
            for (float v : r.radius) m = std::max(m, v);
            return m;
        } else if constexpr (std::is_same_v<T, rules::Separate> || std::is_same_v<T, rules::Cohere> ||
                             std::is_same_v<T, rules::Align> || std::is_same_v<T, rules::Collide> ||
                             std::is_same_v<T, rules::NBodyGravity> || std::is_same_v<T, rules::Pressure> ||
                             std::is_same_v<T, rules::Viscosity> || std::is_same_v<T, rules::Chase> ||
                             std::is_same_v<T, rules::Evade> || std::is_same_v<T, rules::Convert> ||
                             std::is_same_v<T, rules::Diffuse> || std::is_same_v<T, rules::NeighborCustom>) {
            return r.radius;
        } else {
            return 0.0f;
        }
    }, rule.variant());
}

const char* radiusParameter(const Rule& rule) {
    if (rule.is<rules::Typed>()) {
        const auto& t = rule.as<rules::Typed>();
        return t.inner ? radiusParameter(*t.inner) : nullptr;
    }
    if (rule.is<rules::LennardJones>()) return "cutoff";
    if (rule.is<rules::InteractionMatrix>()) return nullptr;
    return requiresNeighbors(rule) ? "radius" : nullptr;
}

std::vector<UniformDecl> dynamicParameters(const Rule& rule) {
    std::vector<UniformDecl> out;
    auto add = [&out](const char* name, const Value& v) { out.push_back({name, v}); };

    std::visit([&](const auto& r) {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, rules::Gravity>) {
            add("strength", r.strength);
        } else if constexpr (std::is_same_v<T, rules::Acceleration>) {
            add("acceleration", r.acceleration);
        } else if constexpr (std::is_same_v<T, rules::Drag>) {
            add("coefficient", r.coefficient);
        } else if constexpr (std::is_same_v<T, rules::SpeedLimit>) {
            add("min", r.min);
            add("max", r.max);
        } else if constexpr (std::is_same_v<T, rules::Separate> || std::is_same_v<T, rules::Cohere> ||
                             std::is_same_v<T, rules::Align> || std::is_same_v<T, rules::Viscosity>) {
            add("radius", r.radius);
            add("strength", r.strength);
        } else if constexpr (std::is_same_v<T, rules::Collide>) {
            add("radius", r.radius);
            add("restitution", r.restitution);
        } else if constexpr (std::is_same_v<T, rules::NBodyGravity>) {
            add("strength", r.strength);
            add("softening", r.softening);
            add("radius", r.radius);
        } else if constexpr (std::is_same_v<T, rules::PointGravity>) {
            add("point", r.point);
            add("strength", r.strength);
            add("softening", r.softening);
        } else if constexpr (std::is_same_v<T, rules::LennardJones>) {
            add("epsilon", r.epsilon);
            add("sigma", r.sigma);
            add("cutoff", r.cutoff);
        } else if constexpr (std::is_same_v<T, rules::Pressure>) {
            add("radius", r.radius);
            add("strength", r.strength);
            add("target_density", r.targetDensity);
        } else if constexpr (std::is_same_v<T, rules::Curl> || std::is_same_v<T, rules::Turbulence>) {
            add("scale", r.scale);
            add("strength", r.strength);
        } else if constexpr (std::is_same_v<T, rules::Wander>) {
            add("strength", r.strength);
            add("frequency", r.frequency);
        } else if constexpr (std::is_same_v<T, rules::Vortex>) {
            add("center", r.center);
            add("axis", r.axis);
            add("strength", r.strength);
        } else if constexpr (std::is_same_v<T, rules::Spring>) {
            add("anchor", r.anchor);
            add("stiffness", r.stiffness);
            add("damping", r.damping);
        } else if constexpr (std::is_same_v<T, rules::Orbit>) {
            add("center", r.center);
            add("strength", r.strength);
        } else if constexpr (std::is_same_v<T, rules::Chase> || std::is_same_v<T, rules::Evade>) {
            add("radius", r.radius);
            add("strength", r.strength);
        } else if constexpr (std::is_same_v<T, rules::Convert>) {
            add("radius", r.radius);
            add("probability", r.probability);
        } else if constexpr (std::is_same_v<T, rules::Refractory>) {
            add("threshold", r.threshold);
            add("depletion_rate", r.depletionRate);
            add("regen_rate", r.regenRate);
        } else if constexpr (std::is_same_v<T, rules::Diffuse>) {
            add("radius", r.radius);
            add("rate", r.rate);
        } else if constexpr (std::is_same_v<T, rules::Sync>) {
            add("frequency", r.frequency);
            add("emit_amount", r.emitAmount);
            add("coupling", r.coupling);
            add("detection_threshold", r.detectionThreshold);
        } else if constexpr (std::is_same_v<T, rules::Typed>) {
            if (r.inner) out = dynamicParameters(*r.inner);
        } else if constexpr (std::is_same_v<T, rules::InteractionMatrix>) {
            add("strength", r.strength);
            add("beta", r.beta);
        } else if constexpr (std::is_same_v<T, rules::BondSprings>) {
            add("stiffness", r.stiffness);
            add("damping", r.damping);
            add("rest_length", r.restLength);
            if (r.maxStretch) add("max_stretch", *r.maxStretch);
        } else if constexpr (std::is_same_v<T, rules::Lifetime> || std::is_same_v<T, rules::FadeOut> ||
                             std::is_same_v<T, rules::ShrinkOut>) {
            add("duration", r.duration);
        } else if constexpr (std::is_same_v<T, rules::ColorOverLife>) {
            add("start", r.start);
            add("end", r.end);
            add("duration", r.duration);
        } else if constexpr (std::is_same_v<T, rules::RespawnBelow>) {
            add("threshold_y", r.thresholdY);
            add("spawn_y", r.spawnY);
        } else if constexpr (std::is_same_v<T, rules::NeighborCustom>) {
            add("radius", r.radius);
        }
    }, rule.variant());
    return out;
}

std::string ruleParamName(uint32_t index, const std::string& param) {
    return "rule" + std::to_string(index) + "_" + param;
}

std::vector<UniformDecl> ruleUniforms(const std::vector<Rule>& list) {
    std::vector<UniformDecl> out;
    for (uint32_t i = 0; i < list.size(); ++i) {
        for (UniformDecl& d : dynamicParameters(list[i])) {
            d.name = ruleParamName(i, d.name);
            out.push_back(std::move(d));
        }
    }
    return out;
}

// =============================================================================
// Validation
// =============================================================================

std::optional<BuildError> validateRule(const Rule& rule, const RuleContext& ctx) {
    return std::visit([&](const auto& r) -> std::optional<BuildError> {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, rules::SpeedLimit>) {
            if (r.min < 0.0f || r.min > r.max) {
                return invalid(rule, "requires 0 <= min <= max");
            }
        } else if constexpr (std::is_same_v<T, rules::LennardJones>) {
            if (auto e = requirePositive(rule, "cutoff", r.cutoff)) return e;
            if (auto e = requirePositive(rule, "sigma", r.sigma)) return e;
        } else if constexpr (std::is_same_v<T, rules::Separate> || std::is_same_v<T, rules::Cohere> ||
                             std::is_same_v<T, rules::Align> || std::is_same_v<T, rules::Collide> ||
                             std::is_same_v<T, rules::NBodyGravity> || std::is_same_v<T, rules::Pressure> ||
                             std::is_same_v<T, rules::Viscosity> || std::is_same_v<T, rules::Chase> ||
                             std::is_same_v<T, rules::Evade>) {
            if (auto e = requirePositive(rule, "radius", r.radius)) return e;
        } else if constexpr (std::is_same_v<T, rules::Convert>) {
            if (auto e = requirePositive(rule, "radius", r.radius)) return e;
            if (r.probability < 0.0f || r.probability > 1.0f) {
                return invalid(rule, "probability must be in [0, 1]");
            }
        } else if constexpr (std::is_same_v<T, rules::Diffuse>) {
            if (auto e = requirePositive(rule, "radius", r.radius)) return e;
            if (r.field.empty()) return invalid(rule, "no field given");
            return requireField(rule, ctx, r.field,
                                {FieldType::F32, FieldType::Vec2, FieldType::Vec3, FieldType::Vec4});
        } else if constexpr (std::is_same_v<T, rules::NeighborCustom>) {
            if (r.radius < 0.0f) return invalid(rule, "radius must not be negative");
        } else if constexpr (std::is_same_v<T, rules::Refractory>) {
            if (auto e = requireField(rule, ctx, r.trigger, {FieldType::F32})) return e;
            return requireField(rule, ctx, r.charge, {FieldType::F32});
        } else if constexpr (std::is_same_v<T, rules::Sync>) {
            if (auto e = requireField(rule, ctx, r.phaseField, {FieldType::F32})) return e;
            if (r.frequencyField) {
                if (auto e = requireField(rule, ctx, *r.frequencyField, {FieldType::F32})) return e;
            }
            if (!ctx.fields) return invalid(rule, "requires a field registry");
            const FieldConfig* f = ctx.fields->find(r.field);
            if (!f) return invalid(rule, "spatial field '" + r.field + "' does not exist");
            if (f->kind != FieldKind::Vector) {
                return invalid(rule, "spatial field '" + r.field + "' must be a vector field");
            }
        } else if constexpr (std::is_same_v<T, rules::Typed>) {
            if (!r.inner) return invalid(rule, "no inner rule");
            if (r.otherType && !requiresNeighbors(*r.inner)) {
                return invalid(rule, "other type given for a rule that does not read neighbors");
            }
            return validateRule(*r.inner, ctx);
        } else if constexpr (std::is_same_v<T, rules::InteractionMatrix>) {
            size_t n = r.numTypes;
            if (n == 0) return invalid(rule, "numTypes must be positive");
            if (r.attraction.size() != n * n || r.radius.size() != n * n) {
                return invalid(rule, "attraction and radius tables must have numTypes^2 entries");
            }
            for (float v : r.radius) {
                if (v < 0.0f) return invalid(rule, "radius entries must not be negative");
            }
            if (!(neighborRadius(rule) > 0.0f)) return invalid(rule, "all radius entries are zero");
            if (!(r.beta > 0.0f && r.beta < 1.0f)) return invalid(rule, "beta must be in (0, 1)");
        } else if constexpr (std::is_same_v<T, rules::BondSprings>) {
            if (r.bonds.empty()) return invalid(rule, "no bond fields");
            for (const std::string& b : r.bonds) {
                if (auto e = requireField(rule, ctx, b, {FieldType::U32})) return e;
            }
        } else if constexpr (std::is_same_v<T, rules::Agent>) {
            if (r.states.empty()) return invalid(rule, "no states");
            if (auto e = requireField(rule, ctx, r.stateField, {FieldType::U32})) return e;
            if (auto e = requireField(rule, ctx, r.prevStateField, {FieldType::U32})) return e;
            if (r.timerField) {
                if (auto e = requireField(rule, ctx, *r.timerField, {FieldType::F32})) return e;
            }
            std::set<uint32_t> ids;
            for (const rules::AgentState& s : r.states) {
                if (!ids.insert(s.id).second) {
                    return invalid(rule, "duplicate state id " + std::to_string(s.id));
                }
            }
            for (const rules::AgentState& s : r.states) {
                for (const rules::AgentTransition& t : s.transitions) {
                    if (!ids.count(t.to)) {
                        return invalid(rule, "transition to unknown state " + std::to_string(t.to));
                    }
                    if (t.condition.empty()) {
                        return invalid(rule, "transition from state " + std::to_string(s.id) +
                                             " has no condition");
                    }
                }
            }
        } else if constexpr (std::is_same_v<T, rules::Lifetime> || std::is_same_v<T, rules::ShrinkOut>) {
            return requirePositive(rule, "duration", r.duration);
        } else if constexpr (std::is_same_v<T, rules::FadeOut> || std::is_same_v<T, rules::ColorOverLife>) {
            if (auto e = requirePositive(rule, "duration", r.duration)) return e;
            if (ctx.layout && !ctx.layout->hasColor()) {
                return invalid(rule, "particle schema has no color field");
            }
            return requireField(rule, ctx, Emit{ctx}.colorField(), {FieldType::Vec3});
        }
        return std::nullopt;
    }, rule.variant());
}

// =============================================================================
// Lowering
// =============================================================================

RuleCode lowerRule(const Rule& rule, const RuleContext& ctx) {
    RuleCode code;
    Emit e{ctx};
    std::ostringstream body;
    std::ostringstream setup;
    std::ostringstream nb;
    std::ostringstream post;

    std::visit([&](const auto& r) {
        using T = std::decay_t<decltype(r)>;

        // ---------------------------------------------------------------------
        // Forces
        // ---------------------------------------------------------------------
        if constexpr (std::is_same_v<T, rules::Gravity>) {
            body << "p.velocity.y -= " << e.param("strength") << " * dt;\n";
        } else if constexpr (std::is_same_v<T, rules::Acceleration>) {
            body << "p.velocity += " << e.param("acceleration") << " * dt;\n";
        } else if constexpr (std::is_same_v<T, rules::Drag>) {
            body << "p.velocity *= max(0.0, 1.0 - " << e.param("coefficient") << " * dt);\n";
        } else if constexpr (std::is_same_v<T, rules::PointGravity>) {
            body << "let to_point = " << e.param("point") << " - p.position;\n";
            body << "let d2 = dot(to_point, to_point);\n";
            body << "if (d2 > 1e-12) {\n";
            body << "    let soft = " << e.param("softening") << ";\n";
            body << "    p.velocity += normalize(to_point) * " << e.param("strength")
                 << " / (d2 + soft * soft) * dt;\n";
            body << "}\n";
        } else if constexpr (std::is_same_v<T, rules::Vortex>) {
            body << "var axis = " << e.param("axis") << ";\n";
            body << "if (length(axis) < 1e-6) {\n";
            body << "    axis = vec3<f32>(0.0, 1.0, 0.0);\n";
            body << "}\n";
            body << "axis = normalize(axis);\n";
            body << "let rel = p.position - " << e.param("center") << ";\n";
            body << "let radial = rel - axis * dot(rel, axis);\n";
            body << "p.velocity += cross(axis, radial) * " << e.param("strength") << " * dt;\n";
        } else if constexpr (std::is_same_v<T, rules::Spring>) {
            body << "let disp = p.position - " << e.param("anchor") << ";\n";
            body << "p.velocity += (-" << e.param("stiffness") << " * disp - "
                 << e.param("damping") << " * p.velocity) * dt;\n";
        } else if constexpr (std::is_same_v<T, rules::Orbit>) {
            body << "let to_center = " << e.param("center") << " - p.position;\n";
            body << "let r = length(to_center);\n";
            body << "if (r > 1e-4) {\n";
            body << "    let inward = to_center / r;\n";
            body << "    let strength = " << e.param("strength") << ";\n";
            body << "    p.velocity += inward * strength / r * dt;\n";
            body << "    let tangential = p.velocity - inward * dot(p.velocity, inward);\n";
            body << "    let t_speed = length(tangential);\n";
            body << "    if (t_speed > 1e-5) {\n";
            body << "        let target_speed = sqrt(max(strength, 0.0));\n";
            body << "        p.velocity += tangential / t_speed * (target_speed - t_speed) * min(2.0 * dt, 1.0);\n";
            body << "    }\n";
            body << "}\n";
        } else if constexpr (std::is_same_v<T, rules::Curl>) {
            body << "let q = p.position * " << e.param("scale")
                 << " + vec3<f32>(0.0, 0.0, uniforms.time * 0.1);\n";
            body << "p.velocity += curl_noise(q) * " << e.param("strength") << " * dt;\n";
        } else if constexpr (std::is_same_v<T, rules::Turbulence>) {
            body << "let q = p.position * " << e.param("scale") << " + vec3<f32>(uniforms.time * 0.1);\n";
            body << "let n = vec3<f32>(\n";
            body << "    noise3(q),\n";
            body << "    noise3(q + vec3<f32>(31.416, 0.0, 0.0)),\n";
            body << "    noise3(q + vec3<f32>(0.0, 47.853, 0.0)));\n";
            body << "p.velocity += n * " << e.param("strength") << " * dt;\n";
        } else if constexpr (std::is_same_v<T, rules::Wander>) {
            body << "let t = uniforms.time * " << e.param("frequency") << ";\n";
            body << "let s = f32(index % 4096u) * 17.13;\n";
            body << "let dir = vec3<f32>(\n";
            body << "    noise2(vec2<f32>(t, s)),\n";
            body << "    noise2(vec2<f32>(t + 31.7, s)),\n";
            body << "    noise2(vec2<f32>(t + 67.1, s)));\n";
            body << "p.velocity += dir * " << e.param("strength") << " * dt;\n";

        // ---------------------------------------------------------------------
        // Boundaries & constraints
        // ---------------------------------------------------------------------
        } else if constexpr (std::is_same_v<T, rules::BounceWalls>) {
            body << integrateFirst();
            body << "let b = " << wgslFloat(ctx.bounds) << ";\n";
            for (const char* axis : {"x", "y", "z"}) {
                body << "if (p.position." << axis << " > b) {\n";
                body << "    p.position." << axis << " = b;\n";
                body << "    p.velocity." << axis << " = -abs(p.velocity." << axis << ");\n";
                body << "} else if (p.position." << axis << " < -b) {\n";
                body << "    p.position." << axis << " = -b;\n";
                body << "    p.velocity." << axis << " = abs(p.velocity." << axis << ");\n";
                body << "}\n";
            }
        } else if constexpr (std::is_same_v<T, rules::WrapWalls>) {
            body << integrateFirst();
            body << "let b = " << wgslFloat(ctx.bounds) << ";\n";
            body << "p.position = p.position - 2.0 * b * floor((p.position + vec3<f32>(b)) / (2.0 * b));\n";
            body << "p.position = clamp(p.position, vec3<f32>(-b), vec3<f32>(b));\n";
        } else if constexpr (std::is_same_v<T, rules::SpeedLimit>) {
            body << "let speed = length(p.velocity);\n";
            body << "if (speed > 0.0) {\n";
            body << "    p.velocity = p.velocity / speed * clamp(speed, "
                 << e.param("min") << ", " << e.param("max") << ");\n";
            body << "}\n";

        // ---------------------------------------------------------------------
        // Neighbor interactions
        // ---------------------------------------------------------------------
        } else if constexpr (std::is_same_v<T, rules::Separate>) {
            std::string acc = e.var("separate");
            std::string R = e.param("radius");
            setup << "var " << acc << " = vec3<f32>(0.0);\n";
            nb << "if (neighbor_dist < " << R << ") {\n";
            nb << "    " << acc << " += neighbor_dir * (" << R << " - neighbor_dist) / " << R << ";\n";
            nb << "}\n";
            post << "p.velocity += " << acc << " * " << e.param("strength") << " * dt;\n";
            code.radius = R;
        } else if constexpr (std::is_same_v<T, rules::Cohere>) {
            std::string sum = e.var("center_sum");
            std::string n = e.var("center_count");
            setup << "var " << sum << " = vec3<f32>(0.0);\n";
            setup << "var " << n << " = 0u;\n";
            nb << "if (neighbor_dist < " << e.param("radius") << ") {\n";
            nb << "    " << sum << " += other.position;\n";
            nb << "    " << n << " += 1u;\n";
            nb << "}\n";
            post << "if (" << n << " > 0u) {\n";
            post << "    let to_center = " << sum << " / f32(" << n << ") - p.position;\n";
            post << "    if (length(to_center) > 1e-6) {\n";
            post << "        p.velocity += normalize(to_center) * " << e.param("strength") << " * dt;\n";
            post << "    }\n";
            post << "}\n";
            code.radius = e.param("radius");
        } else if constexpr (std::is_same_v<T, rules::Align>) {
            std::string sum = e.var("velocity_sum");
            std::string n = e.var("velocity_count");
            setup << "var " << sum << " = vec3<f32>(0.0);\n";
            setup << "var " << n << " = 0u;\n";
            nb << "if (neighbor_dist < " << e.param("radius") << ") {\n";
            nb << "    " << sum << " += other.velocity;\n";
            nb << "    " << n << " += 1u;\n";
            nb << "}\n";
            post << "if (" << n << " > 0u) {\n";
            post << "    let avg = " << sum << " / f32(" << n << ");\n";
            post << "    p.velocity += (avg - p.velocity) * " << e.param("strength") << " * dt;\n";
            post << "}\n";
            code.radius = e.param("radius");
        } else if constexpr (std::is_same_v<T, rules::Collide>) {
            std::string R = e.param("radius");
            std::string impulse = e.var("impulse");
            std::string push = e.var("push");
            setup << "var " << impulse << " = vec3<f32>(0.0);\n";
            setup << "var " << push << " = vec3<f32>(0.0);\n";
            nb << "if (neighbor_dist < " << R << ") {\n";
            nb << "    let approach = dot(p.velocity - other.velocity, neighbor_dir);\n";
            nb << "    if (approach < 0.0) {\n";
            nb << "        " << impulse << " -= neighbor_dir * approach * (1.0 + "
               << e.param("restitution") << ") * 0.5;\n";
            nb << "    }\n";
            nb << "    " << push << " += neighbor_dir * (" << R << " - neighbor_dist) * 0.5;\n";
            nb << "}\n";
            post << "p.velocity += " << impulse << ";\n";
            post << "p.position += " << push << ";\n";
            code.radius = R;
        } else if constexpr (std::is_same_v<T, rules::NBodyGravity>) {
            std::string force = e.var("gravity");
            std::string mass = e.hasF32("mass") ? "other.mass" : "1.0";
            setup << "var " << force << " = vec3<f32>(0.0);\n";
            nb << "if (neighbor_dist < " << e.param("radius") << ") {\n";
            nb << "    let soft = " << e.param("softening") << ";\n";
            nb << "    " << force << " -= neighbor_dir * " << e.param("strength") << " * " << mass
               << " / (neighbor_dist * neighbor_dist + soft * soft);\n";
            nb << "}\n";
            post << "p.velocity += " << force << " * dt;\n";
            code.radius = e.param("radius");
        } else if constexpr (std::is_same_v<T, rules::LennardJones>) {
            std::string force = e.var("lj");
            setup << "var " << force << " = vec3<f32>(0.0);\n";
            nb << "if (neighbor_dist < " << e.param("cutoff") << " && neighbor_dist > 1e-6) {\n";
            nb << "    let sr = " << e.param("sigma") << " / neighbor_dist;\n";
            nb << "    let sr6 = sr * sr * sr * sr * sr * sr;\n";
            nb << "    let magnitude = 24.0 * " << e.param("epsilon")
               << " * (2.0 * sr6 * sr6 - sr6) / neighbor_dist;\n";
            nb << "    " << force << " += neighbor_dir * clamp(magnitude, -1000.0, 1000.0);\n";
            nb << "}\n";
            post << "p.velocity += " << force << " * dt;\n";
            code.radius = e.param("cutoff");
        } else if constexpr (std::is_same_v<T, rules::Pressure>) {
            std::string R = e.param("radius");
            std::string density = e.var("density");
            std::string push = e.var("pressure_dir");
            setup << "var " << density << " = 0.0;\n";
            setup << "var " << push << " = vec3<f32>(0.0);\n";
            nb << "if (neighbor_dist < " << R << ") {\n";
            nb << "    let w = 1.0 - neighbor_dist / " << R << ";\n";
            nb << "    " << density << " += w * w;\n";
            nb << "    " << push << " += neighbor_dir * w;\n";
            nb << "}\n";
            post << "let excess = max(" << density << " - " << e.param("target_density") << ", 0.0);\n";
            post << "p.velocity += " << push << " * excess * " << e.param("strength") << " * dt;\n";
            code.radius = R;
        } else if constexpr (std::is_same_v<T, rules::Viscosity>) {
            std::string R = e.param("radius");
            std::string vsum = e.var("visc_sum");
            std::string wsum = e.var("visc_weight");
            setup << "var " << vsum << " = vec3<f32>(0.0);\n";
            setup << "var " << wsum << " = 0.0;\n";
            nb << "if (neighbor_dist < " << R << ") {\n";
            nb << "    let w = 1.0 - neighbor_dist / " << R << ";\n";
            nb << "    " << vsum << " += other.velocity * w;\n";
            nb << "    " << wsum << " += w;\n";
            nb << "}\n";
            post << "if (" << wsum << " > 0.0) {\n";
            post << "    p.velocity = mix(p.velocity, " << vsum << " / " << wsum << ", clamp("
                 << e.param("strength") << " * dt, 0.0, 1.0));\n";
            post << "}\n";
            code.radius = R;
        } else if constexpr (std::is_same_v<T, rules::Chase> || std::is_same_v<T, rules::Evade>) {
            constexpr bool chase = std::is_same_v<T, rules::Chase>;
            uint32_t otherType;
            if constexpr (chase) {
                otherType = r.targetType;
            } else {
                otherType = r.threatType;
            }
            std::string best = e.var("nearest");
            std::string dir = e.var("steer");
            setup << "var " << best << " = 1e30;\n";
            setup << "var " << dir << " = vec3<f32>(0.0);\n";
            nb << "if (p.particle_type == " << r.selfType << "u && other.particle_type == " << otherType
               << "u && neighbor_dist < " << e.param("radius") << " && neighbor_dist < " << best << ") {\n";
            nb << "    " << best << " = neighbor_dist;\n";
            nb << "    " << dir << " = " << (chase ? "-neighbor_dir" : "neighbor_dir") << ";\n";
            nb << "}\n";
            post << "if (" << best << " < 1e29) {\n";
            post << "    p.velocity += " << dir << " * " << e.param("strength") << " * dt;\n";
            post << "}\n";
            code.radius = e.param("radius");
        } else if constexpr (std::is_same_v<T, rules::Convert>) {
            std::string hit = e.var("convert");
            setup << "var " << hit << " = false;\n";
            nb << "if (!" << hit << " && p.particle_type == " << r.fromType << "u && other.particle_type == "
               << r.triggerType << "u && neighbor_dist < " << e.param("radius") << ") {\n";
            nb << "    let roll = rand(hash2(hash2(index, other_idx), uniforms.frame + index * 7919u));\n";
            nb << "    if (roll < " << e.param("probability") << ") {\n";
            nb << "        " << hit << " = true;\n";
            nb << "    }\n";
            nb << "}\n";
            post << "if (" << hit << ") {\n";
            post << "    p.particle_type = " << r.toType << "u;\n";
            post << "}\n";
            code.radius = e.param("radius");
        } else if constexpr (std::is_same_v<T, rules::Diffuse>) {
            FieldType type = FieldType::F32;
            if (ctx.layout) {
                type = ctx.layout->typeOf(r.field).value_or(FieldType::F32);
            }
            std::string sum = e.var("diffuse_sum");
            std::string n = e.var("diffuse_count");
            setup << "var " << sum << " = " << fieldZero(type) << ";\n";
            setup << "var " << n << " = 0.0;\n";
            nb << "if (neighbor_dist < " << e.param("radius") << ") {\n";
            nb << "    " << sum << " += other." << r.field << ";\n";
            nb << "    " << n << " += 1.0;\n";
            nb << "}\n";
            post << "if (" << n << " > 0.0) {\n";
            post << "    p." << r.field << " = mix(p." << r.field << ", " << sum << " / " << n
                 << ", clamp(" << e.param("rate") << " * dt, 0.0, 1.0));\n";
            post << "}\n";
            code.radius = e.param("radius");
        } else if constexpr (std::is_same_v<T, rules::InteractionMatrix>) {
            uint32_t n = r.numTypes;
            std::string attraction = e.var("attraction");
            std::string radii = e.var("radii");
            std::string forceFn = e.var("life_force");
            std::string acc = e.var("life");
            std::ostringstream fn;
            fn << "var<private> " << attraction << ": array<f32, " << n * n << "> = array<f32, " << n * n << ">(";
            for (size_t k = 0; k < r.attraction.size(); ++k) {
                fn << (k ? ", " : "") << wgslFloat(r.attraction[k]);
            }
            fn << ");\n";
            fn << "var<private> " << radii << ": array<f32, " << n * n << "> = array<f32, " << n * n << ">(";
            for (size_t k = 0; k < r.radius.size(); ++k) {
                fn << (k ? ", " : "") << wgslFloat(r.radius[k]);
            }
            fn << ");\n\n";
            fn << "fn " << forceFn << "(d: f32, a: f32, beta: f32) -> f32 {\n";
            fn << "    if (d < beta) {\n";
            fn << "        return d / beta - 1.0;\n";
            fn << "    }\n";
            fn << "    if (d < 1.0) {\n";
            fn << "        return a * (1.0 - abs(2.0 * d - 1.0 - beta) / (1.0 - beta));\n";
            fn << "    }\n";
            fn << "    return 0.0;\n";
            fn << "}\n";
            code.functions = fn.str();

            setup << "var " << acc << " = vec3<f32>(0.0);\n";
            nb << "if (p.particle_type < " << n << "u && other.particle_type < " << n << "u) {\n";
            nb << "    let k = p.particle_type * " << n << "u + other.particle_type;\n";
            nb << "    let rmax = " << radii << "[k];\n";
            nb << "    if (rmax > 0.0 && neighbor_dist < rmax) {\n";
            nb << "        let f = " << forceFn << "(neighbor_dist / rmax, " << attraction << "[k], "
               << e.param("beta") << ");\n";
            nb << "        " << acc << " -= neighbor_dir * f;\n";
            nb << "    }\n";
            nb << "}\n";
            post << "p.velocity += " << acc << " * " << e.param("strength") << " * dt;\n";
            code.radius = wgslFloat(neighborRadius(rule));
        } else if constexpr (std::is_same_v<T, rules::NeighborCustom>) {
            nb << "{\n" << r.code << "\n}\n";
            std::string R = e.param("radius");
            code.radius = "select(" + R + ", " + wgslFloat(ctx.cellSize) + ", " + R + " <= 0.0)";

        // ---------------------------------------------------------------------
        // Particle state
        // ---------------------------------------------------------------------
        } else if constexpr (std::is_same_v<T, rules::Refractory>) {
            body << "if (p." << r.trigger << " > " << e.param("threshold") << ") {\n";
            body << "    p." << r.charge << " = max(p." << r.charge << " - " << e.param("depletion_rate")
                 << " * dt, 0.0);\n";
            body << "} else {\n";
            body << "    p." << r.charge << " = min(p." << r.charge << " + " << e.param("regen_rate")
                 << " * dt, 1.0);\n";
            body << "}\n";
        } else if constexpr (std::is_same_v<T, rules::Sync>) {
            uint32_t fid = 0;
            if (ctx.fields) fid = ctx.fields->idOf(r.field).value_or(0);
            std::string phase = "p." + r.phaseField;
            body << "let sensed = field_read_vec(" << fid << "u, p.position);\n";
            if (r.frequencyField) {
                body << "var dphase = p." << *r.frequencyField << ";\n";
            } else {
                body << "var dphase = " << e.param("frequency") << ";\n";
            }
            body << "if (length(sensed.xy) > " << e.param("detection_threshold") << ") {\n";
            body << "    let psi = atan2(sensed.y, sensed.x);\n";
            body << "    dphase += " << e.param("coupling") << " * sin(psi - TAU * " << phase << ");\n";
            body << "}\n";
            body << phase << " += dphase * dt;\n";
            body << "if (" << phase << " >= 1.0) {\n";
            body << "    " << phase << " = fract(" << phase << ");\n";
            if (!r.onFire.empty()) {
                body << "    {\n" << r.onFire << "\n    }\n";
            }
            body << "} else if (" << phase << " < 0.0) {\n";
            body << "    " << phase << " = fract(" << phase << ");\n";
            body << "}\n";
            body << "let theta = TAU * " << phase << ";\n";
            body << "field_write_vec(" << fid << "u, p.position, vec3<f32>(cos(theta), sin(theta), 0.0) * "
                 << e.param("emit_amount") << ");\n";
        } else if constexpr (std::is_same_v<T, rules::BondSprings>) {
            body << "var bond_force = vec3<f32>(0.0);\n";
            for (const std::string& bond : r.bonds) {
                body << "if (p." << bond << " != NO_PARTICLE && p." << bond
                     << " < arrayLength(&particles_read)) {\n";
                body << "    let partner = particles_read[p." << bond << "];\n";
                body << "    let delta = partner.position - p.position;\n";
                body << "    let dist = length(delta);\n";
                body << "    if (dist > 1e-6) {\n";
                body << "        let dir = delta / dist;\n";
                if (r.maxStretch) {
                    body << "        if (dist > " << e.param("rest_length") << " * "
                         << e.param("max_stretch") << ") {\n";
                    body << "            p." << bond << " = NO_PARTICLE;\n";
                    body << "        } else {\n";
                }
                body << "        let stretch = dist - " << e.param("rest_length") << ";\n";
                body << "        let closing = dot(partner.velocity - p.velocity, dir);\n";
                body << "        bond_force += dir * (" << e.param("stiffness") << " * stretch + "
                     << e.param("damping") << " * closing);\n";
                if (r.maxStretch) {
                    body << "        }\n";
                }
                body << "    }\n";
                body << "}\n";
            }
            body << "p.velocity += bond_force * dt;\n";
        } else if constexpr (std::is_same_v<T, rules::Agent>) {
            const std::string& state = r.stateField;
            body << "if (p." << r.prevStateField << " != p." << state << ") {\n";
            body << stateChain(state, r.states, &rules::AgentState::onEnter);
            body << "    p." << r.prevStateField << " = p." << state << ";\n";
            body << "}\n";
            if (r.timerField) {
                body << "p." << *r.timerField << " += dt;\n";
            }
            body << "var agent_next = p." << state << ";\n";
            body << "var agent_fired = false;\n";
            bool first = true;
            for (const rules::AgentState& s : r.states) {
                body << (first ? "if" : "else if") << " (p." << state << " == " << s.id << "u) {\n";
                first = false;
                if (!s.onUpdate.empty()) {
                    body << "    {\n" << s.onUpdate << "\n    }\n";
                }
                std::vector<rules::AgentTransition> ordered = s.transitions;
                std::stable_sort(ordered.begin(), ordered.end(),
                                 [](const rules::AgentTransition& a, const rules::AgentTransition& b) {
                                     return a.priority > b.priority;
                                 });
                for (const rules::AgentTransition& t : ordered) {
                    body << "    if (!agent_fired && (" << t.condition << ")) {\n";
                    body << "        agent_next = " << t.to << "u;\n";
                    body << "        agent_fired = true;\n";
                    body << "    }\n";
                }
                body << "}\n";
            }
            body << "if (agent_fired) {\n";
            body << stateChain(state, r.states, &rules::AgentState::onExit);
            body << "    p." << state << " = agent_next;\n";
            body << stateChain(state, r.states, &rules::AgentState::onEnter);
            body << "    p." << r.prevStateField << " = p." << state << ";\n";
            if (r.timerField) {
                body << "    p." << *r.timerField << " = 0.0;\n";
            }
            body << "}\n";

        // ---------------------------------------------------------------------
        // Lifecycle
        // ---------------------------------------------------------------------
        } else if constexpr (std::is_same_v<T, rules::Age>) {
            body << "if (!flux_aged) {\n";
            body << "    p.age += dt;\n";
            body << "    flux_aged = true;\n";
            body << "}\n";
        } else if constexpr (std::is_same_v<T, rules::Lifetime>) {
            body << "if (p.age >= " << e.param("duration") << ") {\n";
            body << "    kill_particle(&p);\n";
            body << "}\n";
        } else if constexpr (std::is_same_v<T, rules::FadeOut>) {
            std::string c = "p." + e.colorField();
            if (ctx.colorAssigned) {
                body << "let age_now = select(p.age + dt, p.age, flux_aged);\n";
                body << c << " *= clamp(1.0 - age_now / " << e.param("duration") << ", 0.0, 1.0);\n";
                return;
            }
            // Scale by the ratio of this frame's fade factor to the last one
            body << "let age_before = select(p.age, p.age - dt, flux_aged);\n";
            body << "let fade_prev = max(1.0 - age_before / " << e.param("duration") << ", 0.0);\n";
            body << "let fade_next = max(1.0 - (age_before + dt) / " << e.param("duration") << ", 0.0);\n";
            body << "if (fade_prev > 1e-6) {\n";
            body << "    " << c << " *= fade_next / fade_prev;\n";
            body << "} else {\n";
            body << "    " << c << " = vec3<f32>(0.0);\n";
            body << "}\n";
        } else if constexpr (std::is_same_v<T, rules::ShrinkOut>) {
            body << "let age_now = select(p.age + dt, p.age, flux_aged);\n";
            body << "p.scale = clamp(1.0 - age_now / " << e.param("duration") << ", 0.0, 1.0);\n";
        } else if constexpr (std::is_same_v<T, rules::ColorOverLife>) {
            body << "let age_now = select(p.age + dt, p.age, flux_aged);\n";
            body << "let life_t = clamp(age_now / " << e.param("duration") << ", 0.0, 1.0);\n";
            body << "p." << e.colorField() << " = mix(" << e.param("start") << ", " << e.param("end")
                 << ", life_t);\n";
        } else if constexpr (std::is_same_v<T, rules::RespawnBelow>) {
            body << "if (p.position.y < " << e.param("threshold_y") << ") {\n";
            body << "    respawn_at(&p, vec3<f32>(p.position.x, " << e.param("spawn_y") << ", p.position.z), "
                 << (r.resetVelocity ? "vec3<f32>(0.0)" : "p.velocity") << ");\n";
            body << "}\n";

        // ---------------------------------------------------------------------
        // Escape hatches & wrappers
        // ---------------------------------------------------------------------
        } else if constexpr (std::is_same_v<T, rules::Custom>) {
            body << r.code << "\n";
        } else if constexpr (std::is_same_v<T, rules::Typed>) {
            if (!r.inner) return;
            RuleCode inner = lowerRule(*r.inner, ctx);
            std::string selfCond = "p.particle_type == " + std::to_string(r.selfType) + "u";
            code.functions = inner.functions;
            code.radius = inner.radius;
            setup << inner.setup;
            if (!inner.neighbor.empty()) {
                std::string cond = selfCond;
                if (r.otherType) {
                    cond += " && other.particle_type == " + std::to_string(*r.otherType) + "u";
                }
                nb << "if (" << cond << ") {\n" << inner.neighbor << "}\n";
            }
            if (!inner.post.empty()) {
                post << "if (" << selfCond << ") {\n" << inner.post << "}\n";
            }
            if (!inner.body.empty()) {
                body << "if (" << selfCond << ") {\n" << inner.body << "}\n";
            }
        }
    }, rule.variant());

    if (requiresNeighbors(rule)) {
        code.setup = setup.str();
        code.neighbor = nb.str();
        code.post = post.str();
    } else {
        std::string b = body.str();
        if (!b.empty()) code.body = "{\n" + b + "}\n";
    }
    return code;
}

std::string toWgsl(const Rule& rule, const RuleContext& ctx) {
    RuleCode code = lowerRule(rule, ctx);
    if (!requiresNeighbors(rule)) {
        return code.body;
    }
    std::ostringstream ss;
    ss << "{\n";
    ss << code.setup;
    ss << neighborLoopWgsl(code.radius, "{\n" + code.neighbor + "}\n", 0);
    ss << "{\n" << code.post << "}\n";
    ss << "}\n";
    return ss.str();
}

std::string toWgsl(const Rule& rule, float bounds, uint32_t index) {
    RuleContext ctx;
    ctx.bounds = bounds;
    ctx.index = index;
    return toWgsl(rule, ctx);
}

} // namespace flux
