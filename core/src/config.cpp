// Flux - Config Implementation

#include <flux/config.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>

namespace fs = std::filesystem;

namespace flux {

using json = nlohmann::json;

namespace {

template<int N>
json vecToJson(const glm::vec<N, float>& v) {
    json out = json::array();
    for (int i = 0; i < N; ++i) {
        out.push_back(v[i]);
    }
    return out;
}

template<int N>
bool vecFromJson(const json& j, glm::vec<N, float>& out) {
    if (!j.is_array() || j.size() != static_cast<size_t>(N)) {
        return false;
    }
    glm::vec<N, float> v;
    for (int i = 0; i < N; ++i) {
        if (!j[i].is_number()) return false;
        v[i] = j[i].get<float>();
    }
    out = v;
    return true;
}

std::optional<Value> valueFromJson(FieldType type, const json& j) {
    switch (type) {
        case FieldType::F32:
            if (j.is_number()) return Value(j.get<float>());
            break;
        case FieldType::I32:
            if (j.is_number_integer()) return Value(j.get<int32_t>());
            break;
        case FieldType::U32:
            if (j.is_number_unsigned()) return Value(j.get<uint32_t>());
            break;
        case FieldType::Vec2: {
            glm::vec2 v;
            if (vecFromJson(j, v)) return Value(v);
            break;
        }
        case FieldType::Vec3: {
            glm::vec3 v;
            if (vecFromJson(j, v)) return Value(v);
            break;
        }
        case FieldType::Vec4: {
            glm::vec4 v;
            if (vecFromJson(j, v)) return Value(v);
            break;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Field lists
// =============================================================================
// One overload per persisted struct. The archive is either JsonWriter or
// JsonReader, so each struct's keys are spelled exactly once.

// Rules
template<typename A> void fields(A& a, rules::Gravity& r) { a("strength", r.strength); }
template<typename A> void fields(A& a, rules::Acceleration& r) { a("acceleration", r.acceleration); }
template<typename A> void fields(A& a, rules::Drag& r) { a("coefficient", r.coefficient); }

template<typename A> void fields(A& a, rules::PointGravity& r) {
    a("point", r.point);
    a("strength", r.strength);
    a("softening", r.softening);
}

template<typename A> void fields(A& a, rules::Vortex& r) {
    a("center", r.center);
    a("axis", r.axis);
    a("strength", r.strength);
}

template<typename A> void fields(A& a, rules::Spring& r) {
    a("anchor", r.anchor);
    a("stiffness", r.stiffness);
    a("damping", r.damping);
}

template<typename A> void fields(A& a, rules::Orbit& r) {
    a("center", r.center);
    a("strength", r.strength);
}

template<typename A> void fields(A& a, rules::Curl& r) {
    a("scale", r.scale);
    a("strength", r.strength);
}

template<typename A> void fields(A& a, rules::Turbulence& r) {
    a("scale", r.scale);
    a("strength", r.strength);
}

template<typename A> void fields(A& a, rules::Wander& r) {
    a("strength", r.strength);
    a("frequency", r.frequency);
}

template<typename A> void fields(A&, rules::BounceWalls&) {}
template<typename A> void fields(A&, rules::WrapWalls&) {}

template<typename A> void fields(A& a, rules::SpeedLimit& r) {
    a("min", r.min);
    a("max", r.max);
}

template<typename A> void fields(A& a, rules::Separate& r) {
    a("radius", r.radius);
    a("strength", r.strength);
}

template<typename A> void fields(A& a, rules::Cohere& r) {
    a("radius", r.radius);
    a("strength", r.strength);
}

template<typename A> void fields(A& a, rules::Align& r) {
    a("radius", r.radius);
    a("strength", r.strength);
}

template<typename A> void fields(A& a, rules::Collide& r) {
    a("radius", r.radius);
    a("restitution", r.restitution);
}

template<typename A> void fields(A& a, rules::NBodyGravity& r) {
    a("strength", r.strength);
    a("softening", r.softening);
    a("radius", r.radius);
}

template<typename A> void fields(A& a, rules::LennardJones& r) {
    a("epsilon", r.epsilon);
    a("sigma", r.sigma);
    a("cutoff", r.cutoff);
}

template<typename A> void fields(A& a, rules::Pressure& r) {
    a("radius", r.radius);
    a("strength", r.strength);
    a("target_density", r.targetDensity);
}

template<typename A> void fields(A& a, rules::Viscosity& r) {
    a("radius", r.radius);
    a("strength", r.strength);
}

template<typename A> void fields(A& a, rules::Chase& r) {
    a("self_type", r.selfType);
    a("target_type", r.targetType);
    a("radius", r.radius);
    a("strength", r.strength);
}

template<typename A> void fields(A& a, rules::Evade& r) {
    a("self_type", r.selfType);
    a("threat_type", r.threatType);
    a("radius", r.radius);
    a("strength", r.strength);
}

template<typename A> void fields(A& a, rules::Convert& r) {
    a("from_type", r.fromType);
    a("trigger_type", r.triggerType);
    a("to_type", r.toType);
    a("radius", r.radius);
    a("probability", r.probability);
}

template<typename A> void fields(A& a, rules::Diffuse& r) {
    a("field", r.field);
    a("radius", r.radius);
    a("rate", r.rate);
}

template<typename A> void fields(A& a, rules::InteractionMatrix& r) {
    a("num_types", r.numTypes);
    a("attraction", r.attraction);
    a("radius", r.radius);
    a("strength", r.strength);
    a("beta", r.beta);
}

template<typename A> void fields(A& a, rules::NeighborCustom& r) {
    a("code", r.code);
    a("radius", r.radius);
}

template<typename A> void fields(A& a, rules::Refractory& r) {
    a("trigger", r.trigger);
    a("charge", r.charge);
    a("threshold", r.threshold);
    a("depletion_rate", r.depletionRate);
    a("regen_rate", r.regenRate);
}

template<typename A> void fields(A& a, rules::Sync& r) {
    a("phase_field", r.phaseField);
    a("frequency", r.frequency);
    a("field", r.field);
    a("emit_amount", r.emitAmount);
    a("coupling", r.coupling);
    a("detection_threshold", r.detectionThreshold);
    a("on_fire", r.onFire);
    a("frequency_field", r.frequencyField);
}

template<typename A> void fields(A& a, rules::BondSprings& r) {
    a("bonds", r.bonds);
    a("stiffness", r.stiffness);
    a("damping", r.damping);
    a("rest_length", r.restLength);
    a("max_stretch", r.maxStretch);
}

template<typename A> void fields(A& a, rules::AgentTransition& t) {
    a("to", t.to);
    a("condition", t.condition);
    a("priority", t.priority);
}

template<typename A> void fields(A& a, rules::AgentState& s) {
    a("id", s.id);
    a("name", s.name);
    a("on_enter", s.onEnter);
    a("on_update", s.onUpdate);
    a("on_exit", s.onExit);
    a("transitions", s.transitions);
}

template<typename A> void fields(A& a, rules::Agent& r) {
    a("state_field", r.stateField);
    a("prev_state_field", r.prevStateField);
    a("timer_field", r.timerField);
    a("states", r.states);
}

template<typename A> void fields(A&, rules::Age&) {}
template<typename A> void fields(A& a, rules::Lifetime& r) { a("duration", r.duration); }
template<typename A> void fields(A& a, rules::FadeOut& r) { a("duration", r.duration); }
template<typename A> void fields(A& a, rules::ShrinkOut& r) { a("duration", r.duration); }

template<typename A> void fields(A& a, rules::ColorOverLife& r) {
    a("start", r.start);
    a("end", r.end);
    a("duration", r.duration);
}

template<typename A> void fields(A& a, rules::RespawnBelow& r) {
    a("threshold_y", r.thresholdY);
    a("spawn_y", r.spawnY);
    a("reset_velocity", r.resetVelocity);
}

template<typename A> void fields(A& a, rules::Custom& r) { a("code", r.code); }

template<typename A> void fields(A& a, rules::Typed& r) {
    a("self_type", r.selfType);
    a("other_type", r.otherType);
    a("rule", r.inner);
}

// Emitters
template<typename A> void fields(A& a, emitters::Point& e) {
    a("position", e.position);
    a("rate", e.rate);
    a("speed", e.speed);
}

template<typename A> void fields(A& a, emitters::Burst& e) {
    a("position", e.position);
    a("count", e.count);
    a("speed", e.speed);
}

template<typename A> void fields(A& a, emitters::Cone& e) {
    a("position", e.position);
    a("direction", e.direction);
    a("speed", e.speed);
    a("spread", e.spread);
    a("rate", e.rate);
}

template<typename A> void fields(A& a, emitters::Sphere& e) {
    a("center", e.center);
    a("radius", e.radius);
    a("speed", e.speed);
    a("rate", e.rate);
}

template<typename A> void fields(A& a, emitters::Box& e) {
    a("min", e.min);
    a("max", e.max);
    a("velocity", e.velocity);
    a("rate", e.rate);
}

template<typename A> void fields(A& a, SubEmitter& s) {
    a("parent_type", s.parentType);
    a("child_type", s.childType);
    a("count", s.count);
    a("speed_min", s.speedMin);
    a("speed_max", s.speedMax);
    a("spread", s.spread);
    a("inherit_velocity", s.inheritVelocity);
    a("child_lifetime", s.childLifetime);
    a("child_color", s.childColor);
    a("spawn_radius", s.spawnRadius);
}

// Spawn
template<typename A> void fields(A& a, spawn::Cube& s) { a("size", s.size); }
template<typename A> void fields(A& a, spawn::Sphere& s) { a("radius", s.radius); }

template<typename A> void fields(A& a, spawn::Shell& s) {
    a("inner", s.inner);
    a("outer", s.outer);
}

template<typename A> void fields(A& a, spawn::Ring& s) {
    a("radius", s.radius);
    a("thickness", s.thickness);
}

template<typename A> void fields(A&, spawn::Point&) {}
template<typename A> void fields(A& a, spawn::Line& s) { a("length", s.length); }

template<typename A> void fields(A& a, spawn::Plane& s) {
    a("width", s.width);
    a("depth", s.depth);
}

template<typename A> void fields(A&, spawn::Zero&) {}
template<typename A> void fields(A& a, spawn::RandomDirection& v) { a("speed", v.speed); }
template<typename A> void fields(A& a, spawn::Outward& v) { a("speed", v.speed); }
template<typename A> void fields(A& a, spawn::Inward& v) { a("speed", v.speed); }
template<typename A> void fields(A& a, spawn::Swirl& v) { a("speed", v.speed); }

template<typename A> void fields(A& a, spawn::Directional& v) {
    a("direction", v.direction);
    a("speed", v.speed);
}

template<typename A> void fields(A& a, spawn::UniformColor& c) { a("color", c.color); }

template<typename A> void fields(A& a, spawn::RandomHue& c) {
    a("saturation", c.saturation);
    a("value", c.value);
}

template<typename A> void fields(A&, spawn::ByPosition&) {}
template<typename A> void fields(A&, spawn::ByVelocity&) {}

template<typename A> void fields(A& a, spawn::Gradient& c) {
    a("start", c.start);
    a("end", c.end);
}

// =============================================================================
// Archives
// =============================================================================

class JsonWriter {
public:
    explicit JsonWriter(json& out) : m_out(out) {}

    template<typename T>
    void operator()(const char* key, const T& value) { m_out[key] = value; }

    void operator()(const char* key, const glm::vec3& value) { m_out[key] = vecToJson(value); }

    template<typename T>
    void operator()(const char* key, const std::optional<T>& value) {
        if (value) (*this)(key, *value);
    }

    void operator()(const char* key, const std::shared_ptr<const Rule>& rule) {
        if (rule) m_out[key] = ruleToJson(*rule);
    }

    template<typename T>
    void operator()(const char* key, const std::vector<T>& items);

private:
    json& m_out;
};

template<typename T>
void JsonWriter::operator()(const char* key, const std::vector<T>& items) {
    if constexpr (std::is_same_v<T, rules::AgentState> || std::is_same_v<T, rules::AgentTransition>) {
        json array = json::array();
        for (T item : items) {
            json entry = json::object();
            JsonWriter writer(entry);
            fields(writer, item);
            array.push_back(std::move(entry));
        }
        m_out[key] = std::move(array);
    } else {
        m_out[key] = items;
    }
}

class JsonReader {
public:
    JsonReader(const json& in, std::string context, std::vector<std::string>* warnings)
        : m_in(in), m_context(std::move(context)), m_warnings(warnings) {}

    template<typename T>
    bool operator()(const char* key, T& out) {
        const json* value = find(key);
        if (!value) return false;
        try {
            out = value->get<T>();
            return true;
        } catch (const json::exception&) {
            wrongType(key);
            return false;
        }
    }

    bool operator()(const char* key, glm::vec3& out) {
        const json* value = find(key);
        if (!value) return false;
        if (!vecFromJson(*value, out)) {
            wrongType(key);
            return false;
        }
        return true;
    }

    template<typename T>
    bool operator()(const char* key, std::optional<T>& out) {
        if (!find(key)) return false;
        T value = out.value_or(T{});
        if (!(*this)(key, value)) return false;
        out = value;
        return true;
    }

    bool operator()(const char* key, std::shared_ptr<const Rule>& out) {
        const json* value = find(key);
        if (!value) return false;
        auto rule = ruleFromJson(*value, m_warnings);
        if (!rule) return false;
        out = std::make_shared<const Rule>(std::move(*rule));
        return true;
    }

    bool operator()(const char* key, std::vector<float>& out) { return plainArray(key, out); }
    bool operator()(const char* key, std::vector<std::string>& out) { return plainArray(key, out); }

    template<typename T>
    bool operator()(const char* key, std::vector<T>& out) {
        const json* value = find(key);
        if (!value) return false;
        if (!value->is_array()) {
            wrongType(key);
            return false;
        }
        out.clear();
        for (const json& entry : *value) {
            T item;
            JsonReader reader(entry, m_context + "." + key, m_warnings);
            fields(reader, item);
            out.push_back(std::move(item));
        }
        return true;
    }

    /// Member object, or nullptr (with a warning if present but not an object)
    const json* object(const char* key) {
        const json* value = find(key);
        if (value && !value->is_object()) {
            wrongType(key);
            return nullptr;
        }
        return value;
    }

    /// Member array, or nullptr (with a warning if present but not an array)
    const json* array(const char* key) {
        const json* value = find(key);
        if (value && !value->is_array()) {
            wrongType(key);
            return nullptr;
        }
        return value;
    }

    void warn(const std::string& message) {
        if (m_warnings) m_warnings->push_back(m_context + ": " + message);
    }

private:
    const json* find(const char* key) const {
        if (!m_in.is_object()) return nullptr;
        auto it = m_in.find(key);
        if (it == m_in.end() || it->is_null()) return nullptr;
        return &*it;
    }

    template<typename T>
    bool plainArray(const char* key, std::vector<T>& out) {
        const json* value = find(key);
        if (!value) return false;
        try {
            out = value->get<std::vector<T>>();
            return true;
        } catch (const json::exception&) {
            wrongType(key);
            return false;
        }
    }

    void wrongType(const char* key) {
        warn(std::string("'") + key + "' has the wrong type, keeping the default");
    }

    const json& m_in;
    std::string m_context;
    std::vector<std::string>* m_warnings;
};

// =============================================================================
// Variants
// =============================================================================

template<typename Variant, typename NameOf, size_t... I>
std::optional<Variant> alternativeNamed(const std::string& name, NameOf nameOf,
                                        std::index_sequence<I...>) {
    std::optional<Variant> out;
    auto tryOne = [&](auto index) {
        if (out) return;
        Variant candidate(std::in_place_index<decltype(index)::value>);
        if (name == nameOf(candidate)) out = std::move(candidate);
    };
    (tryOne(std::integral_constant<size_t, I>{}), ...);
    return out;
}

template<typename Variant>
json variantToJson(const Variant& value, const char* typeName) {
    json out = json::object();
    out["type"] = typeName;
    std::visit([&out](const auto& alternative) {
        auto copy = alternative;
        JsonWriter writer(out);
        fields(writer, copy);
    }, value);
    return out;
}

template<typename Variant, typename NameOf>
std::optional<Variant> variantFromJson(const json& j, const std::string& context, NameOf nameOf,
                                       std::vector<std::string>* warnings) {
    JsonReader reader(j, context, warnings);
    std::string type;
    if (!j.is_object() || !reader("type", type)) {
        reader.warn("missing \"type\", entry skipped");
        return std::nullopt;
    }
    auto value = alternativeNamed<Variant>(type, nameOf,
                                           std::make_index_sequence<std::variant_size_v<Variant>>{});
    if (!value) {
        reader.warn("unknown type \"" + type + "\", entry skipped");
        return std::nullopt;
    }
    std::visit([&reader](auto& alternative) { fields(reader, alternative); }, *value);
    return value;
}

const char* fieldKindName(FieldKind kind) {
    return kind == FieldKind::Vector ? "vector" : "scalar";
}

json emitterToJson(const Emitter& emitter) {
    json out = variantToJson(emitter.shape, emitterKindName(emitter));
    if (emitter.particleType) out["particle_type"] = *emitter.particleType;
    if (emitter.color) out["color"] = vecToJson(*emitter.color);
    return out;
}

std::optional<Emitter> emitterFromJson(const json& j, std::vector<std::string>* warnings) {
    auto shape = variantFromJson<EmitterShape>(j, "emitters",
        [](const EmitterShape& s) { return std::string(emitterKindName(Emitter(s))); }, warnings);
    if (!shape) return std::nullopt;
    Emitter emitter(*shape);
    JsonReader reader(j, "emitters", warnings);
    reader("particle_type", emitter.particleType);
    reader("color", emitter.color);
    return emitter;
}

} // namespace

json valueToJson(const Value& value) {
    return std::visit([](const auto& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, glm::vec2> || std::is_same_v<T, glm::vec3> ||
                      std::is_same_v<T, glm::vec4>) {
            return vecToJson(v);
        } else {
            return v;
        }
    }, value);
}

// =============================================================================
// Rules
// =============================================================================

json ruleToJson(const Rule& rule) {
    return variantToJson(rule.variant(), ruleName(rule));
}

std::optional<Rule> ruleFromJson(const json& j, std::vector<std::string>* warnings) {
    auto value = variantFromJson<Rule::Variant>(j, "rules",
        [](const Rule::Variant& v) { return std::string(ruleName(Rule(v))); }, warnings);
    if (!value) return std::nullopt;
    return Rule(std::move(*value));
}

// =============================================================================
// SimConfig
// =============================================================================

SimulationBuilder SimConfig::toBuilder() const {
    SimulationBuilder builder;
    builder.particleCount(particleCount)
        .bounds(bounds)
        .particleSize(particleSize)
        .schema(schema)
        .spatial(spatial)
        .spawner(spawn)
        .rules(rules)
        .customShaders(customShaders)
        .startDead(startDead)
        .blend(blend)
        .shape(shape)
        .background(background);

    for (const Emitter& e : emitters) builder.emitter(e);
    for (const SubEmitter& s : subEmitters) builder.subEmitter(s);
    for (const FieldConfig& f : fields) builder.field(f);
    for (const UniformDecl& u : uniforms) builder.uniform(u.name, u.initial);

    if (lifecycle && lifecycle->preset != LifecyclePreset::None) {
        builder.lifecycle(Lifecycle::preset(lifecycle->preset, lifecycle->position, lifecycle->rate));
    }

    Camera cam;
    cam.orbit(camera.distance, camera.azimuth, camera.elevation);
    cam.fov(camera.fov);
    builder.camera(cam);
    return builder;
}

json toJson(const SimConfig& config) {
    json doc = json::object();
    doc["name"] = config.name;
    doc["particle_count"] = config.particleCount;
    doc["bounds"] = config.bounds;
    doc["particle_size"] = config.particleSize;
    doc["spatial"] = {
        {"cell_size", config.spatial.cellSize},
        {"resolution", config.spatial.resolution},
        {"max_neighbors", config.spatial.maxNeighbors}
    };

    json schemaFields = json::array();
    for (const FieldDecl& f : config.schema.fields()) {
        schemaFields.push_back({{"name", f.name}, {"type", f.typeName}});
    }
    doc["schema"] = {{"fields", schemaFields}};
    if (config.schema.hasColor()) {
        doc["schema"]["color"] = config.schema.colorField();
    }

    doc["spawn"] = {
        {"shape", variantToJson(config.spawn.shape, spawnShapeName(config.spawn.shape))},
        {"velocity", variantToJson(config.spawn.velocity, initialVelocityName(config.spawn.velocity))},
        {"color", variantToJson(config.spawn.color, colorModeName(config.spawn.color))},
        {"type_weights", config.spawn.typeWeights},
        {"seed", config.spawn.seed}
    };

    doc["rules"] = json::array();
    for (const Rule& r : config.rules) {
        doc["rules"].push_back(ruleToJson(r));
    }

    doc["emitters"] = json::array();
    for (const Emitter& e : config.emitters) {
        doc["emitters"].push_back(emitterToJson(e));
    }

    doc["sub_emitters"] = json::array();
    for (SubEmitter s : config.subEmitters) {
        json entry = json::object();
        JsonWriter writer(entry);
        fields(writer, s);
        doc["sub_emitters"].push_back(std::move(entry));
    }

    doc["fields"] = json::array();
    for (const FieldConfig& f : config.fields) {
        doc["fields"].push_back({
            {"name", f.name},
            {"kind", fieldKindName(f.kind)},
            {"resolution", f.resolution},
            {"extent", f.extent},
            {"decay", f.decay},
            {"blur", f.blur},
            {"blur_iterations", f.blurIterations}
        });
    }

    doc["uniforms"] = json::array();
    for (const UniformDecl& u : config.uniforms) {
        doc["uniforms"].push_back({
            {"name", u.name},
            {"type", fieldTypeName(u.type())},
            {"value", valueToJson(u.initial)}
        });
    }

    doc["custom_shaders"] = {
        {"compute_prelude", config.customShaders.computePrelude},
        {"vertex", config.customShaders.vertex},
        {"fragment", config.customShaders.fragment}
    };

    if (config.lifecycle) {
        doc["lifecycle"] = {
            {"preset", lifecyclePresetName(config.lifecycle->preset)},
            {"position", vecToJson(config.lifecycle->position)},
            {"rate", config.lifecycle->rate}
        };
    }
    doc["start_dead"] = config.startDead;

    doc["visuals"] = {
        {"blend", blendModeName(config.blend)},
        {"shape", particleShapeName(config.shape)},
        {"background", vecToJson(config.background)}
    };

    doc["camera"] = {
        {"distance", config.camera.distance},
        {"azimuth", config.camera.azimuth},
        {"elevation", config.camera.elevation},
        {"fov", config.camera.fov}
    };
    return doc;
}

SimConfig fromJson(const json& doc, std::vector<std::string>* warnings) {
    SimConfig config;
    JsonReader reader(doc, "config", warnings);
    if (!doc.is_object()) {
        reader.warn("document is not an object, using defaults");
        return config;
    }

    reader("name", config.name);
    reader("particle_count", config.particleCount);
    reader("bounds", config.bounds);
    reader("particle_size", config.particleSize);
    reader("start_dead", config.startDead);

    if (const json* spatial = reader.object("spatial")) {
        JsonReader r(*spatial, "spatial", warnings);
        r("cell_size", config.spatial.cellSize);
        r("resolution", config.spatial.resolution);
        r("max_neighbors", config.spatial.maxNeighbors);
    }

    // -------------------------------------------------------------------------
    // Schema
    if (const json* schema = reader.object("schema")) {
        JsonReader r(*schema, "schema", warnings);
        if (const json* list = r.array("fields")) {
            ParticleSchema parsed;
            for (const json& entry : *list) {
                JsonReader fr(entry, "schema.fields", warnings);
                std::string name;
                std::string type;
                if (!fr("name", name) || !fr("type", type)) {
                    fr.warn("field needs \"name\" and \"type\", entry skipped");
                    continue;
                }
                parsed.field(name, type);
            }
            config.schema = parsed;
        }
        std::string color;
        if (r("color", color)) {
            config.schema.color(color);
        }
    }

    // -------------------------------------------------------------------------
    // Spawn
    if (const json* spawnDoc = reader.object("spawn")) {
        JsonReader r(*spawnDoc, "spawn", warnings);
        if (const json* shape = r.object("shape")) {
            auto v = variantFromJson<SpawnShape>(*shape, "spawn.shape",
                [](const SpawnShape& s) { return std::string(spawnShapeName(s)); }, warnings);
            if (v) config.spawn.shape = *v;
        }
        if (const json* velocity = r.object("velocity")) {
            auto v = variantFromJson<InitialVelocity>(*velocity, "spawn.velocity",
                [](const InitialVelocity& s) { return std::string(initialVelocityName(s)); }, warnings);
            if (v) config.spawn.velocity = *v;
        }
        if (const json* color = r.object("color")) {
            auto v = variantFromJson<ColorMode>(*color, "spawn.color",
                [](const ColorMode& s) { return std::string(colorModeName(s)); }, warnings);
            if (v) config.spawn.color = *v;
        }
        r("type_weights", config.spawn.typeWeights);
        r("seed", config.spawn.seed);
    }

    // -------------------------------------------------------------------------
    // Rules, emitters, sub-emitters
    if (const json* list = reader.array("rules")) {
        config.rules.clear();
        for (const json& entry : *list) {
            if (auto rule = ruleFromJson(entry, warnings)) {
                config.rules.push_back(std::move(*rule));
            }
        }
    }

    if (const json* list = reader.array("emitters")) {
        for (const json& entry : *list) {
            if (auto emitter = emitterFromJson(entry, warnings)) {
                config.emitters.push_back(std::move(*emitter));
            }
        }
    }

    reader("sub_emitters", config.subEmitters);

    // -------------------------------------------------------------------------
    // Fields and uniforms
    if (const json* list = reader.array("fields")) {
        for (const json& entry : *list) {
            JsonReader r(entry, "fields", warnings);
            FieldConfig field;
            if (!r("name", field.name)) {
                r.warn("field needs a \"name\", entry skipped");
                continue;
            }
            std::string kind;
            if (r("kind", kind)) {
                if (kind == "vector") field.kind = FieldKind::Vector;
                else if (kind != "scalar") r.warn("unknown field kind \"" + kind + "\", using scalar");
            }
            r("resolution", field.resolution);
            r("extent", field.extent);
            r("decay", field.decay);
            r("blur", field.blur);
            r("blur_iterations", field.blurIterations);
            config.fields.push_back(field);
        }
    }

    if (const json* list = reader.array("uniforms")) {
        for (const json& entry : *list) {
            JsonReader r(entry, "uniforms", warnings);
            std::string name;
            std::string typeName;
            if (!r("name", name) || !r("type", typeName)) {
                r.warn("uniform needs \"name\" and \"type\", entry skipped");
                continue;
            }
            auto type = parseFieldType(typeName);
            if (!type) {
                r.warn("unknown uniform type \"" + typeName + "\", entry skipped");
                continue;
            }
            Value initial = defaultValue(*type);
            if (entry.contains("value")) {
                auto parsed = valueFromJson(*type, entry["value"]);
                if (parsed) {
                    initial = *parsed;
                } else {
                    r.warn("value of '" + name + "' does not match " + typeName + ", using zero");
                }
            }
            config.uniforms.push_back({name, initial});
        }
    }

    if (const json* shaders = reader.object("custom_shaders")) {
        JsonReader r(*shaders, "custom_shaders", warnings);
        r("compute_prelude", config.customShaders.computePrelude);
        r("vertex", config.customShaders.vertex);
        r("fragment", config.customShaders.fragment);
    }

    // -------------------------------------------------------------------------
    // Lifecycle, visuals, camera
    if (const json* lifecycle = reader.object("lifecycle")) {
        JsonReader r(*lifecycle, "lifecycle", warnings);
        LifecycleConfig lc;
        std::string preset;
        if (r("preset", preset)) {
            if (auto parsed = parseLifecyclePreset(preset)) {
                lc.preset = *parsed;
            } else {
                r.warn("unknown preset \"" + preset + "\"");
            }
        }
        r("position", lc.position);
        r("rate", lc.rate);
        config.lifecycle = lc;
    }

    if (const json* visuals = reader.object("visuals")) {
        JsonReader r(*visuals, "visuals", warnings);
        std::string name;
        if (r("blend", name)) {
            if (auto mode = parseBlendMode(name)) config.blend = *mode;
            else r.warn("unknown blend mode \"" + name + "\"");
        }
        if (r("shape", name)) {
            if (auto shape = parseParticleShape(name)) config.shape = *shape;
            else r.warn("unknown particle shape \"" + name + "\"");
        }
        r("background", config.background);
    }

    if (const json* camera = reader.object("camera")) {
        JsonReader r(*camera, "camera", warnings);
        r("distance", config.camera.distance);
        r("azimuth", config.camera.azimuth);
        r("elevation", config.camera.elevation);
        r("fov", config.camera.fov);
    }
    return config;
}

ConfigLoadResult loadConfig(const std::string& path) {
    ConfigLoadResult result;

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        std::cerr << "[Config] Cannot read " << path << "\n";
        result.status = ConfigLoadStatus::Unreadable;
        return result;
    }
    std::ifstream file(path);
    if (!file) {
        std::cerr << "[Config] Cannot open " << path << "\n";
        result.status = ConfigLoadStatus::Unreadable;
        return result;
    }

    json doc;
    try {
        file >> doc;
    } catch (const json::parse_error& e) {
        std::cerr << "[Config] Warning: " << path << " is not valid JSON (" << e.what()
                  << "), loading defaults\n";
        result.status = ConfigLoadStatus::Invalid;
        result.warnings.push_back(e.what());
        return result;
    }

    result.config = fromJson(doc, &result.warnings);
    for (const std::string& w : result.warnings) {
        std::cerr << "[Config] Warning: " << w << "\n";
    }
    std::cout << "[Config] Loaded " << path << " (" << result.config.name << ")\n";
    return result;
}

bool saveConfig(const std::string& path, const SimConfig& config) {
    std::ofstream file(path);
    if (!file) {
        std::cerr << "[Config] Cannot write " << path << "\n";
        return false;
    }
    file << toJson(config).dump(2) << "\n";
    if (!file) {
        std::cerr << "[Config] Write to " << path << " failed\n";
        return false;
    }
    return true;
}

} // namespace flux
