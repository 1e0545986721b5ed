/**
 * @file test_simulation.cpp
 * @brief Integration tests for the frame scheduler on a real device
 *
 * Covers particle and grid readback, live parameter edits, structural
 * rebuilds, emitters, sub-emitters and offscreen rendering.
 */

#include "gpu_fixture.h"
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <flux/gpu/gpu_common.h>
#include <flux/shader_lib.h>
#include <algorithm>
#include <random>

using namespace flux;
using flux::test::runFrames;
using Catch::Matchers::WithinAbs;

namespace {

constexpr float DT = 1.0f / 60.0f;

uint32_t countAlive(const ParticleBatch& batch) {
    uint32_t n = 0;
    for (uint32_t i = 0; i < batch.count(); ++i) {
        if (batch.read(i).get<uint32_t>("alive") != 0u) ++n;
    }
    return n;
}

uint32_t countAliveOfType(const ParticleBatch& batch, uint32_t type) {
    uint32_t n = 0;
    for (uint32_t i = 0; i < batch.count(); ++i) {
        ParticleRecord rec = batch.read(i);
        if (rec.get<uint32_t>("alive") != 0u && rec.get<uint32_t>("particle_type") == type) ++n;
    }
    return n;
}

SimulationBuilder fallingBuilder() {
    SpawnConfig spawn;
    spawn.shape = spawn::Cube{0.5f};
    spawn.velocity = spawn::Zero{};
    return SimulationBuilder()
        .particleCount(256)
        .bounds(2.0f)
        .spawner(spawn)
        .rule(rules::Gravity{0.0f});
}

} // namespace

// =============================================================================
// State access
// =============================================================================

TEST_CASE("Particle readback", "[gpu][simulation]") {
    FLUX_REQUIRE_GPU();

    BuildError err;
    auto sim = fallingBuilder().build(*gpu, &err);
    REQUIRE(sim);
    REQUIRE(sim->particleCount() == 256);
    REQUIRE(sim->frameCount() == 0);

    SECTION("initial state matches the spawner") {
        auto batch = sim->readParticles();
        REQUIRE(batch.has_value());
        REQUIRE(batch->count() == 256);
        REQUIRE(countAlive(*batch) == 256);
        for (uint32_t i = 0; i < batch->count(); ++i) {
            glm::vec3 p = glm::abs(batch->read(i).get<glm::vec3>("position"));
            REQUIRE(std::max(p.x, std::max(p.y, p.z)) <= 0.5f);
        }
    }

    SECTION("written particles come back unchanged") {
        ParticleBatch batch(sim->layout(), 256);
        ParticleRecord rec(sim->layout());
        for (uint32_t i = 0; i < 256; ++i) {
            rec.reset();
            rec.set("position", glm::vec3(float(i) * 0.001f, 0.25f, -0.5f));
            rec.set("velocity", glm::vec3(0.0f, 0.0f, 0.1f));
            rec.set("particle_type", i % 3);
            batch.write(i, rec);
        }
        REQUIRE(sim->writeParticles(batch));

        auto back = sim->readParticles();
        REQUIRE(back.has_value());
        REQUIRE(back->bytes() == batch.bytes());
    }

    SECTION("a batch of the wrong size is rejected") {
        ParticleBatch small(sim->layout(), 16);
        REQUIRE_FALSE(sim->writeParticles(small));
        REQUIRE(sim->hasError());
    }

    SECTION("frames advance time and integrate") {
        ParticleBatch batch(sim->layout(), 256);
        ParticleRecord rec(sim->layout());
        rec.set("velocity", glm::vec3(0.6f, 0.0f, 0.0f));
        for (uint32_t i = 0; i < 256; ++i) batch.write(i, rec);
        REQUIRE(sim->writeParticles(batch));

        REQUIRE(runFrames(*sim, 10, DT));
        REQUIRE(sim->frameCount() == 10);
        REQUIRE_THAT(sim->time(), WithinAbs(10.0 * DT, 1e-5));

        auto back = sim->readParticles();
        REQUIRE(back.has_value());
        REQUIRE_THAT(back->read(17).get<glm::vec3>("position").x, WithinAbs(0.1, 1e-4));
        REQUIRE_THAT(back->read(17).get<float>("age"), WithinAbs(10.0 * DT, 1e-4));
    }
}

TEST_CASE("Mixed schema survives a compute pass", "[gpu][simulation][layout]") {
    FLUX_REQUIRE_GPU();

    ParticleSchema schema = ParticleSchema::basic();
    schema.field("uv", FieldType::Vec2)
          .field("charge", FieldType::F32)
          .field("tint", FieldType::Vec4)
          .field("offset", FieldType::I32)
          .field("flags", FieldType::U32)
          .color();

    BuildError err;
    auto sim = SimulationBuilder()
        .particleCount(128)
        .bounds(1.0f)
        .schema(schema)
        .spawner([rng = std::mt19937(11)](ParticleRecord& rec, uint32_t i, uint32_t) mutable {
            std::uniform_real_distribution<float> real(-8.0f, 8.0f);
            std::uniform_int_distribution<int32_t> signedInt(-100000, 100000);
            std::uniform_int_distribution<uint32_t> unsignedInt;
            rec.set("position", glm::vec3(real(rng), real(rng), real(rng)) * 0.1f);
            rec.set("velocity", glm::vec3(0.0f));
            rec.set("uv", glm::vec2(real(rng), real(rng)));
            rec.set("charge", real(rng));
            rec.set("tint", glm::vec4(real(rng), real(rng), real(rng), real(rng)));
            rec.set("offset", signedInt(rng));
            rec.set("flags", unsignedInt(rng));
            rec.set("color", glm::vec3(real(rng), real(rng), real(rng)));
            rec.set("particle_type", i % 5u);
        })
        .rule(rules::Custom{
            "p.uv = p.uv * 2.0;\n"
            "p.charge = p.charge + 1.0;\n"
            "p.tint = p.tint.wzyx;\n"
            "p.offset = p.offset - 2i;\n"
            "p.flags = p.flags ^ 0xFFu;"})
        .build(*gpu, &err);
    INFO(err.toString());
    REQUIRE(sim);

    auto before = sim->readParticles();
    REQUIRE(before.has_value());
    REQUIRE(sim->frame(DT));
    auto after = sim->readParticles();
    REQUIRE(after.has_value());

    for (uint32_t i = 0; i < 128; ++i) {
        INFO("particle " << i);
        ParticleRecord a = before->read(i);
        ParticleRecord b = after->read(i);
        REQUIRE(b.get<glm::vec2>("uv") == a.get<glm::vec2>("uv") * 2.0f);
        REQUIRE_THAT(b.get<float>("charge"), WithinAbs(a.get<float>("charge") + 1.0f, 1e-5));
        glm::vec4 t = a.get<glm::vec4>("tint");
        REQUIRE(b.get<glm::vec4>("tint") == glm::vec4(t.w, t.z, t.y, t.x));
        REQUIRE(b.get<int32_t>("offset") == a.get<int32_t>("offset") - 2);
        REQUIRE(b.get<uint32_t>("flags") == (a.get<uint32_t>("flags") ^ 0xFFu));
        REQUIRE(b.get<glm::vec3>("color") == a.get<glm::vec3>("color"));
        REQUIRE(b.get<uint32_t>("particle_type") == i % 5u);
        REQUIRE(b.get<glm::vec3>("position") == a.get<glm::vec3>("position"));
    }
}

TEST_CASE("Grid readback is sorted by cell", "[gpu][simulation][spatial]") {
    FLUX_REQUIRE_GPU();

    SpawnConfig spawn;
    spawn.shape = spawn::Sphere{0.9f};
    spawn.velocity = spawn::Zero{};
    SpatialConfig spatial{0.25f, 0, 0};

    BuildError err;
    auto sim = SimulationBuilder()
        .particleCount(500)
        .bounds(1.0f)
        .spatial(spatial)
        .spawner(spawn)
        .rule(rules::Separate{0.05f, 0.0f})
        .build(*gpu, &err);
    REQUIRE(sim);
    REQUIRE(sim->programs().needsNeighbors);

    REQUIRE(sim->frame(DT));
    std::vector<uint32_t> offsets;
    std::vector<uint32_t> sorted;
    REQUIRE(sim->readGrid(offsets, sorted));
    auto batch = sim->readParticles();
    REQUIRE(batch.has_value());

    GridGeometry geometry = GridGeometry::from(spatial, 1.0f);
    REQUIRE(offsets.size() == geometry.numCells() + 1);
    REQUIRE(offsets.front() == 0);
    REQUIRE(offsets.back() == 500);
    REQUIRE(std::is_sorted(offsets.begin(), offsets.end()));

    std::vector<uint32_t> seen(sorted);
    std::sort(seen.begin(), seen.end());
    for (uint32_t i = 0; i < 500; ++i) {
        REQUIRE(seen[i] == i);
    }

    for (uint32_t c = 0; c < geometry.numCells(); ++c) {
        for (uint32_t s = offsets[c]; s < offsets[c + 1]; ++s) {
            glm::vec3 p = batch->read(sorted[s]).get<glm::vec3>("position");
            REQUIRE(geometry.cellIndex(p) == c);
        }
    }
}

TEST_CASE("Grid readback without neighbor rules", "[gpu][simulation][spatial]") {
    FLUX_REQUIRE_GPU();

    auto sim = fallingBuilder().build(*gpu);
    REQUIRE(sim);
    std::vector<uint32_t> offsets;
    std::vector<uint32_t> sorted;
    REQUIRE_FALSE(sim->readGrid(offsets, sorted));
}

TEST_CASE("Host hash matches the WGSL library", "[gpu][simulation][random]") {
    FLUX_REQUIRE_GPU();

    ParticleSchema schema = ParticleSchema::basic();
    schema.field("roll", FieldType::F32).field("bits", FieldType::U32);

    auto sim = SimulationBuilder()
        .particleCount(300)
        .schema(schema)
        .rule(rules::Custom{"p.roll = rand(index + 17u);\np.bits = hash2(index, 5u);"})
        .build(*gpu);
    REQUIRE(sim);
    REQUIRE(sim->frame(DT));

    auto batch = sim->readParticles();
    REQUIRE(batch.has_value());
    for (uint32_t i = 0; i < batch->count(); ++i) {
        ParticleRecord rec = batch->read(i);
        REQUIRE(rec.get<float>("roll") == wgsl::randFloat(i + 17u));
        REQUIRE(rec.get<uint32_t>("bits") == wgsl::hash2U32(i, 5u));
    }
}

// =============================================================================
// Hot-swap
// =============================================================================

TEST_CASE("Parameter edits apply without a rebuild", "[gpu][simulation][hotswap]") {
    FLUX_REQUIRE_GPU();

    BuildError err;
    auto sim = fallingBuilder()
        .uniform("wind", 0.0f)
        .rule(rules::Custom{"p.velocity.x += uniforms.wind * dt;"})
        .build(*gpu, &err);
    REQUIRE(sim);

    SECTION("rule parameters") {
        REQUIRE(runFrames(*sim, 2, DT));
        auto still = sim->readParticles();
        REQUIRE(still.has_value());
        REQUIRE(still->read(0).get<glm::vec3>("velocity").y == 0.0f);

        REQUIRE(sim->setRuleParam(0, "strength", 6.0f));
        REQUIRE(sim->uniform("rule0_strength") == Value(6.0f));
        REQUIRE(sim->frame(DT));

        auto falling = sim->readParticles();
        REQUIRE(falling.has_value());
        REQUIRE_THAT(falling->read(0).get<glm::vec3>("velocity").y, WithinAbs(-6.0 * DT, 1e-5));
        REQUIRE(sim->rebuildCount() == 0);
    }

    SECTION("custom uniforms") {
        REQUIRE(sim->setUniform("wind", 3.0f));
        REQUIRE(sim->frame(DT));
        auto batch = sim->readParticles();
        REQUIRE(batch.has_value());
        REQUIRE_THAT(batch->read(5).get<glm::vec3>("velocity").x, WithinAbs(3.0 * DT, 1e-5));
        REQUIRE(sim->rebuildCount() == 0);
    }

    SECTION("bad edits leave the buffer untouched") {
        REQUIRE_FALSE(sim->setUniform("wind", glm::vec3(1.0f)));
        REQUIRE(sim->lastError().kind == ErrorKind::TypeMismatch);
        REQUIRE(sim->uniform("wind") == Value(0.0f));

        REQUIRE_FALSE(sim->setUniform("storm", 1.0f));
        REQUIRE(sim->lastError().kind == ErrorKind::UnknownParameter);

        REQUIRE_FALSE(sim->setRuleParam(9, "strength", 1.0f));
        REQUIRE(sim->lastError().kind == ErrorKind::UnknownParameter);
        REQUIRE_FALSE(sim->uniform("storm").has_value());
    }
}

TEST_CASE("Neighbor radius edits respect the cell size", "[gpu][simulation][hotswap]") {
    FLUX_REQUIRE_GPU();

    auto sim = SimulationBuilder()
        .particleCount(128)
        .spatial(0.1f)
        .rule(rules::Separate{0.05f, 1.0f})
        .build(*gpu);
    REQUIRE(sim);

    REQUIRE(sim->setRuleParam(0, "radius", 0.08f));
    REQUIRE_FALSE(sim->setRuleParam(0, "radius", 0.2f));
    REQUIRE(sim->lastError().kind == ErrorKind::CellSizeTooSmall);
    REQUIRE(sim->uniform("rule0_radius") == Value(0.08f));
}

TEST_CASE("Structural rebuilds", "[gpu][simulation][hotswap]") {
    FLUX_REQUIRE_GPU();

    BuildError err;
    SimulationBuilder builder = fallingBuilder();
    auto sim = builder.build(*gpu, &err);
    REQUIRE(sim);

    // Mark every particle so carried state can be recognized
    ParticleBatch marked(sim->layout(), 256);
    ParticleRecord rec(sim->layout());
    for (uint32_t i = 0; i < 256; ++i) {
        rec.reset();
        rec.set("position", glm::vec3(0.0f, 0.0f, float(i) / 256.0f));
        marked.write(i, rec);
    }
    REQUIRE(sim->writeParticles(marked));

    SECTION("same layout carries particles over") {
        SimulationBuilder next = builder;
        next.rule(rules::Drag{0.5f});
        REQUIRE(sim->rebuild(next));
        REQUIRE(sim->rebuildCount() == 1);
        REQUIRE(sim->programs().rules.size() == 2);
        REQUIRE_FALSE(sim->hasError());

        auto back = sim->readParticles();
        REQUIRE(back.has_value());
        REQUIRE(back->read(200).get<glm::vec3>("position").z == 200.0f / 256.0f);
        REQUIRE(sim->frame(DT));
    }

    SECTION("batches read before a rebuild stay readable") {
        auto before = sim->readParticles();
        REQUIRE(before.has_value());
        ParticleRecord held = before->read(5);

        ParticleSchema withMass = ParticleSchema::basic();
        withMass.field("mass", FieldType::F32);
        SimulationBuilder next = builder;
        next.schema(withMass);
        REQUIRE(sim->rebuild(next));
        REQUIRE(sim->layout().has("mass"));
        REQUIRE(sim->readParticles().has_value());

        REQUIRE_FALSE(before->layout().has("mass"));
        REQUIRE(before->read(200).get<glm::vec3>("position").z == 200.0f / 256.0f);
        REQUIRE(held.get<glm::vec3>("position").z == 5.0f / 256.0f);
    }

    SECTION("changed count respawns") {
        SimulationBuilder next = builder;
        next.particleCount(64);
        REQUIRE(sim->rebuild(next));
        REQUIRE(sim->particleCount() == 64);
        auto back = sim->readParticles();
        REQUIRE(back.has_value());
        REQUIRE(back->count() == 64);
    }

    SECTION("invalid WGSL keeps the running build") {
        SimulationBuilder broken = builder;
        broken.rule(rules::Custom{"p.velocity = not_a_function(p.position);"});
        REQUIRE_FALSE(sim->rebuild(broken));
        REQUIRE(sim->hasError());
        REQUIRE(sim->lastError().kind == ErrorKind::ShaderValidation);
        REQUIRE(sim->rebuildCount() == 0);
        REQUIRE(sim->programs().rules.size() == 1);

        REQUIRE(sim->frame(DT));
        auto back = sim->readParticles();
        REQUIRE(back.has_value());
        REQUIRE(back->read(200).get<glm::vec3>("position").z == 200.0f / 256.0f);
    }

    SECTION("invalid rules fail before touching the device") {
        SimulationBuilder broken = builder;
        broken.rule(rules::Separate{0.5f, 1.0f});
        REQUIRE_FALSE(sim->rebuild(broken));
        REQUIRE(sim->lastError().kind == ErrorKind::CellSizeTooSmall);
        REQUIRE(sim->rebuildCount() == 0);
    }

    SECTION("callbacks may rebuild mid-frame") {
        SimulationBuilder next = builder;
        next.rule(rules::Drag{0.1f});
        SimulationBuilder withUpdate = builder;
        withUpdate.update([next](Simulation& s, float, float, const InputSnapshot&) {
            if (s.frameCount() == 1) {
                REQUIRE(s.rebuild(next));
            }
        });
        REQUIRE(sim->rebuild(withUpdate));
        REQUIRE(runFrames(*sim, 3, DT));
        REQUIRE(sim->rebuildCount() == 2);
        REQUIRE(sim->programs().rules.size() == 2);
    }
}

// =============================================================================
// Emitters
// =============================================================================

TEST_CASE("Continuous emitters fill dead slots", "[gpu][simulation][emitters]") {
    FLUX_REQUIRE_GPU();

    emitters::Point source;
    source.rate = 600.0f;
    source.speed = 0.5f;

    BuildError err;
    auto sim = SimulationBuilder()
        .particleCount(1000)
        .startDead()
        .emitter(source)
        .build(*gpu, &err);
    REQUIRE(sim);

    auto before = sim->readParticles();
    REQUIRE(before.has_value());
    REQUIRE(countAlive(*before) == 0);

    REQUIRE(runFrames(*sim, 10, DT));
    REQUIRE(sim->totalScheduled() == 100);
    auto after = sim->readParticles();
    REQUIRE(after.has_value());
    REQUIRE(countAlive(*after) == 100);

    SECTION("rate edits take effect without a rebuild") {
        REQUIRE(sim->setEmitterRate(0, 0.0f));
        REQUIRE(runFrames(*sim, 10, DT));
        REQUIRE(sim->totalScheduled() == 100);
        REQUIRE(sim->rebuildCount() == 0);
        REQUIRE_FALSE(sim->setEmitterRate(3, 10.0f));
    }
}

TEST_CASE("Emission is capped by free slots", "[gpu][simulation][emitters]") {
    FLUX_REQUIRE_GPU();

    emitters::Point flood;
    flood.rate = 60000.0f;

    auto sim = SimulationBuilder()
        .particleCount(50)
        .startDead()
        .emitter(flood)
        .build(*gpu);
    REQUIRE(sim);

    REQUIRE(runFrames(*sim, 3, DT));
    auto batch = sim->readParticles();
    REQUIRE(batch.has_value());
    REQUIRE(countAlive(*batch) == 50);

    // 1000 requests per frame against a 50-slot pool
    REQUIRE(sim->totalScheduled() == 3000);
}

TEST_CASE("Bursts fire once and on trigger", "[gpu][simulation][emitters]") {
    FLUX_REQUIRE_GPU();

    emitters::Burst burst;
    burst.count = 40;

    auto sim = SimulationBuilder()
        .particleCount(200)
        .startDead()
        .emitter(Emitter(burst).withType(2))
        .rule(rules::Lifetime{10.0f})
        .build(*gpu);
    REQUIRE(sim);

    REQUIRE(runFrames(*sim, 5, DT));
    auto first = sim->readParticles();
    REQUIRE(first.has_value());
    REQUIRE(countAlive(*first) == 40);
    REQUIRE(countAliveOfType(*first, 2) == 40);

    sim->triggerBurst();
    REQUIRE(runFrames(*sim, 2, DT));
    auto second = sim->readParticles();
    REQUIRE(second.has_value());
    REQUIRE(countAlive(*second) == 80);
    REQUIRE(sim->totalScheduled() == 80);
}

TEST_CASE("Sub-emitters spawn children on death", "[gpu][simulation][emitters]") {
    FLUX_REQUIRE_GPU();

    SubEmitter sparks;
    sparks.parentType = 0;
    sparks.childType = 1;
    sparks.count = 4;

    BuildError err;
    auto sim = SimulationBuilder()
        .particleCount(64)
        .bounds(2.0f)
        .spawner([](ParticleRecord& rec, uint32_t i, uint32_t) {
            rec.set("position", glm::vec3(float(i % 4) * 0.2f - 0.3f, 0.0f, 0.0f));
            rec.set("velocity", glm::vec3(0.0f, 0.2f, 0.0f));
            if (i >= 4) {
                rec.set("alive", 0u);
            }
        })
        .rule(rules::typed(0, rules::Lifetime{0.05f}))
        .subEmitter(sparks)
        .build(*gpu, &err);
    INFO(err.toString());
    REQUIRE(sim);

    REQUIRE(runFrames(*sim, 10, DT));
    auto batch = sim->readParticles();
    REQUIRE(batch.has_value());
    REQUIRE(countAliveOfType(*batch, 0) == 0);
    REQUIRE(countAliveOfType(*batch, 1) == 16);

    // Children start from their parent's position
    for (uint32_t i = 0; i < batch->count(); ++i) {
        ParticleRecord rec = batch->read(i);
        if (rec.get<uint32_t>("alive") == 0u) continue;
        REQUIRE(std::abs(rec.get<glm::vec3>("position").z) < 0.5f);
    }
}

TEST_CASE("Lifecycle presets run end to end", "[gpu][simulation][lifecycle]") {
    FLUX_REQUIRE_GPU();

    auto sim = SimulationBuilder()
        .particleCount(2000)
        .lifecycle(Lifecycle::fire(glm::vec3(0.0f, -0.5f, 0.0f), 600.0f))
        .build(*gpu);
    REQUIRE(sim);
    REQUIRE(sim->layout().find("color") != nullptr);

    REQUIRE(runFrames(*sim, 30, DT));
    auto batch = sim->readParticles();
    REQUIRE(batch.has_value());
    uint32_t alive = countAlive(*batch);
    REQUIRE(alive > 0);
    REQUIRE(alive <= sim->totalScheduled());
}

// =============================================================================
// Rendering
// =============================================================================

TEST_CASE("Offscreen rendering", "[gpu][simulation][render]") {
    FLUX_REQUIRE_GPU();

    WGPUTextureDescriptor desc = {};
    desc.label = gpu::toStringView("Test Target");
    desc.usage = WGPUTextureUsage_RenderAttachment;
    desc.dimension = WGPUTextureDimension_2D;
    desc.size = {320, 240, 1};
    desc.format = gpu->colorFormat();
    desc.mipLevelCount = 1;
    desc.sampleCount = 1;
    gpu::TextureHandle texture(wgpuDeviceCreateTexture(gpu->device(), &desc));
    REQUIRE(texture);
    gpu::TextureViewHandle view(wgpuTextureCreateView(texture, nullptr));
    REQUIRE(view);

    for (BlendMode mode : {BlendMode::Alpha, BlendMode::Additive}) {
        auto sim = SimulationBuilder()
            .particleCount(512)
            .blend(mode)
            .shape(ParticleShape::Glow)
            .customShaders({"", "", "color = vec4<f32>(color.rgb * 0.5, color.a);"})
            .build(*gpu);
        REQUIRE(sim);
        sim->resize(320, 240);
        REQUIRE(sim->frame(DT, view));
        REQUIRE(sim->redraw(view));
        gpu->poll(true);
        REQUIRE_FALSE(sim->hasError());
        REQUIRE_FALSE(gpu->deviceLost());
    }
}
