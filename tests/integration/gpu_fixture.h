#pragma once

/**
 * @file gpu_fixture.h
 * @brief Shared headless device for the [gpu] tests
 *
 * The context is requested once per test process. Machines without a
 * WebGPU adapter skip every test that asks for it.
 */

#include <catch2/catch_test_macros.hpp>
#include <flux/gpu/context.h>
#include <flux/simulation.h>
#include <iostream>
#include <memory>

namespace flux::test {

/// Headless context, or nullptr when no adapter is available
inline gpu::GpuContext* sharedGpu() {
    static std::unique_ptr<gpu::GpuContext> context = [] {
        BuildError err;
        auto ctx = gpu::GpuContext::createHeadless(&err);
        if (!ctx) {
            std::cerr << "[Tests] No GPU: " << err.toString() << "\n";
        }
        return ctx;
    }();
    return context.get();
}

/// Step @p frames frames of @p dt seconds without rendering
inline bool runFrames(Simulation& sim, uint32_t frames, float dt = 1.0f / 60.0f) {
    for (uint32_t i = 0; i < frames; ++i) {
        if (!sim.frame(dt)) return false;
    }
    return true;
}

} // namespace flux::test

/// Bind `gpu` to the shared context or skip the running test
#define FLUX_REQUIRE_GPU()                                 \
    flux::gpu::GpuContext* gpu = flux::test::sharedGpu();  \
    if (!gpu) {                                            \
        SKIP("no WebGPU adapter available");               \
    }
