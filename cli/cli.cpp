// Flux - Command Line Runner Implementation

#include "cli.h"
#include <flux/flux.h>
#include <CLI/CLI.hpp>
#include <GLFW/glfw3.h>
#include <glfw3webgpu.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <memory>

namespace flux::cli {

namespace {

constexpr float HEADLESS_DT = 1.0f / 60.0f;
constexpr uint32_t HEADLESS_DEFAULT_FRAMES = 60;
constexpr float ORBIT_SPEED = 0.005f;
constexpr float ZOOM_STEP = 0.9f;

bool dumpParticles(Simulation& sim, const std::string& configName, const std::string& path) {
    auto batch = sim.readParticles();
    if (!batch) {
        std::cerr << "[Runner] Particle readback failed, nothing dumped\n";
        return false;
    }

    const std::vector<std::string> names = sim.layout().fieldNames();
    nlohmann::json particles = nlohmann::json::array();
    for (uint32_t i = 0; i < batch->count(); ++i) {
        ParticleRecord record = batch->read(i);
        nlohmann::json entry = nlohmann::json::object();
        for (const std::string& name : names) {
            if (auto v = record.value(name)) {
                entry[name] = valueToJson(*v);
            }
        }
        particles.push_back(std::move(entry));
    }

    nlohmann::json doc = {
        {"config", configName},
        {"frames", sim.frameCount()},
        {"time", sim.time()},
        {"fields", names},
        {"particles", std::move(particles)}
    };

    std::ofstream file(path);
    if (!file) {
        std::cerr << "[Runner] Cannot write " << path << "\n";
        return false;
    }
    file << doc.dump(2) << "\n";
    std::cout << "[Runner] Wrote " << batch->count() << " particles to " << path << "\n";
    return static_cast<bool>(file);
}

// =============================================================================
// Headless
// =============================================================================

int runHeadless(const SimConfig& config, const RunOptions& options) {
    BuildError err;
    auto gpu = gpu::GpuContext::createHeadless(&err);
    if (!gpu) {
        std::cerr << "[Runner] " << err.toString() << "\n";
        return 1;
    }

    auto sim = config.toBuilder().build(*gpu, &err);
    if (!sim) {
        std::cerr << "[Runner] Build failed: " << err.toString() << "\n";
        return 1;
    }

    const uint32_t frames = options.frames > 0 ? options.frames : HEADLESS_DEFAULT_FRAMES;
    for (uint32_t i = 0; i < frames; ++i) {
        if (!sim->frame(HEADLESS_DT)) {
            std::cerr << "[Runner] Device lost at frame " << i << "\n";
            return 1;
        }
    }
    gpu->poll(true);
    std::cout << "[Runner] Ran " << frames << " frames (" << sim->time() << " s simulated)\n";

    if (!options.dumpPath.empty() && !dumpParticles(*sim, config.name, options.dumpPath)) {
        return 1;
    }
    return 0;
}

// =============================================================================
// Interactive
// =============================================================================

struct WindowState {
    gpu::GpuContext* gpu = nullptr;
    Simulation* sim = nullptr;
    bool reloadRequested = false;
    bool dragging = false;
    double lastX = 0.0;
    double lastY = 0.0;
};

WindowState* stateOf(GLFWwindow* window) {
    return static_cast<WindowState*>(glfwGetWindowUserPointer(window));
}

void installCallbacks(GLFWwindow* window) {
    glfwSetKeyCallback(window, [](GLFWwindow* w, int key, int, int action, int) {
        WindowState* s = stateOf(w);
        if (!s || !s->sim || action == GLFW_REPEAT) return;
        bool down = action == GLFW_PRESS;
        s->sim->input().keyEvent(key, down);
        if (!down) return;

        if (key == GLFW_KEY_SPACE) {
            s->sim->setPaused(!s->sim->paused());
            std::cout << "[Runner] " << (s->sim->paused() ? "Paused" : "Resumed") << "\n";
        } else if (key == GLFW_KEY_R) {
            s->reloadRequested = true;
        } else if (key == GLFW_KEY_ESCAPE) {
            glfwSetWindowShouldClose(w, GLFW_TRUE);
        }
    });

    glfwSetMouseButtonCallback(window, [](GLFWwindow* w, int button, int action, int) {
        WindowState* s = stateOf(w);
        if (!s || !s->sim) return;
        bool down = action == GLFW_PRESS;
        s->sim->input().mouseButtonEvent(button, down);
        if (button == GLFW_MOUSE_BUTTON_LEFT) {
            s->dragging = down;
            glfwGetCursorPos(w, &s->lastX, &s->lastY);
        }
    });

    glfwSetCursorPosCallback(window, [](GLFWwindow* w, double x, double y) {
        WindowState* s = stateOf(w);
        if (!s || !s->sim) return;
        s->sim->input().mouseMove(static_cast<float>(x), static_cast<float>(y));
        if (s->dragging) {
            float dx = static_cast<float>(x - s->lastX);
            float dy = static_cast<float>(y - s->lastY);
            s->sim->camera().orbitBy(-dx * ORBIT_SPEED, dy * ORBIT_SPEED);
        }
        s->lastX = x;
        s->lastY = y;
    });

    glfwSetScrollCallback(window, [](GLFWwindow* w, double dx, double dy) {
        WindowState* s = stateOf(w);
        if (!s || !s->sim) return;
        s->sim->input().scrollEvent(static_cast<float>(dx), static_cast<float>(dy));
        s->sim->camera().zoom(std::pow(ZOOM_STEP, static_cast<float>(dy)));
    });

    glfwSetFramebufferSizeCallback(window, [](GLFWwindow* w, int width, int height) {
        WindowState* s = stateOf(w);
        if (!s || width <= 0 || height <= 0) return;
        s->gpu->configureSurface(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
        if (s->sim) s->sim->resize(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
    });
}

void updateTitle(GLFWwindow* window, const std::string& name, const Simulation& sim) {
    std::string title = "flux - " + name;
    if (sim.paused()) title += " [paused]";
    if (sim.hasError()) title += " [build error: " + sim.lastError().message + "]";
    glfwSetWindowTitle(window, title.c_str());
}

int runWindowed(SimConfig config, const RunOptions& options, bool configWarning) {
    if (!glfwInit()) {
        std::cerr << "[Runner] Failed to initialize GLFW\n";
        return 1;
    }
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    GLFWwindow* window = glfwCreateWindow(static_cast<int>(options.width), static_cast<int>(options.height),
                                          "flux", nullptr, nullptr);
    if (!window) {
        std::cerr << "[Runner] Failed to create window\n";
        glfwTerminate();
        return 1;
    }

    int exitCode = 0;
    {
        BuildError err;
        int fbWidth = 0;
        int fbHeight = 0;
        glfwGetFramebufferSize(window, &fbWidth, &fbHeight);
        auto gpu = gpu::GpuContext::createForSurface(
            [window](WGPUInstance instance) { return glfwCreateWindowWGPUSurface(instance, window); },
            static_cast<uint32_t>(fbWidth), static_cast<uint32_t>(fbHeight), &err);
        if (!gpu) {
            std::cerr << "[Runner] " << err.toString() << "\n";
            glfwDestroyWindow(window);
            glfwTerminate();
            return 1;
        }

        auto sim = config.toBuilder().build(*gpu, &err);
        if (!sim) {
            std::cerr << "[Runner] Build failed: " << err.toString() << "\n";
            glfwDestroyWindow(window);
            glfwTerminate();
            return 1;
        }

        WindowState state;
        state.gpu = gpu.get();
        state.sim = sim.get();
        glfwSetWindowUserPointer(window, &state);
        installCallbacks(window);

        sim->resize(static_cast<uint32_t>(std::max(fbWidth, 1)), static_cast<uint32_t>(std::max(fbHeight, 1)));

        std::string title = config.name + (configWarning ? " [config invalid, defaults loaded]" : "");
        updateTitle(window, title, *sim);

        double lastTime = glfwGetTime();
        uint32_t framesRun = 0;
        while (!glfwWindowShouldClose(window)) {
            glfwPollEvents();

            if (state.reloadRequested) {
                state.reloadRequested = false;
                ConfigLoadResult loaded = loadConfig(options.configPath);
                if (loaded.status == ConfigLoadStatus::Unreadable) {
                    std::cerr << "[Runner] Reload skipped, " << options.configPath << " is unreadable\n";
                } else if (sim->rebuild(loaded.config.toBuilder())) {
                    config = loaded.config;
                    title = config.name;
                    if (loaded.status == ConfigLoadStatus::Invalid) {
                        title += " [config invalid, defaults loaded]";
                    }
                }
                updateTitle(window, title, *sim);
            }

            double now = glfwGetTime();
            float dt = std::min(static_cast<float>(now - lastTime), 0.1f);
            lastTime = now;

            glfwGetFramebufferSize(window, &fbWidth, &fbHeight);
            if (fbWidth == 0 || fbHeight == 0) {
                continue;
            }

            WGPUSurfaceTexture surfaceTexture = {};
            wgpuSurfaceGetCurrentTexture(gpu->surface(), &surfaceTexture);
            if (surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal &&
                surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal) {
                if (surfaceTexture.texture) wgpuTextureRelease(surfaceTexture.texture);
                // Outdated or lost: reconfigure and retry next frame
                gpu->configureSurface(static_cast<uint32_t>(fbWidth), static_cast<uint32_t>(fbHeight));
                continue;
            }

            WGPUTextureViewDescriptor viewDesc = {};
            viewDesc.format = gpu->colorFormat();
            viewDesc.dimension = WGPUTextureViewDimension_2D;
            viewDesc.mipLevelCount = 1;
            viewDesc.arrayLayerCount = 1;
            viewDesc.aspect = WGPUTextureAspect_All;
            WGPUTextureView view = wgpuTextureCreateView(surfaceTexture.texture, &viewDesc);

            bool ok = sim->paused() ? sim->redraw(view) : sim->frame(dt, view);
            wgpuSurfacePresent(gpu->surface());
            wgpuTextureViewRelease(view);
            wgpuTextureRelease(surfaceTexture.texture);

            if (!ok && gpu->deviceLost()) {
                std::cerr << "[Runner] Device lost, exiting\n";
                exitCode = 1;
                break;
            }
            if (!sim->paused() && options.frames > 0 && ++framesRun >= options.frames) {
                break;
            }
            if (sim->hasError()) {
                updateTitle(window, title, *sim);
            }
        }

        if (exitCode == 0 && !options.dumpPath.empty() && !dumpParticles(*sim, config.name, options.dumpPath)) {
            exitCode = 1;
        }
        glfwSetWindowUserPointer(window, nullptr);
    }

    glfwDestroyWindow(window);
    glfwTerminate();
    return exitCode;
}

} // namespace

// =============================================================================
// Entry points
// =============================================================================

std::optional<int> parseArguments(int argc, char** argv, RunOptions& options) {
    CLI::App app{"flux - GPU particle simulation runner"};
    app.set_version_flag("-v,--version", std::string(FLUX_VERSION));
    app.set_help_flag("-h,--help", "Show this help");

    app.add_option("config", options.configPath, "Simulation config (JSON)")->required();
    app.add_flag("--headless", options.headless, "Run without a window");
    app.add_option("--frames", options.frames, "Frames to run (headless default: 60)");
    app.add_option("--dump", options.dumpPath, "Write the final particle state as JSON");
    app.add_option("--width", options.width, "Window width")->default_val(1280);
    app.add_option("--height", options.height, "Window height")->default_val(720);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }
    return std::nullopt;
}

int run(const RunOptions& options) {
    ConfigLoadResult loaded = loadConfig(options.configPath);
    if (loaded.status == ConfigLoadStatus::Unreadable) {
        std::cerr << "[Runner] Cannot read config " << options.configPath << "\n";
        return 1;
    }
    bool invalid = loaded.status == ConfigLoadStatus::Invalid;
    if (invalid) {
        std::cerr << "[Runner] Warning: " << options.configPath << " is invalid, running defaults\n";
    }

    if (options.headless) {
        return runHeadless(loaded.config, options);
    }
    return runWindowed(loaded.config, options, invalid);
}

} // namespace flux::cli
