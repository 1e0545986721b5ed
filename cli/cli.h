#pragma once

/**
 * @file cli.h
 * @brief Command-line runner for JSON configs
 *
 * `flux <config.json> [--headless --frames N] [--dump path]`
 *
 * Interactive mode opens a GLFW window: drag to orbit, scroll to zoom,
 * Space pauses and R reloads the config from disk. A reload that fails to
 * build keeps the running simulation and shows the error in the title bar.
 */

#include <cstdint>
#include <optional>
#include <string>

namespace flux::cli {

struct RunOptions {
    std::string configPath;
    bool headless = false;
    uint32_t frames = 0;        ///< 0 = until the window closes (headless: 60)
    std::string dumpPath;       ///< Write final particle state as JSON
    uint32_t width = 1280;
    uint32_t height = 720;
};

/// @brief Parse argv
/// @return Exit code when the process should stop (help, bad arguments)
std::optional<int> parseArguments(int argc, char** argv, RunOptions& options);

/// @brief Load the config and run until done; returns the process exit code
int run(const RunOptions& options);

} // namespace flux::cli
