// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file viewer_config.hpp
 * @brief Session configuration persisted as JSON
 * @details Groups the tunables of the navigation engine (cache capacity,
 *          histogram sampling budget, oblique plane width, prefetch worker
 *          count, debounce intervals, wheel acceleration and logging) and
 *          reads/writes them with nlohmann::json. Missing keys fall back to
 *          the defaults below.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/logging.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace tomo_viewer::core {

/**
 * @brief Error information for configuration loading and validation
 */
struct ConfigError {
    enum class Code {
        Success,
        FileOpenFailed,
        FileWriteFailed,
        ParseFailed,
        InvalidValue
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::FileOpenFailed: return "Cannot open config: " + message;
            case Code::FileWriteFailed: return "Cannot write config: " + message;
            case Code::ParseFailed: return "Config parse error: " + message;
            case Code::InvalidValue: return "Invalid config value: " + message;
        }
        return "Unknown error";
    }
};

struct CacheSettings {
    int capacity = 128;                  ///< Slices per open volume
};

struct SamplingSettings {
    int bins = 256;                      ///< Histogram bins
    std::size_t maxVoxels = 2'000'000;   ///< Subsample budget for histogram/stats
};

struct PlaneSettings {
    int lateralWidth = 40;               ///< Oblique raster width in pixels
};

struct PrefetchSettings {
    int workerCount = 2;                 ///< Background worker threads
    bool neighbors = true;               ///< Prefetch center slices of ±1 files
};

struct NavigationSettings {
    int primaryDebounceMs = 10;          ///< Coalescing window for wheel steps
    int secondaryDelayMs = 250;          ///< Deferral of the orthogonal view
};

struct ScrollSettings {
    int baseStep = 4;                    ///< Slices per wheel notch
    double streakThresholdSec = 2.0;     ///< Max gap between events in a streak
    double streakMultiplier = 0.01;      ///< Step gain per streak level
    int maxStreak = 4;
};

struct ViewerConfig {
    CacheSettings cache;
    SamplingSettings sampling;
    PlaneSettings plane;
    PrefetchSettings prefetch;
    NavigationSettings navigation;
    ScrollSettings scroll;
    logging::LogConfig logging;
};

/**
 * @brief Check ranges of all settings
 * @return void, or InvalidValue naming the first offending key
 */
[[nodiscard]] std::expected<void, ConfigError> validate(const ViewerConfig& config);

[[nodiscard]] nlohmann::json toJson(const ViewerConfig& config);

/**
 * @brief Build a config from JSON, using defaults for missing keys
 * @return Config, or ParseFailed on type mismatches, or InvalidValue
 */
[[nodiscard]] std::expected<ViewerConfig, ConfigError>
viewerConfigFromJson(const nlohmann::json& json);

[[nodiscard]] std::expected<ViewerConfig, ConfigError>
loadViewerConfig(const std::filesystem::path& path);

[[nodiscard]] std::expected<void, ConfigError>
saveViewerConfig(const ViewerConfig& config, const std::filesystem::path& path);

}  // namespace tomo_viewer::core
