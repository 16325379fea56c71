#include "core/viewer_config.hpp"

#include <format>
#include <fstream>

#include <nlohmann/json.hpp>

namespace tomo_viewer::core {

namespace {

ConfigError invalid(const std::string& message) {
    return ConfigError{ConfigError::Code::InvalidValue, message};
}

nlohmann::json loggingToJson(const logging::LogConfig& log) {
    return {
        {"level", logging::toString(log.level)},
        {"file_logging", log.enableFileLogging},
        {"directory", log.logDirectory.string()},
        {"pattern", log.pattern},
        {"max_file_size", log.maxFileSize},
        {"max_files", log.maxFiles}
    };
}

logging::LogConfig loggingFromJson(const nlohmann::json& j) {
    logging::LogConfig log;
    log.level = logging::logLevelFromString(j.value("level", std::string("info")));
    log.enableFileLogging = j.value("file_logging", false);
    log.logDirectory = j.value("directory", std::string());
    log.pattern = j.value("pattern", log.pattern);
    log.maxFileSize = j.value("max_file_size", log.maxFileSize);
    log.maxFiles = j.value("max_files", log.maxFiles);
    return log;
}

}  // anonymous namespace

std::expected<void, ConfigError> validate(const ViewerConfig& config) {
    if (config.cache.capacity < 1) {
        return std::unexpected(invalid(
            std::format("cache.capacity must be >= 1 (got {})", config.cache.capacity)));
    }
    if (config.sampling.bins < 1) {
        return std::unexpected(invalid(
            std::format("sampling.bins must be >= 1 (got {})", config.sampling.bins)));
    }
    if (config.sampling.maxVoxels < 1) {
        return std::unexpected(invalid("sampling.max_voxels must be >= 1"));
    }
    if (config.plane.lateralWidth < 2) {
        return std::unexpected(invalid(
            std::format("plane.lateral_width must be >= 2 (got {})",
                        config.plane.lateralWidth)));
    }
    if (config.prefetch.workerCount < 1) {
        return std::unexpected(invalid(
            std::format("prefetch.worker_count must be >= 1 (got {})",
                        config.prefetch.workerCount)));
    }
    if (config.navigation.primaryDebounceMs < 0 ||
        config.navigation.secondaryDelayMs < 0) {
        return std::unexpected(invalid("navigation delays must be >= 0"));
    }
    if (config.scroll.baseStep < 1 || config.scroll.maxStreak < 0 ||
        config.scroll.streakThresholdSec < 0.0 ||
        config.scroll.streakMultiplier < 0.0) {
        return std::unexpected(invalid("scroll settings out of range"));
    }
    return {};
}

nlohmann::json toJson(const ViewerConfig& config) {
    return {
        {"cache", {{"capacity", config.cache.capacity}}},
        {"sampling", {
            {"bins", config.sampling.bins},
            {"max_voxels", config.sampling.maxVoxels}
        }},
        {"plane", {{"lateral_width", config.plane.lateralWidth}}},
        {"prefetch", {
            {"worker_count", config.prefetch.workerCount},
            {"neighbors", config.prefetch.neighbors}
        }},
        {"navigation", {
            {"primary_debounce_ms", config.navigation.primaryDebounceMs},
            {"secondary_delay_ms", config.navigation.secondaryDelayMs}
        }},
        {"scroll", {
            {"base_step", config.scroll.baseStep},
            {"streak_threshold_sec", config.scroll.streakThresholdSec},
            {"streak_multiplier", config.scroll.streakMultiplier},
            {"max_streak", config.scroll.maxStreak}
        }},
        {"logging", loggingToJson(config.logging)}
    };
}

std::expected<ViewerConfig, ConfigError>
viewerConfigFromJson(const nlohmann::json& json) {
    ViewerConfig config;
    const auto empty = nlohmann::json::object();
    auto section = [&](const char* key) -> const nlohmann::json& {
        auto it = json.find(key);
        return (it != json.end() && it->is_object()) ? *it : empty;
    };

    try {
        config.cache.capacity = section("cache").value("capacity", config.cache.capacity);

        const auto& sampling = section("sampling");
        config.sampling.bins = sampling.value("bins", config.sampling.bins);
        config.sampling.maxVoxels = sampling.value("max_voxels", config.sampling.maxVoxels);

        config.plane.lateralWidth =
            section("plane").value("lateral_width", config.plane.lateralWidth);

        const auto& prefetch = section("prefetch");
        config.prefetch.workerCount = prefetch.value("worker_count", config.prefetch.workerCount);
        config.prefetch.neighbors = prefetch.value("neighbors", config.prefetch.neighbors);

        const auto& navigation = section("navigation");
        config.navigation.primaryDebounceMs =
            navigation.value("primary_debounce_ms", config.navigation.primaryDebounceMs);
        config.navigation.secondaryDelayMs =
            navigation.value("secondary_delay_ms", config.navigation.secondaryDelayMs);

        const auto& scroll = section("scroll");
        config.scroll.baseStep = scroll.value("base_step", config.scroll.baseStep);
        config.scroll.streakThresholdSec =
            scroll.value("streak_threshold_sec", config.scroll.streakThresholdSec);
        config.scroll.streakMultiplier =
            scroll.value("streak_multiplier", config.scroll.streakMultiplier);
        config.scroll.maxStreak = scroll.value("max_streak", config.scroll.maxStreak);

        config.logging = loggingFromJson(section("logging"));
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(ConfigError{ConfigError::Code::ParseFailed, e.what()});
    }

    auto valid = validate(config);
    if (!valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

std::expected<ViewerConfig, ConfigError>
loadViewerConfig(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::FileOpenFailed, path.string()});
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected(ConfigError{ConfigError::Code::ParseFailed, e.what()});
    }
    return viewerConfigFromJson(json);
}

std::expected<void, ConfigError>
saveViewerConfig(const ViewerConfig& config, const std::filesystem::path& path) {
    std::ofstream out(path);
    if (!out.is_open()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::FileWriteFailed, path.string()});
    }
    out << toJson(config).dump(2);
    if (!out) {
        return std::unexpected(ConfigError{
            ConfigError::Code::FileWriteFailed, path.string()});
    }
    return {};
}

}  // namespace tomo_viewer::core
