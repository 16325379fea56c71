#include "services/contrast/stats_estimator.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace tomo_viewer::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("StatsEstimator");
    return logger;
}
}

bool isUsableHint(const core::HeaderStats& hint) noexcept {
    return std::isfinite(hint.min) && std::isfinite(hint.max) && hint.max > hint.min;
}

VolumeStats estimateStats(const core::VolumeSource& volume,
                          const std::optional<core::HeaderStats>& hint,
                          std::size_t maxVoxels) {
    if (hint && isUsableHint(*hint)) {
        VolumeStats stats;
        stats.min = hint->min;
        stats.max = hint->max;
        stats.mean = std::isfinite(hint->mean) ? hint->mean
                                               : 0.5 * (hint->min + hint->max);
        stats.source = VolumeStats::Source::Header;
        return stats;
    }

    if (hint) {
        getLogger()->warn("Header statistics of {} unusable ({}, {}); sampling",
                          volume.name(), hint->min, hint->max);
    }

    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();
    double sum = 0.0;
    std::size_t count = 0;
    forEachStridedSample(volume, maxVoxels, [&](float value) {
        const double v = value;
        lo = std::min(lo, v);
        hi = std::max(hi, v);
        sum += v;
        ++count;
    });

    VolumeStats stats;
    stats.source = VolumeStats::Source::Sampled;
    if (count == 0) {
        return stats;
    }
    stats.min = lo;
    stats.max = hi;
    stats.mean = sum / static_cast<double>(count);
    return stats;
}

VolumeStats estimateStats(const core::VolumeSource& volume, std::size_t maxVoxels) {
    return estimateStats(volume, volume.headerStats(), maxVoxels);
}

}  // namespace tomo_viewer::services
