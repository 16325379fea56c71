#include "services/contrast/contrast_window.hpp"
#include "services/contrast/stats_estimator.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace tomo_viewer::services {

namespace {

double spanEpsilon(double lo, double hi) noexcept {
    return kContrastEpsilon * std::max(1.0, std::abs(hi - lo));
}

}  // anonymous namespace

ContrastRange ContrastRange::repaired(double min, double max) noexcept {
    if (max < min) {
        std::swap(min, max);
    }
    const double eps = spanEpsilon(min, max);
    if (max - min < eps) {
        max = min + eps;
    }
    return ContrastRange{min, max};
}

ContrastRange ContrastRange::clampedTo(double lo, double hi) const noexcept {
    if (hi < lo) {
        std::swap(lo, hi);
    }
    const double eps = spanEpsilon(lo, hi);
    if (hi - lo < eps) {
        return repaired(lo, hi);
    }

    ContrastRange result;
    result.min = std::clamp(min, lo, hi - eps);
    result.max = std::clamp(max, lo + eps, hi);
    if (result.min >= result.max) {
        result.min = lo;
        result.max = hi;
    }
    return result;
}

bool ContrastRange::isValid() const noexcept {
    return std::isfinite(min) && std::isfinite(max) &&
           max - min >= spanEpsilon(min, max) && max > min;
}

std::uint8_t normalize(float value, const ContrastRange& range) noexcept {
    const double t = std::clamp(
        (static_cast<double>(value) - range.min) / (range.max - range.min), 0.0, 1.0);
    return static_cast<std::uint8_t>(t * 255.0 + 0.5);
}

Raster applyContrast(const core::FloatSlice& slice, const ContrastRange& range) {
    Raster raster;
    raster.width = slice.width;
    raster.height = slice.height;
    raster.pixels.resize(slice.values.size());

    std::transform(slice.values.begin(), slice.values.end(), raster.pixels.begin(),
                   [&range](float value) { return normalize(value, range); });
    return raster;
}

ContrastRange defaultContrast(const VolumeStats& stats) noexcept {
    const double halfSpan = (stats.max - stats.min) / 2.0;
    if (halfSpan <= 0.0) {
        return ContrastRange::repaired(stats.min, stats.max);
    }
    const double radius = halfSpan / 1.5;
    return ContrastRange::repaired(stats.mean - radius, stats.mean + radius);
}

}  // namespace tomo_viewer::services
