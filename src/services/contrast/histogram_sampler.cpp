#include "services/contrast/histogram_sampler.hpp"

#include <algorithm>
#include <limits>

namespace tomo_viewer::services {

std::size_t samplingStride(std::size_t total, std::size_t maxVoxels) noexcept {
    maxVoxels = std::max<std::size_t>(maxVoxels, 1);
    if (total <= maxVoxels) {
        return 1;
    }
    return (total + maxVoxels - 1) / maxVoxels;
}

HistogramData sampleHistogram(const core::VolumeSource& volume, int bins,
                              std::size_t maxVoxels) {
    bins = std::max(bins, 1);

    // Pass 1: observed range
    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();
    std::size_t sampled = 0;
    forEachStridedSample(volume, maxVoxels, [&](float value) {
        lo = std::min(lo, static_cast<double>(value));
        hi = std::max(hi, static_cast<double>(value));
        ++sampled;
    });

    if (sampled == 0) {
        lo = 0.0;
        hi = 1.0;
    } else if (lo == hi) {
        lo -= 0.5;
        hi += 0.5;
    }

    HistogramData histogram;
    histogram.counts.assign(static_cast<std::size_t>(bins), 0);
    histogram.edges.resize(static_cast<std::size_t>(bins) + 1);
    const double width = (hi - lo) / bins;
    for (int i = 0; i < bins; ++i) {
        histogram.edges[i] = lo + width * i;
    }
    histogram.edges[bins] = hi;

    if (sampled == 0) {
        return histogram;
    }

    // Pass 2: binning, last bin closed on the right
    const double scale = bins / (hi - lo);
    forEachStridedSample(volume, maxVoxels, [&](float value) {
        auto index = static_cast<std::int64_t>((static_cast<double>(value) - lo) * scale);
        index = std::clamp<std::int64_t>(index, 0, bins - 1);
        ++histogram.counts[static_cast<std::size_t>(index)];
    });

    return histogram;
}

}  // namespace tomo_viewer::services
