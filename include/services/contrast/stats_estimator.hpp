/**
 * @file stats_estimator.hpp
 * @brief Two-tier (min, max, mean) estimation for a volume
 * @details Trusted header statistics are O(1) but may be absent or garbage;
 *          the strided subsample is O(maxVoxels) but always available. The
 *          estimator prefers a valid hint and falls back to the subsample.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/volume_source.hpp"
#include "services/contrast/histogram_sampler.hpp"

#include <cstddef>
#include <optional>

namespace tomo_viewer::services {

/**
 * @brief Volume intensity statistics
 */
struct VolumeStats {
    enum class Source {
        Header,   ///< Taken from a valid header hint
        Sampled   ///< Computed from a strided subsample
    };

    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    Source source = Source::Sampled;
};

/**
 * @brief Check whether a header hint can be trusted
 * @return true when min and max are finite and max > min
 */
[[nodiscard]] bool isUsableHint(const core::HeaderStats& hint) noexcept;

/**
 * @brief Estimate (min, max, mean)
 *
 * @param volume Volume to sample when the hint is unusable
 * @param hint Header statistics, typically volume.headerStats()
 * @param maxVoxels Subsample budget for the fallback
 * @return Stats from the hint (mean from the hint if finite, else the
 *         midpoint), or from the subsample; never fails
 */
[[nodiscard]] VolumeStats estimateStats(const core::VolumeSource& volume,
                                        const std::optional<core::HeaderStats>& hint,
                                        std::size_t maxVoxels = kDefaultMaxVoxels);

/**
 * @brief Estimate using the volume's own header statistics as the hint
 */
[[nodiscard]] VolumeStats estimateStats(const core::VolumeSource& volume,
                                        std::size_t maxVoxels = kDefaultMaxVoxels);

}  // namespace tomo_viewer::services
