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
 * @file histogram_sampler.hpp
 * @brief Bounded, deterministic intensity histogram of a volume
 * @details Visits at most ~maxVoxels voxels with a fixed stride over the
 *          flattened C-order array, so the result is reproducible for the
 *          same volume and budget, and bins the visited samples into
 *          equal-width bins over their observed range.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/volume_source.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace tomo_viewer::services {

/// Default number of histogram bins
inline constexpr int kDefaultHistogramBins = 256;

/// Default subsample budget shared by histogram and statistics
inline constexpr std::size_t kDefaultMaxVoxels = 2'000'000;

/**
 * @brief Histogram counts and bin edges
 *
 * edges has counts.size() + 1 entries; bin i covers [edges[i], edges[i+1]),
 * the last bin also includes its right edge.
 */
struct HistogramData {
    std::vector<std::int64_t> counts;
    std::vector<double> edges;

    [[nodiscard]] double lowerBound() const { return edges.empty() ? 0.0 : edges.front(); }
    [[nodiscard]] double upperBound() const { return edges.empty() ? 0.0 : edges.back(); }

    [[nodiscard]] bool operator==(const HistogramData& other) const = default;
};

/**
 * @brief Stride used to visit at most ~maxVoxels of total voxels
 * @return 1 when total <= maxVoxels, else ceil(total / maxVoxels)
 */
[[nodiscard]] std::size_t samplingStride(std::size_t total, std::size_t maxVoxels) noexcept;

/**
 * @brief Visit every stride-th voxel of the flattened volume as float
 *
 * The element type is dispatched once; non-finite samples are skipped.
 */
template <typename Fn>
void forEachStridedSample(const core::VolumeSource& volume, std::size_t maxVoxels, Fn&& fn) {
    const std::size_t total = volume.shape().total();
    const std::size_t stride = samplingStride(total, maxVoxels);
    const std::byte* base = volume.data();
    if (!base) {
        return;
    }
    core::dispatchVoxelType(volume.voxelType(), [&](auto tag) {
        using T = decltype(tag);
        for (std::size_t i = 0; i < total; i += stride) {
            const float value = core::loadVoxel<T>(base, i);
            if (std::isfinite(value)) {
                fn(value);
            }
        }
    });
}

/**
 * @brief Fixed-bin histogram over a strided subsample
 *
 * @param volume Volume to sample
 * @param bins Number of equal-width bins (values below 1 are treated as 1)
 * @param maxVoxels Subsample budget
 * @return Counts and edges; an empty or constant sample uses a unit-wide range
 *         centered on the value (or [0, 1] when nothing was sampled)
 */
[[nodiscard]] HistogramData sampleHistogram(const core::VolumeSource& volume,
                                            int bins = kDefaultHistogramBins,
                                            std::size_t maxVoxels = kDefaultMaxVoxels);

}  // namespace tomo_viewer::services
