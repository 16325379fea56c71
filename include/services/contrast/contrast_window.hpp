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
 * @file contrast_window.hpp
 * @brief Linear contrast windowing of float samples to 8-bit intensity
 * @details Defines ContrastRange with its span invariant and repair rules,
 *          the scalar normalize() mapping, whole-slice windowing into a
 *          Raster, and the default window derived from volume statistics.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/volume_source.hpp"

#include <cstdint>
#include <vector>

namespace tomo_viewer::services {

struct VolumeStats;

/// Relative span epsilon of the contrast invariant
inline constexpr double kContrastEpsilon = 1e-6;

/**
 * @brief Intensity window [min, max] mapped to 0..255
 *
 * Invariant: max - min >= kContrastEpsilon * max(1, |max - min|).
 * Construct through repaired() or clampedTo() to guarantee it.
 */
struct ContrastRange {
    double min = 0.0;
    double max = 1.0;

    /**
     * @brief Build a valid range from arbitrary user input
     *
     * Inverted bounds are swapped; a span below epsilon is widened upward
     * from @p min so that max > min.
     */
    [[nodiscard]] static ContrastRange repaired(double min, double max) noexcept;

    /**
     * @brief Clip this range into the sampled extent [lo, hi]
     *
     * min is clipped to [lo, hi - eps] and max to [lo + eps, hi] with
     * eps = kContrastEpsilon * max(1, |hi - lo|); if the result is still not
     * increasing the whole extent is used.
     */
    [[nodiscard]] ContrastRange clampedTo(double lo, double hi) const noexcept;

    [[nodiscard]] bool isValid() const noexcept;

    [[nodiscard]] bool operator==(const ContrastRange& other) const noexcept = default;
};

/**
 * @brief 8-bit grayscale raster, row-major
 */
struct Raster {
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> pixels;

    [[nodiscard]] std::uint8_t at(int col, int row) const {
        return pixels[static_cast<std::size_t>(row) * width + col];
    }

    [[nodiscard]] bool isEmpty() const noexcept { return pixels.empty(); }
};

/**
 * @brief Map one sample to 0..255
 *
 * round(clamp((value - min) / (max - min), 0, 1) * 255). Monotonic
 * non-decreasing in @p value; normalize(min) == 0 and normalize(max) == 255.
 * Callers guarantee finite input.
 */
[[nodiscard]] std::uint8_t normalize(float value, const ContrastRange& range) noexcept;

/**
 * @brief Window a whole float slice into a raster of the same size
 */
[[nodiscard]] Raster applyContrast(const core::FloatSlice& slice,
                                   const ContrastRange& range);

/**
 * @brief Initial window for a volume with no user adjustment
 *
 * mean ± ((max - min) / 2) / 1.5, or [min, max] when the span is not positive.
 */
[[nodiscard]] ContrastRange defaultContrast(const VolumeStats& stats) noexcept;

}  // namespace tomo_viewer::services
