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
 * @file oblique_plane_resampler.hpp
 * @brief Oblique plane resampling through a scalar volume
 * @details Resamples a fixed-width plane defined by two picked points with
 *          trilinear interpolation, and keeps the current plane definition so
 *          it can be re-anchored when the primary view moves to another depth.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/volume_source.hpp"
#include "services/contrast/contrast_window.hpp"
#include "services/oblique/plane_frame.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>

namespace tomo_viewer::services {

/**
 * @brief Trilinear sample at fractional volume coordinates
 *
 * Coordinates are clamped into [0, dim-1] per axis before interpolation.
 * Exact at integer lattice points.
 */
[[nodiscard]] float trilinearSample(const core::VolumeSource& volume,
                                    double x, double y, double z);

/**
 * @brief Resample the plane described by @p frame
 *
 * Output is frame.height rows × frame.width() columns. Pixel (px, py)
 * takes the value at origin + (px - halfWidth) * lateralA + py * tangentV.
 */
[[nodiscard]] core::FloatSlice resamplePlane(const core::VolumeSource& volume,
                                             const PlaneFrame& frame);

/**
 * @brief Callback invoked after every successful plane (re)definition
 */
using PlaneDefinedCallback = std::function<void(const PlaneFrame& frame,
                                                std::uint64_t version)>;

/**
 * @brief Holds the current oblique plane and renders it
 *
 * The plane is defined from two picked points at a base depth. Moving the
 * primary view translates both original points along Z by (newZ - baseZ);
 * repeated re-anchoring is absolute with respect to the original picks.
 * Each successful definition increments planeVersion(), which callers use
 * as the cache key of the rendered raster.
 *
 * Not thread-safe; owned by the interactive thread.
 */
class ObliquePlaneResampler {
public:
    explicit ObliquePlaneResampler(int lateralWidth = kDefaultLateralWidth);
    ~ObliquePlaneResampler();

    // Non-copyable, movable
    ObliquePlaneResampler(const ObliquePlaneResampler&) = delete;
    ObliquePlaneResampler& operator=(const ObliquePlaneResampler&) = delete;
    ObliquePlaneResampler(ObliquePlaneResampler&&) noexcept;
    ObliquePlaneResampler& operator=(ObliquePlaneResampler&&) noexcept;

    // ==================== Plane Definition ====================

    /**
     * @brief Define the plane from two points picked at depth @p baseZ
     *
     * On failure the previously defined plane (if any) is kept unchanged.
     *
     * @return Version of the new plane, or DegeneratePlane
     */
    std::expected<std::uint64_t, GeometryError>
    definePlane(const Point3D& p1, const Point3D& p2, double baseZ);

    /**
     * @brief Re-anchor the plane to a new primary depth
     * @return New version, or NoPlane when nothing is defined
     */
    std::expected<std::uint64_t, GeometryError> updatePlaneForZ(double newZ);

    /**
     * @brief Forget the current plane
     */
    void clearPlane();

    // ==================== Query ====================

    [[nodiscard]] bool hasPlane() const noexcept;

    /// Version of the current plane; 0 before any definition
    [[nodiscard]] std::uint64_t planeVersion() const noexcept;

    [[nodiscard]] std::optional<PlaneFrame> currentFrame() const;

    [[nodiscard]] int lateralWidth() const noexcept;

    // ==================== Rendering ====================

    /**
     * @brief Resample the current plane and apply the contrast window
     * @return Raster, or NoPlane when nothing is defined
     */
    [[nodiscard]] std::expected<Raster, GeometryError>
    render(const core::VolumeSource& volume, const ContrastRange& range) const;

    void setPlaneDefinedCallback(PlaneDefinedCallback callback);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tomo_viewer::services
