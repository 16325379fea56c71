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
 * @file plane_coordinate_mapper.hpp
 * @brief Mapping between raster-local coordinates and volume space
 * @details Provides the oblique plane forward/inverse transforms and the
 *          PlaneCoordinateMapper that picks the right transform for the view
 *          a pointer event came from (XY, XZ or the oblique plane).
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "services/coordinate/coordinate_types.hpp"
#include "services/oblique/plane_frame.hpp"
#include "services/slice/slice_cache.hpp"

#include <expected>
#include <memory>
#include <optional>

namespace tomo_viewer::services::coordinate {

/**
 * @brief Project a volume point onto the plane raster
 *
 * px = dot(p - origin, lateralA) + halfWidth, py = dot(p - origin, tangentV).
 * The component along normalB is discarded.
 */
[[nodiscard]] RasterCoordinate volumeToPlane(const Point3D& point,
                                             const PlaneFrame& frame) noexcept;

/**
 * @brief Volume point for a plane raster position
 *
 * origin + (px - halfWidth) * lateralA + py * tangentV. Exact inverse of
 * volumeToPlane for points lying on the plane.
 */
[[nodiscard]] Point3D planeToVolume(double px, double py, const PlaneFrame& frame) noexcept;

/**
 * @brief Clamp each coordinate into [0, dim-1]
 */
[[nodiscard]] Point3D clampToVolume(const Point3D& point,
                                    const core::VolumeShape& shape) noexcept;

/**
 * @brief Snap a volume point to the nearest voxel, clamped to the volume
 */
[[nodiscard]] VoxelIndex toVoxelIndex(const Point3D& point,
                                      const core::VolumeShape& shape) noexcept;

/**
 * @brief Converts pointer positions of the slice views to volume coordinates
 *
 * Axis-aligned views are the identity on the in-plane axes with the third
 * coordinate taken from the current cursor:
 * - XY: (px, py) -> (px, py, cursor.z)
 * - XZ: (px, py) -> (px, cursor.y, py)
 * The oblique view uses the frame set with setPlane().
 */
class PlaneCoordinateMapper {
public:
    PlaneCoordinateMapper();
    ~PlaneCoordinateMapper();

    PlaneCoordinateMapper(const PlaneCoordinateMapper& other);
    PlaneCoordinateMapper& operator=(const PlaneCoordinateMapper& other);
    PlaneCoordinateMapper(PlaneCoordinateMapper&&) noexcept;
    PlaneCoordinateMapper& operator=(PlaneCoordinateMapper&&) noexcept;

    // ==================== Setup ====================

    void setVolumeShape(const core::VolumeShape& shape);
    [[nodiscard]] core::VolumeShape volumeShape() const;

    /// Current cursor in volume space; supplies the out-of-view coordinate
    void setCursor(const Point3D& cursor);
    [[nodiscard]] Point3D cursor() const;

    void setPlane(const PlaneFrame& frame);
    void clearPlane();
    [[nodiscard]] bool hasPlane() const noexcept;

    // ==================== Transformations ====================

    /**
     * @brief Raster position in @p view to volume coordinates
     * @return Volume point (not clamped), or NoPlane for an oblique view
     *         without a defined plane
     */
    [[nodiscard]] std::expected<Point3D, GeometryError>
    toVolume(SliceKind view, const RasterCoordinate& raster) const;

    /**
     * @brief Volume point to raster position in @p view
     */
    [[nodiscard]] std::expected<RasterCoordinate, GeometryError>
    toRaster(SliceKind view, const Point3D& point) const;

    /**
     * @brief Map a pointer position to a pick inside the volume
     *
     * Same as toVolume() followed by clampToVolume().
     */
    [[nodiscard]] std::expected<Point3D, GeometryError>
    pick(SliceKind view, const RasterCoordinate& raster) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tomo_viewer::services::coordinate
