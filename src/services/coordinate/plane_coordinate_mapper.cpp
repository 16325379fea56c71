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

#include "services/coordinate/plane_coordinate_mapper.hpp"

#include <algorithm>
#include <cmath>

namespace tomo_viewer::services::coordinate {

namespace {

double clampAxis(double value, std::size_t dim) {
    const double upper = dim > 0 ? static_cast<double>(dim - 1) : 0.0;
    return std::clamp(value, 0.0, upper);
}

GeometryError noPlaneError() {
    return GeometryError{GeometryError::Code::NoPlane, "oblique view has no plane"};
}

}  // anonymous namespace

RasterCoordinate volumeToPlane(const Point3D& point, const PlaneFrame& frame) noexcept {
    const Vector3D offset = point - frame.origin;
    return RasterCoordinate{offset.dot(frame.lateralA) + frame.halfWidth,
                            offset.dot(frame.tangentV)};
}

Point3D planeToVolume(double px, double py, const PlaneFrame& frame) noexcept {
    return frame.origin + frame.lateralA * (px - frame.halfWidth) + frame.tangentV * py;
}

Point3D clampToVolume(const Point3D& point, const core::VolumeShape& shape) noexcept {
    return Point3D{clampAxis(point.x, shape.x),
                   clampAxis(point.y, shape.y),
                   clampAxis(point.z, shape.z)};
}

VoxelIndex toVoxelIndex(const Point3D& point, const core::VolumeShape& shape) noexcept {
    const Point3D clamped = clampToVolume(point, shape);
    return VoxelIndex{static_cast<int>(std::lround(clamped.x)),
                      static_cast<int>(std::lround(clamped.y)),
                      static_cast<int>(std::lround(clamped.z))};
}

class PlaneCoordinateMapper::Impl {
public:
    core::VolumeShape shape;
    Point3D cursor;
    std::optional<PlaneFrame> frame;
};

PlaneCoordinateMapper::PlaneCoordinateMapper()
    : impl_(std::make_unique<Impl>()) {}

PlaneCoordinateMapper::~PlaneCoordinateMapper() = default;

PlaneCoordinateMapper::PlaneCoordinateMapper(const PlaneCoordinateMapper& other)
    : impl_(std::make_unique<Impl>(*other.impl_)) {}

PlaneCoordinateMapper& PlaneCoordinateMapper::operator=(const PlaneCoordinateMapper& other) {
    if (this != &other) {
        impl_ = std::make_unique<Impl>(*other.impl_);
    }
    return *this;
}

PlaneCoordinateMapper::PlaneCoordinateMapper(PlaneCoordinateMapper&&) noexcept = default;
PlaneCoordinateMapper& PlaneCoordinateMapper::operator=(PlaneCoordinateMapper&&) noexcept = default;

void PlaneCoordinateMapper::setVolumeShape(const core::VolumeShape& shape) {
    impl_->shape = shape;
}

core::VolumeShape PlaneCoordinateMapper::volumeShape() const {
    return impl_->shape;
}

void PlaneCoordinateMapper::setCursor(const Point3D& cursor) {
    impl_->cursor = cursor;
}

Point3D PlaneCoordinateMapper::cursor() const {
    return impl_->cursor;
}

void PlaneCoordinateMapper::setPlane(const PlaneFrame& frame) {
    impl_->frame = frame;
}

void PlaneCoordinateMapper::clearPlane() {
    impl_->frame.reset();
}

bool PlaneCoordinateMapper::hasPlane() const noexcept {
    return impl_->frame.has_value();
}

// ==================== Transformations ====================

std::expected<Point3D, GeometryError>
PlaneCoordinateMapper::toVolume(SliceKind view, const RasterCoordinate& raster) const {
    switch (view) {
        case SliceKind::XY:
            return Point3D{raster.x, raster.y, impl_->cursor.z};
        case SliceKind::XZ:
            return Point3D{raster.x, impl_->cursor.y, raster.y};
        case SliceKind::Oblique:
            if (!impl_->frame) {
                return std::unexpected(noPlaneError());
            }
            return planeToVolume(raster.x, raster.y, *impl_->frame);
    }
    return std::unexpected(noPlaneError());
}

std::expected<RasterCoordinate, GeometryError>
PlaneCoordinateMapper::toRaster(SliceKind view, const Point3D& point) const {
    switch (view) {
        case SliceKind::XY:
            return RasterCoordinate{point.x, point.y};
        case SliceKind::XZ:
            return RasterCoordinate{point.x, point.z};
        case SliceKind::Oblique:
            if (!impl_->frame) {
                return std::unexpected(noPlaneError());
            }
            return volumeToPlane(point, *impl_->frame);
    }
    return std::unexpected(noPlaneError());
}

std::expected<Point3D, GeometryError>
PlaneCoordinateMapper::pick(SliceKind view, const RasterCoordinate& raster) const {
    return toVolume(view, raster).transform([this](const Point3D& point) {
        return clampToVolume(point, impl_->shape);
    });
}

}  // namespace tomo_viewer::services::coordinate
