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

#include "services/oblique/oblique_plane_resampler.hpp"
#include "core/logging.hpp"
#include "core/trilinear_interpolation.hpp"

#include <format>
#include <utility>

namespace tomo_viewer::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("ObliquePlaneResampler");
    return logger;
}
}

float trilinearSample(const core::VolumeSource& volume, double x, double y, double z) {
    return volume.sample(x, y, z);
}

core::FloatSlice resamplePlane(const core::VolumeSource& volume, const PlaneFrame& frame) {
    core::FloatSlice slice;
    slice.width = frame.width();
    slice.height = frame.height;
    slice.values.resize(static_cast<std::size_t>(slice.width) * slice.height);

    const core::VolumeShape shape = volume.shape();
    if (shape.isEmpty()) {
        return slice;
    }
    const std::byte* base = volume.data();

    core::dispatchVoxelType(volume.voxelType(), [&](auto tag) {
        using T = decltype(tag);
        std::size_t out = 0;
        for (int py = 0; py < frame.height; ++py) {
            const Point3D rowStart = frame.origin + frame.tangentV * py;
            for (int px = 0; px < slice.width; ++px) {
                const Point3D p = rowStart + frame.lateralA * (px - frame.halfWidth);
                slice.values[out++] = core::trilinearAt<T>(base, shape, p.x, p.y, p.z);
            }
        }
    });
    return slice;
}

class ObliquePlaneResampler::Impl {
public:
    explicit Impl(int width) : lateralWidth(width) {}

    int lateralWidth;
    std::optional<PlaneFrame> frame;
    Point3D originalP1;
    Point3D originalP2;
    double baseZ = 0.0;
    std::uint64_t version = 0;
    PlaneDefinedCallback callback;

    std::expected<std::uint64_t, GeometryError> install(const Point3D& p1, const Point3D& p2) {
        auto built = buildPlaneFrame(p1, p2, lateralWidth);
        if (!built) {
            return std::unexpected(built.error());
        }
        frame = *built;
        return ++version;
    }

    // Runs once the defining points are stored, so the callback may query or
    // re-anchor the resampler
    void notify() {
        if (callback && frame) {
            const PlaneFrame snapshot = *frame;
            callback(snapshot, version);
        }
    }
};

ObliquePlaneResampler::ObliquePlaneResampler(int lateralWidth)
    : impl_(std::make_unique<Impl>(lateralWidth)) {}

ObliquePlaneResampler::~ObliquePlaneResampler() = default;

ObliquePlaneResampler::ObliquePlaneResampler(ObliquePlaneResampler&&) noexcept = default;
ObliquePlaneResampler& ObliquePlaneResampler::operator=(ObliquePlaneResampler&&) noexcept = default;

std::expected<std::uint64_t, GeometryError>
ObliquePlaneResampler::definePlane(const Point3D& p1, const Point3D& p2, double baseZ) {
    auto result = impl_->install(p1, p2);
    if (!result) {
        getLogger()->warn("Plane rejected: {}", result.error().toString());
        return result;
    }
    impl_->originalP1 = p1;
    impl_->originalP2 = p2;
    impl_->baseZ = baseZ;

    const auto& frame = *impl_->frame;
    getLogger()->info("Plane v{} defined from ({:.1f}, {:.1f}, {:.1f}) to ({:.1f}, {:.1f}, {:.1f}), {}x{}",
                      *result, p1.x, p1.y, p1.z, p2.x, p2.y, p2.z,
                      frame.width(), frame.height);
    impl_->notify();
    return result;
}

std::expected<std::uint64_t, GeometryError>
ObliquePlaneResampler::updatePlaneForZ(double newZ) {
    if (!impl_->frame) {
        return std::unexpected(GeometryError{
            GeometryError::Code::NoPlane, std::format("cannot move plane to z={}", newZ)});
    }
    const Vector3D shift{0.0, 0.0, newZ - impl_->baseZ};
    auto result = impl_->install(impl_->originalP1 + shift, impl_->originalP2 + shift);
    if (result) {
        getLogger()->debug("Plane v{} re-anchored to z={}", *result, newZ);
        impl_->notify();
    }
    return result;
}

void ObliquePlaneResampler::clearPlane() {
    if (impl_->frame) {
        getLogger()->debug("Plane v{} cleared", impl_->version);
    }
    impl_->frame.reset();
}

bool ObliquePlaneResampler::hasPlane() const noexcept {
    return impl_->frame.has_value();
}

std::uint64_t ObliquePlaneResampler::planeVersion() const noexcept {
    return impl_->version;
}

std::optional<PlaneFrame> ObliquePlaneResampler::currentFrame() const {
    return impl_->frame;
}

int ObliquePlaneResampler::lateralWidth() const noexcept {
    return impl_->lateralWidth;
}

std::expected<Raster, GeometryError>
ObliquePlaneResampler::render(const core::VolumeSource& volume,
                              const ContrastRange& range) const {
    if (!impl_->frame) {
        return std::unexpected(GeometryError{GeometryError::Code::NoPlane, "render"});
    }
    return applyContrast(resamplePlane(volume, *impl_->frame), range);
}

void ObliquePlaneResampler::setPlaneDefinedCallback(PlaneDefinedCallback callback) {
    impl_->callback = std::move(callback);
}

}  // namespace tomo_viewer::services
