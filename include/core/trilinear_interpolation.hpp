#pragma once

#include "core/volume_source.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace tomo_viewer::core {

/**
 * @brief Trilinear interpolation over a typed C-order buffer
 *
 * Coordinates are clamped into [0, dim-1] per axis, the floor/ceil lattice
 * neighbors are taken on each axis and the eight corners are blended along x,
 * then y, then z. At integer coordinates all fractional weights are zero and
 * the result is the stored voxel value.
 *
 * Called once per output pixel by the plane resampler; performs no allocation.
 */
template <typename T>
[[nodiscard]] inline float trilinearAt(const std::byte* base,
                                       const VolumeShape& shape,
                                       double x, double y, double z) noexcept {
    const double maxX = static_cast<double>(shape.x - 1);
    const double maxY = static_cast<double>(shape.y - 1);
    const double maxZ = static_cast<double>(shape.z - 1);

    x = std::clamp(x, 0.0, maxX);
    y = std::clamp(y, 0.0, maxY);
    z = std::clamp(z, 0.0, maxZ);

    const auto x0 = static_cast<std::size_t>(std::floor(x));
    const auto y0 = static_cast<std::size_t>(std::floor(y));
    const auto z0 = static_cast<std::size_t>(std::floor(z));
    const std::size_t x1 = std::min(x0 + 1, shape.x - 1);
    const std::size_t y1 = std::min(y0 + 1, shape.y - 1);
    const std::size_t z1 = std::min(z0 + 1, shape.z - 1);

    const double xd = x - static_cast<double>(x0);
    const double yd = y - static_cast<double>(y0);
    const double zd = z - static_cast<double>(z0);

    const std::size_t rowStride = shape.x;
    const std::size_t planeStride = shape.x * shape.y;

    auto voxelAt = [&](std::size_t zi, std::size_t yi, std::size_t xi) -> double {
        return loadVoxel<T>(base, zi * planeStride + yi * rowStride + xi);
    };

    const double c000 = voxelAt(z0, y0, x0);
    const double c100 = voxelAt(z0, y0, x1);
    const double c010 = voxelAt(z0, y1, x0);
    const double c110 = voxelAt(z0, y1, x1);
    const double c001 = voxelAt(z1, y0, x0);
    const double c101 = voxelAt(z1, y0, x1);
    const double c011 = voxelAt(z1, y1, x0);
    const double c111 = voxelAt(z1, y1, x1);

    const double c00 = c000 * (1.0 - xd) + c100 * xd;
    const double c01 = c001 * (1.0 - xd) + c101 * xd;
    const double c10 = c010 * (1.0 - xd) + c110 * xd;
    const double c11 = c011 * (1.0 - xd) + c111 * xd;

    const double c0 = c00 * (1.0 - yd) + c10 * yd;
    const double c1 = c01 * (1.0 - yd) + c11 * yd;

    return static_cast<float>(c0 * (1.0 - zd) + c1 * zd);
}

}  // namespace tomo_viewer::core
