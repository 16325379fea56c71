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
 * @file coordinate_types.hpp
 * @brief Coordinate type definitions for raster/volume mapping
 * @details Defines RasterCoordinate, the 2D pixel-space position inside a
 *          rendered slice raster, and the integer VoxelIndex used when a
 *          picked point is snapped to the volume lattice.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/volume_source.hpp"

#include <cstddef>

namespace tomo_viewer::services::coordinate {

/**
 * @brief 2D position inside a rendered raster (column, row), may be fractional
 */
struct RasterCoordinate {
    double x = 0.0;
    double y = 0.0;

    RasterCoordinate() = default;
    RasterCoordinate(double px, double py) : x(px), y(py) {}

    [[nodiscard]] bool operator==(const RasterCoordinate& other) const noexcept {
        return x == other.x && y == other.y;
    }
};

/**
 * @brief 3D voxel indices (x, y, z) into a volume
 */
struct VoxelIndex {
    int x = 0;
    int y = 0;
    int z = 0;

    VoxelIndex() = default;
    VoxelIndex(int px, int py, int pz) : x(px), y(py), z(pz) {}

    [[nodiscard]] bool isValid(const core::VolumeShape& shape) const noexcept {
        return x >= 0 && static_cast<std::size_t>(x) < shape.x &&
               y >= 0 && static_cast<std::size_t>(y) < shape.y &&
               z >= 0 && static_cast<std::size_t>(z) < shape.z;
    }

    [[nodiscard]] bool operator==(const VoxelIndex& other) const noexcept {
        return x == other.x && y == other.y && z == other.z;
    }
};

}  // namespace tomo_viewer::services::coordinate
