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
 * @file plane_frame.hpp
 * @brief Oblique sampling frame built from two picked points
 * @details Defines the volume-space point/vector types, the PlaneFrame
 *          (origin plus right-handed orthonormal basis and raster size) and
 *          the construction routine that derives the basis from the segment
 *          p1 -> p2.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <cmath>
#include <expected>
#include <string>

namespace tomo_viewer::services {

/**
 * @brief 3D vector in volume (voxel) space
 */
struct Vector3D {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    Vector3D() = default;
    Vector3D(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    [[nodiscard]] double length() const noexcept {
        return std::sqrt(x * x + y * y + z * z);
    }

    [[nodiscard]] double dot(const Vector3D& o) const noexcept {
        return x * o.x + y * o.y + z * o.z;
    }

    [[nodiscard]] Vector3D cross(const Vector3D& o) const noexcept {
        return Vector3D{y * o.z - z * o.y, z * o.x - x * o.z, x * o.y - y * o.x};
    }

    [[nodiscard]] Vector3D operator*(double s) const noexcept {
        return Vector3D{x * s, y * s, z * s};
    }

    [[nodiscard]] Vector3D operator+(const Vector3D& o) const noexcept {
        return Vector3D{x + o.x, y + o.y, z + o.z};
    }

    [[nodiscard]] bool operator==(const Vector3D& other) const noexcept = default;
};

/**
 * @brief 3D point in volume (voxel) space, x/y/z in voxel units
 *
 * May carry fractional values (e.g. while dragging a pick).
 */
struct Point3D {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    Point3D() = default;
    Point3D(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    [[nodiscard]] Vector3D operator-(const Point3D& o) const noexcept {
        return Vector3D{x - o.x, y - o.y, z - o.z};
    }

    [[nodiscard]] Point3D operator+(const Vector3D& v) const noexcept {
        return Point3D{x + v.x, y + v.y, z + v.z};
    }

    [[nodiscard]] bool operator==(const Point3D& other) const noexcept = default;
};

/**
 * @brief Error information for plane geometry operations
 */
struct GeometryError {
    enum class Code {
        Success,
        DegeneratePlane,   ///< The two defining points coincide
        NoPlane,           ///< Operation needs a defined plane
        NoVolume           ///< Operation needs an open volume
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::DegeneratePlane: return "Degenerate plane: " + message;
            case Code::NoPlane: return "No plane defined: " + message;
            case Code::NoVolume: return "No volume: " + message;
        }
        return "Unknown error";
    }
};

/// Default oblique raster width in pixels
inline constexpr int kDefaultLateralWidth = 40;

/// Minimum |p2 - p1| (and cross product norm) treated as non-degenerate
inline constexpr double kGeometryEpsilon = 1e-6;

/**
 * @brief Sampling frame of an oblique plane
 *
 * (tangentV, lateralA, normalB) is right-handed and orthonormal with
 * normalB = tangentV × lateralA. Raster pixel (px, py) corresponds to
 * origin + (px - halfWidth) * lateralA + py * tangentV.
 */
struct PlaneFrame {
    Point3D origin;
    Vector3D tangentV{0.0, 0.0, 1.0};
    Vector3D lateralA{1.0, 0.0, 0.0};
    Vector3D normalB{0.0, 1.0, 0.0};
    int halfWidth = kDefaultLateralWidth / 2;
    int height = 1;

    [[nodiscard]] int width() const noexcept { return 2 * halfWidth; }
};

/**
 * @brief Build a frame from two points
 *
 * tangentV = unit(p2 - p1); the provisional up vector is (0,0,1) unless
 * |dot(tangentV, up)| > 0.9, then (0,1,0); lateralA = unit(tangentV × up)
 * with a (1,0,0) fallback; normalB = unit(tangentV × lateralA).
 * halfWidth = max(1, lateralWidth / 2), height = max(1, round(|p2 - p1|)).
 *
 * @return Frame, or DegeneratePlane when |p2 - p1| < kGeometryEpsilon
 */
[[nodiscard]] std::expected<PlaneFrame, GeometryError>
buildPlaneFrame(const Point3D& p1, const Point3D& p2,
                int lateralWidth = kDefaultLateralWidth);

}  // namespace tomo_viewer::services
