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
 * @file volume_source.hpp
 * @brief Read-only scalar volume abstraction
 * @details Declares the VolumeSource interface shared by the memory-mapped
 *          MRC reader and the ITK-backed in-memory volume, together with the
 *          voxel type tags, shape, per-slice float buffers and the open-time
 *          error type. All voxel data is addressed in C order (Z, Y, X) with
 *          x varying fastest, and is normalized to 32-bit float on read.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

namespace tomo_viewer::core {

/**
 * @brief Storage type of the voxels behind a VolumeSource
 */
enum class VoxelType {
    Int8,
    UInt8,
    Int16,
    UInt16,
    Float32
};

/**
 * @brief Size in bytes of one voxel of the given type
 */
[[nodiscard]] constexpr std::size_t voxelSize(VoxelType type) noexcept {
    switch (type) {
        case VoxelType::Int8:
        case VoxelType::UInt8:
            return 1;
        case VoxelType::Int16:
        case VoxelType::UInt16:
            return 2;
        case VoxelType::Float32:
            return 4;
    }
    return 1;
}

/**
 * @brief Volume dimensions in (Z, Y, X) order
 */
struct VolumeShape {
    std::size_t z = 0;
    std::size_t y = 0;
    std::size_t x = 0;

    [[nodiscard]] std::size_t total() const noexcept { return z * y * x; }

    [[nodiscard]] bool isEmpty() const noexcept { return total() == 0; }

    [[nodiscard]] bool operator==(const VolumeShape& other) const noexcept = default;
};

/**
 * @brief Error information for volume open failures
 */
struct VolumeError {
    enum class Code {
        Success,
        FileNotFound,
        OpenFailed,
        InvalidHeader,
        UnsupportedMode,
        Truncated,
        ReadFailed
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::FileNotFound: return "File not found: " + message;
            case Code::OpenFailed: return "Open failed: " + message;
            case Code::InvalidHeader: return "Invalid header: " + message;
            case Code::UnsupportedMode: return "Unsupported mode: " + message;
            case Code::Truncated: return "Truncated data: " + message;
            case Code::ReadFailed: return "Read failed: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief Summary statistics embedded in a file header
 *
 * Values are whatever the writer stored; they are only a hint and must be
 * validated before use (see StatsEstimator).
 */
struct HeaderStats {
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
};

/**
 * @brief Row-major float buffer of one 2D cross-section
 */
struct FloatSlice {
    int width = 0;
    int height = 0;
    std::vector<float> values;

    [[nodiscard]] float at(int col, int row) const {
        return values[static_cast<std::size_t>(row) * width + col];
    }
};

/**
 * @brief Unaligned-safe load of one voxel as float
 *
 * Mapped MRC data starts at 1024 + extended header bytes, so typed pointers
 * into the mapping are not guaranteed to be aligned.
 */
template <typename T>
[[nodiscard]] inline float loadVoxel(const std::byte* base, std::size_t index) noexcept {
    T value;
    std::memcpy(&value, base + index * sizeof(T), sizeof(T));
    return static_cast<float>(value);
}

/**
 * @brief Invoke @p fn with a value-initialized tag of the C++ type matching @p type
 *
 * Lets per-pixel loops be instantiated once per element type instead of
 * switching on the type for every voxel.
 */
template <typename Fn>
decltype(auto) dispatchVoxelType(VoxelType type, Fn&& fn) {
    switch (type) {
        case VoxelType::Int8:    return fn(std::int8_t{});
        case VoxelType::UInt8:   return fn(std::uint8_t{});
        case VoxelType::Int16:   return fn(std::int16_t{});
        case VoxelType::UInt16:  return fn(std::uint16_t{});
        case VoxelType::Float32: return fn(float{});
    }
    return fn(float{});
}

/**
 * @brief Read-only view over a 3D scalar array
 *
 * Implementations expose a contiguous, immutable C-order buffer. All read
 * operations are const and free of shared mutable state, so one instance may
 * be read concurrently from the interactive thread and from worker threads.
 *
 * Failures (missing file, corrupt header) are reported by the factory that
 * opens the volume; once constructed, reads never fail.
 */
class VolumeSource {
public:
    virtual ~VolumeSource() = default;

    /// Dimensions in (Z, Y, X) order
    [[nodiscard]] virtual VolumeShape shape() const noexcept = 0;

    /// Element type of the underlying buffer
    [[nodiscard]] virtual VoxelType voxelType() const noexcept = 0;

    /// First byte of the C-order voxel buffer
    [[nodiscard]] virtual const std::byte* data() const noexcept = 0;

    /// Display name (file name for file-backed volumes)
    [[nodiscard]] virtual std::string name() const = 0;

    /// Statistics stored in the file header, if the format has any
    [[nodiscard]] virtual std::optional<HeaderStats> headerStats() const {
        return std::nullopt;
    }

    /**
     * @brief Voxel at a flat C-order index, normalized to float
     */
    [[nodiscard]] float at(std::size_t flatIndex) const;

    /**
     * @brief Voxel at integer lattice coordinates (no bounds check)
     */
    [[nodiscard]] float voxel(std::size_t z, std::size_t y, std::size_t x) const;

    /**
     * @brief Trilinear sample at fractional coordinates
     *
     * Each coordinate is clamped to [0, dim-1] first, so geometry that falls
     * slightly outside the volume is valid input. Exact at lattice points.
     */
    [[nodiscard]] float sample(double x, double y, double z) const;

    /**
     * @brief XY cross-section at depth @p z (Y rows × X columns)
     * @pre 0 <= z < shape().z
     */
    [[nodiscard]] FloatSlice readXY(std::size_t z) const;

    /**
     * @brief XZ cross-section at row @p y (Z rows × X columns)
     * @pre 0 <= y < shape().y
     */
    [[nodiscard]] FloatSlice readXZ(std::size_t y) const;

protected:
    VolumeSource() = default;
    VolumeSource(const VolumeSource&) = default;
    VolumeSource& operator=(const VolumeSource&) = default;
};

}  // namespace tomo_viewer::core
