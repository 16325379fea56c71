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
 * @file mrc_volume_source.hpp
 * @brief Memory-mapped MRC/REC/MRCS volume reader
 * @details Parses the 1024-byte MRC2014 header, validates dimensions, mode
 *          and file length, and maps the voxel block read-only through
 *          QFile::map so gigabyte-scale tomograms are paged in on demand.
 *          The header's amin/amax/amean fields are reported as a statistics
 *          hint.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/volume_source.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace tomo_viewer::core {

/**
 * @brief Fields of the MRC header used by the reader
 */
struct MrcHeader {
    std::int32_t nx = 0;
    std::int32_t ny = 0;
    std::int32_t nz = 0;
    std::int32_t mode = 0;
    float amin = 0.0f;
    float amax = 0.0f;
    float amean = 0.0f;
    std::int32_t extendedHeaderBytes = 0;
    std::uint8_t machineStamp[4] = {0, 0, 0, 0};

    static constexpr std::size_t kSize = 1024;
};

/**
 * @brief Map an MRC mode number to a voxel type
 * @return Voxel type, or nullopt for modes the reader does not support
 *         (4-bit, complex, float16)
 */
[[nodiscard]] std::optional<VoxelType> voxelTypeForMrcMode(std::int32_t mode) noexcept;

/**
 * @brief Decode the header fields from the first 1024 bytes of a file
 */
[[nodiscard]] MrcHeader parseMrcHeader(const std::byte* bytes) noexcept;

class MrcVolumeSource : public VolumeSource {
public:
    /**
     * @brief Open and map an MRC file
     *
     * @param path File path
     * @return Mapped volume, or VolumeError when the file is missing,
     *         cannot be mapped, has an invalid header, an unsupported mode,
     *         big-endian data, or fewer bytes than the header declares
     */
    [[nodiscard]] static std::expected<std::unique_ptr<MrcVolumeSource>, VolumeError>
    open(const std::filesystem::path& path);

    ~MrcVolumeSource() override;

    MrcVolumeSource(const MrcVolumeSource&) = delete;
    MrcVolumeSource& operator=(const MrcVolumeSource&) = delete;

    [[nodiscard]] VolumeShape shape() const noexcept override;
    [[nodiscard]] VoxelType voxelType() const noexcept override;
    [[nodiscard]] const std::byte* data() const noexcept override;
    [[nodiscard]] std::string name() const override;
    [[nodiscard]] std::optional<HeaderStats> headerStats() const override;

    [[nodiscard]] const MrcHeader& header() const noexcept;
    [[nodiscard]] const std::filesystem::path& path() const noexcept;

private:
    MrcVolumeSource();

    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tomo_viewer::core
