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

#include "core/mrc_volume_source.hpp"
#include "core/logging.hpp"

#include <cstring>
#include <format>

#include <QFile>
#include <QString>

namespace tomo_viewer::core {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("MrcVolumeSource");
    return logger;
}

// Byte offsets of the header fields (MRC2014, little-endian words)
constexpr std::size_t kOffsetNx = 0;
constexpr std::size_t kOffsetNy = 4;
constexpr std::size_t kOffsetNz = 8;
constexpr std::size_t kOffsetMode = 12;
constexpr std::size_t kOffsetAmin = 76;
constexpr std::size_t kOffsetAmax = 80;
constexpr std::size_t kOffsetAmean = 84;
constexpr std::size_t kOffsetNsymbt = 92;
constexpr std::size_t kOffsetMachineStamp = 212;

/// First machine stamp byte written by big-endian hosts
constexpr std::uint8_t kBigEndianStamp = 0x11;

template <typename T>
T readField(const std::byte* bytes, std::size_t offset) noexcept {
    T value;
    std::memcpy(&value, bytes + offset, sizeof(T));
    return value;
}

}  // anonymous namespace

std::optional<VoxelType> voxelTypeForMrcMode(std::int32_t mode) noexcept {
    switch (mode) {
        case 0: return VoxelType::Int8;
        case 1: return VoxelType::Int16;
        case 2: return VoxelType::Float32;
        case 6: return VoxelType::UInt16;
        default: return std::nullopt;
    }
}

MrcHeader parseMrcHeader(const std::byte* bytes) noexcept {
    MrcHeader header;
    header.nx = readField<std::int32_t>(bytes, kOffsetNx);
    header.ny = readField<std::int32_t>(bytes, kOffsetNy);
    header.nz = readField<std::int32_t>(bytes, kOffsetNz);
    header.mode = readField<std::int32_t>(bytes, kOffsetMode);
    header.amin = readField<float>(bytes, kOffsetAmin);
    header.amax = readField<float>(bytes, kOffsetAmax);
    header.amean = readField<float>(bytes, kOffsetAmean);
    header.extendedHeaderBytes = readField<std::int32_t>(bytes, kOffsetNsymbt);
    std::memcpy(header.machineStamp, bytes + kOffsetMachineStamp,
                sizeof(header.machineStamp));
    return header;
}

class MrcVolumeSource::Impl {
public:
    std::filesystem::path path;
    QFile file;
    uchar* mapping = nullptr;
    MrcHeader header;
    VolumeShape shape;
    VoxelType voxelType = VoxelType::Float32;
    const std::byte* voxels = nullptr;

    ~Impl() {
        if (mapping) {
            file.unmap(mapping);
        }
        file.close();
    }
};

MrcVolumeSource::MrcVolumeSource() : impl_(std::make_unique<Impl>()) {}

MrcVolumeSource::~MrcVolumeSource() = default;

std::expected<std::unique_ptr<MrcVolumeSource>, VolumeError>
MrcVolumeSource::open(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected(VolumeError{
            VolumeError::Code::FileNotFound, path.string()});
    }

    std::unique_ptr<MrcVolumeSource> volume(new MrcVolumeSource());
    auto& impl = *volume->impl_;
    impl.path = path;
    impl.file.setFileName(QString::fromStdString(path.string()));

    if (!impl.file.open(QIODevice::ReadOnly)) {
        return std::unexpected(VolumeError{
            VolumeError::Code::OpenFailed,
            path.string() + ": " + impl.file.errorString().toStdString()});
    }

    const qint64 fileSize = impl.file.size();
    if (fileSize < static_cast<qint64>(MrcHeader::kSize)) {
        return std::unexpected(VolumeError{
            VolumeError::Code::InvalidHeader,
            std::format("{}: {} bytes is shorter than the MRC header",
                        path.string(), fileSize)});
    }

    impl.mapping = impl.file.map(0, fileSize);
    if (!impl.mapping) {
        return std::unexpected(VolumeError{
            VolumeError::Code::OpenFailed,
            path.string() + ": " + impl.file.errorString().toStdString()});
    }

    const auto* bytes = reinterpret_cast<const std::byte*>(impl.mapping);
    impl.header = parseMrcHeader(bytes);
    const auto& header = impl.header;

    if (header.machineStamp[0] == kBigEndianStamp) {
        return std::unexpected(VolumeError{
            VolumeError::Code::UnsupportedMode,
            path.string() + ": big-endian data"});
    }

    if (header.nx <= 0 || header.ny <= 0 || header.nz <= 0) {
        return std::unexpected(VolumeError{
            VolumeError::Code::InvalidHeader,
            std::format("{}: dimensions {}x{}x{}", path.string(),
                        header.nx, header.ny, header.nz)});
    }

    if (header.extendedHeaderBytes < 0) {
        return std::unexpected(VolumeError{
            VolumeError::Code::InvalidHeader,
            std::format("{}: negative extended header size {}", path.string(),
                        header.extendedHeaderBytes)});
    }

    auto voxelType = voxelTypeForMrcMode(header.mode);
    if (!voxelType) {
        return std::unexpected(VolumeError{
            VolumeError::Code::UnsupportedMode,
            std::format("{}: mode {}", path.string(), header.mode)});
    }

    impl.voxelType = *voxelType;
    impl.shape.x = static_cast<std::size_t>(header.nx);
    impl.shape.y = static_cast<std::size_t>(header.ny);
    impl.shape.z = static_cast<std::size_t>(header.nz);

    const std::size_t dataOffset =
        MrcHeader::kSize + static_cast<std::size_t>(header.extendedHeaderBytes);
    const auto available = static_cast<std::size_t>(fileSize);
    if (available < dataOffset) {
        return std::unexpected(VolumeError{
            VolumeError::Code::Truncated,
            std::format("{}: data offset {} past end of file ({} bytes)",
                        path.string(), dataOffset, fileSize)});
    }

    // Compare voxel counts instead of byte counts so corrupt dimensions
    // cannot wrap the product.
    const std::size_t maxVoxels =
        (available - dataOffset) / voxelSize(impl.voxelType);
    const std::size_t planeVoxels =
        impl.shape.x > maxVoxels / impl.shape.y ? maxVoxels + 1
                                                : impl.shape.x * impl.shape.y;
    if (planeVoxels > maxVoxels || impl.shape.z > maxVoxels / planeVoxels) {
        return std::unexpected(VolumeError{
            VolumeError::Code::Truncated,
            std::format("{}: {}x{}x{} voxels exceed the {} data bytes in the file",
                        path.string(), header.nx, header.ny, header.nz,
                        available - dataOffset)});
    }

    impl.voxels = bytes + dataOffset;

    getLogger()->info("Mapped {} ({}x{}x{}, mode {})",
                      path.filename().string(), header.nx, header.ny,
                      header.nz, header.mode);
    return volume;
}

VolumeShape MrcVolumeSource::shape() const noexcept {
    return impl_->shape;
}

VoxelType MrcVolumeSource::voxelType() const noexcept {
    return impl_->voxelType;
}

const std::byte* MrcVolumeSource::data() const noexcept {
    return impl_->voxels;
}

std::string MrcVolumeSource::name() const {
    return impl_->path.filename().string();
}

std::optional<HeaderStats> MrcVolumeSource::headerStats() const {
    const auto& header = impl_->header;
    return HeaderStats{header.amin, header.amax, header.amean};
}

const MrcHeader& MrcVolumeSource::header() const noexcept {
    return impl_->header;
}

const std::filesystem::path& MrcVolumeSource::path() const noexcept {
    return impl_->path;
}

}  // namespace tomo_viewer::core
