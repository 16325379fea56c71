/**
 * @file volume_io.hpp
 * @brief Volume file discovery and opening
 * @details Lists the tomogram files of a directory and opens a path as a
 *          VolumeSource, choosing the memory-mapped MRC reader for MRC
 *          extensions and ITK's ImageIO factories for everything else.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/volume_source.hpp"

#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <vector>

namespace tomo_viewer::core {

/**
 * @brief Shared read-only volume handle
 */
using VolumeHandle = std::shared_ptr<const VolumeSource>;

/**
 * @brief Function that opens a path as a volume
 *
 * Injected into the session so tests can supply in-memory volumes.
 */
using VolumeOpener =
    std::function<std::expected<VolumeHandle, VolumeError>(const std::filesystem::path&)>;

/**
 * @brief True for .mrc, .rec, .mrcs and .map (case-insensitive)
 */
[[nodiscard]] bool isMrcPath(const std::filesystem::path& path);

/**
 * @brief Sorted MRC-family files for a path
 *
 * For a directory, returns its .mrc/.rec/.mrcs files. For a file, returns the
 * matching files of its parent directory, with the file itself included when
 * it exists even if its extension does not match.
 */
[[nodiscard]] std::vector<std::filesystem::path>
listVolumeFiles(const std::filesystem::path& path);

/**
 * @brief Open a volume file
 *
 * MRC-family paths are memory-mapped; other paths are read into memory as
 * float through itk::ImageFileReader.
 */
[[nodiscard]] std::expected<VolumeHandle, VolumeError>
openVolume(const std::filesystem::path& path);

}  // namespace tomo_viewer::core
