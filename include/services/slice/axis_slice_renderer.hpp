#pragma once

#include "core/volume_source.hpp"
#include "services/contrast/contrast_window.hpp"
#include "services/slice/slice_cache.hpp"

namespace tomo_viewer::services {

/**
 * @brief Number of valid indices for an axis-aligned slice kind
 *
 * Z for XY slices, Y for XZ slices, 0 for Oblique.
 */
[[nodiscard]] int sliceCount(const core::VolumeShape& shape, SliceKind kind) noexcept;

/**
 * @brief Clamp an axis-aligned slice index into [0, sliceCount - 1]
 */
[[nodiscard]] int clampSliceIndex(const core::VolumeShape& shape, SliceKind kind,
                                  int index) noexcept;

/**
 * @brief Extract and window an axis-aligned slice
 *
 * XY slices are Y rows × X columns; XZ slices are Z rows × X columns. The
 * index is clamped first, so any integer is accepted.
 *
 * @pre kind is XY or XZ and the volume is not empty
 */
[[nodiscard]] Raster renderAxisSlice(const core::VolumeSource& volume, SliceKind kind,
                                     int index, const ContrastRange& range);

}  // namespace tomo_viewer::services
