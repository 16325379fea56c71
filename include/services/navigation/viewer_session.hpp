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
 * @file viewer_session.hpp
 * @brief Interactive browsing session over a list of tomogram files
 * @details ViewerSession is the single owner of everything that changes while
 *          a user browses: the file list and active index, the open volumes
 *          and their slice caches (active file and its ±1 neighbors only),
 *          the cursor, the contrast window that persists across file
 *          switches, the oblique plane and the background prefetcher.
 *
 *          All methods are plain synchronous calls meant for the interactive
 *          thread. Background results become visible only through
 *          histogram()/stats() (which may wait for them) and pumpPrefetched().
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/viewer_config.hpp"
#include "core/volume_io.hpp"
#include "services/contrast/contrast_window.hpp"
#include "services/coordinate/plane_coordinate_mapper.hpp"
#include "services/navigation/metadata_prefetcher.hpp"
#include "services/oblique/plane_frame.hpp"
#include "services/slice/slice_cache.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace tomo_viewer::services {

/**
 * @brief Integer cursor position in volume space
 */
struct SliceCursor {
    int x = 0;
    int y = 0;
    int z = 0;

    [[nodiscard]] bool operator==(const SliceCursor& other) const noexcept = default;
};

/**
 * @brief Browsing session over a list of volume files
 *
 * Lifetime: created when the viewer starts, destroyed when it closes. Open
 * volumes are released as soon as they leave the ±1 window around the
 * active file, or when the session is closed or destroyed.
 */
class ViewerSession {
public:
    /**
     * @brief Construct a session
     *
     * An invalid config is logged and replaced by the defaults; use create()
     * to get the validation error instead.
     */
    explicit ViewerSession(core::ViewerConfig config = {},
                           core::VolumeOpener opener = core::openVolume);

    /**
     * @brief Validate a config, apply its logging section and build a session
     * @return The session, or ConfigError::Code::InvalidValue
     */
    [[nodiscard]] static std::expected<ViewerSession, core::ConfigError>
    create(core::ViewerConfig config, core::VolumeOpener opener = core::openVolume);

    ~ViewerSession();

    // Non-copyable, movable
    ViewerSession(const ViewerSession&) = delete;
    ViewerSession& operator=(const ViewerSession&) = delete;
    ViewerSession(ViewerSession&&) noexcept;
    ViewerSession& operator=(ViewerSession&&) noexcept;

    // ==================== Files ====================

    /**
     * @brief Start browsing @p files with @p activeIndex active
     *
     * Opens the active file and computes its metadata on the calling thread,
     * then schedules metadata for every other file in the background.
     * On failure the session is left closed.
     */
    std::expected<void, core::VolumeError>
    open(std::vector<std::filesystem::path> files, int activeIndex = 0);

    /**
     * @brief Make another file of the list active
     *
     * The cursor moves to the volume center and any oblique plane is
     * cleared. On failure the previously active file stays active.
     */
    std::expected<void, core::VolumeError> activate(int index);

    /// Activate the next file; false (no change) at the end of the list
    std::expected<bool, core::VolumeError> nextFile();

    /// Activate the previous file; false (no change) at the start of the list
    std::expected<bool, core::VolumeError> previousFile();

    /// Release all volumes, caches and pending results
    void close();

    [[nodiscard]] bool isOpen() const noexcept;
    [[nodiscard]] int activeIndex() const noexcept;
    [[nodiscard]] int fileCount() const noexcept;
    [[nodiscard]] const std::vector<std::filesystem::path>& files() const noexcept;
    [[nodiscard]] core::VolumeHandle activeVolume() const;
    [[nodiscard]] core::VolumeShape shape() const;

    /// True when a volume (and its cache) is currently held for @p fileIndex
    [[nodiscard]] bool isResident(int fileIndex) const;

    // ==================== Cursor ====================

    [[nodiscard]] SliceCursor cursor() const noexcept;

    /// Move the cursor; each coordinate is clamped to the volume
    SliceCursor setCursor(int x, int y, int z);

    /// Move the cursor along Z by @p step (clamped); returns the new z
    int stepZ(int step);

    // ==================== Contrast ====================

    [[nodiscard]] ContrastRange contrast() const noexcept;

    /**
     * @brief Apply a user contrast adjustment
     *
     * A valid pair is applied as given. An inverted or collapsed pair is
     * clipped into the histogram extent of the active file, falling back to
     * the whole extent. The result is kept for later file switches and
     * invalidates the active file's cached rasters.
     *
     * @return The range actually applied
     */
    ContrastRange setContrast(double min, double max);

    /// True once the user has adjusted contrast in this session
    [[nodiscard]] bool hasPersistedContrast() const noexcept;

    // ==================== Metadata ====================

    [[nodiscard]] std::expected<VolumeMetadata, core::VolumeError> metadata();
    [[nodiscard]] std::expected<HistogramData, core::VolumeError> histogram();
    [[nodiscard]] std::expected<VolumeStats, core::VolumeError> stats();

    // ==================== Slices ====================

    /**
     * @brief Raster of an axis-aligned slice of the active file
     *
     * Served from the cache when present. Indices are clamped. Oblique
     * requests are forwarded to renderPlane().
     */
    [[nodiscard]] std::expected<Raster, GeometryError> renderSlice(SliceKind kind, int index);

    [[nodiscard]] SliceCacheStatus cacheStatus() const;

    // ==================== Oblique plane ====================

    /**
     * @brief Define the oblique plane from two picks at the current depth
     *
     * A degenerate pair leaves the previous plane in place.
     */
    std::expected<std::uint64_t, GeometryError> definePlane(const Point3D& p1, const Point3D& p2);

    /// Re-anchor the plane to depth @p z (relative to the depth it was picked at)
    std::expected<std::uint64_t, GeometryError> updatePlaneForZ(double z);

    [[nodiscard]] std::expected<Raster, GeometryError> renderPlane();

    void clearPlane();

    [[nodiscard]] std::optional<PlaneFrame> planeFrame() const;

    // ==================== Prefetch ====================

    /**
     * @brief Move finished neighbor slices into their caches
     * @return Number of rasters inserted
     */
    std::size_t pumpPrefetched();

    /// Block until queued background work is finished
    void waitForBackground();

    // ==================== Coordinates ====================

    [[nodiscard]] const coordinate::PlaneCoordinateMapper& mapper() const;

    [[nodiscard]] const core::ViewerConfig& config() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tomo_viewer::services
