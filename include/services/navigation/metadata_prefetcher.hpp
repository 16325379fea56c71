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
 * @file metadata_prefetcher.hpp
 * @brief Background metadata computation and neighbor slice prefetching
 * @details Computes per-file statistics and histograms off the interactive
 *          thread, and renders the center XY/XZ slices of the files adjacent
 *          to the active one so switching files shows an image immediately.
 *          The interactive thread joins background work only through
 *          ensureMetadata() and collects prefetched rasters through
 *          drainPrefetched().
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/volume_io.hpp"
#include "services/contrast/contrast_window.hpp"
#include "services/contrast/histogram_sampler.hpp"
#include "services/contrast/stats_estimator.hpp"
#include "services/slice/slice_cache.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace tomo_viewer::services {

/**
 * @brief Statistics and histogram of one volume file
 */
struct VolumeMetadata {
    VolumeStats stats;
    HistogramData histogram;
};

/**
 * @brief Sampling parameters shared by stats and histogram computation
 */
struct SamplingParameters {
    int bins = kDefaultHistogramBins;
    std::size_t maxVoxels = kDefaultMaxVoxels;
};

/**
 * @brief Compute stats and histogram of a volume synchronously
 */
[[nodiscard]] VolumeMetadata computeMetadata(const core::VolumeSource& volume,
                                             const SamplingParameters& params);

/**
 * @brief Neighbor file whose center slices should be prefetched
 */
struct PrefetchRequest {
    int fileIndex = 0;
    std::filesystem::path path;

    /// Already open volume; opened on the worker when empty
    core::VolumeHandle volume;

    /// Contrast snapshotted at submission; derived from stats when empty
    std::optional<ContrastRange> contrast;
};

/**
 * @brief Center slice rendered in the background for a neighbor file
 */
struct PrefetchedSlice {
    int fileIndex = 0;
    SliceKey key;
    ContrastRange contrast;
    Raster raster;

    /// Volume the raster was rendered from, so the session can adopt it
    core::VolumeHandle volume;
};

/**
 * @brief Schedules metadata and neighbor-slice work on a worker pool
 *
 * Thread model: all public methods are called from the interactive thread.
 * Worker threads only compute; they publish through two mutex-guarded
 * structures, the metadata map and the prefetched-slice queue.
 *
 * reset() starts a new generation; results of older generations still in
 * flight are dropped when they arrive.
 */
class MetadataPrefetcher {
public:
    MetadataPrefetcher(core::VolumeOpener opener,
                       SamplingParameters params = {},
                       std::size_t workerCount = 2);
    ~MetadataPrefetcher();

    MetadataPrefetcher(const MetadataPrefetcher&) = delete;
    MetadataPrefetcher& operator=(const MetadataPrefetcher&) = delete;
    MetadataPrefetcher(MetadataPrefetcher&&) = delete;
    MetadataPrefetcher& operator=(MetadataPrefetcher&&) = delete;

    /**
     * @brief Forget all metadata and queued results (new file list)
     */
    void reset();

    // ==================== Metadata ====================

    /**
     * @brief Compute metadata for @p fileIndex on the calling thread
     */
    VolumeMetadata computeNow(int fileIndex, const core::VolumeSource& volume);

    /**
     * @brief Schedule metadata computation for a file on the worker pool
     *
     * No-op when the file already has metadata or a pending computation.
     */
    void submit(int fileIndex, const std::filesystem::path& path);

    /**
     * @brief Metadata of a file, waiting for its computation if needed
     *
     * Blocks only when the background computation has not finished yet.
     * @return Metadata, the open error of the file, or ReadFailed when
     *         nothing was scheduled for @p fileIndex
     */
    [[nodiscard]] std::expected<VolumeMetadata, core::VolumeError> ensureMetadata(int fileIndex);

    /// True when metadata is available without blocking
    [[nodiscard]] bool isReady(int fileIndex) const;

    /// True when metadata is available or pending
    [[nodiscard]] bool isScheduled(int fileIndex) const;

    // ==================== Neighbor prefetch ====================

    /**
     * @brief Render the center XY and XZ slices of a neighbor in the background
     *
     * Failures are logged and leave the neighbor without prefetched slices.
     */
    void prefetchNeighbor(PrefetchRequest request);

    /**
     * @brief Collect finished neighbor slices
     *
     * Results for files further than one step from @p activeIndex are
     * discarded.
     */
    [[nodiscard]] std::vector<PrefetchedSlice> drainPrefetched(int activeIndex);

    /// Wait until every task submitted so far has finished (tests, shutdown)
    void waitIdle();

    [[nodiscard]] const SamplingParameters& samplingParameters() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tomo_viewer::services
