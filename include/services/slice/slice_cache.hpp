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
 * @file slice_cache.hpp
 * @brief Fixed-capacity LRU cache of contrast-baked slice rasters
 * @details One SliceCache exists per open volume. Entries are keyed by
 *          SliceKey (axis-aligned index or oblique plane version). Because
 *          rasters are windowed at insertion time, the cache remembers the
 *          ContrastRange its contents were baked with and is cleared as a
 *          whole when that range changes; there is no partial invalidation.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "services/contrast/contrast_window.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <optional>
#include <unordered_map>

namespace tomo_viewer::services {

/**
 * @brief Kind of cross-section a raster shows
 */
enum class SliceKind {
    XY,       ///< Perpendicular to Z at a fixed z index
    XZ,       ///< Perpendicular to Y at a fixed y index
    Oblique   ///< Resampled oblique plane
};

/**
 * @brief Identity of a cached slice
 *
 * For XY/XZ the value is the slice index; for Oblique it is the plane
 * version, which changes on every plane (re)definition.
 */
struct SliceKey {
    SliceKind kind = SliceKind::XY;
    std::int64_t value = 0;

    [[nodiscard]] static SliceKey axis(SliceKind kind, int index) noexcept {
        return SliceKey{kind, index};
    }

    [[nodiscard]] static SliceKey oblique(std::uint64_t planeVersion) noexcept {
        return SliceKey{SliceKind::Oblique, static_cast<std::int64_t>(planeVersion)};
    }

    [[nodiscard]] bool operator==(const SliceKey& other) const noexcept = default;
};

struct SliceKeyHash {
    [[nodiscard]] std::size_t operator()(const SliceKey& key) const noexcept {
        return std::hash<std::int64_t>{}(key.value) * 31u +
               static_cast<std::size_t>(key.kind);
    }
};

/**
 * @brief Counters for monitoring cache behavior
 */
struct SliceCacheStatus {
    std::size_t size = 0;
    std::size_t capacity = 0;
    std::size_t hits = 0;
    std::size_t misses = 0;
    std::size_t evictions = 0;
};

/**
 * @brief Strict LRU cache of rasters
 *
 * Not thread-safe: owned and mutated by the interactive thread only.
 * Pointers returned by get() stay valid until the next put() or clear() on
 * the same cache; callers copy the raster if they need it longer.
 */
class SliceCache {
public:
    static constexpr std::size_t kDefaultCapacity = 128;

    /**
     * @brief Construct with a capacity (values below 1 become 1)
     */
    explicit SliceCache(std::size_t capacity = kDefaultCapacity);

    /**
     * @brief Look up a raster and mark it most recently used
     * @return Raster, or nullptr on a miss
     */
    [[nodiscard]] const Raster* get(const SliceKey& key);

    /**
     * @brief Insert or replace a raster at the most-recently-used end,
     *        then evict least-recently-used entries while over capacity
     * @return The stored raster
     */
    const Raster& put(const SliceKey& key, Raster raster);

    /// Drop every entry (counters are kept)
    void clear();

    /**
     * @brief Clear the cache unless its contents were baked with @p range
     * @return true if baked entries were dropped
     */
    bool ensureContrast(const ContrastRange& range);

    /// Contrast the current entries were rendered with, if any
    [[nodiscard]] std::optional<ContrastRange> bakedContrast() const noexcept;

    [[nodiscard]] bool contains(const SliceKey& key) const;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::size_t capacity() const noexcept;
    [[nodiscard]] SliceCacheStatus status() const noexcept;

private:
    struct Entry {
        Raster raster;
        std::list<SliceKey>::iterator order;
    };

    void evictIfNeeded();

    std::size_t capacity_;
    std::unordered_map<SliceKey, Entry, SliceKeyHash> entries_;
    std::list<SliceKey> accessOrder_;  // Front = most recent
    std::optional<ContrastRange> bakedContrast_;
    std::size_t hits_ = 0;
    std::size_t misses_ = 0;
    std::size_t evictions_ = 0;
};

}  // namespace tomo_viewer::services
