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

#include "services/slice/slice_cache.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <utility>

namespace tomo_viewer::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("SliceCache");
    return logger;
}
}

SliceCache::SliceCache(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

const Raster* SliceCache::get(const SliceKey& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        ++misses_;
        return nullptr;
    }
    ++hits_;
    accessOrder_.splice(accessOrder_.begin(), accessOrder_, it->second.order);
    return &it->second.raster;
}

const Raster& SliceCache::put(const SliceKey& key, Raster raster) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.raster = std::move(raster);
        accessOrder_.splice(accessOrder_.begin(), accessOrder_, it->second.order);
        return it->second.raster;
    }

    accessOrder_.push_front(key);
    auto [inserted, _] = entries_.emplace(
        key, Entry{std::move(raster), accessOrder_.begin()});
    evictIfNeeded();
    return inserted->second.raster;
}

void SliceCache::clear() {
    entries_.clear();
    accessOrder_.clear();
    bakedContrast_.reset();
}

bool SliceCache::ensureContrast(const ContrastRange& range) {
    if (bakedContrast_ && *bakedContrast_ == range) {
        return false;
    }
    const bool hadEntries = !entries_.empty();
    clear();
    bakedContrast_ = range;
    return hadEntries;
}

std::optional<ContrastRange> SliceCache::bakedContrast() const noexcept {
    return bakedContrast_;
}

bool SliceCache::contains(const SliceKey& key) const {
    return entries_.contains(key);
}

std::size_t SliceCache::size() const noexcept {
    return entries_.size();
}

std::size_t SliceCache::capacity() const noexcept {
    return capacity_;
}

SliceCacheStatus SliceCache::status() const noexcept {
    return SliceCacheStatus{entries_.size(), capacity_, hits_, misses_, evictions_};
}

void SliceCache::evictIfNeeded() {
    // The entry just inserted sits at the front and is never the victim
    while (entries_.size() > capacity_ && !accessOrder_.empty()) {
        const SliceKey oldest = accessOrder_.back();
        accessOrder_.pop_back();
        entries_.erase(oldest);
        ++evictions_;
        getLogger()->debug("Evicted slice kind={} value={}",
                           static_cast<int>(oldest.kind), oldest.value);
    }
}

}  // namespace tomo_viewer::services
