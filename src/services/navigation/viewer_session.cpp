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

#include "services/navigation/viewer_session.hpp"
#include "services/oblique/oblique_plane_resampler.hpp"
#include "services/slice/axis_slice_renderer.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <format>
#include <unordered_map>
#include <utility>

namespace tomo_viewer::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("ViewerSession");
    return logger;
}

GeometryError noVolumeError(const char* operation) {
    return GeometryError{GeometryError::Code::NoVolume, operation};
}

int clampAxis(int value, std::size_t dim) {
    return std::clamp(value, 0, std::max(0, static_cast<int>(dim) - 1));
}

core::ViewerConfig checkedConfig(core::ViewerConfig config) {
    if (auto valid = core::validate(config); !valid) {
        getLogger()->error("Invalid viewer config, using defaults: {}",
                           valid.error().toString());
        return core::ViewerConfig{};
    }
    return config;
}
}

class ViewerSession::Impl {
public:
    Impl(core::ViewerConfig cfg, core::VolumeOpener volumeOpener)
        : config(std::move(cfg))
        , opener(std::move(volumeOpener))
        , resampler(config.plane.lateralWidth)
        , prefetcher(std::make_unique<MetadataPrefetcher>(
              opener,
              SamplingParameters{config.sampling.bins, config.sampling.maxVoxels},
              static_cast<std::size_t>(config.prefetch.workerCount))) {}

    struct VolumeSlot {
        core::VolumeHandle volume;
        SliceCache cache;
    };

    [[nodiscard]] bool inRange(int index) const noexcept {
        return index >= 0 && index < static_cast<int>(files.size());
    }

    VolumeSlot* activeSlot() {
        auto it = slots.find(activeIndex);
        return it == slots.end() ? nullptr : &it->second;
    }

    const VolumeSlot* activeSlot() const {
        auto it = slots.find(activeIndex);
        return it == slots.end() ? nullptr : &it->second;
    }

    VolumeSlot& adoptSlot(int index, core::VolumeHandle volume) {
        auto [it, inserted] = slots.try_emplace(
            index, VolumeSlot{std::move(volume),
                              SliceCache(static_cast<std::size_t>(config.cache.capacity))});
        return it->second;
    }

    std::expected<VolumeSlot*, core::VolumeError> openSlot(int index) {
        if (auto it = slots.find(index); it != slots.end()) {
            return &it->second;
        }
        auto opened = opener(files[index]);
        if (!opened) {
            getLogger()->error("Failed to open {}: {}", files[index].string(),
                               opened.error().toString());
            return std::unexpected(opened.error());
        }
        return &adoptSlot(index, *opened);
    }

    void dropOutsideWindow() {
        std::erase_if(slots, [this](const auto& entry) {
            return std::abs(entry.first - activeIndex) > 1;
        });
    }

    ContrastRange contrastForActive(const core::VolumeSource& volume) {
        if (persistedContrast) {
            return *persistedContrast;
        }
        auto metadata = prefetcher->ensureMetadata(activeIndex);
        if (!metadata) {
            getLogger()->warn("Recomputing metadata of {}: {}", volume.name(),
                              metadata.error().toString());
            return defaultContrast(prefetcher->computeNow(activeIndex, volume).stats);
        }
        return defaultContrast(metadata->stats);
    }

    void installActive(VolumeSlot& slot, const ContrastRange& range) {
        const core::VolumeShape shape = slot.volume->shape();
        contrast = range;
        cursor = SliceCursor{static_cast<int>(shape.x / 2),
                             static_cast<int>(shape.y / 2),
                             static_cast<int>(shape.z / 2)};

        resampler.clearPlane();
        mapper.clearPlane();
        mapper.setVolumeShape(shape);
        mapper.setCursor(Point3D(cursor.x, cursor.y, cursor.z));

        slot.cache.ensureContrast(contrast);
        dropOutsideWindow();
        prefetchNeighbors();
    }

    void prefetchNeighbors() {
        if (!config.prefetch.neighbors) {
            return;
        }
        for (int index : {activeIndex - 1, activeIndex + 1}) {
            if (!inRange(index)) {
                continue;
            }

            PrefetchRequest request;
            request.fileIndex = index;
            request.path = files[index];
            if (persistedContrast) {
                request.contrast = persistedContrast;
            } else if (prefetcher->isReady(index)) {
                if (auto metadata = prefetcher->ensureMetadata(index)) {
                    request.contrast = defaultContrast(metadata->stats);
                }
            }

            if (auto it = slots.find(index); it != slots.end()) {
                const VolumeSlot& slot = it->second;
                const core::VolumeShape shape = slot.volume->shape();
                const bool warm = request.contrast &&
                                  slot.cache.bakedContrast() == request.contrast &&
                                  slot.cache.contains(SliceKey::axis(
                                      SliceKind::XY, static_cast<int>(shape.z / 2)));
                if (warm) {
                    continue;
                }
                request.volume = slot.volume;
            }
            prefetcher->prefetchNeighbor(std::move(request));
        }
    }

    template <typename RenderFn>
    std::expected<Raster, GeometryError> cachedRender(VolumeSlot& slot, const SliceKey& key,
                                                      RenderFn&& render) {
        slot.cache.ensureContrast(contrast);
        if (const Raster* cached = slot.cache.get(key)) {
            return *cached;
        }
        std::expected<Raster, GeometryError> rendered = render();
        if (!rendered) {
            return rendered;
        }
        return slot.cache.put(key, std::move(*rendered));
    }

    core::ViewerConfig config;
    core::VolumeOpener opener;

    std::vector<std::filesystem::path> files;
    int activeIndex = -1;
    std::unordered_map<int, VolumeSlot> slots;

    ContrastRange contrast;
    std::optional<ContrastRange> persistedContrast;
    SliceCursor cursor;

    ObliquePlaneResampler resampler;
    coordinate::PlaneCoordinateMapper mapper;
    std::unique_ptr<MetadataPrefetcher> prefetcher;
};

ViewerSession::ViewerSession(core::ViewerConfig config, core::VolumeOpener opener)
    : impl_(std::make_unique<Impl>(checkedConfig(std::move(config)), std::move(opener))) {}

std::expected<ViewerSession, core::ConfigError>
ViewerSession::create(core::ViewerConfig config, core::VolumeOpener opener) {
    if (auto valid = core::validate(config); !valid) {
        return std::unexpected(valid.error());
    }
    logging::LoggerFactory::configure(config.logging);
    return ViewerSession(std::move(config), std::move(opener));
}

ViewerSession::~ViewerSession() = default;

ViewerSession::ViewerSession(ViewerSession&&) noexcept = default;
ViewerSession& ViewerSession::operator=(ViewerSession&&) noexcept = default;

// ==================== Files ====================

std::expected<void, core::VolumeError>
ViewerSession::open(std::vector<std::filesystem::path> files, int activeIndex) {
    close();
    if (files.empty()) {
        return std::unexpected(core::VolumeError{
            core::VolumeError::Code::FileNotFound, "no volume files to open"});
    }

    impl_->files = std::move(files);
    const int active = std::clamp(activeIndex, 0, fileCount() - 1);

    auto slot = impl_->openSlot(active);
    if (!slot) {
        impl_->files.clear();
        return std::unexpected(slot.error());
    }
    impl_->activeIndex = active;

    VolumeMetadata metadata = impl_->prefetcher->computeNow(active, *(*slot)->volume);
    for (int i = 0; i < fileCount(); ++i) {
        if (i != active) {
            impl_->prefetcher->submit(i, impl_->files[i]);
        }
    }

    const ContrastRange range = impl_->persistedContrast
        ? *impl_->persistedContrast
        : defaultContrast(metadata.stats);
    impl_->installActive(**slot, range);

    getLogger()->info("Session opened with {} file(s), active {} ({}), contrast [{:.3f}, {:.3f}]",
                      fileCount(), active, impl_->files[active].filename().string(),
                      range.min, range.max);
    return {};
}

std::expected<void, core::VolumeError> ViewerSession::activate(int index) {
    if (!isOpen()) {
        return std::unexpected(core::VolumeError{
            core::VolumeError::Code::FileNotFound, "session has no files"});
    }
    if (!impl_->inRange(index)) {
        return std::unexpected(core::VolumeError{
            core::VolumeError::Code::FileNotFound,
            std::format("file index {} outside [0, {})", index, fileCount())});
    }
    if (index == impl_->activeIndex) {
        return {};
    }

    auto slot = impl_->openSlot(index);
    if (!slot) {
        return std::unexpected(slot.error());
    }

    const int previous = impl_->activeIndex;
    impl_->activeIndex = index;
    const ContrastRange range = impl_->contrastForActive(*(*slot)->volume);
    impl_->installActive(**slot, range);

    getLogger()->info("Activated file {} ({}) after {}", index,
                      impl_->files[index].filename().string(), previous);
    return {};
}

std::expected<bool, core::VolumeError> ViewerSession::nextFile() {
    if (!isOpen() || impl_->activeIndex + 1 >= fileCount()) {
        return false;
    }
    return activate(impl_->activeIndex + 1).transform([]() { return true; });
}

std::expected<bool, core::VolumeError> ViewerSession::previousFile() {
    if (!isOpen() || impl_->activeIndex <= 0) {
        return false;
    }
    return activate(impl_->activeIndex - 1).transform([]() { return true; });
}

void ViewerSession::close() {
    impl_->prefetcher->reset();
    impl_->slots.clear();
    impl_->files.clear();
    impl_->activeIndex = -1;
    impl_->resampler.clearPlane();
    impl_->mapper.clearPlane();
    impl_->cursor = SliceCursor{};
}

bool ViewerSession::isOpen() const noexcept {
    return impl_->activeIndex >= 0;
}

int ViewerSession::activeIndex() const noexcept {
    return impl_->activeIndex;
}

int ViewerSession::fileCount() const noexcept {
    return static_cast<int>(impl_->files.size());
}

const std::vector<std::filesystem::path>& ViewerSession::files() const noexcept {
    return impl_->files;
}

core::VolumeHandle ViewerSession::activeVolume() const {
    const auto* slot = impl_->activeSlot();
    return slot ? slot->volume : nullptr;
}

core::VolumeShape ViewerSession::shape() const {
    const auto* slot = impl_->activeSlot();
    return slot ? slot->volume->shape() : core::VolumeShape{};
}

bool ViewerSession::isResident(int fileIndex) const {
    return impl_->slots.contains(fileIndex);
}

// ==================== Cursor ====================

SliceCursor ViewerSession::cursor() const noexcept {
    return impl_->cursor;
}

SliceCursor ViewerSession::setCursor(int x, int y, int z) {
    const core::VolumeShape s = shape();
    impl_->cursor = SliceCursor{clampAxis(x, s.x), clampAxis(y, s.y), clampAxis(z, s.z)};
    impl_->mapper.setCursor(Point3D(impl_->cursor.x, impl_->cursor.y, impl_->cursor.z));
    return impl_->cursor;
}

int ViewerSession::stepZ(int step) {
    const SliceCursor& c = impl_->cursor;
    return setCursor(c.x, c.y, c.z + step).z;
}

// ==================== Contrast ====================

ContrastRange ViewerSession::contrast() const noexcept {
    return impl_->contrast;
}

ContrastRange ViewerSession::setContrast(double min, double max) {
    ContrastRange range = ContrastRange::repaired(min, max);
    const bool usable = std::isfinite(min) && std::isfinite(max) && max > min;
    if (!usable && isOpen()) {
        // An inverted or collapsed request falls back into the sample extent
        if (auto hist = histogram()) {
            range = ContrastRange{min, max}.clampedTo(hist->lowerBound(), hist->upperBound());
            if (!range.isValid()) {
                range = ContrastRange::repaired(hist->lowerBound(), hist->upperBound());
            }
        }
    }

    impl_->contrast = range;
    impl_->persistedContrast = range;
    if (auto* slot = impl_->activeSlot()) {
        slot->cache.ensureContrast(range);
    }

    getLogger()->debug("Contrast set to [{:.3f}, {:.3f}] (requested [{:.3f}, {:.3f}])",
                       range.min, range.max, min, max);
    return range;
}

bool ViewerSession::hasPersistedContrast() const noexcept {
    return impl_->persistedContrast.has_value();
}

// ==================== Metadata ====================

std::expected<VolumeMetadata, core::VolumeError> ViewerSession::metadata() {
    if (!isOpen()) {
        return std::unexpected(core::VolumeError{
            core::VolumeError::Code::ReadFailed, "session has no active volume"});
    }
    return impl_->prefetcher->ensureMetadata(impl_->activeIndex);
}

std::expected<HistogramData, core::VolumeError> ViewerSession::histogram() {
    return metadata().transform([](const VolumeMetadata& m) { return m.histogram; });
}

std::expected<VolumeStats, core::VolumeError> ViewerSession::stats() {
    return metadata().transform([](const VolumeMetadata& m) { return m.stats; });
}

// ==================== Slices ====================

std::expected<Raster, GeometryError> ViewerSession::renderSlice(SliceKind kind, int index) {
    if (kind == SliceKind::Oblique) {
        return renderPlane();
    }
    auto* slot = impl_->activeSlot();
    if (!slot) {
        return std::unexpected(noVolumeError("renderSlice"));
    }

    const core::VolumeSource& volume = *slot->volume;
    const int clamped = clampSliceIndex(volume.shape(), kind, index);
    return impl_->cachedRender(*slot, SliceKey::axis(kind, clamped),
                               [&]() -> std::expected<Raster, GeometryError> {
        return renderAxisSlice(volume, kind, clamped, impl_->contrast);
    });
}

SliceCacheStatus ViewerSession::cacheStatus() const {
    const auto* slot = impl_->activeSlot();
    return slot ? slot->cache.status() : SliceCacheStatus{};
}

// ==================== Oblique plane ====================

std::expected<std::uint64_t, GeometryError>
ViewerSession::definePlane(const Point3D& p1, const Point3D& p2) {
    if (!isOpen()) {
        return std::unexpected(noVolumeError("definePlane"));
    }
    auto version = impl_->resampler.definePlane(p1, p2, impl_->cursor.z);
    if (version) {
        impl_->mapper.setPlane(*impl_->resampler.currentFrame());
    }
    return version;
}

std::expected<std::uint64_t, GeometryError> ViewerSession::updatePlaneForZ(double z) {
    auto version = impl_->resampler.updatePlaneForZ(z);
    if (version) {
        impl_->mapper.setPlane(*impl_->resampler.currentFrame());
    }
    return version;
}

std::expected<Raster, GeometryError> ViewerSession::renderPlane() {
    auto* slot = impl_->activeSlot();
    if (!slot) {
        return std::unexpected(noVolumeError("renderPlane"));
    }
    if (!impl_->resampler.hasPlane()) {
        return std::unexpected(GeometryError{GeometryError::Code::NoPlane, "renderPlane"});
    }

    const core::VolumeSource& volume = *slot->volume;
    return impl_->cachedRender(*slot, SliceKey::oblique(impl_->resampler.planeVersion()),
                               [&]() { return impl_->resampler.render(volume, impl_->contrast); });
}

void ViewerSession::clearPlane() {
    impl_->resampler.clearPlane();
    impl_->mapper.clearPlane();
}

std::optional<PlaneFrame> ViewerSession::planeFrame() const {
    return impl_->resampler.currentFrame();
}

// ==================== Prefetch ====================

std::size_t ViewerSession::pumpPrefetched() {
    if (!isOpen()) {
        return 0;
    }

    std::size_t inserted = 0;
    for (auto& result : impl_->prefetcher->drainPrefetched(impl_->activeIndex)) {
        // The active file may have been reached before its prefetch finished
        if (result.fileIndex == impl_->activeIndex && result.contrast != impl_->contrast) {
            continue;
        }

        auto& slot = impl_->adoptSlot(result.fileIndex, result.volume);
        slot.cache.ensureContrast(result.contrast);
        if (!slot.cache.contains(result.key)) {
            slot.cache.put(result.key, std::move(result.raster));
            ++inserted;
        }
    }

    if (inserted > 0) {
        getLogger()->debug("Inserted {} prefetched raster(s)", inserted);
    }
    return inserted;
}

void ViewerSession::waitForBackground() {
    impl_->prefetcher->waitIdle();
}

// ==================== Coordinates ====================

const coordinate::PlaneCoordinateMapper& ViewerSession::mapper() const {
    return impl_->mapper;
}

const core::ViewerConfig& ViewerSession::config() const noexcept {
    return impl_->config;
}

}  // namespace tomo_viewer::services
