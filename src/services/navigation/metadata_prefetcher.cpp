#include "services/navigation/metadata_prefetcher.hpp"
#include "services/navigation/worker_pool.hpp"
#include "services/slice/axis_slice_renderer.hpp"
#include "core/logging.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <deque>
#include <format>
#include <future>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace tomo_viewer::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("MetadataPrefetcher");
    return logger;
}

using MetadataResult = std::expected<VolumeMetadata, core::VolumeError>;
}

VolumeMetadata computeMetadata(const core::VolumeSource& volume,
                               const SamplingParameters& params) {
    VolumeMetadata metadata;
    metadata.stats = estimateStats(volume, params.maxVoxels);
    metadata.histogram = sampleHistogram(volume, params.bins, params.maxVoxels);
    return metadata;
}

class MetadataPrefetcher::Impl {
public:
    Impl(core::VolumeOpener opener_, SamplingParameters params_, std::size_t workers)
        : opener(std::move(opener_)), params(params_), pool(workers) {}

    struct QueuedSlice {
        std::uint64_t generation = 0;
        PrefetchedSlice slice;
    };

    void publish(std::uint64_t gen, PrefetchedSlice slice) {
        std::lock_guard lock(resultsMutex);
        results.push_back(QueuedSlice{gen, std::move(slice)});
    }

    void renderNeighbor(std::uint64_t gen, const PrefetchRequest& request) {
        core::VolumeHandle volume = request.volume;
        if (!volume) {
            auto opened = opener(request.path);
            if (!opened) {
                getLogger()->error("Prefetch of file {} ({}) failed: {}",
                                   request.fileIndex, request.path.string(),
                                   opened.error().toString());
                return;
            }
            volume = *opened;
        }

        const core::VolumeShape shape = volume->shape();
        if (shape.isEmpty()) {
            getLogger()->warn("Prefetch skipped for empty volume {}", volume->name());
            return;
        }

        const ContrastRange contrast = request.contrast
            ? *request.contrast
            : defaultContrast(estimateStats(*volume, params.maxVoxels));

        const int centerZ = static_cast<int>(shape.z / 2);
        const int centerY = static_cast<int>(shape.y / 2);

        publish(gen, PrefetchedSlice{
            request.fileIndex, SliceKey::axis(SliceKind::XY, centerZ), contrast,
            renderAxisSlice(*volume, SliceKind::XY, centerZ, contrast), volume});
        publish(gen, PrefetchedSlice{
            request.fileIndex, SliceKey::axis(SliceKind::XZ, centerY), contrast,
            renderAxisSlice(*volume, SliceKind::XZ, centerY, contrast), volume});

        getLogger()->debug("Prefetched center slices of file {} (z={}, y={})",
                           request.fileIndex, centerZ, centerY);
    }

    core::VolumeOpener opener;
    SamplingParameters params;
    std::atomic<std::uint64_t> generation{0};

    mutable std::mutex metadataMutex;
    std::unordered_map<int, std::shared_future<MetadataResult>> metadata;

    std::mutex resultsMutex;
    std::deque<QueuedSlice> results;

    // Touched by the interactive thread only
    std::vector<std::future<void>> prefetchTasks;

    // Declared last: joined before the state its tasks publish to is destroyed
    WorkerPool pool;
};

MetadataPrefetcher::MetadataPrefetcher(core::VolumeOpener opener,
                                       SamplingParameters params,
                                       std::size_t workerCount)
    : impl_(std::make_unique<Impl>(std::move(opener), params, workerCount)) {}

MetadataPrefetcher::~MetadataPrefetcher() = default;

void MetadataPrefetcher::reset() {
    ++impl_->generation;
    {
        std::lock_guard lock(impl_->metadataMutex);
        impl_->metadata.clear();
    }
    {
        std::lock_guard lock(impl_->resultsMutex);
        impl_->results.clear();
    }
}

// ==================== Metadata ====================

VolumeMetadata MetadataPrefetcher::computeNow(int fileIndex, const core::VolumeSource& volume) {
    VolumeMetadata metadata = computeMetadata(volume, impl_->params);

    std::promise<MetadataResult> promise;
    promise.set_value(metadata);
    {
        std::lock_guard lock(impl_->metadataMutex);
        impl_->metadata.insert_or_assign(fileIndex, promise.get_future().share());
    }

    getLogger()->info("Metadata of {} computed: min={:.3f} max={:.3f} mean={:.3f}",
                      volume.name(), metadata.stats.min, metadata.stats.max,
                      metadata.stats.mean);
    return metadata;
}

void MetadataPrefetcher::submit(int fileIndex, const std::filesystem::path& path) {
    std::lock_guard lock(impl_->metadataMutex);
    if (impl_->metadata.contains(fileIndex)) {
        return;
    }

    auto future = impl_->pool.submit(
        [opener = impl_->opener, params = impl_->params, fileIndex, path]() -> MetadataResult {
            auto opened = opener(path);
            if (!opened) {
                getLogger()->error("Metadata of file {} ({}) unavailable: {}",
                                   fileIndex, path.string(), opened.error().toString());
                return std::unexpected(opened.error());
            }
            VolumeMetadata metadata = computeMetadata(**opened, params);
            getLogger()->debug("Background metadata of file {} ready", fileIndex);
            return metadata;
        });
    impl_->metadata.emplace(fileIndex, future.share());
}

std::expected<VolumeMetadata, core::VolumeError> MetadataPrefetcher::ensureMetadata(int fileIndex) {
    std::shared_future<MetadataResult> future;
    {
        std::lock_guard lock(impl_->metadataMutex);
        auto it = impl_->metadata.find(fileIndex);
        if (it == impl_->metadata.end()) {
            return std::unexpected(core::VolumeError{
                core::VolumeError::Code::ReadFailed,
                std::format("no metadata scheduled for file {}", fileIndex)});
        }
        future = it->second;
    }

    if (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        getLogger()->debug("Waiting for metadata of file {}", fileIndex);
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        getLogger()->error("Metadata computation for file {} failed: {}", fileIndex, e.what());
        return std::unexpected(core::VolumeError{core::VolumeError::Code::ReadFailed, e.what()});
    }
}

bool MetadataPrefetcher::isReady(int fileIndex) const {
    std::lock_guard lock(impl_->metadataMutex);
    auto it = impl_->metadata.find(fileIndex);
    return it != impl_->metadata.end() &&
           it->second.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

bool MetadataPrefetcher::isScheduled(int fileIndex) const {
    std::lock_guard lock(impl_->metadataMutex);
    return impl_->metadata.contains(fileIndex);
}

// ==================== Neighbor prefetch ====================

void MetadataPrefetcher::prefetchNeighbor(PrefetchRequest request) {
    const std::uint64_t gen = impl_->generation.load();
    Impl* impl = impl_.get();

    impl_->prefetchTasks.push_back(impl_->pool.submit(
        [impl, gen, request = std::move(request)]() {
            try {
                impl->renderNeighbor(gen, request);
            } catch (const std::exception& e) {
                getLogger()->error("Prefetch of file {} failed: {}", request.fileIndex, e.what());
            }
        }));

    std::erase_if(impl_->prefetchTasks, [](const std::future<void>& task) {
        return task.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    });
}

std::vector<PrefetchedSlice> MetadataPrefetcher::drainPrefetched(int activeIndex) {
    std::deque<Impl::QueuedSlice> drained;
    {
        std::lock_guard lock(impl_->resultsMutex);
        drained.swap(impl_->results);
    }

    const std::uint64_t gen = impl_->generation.load();
    std::vector<PrefetchedSlice> accepted;
    std::size_t discarded = 0;
    for (auto& queued : drained) {
        if (queued.generation != gen || std::abs(queued.slice.fileIndex - activeIndex) > 1) {
            ++discarded;
            continue;
        }
        accepted.push_back(std::move(queued.slice));
    }
    if (discarded > 0) {
        getLogger()->debug("Discarded {} prefetched slice(s) outside the window of file {}",
                           discarded, activeIndex);
    }
    return accepted;
}

void MetadataPrefetcher::waitIdle() {
    for (auto& task : impl_->prefetchTasks) {
        task.wait();
    }
    impl_->prefetchTasks.clear();

    std::vector<std::shared_future<MetadataResult>> pending;
    {
        std::lock_guard lock(impl_->metadataMutex);
        for (const auto& [index, future] : impl_->metadata) {
            pending.push_back(future);
        }
    }
    for (const auto& future : pending) {
        future.wait();
    }
}

const SamplingParameters& MetadataPrefetcher::samplingParameters() const noexcept {
    return impl_->params;
}

}  // namespace tomo_viewer::services
