#include "services/navigation/worker_pool.hpp"
#include "core/logging.hpp"

#include <QThreadPool>

#include <algorithm>
#include <atomic>
#include <limits>

namespace tomo_viewer::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("WorkerPool");
    return logger;
}
}

class WorkerPool::Impl {
public:
    explicit Impl(std::size_t count)
        : threads(static_cast<int>(std::clamp<std::size_t>(
              count, 1, static_cast<std::size_t>(std::numeric_limits<int>::max())))) {
        pool.setMaxThreadCount(threads);
        getLogger()->debug("Thread pool capped at {} worker(s)", threads);
    }

    ~Impl() {
        // Runnables removed here are deleted unrun, breaking their promises
        pool.clear();
        const std::size_t discarded = pending.load();
        pool.waitForDone();
        if (discarded > 0) {
            getLogger()->debug("Discarded {} pending task(s) on shutdown", discarded);
        }
    }

    QThreadPool pool;
    int threads;
    std::atomic<std::size_t> pending{0};
};

WorkerPool::WorkerPool(std::size_t workerCount)
    : impl_(std::make_unique<Impl>(workerCount)) {}

WorkerPool::~WorkerPool() = default;

std::size_t WorkerPool::workerCount() const noexcept {
    return static_cast<std::size_t>(impl_->threads);
}

std::size_t WorkerPool::pendingCount() const {
    return impl_->pending.load();
}

void WorkerPool::enqueue(std::function<void()> job) {
    ++impl_->pending;
    impl_->pool.start([impl = impl_.get(), job = std::move(job)]() {
        --impl->pending;
        // Packaged tasks store their own exceptions in the future
        job();
    });
}

}  // namespace tomo_viewer::services
