#include "services/navigation/scroll_accelerator.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace tomo_viewer::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("ScrollAccelerator");
    return logger;
}

constexpr double kUnitsPerNotch = 120.0;
}

ScrollAccelerator::ScrollAccelerator(core::ScrollSettings settings)
    : settings_(settings) {}

int ScrollAccelerator::step(int angleDelta, Clock::time_point now) {
    if (angleDelta == 0) {
        return 0;
    }

    bool inStreak = false;
    if (lastEvent_) {
        const std::chrono::duration<double> gap = now - *lastEvent_;
        inStreak = gap.count() < settings_.streakThresholdSec;
    }
    lastEvent_ = now;

    streak_ = inStreak ? std::min(streak_ + 1, settings_.maxStreak) : 0;

    const double ticks = std::abs(angleDelta) / kUnitsPerNotch;
    const double gain = 1.0 + streak_ * settings_.streakMultiplier;
    const int magnitude = std::max(
        1, static_cast<int>(std::lround(settings_.baseStep * ticks * gain)));
    const int result = angleDelta > 0 ? magnitude : -magnitude;

    getLogger()->trace("Wheel delta={} streak={} gain={:.2f} -> step={}",
                       angleDelta, streak_, gain, result);
    return result;
}

void ScrollAccelerator::reset() noexcept {
    lastEvent_.reset();
    streak_ = 0;
}

}  // namespace tomo_viewer::services
