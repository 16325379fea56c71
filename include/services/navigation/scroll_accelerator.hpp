#pragma once

#include "core/viewer_config.hpp"

#include <chrono>
#include <optional>

namespace tomo_viewer::services {

/**
 * @brief Converts mouse wheel deltas into slice steps with streak acceleration
 *
 * Events closer together than the streak threshold grow a streak counter
 * (capped at maxStreak); a slower event resets it. The step magnitude is
 * max(1, round(baseStep * |delta| / 120 * (1 + streak * streakMultiplier)))
 * with the sign of the delta. One notch of a standard wheel is 120 units;
 * high-resolution wheels report fractions of that.
 */
class ScrollAccelerator {
public:
    using Clock = std::chrono::steady_clock;

    explicit ScrollAccelerator(core::ScrollSettings settings = {});

    /**
     * @brief Step for one wheel event
     * @param angleDelta Vertical wheel delta in eighths of a degree
     * @param now Event time
     * @return Signed slice step; 0 for a zero delta (streak untouched)
     */
    int step(int angleDelta, Clock::time_point now);

    /// Step for an event happening now
    int step(int angleDelta) { return step(angleDelta, Clock::now()); }

    [[nodiscard]] int streak() const noexcept { return streak_; }

    void reset() noexcept;

    [[nodiscard]] const core::ScrollSettings& settings() const noexcept { return settings_; }

private:
    core::ScrollSettings settings_;
    std::optional<Clock::time_point> lastEvent_;
    int streak_ = 0;
};

}  // namespace tomo_viewer::services
