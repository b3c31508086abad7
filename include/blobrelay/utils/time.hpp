#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>

namespace blobrelay::utils {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// Injectable time source; tests substitute a manual clock
using NowFn = std::function<TimePoint()>;

// Injectable sleep; tests substitute a recorder
using SleepFn = std::function<void(std::chrono::milliseconds)>;

inline void sleep_for(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

// Get current Unix timestamp in milliseconds (wall clock)
inline uint64_t unix_time_ms() {
    auto now = std::chrono::system_clock::now();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count());
}

// Milliseconds between two monotonic time points (zero if `to` precedes `from`)
inline uint64_t elapsed_ms(TimePoint from, TimePoint to) {
    if (to <= from) {
        return 0;
    }
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count());
}

// Manually advanced clock for deterministic tests
class ManualClock {
public:
    ManualClock() : now_(TimePoint{} + std::chrono::hours(1)) {}

    [[nodiscard]] TimePoint now() const { return now_; }

    void advance(std::chrono::milliseconds delta) { now_ += delta; }

    // Bind as a NowFn. The clock must outlive the returned function.
    [[nodiscard]] NowFn as_now_fn() {
        return [this]() { return now_; };
    }

private:
    TimePoint now_;
};

}  // namespace blobrelay::utils
