#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#include "blobrelay/receiver/reassembler.hpp"

namespace blobrelay::receiver {

// Runs Reassembler::sweep() periodically on a background thread.
// Stops (and joins) on destruction.
class SweepTimer {
public:
    SweepTimer(Reassembler& reassembler, std::chrono::milliseconds interval);
    ~SweepTimer();

    // Disable copy
    SweepTimer(const SweepTimer&) = delete;
    SweepTimer& operator=(const SweepTimer&) = delete;

    // Returns false if already running or interval is zero
    bool start();
    void stop();

    [[nodiscard]] bool running() const { return running_.load(); }
    [[nodiscard]] uint64_t sweeps_run() const { return sweeps_run_.load(); }
    [[nodiscard]] std::chrono::milliseconds interval() const { return interval_; }

private:
    Reassembler& reassembler_;
    std::chrono::milliseconds interval_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_{false};
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> sweeps_run_{0};

    void run();
};

}  // namespace blobrelay::receiver
