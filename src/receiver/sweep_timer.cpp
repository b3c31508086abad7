#include "blobrelay/receiver/sweep_timer.hpp"

#include <spdlog/spdlog.h>

namespace blobrelay::receiver {

SweepTimer::SweepTimer(Reassembler& reassembler, std::chrono::milliseconds interval)
    : reassembler_(reassembler), interval_(interval) {
}

SweepTimer::~SweepTimer() {
    stop();
}

bool SweepTimer::start() {
    if (interval_.count() <= 0) {
        spdlog::warn("Sweep interval must be positive, sweeper not started");
        return false;
    }
    if (running_.exchange(true)) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    thread_ = std::thread(&SweepTimer::run, this);
    spdlog::debug("Sweeper started, interval {}ms", interval_.count());
    return true;
}

void SweepTimer::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
        spdlog::debug("Sweeper stopped after {} passes", sweeps_run_.load());
    }
    running_ = false;
}

void SweepTimer::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
            break;
        }
        lock.unlock();
        reassembler_.sweep();
        ++sweeps_run_;
        lock.lock();
    }
}

}  // namespace blobrelay::receiver
