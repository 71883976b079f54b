#pragma once

#include "kasa/common/DeviceRecord.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

namespace kasa::inventory {

enum class WatchState {
    Idle,
    Running,
    Stopped,
};

/**
 * @brief Repeats discover -> render -> persist on a fixed interval.
 *
 * run() blocks the calling thread. stop() may be called from any thread: while
 * the loop sleeps it wakes immediately; while a round is in flight that round is
 * rendered and persisted first. A round that throws is never rendered or
 * persisted. TransportError and StorageError end the loop and propagate; other
 * round failures are logged and the loop carries on.
 */
class WatchScheduler {
public:
    using Clock = std::chrono::system_clock;
    using Records = std::vector<common::DeviceRecord>;
    using RoundFn = std::function<Records()>;
    using SinkFn = std::function<void(const Records&, Clock::time_point)>;

    WatchScheduler(std::chrono::milliseconds interval, RoundFn round, SinkFn render, SinkFn persist);

    WatchScheduler(const WatchScheduler&) = delete;
    WatchScheduler& operator=(const WatchScheduler&) = delete;

    void run();
    void stop();

    WatchState state() const;
    std::size_t completedRounds() const;
    std::chrono::milliseconds interval() const noexcept { return interval_; }

private:
    bool waitForNextRound();
    void finish();

    const std::chrono::milliseconds interval_;
    RoundFn round_;
    SinkFn render_;
    SinkFn persist_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    WatchState state_{WatchState::Idle};
    bool stopRequested_{false};
    std::size_t completedRounds_{0};
};

}  // namespace kasa::inventory
