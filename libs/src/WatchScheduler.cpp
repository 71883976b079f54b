#include "kasa/inventory/WatchScheduler.h"

#include "kasa/common/Errors.h"

#include <spdlog/spdlog.h>

#include <optional>
#include <stdexcept>
#include <utility>

namespace kasa::inventory {

namespace {

std::optional<WatchScheduler::Records> runRound(const WatchScheduler::RoundFn& round) {
    try {
        return round();
    } catch (const common::TransportError&) {
        throw;
    } catch (const common::StorageError&) {
        throw;
    } catch (const std::exception& ex) {
        spdlog::error("Watch round failed: {}", ex.what());
        return std::nullopt;
    }
}

}  // namespace

WatchScheduler::WatchScheduler(std::chrono::milliseconds interval, RoundFn round, SinkFn render, SinkFn persist)
    : interval_(interval),
      round_(std::move(round)),
      render_(std::move(render)),
      persist_(std::move(persist)) {
    if (!round_) {
        throw std::invalid_argument("WatchScheduler requires a round function");
    }
}

void WatchScheduler::run() {
    {
        std::lock_guard lock(mutex_);
        if (state_ != WatchState::Idle) {
            throw std::logic_error("WatchScheduler::run called twice");
        }
        if (stopRequested_) {
            state_ = WatchState::Stopped;
            return;
        }
        state_ = WatchState::Running;
    }
    spdlog::debug("Watch started, interval {} ms", interval_.count());

    try {
        for (;;) {
            {
                std::lock_guard lock(mutex_);
                if (stopRequested_) {
                    break;
                }
            }

            if (auto records = runRound(round_)) {
                const auto now = Clock::now();
                if (render_) {
                    render_(*records, now);
                }
                if (persist_) {
                    persist_(*records, now);
                }
                std::lock_guard lock(mutex_);
                ++completedRounds_;
            }

            if (!waitForNextRound()) {
                break;
            }
        }
    } catch (...) {
        finish();
        throw;
    }
    finish();
}

void WatchScheduler::stop() {
    {
        std::lock_guard lock(mutex_);
        stopRequested_ = true;
    }
    wake_.notify_all();
}

WatchState WatchScheduler::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

std::size_t WatchScheduler::completedRounds() const {
    std::lock_guard lock(mutex_);
    return completedRounds_;
}

bool WatchScheduler::waitForNextRound() {
    std::unique_lock lock(mutex_);
    wake_.wait_for(lock, interval_, [this] { return stopRequested_; });
    return !stopRequested_;
}

void WatchScheduler::finish() {
    std::size_t rounds = 0;
    {
        std::lock_guard lock(mutex_);
        state_ = WatchState::Stopped;
        rounds = completedRounds_;
    }
    spdlog::debug("Watch stopped after {} round(s)", rounds);
}

}  // namespace kasa::inventory
