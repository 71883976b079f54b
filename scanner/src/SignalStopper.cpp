#include "kasa/scanner/SignalStopper.h"

#include <spdlog/spdlog.h>

#include <csignal>

namespace kasa::scanner {

SignalStopper::SignalStopper(inventory::WatchScheduler& watch) : signals_(ioContext_, SIGINT, SIGTERM) {
    signals_.async_wait([this, &watch](const std::error_code& ec, int signal) {
        if (ec) {
            return;
        }
        spdlog::debug("Signal {} received, stopping watch", signal);
        watch.stop();

        std::error_code clearError;
        signals_.clear(clearError);
        if (clearError) {
            spdlog::warn("Could not restore default signal handling: {}", clearError.message());
        }
    });
    worker_ = std::thread([this] { ioContext_.run(); });
}

SignalStopper::~SignalStopper() {
    ioContext_.stop();
    if (worker_.joinable()) {
        worker_.join();
    }
    std::error_code ec;
    signals_.clear(ec);
}

}  // namespace kasa::scanner
