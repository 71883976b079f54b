#pragma once

#include "kasa/inventory/WatchScheduler.h"

#include <asio.hpp>

#include <thread>

namespace kasa::scanner {

/**
 * @brief Stops a watch loop on SIGINT/SIGTERM from a dedicated io_context thread.
 *
 * Only the first signal is caught. The default disposition is restored right
 * after it, so a second Ctrl-C terminates the process even when the current
 * discovery round is still running.
 */
class SignalStopper {
public:
    explicit SignalStopper(inventory::WatchScheduler& watch);
    ~SignalStopper();

    SignalStopper(const SignalStopper&) = delete;
    SignalStopper& operator=(const SignalStopper&) = delete;

private:
    asio::io_context ioContext_;
    asio::signal_set signals_;
    std::thread worker_;
};

}  // namespace kasa::scanner
