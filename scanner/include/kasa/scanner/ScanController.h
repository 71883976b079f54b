#pragma once

#include "kasa/common/ScanConfig.h"
#include "kasa/device/DeviceChannel.h"
#include "kasa/discovery/DeviceScanner.h"
#include "kasa/discovery/DiscoveryTransport.h"
#include "kasa/inventory/DeviceFormatter.h"
#include "kasa/inventory/DeviceQuery.h"
#include "kasa/inventory/SnapshotStore.h"
#include "kasa/inventory/WatchScheduler.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace kasa::scanner {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;

enum class PowerAction {
    On,
    Off,
    Toggle,
};

struct ScanOptions {
    std::string nameFilter;
    std::string typeFilter;
    std::optional<std::string> targetIp;
    inventory::SortKey sortKey{inventory::SortKey::Name};
    bool energy{false};
    inventory::OutputFormat format{inventory::OutputFormat::Table};
    std::filesystem::path output;
};

// Runs one command against the network and reports on out/err. Returns the exit code.
class ScanController {
public:
    ScanController(common::ScanConfig config,
                   discovery::DiscoveryTransport& transport,
                   device::ChannelFactory channelFactory,
                   std::ostream& out,
                   std::ostream& err);

    int scan(const ScanOptions& options);
    int control(PowerAction action, const std::string& identifier);
    int baseline();
    int diff();

    // The caller drives run() and wires stop() to its cancellation source.
    std::unique_ptr<inventory::WatchScheduler> makeWatch(bool energy);

    const common::ScanConfig& config() const noexcept { return config_; }

private:
    void writeOutput(const std::filesystem::path& path, const std::string& text, std::size_t count);

    const common::ScanConfig config_;
    discovery::DeviceScanner scanner_;
    inventory::SnapshotStore store_;
    std::ostream& out_;
    std::ostream& err_;
};

}  // namespace kasa::scanner
