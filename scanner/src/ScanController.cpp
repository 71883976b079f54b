#include "kasa/scanner/ScanController.h"

#include "kasa/common/Errors.h"
#include "kasa/common/TimeFormat.h"
#include "kasa/discovery/DeviceResolver.h"
#include "kasa/inventory/DeviceDiff.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <utility>

namespace kasa::scanner {

namespace {

using Clock = std::chrono::system_clock;

std::string sessionLabel(const device::DeviceSession& session) {
    auto name = session.name();
    return name.empty() ? session.address() : name;
}

}  // namespace

ScanController::ScanController(common::ScanConfig config,
                               discovery::DiscoveryTransport& transport,
                               device::ChannelFactory channelFactory,
                               std::ostream& out,
                               std::ostream& err)
    : config_(std::move(config)),
      scanner_(transport, std::move(channelFactory), config_.maxParallel),
      store_(config_.paths),
      out_(out),
      err_(err) {}

int ScanController::scan(const ScanOptions& options) {
    auto records = scanner_.scan(config_.timeout, options.targetIp, options.energy);
    if (records.empty()) {
        if (options.targetIp) {
            err_ << "No Kasa device answered at " << *options.targetIp << ".\n";
        } else {
            err_ << "No Kasa devices found on the network.\n";
        }
        return kExitFailure;
    }

    records = inventory::filterRecords(std::move(records), options.nameFilter, options.typeFilter);
    if (options.sortKey != inventory::SortKey::Name) {
        inventory::sortRecordsBy(records, options.sortKey);
    }

    const auto now = Clock::now();
    store_.persistRound(records, now);

    switch (options.format) {
    case inventory::OutputFormat::Json:
        writeOutput(options.output, inventory::formatJson(records, now) + '\n', records.size());
        break;
    case inventory::OutputFormat::Csv:
        writeOutput(options.output, inventory::formatCsv(records, options.energy), records.size());
        break;
    case inventory::OutputFormat::Table:
        if (!options.output.empty()) {
            writeOutput(options.output, inventory::formatTable(records, options.energy), records.size());
            break;
        }
        out_ << "\nFound " << records.size() << " Kasa device(s):\n\n"
             << inventory::formatTable(records, options.energy)
             << '\n' << store_.paths().snapshotCsv.string() << '\n';
        break;
    }
    return kExitOk;
}

int ScanController::control(PowerAction action, const std::string& identifier) {
    discovery::DeviceResolver resolver(scanner_);
    auto resolution = resolver.resolve(identifier, config_.timeout);

    switch (resolution.status) {
    case discovery::ResolveStatus::NotFound:
        if (discovery::DeviceResolver::isIpv4Literal(identifier)) {
            err_ << "Could not reach " << identifier << ".\n";
        } else {
            err_ << "No device matching '" << identifier << "' found.\n";
        }
        return kExitFailure;
    case discovery::ResolveStatus::Ambiguous:
        err_ << "Multiple devices match '" << identifier << "':\n";
        for (const auto& candidate : resolution.candidates) {
            err_ << "  " << candidate.name << " (" << candidate.ip << ")\n";
        }
        err_ << "Be more specific.\n";
        return kExitFailure;
    case discovery::ResolveStatus::Found:
        break;
    }

    auto& session = *resolution.session;
    const auto label = sessionLabel(session);
    bool turnOn = action == PowerAction::On;
    if (action == PowerAction::Toggle) {
        turnOn = session.powerState() != common::PowerState::On;
    }

    const auto status = session.setPower(turnOn);
    if (status != device::CallStatus::Ok) {
        err_ << "Failed to turn " << (turnOn ? "on" : "off") << ' ' << label
             << ": device " << device::callStatusName(status) << '\n';
        session.release();
        return kExitFailure;
    }

    if (session.refresh() != device::CallStatus::Ok) {
        spdlog::debug("Post-command refresh of {} failed", session.address());
    }
    session.release();
    out_ << label << " -> " << (turnOn ? "ON" : "OFF") << '\n';
    return kExitOk;
}

int ScanController::baseline() {
    auto records = scanner_.scan(config_.timeout, std::nullopt, false);
    if (records.empty()) {
        err_ << "No devices found.\n";
        return kExitFailure;
    }

    store_.saveBaseline(inventory::Baseline{Clock::now(), records});
    out_ << "Baseline saved (" << records.size() << " devices) -> "
         << store_.paths().baselineJson.string() << '\n';
    return kExitOk;
}

int ScanController::diff() {
    auto saved = store_.loadBaseline();
    if (!saved) {
        err_ << "No baseline found. Run 'kasa-scan baseline' first.\n";
        return kExitFailure;
    }

    auto records = scanner_.scan(config_.timeout, std::nullopt, false);
    if (records.empty()) {
        err_ << "No devices found.\n";
        return kExitFailure;
    }

    const auto changes = inventory::diffDevices(saved->devices, records);
    out_ << inventory::formatDiff(changes, *saved, records.size(), Clock::now());
    return kExitOk;
}

std::unique_ptr<inventory::WatchScheduler> ScanController::makeWatch(bool energy) {
    const auto intervalSeconds =
        std::chrono::duration_cast<std::chrono::duration<double>>(config_.interval).count();

    auto round = [this, energy] {
        return scanner_.scan(config_.timeout, std::nullopt, energy);
    };
    auto render = [this, energy, intervalSeconds](const inventory::WatchScheduler::Records& records,
                                                 Clock::time_point timestamp) {
        out_ << "\x1b[2J\x1b[H";
        out_ << "kasa-scan watch - " << common::localTimestamp(timestamp)
             << "  (every " << intervalSeconds << "s, Ctrl-C to stop)\n";
        out_ << "Found " << records.size() << " device(s)\n\n";
        if (!records.empty()) {
            out_ << inventory::formatTable(records, energy);
        }
        out_.flush();
    };
    auto persist = [this](const inventory::WatchScheduler::Records& records, Clock::time_point timestamp) {
        if (!records.empty()) {
            store_.persistRound(records, timestamp);
        }
    };

    return std::make_unique<inventory::WatchScheduler>(config_.interval,
                                                       std::move(round),
                                                       std::move(render),
                                                       std::move(persist));
}

void ScanController::writeOutput(const std::filesystem::path& path, const std::string& text, std::size_t count) {
    if (path.empty()) {
        out_ << text;
        return;
    }
    std::ofstream output(path, std::ios::trunc);
    if (!output) {
        throw common::StorageError("Failed to open output file: " + path.string());
    }
    output << text;
    output.flush();
    if (!output) {
        throw common::StorageError("Failed to write output file: " + path.string());
    }
    out_ << "Wrote " << count << " devices -> " << path.string() << '\n';
}

}  // namespace kasa::scanner
