#include "kasa/common/Errors.h"
#include "kasa/common/ScanConfig.h"
#include "kasa/device/DeviceChannel.h"
#include "kasa/discovery/UdpDiscoveryTransport.h"
#include "kasa/scanner/ScanController.h"
#include "kasa/scanner/SignalStopper.h"

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

using kasa::scanner::PowerAction;

struct CliOptions {
    bool debug{false};
    std::filesystem::path configPath;
    std::filesystem::path dataDir;
    double timeout{-1.0};
    double interval{-1.0};
    std::string format{"table"};
    std::string sort{"name"};
    std::string device;
    kasa::scanner::ScanOptions scan;
    bool watchEnergy{false};
};

std::chrono::milliseconds seconds(double value) {
    return std::chrono::milliseconds(static_cast<std::int64_t>(value * 1000.0));
}

kasa::common::ScanConfig buildConfig(const CliOptions& options) {
    const auto dataDir = options.dataDir.empty() ? kasa::common::defaultDataDir() : options.dataDir;
    const auto configPath = options.configPath.empty() ? dataDir / "config.yaml" : options.configPath;
    if (!options.configPath.empty() && !std::filesystem::exists(configPath)) {
        throw kasa::common::ConfigError("Config file not found: " + configPath.string());
    }

    auto config = kasa::common::loadScanConfig(dataDir, configPath);
    if (!options.dataDir.empty()) {
        config.paths = kasa::common::ScanPaths::under(options.dataDir);
    }
    if (options.timeout > 0.0) {
        config.timeout = seconds(options.timeout);
    }
    if (options.interval > 0.0) {
        config.interval = seconds(options.interval);
    }
    return config;
}

void addTimeout(CLI::App* command, CliOptions& options) {
    command->add_option("-t,--timeout", options.timeout, "Discovery timeout in seconds (default: 5)")
        ->check(CLI::PositiveNumber);
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"Discover, monitor, and control TP-Link Kasa smart home devices"};
    app.require_subcommand(0, 1);
    CliOptions options;

    app.add_flag("--debug", options.debug, "Enable verbose debug logging");
    app.add_option("--config", options.configPath, "YAML config file (default: <data-dir>/config.yaml)");
    app.add_option("--data-dir", options.dataDir, "Directory for baseline, snapshot and scan log (default: ~/.kasa_scan)");

    auto* scan = app.add_subcommand("scan", "Discover devices on the network (default)");
    scan->add_option("-f,--format", options.format, "Output format")
        ->check(CLI::IsMember({"table", "json", "csv"}));
    scan->add_option("-o,--output", options.scan.output, "Write output to FILE");
    addTimeout(scan, options);
    scan->add_option("--filter", options.scan.nameFilter, "Show only devices whose name contains TEXT");
    scan->add_option("--type", options.scan.typeFilter, "Show only devices of TYPE (plug, bulb, ...)");
    scan->add_option("--ip", options.scan.targetIp, "Query a single device by IP");
    scan->add_option("--sort", options.sort, "Sort key")
        ->check(CLI::IsMember({"name", "ip", "mac", "model", "type"}));
    scan->add_flag("--energy", options.scan.energy, "Include energy monitoring data");

    auto* on = app.add_subcommand("on", "Turn a device on");
    auto* off = app.add_subcommand("off", "Turn a device off");
    auto* toggle = app.add_subcommand("toggle", "Toggle a device");
    for (auto* command : {on, off, toggle}) {
        command->add_option("device", options.device, "Device name (partial match) or IP address")->required();
        addTimeout(command, options);
    }

    auto* watch = app.add_subcommand("watch", "Live-updating device monitor");
    watch->add_option("-i,--interval", options.interval, "Refresh interval in seconds (default: 5)")
        ->check(CLI::PositiveNumber);
    addTimeout(watch, options);
    watch->add_flag("--energy", options.watchEnergy, "Include energy monitoring data");

    auto* baseline = app.add_subcommand("baseline", "Save current state for diff comparison");
    addTimeout(baseline, options);

    auto* diff = app.add_subcommand("diff", "Compare current state to saved baseline");
    addTimeout(diff, options);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    auto logger = spdlog::stderr_color_mt("kasa");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
    if (options.debug) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("Debug logging enabled");
    } else {
        spdlog::set_level(spdlog::level::warn);
    }

    try {
        const auto config = buildConfig(options);
        kasa::discovery::UdpDiscoveryTransport transport(config.broadcastAddress, config.discoveryPorts);
        kasa::scanner::ScanController controller(
            config,
            transport,
            kasa::device::tcpChannelFactory(config.commandPort, config.timeout),
            std::cout,
            std::cerr);

        if (*on || *off || *toggle) {
            const auto action = *on ? PowerAction::On : *off ? PowerAction::Off : PowerAction::Toggle;
            return controller.control(action, options.device);
        }
        if (*watch) {
            auto scheduler = controller.makeWatch(options.watchEnergy);
            std::cout << "Watching Kasa devices every "
                      << std::chrono::duration<double>(config.interval).count()
                      << "s  (Ctrl-C to stop)\n\n";
            {
                kasa::scanner::SignalStopper stopper(*scheduler);
                scheduler->run();
            }
            std::cout << "\nStopped.\n";
            return kasa::scanner::kExitOk;
        }
        if (*baseline) {
            return controller.baseline();
        }
        if (*diff) {
            return controller.diff();
        }

        options.scan.format = kasa::inventory::parseOutputFormat(options.format).value_or(kasa::inventory::OutputFormat::Table);
        options.scan.sortKey = kasa::inventory::parseSortKey(options.sort).value_or(kasa::inventory::SortKey::Name);
        return controller.scan(options.scan);
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return kasa::scanner::kExitFailure;
    }
}
