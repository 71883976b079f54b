#include "kasa/common/ScanConfig.h"

#include "kasa/common/Errors.h"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>

namespace kasa::common {

namespace {

template <typename T>
T scalarOrThrow(const YAML::Node& node, const std::string& field) {
    if (!node.IsScalar()) {
        throw ConfigError("Field '" + field + "' must be a scalar");
    }
    return node.as<T>();
}

std::chrono::milliseconds secondsField(const YAML::Node& node, const std::string& field) {
    const double seconds = scalarOrThrow<double>(node, field);
    if (seconds <= 0.0) {
        throw ConfigError("Field '" + field + "' must be positive");
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(seconds * 1000.0));
}

void applyOverrides(const YAML::Node& root, ScanConfig& config) {
    if (auto node = root["data_dir"]) {
        config.paths = ScanPaths::under(scalarOrThrow<std::string>(node, "data_dir"));
    }
    if (auto node = root["broadcast_address"]) {
        config.broadcastAddress = scalarOrThrow<std::string>(node, "broadcast_address");
    }
    if (auto node = root["command_port"]) {
        config.commandPort = scalarOrThrow<std::uint16_t>(node, "command_port");
    }
    if (auto node = root["discovery_ports"]) {
        if (!node.IsSequence() || node.size() == 0) {
            throw ConfigError("'discovery_ports' must be a non-empty sequence");
        }
        config.discoveryPorts.clear();
        for (const auto& port : node) {
            config.discoveryPorts.push_back(scalarOrThrow<std::uint16_t>(port, "discovery_ports[]"));
        }
    }
    if (auto node = root["timeout"]) {
        config.timeout = secondsField(node, "timeout");
    }
    if (auto node = root["interval"]) {
        config.interval = secondsField(node, "interval");
    }
    if (auto node = root["max_parallel"]) {
        const auto value = scalarOrThrow<std::size_t>(node, "max_parallel");
        if (value == 0) {
            throw ConfigError("'max_parallel' must be at least 1");
        }
        config.maxParallel = value;
    }
}

}  // namespace

ScanPaths ScanPaths::under(const std::filesystem::path& dataDir) {
    ScanPaths paths;
    paths.dataDir = dataDir;
    paths.snapshotCsv = dataDir / "devices.csv";
    paths.scanLogCsv = dataDir / "scan_log.csv";
    paths.baselineJson = dataDir / "baseline.json";
    return paths;
}

std::filesystem::path defaultDataDir() {
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return std::filesystem::path(home) / ".kasa_scan";
    }
    return std::filesystem::current_path() / ".kasa_scan";
}

ScanConfig loadScanConfig(const std::filesystem::path& dataDir,
                          const std::filesystem::path& configPath) {
    ScanConfig config;
    config.paths = ScanPaths::under(dataDir);

    if (configPath.empty() || !std::filesystem::exists(configPath)) {
        return config;
    }

    try {
        YAML::Node root = YAML::LoadFile(configPath.string());
        if (root.IsNull()) {
            return config;
        }
        if (!root.IsMap()) {
            throw ConfigError("Config root must be a mapping: " + configPath.string());
        }
        applyOverrides(root, config);
    } catch (const YAML::Exception& ex) {
        throw ConfigError("Failed to parse config (" + configPath.string() + "): " + ex.what());
    }

    spdlog::debug("Loaded config from {}", configPath.string());
    return config;
}

}  // namespace kasa::common
