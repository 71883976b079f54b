#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kasa::common {

struct ScanPaths {
    std::filesystem::path dataDir;
    std::filesystem::path snapshotCsv;
    std::filesystem::path scanLogCsv;
    std::filesystem::path baselineJson;

    static ScanPaths under(const std::filesystem::path& dataDir);
};

struct ScanConfig {
    ScanPaths paths;
    std::vector<std::uint16_t> discoveryPorts{9999, 20002};
    std::string broadcastAddress{"255.255.255.255"};
    std::uint16_t commandPort{9999};
    std::chrono::milliseconds timeout{std::chrono::seconds(5)};
    std::chrono::milliseconds interval{std::chrono::seconds(5)};
    std::size_t maxParallel{8};
};

std::filesystem::path defaultDataDir();

/**
 * @brief Build the run configuration.
 *
 * Starts from defaults rooted at @p dataDir, then applies overrides from the YAML
 * file at @p configPath when it exists. A missing file is not an error; a file
 * that exists but cannot be parsed raises ConfigError.
 */
ScanConfig loadScanConfig(const std::filesystem::path& dataDir,
                          const std::filesystem::path& configPath);

}  // namespace kasa::common
