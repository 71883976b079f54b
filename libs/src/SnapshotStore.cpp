#include "kasa/inventory/SnapshotStore.h"

#include "kasa/common/Errors.h"
#include "kasa/common/TimeFormat.h"
#include "kasa/inventory/DeviceFormatter.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

namespace kasa::inventory {

namespace {

using json = nlohmann::json;

void writeAtomically(const std::filesystem::path& path, const std::string& content) {
    auto temp = path;
    temp += ".tmp";
    {
        std::ofstream output(temp, std::ios::trunc);
        if (!output) {
            throw common::StorageError("Failed to open " + temp.string() + " for writing");
        }
        output << content;
        output.flush();
        if (!output) {
            throw common::StorageError("Failed to write " + temp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        std::filesystem::remove(temp, ec);
        throw common::StorageError("Failed to replace " + path.string());
    }
}

std::string csvBlock(const std::vector<common::DeviceRecord>& records, const std::string& timestamp) {
    std::string block;
    for (const auto& record : records) {
        block += csvRow(record, true, timestamp);
        block.push_back('\n');
    }
    return block;
}

}  // namespace

SnapshotStore::SnapshotStore(common::ScanPaths paths)
    : paths_(std::move(paths)) {}

void SnapshotStore::ensureDataDir() const {
    if (paths_.dataDir.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(paths_.dataDir, ec);
    if (ec) {
        throw common::StorageError("Failed to create data directory " + paths_.dataDir.string() + ": " + ec.message());
    }
}

void SnapshotStore::saveBaseline(const Baseline& baseline) const {
    ensureDataDir();

    json root;
    root["timestamp"] = common::timePointToIso(baseline.timestamp);
    root["devices"] = baseline.devices;

    std::ostringstream oss;
    oss << std::setw(2) << root;
    writeAtomically(paths_.baselineJson, oss.str());
    spdlog::debug("Baseline with {} device(s) written to {}", baseline.devices.size(), paths_.baselineJson.string());
}

std::optional<Baseline> SnapshotStore::loadBaseline() const {
    if (!std::filesystem::exists(paths_.baselineJson)) {
        return std::nullopt;
    }

    std::ifstream input(paths_.baselineJson);
    if (!input) {
        throw common::StorageError("Failed to open baseline file: " + paths_.baselineJson.string());
    }

    const auto where = " (" + paths_.baselineJson.string() + ")";
    json root;
    try {
        input >> root;
    } catch (const json::exception& ex) {
        throw common::StorageError("Failed to parse baseline" + where + ": " + ex.what());
    }
    if (!root.is_object() || !root.contains("devices") || !root.at("devices").is_array()) {
        throw common::StorageError("Baseline file has no device list" + where);
    }

    Baseline baseline;
    try {
        baseline.timestamp = common::isoToTimePoint(root.value("timestamp", ""));
        baseline.devices = root.at("devices").get<std::vector<common::DeviceRecord>>();
    } catch (const std::exception& ex) {
        throw common::StorageError("Invalid baseline" + where + ": " + ex.what());
    }
    return baseline;
}

void SnapshotStore::writeSnapshot(const std::vector<common::DeviceRecord>& records,
                                  std::chrono::system_clock::time_point timestamp) const {
    ensureDataDir();
    const auto ts = common::timePointToIso(timestamp);
    writeAtomically(paths_.snapshotCsv, csvHeader(true, true) + '\n' + csvBlock(records, ts));
}

void SnapshotStore::appendScanLog(const std::vector<common::DeviceRecord>& records,
                                  std::chrono::system_clock::time_point timestamp) const {
    ensureDataDir();

    std::error_code ec;
    const bool fresh = !std::filesystem::exists(paths_.scanLogCsv, ec)
                       || std::filesystem::file_size(paths_.scanLogCsv, ec) == 0;

    // Whole round in one write.
    std::string block;
    if (fresh) {
        block = csvHeader(true, true) + '\n';
    }
    block += csvBlock(records, common::timePointToIso(timestamp));

    std::ofstream output(paths_.scanLogCsv, std::ios::app);
    if (!output) {
        throw common::StorageError("Failed to open scan log " + paths_.scanLogCsv.string());
    }
    output << block;
    output.flush();
    if (!output) {
        throw common::StorageError("Failed to append to scan log " + paths_.scanLogCsv.string());
    }
}

void SnapshotStore::persistRound(const std::vector<common::DeviceRecord>& records,
                                 std::chrono::system_clock::time_point timestamp) const {
    writeSnapshot(records, timestamp);
    appendScanLog(records, timestamp);
}

}  // namespace kasa::inventory
