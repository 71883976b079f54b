#pragma once

#include "kasa/common/DeviceRecord.h"
#include "kasa/inventory/DeviceDiff.h"
#include "kasa/inventory/SnapshotStore.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace kasa::inventory {

enum class OutputFormat {
    Table,
    Json,
    Csv,
};

std::optional<OutputFormat> parseOutputFormat(const std::string& value);

std::string formatTable(const std::vector<common::DeviceRecord>& records, bool energy);
std::string formatJson(const std::vector<common::DeviceRecord>& records,
                       std::chrono::system_clock::time_point timestamp);
std::string formatCsv(const std::vector<common::DeviceRecord>& records, bool energy);

std::string csvHeader(bool energy, bool withTimestamp);
std::string csvRow(const common::DeviceRecord& record,
                   bool energy,
                   const std::optional<std::string>& timestamp);

std::string formatDiff(const DeviceDiff& diff,
                       const Baseline& baseline,
                       std::size_t currentCount,
                       std::chrono::system_clock::time_point now);

}  // namespace kasa::inventory
