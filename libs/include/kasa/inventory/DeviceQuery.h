#pragma once

#include "kasa/common/DeviceRecord.h"

#include <optional>
#include <string>
#include <vector>

namespace kasa::inventory {

enum class SortKey {
    Name,
    Ip,
    Mac,
    Model,
    Type,
};

std::optional<SortKey> parseSortKey(const std::string& value);

// Case-insensitive substring filters; an empty filter matches everything.
std::vector<common::DeviceRecord> filterRecords(std::vector<common::DeviceRecord> records,
                                                const std::string& nameFilter,
                                                const std::string& typeFilter);

// Stable; ties keep the name ordering the scan produced.
void sortRecordsBy(std::vector<common::DeviceRecord>& records, SortKey key);

}  // namespace kasa::inventory
