#pragma once

#include "kasa/common/DeviceRecord.h"

#include <vector>

namespace kasa::inventory {

struct DeviceChange {
    common::DeviceRecord before;
    common::DeviceRecord after;
};

struct DeviceDiff {
    std::vector<common::DeviceRecord> added;
    std::vector<common::DeviceRecord> removed;
    std::vector<DeviceChange> ipChanged;
    std::vector<DeviceChange> nameChanged;

    bool hasChanges() const {
        return !added.empty() || !removed.empty() || !ipChanged.empty() || !nameChanged.empty();
    }
};

// Compares two generations by MAC. A device can sit in both ipChanged and nameChanged.
DeviceDiff diffDevices(const std::vector<common::DeviceRecord>& baseline,
                       const std::vector<common::DeviceRecord>& current);

}  // namespace kasa::inventory
