#include "kasa/inventory/DeviceDiff.h"

#include <map>
#include <string>

namespace kasa::inventory {

namespace {

std::map<std::string, const common::DeviceRecord*> indexByMac(const std::vector<common::DeviceRecord>& records) {
    std::map<std::string, const common::DeviceRecord*> index;
    for (const auto& record : records) {
        index[common::canonicalMac(record.mac)] = &record;
    }
    return index;
}

}  // namespace

DeviceDiff diffDevices(const std::vector<common::DeviceRecord>& baseline,
                       const std::vector<common::DeviceRecord>& current) {
    const auto before = indexByMac(baseline);
    const auto after = indexByMac(current);

    DeviceDiff diff;
    for (const auto& [mac, record] : after) {
        auto it = before.find(mac);
        if (it == before.end()) {
            diff.added.push_back(*record);
            continue;
        }
        const common::DeviceRecord& old = *it->second;
        if (old.ip != record->ip) {
            diff.ipChanged.push_back(DeviceChange{old, *record});
        }
        if (old.name != record->name) {
            diff.nameChanged.push_back(DeviceChange{old, *record});
        }
    }

    for (const auto& [mac, record] : before) {
        if (after.find(mac) == after.end()) {
            diff.removed.push_back(*record);
        }
    }
    return diff;
}

}  // namespace kasa::inventory
