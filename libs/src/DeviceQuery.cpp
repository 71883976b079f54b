#include "kasa/inventory/DeviceQuery.h"

#include "kasa/discovery/DiscoveryTransport.h"

#include <algorithm>

namespace kasa::inventory {

std::optional<SortKey> parseSortKey(const std::string& value) {
    const auto key = common::toLowerCopy(value);
    if (key == "name") {
        return SortKey::Name;
    }
    if (key == "ip") {
        return SortKey::Ip;
    }
    if (key == "mac") {
        return SortKey::Mac;
    }
    if (key == "model") {
        return SortKey::Model;
    }
    if (key == "type") {
        return SortKey::Type;
    }
    return std::nullopt;
}

std::vector<common::DeviceRecord> filterRecords(std::vector<common::DeviceRecord> records,
                                                const std::string& nameFilter,
                                                const std::string& typeFilter) {
    records.erase(std::remove_if(records.begin(), records.end(), [&](const common::DeviceRecord& record) {
                      if (!nameFilter.empty() && !common::containsIgnoreCase(record.name, nameFilter)) {
                          return true;
                      }
                      return !typeFilter.empty() && !common::containsIgnoreCase(record.type, typeFilter);
                  }),
                  records.end());
    return records;
}

void sortRecordsBy(std::vector<common::DeviceRecord>& records, SortKey key) {
    auto byText = [](auto field) {
        return [field](const common::DeviceRecord& a, const common::DeviceRecord& b) {
            return common::toLowerCopy(field(a)) < common::toLowerCopy(field(b));
        };
    };

    switch (key) {
    case SortKey::Name:
        std::stable_sort(records.begin(), records.end(), byText([](const common::DeviceRecord& r) { return r.name; }));
        break;
    case SortKey::Ip:
        std::stable_sort(records.begin(), records.end(), [](const common::DeviceRecord& a, const common::DeviceRecord& b) {
            return discovery::addressLess(a.ip, b.ip);
        });
        break;
    case SortKey::Mac:
        std::stable_sort(records.begin(), records.end(), byText([](const common::DeviceRecord& r) { return r.mac; }));
        break;
    case SortKey::Model:
        std::stable_sort(records.begin(), records.end(), byText([](const common::DeviceRecord& r) { return r.model; }));
        break;
    case SortKey::Type:
        std::stable_sort(records.begin(), records.end(), byText([](const common::DeviceRecord& r) { return r.type; }));
        break;
    }
}

}  // namespace kasa::inventory
