#pragma once

#include "kasa/common/DeviceRecord.h"
#include "kasa/common/ScanConfig.h"

#include <chrono>
#include <optional>
#include <vector>

namespace kasa::inventory {

struct Baseline {
    std::chrono::system_clock::time_point timestamp;
    std::vector<common::DeviceRecord> devices;
};

class SnapshotStore {
public:
    explicit SnapshotStore(common::ScanPaths paths);

    const common::ScanPaths& paths() const noexcept { return paths_; }

    void saveBaseline(const Baseline& baseline) const;
    std::optional<Baseline> loadBaseline() const;

    // Latest round only; replaced atomically.
    void writeSnapshot(const std::vector<common::DeviceRecord>& records,
                       std::chrono::system_clock::time_point timestamp) const;
    // Every round, appended.
    void appendScanLog(const std::vector<common::DeviceRecord>& records,
                       std::chrono::system_clock::time_point timestamp) const;

    void persistRound(const std::vector<common::DeviceRecord>& records,
                      std::chrono::system_clock::time_point timestamp) const;

private:
    void ensureDataDir() const;

    common::ScanPaths paths_;
};

}  // namespace kasa::inventory
