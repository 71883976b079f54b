#include "TestSupport.h"

#include "kasa/common/Errors.h"
#include "kasa/common/ScanConfig.h"
#include "kasa/common/TimeFormat.h"
#include "kasa/inventory/SnapshotStore.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using kasa::common::DeviceRecord;
using kasa::common::PowerState;

namespace {

std::string readFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    REQUIRE(input.good());
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

std::size_t countOccurrences(const std::string& text, const std::string& needle) {
    std::size_t count = 0;
    for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

std::vector<DeviceRecord> sampleRecords() {
    DeviceRecord lamp;
    lamp.name = "Desk Lamp";
    lamp.mac = "50:C7:BF:00:00:01";
    lamp.ip = "192.168.1.20";
    lamp.model = "HS103(US)";
    lamp.type = "Plug";
    lamp.powerState = PowerState::On;
    lamp.signalStrength = -48;
    lamp.firmwareVersion = "1.0.3";

    DeviceRecord meter = lamp;
    meter.name = "Dryer, Basement";
    meter.mac = "50:C7:BF:00:00:02";
    meter.ip = "192.168.1.21";
    meter.powerState = PowerState::Unknown;
    meter.energy = kasa::common::EnergyReading{1.5, 120.0, 0.012, 3.456};
    return {lamp, meter};
}

}  // namespace

TEST_CASE("ISO timestamps honour their UTC offset", "[storage]") {
    using kasa::common::isoToTimePoint;
    const auto tenUtc = std::chrono::system_clock::from_time_t(1'704'103'200);  // 2024-01-01T10:00:00Z

    CHECK(isoToTimePoint("2024-01-01T10:00:00Z") == tenUtc);
    CHECK(isoToTimePoint("2024-01-01T10:00:00") == tenUtc);
    CHECK(isoToTimePoint("2024-01-01T12:00:00+02:00") == tenUtc);
    CHECK(isoToTimePoint("2024-01-01T12:00:00+0200") == tenUtc);
    CHECK(isoToTimePoint("2024-01-01T05:30:00-04:30") == tenUtc);
    CHECK(isoToTimePoint("2024-01-01T12:00:00.123456+02:00") == tenUtc);
    CHECK(isoToTimePoint(kasa::common::timePointToIso(tenUtc)) == tenUtc);

    CHECK_THROWS_AS(isoToTimePoint("2024-01-01T10:00:00 PST"), std::runtime_error);
    CHECK_THROWS_AS(isoToTimePoint("2024-01-01T10:00:00+2"), std::runtime_error);
    CHECK_THROWS_AS(isoToTimePoint("2024-01-01T10:00:00+25:00"), std::runtime_error);
    CHECK_THROWS_AS(isoToTimePoint("2024-01-01T10:00:00."), std::runtime_error);
}

TEST_CASE("Baseline survives a save and load", "[storage]") {
    const auto dir = kasa::test::uniqueTempDir("kasa-baseline") / "nested";
    kasa::inventory::SnapshotStore store(kasa::common::ScanPaths::under(dir));

    SECTION("missing baseline is reported as absent") {
        CHECK_FALSE(store.loadBaseline().has_value());
    }

    SECTION("saved devices come back unchanged") {
        const auto timestamp = std::chrono::system_clock::from_time_t(1'700'000'000);
        store.saveBaseline({timestamp, sampleRecords()});
        REQUIRE(std::filesystem::exists(store.paths().baselineJson));

        const auto loaded = store.loadBaseline();
        REQUIRE(loaded.has_value());
        CHECK(loaded->timestamp == timestamp);
        REQUIRE(loaded->devices.size() == 2);
        CHECK(loaded->devices[0].name == "Desk Lamp");
        CHECK(loaded->devices[0].powerState == PowerState::On);
        CHECK(loaded->devices[1].powerState == PowerState::Unknown);
        REQUIRE(loaded->devices[1].energy.has_value());
        CHECK(loaded->devices[1].energy->voltageV == 120.0);
    }

    SECTION("unreadable baseline raises a storage error") {
        std::filesystem::create_directories(dir);
        std::ofstream(store.paths().baselineJson) << "{ not json";
        CHECK_THROWS_AS(store.loadBaseline(), kasa::common::StorageError);

        std::ofstream(store.paths().baselineJson, std::ios::trunc) << R"({"timestamp": "2024-01-01T00:00:00"})";
        CHECK_THROWS_AS(store.loadBaseline(), kasa::common::StorageError);

        std::ofstream(store.paths().baselineJson, std::ios::trunc)
            << R"({"timestamp": "2024-01-01T00:00:00 local", "devices": []})";
        CHECK_THROWS_AS(store.loadBaseline(), kasa::common::StorageError);
    }

    SECTION("baseline written with a local offset is read as UTC") {
        std::filesystem::create_directories(dir);
        std::ofstream(store.paths().baselineJson) << R"({"timestamp": "2024-01-01T12:00:00+02:00", "devices": []})";
        const auto loaded = store.loadBaseline();
        REQUIRE(loaded.has_value());
        CHECK(loaded->timestamp == std::chrono::system_clock::from_time_t(1'704'103'200));
    }

    std::filesystem::remove_all(dir.parent_path());
}

TEST_CASE("Snapshot is replaced and scan log grows per round", "[storage]") {
    const auto dir = kasa::test::uniqueTempDir("kasa-rounds");
    kasa::inventory::SnapshotStore store(kasa::common::ScanPaths::under(dir));
    const auto records = sampleRecords();
    const auto first = std::chrono::system_clock::from_time_t(1'700'000'000);
    const auto second = first + std::chrono::seconds(5);

    store.persistRound(records, first);
    store.persistRound({records.front()}, second);

    const auto snapshot = readFile(store.paths().snapshotCsv);
    CHECK(countOccurrences(snapshot, "timestamp,name,mac") == 1);
    CHECK(countOccurrences(snapshot, "Desk Lamp") == 1);
    CHECK(snapshot.find("Dryer") == std::string::npos);

    const auto log = readFile(store.paths().scanLogCsv);
    CHECK(countOccurrences(log, "timestamp,name,mac") == 1);
    CHECK(countOccurrences(log, "Desk Lamp") == 2);
    CHECK(countOccurrences(log, "\"Dryer, Basement\"") == 1);
    CHECK(log.find("1.5,120,0.012,3.456") != std::string::npos);

    std::filesystem::remove_all(dir);
}
