#include "kasa/inventory/DeviceFormatter.h"

#include "kasa/common/TimeFormat.h"

#include <nlohmann/json.hpp>

#include <iomanip>
#include <sstream>

namespace kasa::inventory {

namespace {

using json = nlohmann::json;
using common::DeviceRecord;

constexpr const char* kMissing = "-";

struct Column {
    const char* label;
    std::size_t width;
};

std::string fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string plain(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

template <typename T, typename Fn>
std::string orMissing(const std::optional<T>& value, Fn&& render) {
    return value.has_value() ? render(*value) : std::string(kMissing);
}

std::string textOrMissing(const std::string& value) {
    return value.empty() ? std::string(kMissing) : value;
}

std::string stateText(common::PowerState state) {
    return state == common::PowerState::Unknown ? std::string(kMissing) : common::powerStateName(state);
}

std::optional<double> energyField(const DeviceRecord& record, std::optional<double> common::EnergyReading::*field) {
    if (!record.energy) {
        return std::nullopt;
    }
    return (*record.energy).*field;
}

std::string csvEscape(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

}  // namespace

std::optional<OutputFormat> parseOutputFormat(const std::string& value) {
    const auto format = common::toLowerCopy(value);
    if (format == "table") {
        return OutputFormat::Table;
    }
    if (format == "json") {
        return OutputFormat::Json;
    }
    if (format == "csv") {
        return OutputFormat::Csv;
    }
    return std::nullopt;
}

std::string formatTable(const std::vector<DeviceRecord>& records, bool energy) {
    std::vector<Column> columns{
        {"Device Name", 30},
        {"MAC", 18},
        {"IP Address", 16},
        {"Model", 10},
        {"State", 7},
        {"RSSI", 5},
    };
    if (energy) {
        columns.push_back({"Watts", 8});
        columns.push_back({"Volts", 7});
        columns.push_back({"Amps", 7});
        columns.push_back({"kWh", 8});
    }

    std::ostringstream out;
    std::size_t lineWidth = 0;
    for (std::size_t i = 0; i < columns.size(); ++i) {
        out << std::left << std::setw(static_cast<int>(columns[i].width)) << columns[i].label;
        lineWidth += columns[i].width;
        if (i + 1 < columns.size()) {
            out << "  ";
            lineWidth += 2;
        }
    }
    out << '\n' << std::string(lineWidth, '-') << '\n';

    for (const auto& record : records) {
        std::vector<std::string> cells{
            textOrMissing(record.name),
            textOrMissing(record.mac),
            textOrMissing(record.ip),
            textOrMissing(record.model),
            stateText(record.powerState),
            orMissing(record.signalStrength, [](int v) { return std::to_string(v); }),
        };
        if (energy) {
            cells.push_back(orMissing(energyField(record, &common::EnergyReading::powerW), [](double v) { return fixed(v, 1); }));
            cells.push_back(orMissing(energyField(record, &common::EnergyReading::voltageV), [](double v) { return fixed(v, 1); }));
            cells.push_back(orMissing(energyField(record, &common::EnergyReading::currentA), [](double v) { return fixed(v, 3); }));
            cells.push_back(orMissing(energyField(record, &common::EnergyReading::totalKwh), [](double v) { return fixed(v, 3); }));
        }
        for (std::size_t i = 0; i < cells.size(); ++i) {
            out << std::left << std::setw(static_cast<int>(columns[i].width)) << cells[i];
            if (i + 1 < cells.size()) {
                out << "  ";
            }
        }
        out << '\n';
    }
    return out.str();
}

std::string formatJson(const std::vector<DeviceRecord>& records,
                       std::chrono::system_clock::time_point timestamp) {
    json root;
    root["timestamp"] = common::timePointToIso(timestamp);
    root["device_count"] = records.size();
    root["devices"] = records;
    return root.dump(2);
}

std::string csvHeader(bool energy, bool withTimestamp) {
    std::string header = withTimestamp ? "timestamp," : "";
    header += "name,mac,ip,model,type,is_on,rssi,brightness,firmware";
    if (energy) {
        header += ",power_w,voltage_v,current_a,total_kwh";
    }
    return header;
}

std::string csvRow(const DeviceRecord& record,
                   bool energy,
                   const std::optional<std::string>& timestamp) {
    std::vector<std::string> cells;
    if (timestamp) {
        cells.push_back(*timestamp);
    }
    cells.push_back(record.name);
    cells.push_back(record.mac);
    cells.push_back(record.ip);
    cells.push_back(record.model);
    cells.push_back(record.type);
    if (record.powerState == common::PowerState::Unknown) {
        cells.emplace_back();
    } else {
        cells.emplace_back(record.powerState == common::PowerState::On ? "true" : "false");
    }
    cells.push_back(record.signalStrength ? std::to_string(*record.signalStrength) : std::string{});
    cells.push_back(record.brightness ? std::to_string(*record.brightness) : std::string{});
    cells.push_back(record.firmwareVersion.value_or(""));
    if (energy) {
        for (auto field : {&common::EnergyReading::powerW,
                           &common::EnergyReading::voltageV,
                           &common::EnergyReading::currentA,
                           &common::EnergyReading::totalKwh}) {
            const auto value = energyField(record, field);
            cells.push_back(value ? plain(*value) : std::string{});
        }
    }

    std::string row;
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) {
            row.push_back(',');
        }
        row += csvEscape(cells[i]);
    }
    return row;
}

std::string formatCsv(const std::vector<DeviceRecord>& records, bool energy) {
    std::string out = csvHeader(energy, false) + '\n';
    for (const auto& record : records) {
        out += csvRow(record, energy, std::nullopt) + '\n';
    }
    return out;
}

std::string formatDiff(const DeviceDiff& diff,
                       const Baseline& baseline,
                       std::size_t currentCount,
                       std::chrono::system_clock::time_point now) {
    std::ostringstream out;
    out << "Baseline : " << common::timePointToIso(baseline.timestamp)
        << "  (" << baseline.devices.size() << " devices)\n";
    out << "Current  : " << common::timePointToIso(now)
        << "  (" << currentCount << " devices)\n\n";

    if (!diff.hasChanges()) {
        out << "No changes detected.\n";
        return out.str();
    }

    if (!diff.added.empty()) {
        out << "  + " << diff.added.size() << " NEW device(s):\n";
        for (const auto& d : diff.added) {
            out << "    + " << d.name << "  " << d.mac << "  " << d.ip << '\n';
        }
        out << '\n';
    }
    if (!diff.removed.empty()) {
        out << "  - " << diff.removed.size() << " MISSING device(s):\n";
        for (const auto& d : diff.removed) {
            out << "    - " << d.name << "  " << d.mac << "  was " << d.ip << '\n';
        }
        out << '\n';
    }
    if (!diff.ipChanged.empty()) {
        out << "  ~ " << diff.ipChanged.size() << " IP change(s):\n";
        for (const auto& change : diff.ipChanged) {
            out << "    ~ " << change.after.name << ": " << change.before.ip << " -> " << change.after.ip << '\n';
        }
        out << '\n';
    }
    if (!diff.nameChanged.empty()) {
        out << "  ~ " << diff.nameChanged.size() << " name change(s):\n";
        for (const auto& change : diff.nameChanged) {
            out << "    ~ " << change.before.name << " -> " << change.after.name
                << "  (" << change.after.mac << ")\n";
        }
    }
    return out.str();
}

}  // namespace kasa::inventory
