#pragma once

#include <chrono>
#include <string>

namespace kasa::common {

std::string timePointToIso(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point isoToTimePoint(const std::string& iso);
std::string localTimestamp(std::chrono::system_clock::time_point tp);

}  // namespace kasa::common
