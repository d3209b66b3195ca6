#include "common/size_format.hpp"

#include <array>
#include <cstdio>

namespace driftwatch {

namespace {

constexpr std::uint64_t kUnitBase = 1024;
constexpr std::array<const char *, 4> kUnits = {"Bytes", "KB", "MB", "GB"};

std::string trimFraction(std::string value)
{
    const auto dot = value.find('.');
    if (dot == std::string::npos) {
        return value;
    }
    while (!value.empty() && value.back() == '0') {
        value.pop_back();
    }
    if (!value.empty() && value.back() == '.') {
        value.pop_back();
    }
    return value;
}

} // namespace

std::string formatBytes(std::uint64_t bytes)
{
    if (bytes == 0) {
        return "0 Bytes";
    }

    std::size_t unit = 0;
    std::uint64_t divisor = 1;
    while (unit + 1 < kUnits.size() && bytes >= divisor * kUnitBase) {
        divisor *= kUnitBase;
        ++unit;
    }

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.2f",
                  static_cast<double>(bytes) / static_cast<double>(divisor));
    return trimFraction(buffer) + " " + kUnits[unit];
}

std::string formatSizeDelta(std::int64_t delta)
{
    const std::uint64_t magnitude = delta < 0
        ? static_cast<std::uint64_t>(-(delta + 1)) + 1
        : static_cast<std::uint64_t>(delta);
    return (delta > 0 ? "+" : "-") + formatBytes(magnitude);
}

} // namespace driftwatch
