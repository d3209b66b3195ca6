#pragma once

#include <cstdint>
#include <string>

namespace driftwatch {

// Human-readable size in base 1024: "0 Bytes", "10 Bytes", "1.5 KB".
// At most two decimals, trailing zeros dropped. GB is the largest unit.
std::string formatBytes(std::uint64_t bytes);

// Signed size change: "+10 Bytes", "-1.5 KB". Zero renders as "-0 Bytes".
std::string formatSizeDelta(std::int64_t delta);

} // namespace driftwatch
