// Human-readable sizes and durations for logs and progress lines.
#pragma once
#include <cstdint>
#include <string>

namespace mediaferry {

// "512 B", "1.50 KB", "10.00 MB" ... (base 1024, up to TB).
std::string formatSize(std::int64_t bytes);

// "1h 23m 45s"; zero components are omitted, "0s" for <= 0.
std::string formatDuration(std::int64_t seconds);

// formatSize(bytes_per_sec) + "/s".
std::string formatRate(double bytes_per_sec);

} // namespace mediaferry
