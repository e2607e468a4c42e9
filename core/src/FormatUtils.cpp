#include "mediaferry/FormatUtils.hpp"
#include <cstdio>

namespace mediaferry {

std::string formatSize(std::int64_t bytes) {
    if (bytes < 0)
        return "0 B";
    static const char *units[] = {"B", "KB", "MB", "GB", "TB"};
    static constexpr int kUnits = sizeof(units) / sizeof(units[0]);
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < kUnits - 1) {
        size /= 1024.0;
        ++unit;
    }
    if (unit == 0)
        return std::to_string(bytes) + " B";
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f %s", size, units[unit]);
    return buf;
}

std::string formatDuration(std::int64_t seconds) {
    if (seconds <= 0)
        return "0s";
    const std::int64_t hours = seconds / 3600;
    const std::int64_t minutes = (seconds % 3600) / 60;
    const std::int64_t secs = seconds % 60;
    std::string out;
    auto append = [&out](std::int64_t v, const char *suffix) {
        if (!out.empty())
            out += ' ';
        out += std::to_string(v);
        out += suffix;
    };
    if (hours > 0)
        append(hours, "h");
    if (minutes > 0)
        append(minutes, "m");
    if (secs > 0 || out.empty())
        append(secs, "s");
    return out;
}

std::string formatRate(double bytes_per_sec) {
    if (bytes_per_sec < 0.0)
        bytes_per_sec = 0.0;
    return formatSize(static_cast<std::int64_t>(bytes_per_sec)) + "/s";
}

} // namespace mediaferry
