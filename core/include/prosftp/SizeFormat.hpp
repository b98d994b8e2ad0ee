// Human readable byte counts for listings and status lines.
#pragma once
#include <cstdint>
#include <cstdio>
#include <string>

namespace prosftp {

inline std::string humanSize(std::uint64_t bytes) {
    static const char *const units[] = {"B", "KB", "MB", "GB", "TB"};
    double f = static_cast<double>(bytes);
    char buf[32];
    for (const char *u : units) {
        if (f < 1024.0) {
            if (u == units[0])
                std::snprintf(buf, sizeof(buf), "%llu B",
                              static_cast<unsigned long long>(bytes));
            else
                std::snprintf(buf, sizeof(buf), "%.1f %s", f, u);
            return buf;
        }
        f /= 1024.0;
    }
    std::snprintf(buf, sizeof(buf), "%.1f PB", f);
    return buf;
}

} // namespace prosftp
