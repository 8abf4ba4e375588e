#pragma once
#include <cstdint>
#include <ctime>
#include <string>

namespace TimeUtils {
    inline uint64_t nowUnix() {
        return static_cast<uint64_t>(std::time(nullptr));
    }

    /** "2026-02-26 13:30:00 UTC" */
    inline std::string formatUtc(uint64_t unixSecs) {
        std::time_t t = static_cast<std::time_t>(unixSecs);
        std::tm tm{};
        gmtime_r(&t, &tm);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S UTC", &tm);
        return buf;
    }
}
