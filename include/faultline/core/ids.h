#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace faultline {

/**
 * Generate a UUID v4 string (xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx) from @p rng.
 */
inline std::string generateUUID(std::mt19937_64& rng) {
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t a = dist(rng);
    uint64_t b = dist(rng);

    // version 4, variant 1
    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx", static_cast<uint32_t>(a >> 32),
                  static_cast<uint16_t>((a >> 16) & 0xFFFF), static_cast<uint16_t>(a & 0xFFFF),
                  static_cast<uint16_t>(b >> 48),
                  static_cast<unsigned long long>(b & 0x0000FFFFFFFFFFFFull));
    return std::string(buf);
}

inline std::tm toUtc(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc;
    gmtime_r(&t, &tm_utc);
    return tm_utc;
}

/**
 * ISO 8601 UTC timestamp with microsecond precision: 2025-10-01T14:30:00.123456
 */
inline std::string isoTimestamp(std::chrono::system_clock::time_point tp) {
    auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count() %
        1000000;
    auto tm_utc = toUtc(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(6)
        << micros;
    return oss.str();
}

// Report file stamp: 20251001_143000
inline std::string reportTimestamp(std::chrono::system_clock::time_point tp) {
    auto tm_utc = toUtc(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y%m%d_%H%M%S");
    return oss.str();
}

} // namespace faultline
