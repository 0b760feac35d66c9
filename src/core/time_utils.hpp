#pragma once
#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace tcplat {
inline uint64_t monotonic_ns() {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

// Wall clock at second resolution, as stamped on every record of a round.
inline uint32_t unix_seconds() {
    using namespace std::chrono;
    return static_cast<uint32_t>(
        duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

inline std::string format_unix_seconds(uint32_t secs) {
    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    ::gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%FT%TZ", &tm);
    return std::string(buf);
}
}  // namespace tcplat
