#pragma once
#include <cstdint>
#include <string>

namespace tcplat {
// Identity of a monitored target class: names its backing files and seeds the
// options of a fresh storage directory.
struct Kind {
    std::string name;
    std::string default_addr;
    uint32_t default_interval_ms{};

    std::string file_name(const std::string& suffix) const {
        return name + "." + suffix;
    }

    static Kind tcp_ping() {
        return {"tcpping", "google.com:443", 5000};
    }
};
}  // namespace tcplat
