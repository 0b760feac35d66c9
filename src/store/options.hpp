#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tcplat {
struct Options {
    std::vector<uint32_t> addrs;
    uint32_t interval_ms{};
};

inline bool operator==(const Options& a, const Options& b) {
    return a.addrs == b.addrs && a.interval_ms == b.interval_ms;
}
inline bool operator!=(const Options& a, const Options& b) {
    return !(a == b);
}

nlohmann::json options_to_json(const Options& opt);
bool options_from_json(const nlohmann::json& doc, Options& out);
std::string describe(const Options& opt);

// Command-line forms: a positive decimal millisecond count that fits in 32 bits, and a
// comma-separated list of address ids. Both reject signs and trailing garbage.
bool parse_interval_ms(const std::string& s, uint32_t& out);
bool parse_addr_ids(const std::string& s, std::vector<uint32_t>& out);
}  // namespace tcplat
