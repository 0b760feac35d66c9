#include "options.hpp"

#include <cstdint>
#include <sstream>
#include <utility>

#include "../core/logger.hpp"

namespace tcplat {
nlohmann::json options_to_json(const Options& opt) {
    nlohmann::json doc;
    doc["addrs"] = opt.addrs;
    doc["interval"] = opt.interval_ms;
    return doc;
}

bool options_from_json(const nlohmann::json& doc, Options& out) {
    try {
        Options opt;
        doc.at("addrs").get_to(opt.addrs);
        doc.at("interval").get_to(opt.interval_ms);
        out = std::move(opt);
        return true;
    } catch (const nlohmann::json::exception& e) {
        log(LogLevel::ERROR, std::string("invalid options document: ") + e.what());
        return false;
    }
}

namespace {
bool parse_u32(const std::string& s, uint32_t& out) {
    if (s.empty() || s.size() > 10) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
    }
    if (v > UINT32_MAX) return false;
    out = static_cast<uint32_t>(v);
    return true;
}
}  // namespace

bool parse_interval_ms(const std::string& s, uint32_t& out) {
    uint32_t v = 0;
    if (!parse_u32(s, v) || v == 0) return false;
    out = v;
    return true;
}

bool parse_addr_ids(const std::string& s, std::vector<uint32_t>& out) {
    std::vector<uint32_t> ids;
    std::istringstream in(s);
    std::string item;
    while (std::getline(in, item, ',')) {
        if (item.empty()) continue;
        uint32_t id = 0;
        if (!parse_u32(item, id)) return false;
        ids.push_back(id);
    }
    out = std::move(ids);
    return true;
}

std::string describe(const Options& opt) {
    std::ostringstream out;
    out << "{addrs: [";
    for (size_t i = 0; i < opt.addrs.size(); ++i) {
        if (i) out << ", ";
        out << opt.addrs[i];
    }
    out << "], interval: " << opt.interval_ms << "ms}";
    return out.str();
}
}  // namespace tcplat
