#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../src/store/options.hpp"

int main() {
    tcplat::Options opt;
    opt.addrs = {3, 1, 2};
    opt.interval_ms = 2500;
    nlohmann::json doc = tcplat::options_to_json(opt);
    if (doc["interval"] != 2500) return 1;
    if (doc["addrs"].size() != 3 || doc["addrs"][0] != 3) return 2;

    tcplat::Options parsed;
    if (!tcplat::options_from_json(nlohmann::json::parse(R"({"addrs":[0],"interval":5000})"),
                                   parsed))
        return 3;
    if (parsed.addrs.size() != 1 || parsed.addrs[0] != 0 || parsed.interval_ms != 5000) return 4;

    tcplat::Options untouched = opt;
    if (tcplat::options_from_json(nlohmann::json::parse(R"({"addrs":"0"})"), untouched)) return 5;
    if (untouched != opt) return 6;

    if (tcplat::describe(opt) != "{addrs: [3, 1, 2], interval: 2500ms}") return 7;

    uint32_t interval = 7;
    if (!tcplat::parse_interval_ms("1500", interval) || interval != 1500) return 8;
    if (!tcplat::parse_interval_ms("4294967295", interval) || interval != 4294967295u) return 9;
    if (tcplat::parse_interval_ms("-5", interval)) return 10;
    if (tcplat::parse_interval_ms("0", interval)) return 11;
    if (tcplat::parse_interval_ms("4294967296", interval)) return 12;
    if (tcplat::parse_interval_ms("10ms", interval)) return 13;
    if (interval != 4294967295u) return 14;

    std::vector<uint32_t> ids{9};
    if (!tcplat::parse_addr_ids("0,2,,5", ids) || ids != std::vector<uint32_t>{0, 2, 5}) return 15;
    if (tcplat::parse_addr_ids("1,-2", ids)) return 16;
    if (ids != std::vector<uint32_t>{0, 2, 5}) return 17;
    return 0;
}
