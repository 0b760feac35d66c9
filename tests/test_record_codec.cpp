#include <cmath>
#include <cstring>
#include <limits>
#include <vector>

#include "../src/core/record.hpp"

using namespace tcplat;

static DiscreteRecord rec(uint32_t time, uint32_t index, float val) {
    DiscreteRecord r;
    r.time = time;
    r.index = index;
    r.val = val;
    return r;
}

int main() {
    // same address id, different time: the first insert wins
    TimePackage dup;
    dup.insert(rec(100, 7, 1.5f));
    dup.insert(rec(200, 7, 9.0f));
    if (dup.size() != 1) return 1;
    if (dup.begin()->time != 100 || dup.begin()->val != 1.5f) return 2;

    TimePackage empty;
    if (space_necessary(empty) != 0) return 3;
    TimePackage one{rec(5, 1, 2.0f)};
    if (space_necessary(one) != DiscreteRecord::kOnDiskSize) return 4;
    TimePackage many{rec(5, 3, 1.0f), rec(5, 1, 2.0f), rec(5, 2, 3.0f), rec(5, 9, 4.0f)};
    if (space_necessary(many) != 4 * DiscreteRecord::kOnDiskSize) return 5;
    AveragedPackage avg_many{{5, 1, 1.0f, 0.5f}, {5, 2, 2.0f, 0.25f}};
    if (space_necessary(avg_many) != 2 * AveragedRecord::kOnDiskSize) return 6;

    // payload only, ascending by id, regardless of insertion order
    std::vector<uint8_t> wire;
    wire.reserve(space_necessary(many));
    if (to_wire(many, wire) != WireError::Ok) return 7;
    if (wire.size() != 4 * DiscreteRecord::kPayloadSize) return 8;
    const float expected[] = {2.0f, 3.0f, 1.0f, 4.0f};
    for (size_t i = 0; i < 4; ++i) {
        float v;
        std::memcpy(&v, wire.data() + i * 4, 4);
        if (v != expected[i]) return 9;
    }

    std::vector<uint32_t> ids;
    for (const auto& r : many) ids.push_back(r.index);
    TimePackage back;
    if (from_wire(wire.data(), wire.size(), 5, ids, back) != WireError::Ok) return 10;
    auto it = back.begin();
    for (const auto& r : many) {
        if (it->index != r.index || it->time != 5) return 11;
        if (std::memcmp(&it->val, &r.val, sizeof(float)) != 0) return 12;
        ++it;
    }
    if (from_wire(wire.data(), wire.size() - 1, 5, ids, back) != WireError::Truncated) return 13;

    // NaN sentinel survives bit-exact
    TimePackage with_nan{rec(8, 0, std::numeric_limits<float>::quiet_NaN()), rec(8, 1, 0.5f)};
    std::vector<uint8_t> nan_wire;
    if (to_wire(with_nan, nan_wire) != WireError::Ok) return 14;
    float first;
    std::memcpy(&first, nan_wire.data(), 4);
    if (!std::isnan(first)) return 15;

    TimePackage mixed{rec(10, 1, 1.0f), rec(11, 2, 2.0f), rec(10, 3, 3.0f)};
    std::vector<uint8_t> bad;
    if (to_wire(mixed, bad) != WireError::IncompatibleTimes) return 16;

    AveragedPackage avg{{42, 4, 10.0f, 1.0f}, {42, 2, 20.0f, 2.0f}};
    std::vector<uint8_t> avg_wire;
    if (to_wire(avg, avg_wire) != WireError::Ok) return 17;
    if (avg_wire.size() != 2 * AveragedRecord::kPayloadSize) return 18;
    float pair[4];
    std::memcpy(pair, avg_wire.data(), sizeof(pair));
    if (pair[0] != 20.0f || pair[1] != 2.0f || pair[2] != 10.0f || pair[3] != 1.0f) return 19;

    // on-disk layout: time, index, value with no padding
    std::vector<uint8_t> disk;
    encode_record(rec(0x01020304u, 0x0a0b0c0du, 6.25f), disk);
    if (disk.size() != 12) return 20;
    uint32_t t, idx;
    float v;
    std::memcpy(&t, disk.data(), 4);
    std::memcpy(&idx, disk.data() + 4, 4);
    std::memcpy(&v, disk.data() + 8, 4);
    if (t != 0x01020304u || idx != 0x0a0b0c0du || v != 6.25f) return 21;
    DiscreteRecord decoded;
    if (!decode_record(disk.data(), disk.size(), decoded)) return 22;
    if (decoded.time != t || decoded.index != idx || decoded.val != v) return 23;
    if (decode_record(disk.data(), disk.size() - 1, decoded)) return 24;
    return 0;
}
