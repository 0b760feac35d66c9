#pragma once
#include <cstddef>
#include <cstdint>
#include <set>
#include <vector>

namespace tcplat {
// One raw latency measurement. On disk: time, index, val (12 bytes, native order).
// val is NaN when the probe failed.
struct DiscreteRecord {
    static constexpr size_t kPayloadSize = 4;
    static constexpr size_t kOnDiskSize = 8 + kPayloadSize;

    uint32_t time{};
    uint32_t index{};
    float val{};

    void encode_payload(std::vector<uint8_t>& out) const;
    void decode_payload(const uint8_t* p);
};

// Averaged measurement: time, index, mean, standard deviation (16 bytes).
struct AveragedRecord {
    static constexpr size_t kPayloadSize = 8;
    static constexpr size_t kOnDiskSize = 8 + kPayloadSize;

    uint32_t time{};
    uint32_t index{};
    float val{};
    float sd{};

    void encode_payload(std::vector<uint8_t>& out) const;
    void decode_payload(const uint8_t* p);
};

// Records order and compare by address id only, so a set of them holds at most
// one record per address.
inline bool operator<(const DiscreteRecord& a, const DiscreteRecord& b) {
    return a.index < b.index;
}
inline bool operator==(const DiscreteRecord& a, const DiscreteRecord& b) {
    return a.index == b.index;
}
inline bool operator<(const AveragedRecord& a, const AveragedRecord& b) {
    return a.index < b.index;
}
inline bool operator==(const AveragedRecord& a, const AveragedRecord& b) {
    return a.index == b.index;
}

// One probing round. Every member must carry the same time; to_wire checks it.
using TimePackage = std::set<DiscreteRecord>;
using AveragedPackage = std::set<AveragedRecord>;

enum class WireError { Ok, IncompatibleTimes, Truncated };

const char* wire_error_name(WireError err);

void put_u32(std::vector<uint8_t>& out, uint32_t v);
void put_f32(std::vector<uint8_t>& out, float v);
uint32_t get_u32(const uint8_t* p);
float get_f32(const uint8_t* p);

// Full on-disk encoding (time, index, payload), as appended to data files.
template <typename Record>
void encode_record(const Record& rec, std::vector<uint8_t>& out) {
    put_u32(out, rec.time);
    put_u32(out, rec.index);
    rec.encode_payload(out);
}

template <typename Record>
bool decode_record(const uint8_t* data, size_t len, Record& rec) {
    if (len < Record::kOnDiskSize) return false;
    rec.time = get_u32(data);
    rec.index = get_u32(data + 4);
    rec.decode_payload(data + 8);
    return true;
}

template <typename Record>
size_t space_necessary(const std::set<Record>& records) {
    return records.size() * Record::kOnDiskSize;
}

// Appends each record's payload, ascending by id. The shared timestamp and the ids
// are implied by the round and not emitted. On IncompatibleTimes the buffer holds a
// partial write and must be discarded.
template <typename Record>
WireError to_wire(const std::set<Record>& records, std::vector<uint8_t>& wire) {
    bool have_time = false;
    uint32_t time = 0;
    for (const auto& rec : records) {
        if (!have_time) {
            time = rec.time;
            have_time = true;
        } else if (rec.time != time) {
            return WireError::IncompatibleTimes;
        }
        rec.encode_payload(wire);
    }
    return WireError::Ok;
}

// Inverse of to_wire: ids must be the round's ids in ascending order.
template <typename Record>
WireError from_wire(const uint8_t* data, size_t len, uint32_t time,
                    const std::vector<uint32_t>& ids, std::set<Record>& out) {
    if (len < ids.size() * Record::kPayloadSize) return WireError::Truncated;
    for (size_t i = 0; i < ids.size(); ++i) {
        Record rec;
        rec.time = time;
        rec.index = ids[i];
        rec.decode_payload(data + i * Record::kPayloadSize);
        out.insert(rec);
    }
    return WireError::Ok;
}
}  // namespace tcplat
