#include "record.hpp"

#include <cstring>

namespace tcplat {
static_assert(sizeof(float) == 4, "records require 32-bit floats");

const char* wire_error_name(WireError err) {
    switch (err) {
        case WireError::Ok: return "ok";
        case WireError::IncompatibleTimes: return "incompatible_times";
        case WireError::Truncated: return "truncated";
    }
    return "?";
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    uint8_t b[4];
    std::memcpy(b, &v, sizeof(b));
    out.insert(out.end(), b, b + sizeof(b));
}

void put_f32(std::vector<uint8_t>& out, float v) {
    uint8_t b[4];
    std::memcpy(b, &v, sizeof(b));
    out.insert(out.end(), b, b + sizeof(b));
}

uint32_t get_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, sizeof(v));
    return v;
}

float get_f32(const uint8_t* p) {
    float v;
    std::memcpy(&v, p, sizeof(v));
    return v;
}

void DiscreteRecord::encode_payload(std::vector<uint8_t>& out) const {
    put_f32(out, val);
}

void DiscreteRecord::decode_payload(const uint8_t* p) {
    val = get_f32(p);
}

void AveragedRecord::encode_payload(std::vector<uint8_t>& out) const {
    put_f32(out, val);
    put_f32(out, sd);
}

void AveragedRecord::decode_payload(const uint8_t* p) {
    val = get_f32(p);
    sd = get_f32(p + 4);
}
}  // namespace tcplat
