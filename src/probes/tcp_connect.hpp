#pragma once
#include <cstdint>
#include <string>

namespace tcplat {
struct HostPort {
    std::string host;
    std::string port;
};

// Accepts "host:port" and "[v6addr]:port".
bool split_host_port(const std::string& addr, HostPort& out);

// Milliseconds to establish a TCP connection to addr, or NaN when the name does not
// resolve, every resolved address refuses, or timeout_ms elapses first.
float tcp_connect_ms(const std::string& addr, uint32_t timeout_ms);
}  // namespace tcplat
