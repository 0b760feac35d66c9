#include "tcp_connect.hpp"

#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <limits>

#include "../core/fd.hpp"
#include "../core/logger.hpp"
#include "../core/time_utils.hpp"

namespace tcplat {
namespace {
constexpr float kNoMeasurement = std::numeric_limits<float>::quiet_NaN();

int remaining_ms(uint64_t deadline_ns) {
    uint64_t now = monotonic_ns();
    if (now >= deadline_ns) return 0;
    uint64_t ms = (deadline_ns - now + 999999) / 1000000;
    // poll() takes an int; long waits are split across several calls
    return ms > static_cast<uint64_t>(std::numeric_limits<int>::max())
               ? std::numeric_limits<int>::max()
               : static_cast<int>(ms);
}

// True once fd is connected; false on refusal, error or deadline.
bool connect_before(const addrinfo* ai, uint64_t deadline_ns) {
    Fd fd(::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                   ai->ai_protocol));
    if (!fd) return false;
    if (::connect(fd.get(), ai->ai_addr, ai->ai_addrlen) == 0) return true;
    if (errno != EINPROGRESS) return false;

    pollfd pfd{};
    pfd.fd = fd.get();
    pfd.events = POLLOUT;
    while (true) {
        int wait = remaining_ms(deadline_ns);
        if (wait == 0) return false;
        int rc = ::poll(&pfd, 1, wait);
        if (rc < 0 && errno == EINTR) continue;
        if (rc < 0) return false;
        if (rc > 0) break;
    }
    int err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &err, &len) < 0) return false;
    return err == 0;
}
}  // namespace

bool split_host_port(const std::string& addr, HostPort& out) {
    std::string host, port;
    if (!addr.empty() && addr[0] == '[') {
        auto close = addr.find(']');
        if (close == std::string::npos || close + 1 >= addr.size() || addr[close + 1] != ':')
            return false;
        host = addr.substr(1, close - 1);
        port = addr.substr(close + 2);
    } else {
        auto colon = addr.rfind(':');
        if (colon == std::string::npos) return false;
        host = addr.substr(0, colon);
        port = addr.substr(colon + 1);
        if (host.find(':') != std::string::npos) return false;
    }
    if (host.empty() || port.empty()) return false;
    for (char c : port) {
        if (c < '0' || c > '9') return false;
    }
    out.host = host;
    out.port = port;
    return true;
}

float tcp_connect_ms(const std::string& addr, uint32_t timeout_ms) {
    uint64_t deadline = monotonic_ns() + static_cast<uint64_t>(timeout_ms) * 1000000ULL;
    HostPort hp;
    if (!split_host_port(addr, hp)) {
        log(LogLevel::WARN, "tcp probe: malformed address '" + addr + "'");
        return kNoMeasurement;
    }

    addrinfo hints{};
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_family = AF_UNSPEC;
    addrinfo* res = nullptr;
    int rc = ::getaddrinfo(hp.host.c_str(), hp.port.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        log(LogLevel::DEBUG, "tcp probe: cannot resolve " + addr + ": " + gai_strerror(rc));
        return kNoMeasurement;
    }

    float result = kNoMeasurement;
    for (const addrinfo* ai = res; ai; ai = ai->ai_next) {
        if (remaining_ms(deadline) == 0) break;
        uint64_t start = monotonic_ns();
        if (connect_before(ai, deadline)) {
            result = static_cast<float>((monotonic_ns() - start) / 1e6);
            break;
        }
    }
    ::freeaddrinfo(res);
    return result;
}
}  // namespace tcplat
