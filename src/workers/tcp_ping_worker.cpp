#include "tcp_ping_worker.hpp"

#include <cmath>
#include <future>
#include <limits>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "../core/logger.hpp"
#include "../core/time_utils.hpp"
#include "../probes/tcp_connect.hpp"

namespace tcplat {
namespace {
constexpr float kNoMeasurement = std::numeric_limits<float>::quiet_NaN();

struct Dispatched {
    uint32_t id;
    std::future<float> result;
};

std::future<float> ready_nan() {
    std::promise<float> p;
    p.set_value(kNoMeasurement);
    return p.get_future();
}

// Starts one detached probe thread. The probe owns its promise; if the round has
// already been collected the value is simply never read.
std::future<float> launch_probe(const std::string& addr, uint32_t timeout_ms) {
    std::promise<float> p;
    std::future<float> f = p.get_future();
    try {
        std::thread([addr, timeout_ms, p = std::move(p)]() mutable {
            p.set_value(tcp_connect_ms(addr, timeout_ms));
        }).detach();
    } catch (const std::system_error& e) {
        log(LogLevel::ERROR, "cannot start probe thread for " + addr + ": " + e.what());
        return ready_nan();
    }
    return f;
}

float collect(std::future<float>& f, std::chrono::steady_clock::time_point deadline) {
    if (f.wait_until(deadline) != std::future_status::ready) return kNoMeasurement;
    try {
        return f.get();
    } catch (const std::future_error&) {
        return kNoMeasurement;
    }
}
}  // namespace

TcpPingWorker::TcpPingWorker(const Manager& manager) : manager_(manager) {}

TcpPingWorker::~TcpPingWorker() {
    stop();
}

void TcpPingWorker::start(RoundSink& sink) {
    if (thread_.joinable()) {
        log(LogLevel::WARN, "worker " + manager_.kind().name + " already running");
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mu_);
        stop_requested_ = false;
    }
    thread_ = std::thread([this, &sink] { run(sink); });
    log(LogLevel::INFO, "worker " + manager_.kind().name + " started");
}

void TcpPingWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
        log(LogLevel::INFO, "worker " + manager_.kind().name + " stopped");
    }
}

bool TcpPingWorker::wait_for_stop(std::chrono::milliseconds dur) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, dur, [this] { return stop_requested_; });
}

bool TcpPingWorker::run_round(TimePackage& out) {
    out.clear();
    Options opt = manager_.options_snapshot();
    auto interval = std::chrono::milliseconds(opt.interval_ms);
    auto round_start = std::chrono::steady_clock::now();
    uint32_t timestamp = unix_seconds();

    std::vector<Dispatched> dispatched;
    dispatched.reserve(opt.addrs.size());
    for (uint32_t id : opt.addrs) {
        std::optional<std::string> addr = manager_.index_read()->get_addr(id);
        if (!addr) {
            log(LogLevel::WARN, manager_.kind().name + ": no address for id " +
                                    std::to_string(id));
            dispatched.push_back({id, ready_nan()});
            continue;
        }
        dispatched.push_back({id, launch_probe(*addr, opt.interval_ms)});
    }

    if (wait_for_stop(interval)) return false;

    auto deadline = round_start + interval + kCollectGrace;
    size_t failed = 0;
    for (auto& d : dispatched) {
        DiscreteRecord rec;
        rec.time = timestamp;
        rec.index = d.id;
        rec.val = collect(d.result, deadline);
        if (std::isnan(rec.val)) ++failed;
        out.insert(rec);
    }
    log(LogLevel::DEBUG, manager_.kind().name + " round " + format_unix_seconds(timestamp) +
                             ": " + std::to_string(out.size()) + " records, " +
                             std::to_string(failed) + " unreachable");
    return true;
}

void TcpPingWorker::run(RoundSink& sink) {
    while (true) {
        TimePackage round;
        if (!run_round(round)) break;
        if (!sink.deliver(std::move(round))) {
            log(LogLevel::WARN, "worker " + manager_.kind().name +
                                    ": failed to send round results, round dropped");
        }
    }
}
}  // namespace tcplat
