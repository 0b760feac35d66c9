#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "../core/record.hpp"
#include "../core/round_channel.hpp"
#include "../store/manager.hpp"

namespace tcplat {
// Background scheduler for one kind. Each round it snapshots the options, probes
// every configured address on its own thread, waits out the interval and emits one
// TimePackage holding a record per address (NaN where no latency was measured).
class TcpPingWorker {
   public:
    // Extra time after the interval for late probe results before they count as NaN.
    static constexpr std::chrono::milliseconds kCollectGrace{250};

    explicit TcpPingWorker(const Manager& manager);
    ~TcpPingWorker();

    TcpPingWorker(const TcpPingWorker&) = delete;
    TcpPingWorker& operator=(const TcpPingWorker&) = delete;

    // Runs rounds on a new thread, delivering each to sink, until stop(). Ignored while
    // a previous start() is still running.
    void start(RoundSink& sink);
    // Wakes the interval wait and joins the scheduler thread.
    void stop();

    // One complete round. Returns false, leaving out empty, if stop() was requested
    // while waiting out the interval.
    bool run_round(TimePackage& out);

   private:
    const Manager& manager_;
    std::thread thread_;
    std::mutex mu_;
    std::condition_variable cv_;
    bool stop_requested_{false};

    void run(RoundSink& sink);
    bool wait_for_stop(std::chrono::milliseconds dur);
};
}  // namespace tcplat
