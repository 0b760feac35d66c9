#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

#include "record.hpp"

namespace tcplat {
class RoundSink {
   public:
    virtual ~RoundSink() = default;
    // False when the sink no longer accepts rounds; the round is dropped.
    virtual bool deliver(TimePackage round) = 0;
};

// Unbounded multi-producer queue of completed rounds between workers and the
// thread that persists them.
class RoundChannel : public RoundSink {
   public:
    bool deliver(TimePackage round) override {
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (closed_) return false;
            queue_.push_back(std::move(round));
        }
        cv_.notify_one();
        return true;
    }

    // Waits up to timeout for a round. False on timeout, or when closed and drained.
    bool recv_for(std::chrono::milliseconds timeout, TimePackage& out) {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mu_);
        return closed_;
    }

   private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<TimePackage> queue_;
    bool closed_{false};
};
}  // namespace tcplat
