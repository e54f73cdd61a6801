#pragma once

#include "gateway/common/noncopyable.h"
#include "gateway/network/InetAddress.h"
#include "gateway/upstream/HealthChecker.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace gateway {

namespace network {
class EventLoop;
class Timer;
} // namespace network

namespace upstream {

struct ReadinessOptions {
    double maxWaitSec{30.0};
    double initialBackoffSec{0.1};
    double maxBackoffSec{1.0};
    // Only used without a checker: a fixed wait, then assume ready.
    double graceSec{3.0};
};

// Waits until the worker answers its health endpoint. Attempts are spaced
// by an exponential backoff (doubling, capped) and the whole wait is bounded
// by maxWaitSec. Without a checker it just sleeps graceSec.
class ReadinessProbe : gateway::common::noncopyable {
public:
    enum Result { kReady, kTimedOut, kWorkerExited, kCancelled };

    using Callback = std::function<void(Result result, const std::string& detail)>;
    using AliveFunc = std::function<bool()>;

    ReadinessProbe(gateway::network::EventLoop* loop,
                   HealthCheckerPtr checker,
                   const gateway::network::InetAddress& addr,
                   const ReadinessOptions& options);
    ~ReadinessProbe();

    // alive is polled before every attempt; cb runs exactly once.
    void Start(AliveFunc alive, Callback cb);
    // The worker is gone; finishes with kWorkerExited.
    void NotifyWorkerExited();
    // Finishes with kCancelled.
    void Cancel();

    int attempts() const { return attempts_; }
    bool finished() const { return finished_; }

    static double NextBackoff(double current, double maxBackoff);
    static const char* ResultName(Result r);

private:
    void Attempt();
    void OnCheckDone(bool healthy, const std::string& detail);
    void Finish(Result result, const std::string& detail);
    double RemainingSec() const;

    gateway::network::EventLoop* loop_;
    HealthCheckerPtr checker_;
    const gateway::network::InetAddress addr_;
    const ReadinessOptions options_;

    AliveFunc alive_;
    Callback callback_;
    std::unique_ptr<gateway::network::Timer> timer_;
    std::chrono::steady_clock::time_point deadline_;
    double backoffSec_{0.0};
    int attempts_{0};
    bool started_{false};
    bool finished_{false};
    std::string lastDetail_;
    // Expires with the probe; outstanding checks test it.
    std::shared_ptr<int> lifeToken_;
};

} // namespace upstream
} // namespace gateway
