#include "gateway/upstream/ReadinessProbe.h"
#include "gateway/common/Logger.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/Timer.h"

#include <algorithm>

namespace gateway {
namespace upstream {

ReadinessProbe::ReadinessProbe(gateway::network::EventLoop* loop,
                               HealthCheckerPtr checker,
                               const gateway::network::InetAddress& addr,
                               const ReadinessOptions& options)
    : loop_(loop),
      checker_(std::move(checker)),
      addr_(addr),
      options_(options),
      lifeToken_(std::make_shared<int>(0)) {
}

ReadinessProbe::~ReadinessProbe() {
    lifeToken_.reset();
}

double ReadinessProbe::NextBackoff(double current, double maxBackoff) {
    return std::min(current * 2.0, maxBackoff);
}

const char* ReadinessProbe::ResultName(Result r) {
    switch (r) {
        case kReady: return "ready";
        case kTimedOut: return "timed out";
        case kWorkerExited: return "worker exited";
        case kCancelled: return "cancelled";
    }
    return "unknown";
}

void ReadinessProbe::Start(AliveFunc alive, Callback cb) {
    if (started_) return;
    started_ = true;
    alive_ = std::move(alive);
    callback_ = std::move(cb);
    timer_.reset(new gateway::network::Timer(loop_, [this]() { Attempt(); }));

    if (!checker_) {
        LOG_INFO << "Readiness probe disabled, waiting " << options_.graceSec << "s for the worker";
        timer_->Start(options_.graceSec);
        return;
    }

    deadline_ = std::chrono::steady_clock::now() +
                std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                    std::chrono::duration<double>(options_.maxWaitSec));
    backoffSec_ = options_.initialBackoffSec;
    LOG_INFO << "Waiting for worker at " << addr_.toIpPort() << " (up to " << options_.maxWaitSec << "s)";
    Attempt();
}

void ReadinessProbe::NotifyWorkerExited() {
    Finish(kWorkerExited, lastDetail_.empty() ? "worker exited" : lastDetail_);
}

void ReadinessProbe::Cancel() {
    Finish(kCancelled, "cancelled");
}

double ReadinessProbe::RemainingSec() const {
    const auto left = deadline_ - std::chrono::steady_clock::now();
    return std::chrono::duration<double>(left).count();
}

void ReadinessProbe::Attempt() {
    if (finished_) return;
    if (alive_ && !alive_()) {
        Finish(kWorkerExited, "worker exited before becoming ready");
        return;
    }
    if (!checker_) {
        Finish(kReady, "grace period elapsed");
        return;
    }

    ++attempts_;
    std::weak_ptr<int> life(lifeToken_);
    checker_->Check(addr_, [this, life](bool healthy, const std::string& detail) {
        if (life.expired()) return;
        OnCheckDone(healthy, detail);
    });
}

void ReadinessProbe::OnCheckDone(bool healthy, const std::string& detail) {
    if (finished_) return;
    lastDetail_ = detail;
    if (healthy) {
        Finish(kReady, detail);
        return;
    }
    if (alive_ && !alive_()) {
        Finish(kWorkerExited, "worker exited before becoming ready");
        return;
    }
    const double remaining = RemainingSec();
    if (remaining <= 0.0) {
        Finish(kTimedOut, "no healthy answer within " + std::to_string(options_.maxWaitSec) + "s, last: " + detail);
        return;
    }

    LOG_DEBUG << "Worker not ready (attempt " << attempts_ << ": " << detail << "), retrying in "
              << std::min(backoffSec_, remaining) << "s";
    timer_->Start(std::min(backoffSec_, remaining));
    backoffSec_ = NextBackoff(backoffSec_, options_.maxBackoffSec);
}

void ReadinessProbe::Finish(Result result, const std::string& detail) {
    if (finished_ || !started_) return;
    finished_ = true;
    if (timer_) timer_->Cancel();

    if (result == kReady) {
        LOG_INFO << "Worker at " << addr_.toIpPort() << " is ready after " << attempts_ << " probe(s): " << detail;
    } else if (result != kCancelled) {
        LOG_ERROR << "Worker readiness failed (" << ResultName(result) << "): " << detail;
    }

    Callback cb = std::move(callback_);
    callback_ = nullptr;
    if (cb) cb(result, detail);
}

} // namespace upstream
} // namespace gateway
