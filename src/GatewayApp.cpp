#include "gateway/GatewayApp.h"
#include "gateway/common/Logger.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/InetAddress.h"
#include "gateway/upstream/HttpHealthChecker.h"

namespace gateway {

GatewayApp::GatewayApp(gateway::network::EventLoop* loop, const GatewayConfig& config)
    : loop_(loop),
      config_(config),
      supervisor_(loop),
      gateway_(loop, config) {
    supervisor_.SetExitCallback([this](const supervisor::WorkerProcess& worker) { OnWorkerExit(worker); });
}

GatewayApp::~GatewayApp() {
    supervisor_.SetExitCallback(nullptr);
}

supervisor::LaunchSpec GatewayApp::MakeLaunchSpec(const GatewayConfig& config) {
    supervisor::LaunchSpec spec;
    spec.argv = config.workerArgv;
    spec.cwd = config.workerCwd;
    spec.env = config.WorkerEnvironment();
    spec.port = config.workerPort;
    spec.terminateTimeoutSec = config.terminateTimeoutSec;
    return spec;
}

void GatewayApp::Start(StartCallback cb) {
    if (phase_ != kIdle) {
        LOG_WARN << "GatewayApp::Start called twice";
        return;
    }
    phase_ = kStarting;
    startCallback_ = std::move(cb);

    try {
        worker_ = supervisor_.Launch(MakeLaunchSpec(config_));
    } catch (const supervisor::LaunchError& e) {
        LOG_ERROR << "Cannot launch worker: " << e.what();
        phase_ = kStopped;
        // Reported from the loop so callers may Quit() it.
        StartCallback done = std::move(startCallback_);
        loop_->QueueInLoop([done]() {
            if (done) done(false);
        });
        return;
    }
    gateway_.SetWorker(worker_);

    upstream::HealthCheckerPtr checker;
    if (config_.readinessProbe) {
        checker = std::make_shared<upstream::HttpHealthChecker>(loop_, config_.probeTimeoutSec, config_.readinessPath);
    }
    upstream::ReadinessOptions options;
    options.maxWaitSec = config_.readinessMaxWaitSec;
    options.initialBackoffSec = config_.readinessInitialBackoffSec;
    options.maxBackoffSec = config_.readinessMaxBackoffSec;
    options.graceSec = config_.readinessGraceSec;
    probe_.reset(new upstream::ReadinessProbe(loop_, checker,
                                              gateway::network::InetAddress("127.0.0.1", config_.workerPort), options));

    supervisor::ConstWorkerProcessPtr worker = worker_;
    probe_->Start([worker]() { return worker->running(); },
                  [this](upstream::ReadinessProbe::Result result, const std::string& detail) {
                      OnReadiness(result, detail);
                  });
}

void GatewayApp::OnReadiness(upstream::ReadinessProbe::Result result, const std::string& detail) {
    if (result == upstream::ReadinessProbe::kCancelled) {
        LOG_INFO << "Startup interrupted before the worker became ready";
        return;
    }
    if (phase_ != kStarting) return;
    if (result != upstream::ReadinessProbe::kReady) {
        FailStart(std::string("worker not ready: ") + upstream::ReadinessProbe::ResultName(result) + ", " + detail);
        return;
    }

    supervisor_.MarkReady(worker_);
    if (!gateway_.Start()) {
        FailStart("listener could not be started");
        return;
    }
    phase_ = kServing;
    StartCallback cb = std::move(startCallback_);
    startCallback_ = nullptr;
    if (cb) cb(true);
}

void GatewayApp::FailStart(const std::string& why) {
    LOG_ERROR << "Startup failed: " << why;
    phase_ = kStopping;
    supervisor_.Terminate(worker_, [this]() {
        phase_ = kStopped;
        StartCallback cb = std::move(startCallback_);
        startCallback_ = nullptr;
        if (cb) cb(false);
    });
}

void GatewayApp::OnWorkerExit(const supervisor::WorkerProcess& worker) {
    if (phase_ == kStarting && probe_ && !probe_->finished()) {
        probe_->NotifyWorkerExited();
    } else if (phase_ == kServing) {
        LOG_WARN << "Serving without a worker (" << worker.exitDescription() << "), proxied requests now get 503";
    }
}

void GatewayApp::Shutdown(DoneCallback done) {
    if (phase_ == kStopped || phase_ == kIdle) {
        phase_ = kStopped;
        if (done) done();
        return;
    }
    if (probe_ && !probe_->finished()) {
        probe_->Cancel();
    }
    phase_ = kStopping;
    LOG_INFO << "Shutting down";
    supervisor_.Terminate(worker_, [this, done]() {
        phase_ = kStopped;
        LOG_INFO << "Worker stopped, gateway exiting";
        if (done) done();
    });
}

} // namespace gateway
