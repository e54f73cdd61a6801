#pragma once

#include "gateway/GatewayConfig.h"
#include "gateway/ProxyGateway.h"
#include "gateway/common/noncopyable.h"
#include "gateway/supervisor/ProcessSupervisor.h"
#include "gateway/upstream/ReadinessProbe.h"

#include <functional>
#include <memory>
#include <string>

namespace gateway {

namespace network {
class EventLoop;
} // namespace network

// Startup and shutdown order of the whole process:
// launch worker -> wait until ready -> listen ... terminate worker -> reaped.
class GatewayApp : gateway::common::noncopyable {
public:
    enum Phase { kIdle, kStarting, kServing, kStopping, kStopped };

    using StartCallback = std::function<void(bool ok)>;
    using DoneCallback = std::function<void()>;

    GatewayApp(gateway::network::EventLoop* loop, const GatewayConfig& config);
    ~GatewayApp();

    // cb(true) once the listener is up; cb(false) after a launch, readiness or
    // listen failure, with the worker already stopped. Not called when
    // Shutdown interrupts startup.
    void Start(StartCallback cb);

    // Terminates the worker; done runs after it has been reaped.
    void Shutdown(DoneCallback done);

    Phase phase() const { return phase_; }
    const supervisor::WorkerProcessPtr& worker() const { return worker_; }
    ProxyGateway& gateway() { return gateway_; }
    supervisor::ProcessSupervisor& processSupervisor() { return supervisor_; }

    static supervisor::LaunchSpec MakeLaunchSpec(const GatewayConfig& config);

private:
    void OnReadiness(upstream::ReadinessProbe::Result result, const std::string& detail);
    void OnWorkerExit(const supervisor::WorkerProcess& worker);
    void FailStart(const std::string& why);

    gateway::network::EventLoop* loop_;
    const GatewayConfig config_;
    // Declared first so a live worker is stopped last, after the gateway.
    supervisor::ProcessSupervisor supervisor_;
    ProxyGateway gateway_;
    std::unique_ptr<upstream::ReadinessProbe> probe_;
    supervisor::WorkerProcessPtr worker_;
    StartCallback startCallback_;
    Phase phase_{kIdle};
};

} // namespace gateway
