#pragma once

#include "gateway/common/noncopyable.h"
#include "gateway/supervisor/WorkerProcess.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <sys/types.h>
#include <vector>

namespace gateway {

namespace network {
class Channel;
class EventLoop;
class Timer;
} // namespace network

namespace supervisor {

// The worker could not be started. Fatal for startup.
class LaunchError : public std::runtime_error {
public:
    explicit LaunchError(const std::string& what) : std::runtime_error(what) {}
};

struct LaunchSpec {
    std::vector<std::string> argv;
    // Empty keeps the gateway's working directory.
    std::string cwd;
    // Set on top of the inherited environment.
    std::map<std::string, std::string> env;
    uint16_t port{0};
    double terminateTimeoutSec{5.0};
    // Receives every output line; logs with a [worker:stdout]/[worker:stderr]
    // tag when empty.
    std::function<void(bool isStderr, const std::string& line)> outputSink;
};

// Starts, watches and stops one worker process on an EventLoop.
// Exit is noticed through a pidfd on the loop, or by polling waitpid when
// the kernel has no pidfd_open. A worker that dies is logged, not respawned.
class ProcessSupervisor : gateway::common::noncopyable {
public:
    using DoneCallback = std::function<void()>;
    using ExitCallback = std::function<void(const WorkerProcess&)>;

    explicit ProcessSupervisor(gateway::network::EventLoop* loop);
    // Blocks until a live worker is gone: SIGTERM, wait, then SIGKILL.
    ~ProcessSupervisor();

    // Throws LaunchError on a missing binary, bad working directory, spawn
    // failure, or when the previous worker has not been reaped yet.
    WorkerProcessPtr Launch(const LaunchSpec& spec);

    // Starting -> Running, once readiness is confirmed.
    void MarkReady(const WorkerProcessPtr& worker);

    // SIGTERM to the worker's process group, SIGKILL after the terminate
    // timeout. done runs once the worker has been reaped and no other member
    // of its group is left, immediately when there is nothing to stop.
    void Terminate(const WorkerProcessPtr& worker, DoneCallback done);

    // Called on every exit, expected or not.
    void SetExitCallback(ExitCallback cb) { exitCallback_ = std::move(cb); }

    const WorkerProcessPtr& current() const { return worker_; }

    // argv[0] resolved against PATH the way execvp would; empty if not found.
    static std::string FindExecutable(const std::string& file);

private:
    void WatchExit();
    void StopWatching();
    void CheckExit();
    void Reap(int waitStatus);
    void OnTerminateTimeout();
    void KillGroup(int sig);
    void DrainGroup(pid_t pgid, bool expected);
    void KillDrainingGroup(int sig);
    void FinishStop();
    void BlockingStop();

    gateway::network::EventLoop* loop_;
    WorkerProcessPtr worker_;
    double terminateTimeoutSec_{5.0};

    int pidfd_{-1};
    std::unique_ptr<gateway::network::Channel> pidfdChannel_;
    std::unique_ptr<gateway::network::Timer> pollTimer_;
    std::unique_ptr<gateway::network::Timer> killTimer_;

    // Process group of a reaped worker whose other members still run.
    pid_t drainingGroup_{-1};
    std::unique_ptr<gateway::network::Timer> groupTimer_;
    std::unique_ptr<gateway::network::Timer> groupKillDeadline_;

    std::vector<DoneCallback> pendingDone_;
    ExitCallback exitCallback_;
};

} // namespace supervisor
} // namespace gateway
