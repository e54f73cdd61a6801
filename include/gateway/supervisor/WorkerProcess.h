#pragma once

#include "gateway/common/noncopyable.h"
#include "gateway/supervisor/OutputDrainer.h"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

namespace gateway {
namespace supervisor {

class ProcessSupervisor;

// Handle to the one backend worker. Only ProcessSupervisor changes it; the
// rest of the gateway reads it through a shared_ptr<const WorkerProcess>.
class WorkerProcess : gateway::common::noncopyable {
public:
    enum State { kUnstarted, kStarting, kRunning, kTerminating, kExited };

    WorkerProcess(std::vector<std::string> argv, uint16_t port, std::map<std::string, std::string> env)
        : argv_(std::move(argv)), port_(port), env_(std::move(env)) {}

    pid_t pid() const { return pid_; }
    uint16_t port() const { return port_; }
    const std::vector<std::string>& argv() const { return argv_; }
    // Variables set on top of the inherited environment.
    const std::map<std::string, std::string>& environment() const { return env_; }

    State state() const { return state_; }
    // A process exists (not yet reaped).
    bool alive() const { return state_ == kStarting || state_ == kRunning || state_ == kTerminating; }
    // Alive and not being shut down.
    bool running() const { return state_ == kStarting || state_ == kRunning; }

    // Raw wait status, valid once state() == kExited.
    int waitStatus() const { return waitStatus_; }
    std::string exitDescription() const;

    const OutputDrainer* stdoutDrainer() const { return stdout_.get(); }
    const OutputDrainer* stderrDrainer() const { return stderr_.get(); }

    static const char* StateName(State s);

private:
    friend class ProcessSupervisor;

    const std::vector<std::string> argv_;
    const uint16_t port_;
    const std::map<std::string, std::string> env_;

    pid_t pid_{-1};
    State state_{kUnstarted};
    int waitStatus_{0};
    std::unique_ptr<OutputDrainer> stdout_;
    std::unique_ptr<OutputDrainer> stderr_;
};

using WorkerProcessPtr = std::shared_ptr<WorkerProcess>;
using ConstWorkerProcessPtr = std::shared_ptr<const WorkerProcess>;

} // namespace supervisor
} // namespace gateway
