#include "gateway/supervisor/WorkerProcess.h"

#include <cstring>
#include <sys/wait.h>

namespace gateway {
namespace supervisor {

std::string WorkerProcess::exitDescription() const {
    if (state_ != kExited) return StateName(state_);
    if (WIFEXITED(waitStatus_)) {
        return "exited with code " + std::to_string(WEXITSTATUS(waitStatus_));
    }
    if (WIFSIGNALED(waitStatus_)) {
        const int sig = WTERMSIG(waitStatus_);
        const char* name = ::strsignal(sig);
        return "killed by signal " + std::to_string(sig) + " (" + (name ? name : "?") + ")";
    }
    return "exited with status " + std::to_string(waitStatus_);
}

const char* WorkerProcess::StateName(State s) {
    switch (s) {
        case kUnstarted: return "unstarted";
        case kStarting: return "starting";
        case kRunning: return "running";
        case kTerminating: return "terminating";
        case kExited: return "exited";
    }
    return "unknown";
}

} // namespace supervisor
} // namespace gateway
