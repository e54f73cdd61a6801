#include "gateway/supervisor/ProcessSupervisor.h"
#include "gateway/common/Logger.h"
#include "gateway/network/Channel.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/Timer.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <fstream>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace gateway {
namespace supervisor {

namespace {

const double kExitPollIntervalSec = 0.1;
const double kGroupPollIntervalSec = 0.05;
// How long to wait for the group to vanish once SIGKILL has been sent.
const double kGroupKillWaitSec = 1.0;

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int OpenPidfd(pid_t pid) {
#ifdef SYS_pidfd_open
    return static_cast<int>(::syscall(SYS_pidfd_open, pid, 0));
#else
    (void)pid;
    errno = ENOSYS;
    return -1;
#endif
}

bool IsExecutableFile(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) return false;
    return ::access(path.c_str(), X_OK) == 0;
}

// Inherited environment with the overrides replacing same-named entries.
std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** e = ::environ; e && *e; ++e) {
        const char* eq = std::strchr(*e, '=');
        const std::string key = eq ? std::string(*e, static_cast<size_t>(eq - *e)) : std::string(*e);
        if (overrides.count(key)) continue;
        env.emplace_back(*e);
    }
    for (const auto& kv : overrides) {
        env.push_back(kv.first + "=" + kv.second);
    }
    return env;
}

// True while any non-zombie process is in group pgid. Zombies left behind by
// a parent that does not reap them no longer run and are not counted.
bool GroupHasLiveMembers(pid_t pgid) {
    DIR* proc = ::opendir("/proc");
    if (!proc) return ::kill(-pgid, 0) == 0;
    bool live = false;
    while (struct dirent* ent = ::readdir(proc)) {
        if (ent->d_name[0] < '0' || ent->d_name[0] > '9') continue;
        std::ifstream f(std::string("/proc/") + ent->d_name + "/stat");
        std::string stat;
        if (!std::getline(f, stat)) continue;
        // pid (comm) state ppid pgrp ...; comm may hold spaces and parens.
        const size_t close = stat.rfind(')');
        if (close == std::string::npos || close + 2 >= stat.size()) continue;
        char state = 0;
        long ppid = 0;
        long pgrp = 0;
        if (std::sscanf(stat.c_str() + close + 2, "%c %ld %ld", &state, &ppid, &pgrp) != 3) continue;
        if (pgrp == pgid && state != 'Z' && state != 'X') {
            live = true;
            break;
        }
    }
    ::closedir(proc);
    return live;
}

std::vector<char*> ToCharPtrs(std::vector<std::string>& items) {
    std::vector<char*> out;
    out.reserve(items.size() + 1);
    for (auto& s : items) out.push_back(&s[0]);
    out.push_back(nullptr);
    return out;
}

// posix_spawn file actions and attributes, released on every exit path.
struct SpawnSetup {
    posix_spawn_file_actions_t actions;
    posix_spawnattr_t attr;
    bool haveActions{false};
    bool haveAttr{false};

    ~SpawnSetup() {
        if (haveActions) ::posix_spawn_file_actions_destroy(&actions);
        if (haveAttr) ::posix_spawnattr_destroy(&attr);
    }
};

} // namespace

ProcessSupervisor::ProcessSupervisor(gateway::network::EventLoop* loop)
    : loop_(loop) {
}

ProcessSupervisor::~ProcessSupervisor() {
    BlockingStop();
    StopWatching();
}

std::string ProcessSupervisor::FindExecutable(const std::string& file) {
    if (file.empty()) return std::string();
    if (file.find('/') != std::string::npos) {
        return IsExecutableFile(file) ? file : std::string();
    }
    const char* pathEnv = ::getenv("PATH");
    const std::string path = (pathEnv && *pathEnv) ? pathEnv : "/bin:/usr/bin";
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();
        std::string dir = path.substr(start, end - start);
        if (dir.empty()) dir = ".";
        const std::string candidate = dir + "/" + file;
        if (IsExecutableFile(candidate)) return candidate;
        start = end + 1;
    }
    return std::string();
}

WorkerProcessPtr ProcessSupervisor::Launch(const LaunchSpec& spec) {
    if (worker_ && worker_->alive()) {
        throw LaunchError("previous worker pid=" + std::to_string(worker_->pid()) + " is still " +
                          WorkerProcess::StateName(worker_->state()));
    }
    if (drainingGroup_ > 0) {
        throw LaunchError("processes of previous worker group " + std::to_string(drainingGroup_) + " are still stopping");
    }
    if (spec.argv.empty() || spec.argv[0].empty()) {
        throw LaunchError("worker command is empty");
    }

    if (!spec.cwd.empty()) {
        struct stat st;
        if (::stat(spec.cwd.c_str(), &st) != 0) {
            throw LaunchError("worker directory " + spec.cwd + ": " + std::strerror(errno));
        }
        if (!S_ISDIR(st.st_mode)) {
            throw LaunchError("worker directory " + spec.cwd + " is not a directory");
        }
    }

    // posix_spawnp may report a missing binary only as exit status 127 of the
    // child, so look it up first. Relative paths resolve in the worker's cwd.
    std::string program = spec.argv[0];
    if (program.find('/') != std::string::npos && program[0] != '/' && !spec.cwd.empty()) {
        program = spec.cwd + "/" + program;
    }
    if (FindExecutable(program).empty()) {
        throw LaunchError("worker command not found or not executable: " + spec.argv[0]);
    }

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0 || ::pipe2(errPipe, O_CLOEXEC) != 0) {
        const int saved = errno;
        CloseFd(outPipe[0]);
        CloseFd(outPipe[1]);
        throw LaunchError(std::string("pipe2 failed: ") + std::strerror(saved));
    }
    auto closePipes = [&]() {
        CloseFd(outPipe[0]);
        CloseFd(outPipe[1]);
        CloseFd(errPipe[0]);
        CloseFd(errPipe[1]);
    };

    SpawnSetup setup;
    setup.haveActions = ::posix_spawn_file_actions_init(&setup.actions) == 0;
    setup.haveAttr = ::posix_spawnattr_init(&setup.attr) == 0;
    if (!setup.haveActions || !setup.haveAttr) {
        closePipes();
        throw LaunchError("posix_spawn setup failed");
    }

    int rc = 0;
    rc |= ::posix_spawn_file_actions_addopen(&setup.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    rc |= ::posix_spawn_file_actions_adddup2(&setup.actions, outPipe[1], STDOUT_FILENO);
    rc |= ::posix_spawn_file_actions_adddup2(&setup.actions, errPipe[1], STDERR_FILENO);
    if (!spec.cwd.empty()) {
        rc |= ::posix_spawn_file_actions_addchdir_np(&setup.actions, spec.cwd.c_str());
    }

    // The gateway blocks SIGINT/SIGTERM for its signalfd and ignores SIGPIPE;
    // the worker starts with a clean mask and default dispositions, in a
    // process group of its own so the whole tree can be signalled.
    sigset_t emptyMask;
    sigemptyset(&emptyMask);
    sigset_t defaults;
    sigemptyset(&defaults);
    sigaddset(&defaults, SIGPIPE);
    sigaddset(&defaults, SIGINT);
    sigaddset(&defaults, SIGTERM);
    sigaddset(&defaults, SIGCHLD);
    rc |= ::posix_spawnattr_setsigmask(&setup.attr, &emptyMask);
    rc |= ::posix_spawnattr_setsigdefault(&setup.attr, &defaults);
    rc |= ::posix_spawnattr_setpgroup(&setup.attr, 0);
    rc |= ::posix_spawnattr_setflags(&setup.attr, POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETPGROUP);
    if (rc != 0) {
        closePipes();
        throw LaunchError("posix_spawn setup failed");
    }

    std::vector<std::string> argvStore = spec.argv;
    std::vector<std::string> envStore = BuildEnvironment(spec.env);
    std::vector<char*> argvPtrs = ToCharPtrs(argvStore);
    std::vector<char*> envPtrs = ToCharPtrs(envStore);

    pid_t pid = -1;
    const int sp = ::posix_spawnp(&pid, argvPtrs[0], &setup.actions, &setup.attr, argvPtrs.data(), envPtrs.data());
    CloseFd(outPipe[1]);
    CloseFd(errPipe[1]);
    if (sp != 0) {
        closePipes();
        throw LaunchError("cannot start " + spec.argv[0] + ": " + std::strerror(sp));
    }

    auto worker = std::make_shared<WorkerProcess>(spec.argv, spec.port, spec.env);
    worker->pid_ = pid;
    worker->state_ = WorkerProcess::kStarting;

    auto sink = spec.outputSink;
    worker->stdout_.reset(new OutputDrainer(loop_, outPipe[0], "stdout", [sink](const std::string& line) {
        if (sink) {
            sink(false, line);
        } else {
            LOG_INFO << "[worker:stdout] " << line;
        }
    }));
    worker->stderr_.reset(new OutputDrainer(loop_, errPipe[0], "stderr", [sink](const std::string& line) {
        if (sink) {
            sink(true, line);
        } else {
            LOG_WARN << "[worker:stderr] " << line;
        }
    }));
    outPipe[0] = -1;
    errPipe[0] = -1;
    worker->stdout_->Start();
    worker->stderr_->Start();

    StopWatching();
    worker_ = worker;
    terminateTimeoutSec_ = spec.terminateTimeoutSec > 0.0 ? spec.terminateTimeoutSec : 5.0;
    WatchExit();

    std::string cmd;
    for (const auto& a : spec.argv) {
        if (!cmd.empty()) cmd += ' ';
        cmd += a;
    }
    LOG_INFO << "Started worker pid=" << pid << " port=" << spec.port << " cmd=\"" << cmd << "\""
             << (spec.cwd.empty() ? std::string() : " cwd=" + spec.cwd);
    return worker;
}

void ProcessSupervisor::MarkReady(const WorkerProcessPtr& worker) {
    if (!worker || worker != worker_ || worker->state_ != WorkerProcess::kStarting) return;
    worker->state_ = WorkerProcess::kRunning;
    LOG_INFO << "Worker pid=" << worker->pid() << " is ready on port " << worker->port();
}

void ProcessSupervisor::Terminate(const WorkerProcessPtr& worker, DoneCallback done) {
    if (worker && worker == worker_ && drainingGroup_ > 0) {
        if (done) pendingDone_.push_back(std::move(done));
        return;
    }
    if (!worker || worker != worker_ || !worker->alive()) {
        if (done) done();
        return;
    }
    if (done) pendingDone_.push_back(std::move(done));
    if (worker->state_ == WorkerProcess::kTerminating) return;

    worker->state_ = WorkerProcess::kTerminating;
    LOG_INFO << "Terminating worker pid=" << worker->pid() << " (SIGTERM, " << terminateTimeoutSec_ << "s grace)";
    KillGroup(SIGTERM);

    killTimer_.reset(new gateway::network::Timer(loop_, [this]() { OnTerminateTimeout(); }));
    if (!killTimer_->Start(terminateTimeoutSec_)) {
        LOG_ERROR << "Cannot arm terminate timer, sending SIGKILL now";
        KillGroup(SIGKILL);
    }
}

void ProcessSupervisor::OnTerminateTimeout() {
    if (drainingGroup_ > 0) {
        LOG_WARN << "ShutdownTimeout: processes of worker group " << drainingGroup_ << " still alive after "
                 << terminateTimeoutSec_ << "s, sending SIGKILL";
        KillDrainingGroup(SIGKILL);
        return;
    }
    if (!worker_ || !worker_->alive()) return;
    LOG_WARN << "ShutdownTimeout: worker pid=" << worker_->pid() << " still alive after "
             << terminateTimeoutSec_ << "s, sending SIGKILL";
    KillGroup(SIGKILL);
}

void ProcessSupervisor::KillGroup(int sig) {
    if (!worker_ || worker_->pid_ <= 0) return;
    const pid_t pid = worker_->pid_;
    // The group is gone if the worker moved itself elsewhere; fall back to the pid.
    if (::kill(-pid, sig) != 0) {
        if (::kill(pid, sig) != 0 && errno != ESRCH) {
            LOG_ERROR << "kill(" << pid << ", " << sig << ") failed: " << std::strerror(errno);
        }
    }
}

void ProcessSupervisor::KillDrainingGroup(int sig) {
    if (::kill(-drainingGroup_, sig) != 0 && errno != ESRCH) {
        LOG_ERROR << "kill(-" << drainingGroup_ << ", " << sig << ") failed: " << std::strerror(errno);
    }
    if (sig == SIGKILL && !groupKillDeadline_) {
        groupKillDeadline_.reset(new gateway::network::Timer(loop_, [this]() {
            LOG_ERROR << "Worker group " << drainingGroup_ << " survived SIGKILL, giving up on it";
            FinishStop();
        }));
        groupKillDeadline_->Start(kGroupKillWaitSec);
    }
}

void ProcessSupervisor::DrainGroup(pid_t pgid, bool expected) {
    drainingGroup_ = pgid;
    if (expected) {
        LOG_INFO << "Waiting for the rest of worker group " << pgid << " to exit";
        // Terminate's timer still runs unless it could not be armed.
        if (!killTimer_) KillDrainingGroup(SIGKILL);
    } else {
        // Leftovers of a crashed worker keep its output pipes open; stop them.
        LOG_WARN << "Worker group " << pgid << " outlived its leader, sending SIGTERM";
        KillDrainingGroup(SIGTERM);
        killTimer_.reset(new gateway::network::Timer(loop_, [this]() { OnTerminateTimeout(); }));
        if (!killTimer_->Start(terminateTimeoutSec_)) KillDrainingGroup(SIGKILL);
    }
    groupTimer_.reset(new gateway::network::Timer(loop_, [this]() {
        if (!GroupHasLiveMembers(drainingGroup_)) {
            LOG_INFO << "Worker group " << drainingGroup_ << " is gone";
            FinishStop();
        }
    }));
    groupTimer_->Start(kGroupPollIntervalSec, kGroupPollIntervalSec);
}

void ProcessSupervisor::FinishStop() {
    drainingGroup_ = -1;
    killTimer_.reset();
    groupTimer_.reset();
    groupKillDeadline_.reset();

    std::vector<DoneCallback> done;
    done.swap(pendingDone_);
    for (const auto& cb : done) {
        cb();
    }
}

void ProcessSupervisor::WatchExit() {
    pidfd_ = OpenPidfd(worker_->pid_);
    if (pidfd_ >= 0) {
        pidfdChannel_.reset(new gateway::network::Channel(loop_, pidfd_));
        pidfdChannel_->SetReadCallback([this](std::chrono::system_clock::time_point) { CheckExit(); });
        pidfdChannel_->EnableReading();
        return;
    }
    LOG_DEBUG << "pidfd_open unavailable (" << std::strerror(errno) << "), polling waitpid";
    pollTimer_.reset(new gateway::network::Timer(loop_, [this]() { CheckExit(); }));
    pollTimer_->Start(kExitPollIntervalSec, kExitPollIntervalSec);
}

void ProcessSupervisor::StopWatching() {
    if (pidfdChannel_) loop_->ReleaseChannel(std::move(pidfdChannel_));
    CloseFd(pidfd_);
    pollTimer_.reset();
}

void ProcessSupervisor::CheckExit() {
    if (!worker_ || !worker_->alive()) return;
    int status = 0;
    const pid_t r = ::waitpid(worker_->pid_, &status, WNOHANG);
    if (r == worker_->pid_) {
        Reap(status);
    } else if (r < 0 && errno == ECHILD) {
        LOG_ERROR << "Worker pid=" << worker_->pid_ << " was reaped elsewhere";
        Reap(0);
    } else if (r < 0 && errno != EINTR) {
        LOG_ERROR << "waitpid(" << worker_->pid_ << ") failed: " << std::strerror(errno);
    }
}

void ProcessSupervisor::Reap(int waitStatus) {
    WorkerProcessPtr worker = worker_;
    const bool expected = worker->state_ == WorkerProcess::kTerminating;
    worker->waitStatus_ = waitStatus;
    worker->state_ = WorkerProcess::kExited;
    StopWatching();
    const bool groupLeft = GroupHasLiveMembers(worker->pid_);
    if (!groupLeft) killTimer_.reset();

    if (expected) {
        LOG_INFO << "Worker pid=" << worker->pid() << " stopped: " << worker->exitDescription();
    } else {
        LOG_ERROR << "Worker pid=" << worker->pid() << " died unexpectedly: " << worker->exitDescription()
                  << "; requests will fail until the gateway is restarted";
    }

    if (exitCallback_) exitCallback_(*worker);

    if (groupLeft) {
        DrainGroup(worker->pid_, expected);
        return;
    }
    FinishStop();
}

void ProcessSupervisor::BlockingStop() {
    const bool leaderAlive = worker_ && worker_->alive();
    if (!leaderAlive && drainingGroup_ <= 0) return;
    const pid_t pgid = leaderAlive ? worker_->pid_ : drainingGroup_;
    LOG_WARN << "Supervisor going away with worker group " << pgid << " alive, stopping it";
    if (leaderAlive && worker_->state_ != WorkerProcess::kTerminating) KillGroup(SIGTERM);

    int status = 0;
    bool reaped = !leaderAlive;
    auto settled = [&]() {
        if (!reaped) {
            const pid_t r = ::waitpid(pgid, &status, WNOHANG);
            if (r == pgid || (r < 0 && errno == ECHILD)) reaped = true;
        }
        return reaped && !GroupHasLiveMembers(pgid);
    };
    bool stopped = false;
    const int rounds = std::max(1, static_cast<int>(terminateTimeoutSec_ * 100));
    for (int i = 0; i < rounds && !(stopped = settled()); ++i) {
        ::usleep(10 * 1000);
    }
    if (!stopped) {
        LOG_WARN << "ShutdownTimeout: worker group " << pgid << " ignored SIGTERM, sending SIGKILL";
        if (::kill(-pgid, SIGKILL) != 0 && leaderAlive && !reaped) ::kill(pgid, SIGKILL);
        if (!reaped) {
            while (::waitpid(pgid, &status, 0) < 0 && errno == EINTR) {
            }
        }
        const int killRounds = static_cast<int>(kGroupKillWaitSec * 100);
        for (int i = 0; i < killRounds && GroupHasLiveMembers(pgid); ++i) {
            ::usleep(10 * 1000);
        }
    }

    if (leaderAlive) {
        worker_->waitStatus_ = status;
        worker_->state_ = WorkerProcess::kExited;
    }
    drainingGroup_ = -1;
    if (worker_ && worker_->stdout_) worker_->stdout_->DrainNow();
    if (worker_ && worker_->stderr_) worker_->stderr_->DrainNow();
    pendingDone_.clear();
}

} // namespace supervisor
} // namespace gateway
