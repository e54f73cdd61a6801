#include "gateway/supervisor/ProcessSupervisor.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/Timer.h"
#include "gateway/common/Logger.h"

#include <cassert>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

using namespace gateway;
using supervisor::LaunchError;
using supervisor::LaunchSpec;
using supervisor::ProcessSupervisor;
using supervisor::WorkerProcess;

// Runs the loop until pred() holds or timeoutSec passes; returns pred().
static bool runUntil(network::EventLoop& loop, const std::function<bool()>& pred, double timeoutSec) {
    if (pred()) return true;
    network::Timer poll(&loop, [&]() {
        if (pred()) loop.Quit();
    });
    poll.Start(0.01, 0.01);
    network::Timer guard(&loop, [&]() { loop.Quit(); });
    guard.Start(timeoutSec);
    loop.Loop();
    return pred();
}

static LaunchSpec shellSpec(const std::string& script) {
    LaunchSpec spec;
    spec.argv = {"/bin/sh", "-c", script};
    spec.port = 18002;
    return spec;
}

// True while pid exists and is not a zombie.
static bool processRuns(pid_t pid) {
    std::ifstream f("/proc/" + std::to_string(pid) + "/stat");
    std::string stat;
    if (!std::getline(f, stat)) return false;
    const size_t close = stat.rfind(')');
    return close != std::string::npos && close + 2 < stat.size() && stat[close + 2] != 'Z';
}

static bool drained(const WorkerProcess& w) {
    return w.stdoutDrainer()->closed() && w.stderrDrainer()->closed();
}

void testEnvironmentAndOutput(network::EventLoop& loop) {
    ProcessSupervisor sup(&loop);
    std::vector<std::string> out;
    std::vector<std::string> err;
    int exits = 0;
    sup.SetExitCallback([&](const WorkerProcess&) { ++exits; });

    // Inherited values are replaced by the overrides, not duplicated.
    ::setenv("MINIMAL_BOOT", "0", 1);
    LaunchSpec spec = shellSpec("echo port=$PORT mode=$MINIMAL_BOOT; echo cwd=$(pwd); echo oops >&2; exit 3");
    spec.env = {{"PORT", "18002"}, {"MINIMAL_BOOT", "1"}};
    spec.cwd = "/tmp";
    spec.outputSink = [&](bool isStderr, const std::string& line) {
        (isStderr ? err : out).push_back(line);
    };
    auto worker = sup.Launch(spec);
    assert(worker->pid() > 0);
    assert(worker->state() == WorkerProcess::kStarting);
    assert(worker->running());
    assert(worker->environment().at("PORT") == "18002");

    assert(runUntil(loop, [&]() { return !worker->alive() && drained(*worker); }, 5.0));
    assert(exits == 1);
    assert(worker->state() == WorkerProcess::kExited);
    assert(worker->exitDescription() == "exited with code 3");
    assert(out.size() == 2);
    assert(out[0] == "port=18002 mode=1");
    assert(out[1] == "cwd=/tmp");
    assert(err.size() == 1 && err[0] == "oops");
    LOG_INFO << "Supervisor env/output/exit PASS";
}

void testUnexpectedDeathBySignal(network::EventLoop& loop) {
    ProcessSupervisor sup(&loop);
    std::string description;
    sup.SetExitCallback([&](const WorkerProcess& w) { description = w.exitDescription(); });

    auto worker = sup.Launch(shellSpec("kill -9 $$"));
    assert(runUntil(loop, [&]() { return !worker->alive(); }, 5.0));
    assert(WIFSIGNALED(worker->waitStatus()));
    assert(WTERMSIG(worker->waitStatus()) == SIGKILL);
    assert(description.find("killed by signal 9") == 0);

    // A dead worker may be replaced.
    auto second = sup.Launch(shellSpec("exit 0"));
    assert(sup.current() == second);
    assert(runUntil(loop, [&]() { return !second->alive(); }, 5.0));
    assert(second->exitDescription() == "exited with code 0");
    LOG_INFO << "Supervisor unexpected death PASS";
}

void testGracefulTerminate(network::EventLoop& loop) {
    ProcessSupervisor sup(&loop);
    auto worker = sup.Launch(shellSpec("while true; do sleep 0.1; done"));
    sup.MarkReady(worker);
    assert(worker->state() == WorkerProcess::kRunning);

    int done = 0;
    const auto start = std::chrono::steady_clock::now();
    sup.Terminate(worker, [&]() { ++done; });
    assert(worker->state() == WorkerProcess::kTerminating);
    assert(worker->alive());
    assert(!worker->running());
    // Second request while the first is in progress joins it.
    sup.Terminate(worker, [&]() { ++done; });

    assert(runUntil(loop, [&]() { return done == 2; }, 5.0));
    const double took = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    assert(took < 2.0);
    assert(worker->state() == WorkerProcess::kExited);
    assert(WIFSIGNALED(worker->waitStatus()) && WTERMSIG(worker->waitStatus()) == SIGTERM);

    // Nothing left to stop: done runs at once.
    bool immediate = false;
    sup.Terminate(worker, [&]() { immediate = true; });
    assert(immediate);
    LOG_INFO << "Supervisor graceful terminate PASS";
}

void testKillAfterTimeout(network::EventLoop& loop) {
    ProcessSupervisor sup(&loop);
    LaunchSpec spec = shellSpec("trap '' TERM; while true; do sleep 0.1; done");
    spec.terminateTimeoutSec = 0.3;
    auto worker = sup.Launch(spec);
    // Let the shell install its trap.
    runUntil(loop, []() { return false; }, 0.2);

    bool done = false;
    const auto start = std::chrono::steady_clock::now();
    sup.Terminate(worker, [&]() { done = true; });
    assert(runUntil(loop, [&]() { return done; }, 5.0));
    const double took = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    assert(took >= 0.25);
    assert(WIFSIGNALED(worker->waitStatus()) && WTERMSIG(worker->waitStatus()) == SIGKILL);
    LOG_INFO << "Supervisor SIGKILL after timeout PASS";
}

void testGroupMemberIgnoringTerm(network::EventLoop& loop) {
    ProcessSupervisor sup(&loop);
    std::vector<std::string> out;
    LaunchSpec spec = shellSpec("sh -c 'trap \"\" TERM; echo child=$$; while true; do sleep 0.1; done' & wait");
    spec.terminateTimeoutSec = 0.5;
    spec.outputSink = [&](bool isStderr, const std::string& line) {
        if (!isStderr) out.push_back(line);
    };
    auto worker = sup.Launch(spec);
    assert(runUntil(loop, [&]() { return !out.empty(); }, 5.0));
    assert(out[0].compare(0, 6, "child=") == 0);
    const pid_t child = static_cast<pid_t>(std::stoi(out[0].substr(6)));
    assert(processRuns(child));

    bool done = false;
    const auto start = std::chrono::steady_clock::now();
    sup.Terminate(worker, [&]() { done = true; });
    assert(runUntil(loop, [&]() { return done; }, 5.0));
    const double took = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    // The leader goes on SIGTERM; the child only on SIGKILL at the timeout.
    assert(took >= 0.4);
    assert(worker->state() == WorkerProcess::kExited);
    assert(WIFSIGNALED(worker->waitStatus()) && WTERMSIG(worker->waitStatus()) == SIGTERM);
    assert(!processRuns(child));
    assert(runUntil(loop, [&]() { return drained(*worker); }, 2.0));
    LOG_INFO << "Supervisor stops the whole worker group PASS";
}

void testLeftoverAfterCrash(network::EventLoop& loop) {
    ProcessSupervisor sup(&loop);
    std::vector<std::string> out;
    std::string description;
    sup.SetExitCallback([&](const WorkerProcess& w) { description = w.exitDescription(); });
    LaunchSpec spec = shellSpec("sh -c 'echo child=$$; exec sleep 30' & sleep 0.2; exit 4");
    spec.terminateTimeoutSec = 1.0;
    spec.outputSink = [&](bool isStderr, const std::string& line) {
        if (!isStderr) out.push_back(line);
    };
    auto worker = sup.Launch(spec);
    assert(runUntil(loop, [&]() { return !worker->alive(); }, 5.0));
    assert(description == "exited with code 4");
    assert(out.size() == 1 && out[0].compare(0, 6, "child=") == 0);
    const pid_t child = static_cast<pid_t>(std::stoi(out[0].substr(6)));

    // The orphaned sleep holds the output pipes until the supervisor stops it.
    assert(runUntil(loop, [&]() { return !processRuns(child) && drained(*worker); }, 5.0));

    bool done = false;
    sup.Terminate(worker, [&]() { done = true; });
    assert(runUntil(loop, [&]() { return done; }, 2.0));
    auto next = sup.Launch(shellSpec("exit 0"));
    assert(runUntil(loop, [&]() { return !next->alive(); }, 5.0));
    LOG_INFO << "Supervisor stops leftovers of a crashed worker PASS";
}

void testLaunchErrors(network::EventLoop& loop) {
    ProcessSupervisor sup(&loop);

    bool threw = false;
    try {
        LaunchSpec missing;
        missing.argv = {"definitely-not-a-real-binary-xyz"};
        sup.Launch(missing);
    } catch (const LaunchError& e) {
        threw = true;
        assert(std::string(e.what()).find("not found") != std::string::npos);
    }
    assert(threw);
    assert(!sup.current());

    threw = false;
    try {
        LaunchSpec badDir = shellSpec("exit 0");
        badDir.cwd = "/nonexistent/worker/dir";
        sup.Launch(badDir);
    } catch (const LaunchError& e) {
        threw = true;
        assert(std::string(e.what()).find("/nonexistent/worker/dir") != std::string::npos);
    }
    assert(threw);

    threw = false;
    try {
        sup.Launch(LaunchSpec());
    } catch (const LaunchError&) {
        threw = true;
    }
    assert(threw);

    auto live = sup.Launch(shellSpec("sleep 5"));
    threw = false;
    try {
        sup.Launch(shellSpec("exit 0"));
    } catch (const LaunchError& e) {
        threw = true;
        assert(std::string(e.what()).find("still") != std::string::npos);
    }
    assert(threw);
    assert(sup.current() == live);

    bool stopped = false;
    sup.Terminate(live, [&]() { stopped = true; });
    assert(runUntil(loop, [&]() { return stopped; }, 5.0));
    LOG_INFO << "Supervisor launch errors PASS";
}

void testDestructorStopsWorker(network::EventLoop& loop) {
    pid_t pid = -1;
    {
        ProcessSupervisor sup(&loop);
        LaunchSpec spec = shellSpec("while true; do sleep 0.1; done");
        spec.terminateTimeoutSec = 1.0;
        pid = sup.Launch(spec)->pid();
        assert(::kill(pid, 0) == 0);
    }
    // Reaped by the destructor: the pid no longer names our child.
    int status = 0;
    assert(::waitpid(pid, &status, WNOHANG) < 0);
    LOG_INFO << "Supervisor destructor stop PASS";
}

void testFindExecutable() {
    assert(!ProcessSupervisor::FindExecutable("sh").empty());
    assert(ProcessSupervisor::FindExecutable("/bin/sh") == "/bin/sh");
    assert(ProcessSupervisor::FindExecutable("no-such-tool-here-xyz").empty());
    assert(ProcessSupervisor::FindExecutable("/etc/hostname-not-exec").empty());
    assert(ProcessSupervisor::FindExecutable("").empty());
    LOG_INFO << "FindExecutable PASS";
}

int main() {
    common::Logger::Instance().SetLevel(common::LogLevel::INFO);
    ::signal(SIGPIPE, SIG_IGN);
    network::EventLoop loop;
    testFindExecutable();
    testEnvironmentAndOutput(loop);
    testUnexpectedDeathBySignal(loop);
    testGracefulTerminate(loop);
    testKillAfterTimeout(loop);
    testGroupMemberIgnoringTerm(loop);
    testLeftoverAfterCrash(loop);
    testLaunchErrors(loop);
    testDestructorStopsWorker(loop);
    return 0;
}
