#include "gateway/GatewayApp.h"
#include "gateway/GatewayConfig.h"
#include "gateway/common/Config.h"
#include "gateway/common/Logger.h"
#include "gateway/network/EventLoop.h"
#include "gateway/network/SignalWatcher.h"

#include <csignal>
#include <cstdio>
#include <getopt.h>
#include <string>
#include <unistd.h>

int main(int argc, char* argv[]) {
    using namespace gateway;

    std::string configFile = "config/gateway.conf";
    bool checkOnly = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:hC")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'h':
            default:
                printf("Usage: %s [-c config_file] [-C]\n", argv[0]);
                printf("  -c  INI config file (default config/gateway.conf)\n");
                printf("  -C  check config and exit\n");
                return ch == 'h' ? 0 : 1;
        }
    }

    if (!common::Config::Instance().Load(configFile)) {
        LOG_ERROR << "Failed to load config " << configFile << ", using defaults.";
    }

    GatewayConfig config;
    std::string err;
    if (!GatewayConfig::Resolve(common::Config::Instance(), &config, &err)) {
        LOG_ERROR << "Invalid configuration: " << err;
        return 1;
    }

    auto& logger = common::Logger::Instance();
    logger.SetLevel(logger.ParseLevel(config.logLevel));
    if (!config.logFile.empty() && !logger.SetLogFile(config.logFile)) {
        LOG_ERROR << "Cannot open log file " << config.logFile << ", logging to stdout";
    }

    if (checkOnly) {
        printf("OK\n");
        return 0;
    }

    // Worker and client sockets may close under us.
    ::signal(SIGPIPE, SIG_IGN);

    network::EventLoop loop;
    GatewayApp app(&loop, config);
    int exitCode = 0;

    network::SignalWatcher signals(&loop, {SIGINT, SIGTERM}, [&](int) {
        app.Shutdown([&loop]() { loop.Quit(); });
    });
    if (!signals.valid()) {
        LOG_WARN << "Signal handling unavailable; SIGINT/SIGTERM will not stop the worker cleanly";
    }

    app.Start([&](bool ok) {
        if (!ok) {
            exitCode = 1;
            loop.Quit();
        }
    });

    loop.Loop();
    return exitCode;
}
