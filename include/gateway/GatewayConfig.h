#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace gateway {

namespace common {
class Config;
} // namespace common

// Immutable runtime settings, resolved once at startup from the INI file and
// the environment.
struct GatewayConfig {
    // Public listener
    std::string listenHost = "0.0.0.0";
    uint16_t listenPort = 8001;
    std::string apiPrefix = "/api";
    std::string healthPath = "/health";
    double requestTimeoutSec = 60.0;
    double connectTimeoutSec = 5.0;
    size_t maxBodyBytes = 10 * 1024 * 1024;
    double idleTimeoutSec = 60.0;

    // Worker process
    uint16_t workerPort = 8002;
    std::vector<std::string> workerArgv{"npx", "tsx", "src/app.fractal.ts"};
    std::string workerCwd = "/app/backend";
    std::string workerPortEnv = "PORT";
    bool workerMinimal = true;
    std::vector<std::string> minimalEnvKeys{"FRACTAL_ONLY", "MINIMAL_BOOT"};
    std::string featureFlagEnv = "FRACTAL_ENABLED";
    bool featureEnabled = true;
    std::map<std::string, std::string> workerExtraEnv;
    double terminateTimeoutSec = 5.0;

    // Readiness
    bool readinessProbe = true;
    std::string readinessPath = "/api/health";
    double readinessMaxWaitSec = 30.0;
    double readinessInitialBackoffSec = 0.1;
    double readinessMaxBackoffSec = 1.0;
    double probeTimeoutSec = 1.0;
    double readinessGraceSec = 3.0;

    // CORS
    bool corsEnabled = true;
    std::vector<std::string> corsAllowOrigins{"*"};
    bool corsAllowCredentials = true;
    std::string corsAllowMethods = "GET, POST, PUT, DELETE, PATCH, OPTIONS";
    std::string corsAllowHeaders = "*";
    int corsMaxAgeSec = 600;

    // TLS on the public listener
    bool tlsEnabled = false;
    std::string tlsCertPath;
    std::string tlsKeyPath;

    // Logging
    std::string logLevel = "INFO";
    std::string logFile;

    using EnvLookup = std::function<const char*(const char*)>;

    // Reads every section of `cfg`, applies GATEWAY_PORT, WORKER_PORT,
    // WORKER_MINIMAL, WORKER_FEATURE_ENABLED and GATEWAY_LOG_LEVEL from `env`,
    // then validates. On failure *out is untouched and *err says why.
    static bool Resolve(const common::Config& cfg, GatewayConfig* out, std::string* err,
                        const EnvLookup& env = EnvLookup());

    // "http://127.0.0.1:<workerPort>"
    std::string WorkerBaseUrl() const;

    // Environment overrides handed to the worker, in addition to the
    // inherited environment.
    std::map<std::string, std::string> WorkerEnvironment() const;

    static std::vector<std::string> SplitCommand(const std::string& command);
    static std::vector<std::string> SplitList(const std::string& text);
};

} // namespace gateway
