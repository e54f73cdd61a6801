#include "gateway/GatewayConfig.h"
#include "gateway/common/Config.h"
#include "gateway/network/InetAddress.h"

#include <cctype>
#include <cstdlib>
#include <sstream>

namespace gateway {

namespace {

bool ParsePort(const std::string& text, const std::string& what, uint16_t* out, std::string* err) {
    char* endp = nullptr;
    const long v = std::strtol(text.c_str(), &endp, 10);
    if (text.empty() || *endp != '\0' || v < 1 || v > 65535) {
        *err = what + " must be a port number in 1..65535, got '" + text + "'";
        return false;
    }
    *out = static_cast<uint16_t>(v);
    return true;
}

bool ParsePositive(const std::string& text, const std::string& what, double* out, std::string* err) {
    char* endp = nullptr;
    const double v = std::strtod(text.c_str(), &endp);
    if (text.empty() || *endp != '\0' || !(v > 0.0)) {
        *err = what + " must be a positive number, got '" + text + "'";
        return false;
    }
    *out = v;
    return true;
}

bool ParseFlag(const std::string& text, const std::string& what, bool* out, std::string* err) {
    const bool t = common::Config::ParseBool(text, true);
    const bool f = common::Config::ParseBool(text, false);
    if (t != f) {
        *err = what + " must be a boolean (1/0, true/false, yes/no, on/off), got '" + text + "'";
        return false;
    }
    *out = t;
    return true;
}

bool ValidLogLevel(const std::string& level) {
    return level == "DEBUG" || level == "INFO" || level == "WARN" || level == "ERROR" || level == "FATAL";
}

std::string Upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

} // namespace

std::vector<std::string> GatewayConfig::SplitCommand(const std::string& command) {
    std::vector<std::string> argv;
    std::istringstream in(command);
    std::string word;
    while (in >> word) argv.push_back(word);
    return argv;
}

std::vector<std::string> GatewayConfig::SplitList(const std::string& text) {
    std::vector<std::string> items;
    std::string item;
    std::istringstream in(text);
    while (std::getline(in, item, ',')) {
        size_t b = item.find_first_not_of(" \t");
        size_t e = item.find_last_not_of(" \t");
        if (b == std::string::npos) continue;
        items.push_back(item.substr(b, e - b + 1));
    }
    return items;
}

std::string GatewayConfig::WorkerBaseUrl() const {
    return "http://127.0.0.1:" + std::to_string(workerPort);
}

std::map<std::string, std::string> GatewayConfig::WorkerEnvironment() const {
    std::map<std::string, std::string> env = workerExtraEnv;
    env[workerPortEnv] = std::to_string(workerPort);
    if (workerMinimal) {
        for (const auto& key : minimalEnvKeys) env[key] = "1";
    }
    if (!featureFlagEnv.empty()) {
        env[featureFlagEnv] = featureEnabled ? "true" : "false";
    }
    return env;
}

bool GatewayConfig::Resolve(const common::Config& cfg, GatewayConfig* out, std::string* err,
                            const EnvLookup& envLookup) {
    const EnvLookup env = envLookup ? envLookup : EnvLookup([](const char* name) { return ::getenv(name); });
    GatewayConfig c;

    auto str = [&cfg](const char* section, const char* key, const std::string& def) {
        return cfg.GetString(section, key, def);
    };
    auto num = [](double v) {
        std::ostringstream os;
        os << v;
        return os.str();
    };

    // [global]
    c.listenHost = str("global", "listen_host", c.listenHost);
    if (!ParsePort(str("global", "listen_port", std::to_string(c.listenPort)), "[global] listen_port", &c.listenPort, err)) return false;
    c.apiPrefix = str("global", "api_prefix", c.apiPrefix);
    c.healthPath = str("global", "health_path", c.healthPath);
    if (!ParsePositive(str("global", "request_timeout_sec", num(c.requestTimeoutSec)), "[global] request_timeout_sec", &c.requestTimeoutSec, err)) return false;
    if (!ParsePositive(str("global", "connect_timeout_sec", num(c.connectTimeoutSec)), "[global] connect_timeout_sec", &c.connectTimeoutSec, err)) return false;
    {
        const std::string text = str("global", "max_body_bytes", std::to_string(c.maxBodyBytes));
        char* endp = nullptr;
        const long long v = std::strtoll(text.c_str(), &endp, 10);
        if (text.empty() || *endp != '\0' || v < 0) {
            *err = "[global] max_body_bytes must be a non-negative integer, got '" + text + "'";
            return false;
        }
        c.maxBodyBytes = static_cast<size_t>(v);
    }
    c.idleTimeoutSec = cfg.GetDouble("global", "idle_timeout_sec", c.idleTimeoutSec);
    if (c.idleTimeoutSec < 0.0) c.idleTimeoutSec = 0.0;
    c.logLevel = Upper(str("global", "log_level", c.logLevel));
    c.logFile = str("global", "log_file", c.logFile);

    // [worker]
    if (!ParsePort(str("worker", "port", std::to_string(c.workerPort)), "[worker] port", &c.workerPort, err)) return false;
    if (cfg.GetSection("worker").count("command")) {
        c.workerArgv = SplitCommand(str("worker", "command", ""));
    }
    c.workerCwd = str("worker", "cwd", c.workerCwd);
    c.workerPortEnv = str("worker", "port_env", c.workerPortEnv);
    if (!ParseFlag(str("worker", "minimal", c.workerMinimal ? "true" : "false"), "[worker] minimal", &c.workerMinimal, err)) return false;
    if (cfg.GetSection("worker").count("minimal_env")) {
        c.minimalEnvKeys = SplitList(str("worker", "minimal_env", ""));
    }
    c.featureFlagEnv = str("worker", "feature_env", c.featureFlagEnv);
    if (!ParseFlag(str("worker", "feature_enabled", c.featureEnabled ? "true" : "false"), "[worker] feature_enabled", &c.featureEnabled, err)) return false;
    if (!ParsePositive(str("worker", "terminate_timeout_sec", num(c.terminateTimeoutSec)), "[worker] terminate_timeout_sec", &c.terminateTimeoutSec, err)) return false;
    c.workerExtraEnv = cfg.GetSection("worker_env");

    // [readiness]
    if (!ParseFlag(str("readiness", "probe", c.readinessProbe ? "true" : "false"), "[readiness] probe", &c.readinessProbe, err)) return false;
    c.readinessPath = str("readiness", "path", c.readinessPath);
    if (!ParsePositive(str("readiness", "max_wait_sec", num(c.readinessMaxWaitSec)), "[readiness] max_wait_sec", &c.readinessMaxWaitSec, err)) return false;
    if (!ParsePositive(str("readiness", "initial_backoff_sec", num(c.readinessInitialBackoffSec)), "[readiness] initial_backoff_sec", &c.readinessInitialBackoffSec, err)) return false;
    if (!ParsePositive(str("readiness", "max_backoff_sec", num(c.readinessMaxBackoffSec)), "[readiness] max_backoff_sec", &c.readinessMaxBackoffSec, err)) return false;
    if (!ParsePositive(str("readiness", "probe_timeout_sec", num(c.probeTimeoutSec)), "[readiness] probe_timeout_sec", &c.probeTimeoutSec, err)) return false;
    {
        const std::string text = str("readiness", "grace_sec", num(c.readinessGraceSec));
        char* endp = nullptr;
        const double v = std::strtod(text.c_str(), &endp);
        if (text.empty() || *endp != '\0' || v < 0.0) {
            *err = "[readiness] grace_sec must be a non-negative number, got '" + text + "'";
            return false;
        }
        c.readinessGraceSec = v;
    }

    // [cors]
    c.corsEnabled = cfg.GetBool("cors", "enable", c.corsEnabled);
    if (cfg.GetSection("cors").count("allow_origins")) {
        c.corsAllowOrigins = SplitList(str("cors", "allow_origins", ""));
    }
    c.corsAllowCredentials = cfg.GetBool("cors", "allow_credentials", c.corsAllowCredentials);
    c.corsAllowMethods = str("cors", "allow_methods", c.corsAllowMethods);
    c.corsAllowHeaders = str("cors", "allow_headers", c.corsAllowHeaders);
    c.corsMaxAgeSec = cfg.GetInt("cors", "max_age_sec", c.corsMaxAgeSec);

    // [tls]
    c.tlsEnabled = cfg.GetBool("tls", "enable", c.tlsEnabled);
    c.tlsCertPath = str("tls", "cert_path", c.tlsCertPath);
    c.tlsKeyPath = str("tls", "key_path", c.tlsKeyPath);

    // Environment overrides
    if (const char* v = env("GATEWAY_PORT")) {
        if (!ParsePort(v, "GATEWAY_PORT", &c.listenPort, err)) return false;
    }
    if (const char* v = env("WORKER_PORT")) {
        if (!ParsePort(v, "WORKER_PORT", &c.workerPort, err)) return false;
    }
    if (const char* v = env("WORKER_MINIMAL")) {
        if (!ParseFlag(v, "WORKER_MINIMAL", &c.workerMinimal, err)) return false;
    }
    if (const char* v = env("WORKER_FEATURE_ENABLED")) {
        if (!ParseFlag(v, "WORKER_FEATURE_ENABLED", &c.featureEnabled, err)) return false;
    }
    if (const char* v = env("GATEWAY_LOG_LEVEL")) {
        c.logLevel = Upper(v);
    }

    // Validation
    gateway::network::InetAddress probe;
    if (!gateway::network::InetAddress::Resolve(c.listenHost, c.listenPort, &probe)) {
        *err = "[global] listen_host must be an IPv4 address, got '" + c.listenHost + "'";
        return false;
    }
    if (c.listenPort == c.workerPort) {
        *err = "listen port and worker port must differ (both " + std::to_string(c.listenPort) + ")";
        return false;
    }
    while (c.apiPrefix.size() > 1 && c.apiPrefix.back() == '/') c.apiPrefix.pop_back();
    if (c.apiPrefix.empty() || c.apiPrefix[0] != '/' || c.apiPrefix == "/") {
        *err = "[global] api_prefix must start with '/' and name a path segment, got '" + c.apiPrefix + "'";
        return false;
    }
    if (c.healthPath.empty() || c.healthPath[0] != '/') {
        *err = "[global] health_path must start with '/', got '" + c.healthPath + "'";
        return false;
    }
    if (c.readinessPath.empty() || c.readinessPath[0] != '/') {
        *err = "[readiness] path must start with '/', got '" + c.readinessPath + "'";
        return false;
    }
    if (c.workerArgv.empty()) {
        *err = "[worker] command is empty";
        return false;
    }
    if (c.workerPortEnv.empty()) {
        *err = "[worker] port_env is empty";
        return false;
    }
    if (c.readinessInitialBackoffSec > c.readinessMaxBackoffSec) {
        *err = "[readiness] initial_backoff_sec exceeds max_backoff_sec";
        return false;
    }
    if (!ValidLogLevel(c.logLevel)) {
        *err = "log level must be one of DEBUG, INFO, WARN, ERROR, FATAL, got '" + c.logLevel + "'";
        return false;
    }
    if (c.tlsEnabled && (c.tlsCertPath.empty() || c.tlsKeyPath.empty())) {
        *err = "[tls] enable requires cert_path and key_path";
        return false;
    }

    *out = std::move(c);
    return true;
}

} // namespace gateway
