#include <devscope/config/server_config.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <thread>
#include <utility>

namespace devscope::config {

namespace {

// Config key and the environment variable that overrides it
constexpr std::array<std::pair<const char*, const char*>, 15> kKeys = {{
    {"server.worker_threads", "DEVSCOPE_WORKER_THREADS"},
    {"server.log_level", "DEVSCOPE_LOG_LEVEL"},
    {"transport.output_framing", "DEVSCOPE_OUTPUT_FRAMING"},
    {"transport.max_message_bytes", "DEVSCOPE_MAX_MESSAGE_BYTES"},
    {"streaming.adaptive_threshold", "DEVSCOPE_ADAPTIVE_THRESHOLD"},
    {"streaming.idle_timeout_s", "DEVSCOPE_IDLE_TIMEOUT_S"},
    {"streaming.sweep_interval_s", "DEVSCOPE_SWEEP_INTERVAL_S"},
    {"streaming.retired_retention_s", "DEVSCOPE_RETIRED_RETENTION_S"},
    {"browser.command", "DEVSCOPE_BROWSER_COMMAND"},
    {"browser.timeout_ms", "DEVSCOPE_BROWSER_TIMEOUT_MS"},
    {"analyzer.command", "DEVSCOPE_ANALYZER_COMMAND"},
    {"analyzer.timeout_ms", "DEVSCOPE_ANALYZER_TIMEOUT_MS"},
    {"tools.allow_terminal", "DEVSCOPE_ALLOW_TERMINAL"},
    {"tools.command_timeout_ms", "DEVSCOPE_COMMAND_TIMEOUT_MS"},
    {"project.root", "DEVSCOPE_PROJECT_ROOT"},
}};

Error invalidValue(const std::string& key, const std::string& value) {
    return Error{ErrorCode::InvalidArgument,
                 "Invalid value for " + key + ": '" + value + "'"};
}

Result<long long> nonNegative(const std::string& key, const std::string& value) {
    auto v = parse_integer(value);
    if (!v || *v < 0) {
        return invalidValue(key, value);
    }
    return *v;
}

} // namespace

std::optional<std::string> processEnv(const std::string& name) {
    if (const char* v = std::getenv(name.c_str()); v && *v) {
        return std::string(v);
    }
    return std::nullopt;
}

std::size_t ServerConfig::effectiveWorkerThreads() const {
    if (workerThreads > 0) {
        return workerThreads;
    }
    std::size_t hw = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    return std::clamp<std::size_t>(hw / 4, 2, 8);
}

Result<void> ServerConfig::validate() const {
    if (workerThreads > 256) {
        return Error{ErrorCode::InvalidArgument, "server.worker_threads must be at most 256"};
    }
    static const std::array<std::string_view, 7> kLevels = {"trace", "debug", "info", "warn",
                                                            "error", "critical", "off"};
    if (std::find(kLevels.begin(), kLevels.end(), logLevel) == kLevels.end()) {
        return Error{ErrorCode::InvalidArgument, "Unknown log level: " + logLevel};
    }
    if (outputFraming != "ndjson" && outputFraming != "content-length" &&
        outputFraming != "mirror") {
        return Error{ErrorCode::InvalidArgument,
                     "transport.output_framing must be ndjson, content-length or mirror"};
    }
    if (maxMessageBytes == 0) {
        return Error{ErrorCode::InvalidArgument, "transport.max_message_bytes must be positive"};
    }
    if (!(adaptiveThreshold > 0.0 && adaptiveThreshold <= 1.0)) {
        return Error{ErrorCode::InvalidArgument, "streaming.adaptive_threshold must be in (0, 1]"};
    }
    if (idleTimeout.count() <= 0 || sweepInterval.count() <= 0) {
        return Error{ErrorCode::InvalidArgument,
                     "streaming.idle_timeout_s and streaming.sweep_interval_s must be positive"};
    }
    return {};
}

Result<void> applyConfigValue(ServerConfig& config, const std::string& key,
                              const std::string& value) {
    using std::chrono::milliseconds;
    using std::chrono::seconds;

    if (key == "server.worker_threads" || key == "transport.max_message_bytes" ||
        key == "streaming.idle_timeout_s" || key == "streaming.sweep_interval_s" ||
        key == "streaming.retired_retention_s" || key == "browser.timeout_ms" ||
        key == "analyzer.timeout_ms" || key == "tools.command_timeout_ms") {
        auto n = nonNegative(key, value);
        if (!n) {
            return n.error();
        }
        auto v = n.value();
        if (key == "server.worker_threads") {
            config.workerThreads = static_cast<std::size_t>(v);
        } else if (key == "transport.max_message_bytes") {
            config.maxMessageBytes = static_cast<std::size_t>(v);
        } else if (key == "streaming.idle_timeout_s") {
            config.idleTimeout = seconds{v};
        } else if (key == "streaming.sweep_interval_s") {
            config.sweepInterval = seconds{v};
        } else if (key == "streaming.retired_retention_s") {
            config.retiredRetention = seconds{v};
        } else if (key == "browser.timeout_ms") {
            config.browserTimeout = milliseconds{v};
        } else if (key == "analyzer.timeout_ms") {
            config.analyzerTimeout = milliseconds{v};
        } else {
            config.commandTimeout = milliseconds{v};
        }
        return {};
    }

    if (key == "server.log_level") {
        config.logLevel = value;
    } else if (key == "transport.output_framing") {
        config.outputFraming = value;
    } else if (key == "streaming.adaptive_threshold") {
        auto d = parse_double(value);
        if (!d) {
            return invalidValue(key, value);
        }
        config.adaptiveThreshold = *d;
    } else if (key == "browser.command") {
        config.browserCommand = value;
    } else if (key == "analyzer.command") {
        config.analyzerCommand = value;
    } else if (key == "tools.allow_terminal") {
        auto b = parse_bool(value);
        if (!b) {
            return invalidValue(key, value);
        }
        config.allowTerminal = *b;
    } else if (key == "project.root") {
        config.projectRoot = expand_tilde(value);
    } else {
        spdlog::warn("Ignoring unknown config key '{}'", key);
    }
    return {};
}

Result<ServerConfig> loadServerConfig(const std::string& configOverride, const EnvLookup& env) {
    ServerConfig config;

    std::string pathText = configOverride;
    if (pathText.empty()) {
        pathText = env("DEVSCOPE_CONFIG").value_or("");
    }
    auto path = get_config_path(pathText);
    if (!pathText.empty()) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return Error{ErrorCode::NotFound, "Config file not found: " + path.string()};
        }
    }

    auto values = load_config_values(path);
    if (!values) {
        return values.error();
    }
    if (!values.value().empty()) {
        config.configPath = path;
        spdlog::debug("Loaded {} config values from {}", values.value().size(), path.string());
    }
    for (const auto& [key, value] : values.value()) {
        if (auto r = applyConfigValue(config, key, value); !r) {
            return r.error();
        }
    }

    for (const auto& [key, envName] : kKeys) {
        if (auto v = env(envName)) {
            if (auto r = applyConfigValue(config, key, *v); !r) {
                return Error{r.error().code, r.error().message + " (from " + envName + ")"};
            }
        }
    }

    if (config.projectRoot.empty()) {
        std::error_code ec;
        config.projectRoot = std::filesystem::current_path(ec);
    }

    if (auto r = config.validate(); !r) {
        return r.error();
    }
    return config;
}

} // namespace devscope::config
