#pragma once

#include <devscope/config/config_helpers.h>
#include <devscope/core/types.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace devscope::config {

struct ServerConfig {
    // [server]
    std::size_t workerThreads = 0; // 0 selects clamp(hw / 4, 2, 8)
    std::string logLevel = "info";

    // [transport]
    std::string outputFraming = "ndjson";
    std::size_t maxMessageBytes = 64u * 1024u * 1024u;

    // [streaming]
    double adaptiveThreshold = 0.5;
    std::chrono::seconds idleTimeout{1800};
    std::chrono::seconds sweepInterval{60};
    std::chrono::seconds retiredRetention{3600};

    // [browser] / [analyzer]
    std::string browserCommand;
    std::chrono::milliseconds browserTimeout{30'000};
    std::string analyzerCommand;
    std::chrono::milliseconds analyzerTimeout{60'000};

    // [tools] / [project]
    bool allowTerminal = true;
    std::chrono::milliseconds commandTimeout{120'000};
    std::filesystem::path projectRoot;

    std::filesystem::path configPath; // file the values were read from, if any

    std::size_t effectiveWorkerThreads() const;
    Result<void> validate() const;
};

// Returns the value of an environment variable, or nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

std::optional<std::string> processEnv(const std::string& name);

/**
 * Resolves configuration from DEVSCOPE_* environment variables, then the config file
 * (`configOverride`, DEVSCOPE_CONFIG, or the XDG default), then built-in defaults. Command line
 * flags are applied by the caller on top of the result.
 */
Result<ServerConfig> loadServerConfig(const std::string& configOverride = "",
                                      const EnvLookup& env = processEnv);

// Applies one "section.key" value; unknown keys are ignored with a warning.
Result<void> applyConfigValue(ServerConfig& config, const std::string& key,
                              const std::string& value);

} // namespace devscope::config
