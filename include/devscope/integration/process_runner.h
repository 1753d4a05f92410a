#pragma once

#include <devscope/core/types.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace devscope::integration {

struct ProcessSpec {
    std::filesystem::path executable; // resolved through PATH when not absolute
    std::vector<std::string> args;
    std::optional<std::filesystem::path> workdir;
    std::string stdinData;
    std::chrono::milliseconds timeout{30'000};
    std::chrono::milliseconds killGrace{500}; // SIGTERM to SIGKILL delay
    std::size_t maxOutputBytes = 16u * 1024u * 1024u;
};

struct ProcessOutput {
    int exitCode = -1; // 128 + signal when killed; 127 when exec failed
    std::string stdoutData;
    std::string stderrData;
    bool timedOut = false;
    bool truncated = false;
    std::chrono::milliseconds elapsed{0};

    bool succeeded() const noexcept { return !timedOut && exitCode == 0; }
};

/**
 * Runs a child process to completion with piped stdio and a hard timeout. Failure to start the
 * child is an error; a non-zero exit or a timeout is reported in ProcessOutput.
 */
class ProcessRunner {
public:
    static Result<ProcessOutput> run(const ProcessSpec& spec);
};

// Splits a configured command line on whitespace (no shell quoting rules)
std::vector<std::string> splitCommandLine(std::string_view commandLine);

// Spec for `commandLine` followed by `extraArgs`; InvalidArgument when the command is empty
Result<ProcessSpec> makeCommandSpec(std::string_view commandLine,
                                    const std::vector<std::string>& extraArgs);

} // namespace devscope::integration
