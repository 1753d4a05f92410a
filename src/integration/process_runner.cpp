#include <devscope/integration/process_runner.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/wait.h>

namespace devscope::integration {

namespace {

class FdGuard {
public:
    FdGuard() = default;
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() { reset(); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_{-1};
};

struct PipePair {
    FdGuard read;
    FdGuard write;
};

Result<void> openPipe(PipePair& p) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0) {
        return Error{ErrorCode::ResourceExhausted,
                     std::string("Failed to create pipe: ") + std::strerror(errno)};
    }
    p.read.reset(fds[0]);
    p.write.reset(fds[1]);
    return {};
}

void setNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Polls waitpid until the child exits or `timeout` elapses
std::optional<int> waitForExit(pid_t pid, std::chrono::milliseconds timeout) {
    auto start = std::chrono::steady_clock::now();
    while (true) {
        int status = 0;
        pid_t rc = waitpid(pid, &status, WNOHANG);
        if (rc == pid) {
            return decodeStatus(status);
        }
        if (rc < 0 && errno != EINTR) {
            return -1;
        }
        if (std::chrono::steady_clock::now() - start >= timeout) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
}

int terminateChild(pid_t pid, std::chrono::milliseconds grace) {
    if (kill(pid, SIGTERM) == 0) {
        if (auto code = waitForExit(pid, grace)) {
            return *code;
        }
    }
    spdlog::warn("ProcessRunner: forcefully killing pid {}", pid);
    kill(pid, SIGKILL);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    return decodeStatus(status);
}

// Appends available bytes; returns false once the pipe reached EOF or failed
bool drainInto(int fd, std::string& sink, std::size_t limit, bool& truncated) {
    std::array<char, 8192> buf;
    while (true) {
        ssize_t n = ::read(fd, buf.data(), buf.size());
        if (n > 0) {
            std::size_t room = sink.size() < limit ? limit - sink.size() : 0;
            std::size_t take = std::min<std::size_t>(room, static_cast<std::size_t>(n));
            sink.append(buf.data(), take);
            if (take < static_cast<std::size_t>(n)) {
                truncated = true;
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

} // namespace

Result<ProcessOutput> ProcessRunner::run(const ProcessSpec& spec) {
    if (spec.executable.empty()) {
        return Error{ErrorCode::InvalidArgument, "No executable given"};
    }

    // A child exiting early must not kill the server through SIGPIPE
    std::signal(SIGPIPE, SIG_IGN);

    PipePair in, out, err;
    for (auto* p : {&in, &out, &err}) {
        if (auto r = openPipe(*p); !r) {
            return r.error();
        }
    }

    std::vector<std::string> argvStorage;
    argvStorage.reserve(spec.args.size() + 1);
    argvStorage.push_back(spec.executable.string());
    argvStorage.insert(argvStorage.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    for (auto& a : argvStorage) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);

    auto started = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        return Error{ErrorCode::InternalError,
                     std::string("fork() failed: ") + std::strerror(errno)};
    }

    if (pid == 0) {
        dup2(in.read.get(), STDIN_FILENO);
        dup2(out.write.get(), STDOUT_FILENO);
        dup2(err.write.get(), STDERR_FILENO);
        if (spec.workdir && chdir(spec.workdir->c_str()) < 0) {
            _exit(127);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    spdlog::debug("ProcessRunner: spawned {} (pid={})", argvStorage.front(), pid);
    in.read.reset();
    out.write.reset();
    err.write.reset();

    setNonBlocking(in.write.get());
    setNonBlocking(out.read.get());
    setNonBlocking(err.read.get());

    ProcessOutput result;
    std::size_t written = 0;
    if (spec.stdinData.empty()) {
        in.write.reset();
    }

    auto deadline = started + spec.timeout;
    while (in.write.valid() || out.read.valid() || err.read.valid()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result.timedOut = true;
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

        std::array<pollfd, 3> fds{};
        nfds_t count = 0;
        int inIdx = -1, outIdx = -1, errIdx = -1;
        if (in.write.valid()) {
            inIdx = static_cast<int>(count);
            fds[count++] = pollfd{in.write.get(), POLLOUT, 0};
        }
        if (out.read.valid()) {
            outIdx = static_cast<int>(count);
            fds[count++] = pollfd{out.read.get(), POLLIN, 0};
        }
        if (err.read.valid()) {
            errIdx = static_cast<int>(count);
            fds[count++] = pollfd{err.read.get(), POLLIN, 0};
        }

        int rc = poll(fds.data(), count,
                      static_cast<int>(std::min<long long>(remaining.count(), 100)));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("ProcessRunner: poll failed: {}", std::strerror(errno));
            result.timedOut = true;
            break;
        }
        if (rc == 0) {
            continue;
        }

        if (inIdx >= 0 && fds[inIdx].revents != 0) {
            if (fds[inIdx].revents & (POLLERR | POLLHUP)) {
                in.write.reset();
            } else {
                ssize_t n = ::write(in.write.get(), spec.stdinData.data() + written,
                                    spec.stdinData.size() - written);
                if (n > 0) {
                    written += static_cast<std::size_t>(n);
                } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    spdlog::debug("ProcessRunner: stdin write failed: {}", std::strerror(errno));
                    in.write.reset();
                }
                if (written >= spec.stdinData.size()) {
                    in.write.reset();
                }
            }
        }
        if (outIdx >= 0 && fds[outIdx].revents != 0 &&
            !drainInto(out.read.get(), result.stdoutData, spec.maxOutputBytes, result.truncated)) {
            out.read.reset();
        }
        if (errIdx >= 0 && fds[errIdx].revents != 0 &&
            !drainInto(err.read.get(), result.stderrData, spec.maxOutputBytes, result.truncated)) {
            err.read.reset();
        }
    }

    if (result.timedOut) {
        spdlog::warn("ProcessRunner: {} timed out after {} ms", argvStorage.front(),
                     spec.timeout.count());
        result.exitCode = terminateChild(pid, spec.killGrace);
    } else {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (auto code = waitForExit(pid, std::max(remaining, std::chrono::milliseconds{0}))) {
            result.exitCode = *code;
        } else {
            result.timedOut = true;
            result.exitCode = terminateChild(pid, spec.killGrace);
        }
    }

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return result;
}

std::vector<std::string> splitCommandLine(std::string_view commandLine) {
    std::vector<std::string> parts;
    std::istringstream ss{std::string(commandLine)};
    std::string token;
    while (ss >> token) {
        parts.push_back(token);
    }
    return parts;
}

Result<ProcessSpec> makeCommandSpec(std::string_view commandLine,
                                    const std::vector<std::string>& extraArgs) {
    auto parts = splitCommandLine(commandLine);
    if (parts.empty()) {
        return Error{ErrorCode::InvalidArgument, "Command line is empty"};
    }
    ProcessSpec spec;
    spec.executable = parts.front();
    spec.args.assign(parts.begin() + 1, parts.end());
    spec.args.insert(spec.args.end(), extraArgs.begin(), extraArgs.end());
    return spec;
}

} // namespace devscope::integration
