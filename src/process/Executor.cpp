#include "process/Executor.hpp"
#include "logging/LogRegistry.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>

using namespace tr::logging;

namespace tr::process {

namespace {

// Reported by the child over the status pipe when it fails before exec completes
enum class ChildStage : int { Stdin = 1, Redirect = 2, Chdir = 3, Exec = 4 };

struct ChildFailure {
    int stage;
    int err;
};

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(const int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) reset(other.release());
        return *this;
    }

    [[nodiscard]] int get() const { return fd_; }

    int release() {
        const int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(const int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    UniqueFd read;
    UniqueFd write;
};

Pipe makePipe(const std::string& program) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == -1) throw SpawnError(program, "pipe", errno);
    return {UniqueFd(fds[0]), UniqueFd(fds[1])};
}

std::string_view stageName(const int stage) {
    switch (static_cast<ChildStage>(stage)) {
    case ChildStage::Stdin: return "stdin";
    case ChildStage::Redirect: return "redirect";
    case ChildStage::Chdir: return "chdir";
    case ChildStage::Exec: return "exec";
    }
    return "child";
}

[[noreturn]] void childFail(const int statusFd, const ChildStage stage) {
    const ChildFailure failure{static_cast<int>(stage), errno};
    // Best effort: the parent treats a short read as an unknown failure
    [[maybe_unused]] const auto n = ::write(statusFd, &failure, sizeof(failure));
    ::_exit(127);
}

// Returns false once the descriptor reaches EOF
bool drainInto(const int fd, std::string& out) {
    std::array<char, 8192> buf{};
    while (true) {
        const ssize_t n = ::read(fd, buf.data(), buf.size());
        if (n > 0) {
            out.append(buf.data(), static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

void setNonBlocking(const int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags != -1) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

int waitForChild(const pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) throw std::runtime_error(fmt::format("waitpid failed: {}", std::strerror(errno)));
    }
    return status;
}

}

SpawnError::SpawnError(std::string program, std::string stage, const int err)
    : std::runtime_error(fmt::format("Failed to start '{}' ({}): {}", program, stage, std::strerror(err))),
      program_(std::move(program)),
      stage_(std::move(stage)),
      errno_(err) {}

ExecutionResult Executor::run(const Invocation& invocation) const {
    const auto argvStrings = invocation.argv();
    std::vector<char*> argv;
    argv.reserve(argvStrings.size() + 1);
    for (const auto& s : argvStrings) argv.push_back(const_cast<char*>(s.c_str()));
    argv.push_back(nullptr);

    const std::string workingDir = invocation.working_dir ? invocation.working_dir->string() : std::string{};

    auto out = makePipe(invocation.program);
    auto err = makePipe(invocation.program);
    auto status = makePipe(invocation.program);

    LogRegistry::process()->debug("[Executor] Spawning: {}", invocation.commandLine());

    const pid_t pid = ::fork();
    if (pid < 0) throw SpawnError(invocation.program, "fork", errno);

    if (pid == 0) {
        const int devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devNull < 0 || ::dup2(devNull, STDIN_FILENO) == -1) childFail(status.write.get(), ChildStage::Stdin);
        if (::dup2(out.write.get(), STDOUT_FILENO) == -1 || ::dup2(err.write.get(), STDERR_FILENO) == -1)
            childFail(status.write.get(), ChildStage::Redirect);
        if (!workingDir.empty() && ::chdir(workingDir.c_str()) != 0) childFail(status.write.get(), ChildStage::Chdir);

        // the daemon ignores SIGPIPE and an ignored disposition survives exec
        ::signal(SIGPIPE, SIG_DFL);
        ::execvp(argv[0], argv.data());
        childFail(status.write.get(), ChildStage::Exec);
    }

    out.write.reset();
    err.write.reset();
    status.write.reset();

    // The status pipe closes on a successful exec; anything readable is a failure report
    ChildFailure failure{};
    ssize_t n = 0;
    do {
        n = ::read(status.read.get(), &failure, sizeof(failure));
    } while (n == -1 && errno == EINTR);

    if (n > 0) {
        waitForChild(pid);
        const auto stage = n == static_cast<ssize_t>(sizeof(failure)) ? std::string{stageName(failure.stage)} : "child";
        const int code = n == static_cast<ssize_t>(sizeof(failure)) ? failure.err : EIO;
        LogRegistry::process()->error("[Executor] Failed to start '{}' ({}): {}",
                                      invocation.program, stage, std::strerror(code));
        throw SpawnError(invocation.program, stage, code);
    }

    LogRegistry::audit()->info("spawned pid {}: {}", pid, invocation.commandLine());

    ExecutionResult result;

    setNonBlocking(out.read.get());
    setNonBlocking(err.read.get());

    bool outOpen = true, errOpen = true;
    while (outOpen || errOpen) {
        std::array<pollfd, 2> fds = {{
            {outOpen ? out.read.get() : -1, POLLIN, 0},
            {errOpen ? err.read.get() : -1, POLLIN, 0}
        }};

        if (::poll(fds.data(), fds.size(), -1) == -1) {
            if (errno == EINTR) continue;
            const int pollErr = errno;
            ::kill(pid, SIGKILL);
            waitForChild(pid);
            throw std::runtime_error(fmt::format("poll on '{}' output failed: {}", invocation.program, std::strerror(pollErr)));
        }

        if (outOpen && (fds[0].revents & (POLLIN | POLLHUP | POLLERR)))
            outOpen = drainInto(out.read.get(), result.stdout_text);
        if (errOpen && (fds[1].revents & (POLLIN | POLLHUP | POLLERR)))
            errOpen = drainInto(err.read.get(), result.stderr_text);
    }

    const int raw = waitForChild(pid);
    if (WIFEXITED(raw)) result.exit_code = WEXITSTATUS(raw);
    else if (WIFSIGNALED(raw)) result.term_signal = WTERMSIG(raw);

    LogRegistry::process()->info("[Executor] '{}' (pid {}) finished with exit code {}",
                                 invocation.program, pid, result.exitCodeString());
    return result;
}

}
