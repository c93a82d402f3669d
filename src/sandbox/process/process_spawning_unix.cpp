/*
 * process_spawning_unix.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef _WIN32

#include "process_spawning.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

namespace warden::sandbox::process {

namespace {

/// Written by the child to the error pipe when a setup step fails
struct ChildFailure {
    int step;
    int error;
};

enum ChildStep : int {
    StepProcessGroup = 1,
    StepStdin,
    StepOutput,
    StepLimits,
    StepChdir,
    StepExec
};

const char* describeStep(int step) {
    switch (step) {
        case StepProcessGroup: return "setpgid";
        case StepStdin: return "stdin redirection";
        case StepOutput: return "output redirection";
        case StepLimits: return "setrlimit";
        case StepChdir: return "chdir";
        case StepExec: return "execve";
        default: return "child setup";
    }
}

[[noreturn]] void failChild(int errorFd, int step) {
    ChildFailure failure{step, errno};
    // Nothing else can be reported from here
    [[maybe_unused]] auto written = ::write(errorFd, &failure, sizeof(failure));
    ::_exit(127);
}

rlim_t clampToHard(int resource, std::uint64_t requested) {
    struct rlimit current {};
    if (::getrlimit(resource, &current) == 0 && current.rlim_max != RLIM_INFINITY) {
        return std::min<rlim_t>(static_cast<rlim_t>(requested), current.rlim_max);
    }
    return static_cast<rlim_t>(requested);
}

struct PreparedLimit {
    int resource;
    struct rlimit value;
};

ExitStatus toExitStatus(int status, const struct rusage& usage) {
    ExitStatus exit;
    if (WIFEXITED(status)) {
        exit.exited = true;
        exit.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit.signal = WTERMSIG(status);
    }
    exit.cpuTimeMs = (usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) * 1000 +
                     (usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1000;
    exit.maxRssBytes = static_cast<std::uint64_t>(usage.ru_maxrss) * 1024;
    return exit;
}

}  // namespace

Result<SpawnedProcess> ProcessSpawner::spawn(const SpawnSpec& spec) {
    auto launchError = [&spec](std::string message, int error) {
        return std::unexpected(SandboxError{
            .kind = SandboxErrorKind::LaunchFailed,
            .message = std::move(message),
            .cause = fmt::format("{} ({})", std::strerror(error),
                                 spec.executable.string())});
    };

    // Everything the child needs is built before fork
    std::vector<std::string> argvStorage;
    argvStorage.reserve(spec.arguments.size() + 1);
    argvStorage.push_back(spec.executable.string());
    argvStorage.insert(argvStorage.end(), spec.arguments.begin(),
                       spec.arguments.end());
    std::vector<char*> argv;
    for (auto& arg : argvStorage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> envStorage;
    envStorage.reserve(spec.environment.size());
    for (const auto& [name, value] : spec.environment) {
        envStorage.push_back(name + "=" + value);
    }
    std::vector<char*> envp;
    for (auto& entry : envStorage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    std::vector<PreparedLimit> limits;
    if (spec.limits.addressSpaceBytes) {
        auto value = clampToHard(RLIMIT_AS, *spec.limits.addressSpaceBytes);
        limits.push_back({RLIMIT_AS, {value, value}});
    }
    if (spec.limits.cpuSeconds) {
        // SIGXCPU at the soft limit, SIGKILL one second later
        auto soft = clampToHard(RLIMIT_CPU, *spec.limits.cpuSeconds);
        auto hard = clampToHard(RLIMIT_CPU, *spec.limits.cpuSeconds + 1);
        limits.push_back({RLIMIT_CPU, {soft, std::max(soft, hard)}});
    }
    if (spec.limits.openFiles) {
        auto value = clampToHard(RLIMIT_NOFILE, *spec.limits.openFiles);
        limits.push_back({RLIMIT_NOFILE, {value, value}});
    }
    if (spec.limits.disableCoreDumps) {
        limits.push_back({RLIMIT_CORE, {0, 0}});
    }

    const std::string workingDirectory = spec.workingDirectory.string();
    const long maxFd = std::max(::sysconf(_SC_OPEN_MAX), 256L);

    int outputPipe[2];
    if (::pipe2(outputPipe, O_CLOEXEC) != 0) {
        return launchError("Failed to create output pipe", errno);
    }
    int errorPipe[2];
    if (::pipe2(errorPipe, O_CLOEXEC) != 0) {
        int error = errno;
        ::close(outputPipe[0]);
        ::close(outputPipe[1]);
        return launchError("Failed to create error pipe", error);
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int error = errno;
        spdlog::error("Fork failed: {}", std::strerror(error));
        for (int fd : {outputPipe[0], outputPipe[1], errorPipe[0], errorPipe[1]}) {
            ::close(fd);
        }
        return launchError("Failed to fork sandbox process", error);
    }

    if (pid == 0) {
        // Child process: async-signal-safe calls only
        const int errorFd = errorPipe[1];

        if (::setpgid(0, 0) != 0) {
            failChild(errorFd, StepProcessGroup);
        }

        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull < 0 || ::dup2(devNull, STDIN_FILENO) < 0) {
            failChild(errorFd, StepStdin);
        }
        if (::dup2(outputPipe[1], STDOUT_FILENO) < 0 ||
            ::dup2(outputPipe[1], STDERR_FILENO) < 0) {
            failChild(errorFd, StepOutput);
        }

        // Only stdio and the close-on-exec error pipe survive
        const unsigned firstFd = STDERR_FILENO + 1;
        const auto errorSlot = static_cast<unsigned>(errorFd);
        bool closed = (errorSlot == firstFd ||
                       ::close_range(firstFd, errorSlot - 1, 0) == 0) &&
                      ::close_range(errorSlot + 1, ~0U, 0) == 0;
        if (!closed) {
            for (long fd = firstFd; fd < maxFd; ++fd) {
                if (fd != errorFd) {
                    ::close(static_cast<int>(fd));
                }
            }
        }

        for (const auto& limit : limits) {
            if (::setrlimit(limit.resource, &limit.value) != 0) {
                failChild(errorFd, StepLimits);
            }
        }

        if (!workingDirectory.empty() && ::chdir(workingDirectory.c_str()) != 0) {
            failChild(errorFd, StepChdir);
        }

        ::execve(argv[0], argv.data(), envp.data());
        failChild(errorFd, StepExec);
    }

    // Parent process
    ::close(outputPipe[1]);
    ::close(errorPipe[1]);

    // Also set from the parent so the group exists before the first signal
    if (::setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH) {
        spdlog::debug("setpgid({}) from parent failed: {}", pid,
                      std::strerror(errno));
    }

    ChildFailure failure{};
    ssize_t received;
    do {
        received = ::read(errorPipe[0], &failure, sizeof(failure));
    } while (received < 0 && errno == EINTR);
    ::close(errorPipe[0]);

    if (received == static_cast<ssize_t>(sizeof(failure))) {
        ::close(outputPipe[0]);
        int status;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        spdlog::error("Sandbox child {} failed during {}: {}", pid,
                      describeStep(failure.step), std::strerror(failure.error));
        return launchError(
            fmt::format("Failed to launch sandbox process ({})",
                        describeStep(failure.step)),
            failure.error);
    }

    int flags = ::fcntl(outputPipe[0], F_GETFL);
    if (flags < 0 || ::fcntl(outputPipe[0], F_SETFL, flags | O_NONBLOCK) < 0) {
        int error = errno;
        signalGroup(pid, SIGKILL);
        [[maybe_unused]] auto reaped = reap(pid);
        ::close(outputPipe[0]);
        return launchError("Failed to configure output pipe", error);
    }

    spdlog::debug("Spawned sandbox process with PID {}", pid);
    return SpawnedProcess{.processId = static_cast<int>(pid),
                          .outputFd = outputPipe[0]};
}

std::optional<ExitStatus> ProcessSpawner::tryReap(int processId) {
    int status = 0;
    struct rusage usage {};
    pid_t result;
    do {
        result = ::wait4(processId, &status, WNOHANG, &usage);
    } while (result < 0 && errno == EINTR);

    if (result == 0) {
        return std::nullopt;
    }
    if (result < 0) {
        spdlog::warn("wait4({}) failed: {}", processId, std::strerror(errno));
        return ExitStatus{};
    }
    return toExitStatus(status, usage);
}

std::optional<ExitStatus> ProcessSpawner::reap(int processId) {
    int status = 0;
    struct rusage usage {};
    pid_t result;
    do {
        result = ::wait4(processId, &status, 0, &usage);
    } while (result < 0 && errno == EINTR);

    if (result < 0) {
        spdlog::warn("wait4({}) failed: {}", processId, std::strerror(errno));
        return std::nullopt;
    }
    return toExitStatus(status, usage);
}

bool ProcessSpawner::signalGroup(int processId, int signal) {
    if (processId <= 0) {
        return false;
    }
    if (::kill(-processId, signal) == 0) {
        return true;
    }
    // The group may not exist yet if the child has not run setpgid
    return ::kill(processId, signal) == 0;
}

bool ProcessSpawner::isProcessRunning(int processId) {
    return processId > 0 && ::kill(processId, 0) == 0;
}

bool ProcessSpawner::drainOutput(int fd, std::string& buffer,
                                 std::size_t maxBytes, bool& truncated) {
    char chunk[4096];
    while (true) {
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            auto room = maxBytes > buffer.size() ? maxBytes - buffer.size() : 0;
            auto take = std::min<std::size_t>(room, static_cast<std::size_t>(n));
            buffer.append(chunk, take);
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

}  // namespace warden::sandbox::process

#endif  // !_WIN32
