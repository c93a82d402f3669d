/*
 * process_spawning.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef WARDEN_SANDBOX_PROCESS_SPAWNING_HPP
#define WARDEN_SANDBOX_PROCESS_SPAWNING_HPP

#include "sandbox/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace warden::sandbox::process {

/**
 * @brief rlimits applied in the child before exec
 */
struct ChildLimits {
    std::optional<std::uint64_t> addressSpaceBytes;
    std::optional<std::uint64_t> cpuSeconds;
    std::optional<std::uint64_t> openFiles;
    bool disableCoreDumps{true};
};

struct SpawnSpec {
    std::filesystem::path executable;
    std::vector<std::string> arguments;  ///< argv[1..]
    std::unordered_map<std::string, std::string> environment;  ///< Complete envp
    std::filesystem::path workingDirectory;
    ChildLimits limits;
};

/**
 * @brief A running child
 *
 * The child leads its own process group. stdout and stderr share outputFd.
 */
struct SpawnedProcess {
    int processId{-1};
    int outputFd{-1};
};

/**
 * @brief How a reaped child ended
 */
struct ExitStatus {
    bool exited{false};   ///< Normal exit, exitCode is valid
    int exitCode{-1};
    int signal{0};        ///< Terminating signal when !exited
    std::int64_t cpuTimeMs{0};
    std::uint64_t maxRssBytes{0};
};

/**
 * @brief POSIX process spawning and reaping
 */
class ProcessSpawner {
public:
    /**
     * @brief Fork and exec a child with a merged output pipe
     * @return Spawned process, or LaunchFailed (exec errors included)
     */
    [[nodiscard]] static Result<SpawnedProcess> spawn(const SpawnSpec& spec);

    /**
     * @brief Reap the child if it has exited, without blocking
     * @return Exit status once reaped, nullopt while still running
     */
    [[nodiscard]] static std::optional<ExitStatus> tryReap(int processId);

    /**
     * @brief Block until the child exits and reap it
     */
    [[nodiscard]] static std::optional<ExitStatus> reap(int processId);

    /**
     * @brief Send a signal to the child's whole process group
     */
    static bool signalGroup(int processId, int signal);

    /**
     * @brief Check if process is still running
     */
    [[nodiscard]] static bool isProcessRunning(int processId);

    /**
     * @brief Read whatever is available without blocking
     * @return false once the write end is closed
     */
    static bool drainOutput(int fd, std::string& buffer, std::size_t maxBytes,
                            bool& truncated);
};

}  // namespace warden::sandbox::process

#endif  // WARDEN_SANDBOX_PROCESS_SPAWNING_HPP
