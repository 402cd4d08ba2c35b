#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "utils/Deadline.h"

namespace fs = std::filesystem;

struct ProcessResult {
    int exitCode = -1;
    bool timedOut = false;
    bool spawnFailed = false;
    std::string output;  // stdout
    std::string error;   // stderr, or the spawn failure reason
};

/**
 * @brief Runs a program without a shell and waits for it under a deadline.
 *
 * The child gets its own process group, stdin from /dev/null and the given
 * working directory. When the deadline passes the whole group receives
 * SIGTERM, then SIGKILL, and is reaped before run() returns.
 */
class ProcessRunner {
public:
    static constexpr std::size_t kDefaultOutputLimit = 1024 * 1024;

    static ProcessResult run(const std::vector<std::string>& argv,
                             const fs::path& workingDir,
                             const Deadline& deadline,
                             const std::vector<std::string>& extraEnv = {},
                             std::size_t outputLimit = kDefaultOutputLimit);
};
