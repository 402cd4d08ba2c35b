#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tools/OperationTypes.h"
#include "utils/Deadline.h"
#include "utils/PathGuard.h"

namespace fs = std::filesystem;

/**
 * @brief The sandboxed filesystem and version-control primitives.
 *
 * Every path argument goes through PathGuard, every call runs under its own
 * Deadline, and no exception crosses the public methods: failures come back
 * as OperationResult with an ErrorKind.
 */
class OperationServer {
public:
    static constexpr int kDefaultTimeoutMs = 120000;
    static constexpr std::uintmax_t kMaxReadBytes = 8 * 1024 * 1024;

    explicit OperationServer(const std::string& rootPath,
                             std::chrono::milliseconds timeout = std::chrono::milliseconds(kDefaultTimeoutMs));

    /**
     * @brief Dispatch a request to the handler registered for its kind.
     *
     * A `working_directory` argument, when present, must name the root;
     * anything else is refused with AccessDenied.
     */
    OperationResult execute(const OperationRequest& request);

    OperationResult listFiles(const std::string& path);
    OperationResult readFile(const std::string& path);
    OperationResult writeFile(const std::string& path, const std::string& content);
    OperationResult appendFile(const std::string& path, const std::string& content);
    OperationResult moveFile(const std::string& source, const std::string& destination);
    OperationResult deleteFile(const std::string& path);
    OperationResult createDirectory(const std::string& path);
    OperationResult deleteDirectory(const std::string& path);
    OperationResult listDirectoryTree(const std::string& path);
    OperationResult readDirectoryFiles(const std::string& path);
    OperationResult runVcsCommand(const std::string& command);
    OperationResult getWorkingDirectory();

    // Structured form of runVcsCommand for callers that already hold argv.
    OperationResult runVcs(const std::vector<std::string>& args);

    /**
     * @brief Split a command line into words.
     *
     * Understands single quotes, double quotes and backslash escapes; does
     * no globbing or variable expansion.
     * @throws OperationError(Unknown) on an unterminated quote.
     */
    static std::vector<std::string> splitCommandLine(const std::string& command);

    // Program used for run_vcs_command ("git" unless overridden).
    void setVcsProgram(const std::string& program) { vcsProgram = program; }
    const std::string& getVcsProgram() const { return vcsProgram; }

    const fs::path& workingRoot() const { return guard.root(); }
    std::chrono::milliseconds getTimeout() const { return timeout; }

private:
    PathGuard guard;
    std::chrono::milliseconds timeout;
    std::string vcsProgram = "git";

    using Handler = std::function<OperationResult(const nlohmann::json&)>;
    std::map<OperationKind, Handler> handlers;

    void registerHandlers();

    // Runs body under a fresh deadline and converts every exception into a
    // failed result.
    OperationResult guarded(const std::function<OperationResult(const Deadline&)>& body);

    std::string readContent(const fs::path& path, const Deadline& deadline);
    void writeContent(const fs::path& path, const std::string& content, bool append, const Deadline& deadline);
    void removeTree(const fs::path& path, const Deadline& deadline);
    void buildTree(const fs::path& dir, int depth, std::set<fs::path>& ancestors,
                   std::string& out, const Deadline& deadline);
};
