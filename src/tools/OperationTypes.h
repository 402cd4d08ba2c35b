#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Operations the sandboxed server can perform.
 *
 * Closed set: a name that does not map to one of these is rejected before it
 * reaches the server.
 */
enum class OperationKind {
    ListFiles,
    ReadFile,
    WriteFile,
    AppendFile,
    MoveFile,
    DeleteFile,
    CreateDirectory,
    DeleteDirectory,
    ListDirectoryTree,
    ReadDirectoryFiles,
    RunVcsCommand,
    GetWorkingDirectory
};

/**
 * @brief Failure taxonomy shared by the server, the transports and the loop.
 */
enum class ErrorKind {
    AccessDenied,
    NotFound,
    AlreadyExists,
    NotADirectory,
    NotAFile,
    Timeout,
    InvalidRequest,
    UpstreamFailure,
    Unknown
};

std::string toString(OperationKind kind);
std::string toString(ErrorKind kind);

// Accepts the canonical snake_case names plus the legacy aliases
// run_git_command and get_current_directory.
std::optional<OperationKind> operationKindFromString(const std::string& name);
ErrorKind errorKindFromString(const std::string& name);

struct OperationRequest {
    OperationKind kind = OperationKind::GetWorkingDirectory;
    nlohmann::json arguments = nlohmann::json::object();

    nlohmann::json toJson() const;
};

/**
 * @brief Outcome of exactly one OperationRequest.
 *
 * Either a payload (string or object) or an ErrorKind with a message, never
 * both. The wire form is {"ok": true, "payload": ...} or
 * {"ok": false, "error_kind": "...", "message": "..."}.
 */
struct OperationResult {
    bool ok = false;
    nlohmann::json payload;
    ErrorKind error = ErrorKind::Unknown;
    std::string message;

    static OperationResult success(nlohmann::json payload);
    static OperationResult failure(ErrorKind kind, std::string message);

    nlohmann::json toJson() const;

    // Malformed input becomes an Unknown failure instead of throwing.
    static OperationResult fromJson(const nlohmann::json& j);

    /**
     * @brief Text handed back to the model for this result.
     *
     * String payloads are returned verbatim, object payloads as indented JSON,
     * failures as "Error [Kind]: message".
     */
    std::string render() const;
};

/**
 * @brief Raised inside the server to abort an operation with a specific kind.
 *
 * Never escapes OperationServer; its boundary converts it into a result.
 */
class OperationError : public std::runtime_error {
public:
    OperationError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind(kind) {}

    ErrorKind getKind() const { return kind; }

private:
    ErrorKind kind;
};
