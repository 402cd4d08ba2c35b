#include "tools/OperationTypes.h"
#include <map>

namespace {

const std::map<OperationKind, std::string>& kindNames() {
    static const std::map<OperationKind, std::string> names = {
        {OperationKind::ListFiles, "list_files"},
        {OperationKind::ReadFile, "read_file"},
        {OperationKind::WriteFile, "write_file"},
        {OperationKind::AppendFile, "append_file"},
        {OperationKind::MoveFile, "move_file"},
        {OperationKind::DeleteFile, "delete_file"},
        {OperationKind::CreateDirectory, "create_directory"},
        {OperationKind::DeleteDirectory, "delete_directory"},
        {OperationKind::ListDirectoryTree, "list_directory_tree"},
        {OperationKind::ReadDirectoryFiles, "read_directory_files"},
        {OperationKind::RunVcsCommand, "run_vcs_command"},
        {OperationKind::GetWorkingDirectory, "get_working_directory"}
    };
    return names;
}

const std::map<ErrorKind, std::string>& errorNames() {
    static const std::map<ErrorKind, std::string> names = {
        {ErrorKind::AccessDenied, "AccessDenied"},
        {ErrorKind::NotFound, "NotFound"},
        {ErrorKind::AlreadyExists, "AlreadyExists"},
        {ErrorKind::NotADirectory, "NotADirectory"},
        {ErrorKind::NotAFile, "NotAFile"},
        {ErrorKind::Timeout, "Timeout"},
        {ErrorKind::InvalidRequest, "InvalidRequest"},
        {ErrorKind::UpstreamFailure, "UpstreamFailure"},
        {ErrorKind::Unknown, "Unknown"}
    };
    return names;
}

} // namespace

std::string toString(OperationKind kind) {
    return kindNames().at(kind);
}

std::string toString(ErrorKind kind) {
    return errorNames().at(kind);
}

std::optional<OperationKind> operationKindFromString(const std::string& name) {
    for (const auto& [kind, kindName] : kindNames()) {
        if (kindName == name) return kind;
    }
    if (name == "run_git_command") return OperationKind::RunVcsCommand;
    if (name == "get_current_directory") return OperationKind::GetWorkingDirectory;
    return std::nullopt;
}

ErrorKind errorKindFromString(const std::string& name) {
    for (const auto& [kind, kindName] : errorNames()) {
        if (kindName == name) return kind;
    }
    return ErrorKind::Unknown;
}

nlohmann::json OperationRequest::toJson() const {
    return {{"name", toString(kind)}, {"arguments", arguments}};
}

OperationResult OperationResult::success(nlohmann::json payload) {
    OperationResult result;
    result.ok = true;
    result.payload = std::move(payload);
    return result;
}

OperationResult OperationResult::failure(ErrorKind kind, std::string message) {
    OperationResult result;
    result.ok = false;
    result.error = kind;
    result.message = std::move(message);
    return result;
}

nlohmann::json OperationResult::toJson() const {
    if (ok) {
        return {{"ok", true}, {"payload", payload}};
    }
    return {{"ok", false}, {"error_kind", toString(error)}, {"message", message}};
}

OperationResult OperationResult::fromJson(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("ok") || !j["ok"].is_boolean()) {
        return failure(ErrorKind::Unknown, "Malformed operation result: " + j.dump());
    }
    if (j["ok"].get<bool>()) {
        if (!j.contains("payload")) {
            return failure(ErrorKind::Unknown, "Operation result is missing its payload");
        }
        return success(j["payload"]);
    }
    std::string kindName = j.contains("error_kind") && j["error_kind"].is_string()
        ? j["error_kind"].get<std::string>()
        : "Unknown";
    std::string message = j.contains("message") && j["message"].is_string()
        ? j["message"].get<std::string>()
        : "Operation failed without a message";
    return failure(errorKindFromString(kindName), message);
}

std::string OperationResult::render() const {
    if (!ok) {
        return "Error [" + toString(error) + "]: " + message;
    }
    if (payload.is_string()) {
        return payload.get<std::string>();
    }
    // Replace invalid UTF-8 rather than throwing on file content from disk.
    return payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}
