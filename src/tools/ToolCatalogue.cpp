#include "tools/ToolCatalogue.h"

namespace {

ToolCatalogue::Parameter pathParam(const std::string& description) {
    return {"path", "string", true, description};
}

bool matchesType(const nlohmann::json& value, const std::string& type) {
    if (type == "string") return value.is_string();
    if (type == "integer") return value.is_number_integer();
    if (type == "boolean") return value.is_boolean();
    return false;
}

} // namespace

nlohmann::json ToolCatalogue::Entry::getSchema() const {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();
    for (const auto& param : parameters) {
        properties[param.name] = {{"type", param.type}, {"description", param.description}};
        if (param.required) required.push_back(param.name);
    }

    nlohmann::json schema = {{"type", "object"}, {"properties", properties}};
    if (!required.empty()) schema["required"] = required;
    return schema;
}

const std::vector<ToolCatalogue::Entry>& ToolCatalogue::entries() {
    static const std::vector<Entry> catalogue = {
        {OperationKind::ListFiles,
         "Lists files and directories in a specified path. Use '.' for the project directory.",
         {pathParam("Directory to list, relative to the project directory.")}},
        {OperationKind::ReadFile,
         "Reads and returns the content of a specified file.",
         {pathParam("File to read.")}},
        {OperationKind::WriteFile,
         "Writes or overwrites content to a specified file. Creates the file and missing parent directories if needed.",
         {pathParam("File to write."),
          {"content", "string", true, "Full new content of the file."}}},
        {OperationKind::AppendFile,
         "Appends content to the end of a file, creating it if it does not exist.",
         {pathParam("File to append to."),
          {"content", "string", true, "Text to append."}}},
        {OperationKind::MoveFile,
         "Moves or renames a file or directory. The destination must not exist yet.",
         {{"source", "string", true, "Existing file or directory."},
          {"destination", "string", true, "New path; its parent directory must exist."}}},
        {OperationKind::DeleteFile,
         "Deletes a specified file.",
         {pathParam("File to delete.")}},
        {OperationKind::CreateDirectory,
         "Creates a new directory, including any necessary parent directories.",
         {pathParam("Directory to create.")}},
        {OperationKind::DeleteDirectory,
         "Deletes a directory and all of its contents recursively.",
         {pathParam("Directory to delete.")}},
        {OperationKind::ListDirectoryTree,
         "Recursively lists the directory tree structure starting at a given path.",
         {pathParam("Directory to start from.")}},
        {OperationKind::ReadDirectoryFiles,
         "Reads the contents of all files in the given directory (non-recursive).",
         {pathParam("Directory whose files should be read.")}},
        {OperationKind::RunVcsCommand,
         "Executes a git command in the project directory. Do not include 'git' in the command string.",
         {{"command", "string", true, "Arguments for git, for example: status --short"}}},
        {OperationKind::GetWorkingDirectory,
         "Returns the project directory path.",
         {}}
    };
    return catalogue;
}

const ToolCatalogue::Entry* ToolCatalogue::find(OperationKind kind) {
    for (const auto& entry : entries()) {
        if (entry.kind == kind) return &entry;
    }
    return nullptr;
}

std::vector<nlohmann::json> ToolCatalogue::schemas() {
    std::vector<nlohmann::json> result;
    for (const auto& entry : entries()) {
        nlohmann::json function;
        function["name"] = entry.getName();
        function["description"] = entry.description;
        function["parameters"] = entry.getSchema();

        nlohmann::json schema;
        schema["type"] = "function";
        schema["function"] = function;
        result.push_back(schema);
    }
    return result;
}

ToolCatalogue::ValidationResult ToolCatalogue::validate(const std::string& name, const nlohmann::json& arguments) {
    ValidationResult result;

    if (name.compare(0, 5, "copy_") == 0) {
        result.error = "Operation '" + name + "' is not supported";
        return result;
    }

    auto kind = operationKindFromString(name);
    if (!kind) {
        result.error = "Unknown operation: " + name;
        return result;
    }

    if (!arguments.is_object()) {
        result.error = "Arguments for '" + name + "' must be a JSON object";
        return result;
    }

    const Entry* entry = find(*kind);
    if (!entry) {
        result.error = "No catalogue entry for operation: " + name;
        return result;
    }

    for (const auto& param : entry->parameters) {
        auto it = arguments.find(param.name);
        if (it == arguments.end() || it->is_null()) {
            if (param.required) {
                result.error = "Missing required parameter '" + param.name + "' for " + name;
                return result;
            }
            continue;
        }
        if (!matchesType(*it, param.type)) {
            result.error = "Parameter '" + param.name + "' of " + name + " must be of type " + param.type;
            return result;
        }
    }

    result.valid = true;
    result.request.kind = *kind;
    result.request.arguments = arguments;
    return result;
}
