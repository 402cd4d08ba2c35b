#include "mcp/StdioServer.h"
#include "tools/ToolCatalogue.h"
#include "utils/Logger.h"

namespace {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
}

StdioServer::StdioServer(OperationServer& server) : server(server) {}

void StdioServer::serve(std::istream& in, std::ostream& out) {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        nlohmann::json response = handleLine(line);
        if (response.is_null()) continue;
        out << response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        out.flush();
    }
}

nlohmann::json StdioServer::handleLine(const std::string& line) {
    nlohmann::json request = nlohmann::json::parse(line, nullptr, false);
    if (request.is_discarded()) {
        return errorResponse(nullptr, kParseError, "Parse error");
    }
    if (!request.is_object() || !request.contains("method") || !request["method"].is_string()) {
        return errorResponse(request.is_object() ? request.value("id", nlohmann::json()) : nlohmann::json(),
                             kInvalidRequest, "Invalid Request");
    }

    std::string method = request["method"].get<std::string>();
    if (!request.contains("id")) {
        Logger::getInstance().debug("notification: " + method);
        return nullptr;
    }
    nlohmann::json id = request["id"];
    nlohmann::json params = request.value("params", nlohmann::json::object());

    nlohmann::json result;
    if (method == "initialize") {
        result = {
            {"protocolVersion", "2024-11-05"},
            {"capabilities", {{"tools", nlohmann::json::object()}}},
            {"serverInfo", {{"name", "gitflash-server"}, {"version", "1.0.0"}}}
        };
    } else if (method == "tools/list") {
        result = toolList();
    } else if (method == "tools/call") {
        if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
            return errorResponse(id, kInvalidParams, "tools/call needs a string 'name'");
        }
        result = handleCall(params);
    } else {
        return errorResponse(id, kMethodNotFound, "Method not found: " + method);
    }

    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

nlohmann::json StdioServer::handleCall(const nlohmann::json& params) {
    std::string name = params["name"].get<std::string>();
    nlohmann::json arguments = params.value("arguments", nlohmann::json::object());

    auto validation = ToolCatalogue::validate(name, arguments);
    if (!validation.valid) {
        Logger::getInstance().warn("Rejected call to " + name + ": " + validation.error);
        return OperationResult::failure(ErrorKind::InvalidRequest, validation.error).toJson();
    }

    OperationResult result = server.execute(validation.request);
    Logger::getInstance().info(name + " -> " + (result.ok ? "ok" : toString(result.error)));
    return result.toJson();
}

nlohmann::json StdioServer::toolList() {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& entry : ToolCatalogue::entries()) {
        tools.push_back({
            {"name", entry.getName()},
            {"description", entry.description},
            {"inputSchema", entry.getSchema()}
        });
    }
    return {{"tools", tools}};
}

nlohmann::json StdioServer::errorResponse(const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}
