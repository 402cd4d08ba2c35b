#pragma once
#include <istream>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "tools/OperationServer.h"

/**
 * @brief JSON-RPC 2.0 front end for an OperationServer.
 *
 * Reads one request per line and writes one response per line. Handles
 * initialize, tools/list and tools/call; notifications get no response.
 */
class StdioServer {
public:
    explicit StdioServer(OperationServer& server);

    // Serves until EOF on in.
    void serve(std::istream& in, std::ostream& out);

    // Response for one input line, or null when none is due.
    nlohmann::json handleLine(const std::string& line);

private:
    OperationServer& server;

    nlohmann::json handleCall(const nlohmann::json& params);
    static nlohmann::json toolList();
    static nlohmann::json errorResponse(const nlohmann::json& id, int code, const std::string& message);
};
