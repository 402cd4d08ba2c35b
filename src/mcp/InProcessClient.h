#pragma once
#include <chrono>
#include <string>
#include "mcp/IOperationClient.h"
#include "tools/OperationServer.h"

// Calls an OperationServer owned by this process directly.
class InProcessClient : public IOperationClient {
public:
    InProcessClient(const std::string& rootPath,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(OperationServer::kDefaultTimeoutMs));

    std::vector<nlohmann::json> listTools() override;
    OperationResult call(const OperationRequest& request) override;

    OperationServer& getServer() { return server; }

private:
    OperationServer server;
};
