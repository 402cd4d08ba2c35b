#include "mcp/InProcessClient.h"
#include "tools/ToolCatalogue.h"

InProcessClient::InProcessClient(const std::string& rootPath, std::chrono::milliseconds timeout)
    : server(rootPath, timeout) {}

std::vector<nlohmann::json> InProcessClient::listTools() {
    return ToolCatalogue::schemas();
}

OperationResult InProcessClient::call(const OperationRequest& request) {
    return server.execute(request);
}
