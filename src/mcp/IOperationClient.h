#pragma once
#include <vector>
#include <nlohmann/json.hpp>
#include "tools/OperationTypes.h"

/**
 * @brief Channel between the dispatch loop and an OperationServer.
 *
 * Implementations never throw: transport problems come back as an
 * ErrorKind::Unknown result whose message starts with "transport:".
 */
class IOperationClient {
public:
    virtual ~IOperationClient() = default;

    // Tool schemas in the OpenAI format, as rendered by ToolCatalogue.
    virtual std::vector<nlohmann::json> listTools() = 0;

    virtual OperationResult call(const OperationRequest& request) = 0;
};
