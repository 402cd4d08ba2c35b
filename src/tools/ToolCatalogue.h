#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tools/OperationTypes.h"

/**
 * @brief Model-facing description of every operation.
 *
 * Pure data: the catalogue never touches the filesystem. It renders the
 * OpenAI `tools` array and checks a proposed call against the declared
 * parameters before the call is allowed to reach a server.
 */
class ToolCatalogue {
public:
    struct Parameter {
        std::string name;
        std::string type;  // "string", "integer" or "boolean"
        bool required = true;
        std::string description;
    };

    struct Entry {
        OperationKind kind;
        std::string description;
        std::vector<Parameter> parameters;

        std::string getName() const { return toString(kind); }
        nlohmann::json getSchema() const;
    };

    struct ValidationResult {
        bool valid = false;
        OperationRequest request;
        std::string error;
    };

    static const std::vector<Entry>& entries();

    // nullptr when the kind has no entry (never for a well-formed kind).
    static const Entry* find(OperationKind kind);

    /**
     * @brief List every operation in the OpenAI tool format.
     *
     * [{"type": "function", "function": {"name", "description", "parameters"}}]
     */
    static std::vector<nlohmann::json> schemas();

    /**
     * @brief Check a proposed call.
     *
     * Fails for an unknown name, a copy operation, non-object arguments, a
     * missing required parameter or a parameter of the wrong primitive type.
     * Extra parameters are ignored.
     */
    static ValidationResult validate(const std::string& name, const nlohmann::json& arguments);
};
