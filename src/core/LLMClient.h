#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Client for an OpenAI-compatible chat completions endpoint.
 *
 * Failures never throw: after the retries are spent chatWithTools returns an
 * empty object, which callers treat as an upstream failure. The methods are
 * virtual so tests can script the model.
 */
class LLMClient {
public:
    LLMClient(const std::string& apiKey, 
              const std::string& baseUrl = "https://api.openai.com/v1", 
              const std::string& model = "gpt-4o-mini");
    virtual ~LLMClient() = default;
    
    virtual std::string chat(const std::string& prompt, const std::string& systemRole = "");
    virtual nlohmann::json chatWithTools(const nlohmann::json& messages, const nlohmann::json& tools);

    const std::string& getModel() const { return modelName; }

private:
    std::string apiKey;
    std::string baseUrl;
    std::string modelName;
    bool isSsl;
    std::string host;
    int port;
    std::string pathPrefix;

    void parseBaseUrl(const std::string& url);
};
