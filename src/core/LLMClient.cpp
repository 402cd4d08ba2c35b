#include "core/LLMClient.h"
#include "utils/Logger.h"
#define CPPHTTPLIB_OPENSSL_SUPPORT
#include "httplib.h"
#include <chrono>
#include <regex>
#include <thread>

LLMClient::LLMClient(const std::string& apiKey, const std::string& baseUrl, const std::string& model) 
    : apiKey(apiKey), baseUrl(baseUrl), modelName(model) {
    parseBaseUrl(baseUrl);
}

void LLMClient::parseBaseUrl(const std::string& url) {
    std::regex urlRegex(R"((http|https)://([^/:]+)(?::(\d+))?(.*))");
    std::smatch match;
    if (std::regex_match(url, match, urlRegex)) {
        isSsl = (match[1] == "https");
        host = match[2];
        if (match[3].matched) {
            port = std::stoi(match[3]);
        } else {
            port = isSsl ? 443 : 80;
        }
        pathPrefix = match[4];
        while (!pathPrefix.empty() && pathPrefix.back() == '/') {
            pathPrefix.pop_back();
        }
    } else {
        // Bare host name
        isSsl = true;
        host = url;
        port = 443;
        pathPrefix = "";
    }
}

std::string LLMClient::chat(const std::string& prompt, const std::string& systemRole) {
    nlohmann::json messages = nlohmann::json::array();
    std::string role = systemRole.empty() ? "You are a helpful assistant." : systemRole;
    messages.push_back({{"role", "system"}, {"content", role}});
    messages.push_back({{"role", "user"}, {"content", prompt}});

    nlohmann::json res = chatWithTools(messages, nlohmann::json::array());
    if (res.is_object() && res.contains("choices") && res["choices"].is_array() && !res["choices"].empty()) {
        const auto& msg = res["choices"][0].value("message", nlohmann::json::object());
        if (msg.contains("content") && msg["content"].is_string()) {
            return msg["content"].get<std::string>();
        }
    }
    return "";
}

// Request bodies must carry string content: an assistant turn that only made
// tool calls comes back with "content": null, and some providers return it
// as an array of text parts.
static nlohmann::json normalizeMessages(const nlohmann::json& messages) {
    if (!messages.is_array()) return messages;
    nlohmann::json out = nlohmann::json::array();
    for (const auto& msg : messages) {
        if (!msg.is_object()) continue;
        nlohmann::json m = msg;
        if (m.contains("content")) {
            if (m["content"].is_null()) {
                m["content"] = "";
            } else if (m["content"].is_array()) {
                std::string flat;
                for (const auto& part : m["content"]) {
                    if (part.is_object() && part.contains("text") && part["text"].is_string())
                        flat += part["text"].get<std::string>();
                }
                m["content"] = flat;
            }
        }
        out.push_back(m);
    }
    return out;
}

nlohmann::json LLMClient::chatWithTools(const nlohmann::json& messages, const nlohmann::json& tools) {
    httplib::Headers headers = {
        {"Authorization", "Bearer " + apiKey}
    };

    nlohmann::json body = {
        {"model", modelName},
        {"messages", normalizeMessages(messages)}
    };

    if (!tools.empty()) {
        body["tools"] = tools;
    }

    std::string endpoint = pathPrefix + "/chat/completions";
    std::string bodyStr = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    httplib::Result res;
    std::string failure;
    int retryCount = 0;
    const int maxRetries = 3;
    auto& logger = Logger::getInstance();
    
    while (retryCount < maxRetries) {
        try {
            if (isSsl) {
                httplib::SSLClient cli(host, port);
                cli.set_follow_location(true);
                cli.set_connection_timeout(10);
                cli.set_read_timeout(120);
                res = cli.Post(endpoint.c_str(), headers, bodyStr, "application/json");
            } else {
                httplib::Client cli(host, port);
                cli.set_follow_location(true);
                cli.set_connection_timeout(10);
                cli.set_read_timeout(120);
                res = cli.Post(endpoint.c_str(), headers, bodyStr, "application/json");
            }

            if (res && res->status == 200) break;
            failure = res ? "HTTP " + std::to_string(res->status) : httplib::to_string(res.error());
        } catch (const std::exception& e) {
            failure = e.what();
        }

        retryCount++;
        if (retryCount < maxRetries) {
            logger.warn("API request failed (" + failure + "). Retrying (" +
                        std::to_string(retryCount) + "/" + std::to_string(maxRetries) + ")...");
            std::this_thread::sleep_for(std::chrono::seconds(2 * retryCount));
        }
    }

    if (res && res->status == 200) {
        try {
            return nlohmann::json::parse(res->body);
        } catch (const nlohmann::json::parse_error& e) {
            logger.error(std::string("API returned invalid JSON: ") + e.what());
            return nlohmann::json::object();
        }
    }

    logger.error("API Error after " + std::to_string(maxRetries) + " attempts: " + failure);
    if (res && !res->body.empty()) logger.debug("Body: " + res->body);
    return nlohmann::json::object();
}
