#pragma once
#include <cstdlib>
#include <string>
#include <fstream>
#include <filesystem>
#include <regex>
#include <stdexcept>
#include <nlohmann/json.hpp>

struct Config {
    struct LLM {
        std::string apiKey;
        std::string baseUrl = "https://api.openai.com/v1";
        std::string model = "gpt-4o-mini";
        std::string systemRole =
            "You are GitFlash, an AI assistant for git and file system operations. "
            "Use the provided tools to act on the project directory, one step at a time, "
            "and answer with a short summary once the goal is reached.";
    } llm;

    struct Agent {
        int maxTurns = 25;
        int toolTimeoutSeconds = 120;
        std::string transport = "builtin";  // "builtin" or "stdio"
        std::string serverCommand = "gitflash-server";
        std::string vcsProgram = "git";
        bool enableDebug = false;
    } agent;

    static Config defaults() { return Config(); }

    // Missing keys keep their defaults; malformed files and wrong types throw.
    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }
        
        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }
        if (!j.is_object()) {
            throw std::runtime_error("Config root must be a JSON object: " + path.string());
        }

        Config cfg;
        try {
            if (j.contains("llm")) {
                const auto& llm = j.at("llm");
                cfg.llm.apiKey = llm.value("api_key", cfg.llm.apiKey);
                cfg.llm.baseUrl = llm.value("base_url", cfg.llm.baseUrl);
                cfg.llm.model = llm.value("model", cfg.llm.model);
                cfg.llm.systemRole = llm.value("system_role", cfg.llm.systemRole);
            }
            if (j.contains("agent")) {
                const auto& agent = j.at("agent");
                cfg.agent.maxTurns = agent.value("max_turns", cfg.agent.maxTurns);
                cfg.agent.toolTimeoutSeconds = agent.value("tool_timeout_seconds", cfg.agent.toolTimeoutSeconds);
                cfg.agent.transport = agent.value("transport", cfg.agent.transport);
                cfg.agent.serverCommand = agent.value("server_command", cfg.agent.serverCommand);
                cfg.agent.vcsProgram = agent.value("vcs_program", cfg.agent.vcsProgram);
                cfg.agent.enableDebug = agent.value("enable_debug", cfg.agent.enableDebug);
            }
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid value in " + path.string() + ": " + e.what());
        }

        cfg.validate();
        return cfg;
    }

    void validate() const {
        if (agent.maxTurns <= 0) {
            throw std::runtime_error("agent.max_turns must be positive");
        }
        if (agent.toolTimeoutSeconds <= 0) {
            throw std::runtime_error("agent.tool_timeout_seconds must be positive");
        }
        if (agent.transport != "builtin" && agent.transport != "stdio") {
            throw std::runtime_error("agent.transport must be \"builtin\" or \"stdio\", got \"" + agent.transport + "\"");
        }
    }

    static std::filesystem::path homeDir() {
        const char* home = std::getenv("HOME");
        return home ? std::filesystem::u8path(home) : std::filesystem::path();
    }

    // ~/.gitflash, empty when HOME is unset.
    static std::filesystem::path dataDir() {
        std::filesystem::path home = homeDir();
        return home.empty() ? home : home / ".gitflash";
    }

    /**
     * @brief Pick the config file to load.
     *
     * An explicit path wins, then ./gitflash.json, then ~/.gitflash/config.json.
     * Returns an empty string when none exists (defaults apply).
     */
    static std::string findConfigFile(const std::string& explicitPath) {
        if (!explicitPath.empty()) return explicitPath;
        std::error_code ec;
        if (std::filesystem::is_regular_file("gitflash.json", ec)) return "gitflash.json";
        std::filesystem::path dir = dataDir();
        if (!dir.empty() && std::filesystem::is_regular_file(dir / "config.json", ec)) {
            return (dir / "config.json").u8string();
        }
        return "";
    }

    /**
     * @brief Fill llm.apiKey if the config did not set it.
     *
     * Sources, in order: the config file, $GITFLASH_API_KEY, then a
     * GITFLASH_API_KEY="..." line in envFile. Returns false if all are empty.
     */
    bool resolveApiKey(const std::filesystem::path& envFile) {
        if (!llm.apiKey.empty()) return true;

        const char* fromEnv = std::getenv("GITFLASH_API_KEY");
        if (fromEnv && *fromEnv) {
            llm.apiKey = fromEnv;
            return true;
        }

        std::ifstream f(envFile);
        if (f.is_open()) {
            static const std::regex keyLine(R"re(^\s*GITFLASH_API_KEY="(.+)"\s*$)re");
            std::string line;
            std::smatch match;
            while (std::getline(f, line)) {
                if (std::regex_match(line, match, keyLine)) {
                    llm.apiKey = match[1];
                    return true;
                }
            }
        }
        return false;
    }
};
