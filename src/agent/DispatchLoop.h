#pragma once
#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "agent/SessionState.h"
#include "core/LLMClient.h"
#include "mcp/IOperationClient.h"

namespace fs = std::filesystem;

/**
 * @brief Drives one session: model → operation → result → model ... → answer.
 *
 * States:
 * - AwaitingModel: send the history with the tool schemas. A reply with tool
 *   calls moves to ExecutingOperation, a reply without moves to Done.
 * - ExecutingOperation: validate each call against ToolCatalogue, pin its
 *   working_directory to the root, run it (or fake it in dry-run mode) and
 *   answer the call id with the rendered result.
 * - Done: terminal.
 *
 * Operation failures, timeouts included, are fed back to the model. Invalid
 * calls, malformed replies and completion failures end the session.
 */
class DispatchLoop {
public:
    static constexpr int kDefaultMaxTurns = 25;
    static constexpr std::size_t kTraceOutputLimit = 2000;

    struct Options {
        bool dryRun = false;
        int maxTurns = kDefaultMaxTurns;
        std::string systemRole;
        // Checked before each model call and each operation.
        const std::atomic<bool>* cancelFlag = nullptr;
    };

    DispatchLoop(std::shared_ptr<LLMClient> llmClient,
                 IOperationClient& client,
                 const fs::path& workingRoot,
                 Options options);

    SessionOutcome run(const std::string& goal);

    const SessionState& getState() const { return state; }
    const nlohmann::json& getMessageHistory() const { return messageHistory; }

private:
    std::shared_ptr<LLMClient> llm;
    IOperationClient& client;
    fs::path workingRoot;
    Options options;

    SessionState state;
    nlohmann::json messageHistory;
    nlohmann::json toolSchemas;

    bool cancelled() const;
    std::string assembleSystemPrompt() const;

    // Runs every call of one assistant message; returns false when the
    // session ended (fatal, cancelled or turn cap) with outcome filled in.
    bool executeToolCalls(const nlohmann::json& toolCalls, SessionOutcome& outcome);

    SessionOutcome finish(const std::string& finalText);
    SessionOutcome fail(ErrorKind kind, const std::string& message);
    SessionOutcome interrupt();
};
