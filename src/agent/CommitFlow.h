#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/LLMClient.h"
#include "tools/OperationServer.h"

/**
 * @brief Stage, commit and push without a dispatch loop.
 *
 * Every git step goes through OperationServer::runVcs with a structured
 * argv, so the commit message never passes through a shell.
 */
class CommitFlow {
public:
    static constexpr std::size_t kMaxDiffBytes = 16 * 1024;

    struct Outcome {
        bool ok = false;
        std::string summary;   // what happened, for the user
        std::string detail;    // stderr (or error message) of the failing step
        std::string commitMessage;
    };

    CommitFlow(OperationServer& server, bool dryRun, bool push = true);

    // git add . / commit -m <message> / branch --show-current / push origin <branch>.
    Outcome manualCommit(const std::string& message);

    // Stages everything, asks the model for a Conventional Commits message
    // describing the staged diff, then runs manualCommit with it.
    Outcome autoCommit(LLMClient& llm);

    static std::string buildCommitPrompt(const std::string& diff);

    // Removes a surrounding ``` fence (with optional language tag) and trims.
    static std::string stripCodeFences(const std::string& text);

private:
    OperationServer& server;
    bool dryRun;
    bool push;

    // Runs one git step. On failure fills outcome and returns false.
    bool runStep(const std::vector<std::string>& args, const std::string& label,
                 std::string& stdoutText, Outcome& outcome);
};
