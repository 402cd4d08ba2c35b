#include "agent/CommitFlow.h"
#include "utils/Logger.h"
#include <cctype>

namespace {

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

} // namespace

CommitFlow::CommitFlow(OperationServer& server, bool dryRun, bool push)
    : server(server), dryRun(dryRun), push(push) {}

bool CommitFlow::runStep(const std::vector<std::string>& args, const std::string& label,
                         std::string& stdoutText, Outcome& outcome) {
    auto& logger = Logger::getInstance();
    logger.action(label);

    OperationResult result = server.runVcs(args);
    if (!result.ok) {
        outcome.ok = false;
        outcome.summary = label + " failed";
        outcome.detail = "[" + toString(result.error) + "] " + result.message;
        logger.error(outcome.summary + ": " + outcome.detail);
        return false;
    }

    int code = result.payload.value("return_code", -1);
    stdoutText = result.payload.value("stdout", "");
    if (code != 0) {
        outcome.ok = false;
        outcome.summary = label + " failed (exit code " + std::to_string(code) + ")";
        outcome.detail = result.payload.value("stderr", "");
        if (outcome.detail.empty()) outcome.detail = stdoutText;
        logger.error(outcome.summary + "\n" + outcome.detail);
        if (outcome.detail.find("not a git repository") != std::string::npos) {
            logger.warn("Initialize a git repository first: git init");
        }
        return false;
    }
    return true;
}

CommitFlow::Outcome CommitFlow::manualCommit(const std::string& message) {
    auto& logger = Logger::getInstance();
    Outcome outcome;
    outcome.commitMessage = message;

    if (trim(message).empty()) {
        outcome.summary = "Commit message is required";
        logger.error(outcome.summary);
        return outcome;
    }

    logger.info("Commit message:\n" + message);

    std::string out;
    if (!runStep({"add", "."}, "Staging changes", out, outcome)) return outcome;

    if (dryRun) {
        outcome.ok = true;
        outcome.summary = "Dry run completed - changes were staged but not committed";
        logger.warn(outcome.summary);
        return outcome;
    }

    if (!runStep({"commit", "-m", message}, "Creating commit", out, outcome)) return outcome;
    logger.success("Commit created successfully");

    if (!push) {
        outcome.ok = true;
        outcome.summary = "Committed (push skipped)";
        return outcome;
    }

    std::string branch;
    if (!runStep({"branch", "--show-current"}, "Detecting current branch", branch, outcome)) return outcome;
    branch = trim(branch);
    if (branch.empty()) {
        outcome.summary = "Cannot push: HEAD is detached";
        logger.error(outcome.summary);
        return outcome;
    }

    if (!runStep({"push", "origin", branch}, "Pushing to origin/" + branch, out, outcome)) return outcome;
    logger.success("Changes pushed to origin/" + branch);

    outcome.ok = true;
    outcome.summary = "Committed and pushed to origin/" + branch;
    return outcome;
}

CommitFlow::Outcome CommitFlow::autoCommit(LLMClient& llm) {
    auto& logger = Logger::getInstance();
    Outcome outcome;

    std::string out;
    if (!runStep({"add", "."}, "Staging changes", out, outcome)) return outcome;

    std::string diff;
    if (!runStep({"diff", "--staged"}, "Reading staged diff", diff, outcome)) return outcome;
    if (trim(diff).empty()) {
        outcome.ok = true;
        outcome.summary = "No staged changes to commit.";
        logger.info(outcome.summary);
        return outcome;
    }

    logger.thought("Analyzing changes and generating commit message");
    std::string reply = llm.chat(buildCommitPrompt(diff));
    std::string message = stripCodeFences(reply);
    if (message.empty()) {
        outcome.summary = "Failed to generate commit message";
        logger.error(outcome.summary);
        return outcome;
    }
    logger.success("Commit message generated");

    return manualCommit(message);
}

std::string CommitFlow::buildCommitPrompt(const std::string& diff) {
    std::string prompt =
        "Based on the following git diff, generate a concise commit message following "
        "Conventional Commits. Reply with the commit message only.\n\n";
    if (diff.size() > kMaxDiffBytes) {
        prompt += diff.substr(0, kMaxDiffBytes);
        prompt += "\n... (diff truncated, " + std::to_string(diff.size() - kMaxDiffBytes) + " more bytes)";
    } else {
        prompt += diff;
    }
    return prompt;
}

std::string CommitFlow::stripCodeFences(const std::string& text) {
    std::string result = trim(text);
    if (result.compare(0, 3, "```") == 0) {
        std::size_t lineEnd = result.find('\n');
        // Drop the opening fence and its language tag
        result = lineEnd == std::string::npos ? result.substr(3) : result.substr(lineEnd + 1);
    }
    result = trim(result);
    if (result.size() >= 3 && result.compare(result.size() - 3, 3, "```") == 0) {
        result.erase(result.size() - 3);
    }
    return trim(result);
}
