#include "agent/DispatchLoop.h"
#include "tools/ToolCatalogue.h"
#include "utils/Logger.h"

namespace {

const char* const kDryRunOutput = "Dry run mode, command not executed.";
const std::string kDivider(60, '-');

std::string truncateForTrace(const std::string& text, std::size_t limit) {
    if (text.size() <= limit) return text;
    return text.substr(0, limit) + "\n... (" + std::to_string(text.size() - limit) + " more characters)";
}

} // namespace

DispatchLoop::DispatchLoop(std::shared_ptr<LLMClient> llmClient,
                           IOperationClient& client,
                           const fs::path& workingRoot,
                           Options options)
    : llm(std::move(llmClient)),
      client(client),
      workingRoot(workingRoot),
      options(std::move(options)) {
    messageHistory = nlohmann::json::array();
}

bool DispatchLoop::cancelled() const {
    return options.cancelFlag && options.cancelFlag->load();
}

std::string DispatchLoop::assembleSystemPrompt() const {
    std::string prompt = options.systemRole.empty()
        ? "You are GitFlash, an AI assistant for git and file system operations."
        : options.systemRole;
    prompt += "\nOperating in directory: " + workingRoot.u8string() + ".";
    prompt += "\nAll paths are relative to that directory; git commands are run there without the leading 'git'.";
    return prompt;
}

SessionOutcome DispatchLoop::run(const std::string& goal) {
    auto& logger = Logger::getInstance();

    state = SessionState();
    state.goal = goal;
    messageHistory = nlohmann::json::array();
    messageHistory.push_back({{"role", "system"}, {"content", assembleSystemPrompt()}});
    messageHistory.push_back({{"role", "user"}, {"content", goal}});

    toolSchemas = nlohmann::json::array();
    std::vector<nlohmann::json> schemas = client.listTools();
    if (schemas.empty()) {
        logger.warn("Transport reported no tools; using the built-in catalogue.");
        schemas = ToolCatalogue::schemas();
    }
    for (const auto& schema : schemas) {
        toolSchemas.push_back(schema);
    }

    logger.info("Goal: " + goal);
    if (options.dryRun) {
        logger.warn("Dry run: operations will be announced but not executed.");
    }

    while (state.phase != LoopPhase::Done) {
        if (cancelled()) return interrupt();

        logger.thought("Waiting for the model...");
        nlohmann::json response = llm->chatWithTools(messageHistory, toolSchemas);
        if (!response.is_object() || response.empty()) {
            return fail(ErrorKind::UpstreamFailure, "Completion service returned no response");
        }
        if (!response.contains("choices") || !response["choices"].is_array() || response["choices"].empty()) {
            return fail(ErrorKind::UpstreamFailure, "Malformed completion response: no choices");
        }
        const nlohmann::json& choice = response["choices"][0];
        if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object()) {
            return fail(ErrorKind::UpstreamFailure, "Malformed completion response: no message");
        }

        nlohmann::json message = choice["message"];
        messageHistory.push_back(message);

        bool hasToolCalls = message.contains("tool_calls") && message["tool_calls"].is_array() &&
                            !message["tool_calls"].empty();
        if (!hasToolCalls) {
            std::string text;
            if (message.contains("content") && message["content"].is_string()) {
                text = message["content"].get<std::string>();
            } else if (message.contains("content") && !message["content"].is_null()) {
                text = message["content"].dump();
            }
            return finish(text);
        }

        state.phase = LoopPhase::ExecutingOperation;
        SessionOutcome outcome;
        if (!executeToolCalls(message["tool_calls"], outcome)) {
            return outcome;
        }
        state.phase = LoopPhase::AwaitingModel;
    }

    return finish(state.finalText.value_or(""));
}

bool DispatchLoop::executeToolCalls(const nlohmann::json& toolCalls, SessionOutcome& outcome) {
    auto& logger = Logger::getInstance();

    for (const auto& toolCall : toolCalls) {
        if (cancelled()) {
            outcome = interrupt();
            return false;
        }
        if (state.turns >= options.maxTurns) {
            state.turnLimitReached = true;
            logger.warn("Turn limit of " + std::to_string(options.maxTurns) + " operations reached.");
            outcome = finish("Stopped after " + std::to_string(state.turns) +
                             " operations: the turn limit was reached before the goal was completed.");
            return false;
        }

        if (!toolCall.is_object() || !toolCall.contains("function") || !toolCall["function"].is_object()) {
            outcome = fail(ErrorKind::UpstreamFailure, "Malformed tool call: missing function");
            return false;
        }
        const nlohmann::json& function = toolCall["function"];
        if (!function.contains("name") || !function["name"].is_string() ||
            function["name"].get<std::string>().empty()) {
            outcome = fail(ErrorKind::UpstreamFailure, "Malformed tool call: missing function name");
            return false;
        }
        std::string toolName = function["name"].get<std::string>();
        std::string callId = toolCall.contains("id") && toolCall["id"].is_string()
            ? toolCall["id"].get<std::string>()
            : "";

        nlohmann::json args = nlohmann::json::object();
        if (function.contains("arguments")) {
            const nlohmann::json& raw = function["arguments"];
            if (raw.is_string()) {
                const std::string& argsStr = raw.get_ref<const std::string&>();
                if (!argsStr.empty()) {
                    args = nlohmann::json::parse(argsStr, nullptr, false);
                    if (args.is_discarded()) {
                        outcome = fail(ErrorKind::UpstreamFailure,
                                       "Malformed arguments for " + toolName + ": not valid JSON");
                        return false;
                    }
                }
            } else if (!raw.is_null()) {
                args = raw;
            }
        }

        auto validation = ToolCatalogue::validate(toolName, args);
        if (!validation.valid) {
            outcome = fail(ErrorKind::InvalidRequest, validation.error);
            return false;
        }

        OperationRequest request = validation.request;
        request.arguments["working_directory"] = workingRoot.u8string();

        logger.action("Planning action: " + toString(request.kind) + "\n" + request.arguments.dump(2));

        OperationResult result;
        if (options.dryRun) {
            logger.warn("Dry run - skipping execution");
            result = OperationResult::success(kDryRunOutput);
        } else {
            result = client.call(request);
            if (result.ok) {
                logger.success("Action completed");
            } else {
                logger.warn("Action failed: " + toString(result.error));
            }
        }
        state.record(request, result, options.dryRun);

        std::string rendered = result.render();
        logger.info("Output:\n" + truncateForTrace(rendered, kTraceOutputLimit));
        logger.info(kDivider);

        nlohmann::json toolResult;
        toolResult["role"] = "tool";
        toolResult["tool_call_id"] = callId;
        toolResult["content"] = rendered;
        messageHistory.push_back(toolResult);
    }
    return true;
}

SessionOutcome DispatchLoop::finish(const std::string& finalText) {
    state.phase = LoopPhase::Done;
    state.finished = true;
    state.finalText = finalText;

    SessionOutcome outcome;
    outcome.ok = true;
    outcome.finalText = finalText;
    outcome.turns = state.turns;
    outcome.turnLimitReached = state.turnLimitReached;
    Logger::getInstance().success("Task completed after " + std::to_string(state.turns) + " operation(s).");
    return outcome;
}

SessionOutcome DispatchLoop::fail(ErrorKind kind, const std::string& message) {
    state.phase = LoopPhase::Done;
    state.finished = true;

    SessionOutcome outcome;
    outcome.ok = false;
    outcome.error = kind;
    outcome.message = message;
    outcome.turns = state.turns;
    Logger::getInstance().error("Session aborted [" + toString(kind) + "]: " + message);
    return outcome;
}

SessionOutcome DispatchLoop::interrupt() {
    state.phase = LoopPhase::Done;
    state.finished = true;

    SessionOutcome outcome;
    outcome.ok = false;
    outcome.cancelled = true;
    outcome.error = ErrorKind::Unknown;
    outcome.message = "Interrupted";
    outcome.turns = state.turns;
    Logger::getInstance().warn("Session interrupted after " + std::to_string(state.turns) + " operation(s).");
    return outcome;
}
