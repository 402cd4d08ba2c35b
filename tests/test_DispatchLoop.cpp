#include <gtest/gtest.h>
#include "agent/DispatchLoop.h"
#include "mcp/InProcessClient.h"
#include "tools/ToolCatalogue.h"
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

json toolCallResponse(const std::string& id, const std::string& name, const json& args) {
    json call = {{"id", id}, {"type", "function"},
                 {"function", {{"name", name}, {"arguments", args.dump()}}}};
    return {{"choices", json::array({{{"message", {{"role", "assistant"}, {"content", nullptr},
                                                   {"tool_calls", json::array({call})}}}}})}};
}

json textResponse(const std::string& text) {
    return {{"choices", json::array({{{"message", {{"role", "assistant"}, {"content", text}}}}})}};
}

// Replays scripted completions; once the script runs out it keeps
// returning the fallback.
class MockLLMClient : public LLMClient {
public:
    MockLLMClient() : LLMClient("fake_key", "fake_url", "fake_model") {}

    json chatWithTools(const json& messages, const json& tools) override {
        calls++;
        lastMessages = messages;
        lastTools = tools;
        if (script.empty()) return fallback;
        json next = script.front();
        script.pop_front();
        return next;
    }

    std::deque<json> script;
    json fallback = textResponse("done");
    int calls = 0;
    json lastMessages;
    json lastTools;
};

// Records every request and answers from a fixed result.
class RecordingClient : public IOperationClient {
public:
    std::vector<json> listTools() override { return ToolCatalogue::schemas(); }

    OperationResult call(const OperationRequest& request) override {
        requests.push_back(request);
        return reply;
    }

    std::vector<OperationRequest> requests;
    OperationResult reply = OperationResult::success("ok");
};

std::string readAll(const fs::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

} // namespace

class DispatchLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        root = fs::temp_directory_path() / fs::path("gitflash_loop_test_" + std::to_string(now));
        fs::create_directories(root);
        root = fs::canonical(root);
        llm = std::make_shared<MockLLMClient>();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    fs::path root;
    std::shared_ptr<MockLLMClient> llm;
};

TEST_F(DispatchLoopTest, WritesThenReadsNotesFile) {
    llm->script = {
        toolCallResponse("call_1", "write_file", {{"path", "notes.txt"}, {"content", "hello"}}),
        toolCallResponse("call_2", "read_file", {{"path", "notes.txt"}}),
        textResponse("notes.txt now says hello")
    };
    InProcessClient client(root.u8string());
    DispatchLoop loop(llm, client, root, {});

    SessionOutcome outcome = loop.run("create notes.txt containing hello, then show it");

    ASSERT_TRUE(outcome.ok) << outcome.message;
    EXPECT_EQ(outcome.finalText, "notes.txt now says hello");
    EXPECT_EQ(outcome.turns, 2);
    EXPECT_EQ(readAll(root / "notes.txt"), "hello");

    const auto& transcript = loop.getState().transcript;
    ASSERT_EQ(transcript.size(), 2u);
    EXPECT_EQ(transcript[0].request.kind, OperationKind::WriteFile);
    EXPECT_EQ(transcript[1].result.payload, "hello");

    // The second model call saw the read result answering call_2.
    const json& history = loop.getMessageHistory();
    bool answered = false;
    for (const auto& msg : history) {
        if (msg["role"] == "tool" && msg["tool_call_id"] == "call_2") {
            EXPECT_EQ(msg["content"], "hello");
            answered = true;
        }
    }
    EXPECT_TRUE(answered);
}

TEST_F(DispatchLoopTest, SystemPromptNamesTheRoot) {
    RecordingClient client;
    DispatchLoop loop(llm, client, root, {});
    loop.run("say hi");

    ASSERT_GE(llm->lastMessages.size(), 2u);
    EXPECT_EQ(llm->lastMessages[0]["role"], "system");
    EXPECT_NE(llm->lastMessages[0]["content"].get<std::string>().find(root.u8string()), std::string::npos);
    EXPECT_EQ(llm->lastMessages[1]["content"], "say hi");
    EXPECT_EQ(llm->lastTools.size(), 12u);
}

TEST_F(DispatchLoopTest, PinsWorkingDirectoryToRoot) {
    llm->script = {toolCallResponse("c1", "list_files", {{"path", "."}, {"working_directory", "/"}})};
    RecordingClient client;
    DispatchLoop loop(llm, client, root, {});

    auto outcome = loop.run("list");
    ASSERT_TRUE(outcome.ok);
    ASSERT_EQ(client.requests.size(), 1u);
    EXPECT_EQ(client.requests[0].arguments["working_directory"], root.u8string());
}

TEST_F(DispatchLoopTest, DryRunNeverExecutes) {
    llm->script = {toolCallResponse("c1", "delete_directory", {{"path", "src"}})};
    RecordingClient client;
    DispatchLoop::Options opts;
    opts.dryRun = true;
    DispatchLoop loop(llm, client, root, opts);

    auto outcome = loop.run("clean up");
    ASSERT_TRUE(outcome.ok);
    EXPECT_TRUE(client.requests.empty());
    EXPECT_EQ(outcome.turns, 1);
    ASSERT_EQ(loop.getState().transcript.size(), 1u);
    EXPECT_TRUE(loop.getState().transcript[0].dryRun);
    EXPECT_EQ(loop.getState().transcript[0].result.payload, "Dry run mode, command not executed.");
}

TEST_F(DispatchLoopTest, UnknownOperationEndsSession) {
    llm->script = {toolCallResponse("c1", "copy_file", {{"source", "a"}, {"destination", "b"}})};
    RecordingClient client;
    DispatchLoop loop(llm, client, root, {});

    auto outcome = loop.run("copy a to b");
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.error, ErrorKind::InvalidRequest);
    EXPECT_TRUE(client.requests.empty());
    EXPECT_EQ(llm->calls, 1);
}

TEST_F(DispatchLoopTest, MissingParameterEndsSession) {
    llm->script = {toolCallResponse("c1", "write_file", {{"path", "a.txt"}})};
    RecordingClient client;
    DispatchLoop loop(llm, client, root, {});

    auto outcome = loop.run("write");
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.error, ErrorKind::InvalidRequest);
    EXPECT_TRUE(client.requests.empty());
}

TEST_F(DispatchLoopTest, UnparseableArgumentsAreUpstreamFailure) {
    json response = toolCallResponse("c1", "read_file", json::object());
    response["choices"][0]["message"]["tool_calls"][0]["function"]["arguments"] = "{not json";
    llm->script = {response};
    RecordingClient client;
    DispatchLoop loop(llm, client, root, {});

    auto outcome = loop.run("read");
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.error, ErrorKind::UpstreamFailure);
}

TEST_F(DispatchLoopTest, EmptyCompletionIsUpstreamFailure) {
    llm->script = {json::object()};
    RecordingClient client;
    DispatchLoop loop(llm, client, root, {});

    auto outcome = loop.run("anything");
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.error, ErrorKind::UpstreamFailure);
    EXPECT_EQ(outcome.message, "Completion service returned no response");
}

TEST_F(DispatchLoopTest, ResponseWithoutChoicesIsUpstreamFailure) {
    llm->script = {json{{"error", "overloaded"}}};
    RecordingClient client;
    DispatchLoop loop(llm, client, root, {});

    auto outcome = loop.run("anything");
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.error, ErrorKind::UpstreamFailure);
}

TEST_F(DispatchLoopTest, OperationFailureIsFedBack) {
    llm->script = {
        toolCallResponse("c1", "read_file", {{"path", "missing.txt"}}),
        textResponse("the file does not exist")
    };
    InProcessClient client(root.u8string());
    DispatchLoop loop(llm, client, root, {});

    auto outcome = loop.run("show missing.txt");
    ASSERT_TRUE(outcome.ok);
    EXPECT_EQ(outcome.turns, 1);
    EXPECT_EQ(loop.getState().transcript[0].result.error, ErrorKind::NotFound);

    const json& history = loop.getMessageHistory();
    std::string toolContent;
    for (const auto& msg : history) {
        if (msg["role"] == "tool") toolContent = msg["content"].get<std::string>();
    }
    EXPECT_EQ(toolContent.rfind("Error [NotFound]", 0), 0u);
}

TEST_F(DispatchLoopTest, EscapeAttemptIsFedBackAsAccessDenied) {
    llm->script = {toolCallResponse("c1", "read_file", {{"path", "../../etc/passwd"}})};
    InProcessClient client(root.u8string());
    DispatchLoop loop(llm, client, root, {});

    auto outcome = loop.run("read passwd");
    ASSERT_TRUE(outcome.ok);
    EXPECT_EQ(loop.getState().transcript[0].result.error, ErrorKind::AccessDenied);
}

TEST_F(DispatchLoopTest, TimeoutCountsAsOneTurnAndSessionContinues) {
    llm->script = {
        toolCallResponse("c1", "run_vcs_command", {{"command", "30"}}),
        textResponse("the command hung")
    };
    InProcessClient client(root.u8string(), 300ms);
    client.getServer().setVcsProgram("sleep");
    DispatchLoop loop(llm, client, root, {});

    auto outcome = loop.run("run something slow");
    ASSERT_TRUE(outcome.ok);
    EXPECT_EQ(outcome.turns, 1);
    EXPECT_EQ(loop.getState().transcript[0].result.error, ErrorKind::Timeout);
    EXPECT_EQ(outcome.finalText, "the command hung");
}

TEST_F(DispatchLoopTest, VcsStatusOutsideRepositoryIsFedBack) {
    llm->script = {
        toolCallResponse("c1", "run_vcs_command", {{"command", "status"}}),
        textResponse("this directory is not a repository")
    };
    InProcessClient client(root.u8string());
    DispatchLoop loop(llm, client, root, {});

    auto outcome = loop.run("show the repository status");
    ASSERT_TRUE(outcome.ok) << outcome.message;
    EXPECT_EQ(outcome.turns, 1);
    EXPECT_EQ(outcome.finalText, "this directory is not a repository");
    EXPECT_EQ(llm->calls, 2);

    const auto& step = loop.getState().transcript[0];
    ASSERT_TRUE(step.result.ok) << step.result.message;
    EXPECT_NE(step.result.payload["return_code"].get<int>(), 0);

    std::string toolContent;
    for (const auto& msg : loop.getMessageHistory()) {
        if (msg["role"] == "tool" && msg["tool_call_id"] == "c1") {
            toolContent = msg["content"].get<std::string>();
        }
    }
    json fedBack = json::parse(toolContent);
    EXPECT_NE(fedBack["return_code"].get<int>(), 0);
}

TEST_F(DispatchLoopTest, TurnLimitStopsRunawayModel) {
    llm->fallback = toolCallResponse("again", "get_working_directory", json::object());
    RecordingClient client;
    DispatchLoop::Options opts;
    opts.maxTurns = 3;
    DispatchLoop loop(llm, client, root, opts);

    auto outcome = loop.run("loop forever");
    EXPECT_TRUE(outcome.ok);
    EXPECT_TRUE(outcome.turnLimitReached);
    EXPECT_EQ(outcome.turns, 3);
    EXPECT_EQ(client.requests.size(), 3u);
}

TEST_F(DispatchLoopTest, CancelFlagStopsBeforeModelCall) {
    std::atomic<bool> cancel{true};
    RecordingClient client;
    DispatchLoop::Options opts;
    opts.cancelFlag = &cancel;
    DispatchLoop loop(llm, client, root, opts);

    auto outcome = loop.run("anything");
    EXPECT_FALSE(outcome.ok);
    EXPECT_TRUE(outcome.cancelled);
    EXPECT_EQ(llm->calls, 0);
}

TEST_F(DispatchLoopTest, FallsBackToCatalogueWhenTransportListsNothing) {
    class SilentClient : public RecordingClient {
    public:
        std::vector<json> listTools() override { return {}; }
    } client;
    DispatchLoop loop(llm, client, root, {});
    loop.run("hi");
    EXPECT_EQ(llm->lastTools.size(), ToolCatalogue::schemas().size());
}
