#include <gtest/gtest.h>
#include "mcp/StdioClient.h"
#include "mcp/StdioServer.h"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace std::chrono_literals;

class StdioServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        root = fs::temp_directory_path() / fs::path("gitflash_rpc_test_" + std::to_string(now));
        fs::create_directories(root);
        root = fs::canonical(root);
        std::ofstream(root / "hello.txt") << "hi there";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    fs::path root;
};

TEST_F(StdioServerTest, AnswersInitialize) {
    OperationServer server(root.u8string());
    StdioServer rpc(server);
    json res = rpc.handleLine(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})");
    EXPECT_EQ(res["id"], 1);
    EXPECT_EQ(res["result"]["serverInfo"]["name"], "gitflash-server");
    EXPECT_TRUE(res["result"]["capabilities"].contains("tools"));
}

TEST_F(StdioServerTest, NotificationsGetNoResponse) {
    OperationServer server(root.u8string());
    StdioServer rpc(server);
    EXPECT_TRUE(rpc.handleLine(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").is_null());
}

TEST_F(StdioServerTest, ListsToolsWithInputSchema) {
    OperationServer server(root.u8string());
    StdioServer rpc(server);
    json res = rpc.handleLine(R"({"jsonrpc":"2.0","id":"a","method":"tools/list"})");
    ASSERT_TRUE(res["result"]["tools"].is_array());
    EXPECT_EQ(res["result"]["tools"].size(), 12u);
    EXPECT_TRUE(res["result"]["tools"][0].contains("inputSchema"));
}

TEST_F(StdioServerTest, CallsOperation) {
    OperationServer server(root.u8string());
    StdioServer rpc(server);
    json res = rpc.handleLine(
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"read_file","arguments":{"path":"hello.txt"}}})");
    OperationResult result = OperationResult::fromJson(res["result"]);
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.payload, "hi there");
}

TEST_F(StdioServerTest, InvalidCallIsInvalidRequestResult) {
    OperationServer server(root.u8string());
    StdioServer rpc(server);
    json res = rpc.handleLine(
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"read_file","arguments":{}}})");
    OperationResult result = OperationResult::fromJson(res["result"]);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, ErrorKind::InvalidRequest);
}

TEST_F(StdioServerTest, ProtocolErrors) {
    OperationServer server(root.u8string());
    StdioServer rpc(server);
    EXPECT_EQ(rpc.handleLine("{oops")["error"]["code"], -32700);
    EXPECT_EQ(rpc.handleLine(R"({"jsonrpc":"2.0","id":4})")["error"]["code"], -32600);
    EXPECT_EQ(rpc.handleLine(R"({"jsonrpc":"2.0","id":5,"method":"resources/list"})")["error"]["code"], -32601);
    EXPECT_EQ(rpc.handleLine(R"({"jsonrpc":"2.0","id":6,"method":"tools/call","params":{}})")["error"]["code"], -32602);
}

TEST_F(StdioServerTest, ServeWritesOneLinePerRequest) {
    OperationServer server(root.u8string());
    StdioServer rpc(server);
    std::istringstream in(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\"}\n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
        "\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}\n");
    std::ostringstream out;
    rpc.serve(in, out);

    std::istringstream lines(out.str());
    std::string line;
    std::vector<json> responses;
    while (std::getline(lines, line)) responses.push_back(json::parse(line));
    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(responses[0]["id"], 1);
    EXPECT_EQ(responses[1]["id"], 2);
}

TEST(StdioClient, QuotesArgumentsForShell) {
    EXPECT_EQ(StdioClient::quoteArgument("plain"), "'plain'");
    EXPECT_EQ(StdioClient::quoteArgument("it's"), "'it'\\''s'");
}

TEST(StdioClient, DeadServerIsReportedAsTransportFailure) {
    StdioClient client("exit 0", 2s);
    EXPECT_FALSE(client.initialize());
    EXPECT_FALSE(client.getLastError().empty());

    OperationResult res = client.call({OperationKind::GetWorkingDirectory, json::object()});
    EXPECT_FALSE(res.ok);
    EXPECT_EQ(res.error, ErrorKind::Unknown);
    EXPECT_EQ(res.message.rfind("transport:", 0), 0u);
}

TEST(StdioClient, SilentServerTimesOut) {
    StdioClient client("sleep 30", 300ms);
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(client.initialize());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_NE(client.getLastError().find("no response"), std::string::npos);
}

TEST(StdioClient, ServerRunsInItsOwnProcessGroup) {
    StdioClient client("sleep 30", 300ms);
    client.initialize();
    pid_t pid = client.getServerPid();
    ASSERT_GT(pid, 0);
    EXPECT_EQ(getpgid(pid), pid);
    EXPECT_NE(getpgid(pid), getpgrp());
}

// Answers initialize, then replies to tools/call and tools/list with
// fields of the wrong JSON type.
const char* kMistypedServer =
    "read l; echo '{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}'; "
    "read l; read l; "
    "echo '{\"jsonrpc\":\"2.0\",\"id\":2,\"error\":{\"code\":\"oops\",\"message\":7}}'; "
    "read l; "
    "echo '{\"jsonrpc\":\"2.0\",\"id\":3,\"result\":{\"tools\":["
    "{\"name\":\"read_file\",\"description\":5,\"inputSchema\":\"x\"},{\"name\":9}]}}'; "
    "cat >/dev/null";

TEST(StdioClient, MistypedResponsesAreNotFatal) {
    StdioClient client(kMistypedServer, 5s);
    ASSERT_TRUE(client.initialize()) << client.getLastError();

    OperationResult res;
    EXPECT_NO_THROW(res = client.call({OperationKind::ReadFile, {{"path", "hello.txt"}}}));
    EXPECT_FALSE(res.ok);
    EXPECT_EQ(res.error, ErrorKind::Unknown);
    EXPECT_EQ(res.message, "transport: unknown error");

    std::vector<json> tools;
    EXPECT_NO_THROW(tools = client.listTools());
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools[0]["function"]["name"], "read_file");
    EXPECT_EQ(tools[0]["function"]["description"], "");
    EXPECT_TRUE(tools[0]["function"]["parameters"].is_object());
}

#ifdef GITFLASH_SERVER_BINARY
TEST_F(StdioServerTest, RoundTripThroughServerProcess) {
    std::string command = "exec " + StdioClient::quoteArgument(GITFLASH_SERVER_BINARY) + " " +
                          StdioClient::quoteArgument(root.u8string()) + " --timeout 10";
    StdioClient client(command, 15s);
    ASSERT_TRUE(client.initialize()) << client.getLastError();

    auto tools = client.listTools();
    ASSERT_EQ(tools.size(), 12u);
    EXPECT_EQ(tools[0]["type"], "function");
    EXPECT_TRUE(tools[0]["function"].contains("parameters"));

    auto written = client.call({OperationKind::WriteFile, {{"path", "sub/new.txt"}, {"content", "via rpc"}}});
    ASSERT_TRUE(written.ok) << written.message;

    auto read = client.call({OperationKind::ReadFile, {{"path", "sub/new.txt"}}});
    ASSERT_TRUE(read.ok) << read.message;
    EXPECT_EQ(read.payload, "via rpc");

    auto denied = client.call({OperationKind::ReadFile, {{"path", "../outside.txt"}}});
    EXPECT_FALSE(denied.ok);
    EXPECT_EQ(denied.error, ErrorKind::AccessDenied);

    auto listing = client.call({OperationKind::ReadDirectoryFiles, {{"path", "sub"}}});
    ASSERT_TRUE(listing.ok);
    EXPECT_EQ(listing.payload["new.txt"], "via rpc");
}
#endif
