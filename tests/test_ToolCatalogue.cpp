#include <gtest/gtest.h>
#include "tools/ToolCatalogue.h"
#include <set>

using json = nlohmann::json;

TEST(ToolCatalogue, DescribesEveryOperation) {
    auto schemas = ToolCatalogue::schemas();
    ASSERT_EQ(schemas.size(), 12u);

    std::set<std::string> names;
    for (const auto& schema : schemas) {
        EXPECT_EQ(schema["type"], "function");
        EXPECT_EQ(schema["function"]["parameters"]["type"], "object");
        EXPECT_FALSE(schema["function"]["description"].get<std::string>().empty());
        names.insert(schema["function"]["name"].get<std::string>());
    }
    std::set<std::string> expected = {
        "list_files", "read_file", "write_file", "append_file", "move_file", "delete_file",
        "create_directory", "delete_directory", "list_directory_tree", "read_directory_files",
        "run_vcs_command", "get_working_directory"};
    EXPECT_EQ(names, expected);
}

TEST(ToolCatalogue, SchemaListsRequiredParameters) {
    const auto* write = ToolCatalogue::find(OperationKind::WriteFile);
    ASSERT_NE(write, nullptr);
    json schema = write->getSchema();
    EXPECT_EQ(schema["required"], json({"path", "content"}));
    EXPECT_EQ(schema["properties"]["content"]["type"], "string");

    const auto* cwd = ToolCatalogue::find(OperationKind::GetWorkingDirectory);
    ASSERT_NE(cwd, nullptr);
    EXPECT_FALSE(cwd->getSchema().contains("required"));
}

TEST(ToolCatalogue, AcceptsWellFormedCall) {
    auto res = ToolCatalogue::validate("move_file", {{"source", "a.txt"}, {"destination", "b.txt"}});
    ASSERT_TRUE(res.valid) << res.error;
    EXPECT_EQ(res.request.kind, OperationKind::MoveFile);
    EXPECT_EQ(res.request.arguments["source"], "a.txt");
}

TEST(ToolCatalogue, AcceptsLegacyNames) {
    auto git = ToolCatalogue::validate("run_git_command", {{"command", "status"}});
    ASSERT_TRUE(git.valid);
    EXPECT_EQ(git.request.kind, OperationKind::RunVcsCommand);

    auto cwd = ToolCatalogue::validate("get_current_directory", json::object());
    ASSERT_TRUE(cwd.valid);
    EXPECT_EQ(cwd.request.kind, OperationKind::GetWorkingDirectory);
}

TEST(ToolCatalogue, IgnoresExtraArguments) {
    auto res = ToolCatalogue::validate("read_file", {{"path", "a"}, {"working_directory", "/"}});
    EXPECT_TRUE(res.valid);
}

TEST(ToolCatalogue, RejectsUnknownAndCopyOperations) {
    auto unknown = ToolCatalogue::validate("format_disk", json::object());
    EXPECT_FALSE(unknown.valid);
    EXPECT_EQ(unknown.error, "Unknown operation: format_disk");

    auto copy = ToolCatalogue::validate("copy_file", {{"source", "a"}, {"destination", "b"}});
    EXPECT_FALSE(copy.valid);
    EXPECT_EQ(copy.error, "Operation 'copy_file' is not supported");
}

TEST(ToolCatalogue, RejectsMissingOrMistypedParameters) {
    auto missing = ToolCatalogue::validate("write_file", {{"path", "a.txt"}});
    EXPECT_FALSE(missing.valid);
    EXPECT_EQ(missing.error, "Missing required parameter 'content' for write_file");

    auto nullValue = ToolCatalogue::validate("read_file", {{"path", nullptr}});
    EXPECT_FALSE(nullValue.valid);

    auto wrongType = ToolCatalogue::validate("read_file", {{"path", 3}});
    EXPECT_FALSE(wrongType.valid);
    EXPECT_EQ(wrongType.error, "Parameter 'path' of read_file must be of type string");

    auto notObject = ToolCatalogue::validate("read_file", json::array({"a"}));
    EXPECT_FALSE(notObject.valid);
}

TEST(OperationTypes, ResultRendering) {
    EXPECT_EQ(OperationResult::success("plain").render(), "plain");
    EXPECT_EQ(OperationResult::failure(ErrorKind::NotFound, "gone").render(), "Error [NotFound]: gone");

    std::string rendered = OperationResult::success({{"return_code", 0}}).render();
    EXPECT_NE(rendered.find("\"return_code\": 0"), std::string::npos);
}

TEST(OperationTypes, ResultSurvivesJson) {
    auto failure = OperationResult::failure(ErrorKind::Timeout, "slow");
    auto back = OperationResult::fromJson(failure.toJson());
    EXPECT_FALSE(back.ok);
    EXPECT_EQ(back.error, ErrorKind::Timeout);
    EXPECT_EQ(back.message, "slow");
}

TEST(OperationTypes, KindNamesMatchWireNames) {
    EXPECT_EQ(toString(OperationKind::RunVcsCommand), "run_vcs_command");
    EXPECT_EQ(toString(ErrorKind::AccessDenied), "AccessDenied");
    EXPECT_FALSE(operationKindFromString("nope").has_value());
}
