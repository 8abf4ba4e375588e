#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>

#include "analysis/SymbolManager.h"
#include "analysis/SyntaxValidator.h"
#include "analysis/providers/RegexSymbolProvider.h"
#include "analysis/providers/TreeSitterSymbolProvider.h"
#include "edit/AstEditor.h"
#include "jobs/JobManager.h"
#include "mcp/McpServer.h"
#include "support/TestUtils.h"
#include "tools/EditTools.h"
#include "tools/JobTools.h"
#include "tools/ToolRegistry.h"

using json = nlohmann::json;
using namespace std::chrono_literals;
using testutil::readAll;
using testutil::writeAll;

class McpServerTest : public ::testing::Test {
protected:
    fs::path root;
    SymbolManager symbols;
    std::unique_ptr<SyntaxValidator> validator;
    std::unique_ptr<AstEditor> editor;
    std::unique_ptr<JobManager> jobs;
    ToolRegistry tools;
    std::unique_ptr<McpServer> server;

    void SetUp() override {
        root = testutil::makeTempDir("mcp");

        auto ts = std::make_unique<TreeSitterSymbolProvider>();
        const TreeSitterSymbolProvider* grammars = ts.get();
        symbols.registerProvider(std::move(ts));
        symbols.registerProvider(std::make_unique<RegexSymbolProvider>());
        validator = std::make_unique<SyntaxValidator>(grammars);
        editor = std::make_unique<AstEditor>(symbols, *validator);

        JobManager::Options options;
        options.dataDir = (root / "data").string();
        options.pollIntervalMs = 50;
        jobs = std::make_unique<JobManager>(options);

        tools.registerTool(std::make_unique<EditAstTool>(
            *editor, [](const std::string&) { return std::shared_ptr<IRepairOracle>(); }));
        tools.registerTool(std::make_unique<PatchFileTool>());
        tools.registerTool(std::make_unique<RunAsyncTool>(*jobs, 300));
        tools.registerTool(std::make_unique<CheckJobTool>(*jobs));
        tools.registerTool(std::make_unique<KillJobTool>(*jobs));

        server = std::make_unique<McpServer>(tools, "9.9.9");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    json call(const std::string& tool, const json& arguments, int id = 1) {
        auto reply = server->handleMessage(
            {{"jsonrpc", "2.0"}, {"id", id}, {"method", "tools/call"}, {"params", {{"name", tool}, {"arguments", arguments}}}});
        EXPECT_TRUE(reply.has_value());
        return reply ? (*reply)["result"] : json();
    }

    static std::string text(const json& result) { return result["content"][0]["text"].get<std::string>(); }
};

TEST_F(McpServerTest, InitializeAnnouncesServer) {
    auto reply = server->handleMessage({{"jsonrpc", "2.0"}, {"id", 0}, {"method", "initialize"}, {"params", json::object()}});
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["id"], 0);
    EXPECT_EQ((*reply)["result"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ((*reply)["result"]["serverInfo"]["name"], "cortex-act");
    EXPECT_EQ((*reply)["result"]["serverInfo"]["version"], "9.9.9");
    EXPECT_TRUE((*reply)["result"]["capabilities"]["tools"].is_object());
}

TEST_F(McpServerTest, ListsToolsInRegistrationOrder) {
    auto reply = server->handleMessage({{"jsonrpc", "2.0"}, {"id", "a"}, {"method", "tools/list"}});
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["id"], "a");
    const json& list = (*reply)["result"]["tools"];
    ASSERT_EQ(list.size(), 5u);
    EXPECT_EQ(list[0]["name"], "edit_ast");
    EXPECT_EQ(list[1]["name"], "patch_file");
    EXPECT_EQ(list[2]["name"], "run_async");
    EXPECT_EQ(list[3]["name"], "check_job");
    EXPECT_EQ(list[4]["name"], "kill_job");
    for (const auto& tool : list) {
        EXPECT_FALSE(tool["description"].get<std::string>().empty());
        EXPECT_EQ(tool["inputSchema"]["type"], "object");
    }
    EXPECT_EQ(list[0]["inputSchema"]["required"], json::array({"file", "edits"}));
}

TEST_F(McpServerTest, NotificationsGetNoReply) {
    EXPECT_FALSE(server->handleMessage({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}).has_value());
}

TEST_F(McpServerTest, UnknownMethodIsMethodNotFound) {
    auto reply = server->handleMessage({{"jsonrpc", "2.0"}, {"id", 7}, {"method", "resources/list"}});
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["error"]["code"], -32601);
    EXPECT_EQ((*reply)["error"]["message"], "Method not found: resources/list");
}

TEST_F(McpServerTest, GarbageLinesAreSkipped) {
    EXPECT_FALSE(server->handleLine("{not json").has_value());
    EXPECT_FALSE(server->handleLine("   ").has_value());
}

TEST_F(McpServerTest, EditAstThroughTheProtocol) {
    fs::path file = root / "lib.rs";
    writeAll(file, "fn add(a: i32, b: i32) -> i32 {\n    a - b\n}\n");

    json result = call("edit_ast", {{"file", file.string()},
                                    {"edits", {{{"target", "function:add"},
                                                {"action", "replace"},
                                                {"code", "fn add(a: i32, b: i32) -> i32 {\n    a + b\n}"}}}}});
    EXPECT_FALSE(result["isError"].get<bool>());
    json body = json::parse(text(result));
    EXPECT_EQ(body["status"], "ok");
    EXPECT_EQ(readAll(file), "fn add(a: i32, b: i32) -> i32 {\n    a + b\n}\n");
}

TEST_F(McpServerTest, ToolFailuresAreReportedAsIsError) {
    fs::path file = root / "lib.rs";
    writeAll(file, "fn a() {}\n");

    json missing = call("edit_ast", {{"file", file.string()}, {"edits", {{{"target", "ghost"}, {"action", "delete"}}}}});
    EXPECT_TRUE(missing["isError"].get<bool>());
    EXPECT_EQ(text(missing).rfind("edit_ast failed: AST target not found in source: 'ghost'", 0), 0u);

    json noEdits = call("edit_ast", {{"file", file.string()}});
    EXPECT_TRUE(noEdits["isError"].get<bool>());
    EXPECT_EQ(text(noEdits), "'edits' array required");

    json badAction = call("edit_ast", {{"file", file.string()}, {"edits", {{{"target", "a"}, {"action", "rename"}}}}});
    EXPECT_NE(text(badAction).find("unknown action 'rename'"), std::string::npos);

    json unknown = call("no_such_tool", json::object());
    EXPECT_TRUE(unknown["isError"].get<bool>());
    EXPECT_EQ(text(unknown), "Tool not found: no_such_tool");

    json badType = call("patch_file", {{"file", file.string()}, {"type", "toml"}, {"target", "x"}, {"value", 1}});
    EXPECT_EQ(text(badType), "Unknown patch type: 'toml'. Use: config | docs | env");

    json noValue = call("patch_file", {{"file", file.string()}, {"type", "env"}, {"target", "X"}});
    EXPECT_EQ(text(noValue), "'value' required for 'set' action");

    EXPECT_EQ(readAll(file), "fn a() {}\n");
}

TEST_F(McpServerTest, PatchFileEnvThroughTheProtocol) {
    fs::path env = root / ".env";
    writeAll(env, "PORT=80\n");
    json result = call("patch_file", {{"file", env.string()}, {"type", "env"}, {"target", "PORT"}, {"value", 8080}});
    EXPECT_FALSE(result["isError"].get<bool>());
    EXPECT_EQ(readAll(env), "PORT=8080\n");
}

TEST_F(McpServerTest, JobToolsRoundTrip) {
    json bad = call("run_async", {{"command", "true"}, {"timeout_secs", 0}});
    EXPECT_TRUE(bad["isError"].get<bool>());
    EXPECT_EQ(text(bad), "'timeout_secs' must be a positive integer");

    json started = call("run_async", {{"command", "echo via-mcp"}, {"timeout_secs", 10}});
    ASSERT_FALSE(started["isError"].get<bool>());
    std::string jobId = json::parse(text(started))["job_id"];

    json status;
    ASSERT_TRUE(testutil::waitFor(
        [&] {
            status = json::parse(text(call("check_job", {{"job_id", jobId}})));
            return status["status"] != "running" && status["log_tail"].dump().find("via-mcp") != std::string::npos;
        },
        5000ms));
    EXPECT_EQ(status["status"], "done");
    EXPECT_EQ(status["exit_code"], 0);
    EXPECT_NE(status["log_tail"].dump().find("[stdout] via-mcp"), std::string::npos);

    json killed = call("kill_job", {{"job_id", jobId}});
    EXPECT_FALSE(killed["isError"].get<bool>());
    EXPECT_NE(text(killed).find("Nothing to kill."), std::string::npos);

    json gone = call("check_job", {{"job_id", "job_0_0"}});
    EXPECT_TRUE(gone["isError"].get<bool>());
    EXPECT_EQ(text(gone).rfind("check_job failed: Job 'job_0_0' not found", 0), 0u);

    std::string logPath = jobs->jobsDir() + "/" + jobId + ".log";
    testutil::waitFor([&] { return readAll(logPath).find("[cortex-act] status=") != std::string::npos; }, 5000ms);
}

TEST_F(McpServerTest, RunLoopAnswersEachRequestOnItsOwnLine) {
    std::istringstream in(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\",\"params\":{}}\n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
        "\n"
        "garbage\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}\n");
    std::ostringstream out;
    server->run(in, out);

    std::istringstream replies(out.str());
    std::string line;
    std::vector<json> parsed;
    while (std::getline(replies, line)) {
        parsed.push_back(json::parse(line));
    }
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed[0]["id"], 1);
    EXPECT_EQ(parsed[1]["id"], 2);
    EXPECT_EQ(parsed[1]["result"]["tools"].size(), 5u);
}
