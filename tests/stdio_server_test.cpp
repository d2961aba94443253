#include <docgate/mcp/stdio_server.hpp>
#include <docgate/core/utils.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <sstream>
#include <thread>

using namespace docgate;

namespace {

AgentTool echo_tool() {
    AgentTool tool;
    tool.name = "echo";
    tool.description = "Echoes its text argument";
    tool.params.push_back(ToolParamSchema("text", "string", "Text to echo", true));
    tool.execute = [](const Json& params, const ToolCallContext&) -> AgentToolResult {
        if (!params["text"].is_string()) return AgentToolResult::fail("text is required");
        return AgentToolResult::ok(params["text"].as_string());
    };
    return tool;
}

AgentTool throwing_tool() {
    AgentTool tool;
    tool.name = "boom";
    tool.description = "Always throws";
    tool.execute = [](const Json&, const ToolCallContext&) -> AgentToolResult {
        throw std::runtime_error("exploded");
    };
    return tool;
}

std::vector<Json> parse_lines(const std::string& text) {
    std::vector<Json> out;
    std::vector<std::string> lines = split_lines(text);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (!trim(lines[i]).empty()) out.push_back(Json::parse(lines[i]));
    }
    return out;
}

class StdioServerTest : public ::testing::Test {
protected:
    StdioServerTest() : pool_(2) {
        ServerInfo info;
        info.name = "docgate";
        info.version = "test";
        info.instructions = "Use the tools.";
        server_.reset(new McpStdioServer(pool_, info));
        server_->register_tool(echo_tool());
        server_->register_tool(throwing_tool());
    }

    // Sends one line and returns every message written in response
    std::vector<Json> exchange(const std::string& line) {
        std::ostringstream out;
        server_->handle_message(line, out);
        server_->wait_idle();
        return parse_lines(out.str());
    }

    ThreadPool pool_;
    std::unique_ptr<McpStdioServer> server_;
};

} // namespace

TEST_F(StdioServerTest, RejectsDuplicateToolNames) {
    EXPECT_FALSE(server_->register_tool(echo_tool()));
    EXPECT_EQ(2u, server_->tools().size());
}

TEST_F(StdioServerTest, Initialize) {
    std::vector<Json> out = exchange(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\",\"params\":"
        "{\"protocolVersion\":\"2024-11-05\",\"capabilities\":{},"
        "\"clientInfo\":{\"name\":\"test\",\"version\":\"1\"}}}");

    ASSERT_EQ(1u, out.size());
    EXPECT_EQ("2.0", out[0].get_string("jsonrpc"));
    EXPECT_EQ(1, out[0].get_int("id"));
    const Json& result = out[0]["result"];
    EXPECT_EQ("2024-11-05", result.get_string("protocolVersion"));
    EXPECT_FALSE(result["capabilities"]["tools"].get_bool("listChanged", true));
    EXPECT_EQ("docgate", result["serverInfo"].get_string("name"));
    EXPECT_EQ("Use the tools.", result.get_string("instructions"));
}

TEST_F(StdioServerTest, InitializeWithUnknownVersionOffersLatest) {
    std::vector<Json> out = exchange(
        "{\"jsonrpc\":\"2.0\",\"id\":\"a\",\"method\":\"initialize\",\"params\":{\"protocolVersion\":\"1999-01-01\"}}");
    ASSERT_EQ(1u, out.size());
    EXPECT_EQ("a", out[0].get_string("id"));
    EXPECT_EQ(McpStdioServer::LATEST_PROTOCOL_VERSION, out[0]["result"].get_string("protocolVersion"));
}

TEST_F(StdioServerTest, InitializedNotificationHasNoResponse) {
    EXPECT_FALSE(server_->initialized());
    std::vector<Json> out = exchange("{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}");
    EXPECT_TRUE(out.empty());
    EXPECT_TRUE(server_->initialized());
}

TEST_F(StdioServerTest, Ping) {
    std::vector<Json> out = exchange("{\"jsonrpc\":\"2.0\",\"id\":7,\"method\":\"ping\"}");
    ASSERT_EQ(1u, out.size());
    EXPECT_TRUE(out[0]["result"].is_object());
}

TEST_F(StdioServerTest, ToolsList) {
    std::vector<Json> out = exchange("{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}");
    ASSERT_EQ(1u, out.size());
    const Json& tools = out[0]["result"]["tools"];
    ASSERT_EQ(2u, tools.size());
    EXPECT_EQ("echo", tools[0].get_string("name"));
    EXPECT_EQ("Echoes its text argument", tools[0].get_string("description"));
    EXPECT_EQ("string", tools[0]["inputSchema"]["properties"]["text"].get_string("type"));
    EXPECT_EQ("text", tools[0]["inputSchema"]["required"][0].as_string());
}

TEST_F(StdioServerTest, ToolsCallReturnsTextContent) {
    std::vector<Json> out = exchange(
        "{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"tools/call\","
        "\"params\":{\"name\":\"echo\",\"arguments\":{\"text\":\"hello\"}}}");
    ASSERT_EQ(1u, out.size());
    EXPECT_EQ(3, out[0].get_int("id"));
    const Json& result = out[0]["result"];
    EXPECT_FALSE(result.get_bool("isError", true));
    EXPECT_EQ("text", result["content"][0].get_string("type"));
    EXPECT_EQ("hello", result["content"][0].get_string("text"));
}

TEST_F(StdioServerTest, ToolFailureIsErrorResult) {
    std::vector<Json> out = exchange(
        "{\"jsonrpc\":\"2.0\",\"id\":4,\"method\":\"tools/call\",\"params\":{\"name\":\"echo\"}}");
    ASSERT_EQ(1u, out.size());
    EXPECT_TRUE(out[0]["result"].get_bool("isError"));
    EXPECT_EQ("text is required", out[0]["result"]["content"][0].get_string("text"));
}

TEST_F(StdioServerTest, ThrowingToolIsErrorResult) {
    std::vector<Json> out = exchange(
        "{\"jsonrpc\":\"2.0\",\"id\":5,\"method\":\"tools/call\",\"params\":{\"name\":\"boom\"}}");
    ASSERT_EQ(1u, out.size());
    EXPECT_TRUE(out[0]["result"].get_bool("isError"));
    EXPECT_NE(std::string::npos, out[0]["result"]["content"][0].get_string("text").find("exploded"));
}

TEST_F(StdioServerTest, UnknownToolIsInvalidParams) {
    std::vector<Json> out = exchange(
        "{\"jsonrpc\":\"2.0\",\"id\":6,\"method\":\"tools/call\",\"params\":{\"name\":\"nope\"}}");
    ASSERT_EQ(1u, out.size());
    EXPECT_EQ(rpc_error::INVALID_PARAMS, out[0]["error"].get_int("code"));
}

TEST_F(StdioServerTest, UnknownMethod) {
    std::vector<Json> out = exchange("{\"jsonrpc\":\"2.0\",\"id\":8,\"method\":\"resources/list\"}");
    ASSERT_EQ(1u, out.size());
    EXPECT_EQ(rpc_error::METHOD_NOT_FOUND, out[0]["error"].get_int("code"));
    EXPECT_EQ(8, out[0].get_int("id"));
}

TEST_F(StdioServerTest, ParseError) {
    std::vector<Json> out = exchange("{not json");
    ASSERT_EQ(1u, out.size());
    EXPECT_EQ(rpc_error::PARSE_ERROR, out[0]["error"].get_int("code"));
    EXPECT_TRUE(out[0]["id"].is_null());
}

TEST_F(StdioServerTest, InvalidRequest) {
    std::vector<Json> out = exchange("[1, 2]");
    ASSERT_EQ(1u, out.size());
    EXPECT_EQ(rpc_error::INVALID_REQUEST, out[0]["error"].get_int("code"));
}

TEST_F(StdioServerTest, CancelledCallGetsNoResponse) {
    std::atomic<bool> started(false);
    AgentTool slow;
    slow.name = "slow";
    slow.description = "Waits until cancelled";
    slow.execute = [&started](const Json&, const ToolCallContext& ctx) -> AgentToolResult {
        started.store(true);
        for (int i = 0; i < 500 && !ctx.is_cancelled(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return AgentToolResult::fail("cancelled");
    };
    ASSERT_TRUE(server_->register_tool(slow));

    std::ostringstream out;
    server_->handle_message(
        "{\"jsonrpc\":\"2.0\",\"id\":9,\"method\":\"tools/call\",\"params\":{\"name\":\"slow\"}}", out);
    while (!started.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_EQ(1u, server_->in_flight());

    server_->handle_message(
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/cancelled\",\"params\":{\"requestId\":9,\"reason\":\"user\"}}",
        out);
    server_->wait_idle();

    EXPECT_TRUE(parse_lines(out.str()).empty());
    EXPECT_EQ(0u, server_->in_flight());
}

TEST_F(StdioServerTest, RunProcessesStreamUntilEof) {
    std::istringstream in(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n"
        "\n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/call\",\"params\":{\"name\":\"echo\",\"arguments\":{\"text\":\"x\"}}}\n");
    std::ostringstream out;

    EXPECT_EQ(3u, server_->run(in, out));
    std::vector<Json> messages = parse_lines(out.str());
    ASSERT_EQ(2u, messages.size());
    EXPECT_EQ(1, messages[0].get_int("id"));
    EXPECT_EQ(2, messages[1].get_int("id"));
}
