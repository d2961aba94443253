/*
 * docgate - MCP server over stdio
 *
 * Newline-delimited JSON-RPC 2.0 on stdin/stdout. Tool calls run on the
 * worker pool; every other request is answered on the reading thread.
 */
#ifndef DOCGATE_MCP_STDIO_SERVER_HPP
#define DOCGATE_MCP_STDIO_SERVER_HPP

#include <docgate/core/json.hpp>
#include <docgate/core/tool.hpp>
#include <docgate/core/thread_pool.hpp>
#include <atomic>
#include <iosfwd>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace docgate {

// JSON-RPC error codes
namespace rpc_error {
    const int PARSE_ERROR = -32700;
    const int INVALID_REQUEST = -32600;
    const int METHOD_NOT_FOUND = -32601;
    const int INVALID_PARAMS = -32602;
    const int INTERNAL_ERROR = -32603;
}

struct ServerInfo {
    std::string name;
    std::string version;
    std::string instructions;
};

class McpStdioServer : public ToolHost {
public:
    static const char* const LATEST_PROTOCOL_VERSION;

    McpStdioServer(ThreadPool& pool, const ServerInfo& info);

    McpStdioServer(const McpStdioServer&) = delete;
    McpStdioServer& operator=(const McpStdioServer&) = delete;

    bool register_tool(const AgentTool& tool) override;
    const std::vector<AgentTool>& tools() const { return tools_; }

    // Reads requests until EOF or stop(), then waits for running calls.
    // Returns the number of lines processed.
    size_t run(std::istream& in, std::ostream& out);

    // Handles one request line. Responses to tool calls may be written
    // after this returns; wait_idle() blocks until they are.
    void handle_message(const std::string& line, std::ostream& out);

    void wait_idle() { pool_.wait_idle(); }
    void stop() { running_.store(false); }
    bool initialized() const { return initialized_.load(); }

    // Calls currently executing or queued
    size_t in_flight() const;

private:
    ThreadPool& pool_;
    ServerInfo info_;
    std::vector<AgentTool> tools_;
    std::map<std::string, size_t> tool_index_;

    std::atomic<bool> running_;
    std::atomic<bool> initialized_;

    // Guards the output stream and in_flight_
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<std::atomic<bool> > > in_flight_;

    Json handle_initialize(const Json& params);
    Json handle_tools_list() const;
    void handle_tools_call(const Json& id, const Json& params, std::ostream& out);
    void handle_cancelled(const Json& params);
    Json execute_tool(const AgentTool& tool, const Json& arguments, const ToolCallContext& ctx) const;

    void send(std::ostream& out, const Json& message);
    static Json make_result(const Json& id, const Json& result);
    static Json make_error(const Json& id, int code, const std::string& message);
};

} // namespace docgate

#endif // DOCGATE_MCP_STDIO_SERVER_HPP
