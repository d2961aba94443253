/*
 * docgate - MCP stdio server implementation
 */
#include <docgate/mcp/stdio_server.hpp>
#include <docgate/core/logger.hpp>
#include <docgate/core/utils.hpp>
#include <exception>
#include <istream>
#include <ostream>

namespace docgate {

const char* const McpStdioServer::LATEST_PROTOCOL_VERSION = "2025-06-18";

namespace {

const char* const SUPPORTED_PROTOCOL_VERSIONS[] = {
    "2024-11-05",
    "2025-03-26",
    "2025-06-18"
};

bool is_supported_version(const std::string& version) {
    for (size_t i = 0; i < sizeof(SUPPORTED_PROTOCOL_VERSIONS) / sizeof(SUPPORTED_PROTOCOL_VERSIONS[0]); ++i) {
        if (version == SUPPORTED_PROTOCOL_VERSIONS[i]) return true;
    }
    return false;
}

Json text_content(const std::string& text) {
    Json item = Json::object();
    item.set("type", "text");
    item.set("text", text);
    Json content = Json::array();
    content.push(item);
    return content;
}

} // namespace

McpStdioServer::McpStdioServer(ThreadPool& pool, const ServerInfo& info)
    : pool_(pool)
    , info_(info)
    , running_(true)
    , initialized_(false) {
}

bool McpStdioServer::register_tool(const AgentTool& tool) {
    if (tool.name.empty() || !tool.execute) return false;
    if (tool_index_.find(tool.name) != tool_index_.end()) {
        LOG_ERROR("Duplicate tool name: %s", tool.name.c_str());
        return false;
    }
    tool_index_[tool.name] = tools_.size();
    tools_.push_back(tool);
    return true;
}

size_t McpStdioServer::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

size_t McpStdioServer::run(std::istream& in, std::ostream& out) {
    LOG_INFO("MCP server %s %s listening on stdio (%zu tools)",
             info_.name.c_str(), info_.version.c_str(), tools_.size());

    size_t count = 0;
    std::string line;
    while (running_.load() && std::getline(in, line)) {
        if (trim(line).empty()) continue;
        ++count;
        handle_message(line, out);
    }

    pool_.wait_idle();
    LOG_INFO("Input closed after %zu messages", count);
    return count;
}

void McpStdioServer::handle_message(const std::string& line, std::ostream& out) {
    Json request;
    try {
        request = Json::parse(line);
    } catch (const JsonParseError& e) {
        LOG_WARN("Invalid JSON at offset %zu: %s", e.position(), e.what());
        send(out, make_error(Json(), rpc_error::PARSE_ERROR, std::string("Parse error: ") + e.what()));
        return;
    }

    if (!request.is_object() || !request["method"].is_string()) {
        // Responses from the client and malformed messages
        if (request.is_object() && (request.has("result") || request.has("error"))) {
            return;
        }
        send(out, make_error(request["id"], rpc_error::INVALID_REQUEST, "Invalid request"));
        return;
    }

    std::string method = request["method"].as_string();
    const Json& params = request["params"];
    bool is_notification = !request.has("id");
    Json id = request["id"];

    LOG_DEBUG("<- %s%s", method.c_str(), is_notification ? " (notification)" : "");

    if (method == "notifications/initialized") {
        initialized_.store(true);
        return;
    }
    if (method == "notifications/cancelled") {
        handle_cancelled(params);
        return;
    }
    if (is_notification) {
        // Nothing else is defined as a notification
        return;
    }

    if (method == "initialize") {
        send(out, make_result(id, handle_initialize(params)));
    } else if (method == "ping") {
        send(out, make_result(id, Json::object()));
    } else if (method == "tools/list") {
        send(out, make_result(id, handle_tools_list()));
    } else if (method == "tools/call") {
        handle_tools_call(id, params, out);
    } else {
        send(out, make_error(id, rpc_error::METHOD_NOT_FOUND, "Method not found: " + method));
    }
}

Json McpStdioServer::handle_initialize(const Json& params) {
    std::string requested = params.get_string("protocolVersion");
    std::string version = is_supported_version(requested) ? requested : LATEST_PROTOCOL_VERSION;

    const Json& client = params["clientInfo"];
    LOG_INFO("Client %s %s connected (protocol %s)",
             client.get_string("name", "unknown").c_str(),
             client.get_string("version").c_str(), version.c_str());

    Json tools = Json::object();
    tools.set("listChanged", false);
    Json capabilities = Json::object();
    capabilities.set("tools", tools);

    Json server = Json::object();
    server.set("name", info_.name);
    server.set("version", info_.version);

    Json result = Json::object();
    result.set("protocolVersion", version);
    result.set("capabilities", capabilities);
    result.set("serverInfo", server);
    if (!info_.instructions.empty()) {
        result.set("instructions", info_.instructions);
    }
    return result;
}

Json McpStdioServer::handle_tools_list() const {
    Json list = Json::array();
    for (size_t i = 0; i < tools_.size(); ++i) {
        Json t = Json::object();
        t.set("name", tools_[i].name);
        t.set("description", tools_[i].description);
        t.set("inputSchema", tools_[i].input_schema());
        list.push(t);
    }
    Json result = Json::object();
    result.set("tools", list);
    return result;
}

void McpStdioServer::handle_tools_call(const Json& id, const Json& params, std::ostream& out) {
    if (!params.is_object() || !params["name"].is_string()) {
        send(out, make_error(id, rpc_error::INVALID_PARAMS, "tools/call requires a tool name"));
        return;
    }

    std::string name = params["name"].as_string();
    std::map<std::string, size_t>::const_iterator it = tool_index_.find(name);
    if (it == tool_index_.end()) {
        send(out, make_error(id, rpc_error::INVALID_PARAMS, "Unknown tool: " + name));
        return;
    }

    const Json& args = params["arguments"];
    if (!args.is_null() && !args.is_object()) {
        send(out, make_error(id, rpc_error::INVALID_PARAMS, "arguments must be an object"));
        return;
    }
    Json arguments = args.is_object() ? args : Json::object();

    ToolCallContext ctx;
    std::string key = id.dump();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_[key] = ctx.cancelled;
    }

    const AgentTool* tool = &tools_[it->second];
    std::ostream* stream = &out;
    std::function<void()> task = [this, tool, arguments, ctx, id, key, stream]() {
        Json result = execute_tool(*tool, arguments, ctx);
        bool cancelled = ctx.is_cancelled();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_.erase(key);
        }
        // A cancelled request gets no response
        if (cancelled) {
            LOG_DEBUG("Call %s cancelled", key.c_str());
            return;
        }
        send(*stream, make_result(id, result));
    };

    if (!pool_.enqueue(task)) {
        task();
    }
}

Json McpStdioServer::execute_tool(const AgentTool& tool, const Json& arguments,
                                  const ToolCallContext& ctx) const {
    AgentToolResult r;
    try {
        r = tool.execute(arguments, ctx);
    } catch (const std::exception& e) {
        LOG_ERROR("Tool %s threw: %s", tool.name.c_str(), e.what());
        r = AgentToolResult::fail(std::string("Internal error: ") + e.what());
    }

    Json result = Json::object();
    result.set("content", text_content(r.success ? r.output : r.error));
    result.set("isError", !r.success);
    return result;
}

void McpStdioServer::handle_cancelled(const Json& params) {
    std::string key = params["requestId"].dump();
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::shared_ptr<std::atomic<bool> > >::iterator it = in_flight_.find(key);
    if (it == in_flight_.end()) {
        LOG_DEBUG("Cancel for unknown request %s", key.c_str());
        return;
    }
    it->second->store(true);
    LOG_INFO("Cancelling request %s (%s)", key.c_str(), params.get_string("reason", "no reason").c_str());
}

void McpStdioServer::send(std::ostream& out, const Json& message) {
    std::string line = message.dump();
    std::lock_guard<std::mutex> lock(mutex_);
    out << line << '\n';
    out.flush();
}

Json McpStdioServer::make_result(const Json& id, const Json& result) {
    Json msg = Json::object();
    msg.set("jsonrpc", "2.0");
    msg.set("id", id);
    msg.set("result", result);
    return msg;
}

Json McpStdioServer::make_error(const Json& id, int code, const std::string& message) {
    Json error = Json::object();
    error.set("code", code);
    error.set("message", message);

    Json msg = Json::object();
    msg.set("jsonrpc", "2.0");
    msg.set("id", id);
    msg.set("error", error);
    return msg;
}

} // namespace docgate
