#ifndef DOCGATE_CORE_TOOL_HPP
#define DOCGATE_CORE_TOOL_HPP

#include "json.hpp"
#include <string>
#include <vector>
#include <atomic>
#include <memory>
#include <functional>

namespace docgate {

// Schema for a tool parameter
struct ToolParamSchema {
    std::string name;
    std::string type;       // "string", "number", "boolean", "array", "object"
    std::string description;
    bool required;

    ToolParamSchema() : required(false) {}
    ToolParamSchema(const std::string& n, const std::string& t, const std::string& d, bool r = false)
        : name(n), type(t), description(d), required(r) {}
};

// Tool execution result
struct AgentToolResult {
    bool success;
    std::string output;     // Text returned to the caller
    std::string error;      // Error message if failed

    AgentToolResult() : success(false) {}

    static AgentToolResult ok(const std::string& output) {
        AgentToolResult r;
        r.success = true;
        r.output = output;
        return r;
    }

    static AgentToolResult fail(const std::string& err) {
        AgentToolResult r;
        r.success = false;
        r.error = err;
        return r;
    }
};

// Per-call state handed to the executor by the host
struct ToolCallContext {
    std::shared_ptr<std::atomic<bool> > cancelled;

    ToolCallContext() : cancelled(std::make_shared<std::atomic<bool> >(false)) {}

    bool is_cancelled() const { return cancelled && cancelled->load(); }
};

typedef std::function<AgentToolResult(const Json& params, const ToolCallContext& ctx)> ToolExecutor;

// A named, independently invocable capability
struct AgentTool {
    std::string name;
    std::string description;
    std::vector<ToolParamSchema> params;
    ToolExecutor execute;

    // JSON Schema of the parameters ("inputSchema")
    Json input_schema() const;
};

// Registration surface of the protocol layer
class ToolHost {
public:
    virtual ~ToolHost() {}

    // Returns false if the name is already taken
    virtual bool register_tool(const AgentTool& tool) = 0;
};

} // namespace docgate

#endif // DOCGATE_CORE_TOOL_HPP
