/*
 * docgate - Tool Exposer implementation
 */
#include <docgate/docs/tool_exposer.hpp>
#include <docgate/docs/index_parser.hpp>
#include <docgate/core/logger.hpp>
#include <docgate/core/utils.hpp>
#include <cctype>
#include <map>
#include <sstream>

namespace docgate {

const char* const ToolExposer::TOOL_PREFIX = "fetch_docs_";
const char* const ToolExposer::LIST_SOURCES_TOOL = "list_doc_sources";

std::string sanitize_tool_name(const std::string& name) {
    std::string out = name;
    for (size_t i = 0; i < out.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(out[i]);
        if (!std::isalnum(c) || c >= 0x80) {
            if (c != '_' && c != '-') out[i] = '_';
        }
    }
    return out;
}

std::string capability_name(const DocSource& source, size_t max_length) {
    std::string name = std::string(ToolExposer::TOOL_PREFIX) + sanitize_tool_name(source.name);
    if (max_length > 0 && name.size() > max_length) {
        name.resize(max_length);
    }
    return name;
}

ToolExposer::ToolExposer(const SourceRegistry& registry,
                         const ResourceFetcher& fetcher,
                         size_t max_tool_name_length)
    : registry_(registry)
    , fetcher_(fetcher)
    , max_tool_name_length_(max_tool_name_length) {
}

std::vector<AgentTool> ToolExposer::build_tools() const {
    const std::vector<DocSource>& sources = registry_.sources();
    if (sources.empty()) {
        throw StartupError("no documentation sources configured");
    }

    std::vector<AgentTool> tools;
    std::map<std::string, std::string> taken;   // tool name -> source name

    for (size_t i = 0; i < sources.size(); ++i) {
        std::string name = capability_name(sources[i], max_tool_name_length_);
        std::map<std::string, std::string>::const_iterator it = taken.find(name);
        if (it != taken.end()) {
            throw StartupError("sources '" + it->second + "' and '" + sources[i].name +
                               "' both map to tool name '" + name + "'");
        }
        taken[name] = sources[i].name;
        tools.push_back(make_source_tool(sources[i], name));
    }

    tools.push_back(make_list_sources_tool());
    return tools;
}

size_t ToolExposer::register_all(ToolHost& host) const {
    std::vector<AgentTool> tools = build_tools();
    for (size_t i = 0; i < tools.size(); ++i) {
        if (!host.register_tool(tools[i])) {
            throw StartupError("tool name '" + tools[i].name + "' is already registered");
        }
        LOG_DEBUG("Registered tool %s", tools[i].name.c_str());
    }
    return tools.size();
}

AgentToolResult ToolExposer::fetch_docs(const DocSource& source, const std::string& url,
                                        const ToolCallContext& ctx) const {
    const std::atomic<bool>* cancelled = ctx.cancelled.get();
    std::string target = trim(url);

    if (target.empty()) {
        IndexResult index = registry_.load_index(source, cancelled);
        if (!index.success) {
            return AgentToolResult::fail(index.error_text());
        }
        return AgentToolResult::ok(format_index(source, index.entries));
    }

    // Targets with schemes the index cannot resolve go to the fetcher as
    // given; it rejects them
    std::string resolved = resolve_link_target(source.location, target);
    if (resolved.empty()) resolved = target;

    LOG_DEBUG("[%s] fetching %s", source.name.c_str(), resolved.c_str());
    FetchResult r = fetcher_.fetch(resolved, cancelled);
    if (!r.success) {
        LOG_INFO("[%s] %s", source.name.c_str(), r.error_text().c_str());
        return AgentToolResult::fail(r.error_text());
    }

    if (!r.truncated) {
        return AgentToolResult::ok(r.content);
    }
    std::ostringstream oss;
    oss << r.content << "\n\n[Content truncated: showing " << r.content.size()
        << " of " << r.original_length << " characters]";
    return AgentToolResult::ok(oss.str());
}

AgentTool ToolExposer::make_source_tool(const DocSource& source, const std::string& name) const {
    AgentTool tool;
    tool.name = name;

    std::ostringstream desc;
    desc << "Fetch documentation from '" << source.name << "'";
    if (!source.description.empty()) {
        desc << " (" << source.description << ")";
    }
    desc << ". Call without `url` to list the documents in its index (" << source.location
         << "), then call again with one of the listed links as `url`.";
    tool.description = desc.str();

    tool.params.push_back(ToolParamSchema(
        "url", "string",
        "Document to fetch. Omit to list the index. Relative links resolve against the index.",
        false
    ));

    // The source lives in the registry's vector for the life of the server
    const DocSource* src = &source;
    const ToolExposer* self = this;
    tool.execute = [self, src](const Json& params, const ToolCallContext& ctx) -> AgentToolResult {
        const Json& url = params["url"];
        if (!url.is_null() && !url.is_string()) {
            return AgentToolResult::fail("Invalid parameter: url must be a string");
        }
        return self->fetch_docs(*src, url.as_string(), ctx);
    };
    return tool;
}

AgentTool ToolExposer::make_list_sources_tool() const {
    AgentTool tool;
    tool.name = LIST_SOURCES_TOOL;

    std::ostringstream desc;
    desc << "List the available documentation sources. Each one has a tool named "
         << TOOL_PREFIX << "<name>.";
    tool.description = desc.str();

    const SourceRegistry* registry = &registry_;
    size_t max_len = max_tool_name_length_;
    tool.execute = [registry, max_len](const Json&, const ToolCallContext&) -> AgentToolResult {
        std::ostringstream oss;
        oss << registry->describe() << "\nTools:\n";
        const std::vector<DocSource>& sources = registry->sources();
        for (size_t i = 0; i < sources.size(); ++i) {
            oss << "- " << capability_name(sources[i], max_len) << " -> " << sources[i].name << "\n";
        }
        return AgentToolResult::ok(oss.str());
    };
    return tool;
}

} // namespace docgate
