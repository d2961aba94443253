/*
 * docgate - Tool Exposer
 *
 * Turns each documentation source into one named tool, fetch_docs_<name>.
 */
#ifndef DOCGATE_DOCS_TOOL_EXPOSER_HPP
#define DOCGATE_DOCS_TOOL_EXPOSER_HPP

#include <docgate/docs/source_registry.hpp>
#include <docgate/docs/fetcher.hpp>
#include <docgate/core/tool.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace docgate {

// Fatal configuration problem detected while building the tool set
class StartupError : public std::runtime_error {
public:
    explicit StartupError(const std::string& what) : std::runtime_error(what) {}
};

// Replaces every character outside [A-Za-z0-9_-] with '_'
std::string sanitize_tool_name(const std::string& name);

// "fetch_docs_" + sanitized name, cut to max_length (0 = unlimited)
std::string capability_name(const DocSource& source, size_t max_length = 60);

class ToolExposer {
public:
    static const char* const TOOL_PREFIX;
    static const char* const LIST_SOURCES_TOOL;

    ToolExposer(const SourceRegistry& registry,
                const ResourceFetcher& fetcher,
                size_t max_tool_name_length = 60);

    // One tool per source plus list_doc_sources. Throws StartupError when
    // there are no sources or two sources map to the same tool name.
    std::vector<AgentTool> build_tools() const;

    // Builds the tools and hands them to the host. Throws StartupError when
    // the host rejects a name.
    size_t register_all(ToolHost& host) const;

    // Body of a fetch_docs_* call
    AgentToolResult fetch_docs(const DocSource& source, const std::string& url,
                               const ToolCallContext& ctx) const;

private:
    const SourceRegistry& registry_;
    const ResourceFetcher& fetcher_;
    size_t max_tool_name_length_;

    AgentTool make_source_tool(const DocSource& source, const std::string& name) const;
    AgentTool make_list_sources_tool() const;
};

} // namespace docgate

#endif // DOCGATE_DOCS_TOOL_EXPOSER_HPP
