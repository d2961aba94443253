/*
 * docgate - Application
 *
 * Command-line front end: builds the immutable source list and allowlist
 * once, wires them into the fetcher, tool exposer and MCP server, then
 * serves stdin/stdout until the client closes the stream.
 */
#ifndef DOCGATE_CORE_APPLICATION_HPP
#define DOCGATE_CORE_APPLICATION_HPP

#include "config.hpp"
#include "http_client.hpp"
#include "logger.hpp"
#include "thread_pool.hpp"
#include "../docs/allowlist.hpp"
#include "../docs/doc_source.hpp"
#include "../docs/fetcher.hpp"
#include "../docs/source_registry.hpp"
#include "../docs/tool_exposer.hpp"
#include "../mcp/stdio_server.hpp"

#include <memory>
#include <string>
#include <vector>

namespace docgate {

struct AppInfo {
    static constexpr const char* VERSION = "0.4.0";
    static constexpr const char* NAME = "docgate";
};

// Raw command-line values. The *_set flags tell which ones override the
// configuration file.
struct CliOptions {
    std::string json_path;
    std::vector<std::string> urls;

    std::vector<std::string> allowed_domains;
    bool allowed_domains_set;

    std::vector<std::string> allowed_local_dirs;

    bool follow_redirects;
    double timeout_s;
    bool timeout_set;
    long max_tool_name_length;          // -1 = not given
    long max_content_length;            // -1 = not given
    std::string overflow;
    std::string log_level;
    long workers;                       // -1 = not given

    bool probe;
    bool show_help;
    bool show_version;

    CliOptions()
        : allowed_domains_set(false)
        , follow_redirects(false)
        , timeout_s(0)
        , timeout_set(false)
        , max_tool_name_length(-1)
        , max_content_length(-1)
        , workers(-1)
        , probe(false)
        , show_help(false)
        , show_version(false) {}
};

// Every tunable of the running server, after merging file and command line
struct ServerOptions {
    std::vector<DocSource> sources;
    std::vector<std::string> allowed_domains;
    FetchOptions fetch;
    size_t max_tool_name_length;
    LogLevel log_level;
    size_t workers;
    bool probe;

    ServerOptions()
        : max_tool_name_length(60)
        , log_level(LogLevel::INFO)
        , workers(4)
        , probe(false) {}
};

// Returns false with a message in `error` on unknown options or bad values
bool parse_command_line(int argc, char* argv[], CliOptions& out, std::string& error);

// Reads settings from a loaded config. Accepts a top-level array of
// sources or an object with a "sources" array plus settings.
bool apply_config(const Config& config, ServerOptions& out, std::string& error);

// Loads --json (if any) and layers the command line on top
bool build_server_options(const CliOptions& cli, ServerOptions& out, std::string& error);

void print_usage(const char* prog);
void print_version();

class Application {
public:
    static Application& instance();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // False when the process should exit right away; see exit_code()
    bool init(int argc, char* argv[]);

    // Serves stdin/stdout until EOF or stop()
    int run();

    void shutdown();
    void stop();

    int exit_code() const { return exit_code_; }
    const ServerOptions& options() const { return options_; }

private:
    Application();

    bool setup_components();

    int exit_code_;
    bool curl_initialized_;
    ServerOptions options_;

    // Each member below refers to the ones above it
    std::unique_ptr<HttpClient> http_;
    std::unique_ptr<AllowlistPolicy> policy_;
    std::unique_ptr<ResourceFetcher> fetcher_;
    std::unique_ptr<SourceRegistry> registry_;
    std::unique_ptr<ToolExposer> exposer_;
    std::unique_ptr<ThreadPool> pool_;
    std::unique_ptr<McpStdioServer> server_;
};

} // namespace docgate

#endif // DOCGATE_CORE_APPLICATION_HPP
