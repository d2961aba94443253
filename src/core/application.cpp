/*
 * docgate - Application Implementation
 *
 * Command-line parsing, configuration merging and component lifecycle.
 */
#include <docgate/core/application.hpp>
#include <docgate/core/utils.hpp>

#include <algorithm>
#include <iostream>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <curl/curl.h>
#include <sstream>

namespace docgate {

// ============================================================================
// Command Line
// ============================================================================

namespace {

bool is_option(const char* arg) {
    return arg[0] == '-' && arg[1] != '\0';
}

// Collects values up to the next option
void take_values(int argc, char* argv[], int& i, std::vector<std::string>& out) {
    while (i + 1 < argc && !is_option(argv[i + 1])) {
        out.push_back(argv[++i]);
    }
}

bool take_value(int argc, char* argv[], int& i, std::string& out, std::string& error) {
    if (i + 1 >= argc) {
        error = std::string("option ") + argv[i] + " requires a value";
        return false;
    }
    out = argv[++i];
    return true;
}

bool parse_long(const std::string& text, long& out) {
    if (text.empty()) return false;
    char* end = NULL;
    errno = 0;
    long v = strtol(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = v;
    return true;
}

bool parse_double(const std::string& text, double& out) {
    if (text.empty()) return false;
    char* end = NULL;
    errno = 0;
    double v = strtod(text.c_str(), &end);
    if (errno != 0 || *end != '\0') return false;
    out = v;
    return true;
}

// Longest accepted HTTP timeout, one day
const double MAX_TIMEOUT_S = 86400.0;

long timeout_ms(double seconds) {
    return static_cast<long>(std::min(seconds, MAX_TIMEOUT_S) * 1000);
}

} // namespace

bool parse_command_line(int argc, char* argv[], CliOptions& out, std::string& error) {
    if (argc <= 1) {
        out.show_help = true;
        return true;
    }

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        std::string value;

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            out.show_help = true;
        } else if (strcmp(arg, "-V") == 0 || strcmp(arg, "--version") == 0) {
            out.show_version = true;
        } else if (strcmp(arg, "-j") == 0 || strcmp(arg, "--json") == 0) {
            if (!take_value(argc, argv, i, out.json_path, error)) return false;
        } else if (strcmp(arg, "-u") == 0 || strcmp(arg, "--urls") == 0) {
            size_t before = out.urls.size();
            take_values(argc, argv, i, out.urls);
            if (out.urls.size() == before) {
                error = std::string("option ") + arg + " requires at least one value";
                return false;
            }
        } else if (strcmp(arg, "--allowed-domains") == 0) {
            out.allowed_domains_set = true;
            take_values(argc, argv, i, out.allowed_domains);
        } else if (strcmp(arg, "--allowed-local-dirs") == 0) {
            take_values(argc, argv, i, out.allowed_local_dirs);
        } else if (strcmp(arg, "--follow-redirects") == 0) {
            out.follow_redirects = true;
        } else if (strcmp(arg, "--probe") == 0) {
            out.probe = true;
        } else if (strcmp(arg, "--timeout") == 0) {
            if (!take_value(argc, argv, i, value, error)) return false;
            if (!parse_double(value, out.timeout_s) || !(out.timeout_s > 0)) {
                error = "invalid --timeout: " + value;
                return false;
            }
            out.timeout_set = true;
        } else if (strcmp(arg, "--max-tool-name-length") == 0) {
            if (!take_value(argc, argv, i, value, error)) return false;
            if (!parse_long(value, out.max_tool_name_length) || out.max_tool_name_length < 0) {
                error = "invalid --max-tool-name-length: " + value;
                return false;
            }
        } else if (strcmp(arg, "--max-content-length") == 0) {
            if (!take_value(argc, argv, i, value, error)) return false;
            if (!parse_long(value, out.max_content_length) || out.max_content_length < 0) {
                error = "invalid --max-content-length: " + value;
                return false;
            }
        } else if (strcmp(arg, "--overflow") == 0) {
            if (!take_value(argc, argv, i, out.overflow, error)) return false;
            OverflowPolicy policy;
            if (!parse_overflow_policy(out.overflow, policy)) {
                error = "invalid --overflow: " + out.overflow + " (expected truncate or fail)";
                return false;
            }
        } else if (strcmp(arg, "--log-level") == 0) {
            if (!take_value(argc, argv, i, out.log_level, error)) return false;
            LogLevel level;
            if (!parse_log_level(out.log_level, level)) {
                error = "invalid --log-level: " + out.log_level;
                return false;
            }
        } else if (strcmp(arg, "--workers") == 0) {
            if (!take_value(argc, argv, i, value, error)) return false;
            if (!parse_long(value, out.workers) || out.workers <= 0) {
                error = "invalid --workers: " + value;
                return false;
            }
        } else if (strcmp(arg, "--transport") == 0) {
            if (!take_value(argc, argv, i, value, error)) return false;
            if (value != "stdio") {
                error = "unsupported transport: " + value + " (only stdio is available)";
                return false;
            }
        } else {
            error = std::string("unknown option: ") + arg;
            return false;
        }
    }
    return true;
}

// ============================================================================
// Configuration
// ============================================================================

bool apply_config(const Config& config, ServerOptions& out, std::string& error) {
    const Json& data = config.data();

    if (data.is_array()) {
        return doc_sources_from_json(data, out.sources, error);
    }
    if (!data.is_object()) {
        error = "configuration must be a JSON array of sources or an object";
        return false;
    }

    if (config.has("sources") && !doc_sources_from_json(config.get_section("sources"), out.sources, error)) {
        return false;
    }

    std::vector<std::string> domains = config.get_string_list("allowed_domains");
    out.allowed_domains.insert(out.allowed_domains.end(), domains.begin(), domains.end());

    std::vector<std::string> dirs = config.get_string_list("allowed_local_dirs");
    out.fetch.allowed_local_dirs.insert(out.fetch.allowed_local_dirs.end(), dirs.begin(), dirs.end());

    if (config.has("timeout")) {
        double seconds = config.get_double("timeout", 0);
        if (!(seconds > 0)) {
            error = "\"timeout\" must be a positive number of seconds";
            return false;
        }
        out.fetch.timeout_ms = timeout_ms(seconds);
    }

    out.fetch.follow_redirects = config.get_bool("follow_redirects", out.fetch.follow_redirects);
    out.fetch.max_redirects = static_cast<int>(config.get_int("max_redirects", out.fetch.max_redirects));

    int64_t max_content = config.get_int("max_content_length", static_cast<int64_t>(out.fetch.max_content_length));
    int64_t max_download = config.get_int("max_download_bytes", static_cast<int64_t>(out.fetch.max_download_bytes));
    int64_t max_name = config.get_int("max_tool_name_length", static_cast<int64_t>(out.max_tool_name_length));
    int64_t workers = config.get_int("workers", static_cast<int64_t>(out.workers));
    if (max_content < 0 || max_download < 0 || max_name < 0 || workers <= 0 || out.fetch.max_redirects < 0) {
        error = "numeric settings must not be negative and \"workers\" must be positive";
        return false;
    }
    out.fetch.max_content_length = static_cast<size_t>(max_content);
    out.fetch.max_download_bytes = static_cast<size_t>(max_download);
    out.max_tool_name_length = static_cast<size_t>(max_name);
    out.workers = static_cast<size_t>(workers);

    if (config.has("overflow") &&
        !parse_overflow_policy(config.get_string("overflow"), out.fetch.overflow)) {
        error = "\"overflow\" must be \"truncate\" or \"fail\"";
        return false;
    }
    if (config.has("log_level") &&
        !parse_log_level(config.get_string("log_level"), out.log_level)) {
        error = "unknown \"log_level\": " + config.get_string("log_level");
        return false;
    }
    return true;
}

bool build_server_options(const CliOptions& cli, ServerOptions& out, std::string& error) {
    if (!cli.json_path.empty()) {
        Config config;
        if (!config.load_file(cli.json_path)) {
            error = config.error();
            return false;
        }
        if (!apply_config(config, out, error)) {
            error = cli.json_path + ": " + error;
            return false;
        }
        LOG_INFO("Loaded %zu sources from %s", out.sources.size(), cli.json_path.c_str());
    }

    for (size_t i = 0; i < cli.urls.size(); ++i) {
        DocSource src;
        if (!parse_source_argument(cli.urls[i], src)) {
            error = "invalid --urls entry: '" + cli.urls[i] + "'";
            return false;
        }
        append_unique(out.sources, src);
    }

    if (cli.allowed_domains_set) {
        out.allowed_domains.insert(out.allowed_domains.end(),
                                   cli.allowed_domains.begin(), cli.allowed_domains.end());
    }
    out.fetch.allowed_local_dirs.insert(out.fetch.allowed_local_dirs.end(),
                                        cli.allowed_local_dirs.begin(), cli.allowed_local_dirs.end());

    if (cli.follow_redirects) out.fetch.follow_redirects = true;
    if (cli.timeout_set) out.fetch.timeout_ms = timeout_ms(cli.timeout_s);
    if (cli.max_tool_name_length >= 0) out.max_tool_name_length = static_cast<size_t>(cli.max_tool_name_length);
    if (cli.max_content_length >= 0) out.fetch.max_content_length = static_cast<size_t>(cli.max_content_length);
    if (cli.workers > 0) out.workers = static_cast<size_t>(cli.workers);
    if (!cli.overflow.empty()) parse_overflow_policy(cli.overflow, out.fetch.overflow);
    if (!cli.log_level.empty()) parse_log_level(cli.log_level, out.log_level);
    if (cli.probe) out.probe = true;

    if (out.sources.empty()) {
        error = "no documentation sources configured (use --json or --urls)";
        return false;
    }
    return true;
}

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - documentation gateway for MCP clients\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Sources (at least one required, may be combined):\n"
              << "  -j, --json FILE                 JSON config file\n"
              << "  -u, --urls ENTRY...             llms.txt URLs or paths, optionally name:location\n\n"
              << "Options:\n"
              << "  --allowed-domains [D...]        Extra hosts to allow ('*' allows all)\n"
              << "  --allowed-local-dirs DIR...     Extra directories local links may read from\n"
              << "  --follow-redirects              Follow HTTP redirects (each hop is checked)\n"
              << "  --timeout SECONDS               HTTP timeout (default 10)\n"
              << "  --max-content-length N          Characters returned per document (default 100000, 0 = no limit)\n"
              << "  --overflow truncate|fail        What to do with longer documents (default truncate)\n"
              << "  --max-tool-name-length N        Tool name limit (default 60, 0 = no limit)\n"
              << "  --workers N                     Concurrent tool calls (default 4)\n"
              << "  --log-level LEVEL               debug, info, warn or error (default info)\n"
              << "  --probe                         Load every index once at startup\n"
              << "  --transport stdio               Transport (stdio only)\n"
              << "  -h, --help                      Show this help message\n"
              << "  -V, --version                   Show version\n\n"
              << "Every file below a local index's directory is readable through its tool.\n"
              << "Keep local indexes in a dedicated directory, not in $HOME.\n\n"
              << "Examples:\n"
              << "  " << prog << " --urls LangGraph:https://langchain-ai.github.io/langgraph/llms.txt\n"
              << "  " << prog << " --urls LocalDocs:/path/to/llms.txt\n"
              << "  " << prog << " --json sources.json --allowed-domains https://example.com/\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " " << AppInfo::VERSION << "\n";
}

// ============================================================================
// Signal Handler
// ============================================================================

namespace {
    void signal_handler(int sig) {
        (void)sig;
        Application::instance().stop();
        // Unblocks the reader waiting on stdin
        close(STDIN_FILENO);
    }
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : exit_code_(0)
    , curl_initialized_(false) {
}

bool Application::init(int argc, char* argv[]) {
    CliOptions cli;
    std::string error;
    if (!parse_command_line(argc, argv, cli, error)) {
        std::cerr << "Error: " << error << "\n"
                  << "Run '" << argv[0] << " --help' for usage.\n";
        exit_code_ = 1;
        return false;
    }
    if (cli.show_help) {
        print_usage(argv[0]);
        return false;
    }
    if (cli.show_version) {
        print_version();
        return false;
    }

    // The command-line level applies while the config file is read
    if (!cli.log_level.empty()) {
        LogLevel level;
        if (parse_log_level(cli.log_level, level)) Logger::instance().set_level(level);
    }

    if (!build_server_options(cli, options_, error)) {
        LOG_ERROR("%s", error.c_str());
        exit_code_ = 1;
        return false;
    }
    Logger::instance().set_level(options_.log_level);

    // Initialize libcurl globally (before threads start)
    if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
        LOG_ERROR("Failed to initialize libcurl");
        exit_code_ = 1;
        return false;
    }
    curl_initialized_ = true;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    LOG_INFO("%s v%s starting with %zu sources", AppInfo::NAME, AppInfo::VERSION,
             options_.sources.size());

    if (!setup_components()) {
        exit_code_ = 1;
        return false;
    }
    return true;
}

bool Application::setup_components() {
    policy_.reset(new AllowlistPolicy(AllowlistPolicy::build(options_.sources, options_.allowed_domains)));
    LOG_INFO("Allowed domains: %s", policy_->describe().c_str());

    http_.reset(new HttpClient());
    http_->set_user_agent(std::string(AppInfo::NAME) + "/" + AppInfo::VERSION);

    fetcher_.reset(new ResourceFetcher(*policy_, options_.sources, *http_, options_.fetch));
    for (size_t i = 0; i < fetcher_->local_roots().size(); ++i) {
        LOG_DEBUG("Local root: %s", fetcher_->local_roots()[i].c_str());
    }

    registry_.reset(new SourceRegistry(options_.sources, *fetcher_));
    exposer_.reset(new ToolExposer(*registry_, *fetcher_, options_.max_tool_name_length));

    pool_.reset(new ThreadPool(options_.workers));

    ServerInfo info;
    info.name = AppInfo::NAME;
    info.version = AppInfo::VERSION;
    info.instructions =
        "Each fetch_docs_<name> tool serves one documentation source. Call it without "
        "arguments to list the documents in its llms.txt index, then call it with one "
        "of the listed links as `url`. list_doc_sources shows every source.";
    server_.reset(new McpStdioServer(*pool_, info));

    try {
        size_t count = exposer_->register_all(*server_);
        LOG_INFO("Registered %zu tools", count);
    } catch (const StartupError& e) {
        LOG_ERROR("%s", e.what());
        return false;
    }

    if (options_.probe) {
        registry_->probe_all();
    }
    return true;
}

int Application::run() {
    server_->run(std::cin, std::cout);
    return 0;
}

void Application::stop() {
    if (server_) server_->stop();
}

void Application::shutdown() {
    if (server_) LOG_INFO("Shutting down...");

    // Stop thread pool (lets running calls finish)
    if (pool_) pool_->shutdown();

    server_.reset();
    pool_.reset();
    exposer_.reset();
    registry_.reset();
    fetcher_.reset();
    policy_.reset();
    http_.reset();

    if (curl_initialized_) {
        curl_global_cleanup();
        curl_initialized_ = false;
    }
}

} // namespace docgate
