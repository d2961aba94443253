#ifndef DOCGATE_DOCS_FETCHER_HPP
#define DOCGATE_DOCS_FETCHER_HPP

#include <docgate/docs/allowlist.hpp>
#include <docgate/docs/doc_source.hpp>
#include <docgate/core/http_client.hpp>
#include <string>
#include <vector>
#include <atomic>

namespace docgate {

enum class FetchError {
    NONE,
    DOMAIN_NOT_ALLOWED,     // remote host outside the allowlist
    PATH_NOT_ALLOWED,       // local path outside the permitted directories
    NOT_FOUND,              // missing file, HTTP 404/410
    UPSTREAM_ERROR,         // transport failure, other HTTP status, timeout, cancel
    TOO_LARGE               // over the content limit (fail policy) or download ceiling
};

// "DomainNotAllowed", "NotFound", ...
const char* fetch_error_name(FetchError code);

// What to do when converted content exceeds max_content_length
enum class OverflowPolicy {
    TRUNCATE,   // cut at the limit and report truncated = true
    FAIL        // return TOO_LARGE
};

bool parse_overflow_policy(const std::string& name, OverflowPolicy& out);

struct FetchOptions {
    long timeout_ms;
    bool follow_redirects;
    int max_redirects;
    size_t max_content_length;          // 0 = unlimited
    OverflowPolicy overflow;
    size_t max_download_bytes;          // hard transfer ceiling, 0 = unlimited
    std::vector<std::string> allowed_local_dirs;

    FetchOptions()
        : timeout_ms(10000)
        , follow_redirects(false)
        , max_redirects(5)
        , max_content_length(100000)
        , overflow(OverflowPolicy::TRUNCATE)
        , max_download_bytes(10 * 1024 * 1024) {}
};

// Raw bytes of a resource before normalization
struct RawResource {
    std::string body;
    std::string content_type;
    std::string location;       // final URL after redirects, or absolute path
    bool local;

    RawResource() : local(false) {}
};

struct FetchResult {
    bool success;
    FetchError code;
    std::string message;

    std::string content;            // markdown, at most max_content_length bytes
    bool truncated;
    size_t original_length;         // length before truncation
    std::string content_type;
    std::string location;

    FetchResult() : success(false), code(FetchError::NONE), truncated(false), original_length(0) {}

    static FetchResult fail(FetchError code, const std::string& message) {
        FetchResult r;
        r.success = false;
        r.code = code;
        r.message = message;
        return r;
    }

    // "<ErrorName>: <message>"
    std::string error_text() const;
};

// Resolves URLs and local paths to bounded markdown.
//
// Every fetch in the process goes through here. Remote hosts are checked
// against the allowlist before any request is issued, and again for each
// redirect hop. Local paths must lie inside the directory of a configured
// local index or an explicitly allowed directory.
//
// Holds only const state after construction; concurrent calls are safe as
// long as the transport is.
class ResourceFetcher {
public:
    ResourceFetcher(const AllowlistPolicy& policy,
                    const std::vector<DocSource>& sources,
                    HttpTransport& transport,
                    const FetchOptions& options);

    // Fetch and normalize: HTML becomes markdown, length is capped
    FetchResult fetch(const std::string& target,
                      const std::atomic<bool>* cancelled = NULL) const;

    // Fetch without conversion or length cap (index files). The download
    // ceiling and all access checks still apply.
    FetchResult fetch_raw(const std::string& target, RawResource& out,
                          const std::atomic<bool>* cancelled = NULL) const;

    const AllowlistPolicy& policy() const { return policy_; }
    const FetchOptions& options() const { return options_; }
    const std::vector<std::string>& local_roots() const { return local_roots_; }

private:
    const AllowlistPolicy& policy_;
    HttpTransport& transport_;
    FetchOptions options_;
    std::vector<std::string> local_roots_;
    std::vector<std::string> local_files_;      // local index files

    FetchResult fetch_remote(const std::string& url, RawResource& out,
                             const std::atomic<bool>* cancelled) const;
    FetchResult read_local(const std::string& target, RawResource& out) const;
    bool local_path_permitted(const std::string& path) const;
    FetchResult normalize(const RawResource& raw) const;
};

} // namespace docgate

#endif // DOCGATE_DOCS_FETCHER_HPP
