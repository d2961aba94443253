#include <docgate/docs/fetcher.hpp>
#include <docgate/docs/html_markdown.hpp>
#include <docgate/docs/url.hpp>
#include <docgate/core/logger.hpp>
#include <docgate/core/utils.hpp>
#include <climits>
#include <cstdlib>
#include <sstream>
#include <sys/stat.h>

namespace docgate {

namespace {

// Symlink-free absolute path, or the lexical form when it does not exist
std::string canonical_path(const std::string& path) {
    char buf[PATH_MAX];
    if (realpath(path.c_str(), buf) != NULL) {
        return std::string(buf);
    }
    return normalize_path(path);
}

void add_unique(std::vector<std::string>& list, const std::string& value) {
    for (size_t i = 0; i < list.size(); ++i) {
        if (list[i] == value) return;
    }
    list.push_back(value);
}

std::string content_type_for_path(const std::string& path) {
    std::string lower = to_lower(path);
    if (ends_with(lower, ".html") || ends_with(lower, ".htm") || ends_with(lower, ".xhtml")) {
        return "text/html";
    }
    if (ends_with(lower, ".md") || ends_with(lower, ".markdown")) {
        return "text/markdown";
    }
    if (ends_with(lower, ".txt")) {
        return "text/plain";
    }
    return "";
}

} // namespace

const char* fetch_error_name(FetchError code) {
    switch (code) {
        case FetchError::NONE: return "None";
        case FetchError::DOMAIN_NOT_ALLOWED: return "DomainNotAllowed";
        case FetchError::PATH_NOT_ALLOWED: return "PathNotAllowed";
        case FetchError::NOT_FOUND: return "NotFound";
        case FetchError::UPSTREAM_ERROR: return "UpstreamError";
        case FetchError::TOO_LARGE: return "TooLarge";
    }
    return "Unknown";
}

bool parse_overflow_policy(const std::string& name, OverflowPolicy& out) {
    std::string n = to_lower(trim(name));
    if (n == "truncate") {
        out = OverflowPolicy::TRUNCATE;
    } else if (n == "fail") {
        out = OverflowPolicy::FAIL;
    } else {
        return false;
    }
    return true;
}

std::string FetchResult::error_text() const {
    return std::string(fetch_error_name(code)) + ": " + message;
}

ResourceFetcher::ResourceFetcher(const AllowlistPolicy& policy,
                                 const std::vector<DocSource>& sources,
                                 HttpTransport& transport,
                                 const FetchOptions& options)
    : policy_(policy)
    , transport_(transport)
    , options_(options) {
    std::vector<std::string> dirs;
    for (size_t i = 0; i < sources.size(); ++i) {
        if (sources[i].is_remote()) continue;
        add_unique(local_files_, normalize_path(sources[i].location));
        add_unique(local_files_, canonical_path(sources[i].location));

        // An index at the filesystem root only grants itself
        std::string dir = normalize_path(dirname(sources[i].location));
        if (dir == "/") {
            LOG_WARN("Local index %s is in /; only the index file itself is readable",
                     sources[i].location.c_str());
            continue;
        }
        dirs.push_back(dir);
    }
    for (size_t i = 0; i < options_.allowed_local_dirs.size(); ++i) {
        dirs.push_back(absolute_path(options_.allowed_local_dirs[i]));
    }

    // Both spellings of each root: the lexical one for paths as given, the
    // canonical one for symlink-resolved paths. A resolved path contains no
    // symlinks, so it can only match a lexical root that has none either.
    for (size_t i = 0; i < dirs.size(); ++i) {
        if (dirs[i].empty()) continue;
        add_unique(local_roots_, normalize_path(dirs[i]));
        add_unique(local_roots_, canonical_path(dirs[i]));
    }
}

FetchResult ResourceFetcher::fetch(const std::string& target,
                                   const std::atomic<bool>* cancelled) const {
    RawResource raw;
    FetchResult r = fetch_raw(target, raw, cancelled);
    if (!r.success) {
        return r;
    }
    return normalize(raw);
}

FetchResult ResourceFetcher::fetch_raw(const std::string& target, RawResource& out,
                                       const std::atomic<bool>* cancelled) const {
    std::string t = trim(target);
    if (t.empty()) {
        return FetchResult::fail(FetchError::NOT_FOUND, "empty target");
    }

    if (is_http_url(t)) {
        return fetch_remote(t, out, cancelled);
    }

    // Any other scheme is neither a web page nor a file
    size_t colon = t.find(':');
    size_t slash = t.find('/');
    if (colon != std::string::npos && (slash == std::string::npos || colon < slash) &&
        !starts_with(to_lower(t), "file:")) {
        return FetchResult::fail(FetchError::DOMAIN_NOT_ALLOWED,
                                 "unsupported URL scheme in '" + t + "'");
    }

    return read_local(t, out);
}

FetchResult ResourceFetcher::fetch_remote(const std::string& url, RawResource& out,
                                          const std::atomic<bool>* cancelled) const {
    HttpHeaders headers;
    headers["Accept"] = "text/markdown, text/plain;q=0.9, text/html;q=0.8, */*;q=0.5";

    HttpRequestOptions req;
    req.timeout_ms = options_.timeout_ms;
    req.max_body_bytes = options_.max_download_bytes;
    req.cancelled = cancelled;

    std::string current = url;
    for (int hop = 0; hop <= options_.max_redirects; ++hop) {
        Url u;
        if (!parse_url(current, u)) {
            return FetchResult::fail(FetchError::UPSTREAM_ERROR, "malformed URL '" + current + "'");
        }

        // Enforcement happens before the request, for every hop
        if (!policy_.is_allowed(u.host)) {
            LOG_WARN("Blocked fetch of %s: host '%s' not allowed", current.c_str(), u.host.c_str());
            return FetchResult::fail(FetchError::DOMAIN_NOT_ALLOWED,
                                     "host '" + u.host + "' is not in the allowed domains (" +
                                     policy_.describe() + ")");
        }

        if (cancelled && cancelled->load()) {
            return FetchResult::fail(FetchError::UPSTREAM_ERROR, "request cancelled");
        }

        HttpResponse resp = transport_.get(current, headers, req);

        if (resp.too_large) {
            return FetchResult::fail(FetchError::TOO_LARGE, current + ": " + resp.error);
        }
        if (!resp.error.empty()) {
            std::string reason = resp.timed_out
                ? "timed out after " + std::to_string(options_.timeout_ms) + "ms"
                : resp.error;
            return FetchResult::fail(FetchError::UPSTREAM_ERROR, current + ": " + reason);
        }

        if (resp.is_redirect()) {
            std::string next = resolve_url(current, resp.redirect_url);
            if (!options_.follow_redirects) {
                return FetchResult::fail(FetchError::UPSTREAM_ERROR,
                                         current + ": redirected to " + next +
                                         " (redirects are not followed)");
            }
            LOG_DEBUG("Redirect %ld: %s -> %s", resp.status_code, current.c_str(), next.c_str());
            current = next;
            continue;
        }

        if (resp.status_code == 404 || resp.status_code == 410) {
            return FetchResult::fail(FetchError::NOT_FOUND,
                                     current + ": HTTP " + std::to_string(resp.status_code));
        }
        if (!resp.ok()) {
            return FetchResult::fail(FetchError::UPSTREAM_ERROR,
                                     current + ": HTTP " + std::to_string(resp.status_code));
        }

        out.body.swap(resp.body);
        out.content_type = resp.content_type();
        out.location = current;
        out.local = false;

        FetchResult r;
        r.success = true;
        r.location = current;
        r.content_type = out.content_type;
        return r;
    }

    return FetchResult::fail(FetchError::UPSTREAM_ERROR,
                             url + ": more than " + std::to_string(options_.max_redirects) +
                             " redirects");
}

bool ResourceFetcher::local_path_permitted(const std::string& path) const {
    for (size_t i = 0; i < local_files_.size(); ++i) {
        if (path == local_files_[i]) return true;
    }
    for (size_t i = 0; i < local_roots_.size(); ++i) {
        if (path_within(path, local_roots_[i])) return true;
    }
    return false;
}

FetchResult ResourceFetcher::read_local(const std::string& target, RawResource& out) const {
    std::string path = normalize_local_location(target);

    if (!local_path_permitted(path)) {
        return FetchResult::fail(FetchError::PATH_NOT_ALLOWED,
                                 "local path '" + path + "' is outside the permitted directories");
    }

    struct stat st;
    if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return FetchResult::fail(FetchError::NOT_FOUND, "no such file: " + path);
    }

    // A symlink inside a permitted directory may still point outside it
    std::string real = canonical_path(path);
    if (!local_path_permitted(real)) {
        return FetchResult::fail(FetchError::PATH_NOT_ALLOWED,
                                 "local path '" + path + "' resolves outside the permitted directories");
    }

    if (options_.max_download_bytes > 0 &&
        static_cast<size_t>(st.st_size) > options_.max_download_bytes) {
        std::ostringstream oss;
        oss << path << ": file is " << st.st_size << " bytes, limit is "
            << options_.max_download_bytes;
        return FetchResult::fail(FetchError::TOO_LARGE, oss.str());
    }

    if (!read_file(real, out.body)) {
        return FetchResult::fail(FetchError::UPSTREAM_ERROR, "cannot read " + path);
    }
    out.content_type = content_type_for_path(path);
    out.location = path;
    out.local = true;

    FetchResult r;
    r.success = true;
    r.location = path;
    r.content_type = out.content_type;
    return r;
}

FetchResult ResourceFetcher::normalize(const RawResource& raw) const {
    FetchResult r;
    r.location = raw.location;

    if (looks_like_html(raw.content_type, raw.body)) {
        r.content = html_to_markdown(raw.body, raw.local ? std::string() : raw.location);
        r.content_type = "text/markdown";
    } else {
        r.content = raw.body;
        r.content_type = raw.content_type.empty() ? "text/plain" : raw.content_type;
    }

    r.original_length = r.content.size();
    size_t limit = options_.max_content_length;
    if (limit > 0 && r.content.size() > limit) {
        if (options_.overflow == OverflowPolicy::FAIL) {
            std::ostringstream oss;
            oss << raw.location << ": content is " << r.content.size()
                << " characters, limit is " << limit;
            return FetchResult::fail(FetchError::TOO_LARGE, oss.str());
        }
        r.content = truncate_safe(r.content, limit);
        r.truncated = true;
        LOG_DEBUG("Truncated %s from %zu to %zu bytes", raw.location.c_str(),
                  r.original_length, r.content.size());
    }

    r.success = true;
    return r;
}

} // namespace docgate
