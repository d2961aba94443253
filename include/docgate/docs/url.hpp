#ifndef DOCGATE_DOCS_URL_HPP
#define DOCGATE_DOCS_URL_HPP

#include <string>

namespace docgate {

// Components of an absolute http(s) URL
struct Url {
    std::string scheme;     // lower-case, "http" or "https"
    std::string host;       // lower-case, without brackets, port or userinfo
    std::string port;       // empty when absent
    std::string path;       // "/" when absent
    std::string query;      // without '?'
    std::string fragment;   // without '#'

    // scheme://host[:port]
    std::string origin() const;
    std::string str() const;
};

// True for "http://" and "https://" (any case)
bool is_http_url(const std::string& s);

// Parses an absolute http(s) URL. Rejects empty hosts and authorities
// containing whitespace, control characters or backslashes.
bool parse_url(const std::string& s, Url& out);

// Lower-cases a host name and strips a trailing dot and any :port
std::string normalize_host(const std::string& host);

// Resolves `ref` against the absolute URL `base` (RFC 3986 subset: absolute,
// scheme-relative, absolute-path and relative-path references).
// Returns empty when `base` does not parse.
std::string resolve_url(const std::string& base, const std::string& ref);

} // namespace docgate

#endif // DOCGATE_DOCS_URL_HPP
