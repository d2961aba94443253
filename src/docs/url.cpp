#include <docgate/docs/url.hpp>
#include <docgate/core/utils.hpp>
#include <cctype>
#include <vector>

namespace docgate {

namespace {

bool valid_authority(const std::string& authority) {
    for (size_t i = 0; i < authority.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(authority[i]);
        if (c <= 0x20 || c == 0x7F || c == '\\') return false;
    }
    return true;
}

// Collapses "." and ".." segments of an absolute URL path
std::string remove_dot_segments(const std::string& path) {
    std::vector<std::string> out;
    std::vector<std::string> parts = split(path, '/');
    bool trailing_slash = ends_with(path, "/") || ends_with(path, "/.") || ends_with(path, "/..");

    for (size_t i = 0; i < parts.size(); ++i) {
        const std::string& seg = parts[i];
        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            if (!out.empty()) out.pop_back();
            continue;
        }
        out.push_back(seg);
    }

    std::string result = "/" + join(out, "/");
    if (trailing_slash && result.size() > 1) result += "/";
    return result;
}

} // namespace

std::string Url::origin() const {
    std::string o = scheme + "://";
    o += host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (!port.empty()) o += ":" + port;
    return o;
}

std::string Url::str() const {
    std::string s = origin() + path;
    if (!query.empty()) s += "?" + query;
    if (!fragment.empty()) s += "#" + fragment;
    return s;
}

bool is_http_url(const std::string& s) {
    std::string lower = to_lower(s.substr(0, 8));
    return starts_with(lower, "http://") || starts_with(lower, "https://");
}

std::string normalize_host(const std::string& host) {
    std::string h = to_lower(trim(host));
    if (!h.empty() && h[0] == '[') {
        size_t close = h.find(']');
        return close == std::string::npos ? h.substr(1) : h.substr(1, close - 1);
    }
    size_t colon = h.find(':');
    if (colon != std::string::npos && h.find(':', colon + 1) == std::string::npos) {
        h = h.substr(0, colon);
    }
    while (!h.empty() && h[h.size() - 1] == '.') {
        h.erase(h.size() - 1);
    }
    return h;
}

bool parse_url(const std::string& s, Url& out) {
    std::string input = trim(s);
    size_t scheme_end = input.find("://");
    if (scheme_end == std::string::npos) return false;

    Url u;
    u.scheme = to_lower(input.substr(0, scheme_end));
    if (u.scheme != "http" && u.scheme != "https") return false;

    size_t auth_start = scheme_end + 3;
    size_t auth_end = input.find_first_of("/?#", auth_start);
    if (auth_end == std::string::npos) auth_end = input.size();

    std::string authority = input.substr(auth_start, auth_end - auth_start);
    if (authority.empty() || !valid_authority(authority)) return false;

    // Userinfo ends at the last '@'
    size_t at = authority.rfind('@');
    std::string hostport = at == std::string::npos ? authority : authority.substr(at + 1);

    if (!hostport.empty() && hostport[0] == '[') {
        size_t close = hostport.find(']');
        if (close == std::string::npos) return false;
        u.host = to_lower(hostport.substr(1, close - 1));
        if (close + 1 < hostport.size()) {
            if (hostport[close + 1] != ':') return false;
            u.port = hostport.substr(close + 2);
        }
    } else {
        size_t colon = hostport.find(':');
        if (colon != std::string::npos) {
            u.port = hostport.substr(colon + 1);
            hostport = hostport.substr(0, colon);
        }
        u.host = normalize_host(hostport);
    }

    if (u.host.empty()) return false;
    for (size_t i = 0; i < u.port.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(u.port[i]))) return false;
    }

    std::string rest = input.substr(auth_end);
    size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        u.fragment = rest.substr(hash + 1);
        rest = rest.substr(0, hash);
    }
    size_t q = rest.find('?');
    if (q != std::string::npos) {
        u.query = rest.substr(q + 1);
        rest = rest.substr(0, q);
    }
    u.path = rest.empty() ? "/" : rest;

    out = u;
    return true;
}

std::string resolve_url(const std::string& base, const std::string& ref) {
    Url b;
    if (!parse_url(base, b)) return "";

    std::string r = trim(ref);
    if (r.empty()) return b.str();

    if (is_http_url(r)) return r;

    if (starts_with(r, "//")) {
        return b.scheme + ":" + r;
    }

    if (r[0] == '#') {
        b.fragment = r.substr(1);
        return b.str();
    }

    Url resolved = b;
    resolved.fragment.clear();

    std::string path_part = r;
    size_t hash = path_part.find('#');
    if (hash != std::string::npos) {
        resolved.fragment = path_part.substr(hash + 1);
        path_part = path_part.substr(0, hash);
    }

    if (!path_part.empty() && path_part[0] == '?') {
        resolved.query = path_part.substr(1);
        return resolved.str();
    }

    resolved.query.clear();
    size_t q = path_part.find('?');
    if (q != std::string::npos) {
        resolved.query = path_part.substr(q + 1);
        path_part = path_part.substr(0, q);
    }

    if (path_part[0] == '/') {
        resolved.path = remove_dot_segments(path_part);
    } else {
        std::string dir = b.path.substr(0, b.path.rfind('/') + 1);
        resolved.path = remove_dot_segments(dir + path_part);
    }
    return resolved.str();
}

} // namespace docgate
