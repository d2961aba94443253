#include <docgate/docs/index_parser.hpp>
#include <docgate/docs/doc_source.hpp>
#include <docgate/docs/url.hpp>
#include <docgate/core/utils.hpp>
#include <cctype>
#include <sstream>

namespace docgate {

namespace {

// Removes "- ", "* ", "+ " or "12. " from the front of a list item
std::string strip_bullet(const std::string& line) {
    if (line.size() >= 2 && (line[0] == '-' || line[0] == '*' || line[0] == '+') &&
        std::isspace(static_cast<unsigned char>(line[1]))) {
        return ltrim(line.substr(2));
    }
    size_t i = 0;
    while (i < line.size() && std::isdigit(static_cast<unsigned char>(line[i]))) ++i;
    if (i > 0 && i + 1 < line.size() && (line[i] == '.' || line[i] == ')') &&
        std::isspace(static_cast<unsigned char>(line[i + 1]))) {
        return ltrim(line.substr(i + 2));
    }
    return line;
}

bool has_scheme(const std::string& s) {
    size_t colon = s.find(':');
    if (colon == std::string::npos || colon == 0) return false;
    for (size_t i = 0; i < colon; ++i) {
        char c = s[i];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

// Parses "[title](target)rest". Returns false on malformed syntax.
bool parse_link(const std::string& line, std::string& title, std::string& target, std::string& rest) {
    if (line.empty() || line[0] != '[') return false;

    // Title may contain balanced brackets
    int depth = 0;
    size_t close = std::string::npos;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '\\') { ++i; continue; }
        if (line[i] == '[') ++depth;
        else if (line[i] == ']' && --depth == 0) { close = i; break; }
    }
    if (close == std::string::npos || close + 1 >= line.size() || line[close + 1] != '(') {
        return false;
    }

    size_t start = close + 2;
    depth = 1;
    size_t end = std::string::npos;
    for (size_t i = start; i < line.size(); ++i) {
        if (line[i] == '(') ++depth;
        else if (line[i] == ')' && --depth == 0) { end = i; break; }
    }
    if (end == std::string::npos) return false;

    title = trim(line.substr(1, close - 1));
    target = trim(line.substr(start, end - start));
    rest = trim(line.substr(end + 1));

    // Drop an optional link title: (url "title")
    size_t space = target.find_first_of(" \t");
    if (space != std::string::npos) {
        target = target.substr(0, space);
    }
    if (target.size() >= 2 && target[0] == '<' && target[target.size() - 1] == '>') {
        target = target.substr(1, target.size() - 2);
    }

    return !title.empty() && !target.empty();
}

} // namespace

std::string resolve_link_target(const std::string& base_location, const std::string& target) {
    std::string t = trim(target);
    if (t.empty()) return "";

    if (is_http_url(t)) return t;
    if (starts_with(to_lower(t), "file://")) return normalize_local_location(t);
    if (has_scheme(t)) return "";

    if (is_http_url(base_location)) {
        return resolve_url(base_location, t);
    }
    if (t[0] == '/') {
        return normalize_path(t);
    }
    return normalize_path(join_path(dirname(base_location), t));
}

std::vector<LinkEntry> parse_index(const std::string& content,
                                   const std::string& base_location,
                                   IndexParseStats* stats) {
    std::vector<LinkEntry> entries;
    IndexParseStats local;

    std::vector<std::string> lines = split_lines(content);
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string line = strip_bullet(trim(lines[i]));
        if (line.empty() || line[0] != '[') continue;

        std::string title, target, rest;
        if (!parse_link(line, title, target, rest)) {
            ++local.skipped;
            continue;
        }

        std::string resolved = resolve_link_target(base_location, target);
        if (resolved.empty()) {
            ++local.skipped;
            continue;
        }

        std::string description;
        if (!rest.empty() && rest[0] == ':') {
            description = trim(rest.substr(1));
        }
        entries.push_back(LinkEntry(title, resolved, description));
    }

    local.links = entries.size();
    if (stats) *stats = local;
    return entries;
}

std::string format_index(const DocSource& source, const std::vector<LinkEntry>& entries) {
    std::ostringstream oss;
    oss << "# " << source.name << "\n\n";
    if (!source.description.empty()) {
        oss << source.description << "\n\n";
    }
    oss << "Index: " << source.location << "\n\n";
    for (size_t i = 0; i < entries.size(); ++i) {
        oss << "- [" << entries[i].title << "](" << entries[i].target << ")";
        if (!entries[i].description.empty()) {
            oss << ": " << entries[i].description;
        }
        oss << "\n";
    }
    oss << "\nPass one of the links above as `url` to fetch that document.\n";
    return oss.str();
}

} // namespace docgate
