#ifndef DOCGATE_DOCS_INDEX_PARSER_HPP
#define DOCGATE_DOCS_INDEX_PARSER_HPP

#include <string>
#include <vector>

namespace docgate {

struct DocSource;

// One link listed by an index file
struct LinkEntry {
    std::string title;
    std::string target;         // absolute URL or absolute local path
    std::string description;

    LinkEntry() {}
    LinkEntry(const std::string& t, const std::string& tgt, const std::string& d = "")
        : title(t), target(tgt), description(d) {}
};

struct IndexParseStats {
    size_t links;       // entries produced
    size_t skipped;     // lines that started like a link but did not parse

    IndexParseStats() : links(0), skipped(0) {}
};

// Parses llms.txt-style content. One link per line:
//
//   [Title](target)
//   - [Title](target): optional description
//
// Bullets (-, *, +, "1.") are optional. Headings, prose and blockquotes are
// ignored; malformed links are skipped. Relative targets are resolved
// against `base_location` (the index URL or index file path).
std::vector<LinkEntry> parse_index(const std::string& content,
                                   const std::string& base_location,
                                   IndexParseStats* stats = NULL);

// Resolves a link target against an index location. Returns empty for
// unsupported schemes (mailto:, javascript:, ...).
std::string resolve_link_target(const std::string& base_location, const std::string& target);

// Markdown listing of a source's entries, used by the "list index" call
std::string format_index(const DocSource& source, const std::vector<LinkEntry>& entries);

} // namespace docgate

#endif // DOCGATE_DOCS_INDEX_PARSER_HPP
