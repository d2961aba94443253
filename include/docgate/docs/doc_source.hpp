#ifndef DOCGATE_DOCS_DOC_SOURCE_HPP
#define DOCGATE_DOCS_DOC_SOURCE_HPP

#include <docgate/core/json.hpp>
#include <string>
#include <vector>

namespace docgate {

// One configured documentation set: an index file and its display name.
// Built once at startup and never modified afterwards.
struct DocSource {
    std::string name;
    std::string location;       // absolute http(s) URL or absolute local path
    std::string description;

    DocSource() {}
    DocSource(const std::string& n, const std::string& loc, const std::string& desc = "")
        : name(n), location(loc), description(desc) {}

    bool is_remote() const;

    bool operator==(const DocSource& other) const {
        return name == other.name && location == other.location &&
               description == other.description;
    }
};

// Strips a file:// prefix and makes the path absolute
std::string normalize_local_location(const std::string& location);

// Normalizes the location and fills in a default name when `name` is empty:
// "scheme://host/" for remote indexes, the absolute path for local ones.
DocSource make_doc_source(const std::string& name,
                          const std::string& location,
                          const std::string& description = "");

// Reads an array of {"name", "llms_txt", "description"} objects.
// Entries without "llms_txt" are rejected with a message in `error`.
// Every entry is appended, duplicates included.
bool doc_sources_from_json(const Json& list, std::vector<DocSource>& out, std::string& error);

// Parses a command-line entry: "location" or "name:location".
// A leading http:/https: is never taken as a name.
bool parse_source_argument(const std::string& arg, DocSource& out);

// Appends `src` unless an identical entry is already present
void append_unique(std::vector<DocSource>& sources, const DocSource& src);

} // namespace docgate

#endif // DOCGATE_DOCS_DOC_SOURCE_HPP
