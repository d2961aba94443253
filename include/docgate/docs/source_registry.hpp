#ifndef DOCGATE_DOCS_SOURCE_REGISTRY_HPP
#define DOCGATE_DOCS_SOURCE_REGISTRY_HPP

#include <docgate/docs/doc_source.hpp>
#include <docgate/docs/fetcher.hpp>
#include <docgate/docs/index_parser.hpp>
#include <string>
#include <vector>
#include <atomic>

namespace docgate {

enum class IndexError {
    NONE,
    INDEX_UNAVAILABLE,      // index could not be read or fetched
    INDEX_PARSE_ERROR       // no link entry could be interpreted
};

const char* index_error_name(IndexError code);

struct IndexResult {
    bool success;
    IndexError code;
    std::string message;
    std::vector<LinkEntry> entries;
    size_t skipped;             // malformed link lines

    IndexResult() : success(false), code(IndexError::NONE), skipped(0) {}

    static IndexResult fail(IndexError code, const std::string& message) {
        IndexResult r;
        r.code = code;
        r.message = message;
        return r;
    }

    std::string error_text() const;
};

// Immutable list of configured documentation sources.
//
// Index files are read through the fetcher on every call, so an index that
// changes upstream is picked up without a restart.
class SourceRegistry {
public:
    SourceRegistry(const std::vector<DocSource>& sources, const ResourceFetcher& fetcher);

    const std::vector<DocSource>& sources() const { return sources_; }

    // NULL if no source has that name
    const DocSource* find(const std::string& name) const;

    IndexResult load_index(const DocSource& source,
                           const std::atomic<bool>* cancelled = NULL) const;

    // Loads every index once and logs the outcome. Failures are warnings only.
    void probe_all() const;

    // Markdown listing of all sources
    std::string describe() const;

private:
    const std::vector<DocSource>& sources_;
    const ResourceFetcher& fetcher_;
};

} // namespace docgate

#endif // DOCGATE_DOCS_SOURCE_REGISTRY_HPP
