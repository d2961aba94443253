#include <docgate/docs/source_registry.hpp>
#include <docgate/core/logger.hpp>
#include <sstream>

namespace docgate {

const char* index_error_name(IndexError code) {
    switch (code) {
        case IndexError::NONE: return "None";
        case IndexError::INDEX_UNAVAILABLE: return "IndexUnavailable";
        case IndexError::INDEX_PARSE_ERROR: return "IndexParseError";
    }
    return "Unknown";
}

std::string IndexResult::error_text() const {
    return std::string(index_error_name(code)) + ": " + message;
}

SourceRegistry::SourceRegistry(const std::vector<DocSource>& sources, const ResourceFetcher& fetcher)
    : sources_(sources)
    , fetcher_(fetcher) {
}

const DocSource* SourceRegistry::find(const std::string& name) const {
    for (size_t i = 0; i < sources_.size(); ++i) {
        if (sources_[i].name == name) return &sources_[i];
    }
    return NULL;
}

IndexResult SourceRegistry::load_index(const DocSource& source,
                                       const std::atomic<bool>* cancelled) const {
    RawResource raw;
    FetchResult fetched = fetcher_.fetch_raw(source.location, raw, cancelled);
    if (!fetched.success) {
        return IndexResult::fail(IndexError::INDEX_UNAVAILABLE,
                                 source.location + " (" + fetched.error_text() + ")");
    }

    // Relative links resolve against where the index actually came from
    IndexParseStats stats;
    std::vector<LinkEntry> entries = parse_index(raw.body, raw.location, &stats);
    if (entries.empty()) {
        std::ostringstream oss;
        oss << source.location << " contains no usable links";
        if (stats.skipped > 0) {
            oss << " (" << stats.skipped << " malformed)";
        }
        return IndexResult::fail(IndexError::INDEX_PARSE_ERROR, oss.str());
    }

    if (stats.skipped > 0) {
        LOG_DEBUG("Index %s: skipped %zu malformed links", source.location.c_str(), stats.skipped);
    }

    IndexResult r;
    r.success = true;
    r.entries.swap(entries);
    r.skipped = stats.skipped;
    return r;
}

void SourceRegistry::probe_all() const {
    for (size_t i = 0; i < sources_.size(); ++i) {
        IndexResult r = load_index(sources_[i]);
        if (r.success) {
            LOG_INFO("Source '%s': %zu links from %s", sources_[i].name.c_str(),
                     r.entries.size(), sources_[i].location.c_str());
        } else {
            LOG_WARN("Source '%s': %s", sources_[i].name.c_str(), r.error_text().c_str());
        }
    }
}

std::string SourceRegistry::describe() const {
    std::ostringstream oss;
    oss << "# Documentation sources\n\n";
    for (size_t i = 0; i < sources_.size(); ++i) {
        const DocSource& s = sources_[i];
        oss << "- " << s.name << " (" << (s.is_remote() ? "remote" : "local") << "): "
            << s.location << "\n";
        if (!s.description.empty()) {
            oss << "  " << s.description << "\n";
        }
    }
    return oss.str();
}

} // namespace docgate
