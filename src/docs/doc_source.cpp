#include <docgate/docs/doc_source.hpp>
#include <docgate/docs/url.hpp>
#include <docgate/core/utils.hpp>
#include <docgate/core/logger.hpp>

namespace docgate {

bool DocSource::is_remote() const {
    return is_http_url(location);
}

std::string normalize_local_location(const std::string& location) {
    std::string path = trim(location);
    if (starts_with(to_lower(path), "file://")) {
        path = path.substr(7);
    }
    return absolute_path(path);
}

DocSource make_doc_source(const std::string& name,
                          const std::string& location,
                          const std::string& description) {
    DocSource src;
    src.description = trim(description);

    std::string loc = trim(location);
    if (is_http_url(loc)) {
        src.location = loc;
        Url u;
        if (name.empty() && parse_url(loc, u)) {
            src.name = u.origin() + "/";
        }
    } else {
        src.location = normalize_local_location(loc);
        if (name.empty()) {
            src.name = src.location;
        }
    }

    if (!name.empty()) {
        src.name = trim(name);
    }
    return src;
}

bool doc_sources_from_json(const Json& list, std::vector<DocSource>& out, std::string& error) {
    if (!list.is_array()) {
        error = "doc sources must be a JSON array";
        return false;
    }

    const std::vector<Json>& items = list.as_array();
    for (size_t i = 0; i < items.size(); ++i) {
        const Json& item = items[i];
        if (!item.is_object()) {
            error = "doc source #" + std::to_string(i) + " is not an object";
            return false;
        }
        std::string location = trim(item.get_string("llms_txt"));
        if (location.empty()) {
            error = "doc source #" + std::to_string(i) + " has no \"llms_txt\" location";
            return false;
        }
        // Repeated entries are kept so the tool name collision is reported
        out.push_back(make_doc_source(item.get_string("name"), location,
                                      item.get_string("description")));
    }
    return true;
}

bool parse_source_argument(const std::string& arg, DocSource& out) {
    std::string entry = trim(arg);
    if (entry.empty()) return false;

    size_t colon = entry.find(':');
    if (colon != std::string::npos && !is_http_url(entry) &&
        !starts_with(to_lower(entry), "file://")) {
        std::string name = entry.substr(0, colon);
        std::string location = entry.substr(colon + 1);
        if (trim(location).empty()) return false;
        out = make_doc_source(name, location);
        return true;
    }

    out = make_doc_source("", entry);
    return true;
}

void append_unique(std::vector<DocSource>& sources, const DocSource& src) {
    for (size_t i = 0; i < sources.size(); ++i) {
        if (sources[i] == src) {
            LOG_DEBUG("Skipping duplicate doc source '%s'", src.name.c_str());
            return;
        }
    }
    sources.push_back(src);
}

} // namespace docgate
