#include <docgate/docs/allowlist.hpp>
#include <docgate/docs/url.hpp>
#include <docgate/core/logger.hpp>
#include <docgate/core/utils.hpp>

namespace docgate {

const char* const AllowlistPolicy::WILDCARD = "*";

std::string allowlist_entry_host(const std::string& entry) {
    std::string e = trim(entry);
    if (e.empty()) return "";

    if (e.find("://") != std::string::npos) {
        Url u;
        return parse_url(e, u) ? u.host : "";
    }

    // Bare host, possibly with a port or path
    size_t slash = e.find('/');
    if (slash != std::string::npos) {
        e = e.substr(0, slash);
    }
    return normalize_host(e);
}

AllowlistPolicy::AllowlistPolicy() : mode_(ALLOW_LIST) {}

AllowlistPolicy::AllowlistPolicy(Mode mode, const std::set<std::string>& hosts)
    : mode_(mode), hosts_(hosts) {}

AllowlistPolicy AllowlistPolicy::allow_all() {
    return AllowlistPolicy(ALLOW_ALL, std::set<std::string>());
}

AllowlistPolicy AllowlistPolicy::allow_hosts(const std::set<std::string>& hosts) {
    std::set<std::string> normalized;
    for (std::set<std::string>::const_iterator it = hosts.begin(); it != hosts.end(); ++it) {
        std::string h = normalize_host(*it);
        if (!h.empty()) normalized.insert(h);
    }
    return AllowlistPolicy(ALLOW_LIST, normalized);
}

AllowlistPolicy AllowlistPolicy::build(const std::vector<DocSource>& sources,
                                       const std::vector<std::string>& extra_domains) {
    std::set<std::string> hosts;

    for (size_t i = 0; i < sources.size(); ++i) {
        if (!sources[i].is_remote()) continue;
        Url u;
        if (parse_url(sources[i].location, u)) {
            hosts.insert(u.host);
        } else {
            LOG_WARN("Doc source '%s' has an unparseable URL: %s",
                     sources[i].name.c_str(), sources[i].location.c_str());
        }
    }

    bool wildcard = false;
    for (size_t i = 0; i < extra_domains.size(); ++i) {
        if (trim(extra_domains[i]) == WILDCARD) {
            wildcard = true;
            continue;
        }
        std::string host = allowlist_entry_host(extra_domains[i]);
        if (host.empty()) {
            LOG_WARN("Ignoring invalid allowed domain '%s'", extra_domains[i].c_str());
            continue;
        }
        hosts.insert(host);
    }

    if (wildcard) {
        return allow_all();
    }
    return AllowlistPolicy(ALLOW_LIST, hosts);
}

bool AllowlistPolicy::is_allowed(const std::string& host) const {
    switch (mode_) {
        case ALLOW_ALL:
            return true;
        case ALLOW_LIST: {
            std::string h = normalize_host(host);
            return !h.empty() && hosts_.count(h) > 0;
        }
    }
    return false;
}

std::string AllowlistPolicy::describe() const {
    if (mode_ == ALLOW_ALL) return WILDCARD;
    if (hosts_.empty()) return "(none)";
    return join(std::vector<std::string>(hosts_.begin(), hosts_.end()), ", ");
}

} // namespace docgate
