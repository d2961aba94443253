#ifndef DOCGATE_DOCS_ALLOWLIST_HPP
#define DOCGATE_DOCS_ALLOWLIST_HPP

#include <docgate/docs/doc_source.hpp>
#include <string>
#include <set>
#include <vector>

namespace docgate {

// Host allowlist for outbound fetches.
//
// Matching is an exact, case-insensitive comparison of host names. Ports are
// ignored and there is no subdomain matching: allowing "example.com" does
// not allow "docs.example.com". Widening a trusted domain to its subdomains
// would let any host under it serve content, so each host must be named.
class AllowlistPolicy {
public:
    enum Mode {
        ALLOW_LIST,     // only hosts in hosts()
        ALLOW_ALL       // wildcard "*" was configured
    };

    static const char* const WILDCARD;

    // Empty list: denies every host
    AllowlistPolicy();

    static AllowlistPolicy allow_all();
    static AllowlistPolicy allow_hosts(const std::set<std::string>& hosts);

    // Seeds the set with the host of every remote source, then unions the
    // explicit entries. Entries may be bare hosts or URL prefixes
    // ("https://docs.example/"); "*" switches to ALLOW_ALL. Local sources
    // contribute nothing.
    static AllowlistPolicy build(const std::vector<DocSource>& sources,
                                 const std::vector<std::string>& extra_domains);

    // Never throws; false means deny
    bool is_allowed(const std::string& host) const;

    Mode mode() const { return mode_; }
    const std::set<std::string>& hosts() const { return hosts_; }

    // "*" or a comma-separated host list, for messages and logs
    std::string describe() const;

private:
    AllowlistPolicy(Mode mode, const std::set<std::string>& hosts);

    Mode mode_;
    std::set<std::string> hosts_;
};

// Extracts the host from an allowlist entry ("docs.example",
// "https://docs.example/", "docs.example:8443"). Empty if none.
std::string allowlist_entry_host(const std::string& entry);

} // namespace docgate

#endif // DOCGATE_DOCS_ALLOWLIST_HPP
