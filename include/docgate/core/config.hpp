#ifndef DOCGATE_CORE_CONFIG_HPP
#define DOCGATE_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <vector>

namespace docgate {

// JSON configuration document. Keys may use dot notation ("fetch.timeout")
// to reach into nested objects.
class Config {
public:
    Config();

    bool load_file(const std::string& path);
    bool load_string(const std::string& json_str);

    // Reason for the last failed load
    const std::string& error() const { return error_; }

    bool has(const std::string& key) const;

    std::string get_string(const std::string& key, const std::string& def = "") const;
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    double get_double(const std::string& key, double def = 0.0) const;
    bool get_bool(const std::string& key, bool def = false) const;

    // A string is returned as a one-element list
    std::vector<std::string> get_string_list(const std::string& key) const;

    const Json& get_section(const std::string& key) const;

    const Json& data() const { return data_; }

private:
    Json data_;
    std::string error_;

    const Json& lookup(const std::string& key) const;
};

} // namespace docgate

#endif // DOCGATE_CORE_CONFIG_HPP
