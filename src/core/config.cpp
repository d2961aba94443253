#include <docgate/core/config.hpp>
#include <docgate/core/logger.hpp>
#include <docgate/core/utils.hpp>

namespace docgate {

Config::Config() {}

bool Config::load_file(const std::string& path) {
    std::string content;
    if (!read_file(path, content)) {
        error_ = "cannot read " + path;
        return false;
    }
    if (!load_string(content)) {
        error_ = path + ": " + error_;
        return false;
    }
    return true;
}

bool Config::load_string(const std::string& json_str) {
    try {
        data_ = Json::parse(json_str);
    } catch (const JsonParseError& e) {
        error_ = e.what();
        return false;
    }
    error_.clear();
    return true;
}

const Json& Config::lookup(const std::string& key) const {
    // Walk "a.b.c" one segment at a time
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        node = &(*node)[parts[i]];
        if (node->is_null()) break;
    }
    return *node;
}

bool Config::has(const std::string& key) const {
    return !lookup(key).is_null();
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json& v = lookup(key);
    if (v.is_string()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return v.as_string();
    }
    return def;
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json& v = lookup(key);
    if (v.is_number()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return v.as_int();
    }
    return def;
}

double Config::get_double(const std::string& key, double def) const {
    const Json& v = lookup(key);
    return v.is_number() ? v.as_number() : def;
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json& v = lookup(key);
    return v.is_bool() ? v.as_bool() : def;
}

std::vector<std::string> Config::get_string_list(const std::string& key) const {
    std::vector<std::string> out;
    const Json& v = lookup(key);
    if (v.is_string()) {
        out.push_back(v.as_string());
        return out;
    }
    const std::vector<Json>& items = v.as_array();
    for (size_t i = 0; i < items.size(); ++i) {
        if (items[i].is_string()) {
            out.push_back(items[i].as_string());
        } else {
            LOG_WARN("Config: ignoring non-string entry %zu in '%s'", i, key.c_str());
        }
    }
    return out;
}

const Json& Config::get_section(const std::string& key) const {
    return lookup(key);
}

} // namespace docgate
