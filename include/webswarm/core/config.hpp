#ifndef WEBSWARM_CORE_CONFIG_HPP
#define WEBSWARM_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <cstdint>

namespace webswarm {

// JSON-file configuration with dot-notation lookup ("pool.size").
// A key missing from the file falls back to the environment variable
// WEBSWARM_<KEY> (dots become underscores, upper-cased), then to the default.
class Config {
public:
    Config();

    // Load from JSON file
    bool load_file(const std::string& path);

    // Load from JSON string
    bool load_string(const std::string& json_str);

    std::string get_string(const std::string& key, const std::string& def = "") const;

    int64_t get_int(const std::string& key, int64_t def = 0) const;

    bool get_bool(const std::string& key, bool def = false) const;

    // Raw data access
    const Json& data() const;

    // "pool.size" -> "WEBSWARM_POOL_SIZE"
    static std::string to_env_key(const std::string& key);

private:
    Json data_;

    // Walks dot-separated path; returns nullptr if any segment is missing
    const Json* find(const std::string& key) const;
    static bool env_value(const std::string& key, std::string& out);
};

} // namespace webswarm

#endif // WEBSWARM_CORE_CONFIG_HPP
