#include <webswarm/core/config.hpp>
#include <webswarm/core/logger.hpp>
#include <webswarm/core/utils.hpp>
#include <fstream>
#include <cstdlib>

namespace webswarm {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream f(path.c_str());
    if (!f.is_open()) return false;

    std::string content((std::istreambuf_iterator<char>(f)),
                        std::istreambuf_iterator<char>());
    return load_string(content);
}

bool Config::load_string(const std::string& json_str) {
    Json parsed = parse_json_lenient(json_str);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return false;
    }
    data_ = parsed;
    return true;
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &data_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object() || !node->contains(parts[i])) {
            return nullptr;
        }
        node = &(*node)[parts[i]];
    }
    return node;
}

std::string Config::to_env_key(const std::string& key) {
    return "WEBSWARM_" + to_upper(replace_all(key, ".", "_"));
}

bool Config::env_value(const std::string& key, std::string& out) {
    const char* v = std::getenv(to_env_key(key).c_str());
    if (!v || !v[0]) return false;
    out = v;
    return true;
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    const Json* node = find(key);
    if (node && node->is_string()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return node->get<std::string>();
    }

    std::string env;
    if (env_value(key, env)) {
        LOG_DEBUG("Config: key '%s' taken from %s", key.c_str(), to_env_key(key).c_str());
        return env;
    }

    LOG_DEBUG("Config: key '%s' not found", key.c_str());
    return def;
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    const Json* node = find(key);
    if (node && node->is_number()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return node->get<int64_t>();
    }

    std::string env;
    if (env_value(key, env)) {
        char* end = nullptr;
        long long v = std::strtoll(env.c_str(), &end, 10);
        if (end && *end == '\0') {
            return static_cast<int64_t>(v);
        }
        LOG_WARN("Config: ignoring non-numeric %s='%s'", to_env_key(key).c_str(), env.c_str());
    }
    return def;
}

bool Config::get_bool(const std::string& key, bool def) const {
    const Json* node = find(key);
    if (node && node->is_boolean()) {
        LOG_DEBUG("Config: found key '%s'", key.c_str());
        return node->get<bool>();
    }

    std::string env;
    if (env_value(key, env)) {
        std::string v = to_lower(env);
        return v == "1" || v == "true" || v == "yes" || v == "on";
    }
    return def;
}

const Json& Config::data() const { return data_; }

} // namespace webswarm
