#include <webswarm/core/json.hpp>

namespace webswarm {

std::string extract_json_block(const std::string& text) {
    size_t fence = text.find("```json");
    if (fence != std::string::npos) {
        size_t start = fence + 7;
        size_t end = text.find("```", start);
        if (end != std::string::npos) {
            std::string inner = text.substr(start, end - start);
            size_t first = inner.find_first_not_of(" \t\r\n");
            size_t last = inner.find_last_not_of(" \t\r\n");
            if (first == std::string::npos) return "";
            return inner.substr(first, last - first + 1);
        }
    }

    size_t open = text.find('{');
    if (open == std::string::npos) return "";

    // Balanced brace scan; braces inside string literals are skipped
    int depth = 0;
    bool in_string = false;
    bool escaped = false;
    for (size_t i = open; i < text.size(); ++i) {
        char c = text[i];
        if (in_string) {
            if (escaped) escaped = false;
            else if (c == '\\') escaped = true;
            else if (c == '"') in_string = false;
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            --depth;
            if (depth == 0) {
                return text.substr(open, i - open + 1);
            }
        }
    }
    return "";
}

std::string json_string(const Json& obj, const std::string& key, const std::string& def) {
    if (obj.is_object() && obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return def;
}

int64_t json_int(const Json& obj, const std::string& key, int64_t def) {
    if (obj.is_object() && obj.contains(key) && obj[key].is_number()) {
        return obj[key].get<int64_t>();
    }
    return def;
}

bool json_bool(const Json& obj, const std::string& key, bool def) {
    if (obj.is_object() && obj.contains(key) && obj[key].is_boolean()) {
        return obj[key].get<bool>();
    }
    return def;
}

} // namespace webswarm
