#ifndef WEBSWARM_GATEWAY_API_HPP
#define WEBSWARM_GATEWAY_API_HPP

#include "../core/json.hpp"
#include <string>

namespace webswarm {

// Transport-independent HTTP reply produced by the request handlers
struct ApiResponse {
    int status;
    Json body;

    ApiResponse() : status(200), body(Json::object()) {}
    ApiResponse(int s, const Json& b) : status(s), body(b) {}

    static ApiResponse error(int status, const std::string& message) {
        Json b = Json::object();
        b["status"] = "error";
        b["error"] = message;
        return ApiResponse(status, b);
    }
};

} // namespace webswarm

#endif // WEBSWARM_GATEWAY_API_HPP
