/*
 * webswarm - Browser automation protocol client
 *
 * JSON-RPC 2.0 over HTTP against a browser-control server (Model Context
 * Protocol, streamable HTTP transport). Replies may come back as
 *   - a plain JSON body,
 *   - a text/event-stream body carrying the response as a data: event,
 *   - 202 Accepted, in which case the response is pushed later on a GET
 *     event stream of the same endpoint.
 *
 * The server may hand out a session id (Mcp-Session-Id header) which is
 * sent back on every later request. An expired session is re-established
 * once and the call retried once; anything after that is a normal failure.
 */
#ifndef WEBSWARM_MCP_MCP_CLIENT_HPP
#define WEBSWARM_MCP_MCP_CLIENT_HPP

#include "../core/http_client.hpp"
#include "../core/error.hpp"
#include "../core/json.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <atomic>
#include <cstdint>

namespace webswarm {

// Catalog entry advertised by the server
struct OperationInfo {
    std::string name;
    std::string description;
    Json input_schema;

    OperationInfo() : input_schema(Json::object()) {}
    OperationInfo(const std::string& n, const std::string& d, const Json& schema)
        : name(n), description(d), input_schema(schema) {}
};

struct ImageAttachment {
    std::string mime_type;
    std::string data;  // decoded bytes
};

// Normalized outcome of one operation call
struct OperationResult {
    bool success;
    std::vector<std::string> texts;
    std::vector<ImageAttachment> images;
    std::string error;
    ErrorKind error_kind;

    OperationResult() : success(false), error_kind(ErrorKind::NONE) {}

    static OperationResult ok() {
        OperationResult r;
        r.success = true;
        return r;
    }

    static OperationResult fail(ErrorKind kind, const std::string& error) {
        OperationResult r;
        r.success = false;
        r.error_kind = kind;
        r.error = error;
        return r;
    }

    // Text segments joined with newlines
    std::string text() const;
    bool has_images() const { return !images.empty(); }
};

struct McpOptions {
    std::string path;            // appended to the server url
    long timeout_ms;
    std::string client_name;
    std::string client_version;

    McpOptions()
        : path("/mcp")
        , timeout_ms(60000)
        , client_name("webswarm-worker")
        , client_version("1.0.0") {}
};

class McpClient {
public:
    static const char* PROTOCOL_VERSION;

    // The transport must outlive the client
    McpClient(HttpTransport& http, const std::string& server_url,
              const McpOptions& opts = McpOptions());

    // Handshake and catalog fetch. Returns false when the handshake failed;
    // the built-in catalog is loaded in that case (and when the catalog
    // request fails) so operations() is never empty.
    bool connect();

    // Never throws; every failure ends up in the result's error
    OperationResult call_operation(const std::string& name, const Json& arguments);

    std::vector<OperationInfo> operations() const;
    bool connected() const;
    std::string session_id() const;
    std::string endpoint() const { return endpoint_; }

    // Forget the session; the next call re-handshakes
    void disconnect();

    // navigate / click / type / snapshot
    static std::vector<OperationInfo> fallback_catalog();

private:
    McpClient(const McpClient&);
    McpClient& operator=(const McpClient&);

    struct RpcReply {
        bool ok;
        Json result;
        std::string error;
        ErrorKind kind;
        bool session_expired;

        RpcReply() : ok(false), result(Json::object()), kind(ErrorKind::NONE), session_expired(false) {}

        static RpcReply failure(ErrorKind k, const std::string& e, bool expired = false) {
            RpcReply r;
            r.kind = k;
            r.error = e;
            r.session_expired = expired;
            return r;
        }
    };

    RpcReply handshake();
    RpcReply send_request(const std::string& method, const Json& params);
    RpcReply request_with_reconnect(const std::string& method, const Json& params);
    void send_notification(const std::string& method, const Json& params);
    RpcReply await_pushed(int64_t id);
    RpcReply interpret(const Json& message) const;
    bool find_reply(const Json& message, int64_t id, RpcReply& out) const;
    OperationResult normalize(const Json& result) const;
    HttpHeaders request_headers(const std::string& accept) const;
    void remember_session(const HttpResponse& resp);

    HttpTransport& http_;
    std::string endpoint_;
    McpOptions opts_;
    std::atomic<int64_t> next_id_;

    mutable std::mutex mutex_;
    std::string session_id_;
    std::vector<OperationInfo> catalog_;
    bool connected_;
};

} // namespace webswarm

#endif // WEBSWARM_MCP_MCP_CLIENT_HPP
