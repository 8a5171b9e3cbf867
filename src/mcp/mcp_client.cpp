#include <webswarm/mcp/mcp_client.hpp>
#include <webswarm/mcp/sse.hpp>
#include <webswarm/core/logger.hpp>
#include <webswarm/core/utils.hpp>

namespace webswarm {

const char* McpClient::PROTOCOL_VERSION = "2024-11-05";

namespace {

bool id_matches(const Json& message, int64_t id) {
    if (!message.is_object() || !message.contains("id")) return false;
    const Json& mid = message["id"];
    if (mid.is_number_integer() || mid.is_number_unsigned()) {
        return mid.get<int64_t>() == id;
    }
    if (mid.is_string()) {
        return mid.get<std::string>() == std::to_string(id);
    }
    return false;
}

Json object_schema(const Json& properties, const Json& required) {
    Json schema = Json::object();
    schema["type"] = "object";
    schema["properties"] = properties;
    if (!required.empty()) schema["required"] = required;
    return schema;
}

Json string_prop(const std::string& description) {
    Json p = Json::object();
    p["type"] = "string";
    p["description"] = description;
    return p;
}

} // namespace

std::string OperationResult::text() const {
    return join(texts, "\n");
}

McpClient::McpClient(HttpTransport& http, const std::string& server_url, const McpOptions& opts)
    : http_(http)
    , opts_(opts)
    , next_id_(1)
    , connected_(false) {
    std::string base = server_url;
    while (!base.empty() && base[base.size() - 1] == '/') {
        base.erase(base.size() - 1);
    }
    endpoint_ = base + opts_.path;
}

// ============================================================================
// Connection
// ============================================================================

bool McpClient::connect() {
    RpcReply init = handshake();
    if (!init.ok) {
        LOG_ERROR("Failed to initialize MCP connection to %s: %s", endpoint_.c_str(), init.error.c_str());
        std::lock_guard<std::mutex> lock(mutex_);
        catalog_ = fallback_catalog();
        return false;
    }

    RpcReply tools = request_with_reconnect("tools/list", Json::object());
    std::vector<OperationInfo> loaded;
    if (tools.ok && tools.result.contains("tools") && tools.result["tools"].is_array()) {
        const Json& list = tools.result["tools"];
        for (size_t i = 0; i < list.size(); ++i) {
            const Json& t = list[i];
            std::string name = json_string(t, "name");
            if (name.empty()) continue;
            Json schema = (t.contains("inputSchema") && t["inputSchema"].is_object())
                ? t["inputSchema"] : Json::object();
            loaded.push_back(OperationInfo(name, json_string(t, "description"), schema));
        }
    }

    if (loaded.empty()) {
        LOG_WARN("MCP catalog unavailable (%s), using built-in operations",
                 tools.ok ? "empty tool list" : tools.error.c_str());
        loaded = fallback_catalog();
    } else {
        LOG_INFO("Loaded %zu tools from MCP server", loaded.size());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    catalog_ = loaded;
    return true;
}

McpClient::RpcReply McpClient::handshake() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_id_.clear();
        connected_ = false;
    }

    Json client_info = Json::object();
    client_info["name"] = opts_.client_name;
    client_info["version"] = opts_.client_version;

    Json params = Json::object();
    params["protocolVersion"] = PROTOCOL_VERSION;
    params["capabilities"] = Json::object();
    params["clientInfo"] = client_info;

    RpcReply reply = send_request("initialize", params);
    if (!reply.ok) {
        return reply;
    }

    std::string server_name = "unknown";
    if (reply.result.contains("serverInfo")) {
        server_name = json_string(reply.result["serverInfo"], "name", server_name);
    }
    std::string session = session_id();
    LOG_INFO("MCP initialized: server=%s session=%s", server_name.c_str(),
             session.empty() ? "(none)" : session.c_str());

    send_notification("notifications/initialized", Json::object());

    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = true;
    return reply;
}

void McpClient::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    session_id_.clear();
    connected_ = false;
}

// ============================================================================
// Operations
// ============================================================================

OperationResult McpClient::call_operation(const std::string& name, const Json& arguments) {
    try {
        if (!connected()) {
            RpcReply init = handshake();
            if (!init.ok) {
                // Servers without a working handshake may still serve calls
                LOG_WARN("MCP handshake failed (%s), calling %s without a session",
                         init.error.c_str(), name.c_str());
            }
        }

        Json params = Json::object();
        params["name"] = name;
        params["arguments"] = arguments.is_object() ? arguments : Json::object();

        RpcReply reply = request_with_reconnect("tools/call", params);
        if (!reply.ok) {
            LOG_WARN("Tool %s failed: %s", name.c_str(), reply.error.c_str());
            return OperationResult::fail(reply.kind, reply.error);
        }
        return normalize(reply.result);
    } catch (const std::exception& e) {
        LOG_ERROR("Tool execution error: %s", e.what());
        return OperationResult::fail(ErrorKind::PROTOCOL, std::string("Error executing tool: ") + e.what());
    }
}

OperationResult McpClient::normalize(const Json& result) const {
    OperationResult out = OperationResult::ok();

    if (result.is_object() && result.contains("content") && result["content"].is_array()) {
        const Json& content = result["content"];
        for (size_t i = 0; i < content.size(); ++i) {
            const Json& item = content[i];
            std::string type = json_string(item, "type");
            if (type == "text") {
                out.texts.push_back(json_string(item, "text"));
            } else if (type == "image") {
                ImageAttachment img;
                img.mime_type = json_string(item, "mimeType", "image/png");
                if (!base64_decode(json_string(item, "data"), img.data)) {
                    out.success = false;
                    out.error_kind = ErrorKind::PROTOCOL;
                    out.error = "Failed to decode " + img.mime_type + " attachment";
                    continue;
                }
                out.images.push_back(img);
            } else if (type == "resource" && item.contains("resource")) {
                std::string text = json_string(item["resource"], "text");
                if (!text.empty()) out.texts.push_back(text);
            }
        }
    } else if (!result.is_null() && !(result.is_object() && result.empty())) {
        out.texts.push_back(result.dump());
    }

    if (json_bool(result, "isError")) {
        out.success = false;
        out.error_kind = ErrorKind::PROTOCOL;
        out.error = out.texts.empty() ? "Operation reported an error" : out.text();
    }
    return out;
}

std::vector<OperationInfo> McpClient::operations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return catalog_;
}

bool McpClient::connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

std::string McpClient::session_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_id_;
}

std::vector<OperationInfo> McpClient::fallback_catalog() {
    std::vector<OperationInfo> ops;

    Json nav = Json::object();
    nav["url"] = string_prop("URL to navigate to");
    ops.push_back(OperationInfo("browser_navigate", "Navigate to a URL",
                                object_schema(nav, Json::array({"url"}))));

    Json click = Json::object();
    click["element"] = string_prop("Element description");
    click["ref"] = string_prop("Element reference");
    ops.push_back(OperationInfo("browser_click", "Click on an element",
                                object_schema(click, Json::array({"element", "ref"}))));

    Json type = Json::object();
    type["element"] = string_prop("Element description");
    type["ref"] = string_prop("Element reference");
    type["text"] = string_prop("Text to type");
    ops.push_back(OperationInfo("browser_type", "Type text into an element",
                                object_schema(type, Json::array({"element", "ref", "text"}))));

    ops.push_back(OperationInfo("browser_snapshot", "Get accessibility snapshot of the page",
                                object_schema(Json::object(), Json::array())));
    return ops;
}

// ============================================================================
// JSON-RPC plumbing
// ============================================================================

HttpHeaders McpClient::request_headers(const std::string& accept) const {
    HttpHeaders headers;
    headers["Accept"] = accept;
    std::string session = session_id();
    if (!session.empty()) {
        headers["Mcp-Session-Id"] = session;
    }
    return headers;
}

void McpClient::remember_session(const HttpResponse& resp) {
    std::string session = resp.header("mcp-session-id");
    if (session.empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if (session != session_id_) {
        LOG_DEBUG("MCP session id: %s", session.c_str());
        session_id_ = session;
    }
}

McpClient::RpcReply McpClient::request_with_reconnect(const std::string& method, const Json& params) {
    RpcReply reply = send_request(method, params);
    if (!reply.session_expired) {
        return reply;
    }

    LOG_WARN("MCP session expired during %s, re-initializing", method.c_str());
    RpcReply init = handshake();
    if (!init.ok) {
        return RpcReply::failure(init.kind, "session expired and reconnect failed: " + init.error);
    }

    // Single retry; a second expiry is reported like any other failure
    reply = send_request(method, params);
    reply.session_expired = false;
    return reply;
}

McpClient::RpcReply McpClient::send_request(const std::string& method, const Json& params) {
    int64_t id = next_id_++;

    Json envelope = Json::object();
    envelope["jsonrpc"] = "2.0";
    envelope["id"] = id;
    envelope["method"] = method;
    envelope["params"] = params;

    bool had_session = !session_id().empty();
    HttpResponse resp = http_.post_json(endpoint_, envelope.dump(),
                                        request_headers("application/json, text/event-stream"),
                                        opts_.timeout_ms);

    if (resp.transport_failed()) {
        return RpcReply::failure(ErrorKind::TRANSPORT, "MCP request error: " + resp.error);
    }
    remember_session(resp);

    if (resp.status_code == 404 && had_session) {
        return RpcReply::failure(ErrorKind::PROTOCOL, "session not found (HTTP 404)", true);
    }
    if (resp.status_code == 202) {
        return await_pushed(id);
    }
    if (!resp.ok()) {
        return RpcReply::failure(ErrorKind::PROTOCOL,
                                 "MCP request failed: HTTP " + std::to_string(resp.status_code));
    }

    RpcReply reply;
    if (to_lower(resp.header("content-type")).find("text/event-stream") != std::string::npos) {
        std::vector<SseEvent> events = parse_sse(resp.body);
        for (size_t i = 0; i < events.size(); ++i) {
            Json message = parse_json_lenient(events[i].data);
            if (!message.is_discarded() && find_reply(message, id, reply)) {
                return reply;
            }
        }
        return RpcReply::failure(ErrorKind::PROTOCOL,
                                 "event stream carried no response for request " + std::to_string(id));
    }

    Json body = resp.json();
    if (body.is_discarded()) {
        return RpcReply::failure(ErrorKind::PROTOCOL, "malformed JSON-RPC response");
    }
    if (find_reply(body, id, reply)) {
        return reply;
    }
    if (body.is_object() && (body.contains("result") || body.contains("error"))) {
        return interpret(body);
    }
    return RpcReply::failure(ErrorKind::PROTOCOL, "response does not match request " + std::to_string(id));
}

void McpClient::send_notification(const std::string& method, const Json& params) {
    Json envelope = Json::object();
    envelope["jsonrpc"] = "2.0";
    envelope["method"] = method;
    envelope["params"] = params;

    HttpResponse resp = http_.post_json(endpoint_, envelope.dump(),
                                        request_headers("application/json, text/event-stream"),
                                        opts_.timeout_ms);
    if (resp.transport_failed()) {
        LOG_WARN("Failed to send notification %s: %s", method.c_str(), resp.error.c_str());
    } else if (!resp.ok()) {
        LOG_WARN("Notification %s answered with HTTP %ld", method.c_str(), resp.status_code);
    }
}

McpClient::RpcReply McpClient::await_pushed(int64_t id) {
    SseParser parser;
    RpcReply reply;
    bool found = false;

    HttpResponse resp = http_.get_stream(endpoint_, request_headers("text/event-stream"), opts_.timeout_ms,
        [this, &parser, &reply, &found, id](const std::string& chunk) {
            std::vector<SseEvent> events = parser.feed(chunk);
            for (size_t i = 0; i < events.size(); ++i) {
                Json message = parse_json_lenient(events[i].data);
                if (!message.is_discarded() && find_reply(message, id, reply)) {
                    found = true;
                    return false;
                }
            }
            return true;
        });

    if (!found) {
        std::vector<SseEvent> rest = parser.finish();
        for (size_t i = 0; i < rest.size() && !found; ++i) {
            Json message = parse_json_lenient(rest[i].data);
            found = !message.is_discarded() && find_reply(message, id, reply);
        }
    }
    if (found) {
        return reply;
    }

    if (resp.timed_out) {
        return RpcReply::failure(ErrorKind::TRANSPORT,
                                 "timed out waiting for pushed response to request " + std::to_string(id));
    }
    if (resp.transport_failed()) {
        return RpcReply::failure(ErrorKind::TRANSPORT, "event stream error: " + resp.error);
    }
    if (resp.status_code == 404) {
        return RpcReply::failure(ErrorKind::PROTOCOL, "session not found (HTTP 404)", !session_id().empty());
    }
    return RpcReply::failure(ErrorKind::PROTOCOL,
                             "event stream ended without a response for request " + std::to_string(id));
}

bool McpClient::find_reply(const Json& message, int64_t id, RpcReply& out) const {
    if (message.is_array()) {
        for (size_t i = 0; i < message.size(); ++i) {
            if (id_matches(message[i], id)) {
                out = interpret(message[i]);
                return true;
            }
        }
        return false;
    }
    if (id_matches(message, id)) {
        out = interpret(message);
        return true;
    }
    return false;
}

McpClient::RpcReply McpClient::interpret(const Json& message) const {
    if (message.contains("error") && !message["error"].is_null()) {
        const Json& err = message["error"];
        std::string text = err.is_object() ? json_string(err, "message") : std::string();
        if (text.empty()) text = err.dump();
        bool expired = to_lower(text).find("session not found") != std::string::npos;
        return RpcReply::failure(ErrorKind::PROTOCOL, "MCP error: " + text, expired);
    }

    RpcReply reply;
    reply.ok = true;
    if (message.contains("result") && !message["result"].is_null()) {
        reply.result = message["result"];
    }
    return reply;
}

} // namespace webswarm
