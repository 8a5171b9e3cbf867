#include "test_support.hpp"

#include <webswarm/mcp/mcp_client.hpp>
#include <webswarm/mcp/sse.hpp>

using namespace webswarm;

namespace {

const char* SERVER = "http://browser:3001/";

Json rpc_result(const Json& id, const Json& result) {
  Json j = Json::object();
  j["jsonrpc"] = "2.0";
  j["id"] = id;
  j["result"] = result;
  return j;
}

Json rpc_error(const Json& id, int code, const std::string& message) {
  Json err = Json::object();
  err["code"] = code;
  err["message"] = message;
  Json j = Json::object();
  j["jsonrpc"] = "2.0";
  j["id"] = id;
  j["error"] = err;
  return j;
}

Json text_content(const std::string& text) {
  Json item = Json::object();
  item["type"] = "text";
  item["text"] = text;
  Json result = Json::object();
  result["content"] = Json::array({item});
  return result;
}

// Minimal streamable-HTTP automation server. Each session is a numbered
// token; expire() invalidates the current one.
struct FakeServer {
  int sessions;
  bool sse_replies;
  bool push_calls;          // answer tools/call with 202 and push over GET
  bool expire_every_call;   // 404 every tools/call
  std::string expiry_style; // "404" or "rpc"
  std::string valid_session;
  Json last_call_id;
  Json tools;
  Json call_result;

  FakeServer()
      : sessions(0)
      , sse_replies(false)
      , push_calls(false)
      , expire_every_call(false)
      , expiry_style("404")
      , tools(Json::array())
      , call_result(text_content("clicked")) {}

  void expire() { valid_session = "gone"; }

  HttpResponse wrap(const Json& message, const std::string& session = "") {
    HttpResponse r;
    if (sse_replies) {
      r = respond(200, "event: message\ndata: " + message.dump() + "\n\n", "text/event-stream");
    } else {
      r = respond_json(200, message);
    }
    if (!session.empty()) r.headers["mcp-session-id"] = session;
    return r;
  }

  HttpResponse handle(const FakeRequest& req) {
    if (req.method == "STREAM") {
      Json note = Json::object({{"jsonrpc", "2.0"}, {"method", "notifications/progress"}});
      std::string body = ": keep-alive\n\n"
                         "event: message\ndata: " + note.dump() + "\n\n"
                         "event: message\ndata: " + rpc_result(last_call_id, call_result).dump() + "\n\n";
      return respond(200, body, "text/event-stream");
    }

    Json msg = req.json();
    std::string method = json_string(msg, "method");
    if (!msg.contains("id")) {
      return respond(202, "", "");
    }
    Json id = msg["id"];

    if (method == "initialize") {
      ++sessions;
      valid_session = "sess-" + std::to_string(sessions);
      Json result = Json::object();
      result["protocolVersion"] = McpClient::PROTOCOL_VERSION;
      result["serverInfo"] = Json::object({{"name", "fake-browser"}});
      return wrap(rpc_result(id, result), valid_session);
    }

    std::string session = req.header("Mcp-Session-Id");
    bool stale = session != valid_session || (expire_every_call && method == "tools/call");
    if (stale) {
      if (expiry_style == "rpc") return respond_json(200, rpc_error(id, -32000, "Session not found"));
      return respond(404, "");
    }

    if (method == "tools/list") {
      return wrap(rpc_result(id, Json::object({{"tools", tools}})));
    }
    if (method == "tools/call") {
      if (push_calls) {
        last_call_id = id;
        return respond(202, "", "");
      }
      return wrap(rpc_result(id, call_result));
    }
    return respond_json(200, rpc_error(id, -32601, "Method not found"));
  }
};

FakeHttp::Handler serve(FakeServer& server) {
  return [&server](const FakeRequest& req) { return server.handle(req); };
}

size_t count_method(const FakeHttp& http, const std::string& method) {
  std::vector<FakeRequest> log = http.requests();
  size_t n = 0;
  for (size_t i = 0; i < log.size(); ++i) {
    if (log[i].method == "POST" && json_string(log[i].json(), "method") == method) ++n;
  }
  return n;
}

// ============================================================================
// SSE parsing
// ============================================================================

void test_sse_parser_chunking() {
  SseParser parser;
  std::vector<SseEvent> events = parser.feed("event: mess");
  expect(events.empty(), "partial line buffered");
  events = parser.feed("age\r\ndata: {\"a\":");
  expect(events.empty(), "event not complete yet");
  events = parser.feed("1}\r\ndata: second line\r\nid: 7\r\n\r\n: comment\n\ndata: x\n");
  expect(events.size() == 1, "one event dispatched on blank line");
  expect(events[0].event == "message", "event name");
  expect(events[0].data == "{\"a\":1}\nsecond line", "multi-line data joined");
  expect(events[0].id == "7", "event id");

  events = parser.finish();
  expect(events.size() == 1 && events[0].data == "x", "trailing event flushed");

  expect(parse_sse(": only a comment\n\n").empty(), "comments produce no events");
}

// ============================================================================
// Connection
// ============================================================================

void test_handshake_and_catalog() {
  FakeHttp http;
  FakeServer server;
  Json tool = Json::object();
  tool["name"] = "browser_navigate";
  tool["description"] = "Navigate";
  tool["inputSchema"] = Json::object({{"type", "object"}});
  server.tools.push_back(tool);
  http.handler = serve(server);

  McpClient client(http, SERVER);
  expect(client.endpoint() == "http://browser:3001/mcp", "endpoint strips trailing slash");
  expect(client.connect(), "connected");
  expect(client.connected(), "connected flag");
  expect(client.session_id() == "sess-1", "session captured from header");

  std::vector<FakeRequest> log = http.requests();
  expect(log.size() == 3, "initialize, initialized, tools/list");
  Json init = log[0].json();
  expect(init["jsonrpc"] == "2.0", "json-rpc envelope");
  expect(init["method"] == "initialize", "initialize first");
  expect(init["params"]["protocolVersion"] == "2024-11-05", "protocol version");
  expect(init["params"]["clientInfo"]["name"] == "webswarm-worker", "client info");
  expect(log[0].header("Accept") == "application/json, text/event-stream", "accept header");
  expect(log[0].header("Mcp-Session-Id").empty(), "no session before handshake");

  Json note = log[1].json();
  expect(note["method"] == "notifications/initialized", "initialized notification");
  expect(!note.contains("id"), "notification has no id");
  expect(log[1].header("Mcp-Session-Id") == "sess-1", "notification carries session");

  std::vector<OperationInfo> ops = client.operations();
  expect(ops.size() == 1 && ops[0].name == "browser_navigate", "catalog from server");
}

void test_fallback_catalog() {
  FakeHttp http;  // nothing listening
  McpClient client(http, SERVER);
  expect(!client.connect(), "handshake fails");
  expect(!client.connected(), "not connected");

  std::vector<OperationInfo> ops = client.operations();
  expect(ops.size() == 4, "built-in catalog loaded");
  expect(ops[0].name == "browser_navigate", "navigate");
  expect(ops[1].name == "browser_click", "click");
  expect(ops[2].name == "browser_type", "type");
  expect(ops[3].name == "browser_snapshot", "snapshot");
  expect(ops[0].input_schema["required"][0] == "url", "navigate needs url");

  // Empty server catalog also falls back
  FakeServer server;
  http.handler = serve(server);
  McpClient second(http, SERVER);
  expect(second.connect(), "handshake ok");
  expect(second.operations().size() == 4, "empty tool list falls back");
}

// ============================================================================
// Calls
// ============================================================================

void test_call_with_json_and_sse_bodies() {
  FakeHttp http;
  FakeServer server;
  http.handler = serve(server);

  McpClient client(http, SERVER);
  client.connect();

  Json args = Json::object({{"element", "Login"}, {"ref", "e12"}});
  OperationResult r = client.call_operation("browser_click", args);
  expect(r.success, "json body call");
  expect(r.text() == "clicked", "text content");

  std::vector<FakeRequest> log = http.requests();
  Json call = log.back().json();
  expect(call["method"] == "tools/call", "tools/call");
  expect(call["params"]["name"] == "browser_click", "operation name");
  expect(call["params"]["arguments"]["ref"] == "e12", "arguments forwarded");

  server.sse_replies = true;
  server.call_result = text_content("from stream");
  r = client.call_operation("browser_snapshot", Json::object());
  expect(r.success && r.text() == "from stream", "event-stream body call");
}

void test_pushed_response_over_stream() {
  FakeHttp http;
  FakeServer server;
  server.push_calls = true;
  server.call_result = text_content("pushed");
  http.handler = serve(server);

  McpOptions opts;
  opts.timeout_ms = 1500;
  McpClient client(http, SERVER, opts);
  client.connect();

  OperationResult r = client.call_operation("browser_snapshot", Json::object());
  expect(r.success, "pushed response received");
  expect(r.text() == "pushed", "pushed text");

  std::vector<FakeRequest> log = http.requests();
  const FakeRequest& stream = log.back();
  expect(stream.method == "STREAM", "event stream opened after 202");
  expect(stream.url == "http://browser:3001/mcp", "same endpoint");
  expect(stream.header("Accept") == "text/event-stream", "stream accept header");
  expect(stream.header("Mcp-Session-Id") == "sess-1", "stream carries session");
  expect(stream.timeout_ms == 1500, "bounded by the call timeout");
}

void test_session_expiry_retried_once() {
  FakeHttp http;
  FakeServer server;
  http.handler = serve(server);

  McpClient client(http, SERVER);
  client.connect();
  server.expire();

  OperationResult r = client.call_operation("browser_snapshot", Json::object());
  expect(r.success, "call succeeds after re-handshake");
  expect(client.session_id() == "sess-2", "new session adopted");
  expect(count_method(http, "initialize") == 2, "one re-handshake");
  expect(count_method(http, "tools/call") == 2, "one retry");

  // Expiry signalled inside a JSON-RPC error
  server.expiry_style = "rpc";
  server.expire();
  r = client.call_operation("browser_snapshot", Json::object());
  expect(r.success, "rpc-level expiry also recovers");
  expect(client.session_id() == "sess-3", "third session");
}

void test_repeated_expiry_not_looped() {
  FakeHttp http;
  FakeServer server;
  server.expire_every_call = true;
  http.handler = serve(server);

  McpClient client(http, SERVER);
  client.connect();
  size_t inits = count_method(http, "initialize");

  OperationResult r = client.call_operation("browser_snapshot", Json::object());
  expect(!r.success, "second expiry fails the call");
  expect(r.error_kind == ErrorKind::PROTOCOL, "protocol failure");
  expect(count_method(http, "initialize") == inits + 1, "exactly one re-handshake");
  expect(count_method(http, "tools/call") == 2, "exactly one retry");
}

void test_result_normalization() {
  FakeHttp http;
  FakeServer server;
  http.handler = serve(server);
  McpClient client(http, SERVER);
  client.connect();

  Json image = Json::object({{"type", "image"}, {"mimeType", "image/jpeg"}, {"data", "aGVsbG8="}});
  Json text = Json::object({{"type", "text"}, {"text", "page title"}});
  server.call_result = Json::object({{"content", Json::array({text, image})}});
  OperationResult r = client.call_operation("browser_take_screenshot", Json::object());
  expect(r.success, "mixed content");
  expect(r.text() == "page title", "text kept");
  expect(r.has_images() && r.images[0].data == "hello", "image decoded to bytes");
  expect(r.images[0].mime_type == "image/jpeg", "mime type kept");

  image["data"] = "abc";
  server.call_result = Json::object({{"content", Json::array({image})}});
  r = client.call_operation("browser_take_screenshot", Json::object());
  expect(!r.success && r.error_kind == ErrorKind::PROTOCOL, "bad base64 is a protocol failure");

  server.call_result = text_content("element not found");
  server.call_result["isError"] = true;
  r = client.call_operation("browser_click", Json::object());
  expect(!r.success, "isError fails the call");
  expect(r.error == "element not found", "error text from content");
}

void test_call_without_server() {
  FakeHttp http;
  McpClient client(http, SERVER);
  OperationResult r = client.call_operation("browser_snapshot", Json::object());
  expect(!r.success, "call fails");
  expect(r.error_kind == ErrorKind::TRANSPORT, "transport failure");
  expect(r.error.find("Connection refused") != std::string::npos, "transport error reported");
  expect(http.count("POST", "/mcp") == 2, "handshake retried, then the call itself sent");
}

void test_call_after_failed_handshake() {
  FakeHttp http;
  http.handler = [](const FakeRequest& req) {
    Json msg = req.json();
    std::string method = json_string(msg, "method");
    if (method == "initialize") return respond(500, "{\"error\":\"boom\"}");
    if (method == "tools/call") {
      expect(req.header("Mcp-Session-Id").empty(), "no session attached");
      return respond_json(200, rpc_result(msg["id"], text_content("navigated")));
    }
    return respond(202, "", "");
  };
  McpClient client(http, SERVER);

  expect(!client.connect(), "handshake fails");
  expect(client.operations().size() == 4, "fallback catalog loaded");

  Json args = Json::object({{"url", "https://stripe.com"}});
  OperationResult r = client.call_operation("browser_navigate", args);
  expect(r.success, "call served without a session");
  expect(r.text() == "navigated", "result text");

  size_t calls = 0;
  std::vector<FakeRequest> log = http.requests();
  for (size_t i = 0; i < log.size(); ++i) {
    if (json_string(log[i].json(), "method") == "tools/call") ++calls;
  }
  expect(calls == 1, "exactly one tools/call sent");
}

}  // namespace

int main() {
  quiet_logs();
  std::cout << "=== Automation Protocol Client Tests ===\n";

  std::cout << "\n[Event stream]\n";
  run_test("SSE parser chunking", test_sse_parser_chunking);

  std::cout << "\n[Connection]\n";
  run_test("handshake and catalog", test_handshake_and_catalog);
  run_test("fallback catalog", test_fallback_catalog);

  std::cout << "\n[Calls]\n";
  run_test("json and sse bodies", test_call_with_json_and_sse_bodies);
  run_test("pushed response over stream", test_pushed_response_over_stream);
  run_test("session expiry retried once", test_session_expiry_retried_once);
  run_test("repeated expiry not looped", test_repeated_expiry_not_looped);
  run_test("result normalization", test_result_normalization);
  run_test("call without server", test_call_without_server);
  run_test("call after failed handshake", test_call_after_failed_handshake);

  return finish();
}
