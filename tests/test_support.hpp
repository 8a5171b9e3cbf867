#ifndef WEBSWARM_TESTS_TEST_SUPPORT_HPP
#define WEBSWARM_TESTS_TEST_SUPPORT_HPP

#include <webswarm/core/http_client.hpp>
#include <webswarm/core/error.hpp>
#include <webswarm/core/logger.hpp>
#include <webswarm/swarm/oracle.hpp>
#include <webswarm/ai/ai.hpp>

#include <cstdlib>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

namespace {

int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  std::cout.flush();
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

int finish() {
  std::cout << "\n" << g_tests_passed << "/" << g_tests_run << " tests passed\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}

void quiet_logs() {
  webswarm::Logger::instance().set_level(webswarm::LogLevel::ERROR);
}

// ============================================================================
// Scripted HTTP transport
// ============================================================================

struct FakeRequest {
  std::string method;  // GET, POST or STREAM
  std::string url;
  std::string body;
  webswarm::HttpHeaders headers;
  long timeout_ms;

  FakeRequest() : timeout_ms(0) {}

  bool ends_with(const std::string& suffix) const {
    return url.size() >= suffix.size() &&
           url.compare(url.size() - suffix.size(), suffix.size(), suffix) == 0;
  }

  std::string header(const std::string& name) const {
    webswarm::HttpHeaders::const_iterator it = headers.find(name);
    return it == headers.end() ? std::string() : it->second;
  }

  webswarm::Json json() const { return webswarm::parse_json_lenient(body); }
};

webswarm::HttpResponse respond(long status, const std::string& body,
                               const std::string& content_type = "application/json") {
  webswarm::HttpResponse r;
  r.status_code = status;
  r.body = body;
  if (!content_type.empty()) r.headers["content-type"] = content_type;
  return r;
}

webswarm::HttpResponse respond_json(long status, const webswarm::Json& body) {
  return respond(status, body.dump());
}

webswarm::HttpResponse refused() {
  webswarm::HttpResponse r;
  r.error = "Connection refused";
  return r;
}

webswarm::HttpResponse timed_out() {
  webswarm::HttpResponse r;
  r.error = "Operation timed out";
  r.timed_out = true;
  return r;
}

// Every call goes through `handler`; the default refuses the connection.
// Streamed bodies are delivered in chunks of `chunk_size` bytes.
class FakeHttp : public webswarm::HttpTransport {
public:
  typedef std::function<webswarm::HttpResponse(const FakeRequest&)> Handler;

  FakeHttp() : chunk_size(7) {}

  Handler handler;
  size_t chunk_size;

  webswarm::HttpResponse get(const std::string& url, const webswarm::HttpHeaders& headers,
                             long timeout_ms) {
    return dispatch("GET", url, "", headers, timeout_ms);
  }

  webswarm::HttpResponse post_json(const std::string& url, const std::string& body,
                                   const webswarm::HttpHeaders& headers, long timeout_ms) {
    return dispatch("POST", url, body, headers, timeout_ms);
  }

  webswarm::HttpResponse get_stream(const std::string& url, const webswarm::HttpHeaders& headers,
                                    long timeout_ms, const webswarm::ChunkCallback& on_chunk) {
    webswarm::HttpResponse full = dispatch("STREAM", url, "", headers, timeout_ms);
    if (full.transport_failed()) return full;

    webswarm::HttpResponse r = full;
    r.body.clear();
    for (size_t pos = 0; pos < full.body.size(); pos += chunk_size) {
      std::string chunk = full.body.substr(pos, chunk_size);
      r.body += chunk;
      if (!on_chunk(chunk)) break;
    }
    return r;
  }

  std::vector<FakeRequest> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_;
  }

  size_t count(const std::string& method, const std::string& suffix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (size_t i = 0; i < log_.size(); ++i) {
      if (log_[i].method == method && log_[i].ends_with(suffix)) ++n;
    }
    return n;
  }

private:
  webswarm::HttpResponse dispatch(const std::string& method, const std::string& url,
                                  const std::string& body, const webswarm::HttpHeaders& headers,
                                  long timeout_ms) {
    FakeRequest req;
    req.method = method;
    req.url = url;
    req.body = body;
    req.headers = headers;
    req.timeout_ms = timeout_ms;

    Handler h;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      log_.push_back(req);
      h = handler;
    }
    return h ? h(req) : refused();
  }

  mutable std::mutex mutex_;
  std::vector<FakeRequest> log_;
};

// ============================================================================
// Oracles
// ============================================================================

class FakePlanner : public webswarm::PlanningOracle {
public:
  FakePlanner() : fail(false), calls(0) {}

  webswarm::Json response;
  bool fail;
  int calls;

  webswarm::Json plan(const std::string& instruction) {
    (void)instruction;
    ++calls;
    if (fail) throw webswarm::SwarmError(webswarm::ErrorKind::ORACLE, "planner offline");
    return response;
  }
};

class FakeSynthesizer : public webswarm::SynthesisOracle {
public:
  FakeSynthesizer() : fail(false), calls(0) {}

  std::string answer;
  bool fail;
  int calls;
  webswarm::SynthesisRequest last;

  std::string synthesize(const webswarm::SynthesisRequest& request) {
    ++calls;
    last = request;
    if (fail) throw webswarm::SwarmError(webswarm::ErrorKind::ORACLE, "synthesis offline");
    return answer;
  }
};

// ============================================================================
// Reasoning provider
// ============================================================================

// Replays scripted replies and records every conversation it was sent
class ScriptedAI : public webswarm::AIProvider {
public:
  ScriptedAI() : configured(true), next(0) {}

  bool configured;
  std::vector<webswarm::CompletionResult> replies;
  std::vector<std::vector<webswarm::ConversationMessage> > conversations;
  std::vector<webswarm::CompletionOptions> options;
  size_t next;

  void say(const std::string& text) { replies.push_back(webswarm::CompletionResult::ok(text)); }

  std::string provider_id() const { return "scripted"; }
  std::string default_model() const { return "scripted-1"; }
  bool is_configured() const { return configured; }

  webswarm::CompletionResult complete(const std::string& prompt, const webswarm::CompletionOptions& opts) {
    std::vector<webswarm::ConversationMessage> messages;
    messages.push_back(webswarm::ConversationMessage::user(prompt));
    return chat(messages, opts);
  }

  webswarm::CompletionResult chat(const std::vector<webswarm::ConversationMessage>& messages, const webswarm::CompletionOptions& opts) {
    conversations.push_back(messages);
    options.push_back(opts);
    if (replies.empty()) return webswarm::CompletionResult::fail("no script");
    webswarm::CompletionResult r = replies[next < replies.size() ? next : replies.size() - 1];
    ++next;
    return r;
  }
};

}  // namespace

#endif  // WEBSWARM_TESTS_TEST_SUPPORT_HPP
