#include "test_support.hpp"

#include <webswarm/agent/browser_agent.hpp>
#include <webswarm/ai/ai_oracle.hpp>
#include <webswarm/ai/claude.hpp>
#include <webswarm/core/config.hpp>
#include <webswarm/core/utils.hpp>
#include <webswarm/mcp/mcp_client.hpp>

#include <set>

using namespace webswarm;

namespace {

// Automation server that answers every operation with "ok <name>", and a
// claim endpoint that approves the first claim per label
FakeHttp::Handler browser_and_claims(std::set<std::string>& taken) {
  return [&taken](const FakeRequest& req) {
    if (req.ends_with("/swarm/claim")) {
      std::string item = normalize_label(json_string(req.json(), "item"));
      bool approved = taken.insert(item).second;
      return respond_json(200, Json::object({{"approved", approved}, {"item", item}}));
    }
    Json msg = req.json();
    if (!msg.contains("id")) return respond(202, "", "");
    Json result = Json::object();
    std::string method = json_string(msg, "method");
    if (method == "tools/call") {
      Json item = Json::object({{"type", "text"}, {"text", "ok " + json_string(msg["params"], "name")}});
      result["content"] = Json::array({item});
    } else if (method == "tools/list") {
      result["tools"] = Json::array();
    }
    HttpResponse r = respond_json(200, Json::object({{"jsonrpc", "2.0"}, {"id", msg["id"]}, {"result", result}}));
    r.headers["mcp-session-id"] = "s1";
    return r;
  };
}

// ============================================================================
// Parsing
// ============================================================================

void test_parse_tool_calls() {
  FakeHttp http;
  McpClient mcp(http, "http://browser:3001");
  ScriptedAI ai;
  BrowserAgent agent(ai, mcp, nullptr);

  std::string response =
      "Let me look.\n"
      "<tool_call name=\"browser_navigate\">\n{\"url\": \"https://www.ycombinator.com\"}\n</tool_call>\n"
      "then\n"
      "<tool_call name=\"browser_snapshot\"></tool_call>\n"
      "<tool_call name=\"browser_click\">{not json}</tool_call>\n"
      "<tool_call name=\"browser_type\">{\"ref\": \"e3\", \"text\": \"Stripe\"}";

  std::vector<ParsedToolCall> calls = agent.parse_tool_calls(response);
  expect(calls.size() == 4, "four tool calls");
  expect(calls[0].tool_name == "browser_navigate" && calls[0].valid, "navigate parsed");
  expect(calls[0].params["url"] == "https://www.ycombinator.com", "navigate params");
  expect(calls[1].valid && calls[1].params.empty(), "empty body is an empty object");
  expect(!calls[2].valid && !calls[2].parse_error.empty(), "bad json flagged");
  expect(calls[3].valid && calls[3].params["text"] == "Stripe", "unterminated call recovered");

  std::string text = agent.extract_response_text(response, calls);
  expect(text.find("Let me look.") == 0, "leading text kept");
  expect(text.find("then") != std::string::npos, "text between calls kept");
  expect(text.find("tool_call") == std::string::npos, "call blocks removed");
}

void test_extract_claims() {
  std::vector<std::string> claims = BrowserAgent::extract_claims(
      "I will take this one.\nCLAIM: Stripe\nand also\nclaim:\tAirbnb  \nCLAIM:   \n");
  expect(claims.size() == 2, "two claims, blank ignored");
  expect(claims[0] == "Stripe" && claims[1] == "Airbnb", "labels trimmed in order");

  std::string page(200000, 'z');
  claims = BrowserAgent::extract_claims(page + "\nCLAIM: Notion\n" + page + "\nCLAIM: " + page);
  expect(claims.size() == 2, "claims found in a large response");
  expect(claims[0] == "Notion" && claims[1] == page, "long labels kept whole");
}

void test_format_tool_result() {
  FakeHttp http;
  McpClient mcp(http, "http://browser:3001");
  ScriptedAI ai;
  AgentConfig cfg;
  cfg.max_tool_result_size = 10;
  BrowserAgent agent(ai, mcp, nullptr, cfg);

  OperationResult ok = OperationResult::ok();
  ok.texts.push_back("0123456789abcdef");
  ImageAttachment img;
  img.mime_type = "image/png";
  img.data = "12345";
  ok.images.push_back(img);
  std::string out = agent.format_tool_result("browser_snapshot", ok);
  expect(out.find("<tool_result name=\"browser_snapshot\" success=\"true\">") == 0, "result header");
  expect(out.find("[truncated 6 characters]") != std::string::npos, "long output truncated");
  expect(out.find("[image attachment: image/png, 5 bytes]") != std::string::npos, "image noted");

  out = agent.format_tool_result("browser_click", OperationResult::fail(ErrorKind::PROTOCOL, "no ref"));
  expect(out.find("success=\"false\"") != std::string::npos, "failure flag");
  expect(out.find("Error: no ref") != std::string::npos, "error text");
}

// ============================================================================
// Agent loop
// ============================================================================

void test_run_executes_tools_then_answers() {
  std::set<std::string> taken;
  FakeHttp http;
  http.handler = browser_and_claims(taken);
  McpClient mcp(http, "http://browser:3001");
  mcp.connect();

  ScriptedAI ai;
  ai.say("<tool_call name=\"browser_navigate\">{\"url\": \"https://stripe.com\"}</tool_call>");
  ai.say("Stripe is valued at $95B according to Bloomberg.");
  BrowserAgent agent(ai, mcp, nullptr);

  AgentResult r = agent.run("Research Stripe");
  expect(r.success, "run succeeded");
  expect(r.iterations == 2, "two model round trips");
  expect(r.tool_calls_made == 1, "one tool call");
  expect(r.final_response == "Stripe is valued at $95B according to Bloomberg.", "final answer");

  expect(ai.conversations.size() == 2, "two chats");
  const std::vector<ConversationMessage>& second = ai.conversations[1];
  expect(second.size() == 3, "instruction, reply, tool result");
  expect(second[2].content.find("ok browser_navigate") != std::string::npos, "tool output fed back");
  expect(ai.options[0].system_prompt.find("browser_navigate") != std::string::npos,
         "catalog in system prompt");
}

void test_run_retries_after_rejected_claim() {
  std::set<std::string> taken;
  taken.insert("airbnb");
  FakeHttp http;
  http.handler = browser_and_claims(taken);
  McpClient mcp(http, "http://browser:3001");
  mcp.connect();
  ClaimGateway claims(http, "http://orchestrator:8100/", 2);
  expect(claims.enabled(), "claims enabled");

  ScriptedAI ai;
  ai.say("CLAIM: Airbnb\n<tool_call name=\"browser_navigate\">{\"url\": \"https://airbnb.com\"}</tool_call>");
  ai.say("CLAIM: Stripe");
  ai.say("CLAIM: Stripe\nStripe is valued at $95B.");
  BrowserAgent agent(ai, mcp, &claims);

  AgentResult r = agent.run("Find one startup");
  expect(r.success, "run succeeded");
  expect(r.claimed_label == "Stripe", "approved claim recorded");
  expect(r.tool_calls_made == 0, "tools skipped while the claim was rejected");
  expect(r.final_response.find("CLAIM: Stripe") == 0, "final answer carries the claim");

  std::string feedback = ai.conversations[1].back().content;
  expect(feedback.find("rejected") != std::string::npos, "rejection fed back");
  feedback = ai.conversations[2].back().content;
  expect(feedback.find("approved") != std::string::npos, "approval fed back");

  std::vector<FakeRequest> log = http.requests();
  size_t claim_posts = 0;
  for (size_t i = 0; i < log.size(); ++i) {
    if (log[i].url == "http://orchestrator:8100/swarm/claim") {
      ++claim_posts;
      expect(log[i].json()["agent_id"] == 2, "agent id sent");
    }
  }
  expect(claim_posts == 2, "each label requested once");
}

void test_run_prefixes_unrepeated_claim() {
  std::set<std::string> taken;
  FakeHttp http;
  http.handler = browser_and_claims(taken);
  McpClient mcp(http, "http://browser:3001");
  ClaimGateway claims(http, "http://orchestrator:8100", 1);

  ScriptedAI ai;
  ai.say("CLAIM: Figma");
  ai.say("Figma was valued at $20B.");
  BrowserAgent agent(ai, mcp, &claims);

  AgentResult r = agent.run("Find one startup");
  expect(r.final_response == "CLAIM: Figma\n\nFigma was valued at $20B.", "claim prefixed");
}

void test_run_limits() {
  FakeHttp http;
  McpClient mcp(http, "http://browser:3001");

  ScriptedAI off;
  off.configured = false;
  BrowserAgent idle(off, mcp, nullptr);
  AgentResult r = idle.run("anything");
  expect(!r.success && r.error == "AI not configured", "unconfigured provider");

  ScriptedAI failing;
  failing.replies.push_back(CompletionResult::fail("overloaded"));
  BrowserAgent flaky(failing, mcp, nullptr);
  r = flaky.run("anything");
  expect(!r.success, "consecutive errors abort");
  expect(r.error.find("overloaded") != std::string::npos, "provider error kept");
  expect(failing.conversations.size() == 3, "three attempts");

  ScriptedAI looping;
  looping.say("Still looking.\n<tool_call name=\"browser_snapshot\">{}</tool_call>");
  AgentConfig cfg;
  cfg.max_steps = 3;
  BrowserAgent busy(looping, mcp, nullptr, cfg);
  r = busy.run("anything");
  expect(r.success, "max steps still returns text");
  expect(r.iterations == 3, "bounded by max steps");
  expect(r.final_response.find("Still looking.") == 0, "accumulated text");
  expect(r.final_response.find("(Reached maximum steps)") != std::string::npos, "limit noted");
}

void test_claim_gateway_unavailable() {
  FakeHttp http;  // refuses
  ClaimGateway down(http, "http://orchestrator:8100", 1);
  expect(down.request("Stripe") == ClaimOutcome::UNAVAILABLE, "unreachable coordinator");

  ClaimGateway disabled(http, "", 1);
  expect(!disabled.enabled(), "empty url disables");
  expect(disabled.request("Stripe") == ClaimOutcome::UNAVAILABLE, "disabled gateway");
  expect(http.requests().size() == 1, "disabled gateway sends nothing");

  http.handler = [](const FakeRequest&) { return respond(200, "{\"ok\":true}"); };
  expect(down.request("Stripe") == ClaimOutcome::UNAVAILABLE, "malformed reply");
}

// ============================================================================
// Oracles
// ============================================================================

void test_planning_oracle() {
  ScriptedAI ai;
  ai.say("Here is the plan:\n```json\n{\"task_type\": \"comparative\", \"target_count\": 4, "
         "\"base_task\": \"Research one YC company\", \"comparison_criteria\": \"highest valuation\"}\n```");
  AIPlanningOracle planner(ai, 5);

  Json plan = planner.plan("Which YC company has the highest valuation?");
  expect(plan["task_type"] == "comparative", "fenced JSON parsed");
  expect(plan["comparison_criteria"] == "highest valuation", "criterion");
  expect(ai.conversations[0][0].content.find("(1-5)") != std::string::npos, "capacity in prompt");

  ScriptedAI prose;
  prose.say("I cannot decide.");
  AIPlanningOracle lost(prose, 5);
  bool threw = false;
  try {
    lost.plan("x");
  } catch (const SwarmError& e) {
    threw = e.kind() == ErrorKind::ORACLE;
  }
  expect(threw, "no JSON is an oracle error");

  ScriptedAI off;
  off.configured = false;
  AIPlanningOracle unconfigured(off, 5);
  threw = false;
  try {
    unconfigured.plan("x");
  } catch (const SwarmError&) {
    threw = true;
  }
  expect(threw && off.conversations.empty(), "unconfigured provider not called");
}

void test_synthesis_oracle() {
  ScriptedAI ai;
  ai.say("Stripe wins.");
  AISynthesisOracle synth(ai);

  SynthesisRequest req;
  req.mode = TaskMode::COMPARATIVE;
  req.original_instruction = "Which has the highest valuation?";
  req.comparison_criterion = "highest valuation";
  req.results.push_back(LabelledResult("Stripe", "$95B"));
  req.results.push_back(LabelledResult("Airbnb", "$75B"));

  expect(synth.synthesize(req) == "Stripe wins.", "oracle text returned");
  std::string prompt = ai.conversations[0][0].content;
  expect(prompt.find("Comparison criteria: highest valuation") != std::string::npos, "criterion named");
  expect(prompt.find("### Stripe\n$95B") != std::string::npos, "labelled results listed");
  expect(prompt.find("winner") != std::string::npos, "asks for a winner");

  req.mode = TaskMode::PRE_ASSIGNED;
  expect(synth.build_prompt(req).find("Use a table") != std::string::npos, "summary prompt");
}

void test_claude_request_shape() {
  FakeHttp http;
  http.handler = [](const FakeRequest&) {
    return respond(200, "{\"model\":\"m\",\"stop_reason\":\"end_turn\","
                        "\"content\":[{\"type\":\"text\",\"text\":\"hi \"},{\"type\":\"text\",\"text\":\"there\"}],"
                        "\"usage\":{\"input_tokens\":3,\"output_tokens\":2}}");
  };

  Config cfg;
  cfg.load_string("{\"claude\": {\"api_key\": \"k-123\", \"api_url\": \"http://llm/v1/messages\"}}");
  ClaudeProvider claude(http);
  expect(claude.init(cfg), "configured from config");

  CompletionOptions opts;
  opts.system_prompt = "be brief";
  CompletionResult r = claude.complete("hello", opts);
  expect(r.success && r.content == "hi there", "text blocks joined");
  expect(r.usage.total_tokens == 5, "usage summed");

  FakeRequest sent = http.requests()[0];
  expect(sent.url == "http://llm/v1/messages", "api url override");
  expect(sent.header("x-api-key") == "k-123", "api key header");
  expect(sent.header("anthropic-version") == "2023-06-01", "api version header");
  Json body = sent.json();
  expect(body["system"] == "be brief", "system prompt");
  expect(body["messages"][0]["role"] == "user", "user message");

  http.handler = [](const FakeRequest&) {
    return respond(529, "{\"error\":{\"type\":\"overloaded_error\",\"message\":\"Overloaded\"}}");
  };
  r = claude.complete("hello");
  expect(!r.success, "api error");
  expect(r.error == "overloaded_error: Overloaded (HTTP 529)", "api error message");
}

}  // namespace

int main() {
  quiet_logs();
  std::cout << "=== Browser Agent Tests ===\n";

  std::cout << "\n[Parsing]\n";
  run_test("parse tool calls", test_parse_tool_calls);
  run_test("extract claims", test_extract_claims);
  run_test("format tool result", test_format_tool_result);

  std::cout << "\n[Agent loop]\n";
  run_test("tools then answer", test_run_executes_tools_then_answers);
  run_test("retry after rejected claim", test_run_retries_after_rejected_claim);
  run_test("claim prefixed on final answer", test_run_prefixes_unrepeated_claim);
  run_test("run limits", test_run_limits);
  run_test("claim gateway unavailable", test_claim_gateway_unavailable);

  std::cout << "\n[Oracles]\n";
  run_test("planning oracle", test_planning_oracle);
  run_test("synthesis oracle", test_synthesis_oracle);
  run_test("claude request shape", test_claude_request_shape);

  return finish();
}
