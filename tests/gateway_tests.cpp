#include "test_support.hpp"

#include <webswarm/gateway/orchestrator_server.hpp>
#include <webswarm/gateway/worker_server.hpp>
#include <webswarm/agent/browser_agent.hpp>
#include <webswarm/mcp/mcp_client.hpp>
#include <webswarm/pool/worker_pool.hpp>
#include <webswarm/swarm/coordinator.hpp>
#include <webswarm/status/event_queue.hpp>
#include <webswarm/status/status_channel.hpp>
#include <webswarm/core/utils.hpp>

#include <chrono>
#include <cstdlib>
#include <thread>

using namespace webswarm;

namespace {

class RecordingObserver : public StatusObserver {
public:
  bool send(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(parse_json_lenient(message));
    return true;
  }

  std::vector<Json> messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
  }

private:
  mutable std::mutex mutex_;
  std::vector<Json> messages_;
};

int worker_from_url(const std::string& url) {
  size_t pos = url.find("worker-");
  return pos == std::string::npos ? 0 : std::atoi(url.c_str() + pos + 7);
}

// Healthy workers that report a valuation per worker id
FakeHttp::Handler valuation_workers() {
  return [](const FakeRequest& req) {
    if (req.ends_with("/health")) return respond(200, "{}");
    int id = worker_from_url(req.url);
    Json body = Json::object();
    body["response"] = "Valued at $" + std::to_string(id * 10) + " billion per Reuters";
    body["status"] = "success";
    return respond_json(200, body);
  };
}

// Pool, oracles and coordinator wired the way the orchestrator binary does
struct Orchestrator {
  FakeHttp http;
  EventQueue events;
  StatusChannel channel;
  WorkerPool pool;
  FakePlanner planner;
  FakeSynthesizer synthesizer;
  SwarmCoordinator coordinator;
  GatewayOptions opts;
  OrchestratorServer server;

  explicit Orchestrator(size_t workers)
      : channel(events)
      , pool(http, PoolOptions(), &events)
      , coordinator(pool, planner, synthesizer, &events)
      , server(pool, coordinator, channel, PortLayout(), gateway_options()) {
    http.handler = valuation_workers();
    pool.initialize(workers);
  }

  static GatewayOptions gateway_options() {
    GatewayOptions o;
    o.port = 9100;
    o.public_host = "swarm.local";
    return o;
  }
};

// ============================================================================
// Orchestrator HTTP handlers
// ============================================================================

void test_health_and_workers() {
  Orchestrator o(2);

  ApiResponse health = o.server.handle_health();
  expect(health.status == 200, "health ok");
  expect(health.body["status"] == "healthy" && health.body["service"] == "orchestrator", "health body");

  ApiResponse workers = o.server.handle_workers();
  expect(workers.body["total_workers"] == 2, "pool size reported");
  expect(workers.body["idle"] == 2, "probed workers idle");
}

void test_services_lists_endpoints() {
  Orchestrator o(2);
  Json j = o.server.handle_services().body;

  expect(j["worker_count"] == 2, "worker count");
  expect(j["orchestrator"]["ws"] == "ws://swarm.local:9100/ws", "status channel url");
  expect(j["orchestrator"]["http"] == "http://swarm.local:9100", "http url");
  expect(j["workers"].size() == 2, "two workers");
  expect(j["workers"][1]["id"] == 2, "second worker id");
  expect(j["workers"][1]["http"] == "http://worker-2:8000", "worker agent url");
  expect(j["workers"][1]["mcp"] == "http://swarm.local:3012", "worker automation url");
  expect(j["browsers"][0]["video_ws"] == "ws://swarm.local:8766", "first video port");
  expect(j["browsers"][1]["vnc_ws"] == "ws://swarm.local:6082", "second vnc port");
}

void test_claim_validation() {
  Orchestrator o(2);

  ApiResponse bad = o.server.handle_claim("not json");
  expect(bad.status == 400 && bad.body["error"] == "Invalid JSON body", "invalid body");

  ApiResponse missing = o.server.handle_claim("{\"agent_id\": 1}");
  expect(missing.status == 400, "item missing");
  expect(missing.body["error"] == "agent_id and item are required", "missing message");
  expect(o.server.handle_claim("{\"item\": \"Stripe\"}").status == 400, "agent missing");

  ApiResponse first = o.server.handle_claim("{\"agent_id\": 1, \"item\": \"Stripe\"}");
  expect(first.status == 200 && first.body["approved"] == true, "first claim approved");
  expect(first.body["item"] == "Stripe", "item echoed");

  ApiResponse second = o.server.handle_claim("{\"agent_id\": 2, \"item\": \"stripe\"}");
  expect(second.status == 200 && second.body["approved"] == false, "duplicate rejected");

  Json status = o.server.handle_swarm_status().body;
  expect(status["claimed_items"].size() == 1, "one claimed item");
}

void test_swarm_execute() {
  Orchestrator o(2);
  o.planner.response = Json::object({{"task_type", "pre_assigned"},
                                     {"sub_tasks", Json::array({"Research Stripe", "Research Figma"})}});
  o.synthesizer.answer = "| Company | Valuation |";

  ApiResponse missing = o.server.handle_swarm_execute("{\"prompt\": \"  \"}");
  expect(missing.status == 400 && missing.body["error"] == "prompt is required", "prompt required");

  ApiResponse r = o.server.handle_swarm_execute("{\"prompt\": \"Value Stripe and Figma\"}");
  expect(r.status == 200, "run completes synchronously");
  expect(r.body["status"] == "success", "successful run");
  expect(r.body["result"] == "| Company | Valuation |", "synthesized answer");
  expect(r.body["agents"].size() == 2, "both agents reported");
  expect(o.synthesizer.last.results.size() == 2, "synthesis saw both results");

  expect(o.server.handle_swarm_status().body["phase"] == "complete", "phase after run");
}

void test_pool_execute() {
  Orchestrator o(3);

  expect(o.server.handle_pool_execute("{}").status == 400, "units required");
  ApiResponse blank = o.server.handle_pool_execute(
      "{\"units\": [{\"label\": \"Stripe\", \"instruction\": \"x\"}, {\"label\": \"Figma\"}]}");
  expect(blank.status == 400 && blank.body["error"] == "unit 1 has no instruction", "blank unit named");
  ApiResponse none = o.server.handle_pool_execute("{\"units\": []}");
  expect(none.status == 400 && none.body["error"] == "No units to process", "empty units");

  ApiResponse r = o.server.handle_pool_execute(
      "{\"units\": [{\"label\": \"Stripe\", \"instruction\": \"Value Stripe\"},"
      " {\"label\": \"Figma\", \"instruction\": \"Value Figma\"}]}");
  expect(r.status == 200, "accepted");
  expect(r.body["status"] == "completed", "task completed");
  expect(r.body["task_id"].get<std::string>().size() > 0, "task id minted");
  expect(r.body["workers_used"] == 2, "two workers used");
  expect(r.body["results"].size() == 2, "two results");
  expect(r.body["results"][0]["label"] == "Stripe", "results keep unit order");
  expect(r.body["results"][0]["status"] == "completed", "unit completed");

  std::string table = r.body["markdown_table"].get<std::string>();
  expect(table.find("## Valuations") == 0, "valuation table");
  expect(table.find("| Stripe |") != std::string::npos, "stripe row");
  expect(table.find("using 2 parallel agents. 2/2 successful.*") != std::string::npos, "summary line");
}

// ============================================================================
// Status channel messages
// ============================================================================

void test_ws_messages() {
  Orchestrator o(2);
  RecordingObserver obs;

  o.server.handle_ws_message(obs, "{\"type\": \"status\"}");
  o.server.handle_ws_message(obs, "garbage");
  o.server.handle_ws_message(obs, "{\"type\": \"dance\"}");
  o.server.handle_ws_message(obs, "{\"type\": \"execute\"}");

  std::vector<Json> got = obs.messages();
  expect(got.size() == 4, "one reply per message");
  expect(got[0]["type"] == "snapshot", "status returns snapshot");
  expect(got[0]["payload"]["workers"]["total_workers"] == 2, "snapshot has pool");
  expect(got[0]["payload"]["swarm"]["phase"] == "idle", "snapshot has swarm");
  expect(got[1]["type"] == "error" && got[1]["payload"] == "Invalid JSON message", "bad json");
  expect(got[2]["type"] == "error" && got[2]["payload"] == "Unknown message type: dance", "unknown type");
  expect(got[3]["type"] == "error" && got[3]["payload"] == "prompt is required", "execute without prompt");
}

void test_ws_execute_runs_in_background() {
  Orchestrator o(1);
  o.planner.response = Json::object({{"task_type", "pre_assigned"},
                                     {"sub_tasks", Json::array({"Research Stripe"})}});
  o.synthesizer.answer = "done";
  RecordingObserver obs;

  o.server.handle_ws_message(obs, "{\"type\": \"execute\", \"prompt\": \"Value Stripe\"}");
  std::vector<Json> got = obs.messages();
  expect(got.size() == 1 && got[0]["type"] == "accepted", "execute accepted");
  expect(got[0]["payload"]["prompt"] == "Value Stripe", "prompt echoed");

  int64_t deadline = monotonic_ms() + 3000;
  while (o.coordinator.phase() != RunPhase::COMPLETE && monotonic_ms() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  expect(o.coordinator.phase() == RunPhase::COMPLETE, "background run finished");
  expect(o.synthesizer.calls == 1, "synthesized once");
}

// ============================================================================
// Worker endpoint
// ============================================================================

void test_worker_execute() {
  FakeHttp http;
  McpClient mcp(http, "http://browser:3001");
  ScriptedAI ai;
  ai.say("Figma is valued at $12.5B per TechCrunch.");
  BrowserAgent agent(ai, mcp, nullptr);
  WorkerServer worker(agent, 4);

  Json health = worker.handle_health().body;
  expect(health["status"] == "healthy" && health["worker_id"] == 4, "worker health");

  ApiResponse missing = worker.handle_execute("{}");
  expect(missing.status == 400 && missing.body["error"] == "instruction is required", "instruction required");
  expect(worker.handle_execute("[1, 2]").status == 400, "non-object body");

  ApiResponse r = worker.handle_execute("{\"instruction\": \"Value Figma\"}");
  expect(r.status == 200 && r.body["status"] == "success", "run succeeded");
  expect(r.body["response"] == "Figma is valued at $12.5B per TechCrunch.", "final answer returned");
  expect(ai.conversations.size() == 1, "one model turn");

  ApiResponse prompt = worker.handle_execute("{\"prompt\": \"Value Figma again\"}");
  expect(prompt.status == 200 && prompt.body["status"] == "success", "prompt accepted as instruction");
}

void test_worker_execute_reports_agent_error() {
  FakeHttp http;
  McpClient mcp(http, "http://browser:3001");
  ScriptedAI ai;
  ai.configured = false;
  BrowserAgent agent(ai, mcp, nullptr);
  WorkerServer worker(agent, 1);

  ApiResponse r = worker.handle_execute("{\"instruction\": \"Value Figma\"}");
  expect(r.status == 200, "agent failure is still a reply");
  expect(r.body["status"] == "error", "error status");
  expect(r.body["response"] == "AI not configured", "error text as response");
}

}  // namespace

int main() {
  quiet_logs();
  std::cout << "=== Gateway Tests ===\n";

  std::cout << "\n[Orchestrator HTTP]\n";
  run_test("health and workers", test_health_and_workers);
  run_test("services lists endpoints", test_services_lists_endpoints);
  run_test("claim validation", test_claim_validation);
  run_test("swarm execute", test_swarm_execute);
  run_test("pool execute", test_pool_execute);

  std::cout << "\n[Status channel messages]\n";
  run_test("ws messages", test_ws_messages);
  run_test("ws execute runs in background", test_ws_execute_runs_in_background);

  std::cout << "\n[Worker endpoint]\n";
  run_test("worker execute", test_worker_execute);
  run_test("worker execute reports agent error", test_worker_execute_reports_agent_error);

  return finish();
}
