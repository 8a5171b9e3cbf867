/*
 * Orchestrator front door
 *
 * Uses Crow (https://crowcpp.org) for HTTP and WebSocket functionality.
 */

#include <webswarm/gateway/orchestrator_server.hpp>
#include <webswarm/pool/worker_pool.hpp>
#include <webswarm/pool/field_extractor.hpp>
#include <webswarm/swarm/coordinator.hpp>
#include <webswarm/status/status_channel.hpp>
#include <webswarm/core/logger.hpp>
#include <webswarm/core/utils.hpp>

// Crow header-only library (C++17 required)
#include <crow.h>

#include <sstream>
#include <thread>
#include <mutex>
#include <memory>
#include <unordered_map>

namespace webswarm {

namespace {

crow::response to_crow(const ApiResponse& api) {
    crow::response res(api.status);
    res.set_header("Content-Type", "application/json");
    res.set_header("Access-Control-Allow-Origin", "*");
    res.body = api.body.dump();
    return res;
}

// Status observer over a Crow WebSocket. Crow invalidates the connection
// after onclose, so sends are fenced by the closed flag.
class CrowObserver : public StatusObserver {
public:
    explicit CrowObserver(crow::websocket::connection* conn) : conn_(conn), closed_(false) {}

    bool send(const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || !conn_) return false;
        try {
            conn_->send_text(message);
            return true;
        } catch (const std::exception& e) {
            LOG_WARN("Failed to send to WebSocket client: %s", e.what());
            closed_ = true;
            return false;
        }
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        conn_ = nullptr;
    }

private:
    std::mutex mutex_;
    crow::websocket::connection* conn_;
    bool closed_;
};

} // namespace

// ============================================================================
// HTTP/WebSocket server (Crow)
// ============================================================================

class OrchestratorHttp {
public:
    OrchestratorHttp(OrchestratorServer& owner, StatusChannel& channel)
        : owner_(owner)
        , channel_(channel) {}

    ~OrchestratorHttp() {
        stop();
    }

    void start(const std::string& bind, int port, std::atomic<bool>& running) {
        setup_routes();

        server_thread_ = std::thread([this, bind, port, &running]() {
            try {
                app_.bindaddr(bind.empty() ? "0.0.0.0" : bind).port(port).multithreaded().run();
            } catch (const std::exception& e) {
                LOG_ERROR("Orchestrator server error: %s", e.what());
            }
            running = false;
        });

        // Wait a bit for server to start
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    void stop() {
        app_.stop();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }

        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto it = connections_.begin(); it != connections_.end(); ++it) {
            it->second->close();
        }
        connections_.clear();
    }

private:
    void setup_routes() {
        CROW_ROUTE(app_, "/health")
        ([this]() { return to_crow(owner_.handle_health()); });

        CROW_ROUTE(app_, "/workers")
        ([this]() { return to_crow(owner_.handle_workers()); });

        CROW_ROUTE(app_, "/services")
        ([this]() { return to_crow(owner_.handle_services()); });

        CROW_ROUTE(app_, "/swarm/status")
        ([this]() { return to_crow(owner_.handle_swarm_status()); });

        CROW_ROUTE(app_, "/swarm/claim").methods(crow::HTTPMethod::Post)
        ([this](const crow::request& req) { return to_crow(owner_.handle_claim(req.body)); });

        CROW_ROUTE(app_, "/swarm/execute").methods(crow::HTTPMethod::Post)
        ([this](const crow::request& req) { return to_crow(owner_.handle_swarm_execute(req.body)); });

        CROW_ROUTE(app_, "/pool/execute").methods(crow::HTTPMethod::Post)
        ([this](const crow::request& req) { return to_crow(owner_.handle_pool_execute(req.body)); });

        CROW_WEBSOCKET_ROUTE(app_, "/ws")
            .onopen([this](crow::websocket::connection& conn) {
                on_ws_open(conn);
            })
            .onclose([this](crow::websocket::connection& conn, const std::string& reason) {
                on_ws_close(conn, reason);
            })
            .onmessage([this](crow::websocket::connection& conn, const std::string& data, bool /* is_binary */) {
                on_ws_message(conn, data);
            });
    }

    void on_ws_open(crow::websocket::connection& conn) {
        std::shared_ptr<CrowObserver> observer = std::make_shared<CrowObserver>(&conn);
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connections_[&conn] = observer;
        }
        if (!channel_.add_observer(observer)) {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connections_.erase(&conn);
        }
    }

    void on_ws_close(crow::websocket::connection& conn, const std::string& reason) {
        std::shared_ptr<CrowObserver> observer;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            auto it = connections_.find(&conn);
            if (it != connections_.end()) {
                observer = it->second;
                connections_.erase(it);
            }
        }
        if (observer) {
            observer->close();
            channel_.remove_observer(observer.get());
            LOG_DEBUG("WebSocket client disconnected (reason: %s)", reason.c_str());
        }
    }

    void on_ws_message(crow::websocket::connection& conn, const std::string& data) {
        std::shared_ptr<CrowObserver> observer;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            auto it = connections_.find(&conn);
            if (it != connections_.end()) observer = it->second;
        }
        if (observer) {
            owner_.handle_ws_message(*observer, data);
        }
    }

    OrchestratorServer& owner_;
    StatusChannel& channel_;
    crow::SimpleApp app_;
    std::thread server_thread_;

    std::mutex connections_mutex_;
    std::unordered_map<crow::websocket::connection*, std::shared_ptr<CrowObserver> > connections_;
};

// ============================================================================
// OrchestratorServer
// ============================================================================

OrchestratorServer::OrchestratorServer(WorkerPool& pool,
                                       SwarmCoordinator& coordinator,
                                       StatusChannel& channel,
                                       const PortLayout& ports,
                                       const GatewayOptions& opts)
    : pool_(pool)
    , coordinator_(coordinator)
    , channel_(channel)
    , ports_(ports)
    , opts_(opts)
    , running_(false)
    , http_(nullptr)
    , runs_(1, "ws-runs") {
}

OrchestratorServer::~OrchestratorServer() {
    stop();
}

bool OrchestratorServer::start() {
    if (running_) return true;

    channel_.set_snapshot_provider([this]() { return snapshot(); });

    running_ = true;
    http_ = new OrchestratorHttp(*this, channel_);
    http_->start(opts_.bind, opts_.port, running_);

    LOG_INFO("Orchestrator listening on %s:%d", opts_.bind.c_str(), opts_.port);
    return running_;
}

void OrchestratorServer::stop() {
    if (http_) {
        http_->stop();
        delete http_;
        http_ = nullptr;
    }
    running_ = false;
    runs_.shutdown();
}

Json OrchestratorServer::snapshot() const {
    Json j = Json::object();
    j["workers"] = pool_.status().to_json();
    j["swarm"] = coordinator_.status();
    return j;
}

ApiResponse OrchestratorServer::handle_health() const {
    Json j = Json::object();
    j["status"] = "healthy";
    j["service"] = "orchestrator";
    return ApiResponse(200, j);
}

ApiResponse OrchestratorServer::handle_workers() const {
    return ApiResponse(200, pool_.status().to_json());
}

ApiResponse OrchestratorServer::handle_services() const {
    size_t count = pool_.capacity();
    const std::string& host = opts_.public_host;

    Json workers = Json::array();
    Json browsers = Json::array();
    for (size_t i = 0; i < count; ++i) {
        WorkerEndpoint ep = ports_.endpoint_for(static_cast<int>(i));

        Json w = Json::object();
        w["id"] = ep.worker_id;
        w["http"] = ep.base_url();
        w["mcp"] = "http://" + host + ":" + std::to_string(ep.mcp_port);
        workers.push_back(w);

        Json b = Json::object();
        b["id"] = ep.worker_id;
        b["video_ws"] = "ws://" + host + ":" + std::to_string(ep.video_port);
        b["vnc_ws"] = "ws://" + host + ":" + std::to_string(ep.vnc_port);
        browsers.push_back(b);
    }

    Json orchestrator = Json::object();
    orchestrator["ws"] = "ws://" + host + ":" + std::to_string(opts_.port) + "/ws";
    orchestrator["http"] = "http://" + host + ":" + std::to_string(opts_.port);

    Json j = Json::object();
    j["orchestrator"] = orchestrator;
    j["workers"] = workers;
    j["browsers"] = browsers;
    j["worker_count"] = count;
    return ApiResponse(200, j);
}

ApiResponse OrchestratorServer::handle_swarm_status() const {
    return ApiResponse(200, coordinator_.status());
}

ApiResponse OrchestratorServer::handle_claim(const std::string& body) {
    Json req = parse_json_lenient(body);
    if (!req.is_object()) {
        return ApiResponse::error(400, "Invalid JSON body");
    }
    int64_t agent_id = json_int(req, "agent_id", 0);
    std::string item = json_string(req, "item");
    if (agent_id <= 0 || trim(item).empty()) {
        return ApiResponse::error(400, "agent_id and item are required");
    }

    bool approved = coordinator_.claim(static_cast<int>(agent_id), item);

    Json j = Json::object();
    j["approved"] = approved;
    j["item"] = item;
    return ApiResponse(200, j);
}

ApiResponse OrchestratorServer::handle_swarm_execute(const std::string& body) {
    Json req = parse_json_lenient(body);
    if (!req.is_object()) {
        return ApiResponse::error(400, "Invalid JSON body");
    }
    std::string prompt = json_string(req, "prompt");
    if (trim(prompt).empty()) {
        return ApiResponse::error(400, "prompt is required");
    }

    RunReport report = coordinator_.execute(prompt);
    return ApiResponse(200, report.to_json());
}

ApiResponse OrchestratorServer::handle_pool_execute(const std::string& body) {
    Json req = parse_json_lenient(body);
    if (!req.is_object() || !req.contains("units") || !req["units"].is_array()) {
        return ApiResponse::error(400, "units array is required");
    }

    std::vector<WorkUnit> units;
    const Json& list = req["units"];
    for (size_t i = 0; i < list.size(); ++i) {
        std::string instruction = json_string(list[i], "instruction");
        if (trim(instruction).empty()) {
            return ApiResponse::error(400, "unit " + std::to_string(i) + " has no instruction");
        }
        units.push_back(WorkUnit(json_string(list[i], "label"), instruction));
    }
    if (units.empty()) {
        return ApiResponse::error(400, "No units to process");
    }

    std::string query_type = json_string(req, "query_type", "valuation");
    std::string task_id = generate_short_id();
    int64_t start = monotonic_ms();

    LOG_INFO("Task %s: executing %zu units on the pool", task_id.c_str(), units.size());
    std::vector<UnitResult> results = pool_.execute_parallel(units);

    double duration = static_cast<double>(monotonic_ms() - start) / 1000.0;
    size_t completed = 0;
    Json result_list = Json::array();
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i].completed()) ++completed;
        result_list.push_back(results[i].to_json());
    }

    size_t workers_used = 0;
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i].worker_id > 0) ++workers_used;
    }

    std::ostringstream table;
    table.precision(1);
    table << format_results_table(results, query_type)
          << "\n\n*Research completed in " << std::fixed << duration << "s using "
          << workers_used << " parallel agents. " << completed << "/" << results.size()
          << " successful.*";

    Json j = Json::object();
    j["task_id"] = task_id;
    j["status"] = "completed";
    j["results"] = result_list;
    j["markdown_table"] = table.str();
    j["total_duration_seconds"] = duration;
    j["workers_used"] = workers_used;
    return ApiResponse(200, j);
}

void OrchestratorServer::handle_ws_message(StatusObserver& observer, const std::string& data) {
    Json msg = parse_json_lenient(data);
    std::string type = json_string(msg, "type");

    Json reply = Json::object();
    if (!msg.is_object()) {
        reply["type"] = "error";
        reply["payload"] = "Invalid JSON message";
    } else if (type == "execute") {
        std::string prompt = json_string(msg, "prompt");
        if (trim(prompt).empty()) {
            reply["type"] = "error";
            reply["payload"] = "prompt is required";
        } else {
            runs_.enqueue([this, prompt]() { coordinator_.execute(prompt); });
            reply["type"] = "accepted";
            reply["payload"] = Json::object({{"prompt", prompt}});
        }
    } else if (type == "status") {
        reply["type"] = "snapshot";
        reply["payload"] = snapshot();
    } else {
        reply["type"] = "error";
        reply["payload"] = "Unknown message type: " + type;
    }

    if (!observer.send(reply.dump())) {
        LOG_DEBUG("WebSocket reply dropped, client gone");
    }
}

} // namespace webswarm
