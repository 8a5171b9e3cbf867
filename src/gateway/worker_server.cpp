#include <webswarm/gateway/worker_server.hpp>
#include <webswarm/agent/browser_agent.hpp>
#include <webswarm/core/logger.hpp>
#include <webswarm/core/utils.hpp>

#include <crow.h>

#include <thread>

namespace webswarm {

class WorkerHttp {
public:
    explicit WorkerHttp(WorkerServer& owner) : owner_(owner) {}

    ~WorkerHttp() {
        stop();
    }

    void start(const std::string& bind, int port, std::atomic<bool>& running) {
        CROW_ROUTE(app_, "/health")
        ([this]() { return reply(owner_.handle_health()); });

        CROW_ROUTE(app_, "/execute").methods(crow::HTTPMethod::Post)
        ([this](const crow::request& req) { return reply(owner_.handle_execute(req.body)); });

        server_thread_ = std::thread([this, bind, port, &running]() {
            try {
                app_.bindaddr(bind).port(port).multithreaded().run();
            } catch (const std::exception& e) {
                LOG_ERROR("Worker server error: %s", e.what());
            }
            running = false;
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    void stop() {
        app_.stop();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
    }

private:
    static crow::response reply(const ApiResponse& api) {
        crow::response res(api.status);
        res.set_header("Content-Type", "application/json");
        res.body = api.body.dump();
        return res;
    }

    WorkerServer& owner_;
    crow::SimpleApp app_;
    std::thread server_thread_;
};

WorkerServer::WorkerServer(BrowserAgent& agent, int worker_id)
    : agent_(agent)
    , worker_id_(worker_id)
    , running_(false)
    , http_(nullptr) {
}

WorkerServer::~WorkerServer() {
    stop();
}

bool WorkerServer::start(const std::string& bind, int port) {
    if (running_) return true;

    running_ = true;
    http_ = new WorkerHttp(*this);
    http_->start(bind, port, running_);

    LOG_INFO("Worker %d listening on %s:%d", worker_id_, bind.c_str(), port);
    return running_;
}

void WorkerServer::stop() {
    if (http_) {
        http_->stop();
        delete http_;
        http_ = nullptr;
    }
    running_ = false;
}

ApiResponse WorkerServer::handle_health() const {
    Json j = Json::object();
    j["status"] = "healthy";
    j["worker_id"] = worker_id_;
    return ApiResponse(200, j);
}

ApiResponse WorkerServer::handle_execute(const std::string& body) {
    Json req = parse_json_lenient(body);
    if (!req.is_object()) {
        return ApiResponse::error(400, "Invalid JSON body");
    }

    std::string instruction = json_string(req, "instruction");
    if (instruction.empty()) {
        instruction = json_string(req, "prompt");
    }
    if (trim(instruction).empty()) {
        return ApiResponse::error(400, "instruction is required");
    }

    std::lock_guard<std::mutex> lock(exec_mutex_);
    LOG_INFO("Worker %d executing: %.80s", worker_id_, instruction.c_str());

    try {
        AgentResult result = agent_.run(instruction);

        Json j = Json::object();
        if (result.success) {
            j["response"] = result.final_response;
            j["status"] = "success";
        } else {
            j["response"] = result.error.empty() ? result.final_response : result.error;
            j["status"] = "error";
        }
        LOG_INFO("Worker %d finished (%s, %d tool calls)", worker_id_,
                 result.success ? "success" : "error", result.tool_calls_made);
        return ApiResponse(200, j);
    } catch (const std::exception& e) {
        LOG_ERROR("Worker %d execution failed: %s", worker_id_, e.what());
        return ApiResponse::error(500, e.what());
    }
}

} // namespace webswarm
