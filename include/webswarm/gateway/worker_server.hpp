/*
 * webswarm - Worker endpoint
 *
 * HTTP surface of one browser worker, consumed by the WorkerPool:
 *
 *   GET  /health    {"status":"healthy","worker_id":N}
 *   POST /execute   {"instruction"} (or "prompt") -> {"response","status"}
 *
 * Executions are serialized: a worker drives one browser session.
 */
#ifndef WEBSWARM_GATEWAY_WORKER_SERVER_HPP
#define WEBSWARM_GATEWAY_WORKER_SERVER_HPP

#include "api.hpp"
#include <string>
#include <mutex>
#include <atomic>

namespace webswarm {

class BrowserAgent;
class WorkerHttp;

class WorkerServer {
public:
    WorkerServer(BrowserAgent& agent, int worker_id);
    ~WorkerServer();

    bool start(const std::string& bind, int port);
    void stop();
    bool is_running() const { return running_; }

    ApiResponse handle_health() const;
    ApiResponse handle_execute(const std::string& body);

private:
    WorkerServer(const WorkerServer&);
    WorkerServer& operator=(const WorkerServer&);

    BrowserAgent& agent_;
    int worker_id_;
    std::mutex exec_mutex_;
    std::atomic<bool> running_;
    WorkerHttp* http_;
};

} // namespace webswarm

#endif // WEBSWARM_GATEWAY_WORKER_SERVER_HPP
