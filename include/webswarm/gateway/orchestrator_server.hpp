/*
 * webswarm - Orchestrator front door
 *
 * Crow HTTP/WebSocket server in front of the worker pool and the swarm
 * coordinator:
 *
 *   GET  /health          liveness
 *   GET  /workers         pool status
 *   GET  /services        service discovery (worker and browser URLs)
 *   GET  /swarm/status    current run snapshot
 *   POST /swarm/claim     {"agent_id", "item"} -> {"approved", "item"}
 *   POST /swarm/execute   {"prompt"} -> final answer (synchronous run)
 *   POST /pool/execute    {"units": [{"label", "instruction"}], "query_type"}
 *   WS   /ws              status channel; {"type":"execute","prompt"} starts
 *                         a run in the background, {"type":"status"} asks
 *                         for a snapshot
 */
#ifndef WEBSWARM_GATEWAY_ORCHESTRATOR_SERVER_HPP
#define WEBSWARM_GATEWAY_ORCHESTRATOR_SERVER_HPP

#include "api.hpp"
#include "../pool/types.hpp"
#include "../core/thread_pool.hpp"
#include <string>
#include <atomic>

namespace webswarm {

class WorkerPool;
class SwarmCoordinator;
class StatusChannel;
class StatusObserver;
class OrchestratorHttp;

struct GatewayOptions {
    std::string bind;
    int port;
    std::string public_host;  // host name used in /services URLs

    GatewayOptions() : bind("0.0.0.0"), port(8100), public_host("localhost") {}
};

class OrchestratorServer {
public:
    OrchestratorServer(WorkerPool& pool,
                       SwarmCoordinator& coordinator,
                       StatusChannel& channel,
                       const PortLayout& ports,
                       const GatewayOptions& opts);
    ~OrchestratorServer();

    // Serves on a background thread
    bool start();
    void stop();
    bool is_running() const { return running_; }

    // Snapshot sent to status observers on connect
    Json snapshot() const;

    ApiResponse handle_health() const;
    ApiResponse handle_workers() const;
    ApiResponse handle_services() const;
    ApiResponse handle_swarm_status() const;
    ApiResponse handle_claim(const std::string& body);
    ApiResponse handle_swarm_execute(const std::string& body);
    ApiResponse handle_pool_execute(const std::string& body);

    // Messages from a status observer
    void handle_ws_message(StatusObserver& observer, const std::string& data);

private:
    OrchestratorServer(const OrchestratorServer&);
    OrchestratorServer& operator=(const OrchestratorServer&);

    WorkerPool& pool_;
    SwarmCoordinator& coordinator_;
    StatusChannel& channel_;
    PortLayout ports_;
    GatewayOptions opts_;

    std::atomic<bool> running_;
    OrchestratorHttp* http_;

    // Background runs started over the status channel
    ThreadPool runs_;
};

} // namespace webswarm

#endif // WEBSWARM_GATEWAY_ORCHESTRATOR_SERVER_HPP
