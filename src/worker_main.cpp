/*
 * webswarm worker
 *
 * One browser worker: connects to its automation server, then serves
 * /health and /execute for the orchestrator's pool.
 *
 * Usage:
 *   ./webswarm-worker [config.json]
 */

#include <webswarm/core/logger.hpp>
#include <webswarm/core/config.hpp>
#include <webswarm/core/utils.hpp>
#include <webswarm/core/http_client.hpp>
#include <webswarm/mcp/mcp_client.hpp>
#include <webswarm/ai/claude.hpp>
#include <webswarm/agent/browser_agent.hpp>
#include <webswarm/gateway/worker_server.hpp>

#include <iostream>
#include <csignal>
#include <cstring>
#include <curl/curl.h>

namespace {

volatile std::sig_atomic_t g_running = 1;

void signal_handler(int sig) {
    (void)sig;
    g_running = 0;
}

const int MCP_CONNECT_ATTEMPTS = 10;
const int MCP_CONNECT_DELAY_MS = 2000;

} // namespace

int main(int argc, char* argv[]) {
    using namespace webswarm;

    const char* config_file = NULL;
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            std::cout << "Usage: " << argv[0] << " [config.json]\n\n"
                      << "Keys: worker.id, worker.port, worker.mcp_url,\n"
                      << "      worker.coordinator_url, worker.max_steps, claude.api_key\n";
            return 0;
        }
        config_file = argv[i];
    }

    curl_global_init(CURL_GLOBAL_ALL);

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    Config config;
    if (config_file && !config.load_file(config_file)) {
        LOG_WARN("Failed to load config from %s, using defaults", config_file);
    }
    Logger::instance().set_level(parse_log_level(config.get_string("log.level", "info")));

    int worker_id = static_cast<int>(config.get_int("worker.id", 1));
    int port = static_cast<int>(config.get_int("worker.port", 8000));
    std::string mcp_url = config.get_string("worker.mcp_url", "http://playwright-browser:3001");
    std::string coordinator_url = config.get_string("worker.coordinator_url", "");

    LOG_INFO("Worker %d starting (automation server %s)", worker_id, mcp_url.c_str());

    int exit_code = 0;
    {
        HttpClient http;

        McpClient mcp(http, mcp_url);
        bool connected = false;
        for (int attempt = 1; attempt <= MCP_CONNECT_ATTEMPTS && g_running; ++attempt) {
            if (mcp.connect()) {
                connected = true;
                break;
            }
            LOG_INFO("Automation server not ready (attempt %d/%d)", attempt, MCP_CONNECT_ATTEMPTS);
            sleep_ms(MCP_CONNECT_DELAY_MS);
        }
        if (!connected) {
            LOG_WARN("Continuing without an automation session; calls will retry the handshake");
        }

        ClaudeProvider claude(http);
        if (!claude.init(config)) {
            LOG_WARN("No Claude API key configured; executions will fail");
        }

        ClaimGateway claims(http, coordinator_url, worker_id);
        if (!claims.enabled()) {
            LOG_INFO("No coordinator URL configured; claims disabled");
        }

        AgentConfig agent_cfg;
        agent_cfg.max_steps = static_cast<int>(config.get_int("worker.max_steps", agent_cfg.max_steps));
        BrowserAgent agent(claude, mcp, &claims, agent_cfg);

        WorkerServer server(agent, worker_id);
        if (!server.start(config.get_string("worker.bind", "0.0.0.0"), port)) {
            LOG_ERROR("Failed to start worker server");
            exit_code = 1;
        } else {
            while (g_running && server.is_running()) {
                sleep_ms(100);
            }
        }

        LOG_INFO("Shutting down...");
        server.stop();
        mcp.disconnect();
    }

    curl_global_cleanup();
    return exit_code;
}
