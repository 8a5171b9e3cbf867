/*
 * webswarm orchestrator
 *
 * Owns the worker pool, the swarm coordinator and the status channel, and
 * serves them over HTTP/WebSocket.
 *
 * Usage:
 *   ./webswarm-orchestrator [config.json]
 */

#include <webswarm/core/logger.hpp>
#include <webswarm/core/config.hpp>
#include <webswarm/core/utils.hpp>
#include <webswarm/core/http_client.hpp>
#include <webswarm/status/event_queue.hpp>
#include <webswarm/status/status_channel.hpp>
#include <webswarm/pool/worker_pool.hpp>
#include <webswarm/swarm/coordinator.hpp>
#include <webswarm/ai/claude.hpp>
#include <webswarm/ai/ai_oracle.hpp>
#include <webswarm/gateway/orchestrator_server.hpp>

#include <iostream>
#include <csignal>
#include <cstring>
#include <curl/curl.h>

namespace {

static const char* APP_VERSION = "0.3.0";

volatile std::sig_atomic_t g_running = 1;

void signal_handler(int sig) {
    (void)sig;
    g_running = 0;
}

void print_usage(const char* prog) {
    std::cout << "webswarm orchestrator v" << APP_VERSION << "\n\n"
              << "Usage: " << prog << " [options] [config.json]\n\n"
              << "Options:\n"
              << "  -h, --help     Show this help message\n\n"
              << "Config file format (JSON):\n"
              << "  {\n"
              << "    \"log\": { \"level\": \"info\" },\n"
              << "    \"pool\": { \"size\": 5, \"host_template\": \"worker-{id}\" },\n"
              << "    \"gateway\": { \"port\": 8100 },\n"
              << "    \"claude\": { \"api_key\": \"...\" }\n"
              << "  }\n\n"
              << "Every key can also be set from the environment, e.g. WEBSWARM_POOL_SIZE.\n";
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace webswarm;

    const char* config_file = NULL;
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        config_file = argv[i];
    }

    // Initialize libcurl globally (must be done before any threads start)
    curl_global_init(CURL_GLOBAL_ALL);

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    Config config;
    if (config_file) {
        if (!config.load_file(config_file)) {
            LOG_WARN("Failed to load config from %s, using defaults", config_file);
        } else {
            LOG_INFO("Loaded config from %s", config_file);
        }
    }
    Logger::instance().set_level(parse_log_level(config.get_string("log.level", "info")));

    LOG_INFO("webswarm orchestrator v%s starting...", APP_VERSION);

    int exit_code = 0;
    {
        HttpClient http;
        EventQueue events;
        StatusChannel channel(events);
        channel.start();

        WorkerPool pool(http, pool_options_from_config(config), &events);
        pool.initialize(pool_size_from_config(config));

        ClaudeProvider claude(http);
        if (!claude.init(config)) {
            LOG_WARN("No Claude API key configured; planning and synthesis will use fallbacks");
        }
        AIPlanningOracle planner(claude, pool.capacity());
        AISynthesisOracle synthesizer(claude);
        SwarmCoordinator coordinator(pool, planner, synthesizer, &events);

        GatewayOptions gopts;
        gopts.bind = config.get_string("gateway.bind", gopts.bind);
        gopts.port = static_cast<int>(config.get_int("gateway.port", gopts.port));
        gopts.public_host = config.get_string("gateway.public_host", gopts.public_host);

        OrchestratorServer server(pool, coordinator, channel, popts.ports, gopts);
        if (!server.start()) {
            LOG_ERROR("Failed to start orchestrator server");
            exit_code = 1;
        } else {
            int64_t interval_ms = config.get_int("pool.health_interval_s", 30) * 1000;
            int64_t next_check = monotonic_ms() + interval_ms;

            LOG_INFO("Entering main loop");
            while (g_running && server.is_running()) {
                sleep_ms(100);
                if (interval_ms > 0 && monotonic_ms() >= next_check) {
                    pool.check_health();
                    next_check = monotonic_ms() + interval_ms;
                }
            }
        }

        LOG_INFO("Shutting down...");
        server.stop();
        pool.shutdown();
        events.close();
        channel.stop();
    }

    curl_global_cleanup();
    LOG_INFO("Goodbye!");
    return exit_code;
}
