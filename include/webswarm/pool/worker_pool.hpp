/*
 * webswarm - Worker Pool
 *
 * Fixed-size registry of browser workers. Brokers exclusive assignment of
 * one unit of work per worker and guarantees that a worker always returns
 * to IDLE once its assignment ends, whatever the outcome.
 *
 * Worker wire contract:
 *   GET  /health                      -> 200 when ready
 *   POST /execute {"instruction": ...} -> {"response": ..., "status": "success"|"error"}
 */
#ifndef WEBSWARM_POOL_WORKER_POOL_HPP
#define WEBSWARM_POOL_WORKER_POOL_HPP

#include "types.hpp"
#include "../core/http_client.hpp"
#include "../core/thread_pool.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <memory>

namespace webswarm {

class EventQueue;
class Config;

struct PoolOptions {
    PortLayout ports;
    long probe_timeout_ms;
    long assign_timeout_ms;  // upper bound for one remote execution

    PoolOptions() : probe_timeout_ms(5000), assign_timeout_ms(120000) {}
};

// pool.* keys, defaults as above
PoolOptions pool_options_from_config(const Config& cfg);

// pool.size (default 5); values below 1 are raised to 1 with a warning
size_t pool_size_from_config(const Config& cfg);

class WorkerPool {
public:
    // The transport must outlive the pool. events may be null.
    WorkerPool(HttpTransport& http, const PoolOptions& opts, EventQueue* events = nullptr);
    ~WorkerPool();

    // Builds `size` workers (ids 1..size) and probes them concurrently.
    // Unreachable workers stay STARTING; non-200 answers flip to ERROR.
    // Probe failures never abort initialization.
    void initialize(size_t size);

    // Re-probes every worker that is not RUNNING or STOPPING
    void check_health();

    // Up to `count` IDLE workers, without claiming them. Never blocks for
    // workers to free up.
    std::vector<WorkerEndpoint> acquire_idle(size_t count);

    // Runs one unit on a specific worker. Fails immediately (without
    // throwing) if the worker is unknown or not IDLE. The worker is reverted
    // to IDLE with its assignment cleared on every exit path.
    UnitResult assign(int worker_id, const std::string& label, const std::string& instruction);

    // Zips idle workers 1:1 with units and runs the pairs concurrently.
    // With no idle worker every unit fails; units beyond the available
    // workers are dropped from the batch.
    std::vector<UnitResult> execute_parallel(const std::vector<WorkUnit>& units);

    PoolStatus status() const;

    // Marks every worker STOPPING and stops dispatch; idempotent
    void shutdown();

    size_t capacity() const;
    bool is_shut_down() const;

private:
    WorkerPool(const WorkerPool&);
    WorkerPool& operator=(const WorkerPool&);

    bool probe(int worker_id);
    Worker* find_locked(int worker_id);
    void publish_status();

    HttpTransport& http_;
    PoolOptions opts_;
    EventQueue* events_;

    // Indexed by worker_id - 1; sized once in initialize()
    std::vector<Worker> workers_;
    mutable std::mutex mutex_;
    bool shut_down_;

    std::unique_ptr<ThreadPool> dispatch_;
};

} // namespace webswarm

#endif // WEBSWARM_POOL_WORKER_POOL_HPP
