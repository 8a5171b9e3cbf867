#ifndef WEBSWARM_POOL_TYPES_HPP
#define WEBSWARM_POOL_TYPES_HPP

#include "../core/json.hpp"
#include "../core/error.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace webswarm {

// Worker lifecycle state
enum class WorkerState {
    STARTING,
    IDLE,
    RUNNING,
    ERROR,
    STOPPING
};

const char* worker_state_str(WorkerState s);

// Network coordinates of one worker. All workers share the internal agent
// port; auxiliary ports are exposed per worker as base + index.
struct WorkerEndpoint {
    int worker_id;
    std::string host;
    int agent_port;
    int video_port;
    int mcp_port;
    int vnc_port;

    WorkerEndpoint() : worker_id(0), agent_port(0), video_port(0), mcp_port(0), vnc_port(0) {}

    std::string base_url() const;
};

// Port scheme shared by every worker in a pool
struct PortLayout {
    std::string host_template;  // "{id}" is replaced with the worker id
    int agent_port;
    int base_video_port;
    int base_mcp_port;
    int base_vnc_port;

    PortLayout()
        : host_template("worker-{id}")
        , agent_port(8000)
        , base_video_port(8766)
        , base_mcp_port(3011)
        , base_vnc_port(6081) {}

    // index is 0-based, worker ids are index + 1
    WorkerEndpoint endpoint_for(int index) const;
};

// Runtime state of one worker. Owned exclusively by the WorkerPool.
// current_assignment is non-empty iff state == RUNNING.
struct Worker {
    WorkerEndpoint endpoint;
    WorkerState state;
    std::string current_assignment;
    std::string assigned_label;
    int64_t started_at;
    int64_t last_heartbeat;  // 0 until the first successful probe

    Worker() : state(WorkerState::STARTING), started_at(0), last_heartbeat(0) {}

    int id() const { return endpoint.worker_id; }
};

// A single addressable piece of work. The label may be empty when the
// target is only discovered at runtime.
struct WorkUnit {
    std::string label;
    std::string instruction;

    WorkUnit() {}
    WorkUnit(const std::string& l, const std::string& i) : label(l), instruction(i) {}
};

enum class UnitStatus {
    PENDING,
    COMPLETED,
    FAILED
};

const char* unit_status_str(UnitStatus s);

// Best-effort fields pulled out of free-text worker replies
struct PartialFields {
    std::string valuation;
    std::string source;
    std::string confidence;

    PartialFields() : valuation("Unknown"), source("Unknown"), confidence("Low") {}
};

// Terminal outcome of one unit
struct UnitResult {
    int worker_id;           // 0 when no worker was ever assigned
    std::string label;
    UnitStatus status;
    std::string raw_response;
    PartialFields fields;
    std::string error;
    ErrorKind error_kind;
    double duration_seconds;

    UnitResult()
        : worker_id(0)
        , status(UnitStatus::PENDING)
        , error_kind(ErrorKind::NONE)
        , duration_seconds(0.0) {}

    bool completed() const { return status == UnitStatus::COMPLETED; }

    static UnitResult fail(int worker_id, const std::string& label,
                           ErrorKind kind, const std::string& error,
                           double duration = 0.0) {
        UnitResult r;
        r.worker_id = worker_id;
        r.label = label;
        r.status = UnitStatus::FAILED;
        r.error_kind = kind;
        r.error = error;
        r.duration_seconds = duration;
        return r;
    }

    Json to_json() const;
};

// Point-in-time view of one worker for observers
struct WorkerSnapshot {
    int worker_id;
    WorkerState state;
    std::string assigned_label;
    WorkerEndpoint endpoint;
    int64_t last_heartbeat;

    WorkerSnapshot() : worker_id(0), state(WorkerState::STARTING), last_heartbeat(0) {}
};

struct PoolStatus {
    size_t total;
    size_t idle;
    size_t running;
    size_t error;
    size_t starting;
    size_t stopping;
    std::vector<WorkerSnapshot> workers;

    PoolStatus() : total(0), idle(0), running(0), error(0), starting(0), stopping(0) {}

    Json to_json() const;
};

} // namespace webswarm

#endif // WEBSWARM_POOL_TYPES_HPP
