#include <webswarm/pool/worker_pool.hpp>
#include <webswarm/pool/field_extractor.hpp>
#include <webswarm/status/event_queue.hpp>
#include <webswarm/core/config.hpp>
#include <webswarm/core/logger.hpp>
#include <webswarm/core/utils.hpp>
#include <functional>
#include <future>
#include <sstream>

namespace webswarm {

namespace {

// Runs the stored action when the scope ends, including on exceptions
class ScopeExit {
public:
    explicit ScopeExit(const std::function<void()>& fn) : fn_(fn) {}
    ~ScopeExit() { fn_(); }

private:
    ScopeExit(const ScopeExit&);
    ScopeExit& operator=(const ScopeExit&);

    std::function<void()> fn_;
};

double seconds_since(int64_t start_ms) {
    return static_cast<double>(monotonic_ms() - start_ms) / 1000.0;
}

} // namespace

PoolOptions pool_options_from_config(const Config& cfg) {
    PoolOptions opts;
    opts.ports.host_template = cfg.get_string("pool.host_template", opts.ports.host_template);
    opts.ports.agent_port = static_cast<int>(cfg.get_int("pool.agent_port", opts.ports.agent_port));
    opts.ports.base_video_port = static_cast<int>(cfg.get_int("pool.base_video_port", opts.ports.base_video_port));
    opts.ports.base_mcp_port = static_cast<int>(cfg.get_int("pool.base_mcp_port", opts.ports.base_mcp_port));
    opts.ports.base_vnc_port = static_cast<int>(cfg.get_int("pool.base_vnc_port", opts.ports.base_vnc_port));
    opts.probe_timeout_ms = static_cast<long>(cfg.get_int("pool.probe_timeout_ms", opts.probe_timeout_ms));
    opts.assign_timeout_ms = static_cast<long>(cfg.get_int("pool.assign_timeout_ms", opts.assign_timeout_ms));
    return opts;
}

size_t pool_size_from_config(const Config& cfg) {
    int64_t size = cfg.get_int("pool.size", 5);
    if (size < 1) {
        LOG_WARN("pool.size %lld is invalid, using 1 worker", static_cast<long long>(size));
        return 1;
    }
    return static_cast<size_t>(size);
}

WorkerPool::WorkerPool(HttpTransport& http, const PoolOptions& opts, EventQueue* events)
    : http_(http)
    , opts_(opts)
    , events_(events)
    , shut_down_(false) {
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::initialize(size_t size) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!workers_.empty()) {
            LOG_WARN("Worker pool already initialized with %zu workers", workers_.size());
            return;
        }

        LOG_INFO("Initializing worker pool with %zu workers", size);
        workers_.resize(size);
        int64_t now = current_timestamp();
        for (size_t i = 0; i < size; ++i) {
            Worker& w = workers_[i];
            w.endpoint = opts_.ports.endpoint_for(static_cast<int>(i));
            w.state = WorkerState::STARTING;
            w.started_at = now;
            LOG_INFO("Worker %d configured: host=%s agent=%d video=%d mcp=%d vnc=%d",
                     w.id(), w.endpoint.host.c_str(), w.endpoint.agent_port,
                     w.endpoint.video_port, w.endpoint.mcp_port, w.endpoint.vnc_port);
        }
        dispatch_.reset(new ThreadPool(size > 0 ? size : 1, "worker-dispatch"));
    }

    check_health();
}

void WorkerPool::check_health() {
    std::vector<int> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) return;
        for (size_t i = 0; i < workers_.size(); ++i) {
            if (workers_[i].state != WorkerState::RUNNING &&
                workers_[i].state != WorkerState::STOPPING) {
                targets.push_back(workers_[i].id());
            }
        }
    }

    std::vector<std::future<bool> > probes;
    for (size_t i = 0; i < targets.size(); ++i) {
        int id = targets[i];
        try {
            probes.push_back(dispatch_->submit([this, id]() { return probe(id); }));
        } catch (const std::exception& e) {
            LOG_WARN("Could not schedule health probe for worker %d: %s", id, e.what());
        }
    }

    size_t healthy = 0;
    for (size_t i = 0; i < probes.size(); ++i) {
        try {
            if (probes[i].get()) ++healthy;
        } catch (const std::exception& e) {
            LOG_WARN("Health probe failed: %s", e.what());
        }
    }

    LOG_INFO("Health check: %zu/%zu probed workers healthy", healthy, targets.size());
    publish_status();
}

bool WorkerPool::probe(int worker_id) {
    WorkerEndpoint ep;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Worker* w = find_locked(worker_id);
        if (!w) return false;
        ep = w->endpoint;
    }

    HttpResponse resp = http_.get(ep.base_url() + "/health", HttpHeaders(), opts_.probe_timeout_ms);

    std::lock_guard<std::mutex> lock(mutex_);
    Worker* w = find_locked(worker_id);
    // An assignment may have started while the probe was in flight
    if (!w || w->state == WorkerState::RUNNING || w->state == WorkerState::STOPPING) {
        return false;
    }

    if (resp.transport_failed()) {
        // Worker might not be up yet, that's okay during startup
        w->state = WorkerState::STARTING;
        LOG_DEBUG("Worker %d not reachable yet: %s", worker_id, resp.error.c_str());
        return false;
    }

    if (resp.status_code == 200) {
        if (w->state != WorkerState::IDLE) {
            LOG_INFO("Worker %d is healthy", worker_id);
        }
        w->state = WorkerState::IDLE;
        w->last_heartbeat = current_timestamp();
        return true;
    }

    w->state = WorkerState::ERROR;
    LOG_WARN("Worker %d returned status %ld", worker_id, resp.status_code);
    return false;
}

Worker* WorkerPool::find_locked(int worker_id) {
    if (worker_id < 1 || static_cast<size_t>(worker_id) > workers_.size()) {
        return nullptr;
    }
    return &workers_[worker_id - 1];
}

std::vector<WorkerEndpoint> WorkerPool::acquire_idle(size_t count) {
    std::vector<WorkerEndpoint> result;
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) return result;
    for (size_t i = 0; i < workers_.size() && result.size() < count; ++i) {
        if (workers_[i].state == WorkerState::IDLE) {
            result.push_back(workers_[i].endpoint);
        }
    }
    return result;
}

UnitResult WorkerPool::assign(int worker_id, const std::string& label, const std::string& instruction) {
    WorkerEndpoint ep;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return UnitResult::fail(worker_id, label, ErrorKind::STATE_CONFLICT,
                                    "Worker pool is shut down");
        }
        Worker* w = find_locked(worker_id);
        if (!w) {
            return UnitResult::fail(worker_id, label, ErrorKind::STATE_CONFLICT,
                                    "Worker " + std::to_string(worker_id) + " not found");
        }
        if (w->state != WorkerState::IDLE) {
            return UnitResult::fail(worker_id, label, ErrorKind::STATE_CONFLICT,
                                    "Worker " + std::to_string(worker_id) + " is not idle (status: " +
                                    worker_state_str(w->state) + ")");
        }
        w->state = WorkerState::RUNNING;
        w->current_assignment = instruction;
        w->assigned_label = label;
        ep = w->endpoint;
    }

    LOG_INFO("Worker %d assigned '%s'", worker_id, label.empty() ? "(unlabelled)" : label.c_str());
    publish_status();

    ScopeExit release([this, worker_id]() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            Worker* w = find_locked(worker_id);
            if (w) {
                if (w->state == WorkerState::RUNNING) {
                    w->state = WorkerState::IDLE;
                }
                w->current_assignment.clear();
                w->assigned_label.clear();
            }
        }
        publish_status();
    });

    int64_t start = monotonic_ms();

    try {
        Json request = Json::object();
        request["instruction"] = instruction;

        HttpResponse resp = http_.post_json(ep.base_url() + "/execute", request.dump(),
                                            HttpHeaders(), opts_.assign_timeout_ms);
        double duration = seconds_since(start);

        if (resp.transport_failed()) {
            std::ostringstream err;
            if (resp.timed_out) {
                err << "Worker " << worker_id << " timed out after " << opts_.assign_timeout_ms << " ms";
            } else {
                err << "Worker " << worker_id << " unreachable: " << resp.error;
            }
            LOG_ERROR("Error executing task on worker %d: %s", worker_id, err.str().c_str());
            return UnitResult::fail(worker_id, label, ErrorKind::TRANSPORT, err.str(), duration);
        }

        if (resp.status_code != 200) {
            LOG_WARN("Worker %d returned status %ld", worker_id, resp.status_code);
            return UnitResult::fail(worker_id, label, ErrorKind::PROTOCOL,
                                    "Worker returned status " + std::to_string(resp.status_code),
                                    duration);
        }

        Json body = resp.json();
        if (body.is_discarded() || !body.is_object()) {
            return UnitResult::fail(worker_id, label, ErrorKind::PROTOCOL,
                                    "Worker returned a malformed response", duration);
        }

        std::string text = json_string(body, "response");
        if (json_string(body, "status", "success") == "error") {
            LOG_WARN("Worker %d reported failure: %s", worker_id, truncate_safe(text, 200).c_str());
            return UnitResult::fail(worker_id, label, ErrorKind::PROTOCOL,
                                    text.empty() ? "Worker reported an error" : text, duration);
        }

        UnitResult result;
        result.worker_id = worker_id;
        result.label = label;
        result.status = UnitStatus::COMPLETED;
        result.raw_response = text;
        result.fields = extract_structured_fields(text);
        result.duration_seconds = duration;
        LOG_INFO("Worker %d completed '%s' in %.1fs", worker_id,
                 label.empty() ? "(unlabelled)" : label.c_str(), duration);
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("Error executing task on worker %d: %s", worker_id, e.what());
        return UnitResult::fail(worker_id, label, ErrorKind::TRANSPORT, e.what(), seconds_since(start));
    }
}

std::vector<UnitResult> WorkerPool::execute_parallel(const std::vector<WorkUnit>& units) {
    std::vector<UnitResult> results;
    if (units.empty()) return results;

    std::vector<WorkerEndpoint> idle = acquire_idle(units.size());
    if (idle.empty()) {
        LOG_WARN("No idle workers available");
        for (size_t i = 0; i < units.size(); ++i) {
            results.push_back(UnitResult::fail(0, units[i].label, ErrorKind::STATE_CONFLICT,
                                               "No idle workers available"));
        }
        return results;
    }

    if (idle.size() < units.size()) {
        LOG_WARN("Only %zu idle workers for %zu units; %zu units dropped from this batch",
                 idle.size(), units.size(), units.size() - idle.size());
    }

    std::vector<std::future<UnitResult> > pending;
    std::vector<size_t> pending_units;
    for (size_t i = 0; i < idle.size(); ++i) {
        int worker_id = idle[i].worker_id;
        WorkUnit unit = units[i];
        try {
            pending.push_back(dispatch_->submit([this, worker_id, unit]() {
                return assign(worker_id, unit.label, unit.instruction);
            }));
            pending_units.push_back(i);
        } catch (const std::exception& e) {
            results.push_back(UnitResult::fail(worker_id, unit.label, ErrorKind::STATE_CONFLICT, e.what()));
        }
    }

    for (size_t i = 0; i < pending.size(); ++i) {
        try {
            results.push_back(pending[i].get());
        } catch (const std::exception& e) {
            const WorkUnit& unit = units[pending_units[i]];
            results.push_back(UnitResult::fail(idle[pending_units[i]].worker_id, unit.label,
                                               ErrorKind::TRANSPORT, e.what()));
        }
    }
    return results;
}

PoolStatus WorkerPool::status() const {
    PoolStatus st;
    std::lock_guard<std::mutex> lock(mutex_);
    st.total = workers_.size();
    for (size_t i = 0; i < workers_.size(); ++i) {
        const Worker& w = workers_[i];
        switch (w.state) {
            case WorkerState::IDLE: ++st.idle; break;
            case WorkerState::RUNNING: ++st.running; break;
            case WorkerState::ERROR: ++st.error; break;
            case WorkerState::STARTING: ++st.starting; break;
            case WorkerState::STOPPING: ++st.stopping; break;
        }

        WorkerSnapshot snap;
        snap.worker_id = w.id();
        snap.state = w.state;
        snap.assigned_label = w.assigned_label;
        snap.endpoint = w.endpoint;
        snap.last_heartbeat = w.last_heartbeat;
        st.workers.push_back(snap);
    }
    return st;
}

void WorkerPool::publish_status() {
    if (!events_) return;
    events_->publish("pool_status", status().to_json());
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) return;
        shut_down_ = true;
        LOG_INFO("Shutting down worker pool");
        for (size_t i = 0; i < workers_.size(); ++i) {
            workers_[i].state = WorkerState::STOPPING;
        }
    }

    // Lets in-flight assignments finish and release their workers
    if (dispatch_) {
        dispatch_->shutdown();
    }
    publish_status();
}

size_t WorkerPool::capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

bool WorkerPool::is_shut_down() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shut_down_;
}

} // namespace webswarm
