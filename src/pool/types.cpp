#include <webswarm/pool/types.hpp>
#include <webswarm/core/utils.hpp>
#include <sstream>

namespace webswarm {

const char* worker_state_str(WorkerState s) {
    switch (s) {
        case WorkerState::STARTING: return "starting";
        case WorkerState::IDLE: return "idle";
        case WorkerState::RUNNING: return "running";
        case WorkerState::ERROR: return "error";
        case WorkerState::STOPPING: return "stopping";
    }
    return "unknown";
}

const char* unit_status_str(UnitStatus s) {
    switch (s) {
        case UnitStatus::PENDING: return "pending";
        case UnitStatus::COMPLETED: return "completed";
        case UnitStatus::FAILED: return "failed";
    }
    return "unknown";
}

std::string WorkerEndpoint::base_url() const {
    std::ostringstream oss;
    oss << "http://" << host << ":" << agent_port;
    return oss.str();
}

WorkerEndpoint PortLayout::endpoint_for(int index) const {
    WorkerEndpoint ep;
    ep.worker_id = index + 1;
    ep.host = replace_all(host_template, "{id}", std::to_string(ep.worker_id));
    ep.agent_port = agent_port;
    ep.video_port = base_video_port + index;
    ep.mcp_port = base_mcp_port + index;
    ep.vnc_port = base_vnc_port + index;
    return ep;
}

Json UnitResult::to_json() const {
    Json j = Json::object();
    j["worker_id"] = worker_id;
    j["label"] = label;
    j["status"] = unit_status_str(status);
    j["valuation"] = fields.valuation;
    j["source"] = fields.source;
    j["confidence"] = fields.confidence;
    j["raw_response"] = raw_response;
    j["duration_seconds"] = duration_seconds;
    if (status == UnitStatus::FAILED) {
        j["error"] = error;
        j["error_kind"] = error_kind_str(error_kind);
    } else {
        j["error"] = nullptr;
    }
    return j;
}

Json PoolStatus::to_json() const {
    Json j = Json::object();
    j["total_workers"] = total;
    j["idle"] = idle;
    j["running"] = running;
    j["error"] = error;
    j["starting"] = starting;
    j["stopping"] = stopping;

    Json list = Json::array();
    for (size_t i = 0; i < workers.size(); ++i) {
        const WorkerSnapshot& w = workers[i];
        Json item = Json::object();
        item["worker_id"] = w.worker_id;
        item["status"] = worker_state_str(w.state);
        if (w.assigned_label.empty()) {
            item["assigned_label"] = nullptr;
        } else {
            item["assigned_label"] = w.assigned_label;
        }
        item["host"] = w.endpoint.host;
        item["last_heartbeat"] = w.last_heartbeat > 0 ? format_timestamp(w.last_heartbeat) : "";

        Json ports = Json::object();
        ports["agent"] = w.endpoint.agent_port;
        ports["video"] = w.endpoint.video_port;
        ports["mcp"] = w.endpoint.mcp_port;
        ports["vnc"] = w.endpoint.vnc_port;
        item["ports"] = ports;
        list.push_back(item);
    }
    j["workers"] = list;
    return j;
}

} // namespace webswarm
