#include <webswarm/swarm/coordinator.hpp>
#include <webswarm/pool/worker_pool.hpp>
#include <webswarm/status/event_queue.hpp>
#include <webswarm/core/thread_pool.hpp>
#include <webswarm/core/logger.hpp>
#include <webswarm/core/utils.hpp>
#include <sstream>
#include <future>

namespace webswarm {

const char* agent_status_str(AgentStatus s) {
    switch (s) {
        case AgentStatus::IDLE: return "idle";
        case AgentStatus::WORKING: return "working";
        case AgentStatus::DONE: return "done";
        case AgentStatus::ERROR: return "error";
    }
    return "idle";
}

const char* run_phase_str(RunPhase p) {
    switch (p) {
        case RunPhase::IDLE: return "idle";
        case RunPhase::PLANNING: return "planning";
        case RunPhase::DISPATCHING: return "dispatching";
        case RunPhase::COLLECTING: return "collecting";
        case RunPhase::SYNTHESIZING: return "synthesizing";
        case RunPhase::COMPLETE: return "complete";
    }
    return "idle";
}

namespace {

Json nullable(const std::string& s) {
    return s.empty() ? Json(nullptr) : Json(s);
}

std::string display_label(const AgentRunResult& r) {
    return r.claimed_label.empty() ? "Agent " + std::to_string(r.agent_id) : r.claimed_label;
}

std::string raw_listing(const std::vector<LabelledResult>& results) {
    std::ostringstream oss;
    oss << "## Results\n\n";
    for (size_t i = 0; i < results.size(); ++i) {
        if (i > 0) oss << "\n\n";
        oss << "### " << results[i].label << "\n" << results[i].text;
    }
    return oss.str();
}

} // namespace

Json AgentRunResult::to_json() const {
    Json j = Json::object();
    j["agent_id"] = agent_id;
    j["status"] = agent_status_str(status);
    j["claimed_item"] = nullable(claimed_label);
    j["has_result"] = status == AgentStatus::DONE;
    j["error"] = nullable(error);
    if (status == AgentStatus::ERROR) {
        j["error_kind"] = error_kind_str(error_kind);
    }
    return j;
}

Json RunReport::to_json() const {
    Json j = Json::object();
    j["run_id"] = run_id;
    j["status"] = success ? "success" : "error";
    j["result"] = answer;
    j["error"] = nullable(error);
    j["plan"] = plan.summary_json();
    j["synthesized"] = oracle_synthesis;

    Json list = Json::array();
    for (size_t i = 0; i < agents.size(); ++i) {
        list.push_back(agents[i].to_json());
    }
    j["agents"] = list;
    return j;
}

// ============================================================================
// SwarmCoordinator
// ============================================================================

SwarmCoordinator::SwarmCoordinator(WorkerPool& pool,
                                   PlanningOracle& planner,
                                   SynthesisOracle& synthesizer,
                                   EventQueue* events)
    : pool_(pool)
    , planner_(planner)
    , synthesizer_(synthesizer)
    , events_(events)
    , phase_(RunPhase::IDLE)
    , has_plan_(false) {
}

TaskPlan SwarmCoordinator::plan(const std::string& instruction) {
    try {
        Json data = planner_.plan(instruction);
        TaskPlan p = TaskPlan::from_json(data, instruction, pool_.capacity());
        LOG_INFO("Parsed prompt into plan: %s, %zu agents", task_mode_str(p.mode), p.target_count);
        return p;
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing prompt, using single-unit plan: %s", e.what());
        return TaskPlan::fallback(instruction);
    }
}

bool SwarmCoordinator::claim(int agent_id, const std::string& label) {
    bool approved = claims_.claim(agent_id, label);
    if (approved) {
        LOG_INFO("Agent %d claimed '%s'", agent_id, trim(label).c_str());
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (agent_id >= 1 && static_cast<size_t>(agent_id) <= results_.size()) {
            results_[agent_id - 1].claimed_label = trim(label);
        }
    } else {
        LOG_INFO("Agent %d denied claim for '%s' - already claimed", agent_id, trim(label).c_str());
    }

    Json payload = Json::object();
    payload["agent_id"] = agent_id;
    payload["label"] = label;
    payload["approved"] = approved;
    publish("claim", payload);
    publish_status();
    return approved;
}

std::string SwarmCoordinator::build_dynamic_instruction(const TaskPlan& plan, int agent_id) const {
    std::vector<std::string> claimed = claims_.labels();
    std::string claimed_list = claimed.empty() ? "none yet" : join(claimed, ", ");

    std::ostringstream oss;
    oss << plan.shared_template << "\n\n"
        << "IMPORTANT: Before researching any item, you must claim it first to avoid duplicates.\n"
        << "Already claimed by other agents: " << claimed_list << "\n\n"
        << "To claim an item, include in your response:\n"
        << "CLAIM: <item name>\n\n"
        << "Only proceed with research after your claim is confirmed.\n"
        << "If your claim is rejected (item already taken), try a different item.\n\n"
        << "You are Agent " << agent_id << " of " << plan.target_count << ".";
    return oss.str();
}

std::string SwarmCoordinator::extract_claimed_label(const std::string& text) {
    std::vector<std::string> labels = claim_labels(text);
    return labels.empty() ? std::string() : labels[0];
}

std::string SwarmCoordinator::resolve_label(int agent_id, const std::string& extracted) {
    std::string approved = claims_.label_for(agent_id);
    if (!approved.empty()) return approved;
    if (extracted.empty()) return "";

    int owner = claims_.owner(extracted);
    if (owner != 0 && owner != agent_id) {
        LOG_INFO("Agent %d reported '%s' but agent %d owns it", agent_id, extracted.c_str(), owner);
        return "";
    }
    // Unclaimed: register it now so no other agent can report it too
    return claim(agent_id, extracted) ? extracted : std::string();
}

void SwarmCoordinator::run_agent(int agent_id, const std::string& instruction) {
    LOG_INFO("Sending task to agent %d: %s", agent_id, truncate_safe(instruction, 100).c_str());

    UnitResult unit = pool_.assign(agent_id, "", instruction);
    if (unit.completed()) {
        std::string label = resolve_label(agent_id, extract_claimed_label(unit.raw_response));
        submit_result(agent_id, unit.raw_response, label);
    } else {
        submit_error(agent_id, unit.error, unit.error_kind);
    }
}

RunReport SwarmCoordinator::execute(const std::string& instruction) {
    std::lock_guard<std::mutex> run_lock(run_mutex_);
    int64_t start = monotonic_ms();

    RunReport report;
    claims_.clear();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        run_id_ = generate_short_id();
        results_.clear();
        has_plan_ = false;
        plan_ = TaskPlan();
        run_error_.clear();
        phase_ = RunPhase::PLANNING;
        report.run_id = run_id_;
    }

    if (trim(instruction).empty()) {
        report.error = "Empty instruction";
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            run_error_ = report.error;
            phase_ = RunPhase::COMPLETE;
        }
        Json payload = Json::object();
        payload["run_id"] = report.run_id;
        payload["error"] = report.error;
        publish("swarm_error", payload);
        publish_status();
        return report;
    }

    Json started = Json::object();
    started["run_id"] = report.run_id;
    started["prompt"] = instruction;
    publish("swarm_started", started);
    publish_status();

    TaskPlan p = plan(instruction);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        plan_ = p;
        has_plan_ = true;
        phase_ = RunPhase::DISPATCHING;
        results_.resize(p.target_count);
        for (size_t i = 0; i < results_.size(); ++i) {
            results_[i].agent_id = static_cast<int>(i) + 1;
        }
    }
    LOG_INFO("Starting swarm execution: %s, %zu agents", task_mode_str(p.mode), p.target_count);
    publish_status();

    std::vector<int> agent_ids;
    std::vector<std::string> instructions;
    for (size_t i = 0; i < p.target_count; ++i) {
        int agent_id = static_cast<int>(i) + 1;
        if (p.is_dynamic()) {
            instructions.push_back(build_dynamic_instruction(p, agent_id));
        } else if (i < p.sub_instructions.size()) {
            instructions.push_back(p.sub_instructions[i]);
        } else {
            continue;
        }
        agent_ids.push_back(agent_id);
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (size_t i = 0; i < agent_ids.size(); ++i) {
            results_[agent_ids[i] - 1].status = AgentStatus::WORKING;
        }
        phase_ = RunPhase::COLLECTING;
    }
    publish_status();

    if (!agent_ids.empty()) {
        ThreadPool runners(agent_ids.size(), "swarm-agents");
        std::vector<std::future<void> > pending;
        std::vector<int> pending_ids;
        for (size_t i = 0; i < agent_ids.size(); ++i) {
            int agent_id = agent_ids[i];
            std::string unit = instructions[i];
            try {
                pending.push_back(runners.submit([this, agent_id, unit]() { run_agent(agent_id, unit); }));
                pending_ids.push_back(agent_id);
            } catch (const std::exception& e) {
                submit_error(agent_id, e.what(), ErrorKind::STATE_CONFLICT);
            }
        }

        // Siblings keep running whatever happens to one agent
        for (size_t i = 0; i < pending.size(); ++i) {
            try {
                pending[i].get();
            } catch (const std::exception& e) {
                LOG_ERROR("Agent %d task failed: %s", pending_ids[i], e.what());
                submit_error(pending_ids[i], e.what());
            }
        }
    }

    set_phase(RunPhase::SYNTHESIZING);
    publish_status();

    bool used_oracle = false;
    std::string answer = synthesize_impl(used_oracle);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        report.plan = plan_;
        report.agents = results_;
    }

    size_t done = 0;
    std::ostringstream failures;
    for (size_t i = 0; i < report.agents.size(); ++i) {
        const AgentRunResult& r = report.agents[i];
        if (r.status == AgentStatus::DONE) {
            ++done;
        } else if (r.status == AgentStatus::ERROR) {
            failures << "\n- " << display_label(r) << " (" << error_kind_str(r.error_kind)
                     << "): " << r.error;
        }
    }
    if (!failures.str().empty()) {
        answer += "\n\n### Failed agents" + failures.str();
    }

    report.answer = answer;
    report.oracle_synthesis = used_oracle;
    report.success = done > 0;
    if (!report.success) {
        report.error = "No results collected from agents";
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        run_error_ = report.error;
        phase_ = RunPhase::COMPLETE;
    }

    double elapsed = static_cast<double>(monotonic_ms() - start) / 1000.0;
    LOG_INFO("Swarm execution completed in %.1fs: %zu/%zu agents succeeded",
             elapsed, done, agent_ids.size());

    Json payload = Json::object();
    payload["run_id"] = report.run_id;
    payload["result"] = report.answer;
    if (!report.success) payload["error"] = report.error;
    publish(report.success ? "swarm_complete" : "swarm_error", payload);
    publish_status();
    return report;
}

void SwarmCoordinator::submit_result(int agent_id, const std::string& text, const std::string& label) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (agent_id < 1 || static_cast<size_t>(agent_id) > results_.size()) {
            LOG_WARN("Result from agent %d ignored: not part of the current run", agent_id);
            return;
        }
        AgentRunResult& r = results_[agent_id - 1];
        r.claimed_label = label;
        r.result = text;
        r.status = AgentStatus::DONE;
        r.error.clear();
        r.error_kind = ErrorKind::NONE;
    }
    LOG_INFO("Agent %d submitted result for '%s'", agent_id, label.empty() ? "(none)" : label.c_str());
    publish_status();
}

void SwarmCoordinator::submit_error(int agent_id, const std::string& error, ErrorKind kind) {
    std::string claimed = claims_.label_for(agent_id);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (agent_id < 1 || static_cast<size_t>(agent_id) > results_.size()) {
            LOG_WARN("Error from agent %d ignored: not part of the current run", agent_id);
            return;
        }
        AgentRunResult& r = results_[agent_id - 1];
        r.claimed_label = claimed;
        r.result.clear();
        r.status = AgentStatus::ERROR;
        r.error = error;
        r.error_kind = kind;
    }
    LOG_ERROR("Agent %d reported error: %s", agent_id, error.c_str());
    publish_status();
}

std::string SwarmCoordinator::synthesize() {
    bool used_oracle = false;
    return synthesize_impl(used_oracle);
}

std::string SwarmCoordinator::synthesize_impl(bool& used_oracle) {
    used_oracle = false;

    SynthesisRequest req;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!has_plan_) {
            return "No task plan found.";
        }
        req.mode = plan_.mode;
        req.original_instruction = plan_.original_instruction;
        req.comparison_criterion = plan_.comparison_criterion;
        for (size_t i = 0; i < results_.size(); ++i) {
            if (results_[i].status == AgentStatus::DONE) {
                req.results.push_back(LabelledResult(display_label(results_[i]), results_[i].result));
            }
        }
    }

    if (req.results.empty()) {
        return "No results collected from agents.";
    }

    try {
        std::string text = synthesizer_.synthesize(req);
        if (!trim(text).empty()) {
            used_oracle = true;
            return text;
        }
        LOG_WARN("Synthesis returned no text, listing raw results");
    } catch (const std::exception& e) {
        LOG_ERROR("Error synthesizing results: %s", e.what());
    }
    return raw_listing(req.results);
}

Json SwarmCoordinator::status() const {
    std::vector<std::string> claimed = claims_.labels();

    Json j = Json::object();
    std::lock_guard<std::mutex> lock(state_mutex_);
    j["run_id"] = nullable(run_id_);
    j["phase"] = run_phase_str(phase_);
    j["error"] = nullable(run_error_);
    j["plan"] = has_plan_ ? plan_.summary_json() : Json(nullptr);
    j["claimed_items"] = claimed;

    Json agents = Json::object();
    for (size_t i = 0; i < results_.size(); ++i) {
        const AgentRunResult& r = results_[i];
        Json a = Json::object();
        a["status"] = agent_status_str(r.status);
        a["claimed_item"] = nullable(r.claimed_label);
        a["has_result"] = r.status == AgentStatus::DONE;
        a["error"] = nullable(r.error);
        agents[std::to_string(r.agent_id)] = a;
    }
    j["agents"] = agents;
    return j;
}

RunPhase SwarmCoordinator::phase() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return phase_;
}

std::vector<AgentRunResult> SwarmCoordinator::results() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return results_;
}

void SwarmCoordinator::set_phase(RunPhase phase) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    phase_ = phase;
}

void SwarmCoordinator::publish(const std::string& type, const Json& payload) {
    if (events_) events_->publish(type, payload);
}

void SwarmCoordinator::publish_status() {
    if (!events_) return;
    events_->publish("swarm_status", status());
}

} // namespace webswarm
