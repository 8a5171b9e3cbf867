/*
 * webswarm - Swarm Coordinator
 *
 * Runs one coordination request end to end:
 *
 *   Planning -> Dispatching -> Collecting -> Synthesizing -> Complete
 *
 * Agents are the pool's workers (agent id == worker id). Unit failures are
 * recorded per agent and never abort the run; planning and synthesis fall
 * back to local behavior when the oracles fail.
 *
 * Locking: the claim registry, the run state and the worker pool each have
 * their own mutex and none is held while acquiring another.
 */
#ifndef WEBSWARM_SWARM_COORDINATOR_HPP
#define WEBSWARM_SWARM_COORDINATOR_HPP

#include "plan.hpp"
#include "oracle.hpp"
#include "claim_registry.hpp"
#include "../core/error.hpp"
#include "../core/json.hpp"
#include <string>
#include <vector>
#include <mutex>

namespace webswarm {

class WorkerPool;
class EventQueue;

enum class AgentStatus {
    IDLE,
    WORKING,
    DONE,
    ERROR
};

const char* agent_status_str(AgentStatus s);

enum class RunPhase {
    IDLE,
    PLANNING,
    DISPATCHING,
    COLLECTING,
    SYNTHESIZING,
    COMPLETE
};

const char* run_phase_str(RunPhase p);

// Per-agent slot of the current run
struct AgentRunResult {
    int agent_id;
    std::string claimed_label;  // empty when nothing was claimed
    std::string result;
    AgentStatus status;
    std::string error;
    ErrorKind error_kind;

    AgentRunResult() : agent_id(0), status(AgentStatus::IDLE), error_kind(ErrorKind::NONE) {}

    Json to_json() const;
};

// Outcome of execute(). success is false for Complete-with-error runs;
// answer is still filled in whenever anything could be said.
struct RunReport {
    bool success;
    std::string run_id;
    std::string answer;
    std::string error;
    TaskPlan plan;
    std::vector<AgentRunResult> agents;
    bool oracle_synthesis;  // false when the raw listing fallback was used

    RunReport() : success(false), oracle_synthesis(false) {}

    Json to_json() const;
};

class SwarmCoordinator {
public:
    // All collaborators must outlive the coordinator. events may be null.
    SwarmCoordinator(WorkerPool& pool,
                     PlanningOracle& planner,
                     SynthesisOracle& synthesizer,
                     EventQueue* events = nullptr);

    // Oracle plan validated against pool capacity; never throws, falls
    // back to a single verbatim PRE_ASSIGNED unit
    TaskPlan plan(const std::string& instruction);

    // Arbitrates a target label for an agent. Publishes a claim event
    // whatever the outcome.
    bool claim(int agent_id, const std::string& label);

    // Full run. Concurrent calls are serialized.
    RunReport execute(const std::string& instruction);

    // Overwrite the agent's slot in the current run
    void submit_result(int agent_id, const std::string& text, const std::string& label);
    void submit_error(int agent_id, const std::string& error, ErrorKind kind = ErrorKind::TRANSPORT);

    // Merges DONE results of the current run. Always returns text.
    std::string synthesize();

    // run_id, phase, plan, claimed_items, agents
    Json status() const;

    RunPhase phase() const;
    std::vector<AgentRunResult> results() const;

    // Instruction sent to every agent of a dynamic run, listing the
    // labels claimed so far
    std::string build_dynamic_instruction(const TaskPlan& plan, int agent_id) const;

    // Label from a "CLAIM: <label>" line (case-insensitive), or empty
    static std::string extract_claimed_label(const std::string& text);

private:
    SwarmCoordinator(const SwarmCoordinator&);
    SwarmCoordinator& operator=(const SwarmCoordinator&);

    void run_agent(int agent_id, const std::string& instruction);
    std::string resolve_label(int agent_id, const std::string& extracted);
    std::string synthesize_impl(bool& used_oracle);
    void set_phase(RunPhase phase);
    void publish(const std::string& type, const Json& payload);
    void publish_status();

    WorkerPool& pool_;
    PlanningOracle& planner_;
    SynthesisOracle& synthesizer_;
    EventQueue* events_;

    ClaimRegistry claims_;

    std::mutex run_mutex_;          // one execute() at a time
    mutable std::mutex state_mutex_;
    std::string run_id_;
    RunPhase phase_;
    bool has_plan_;
    TaskPlan plan_;
    std::string run_error_;
    // Indexed by agent_id - 1; sized to the plan's target count per run
    std::vector<AgentRunResult> results_;
};

} // namespace webswarm

#endif // WEBSWARM_SWARM_COORDINATOR_HPP
