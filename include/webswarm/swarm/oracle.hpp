/*
 * webswarm - Reasoning oracles
 *
 * The coordinator consults an external reasoning service twice per run:
 * once to classify the request into a TaskPlan, once to merge the agents'
 * findings. Both are fallible; implementations may throw SwarmError or
 * any std::exception and the coordinator degrades gracefully.
 */
#ifndef WEBSWARM_SWARM_ORACLE_HPP
#define WEBSWARM_SWARM_ORACLE_HPP

#include "plan.hpp"
#include "../core/json.hpp"
#include <string>
#include <vector>

namespace webswarm {

class PlanningOracle {
public:
    virtual ~PlanningOracle() {}

    // Raw planner object (task_type, target_count, sub_tasks, base_task,
    // comparison_criteria). Validation happens in TaskPlan::from_json.
    virtual Json plan(const std::string& instruction) = 0;
};

struct LabelledResult {
    std::string label;
    std::string text;

    LabelledResult() {}
    LabelledResult(const std::string& l, const std::string& t) : label(l), text(t) {}
};

struct SynthesisRequest {
    TaskMode mode;
    std::string original_instruction;
    std::string comparison_criterion;  // COMPARATIVE only
    std::vector<LabelledResult> results;

    SynthesisRequest() : mode(TaskMode::PRE_ASSIGNED) {}
};

class SynthesisOracle {
public:
    virtual ~SynthesisOracle() {}

    virtual std::string synthesize(const SynthesisRequest& request) = 0;
};

} // namespace webswarm

#endif // WEBSWARM_SWARM_ORACLE_HPP
