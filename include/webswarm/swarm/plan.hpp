#ifndef WEBSWARM_SWARM_PLAN_HPP
#define WEBSWARM_SWARM_PLAN_HPP

#include "../core/json.hpp"
#include <string>
#include <vector>

namespace webswarm {

// How a coordination request is split across agents
enum class TaskMode {
    PRE_ASSIGNED,       // one fixed instruction per agent, targets known
    DYNAMIC_DISCOVERY,  // shared template, each agent picks and claims a target
    COMPARATIVE         // dynamic discovery plus a ranked synthesis
};

// "pre_assigned" / "dynamic_discovery" / "comparative"
const char* task_mode_str(TaskMode mode);
bool parse_task_mode(const std::string& str, TaskMode& out);

// Immutable once planning completes
struct TaskPlan {
    TaskMode mode;
    std::string original_instruction;
    size_t target_count;
    std::vector<std::string> sub_instructions;  // PRE_ASSIGNED
    std::string shared_template;                // DYNAMIC_DISCOVERY, COMPARATIVE
    std::string comparison_criterion;           // COMPARATIVE

    TaskPlan() : mode(TaskMode::PRE_ASSIGNED), target_count(0) {}

    bool is_dynamic() const { return mode != TaskMode::PRE_ASSIGNED; }

    // Validates planner output of the form
    //   {"task_type": ..., "target_count": n, "sub_tasks": [...],
    //    "base_task": ..., "comparison_criteria": ...}
    // target_count is clamped to [1, capacity]. Throws SwarmError(ORACLE)
    // when the object is unusable.
    static TaskPlan from_json(const Json& data, const std::string& instruction, size_t capacity);

    // Single PRE_ASSIGNED unit carrying the instruction verbatim
    static TaskPlan fallback(const std::string& instruction);

    Json summary_json() const;
};

} // namespace webswarm

#endif // WEBSWARM_SWARM_PLAN_HPP
