#include <webswarm/swarm/plan.hpp>
#include <webswarm/core/error.hpp>
#include <webswarm/core/utils.hpp>

namespace webswarm {

const char* task_mode_str(TaskMode mode) {
    switch (mode) {
        case TaskMode::PRE_ASSIGNED: return "pre_assigned";
        case TaskMode::DYNAMIC_DISCOVERY: return "dynamic_discovery";
        case TaskMode::COMPARATIVE: return "comparative";
    }
    return "pre_assigned";
}

bool parse_task_mode(const std::string& str, TaskMode& out) {
    std::string s = to_lower(trim(str));
    if (s == "pre_assigned") { out = TaskMode::PRE_ASSIGNED; return true; }
    if (s == "dynamic_discovery") { out = TaskMode::DYNAMIC_DISCOVERY; return true; }
    if (s == "comparative") { out = TaskMode::COMPARATIVE; return true; }
    return false;
}

TaskPlan TaskPlan::from_json(const Json& data, const std::string& instruction, size_t capacity) {
    if (!data.is_object()) {
        throw SwarmError(ErrorKind::ORACLE, "plan is not a JSON object");
    }

    TaskPlan plan;
    plan.original_instruction = instruction;

    if (!data.contains("task_type") || !data["task_type"].is_string() ||
        !parse_task_mode(data["task_type"].get<std::string>(), plan.mode)) {
        throw SwarmError(ErrorKind::ORACLE, "plan has no valid task_type");
    }

    if (data.contains("sub_tasks") && data["sub_tasks"].is_array()) {
        const Json& subs = data["sub_tasks"];
        for (size_t i = 0; i < subs.size(); ++i) {
            if (subs[i].is_string() && !trim(subs[i].get<std::string>()).empty()) {
                plan.sub_instructions.push_back(subs[i].get<std::string>());
            }
        }
    }
    // Pre-assigned plans default to one agent per sub-task
    int64_t count = plan.sub_instructions.empty() ? 1 : static_cast<int64_t>(plan.sub_instructions.size());
    if (plan.mode != TaskMode::PRE_ASSIGNED) count = 1;
    if (data.contains("target_count")) {
        const Json& tc = data["target_count"];
        if (!tc.is_number_integer() && !tc.is_number_unsigned()) {
            throw SwarmError(ErrorKind::ORACLE, "plan target_count is not an integer");
        }
        count = tc.get<int64_t>();
    }
    if (count < 1) count = 1;
    size_t limit = capacity > 0 ? capacity : 1;
    plan.target_count = static_cast<size_t>(count) < limit ? static_cast<size_t>(count) : limit;

    plan.shared_template = json_string(data, "base_task");
    plan.comparison_criterion = json_string(data, "comparison_criteria");

    if (plan.mode == TaskMode::PRE_ASSIGNED) {
        if (plan.sub_instructions.empty()) {
            throw SwarmError(ErrorKind::ORACLE, "pre_assigned plan has no sub_tasks");
        }
    } else if (trim(plan.shared_template).empty()) {
        throw SwarmError(ErrorKind::ORACLE,
                         std::string(task_mode_str(plan.mode)) + " plan has no base_task");
    }

    return plan;
}

TaskPlan TaskPlan::fallback(const std::string& instruction) {
    TaskPlan plan;
    plan.mode = TaskMode::PRE_ASSIGNED;
    plan.original_instruction = instruction;
    plan.target_count = 1;
    plan.sub_instructions.push_back(instruction);
    return plan;
}

Json TaskPlan::summary_json() const {
    Json j = Json::object();
    j["task_type"] = task_mode_str(mode);
    j["target_count"] = target_count;
    j["original_prompt"] = original_instruction;
    if (mode == TaskMode::COMPARATIVE) {
        j["comparison_criteria"] = comparison_criterion;
    }
    return j;
}

} // namespace webswarm
