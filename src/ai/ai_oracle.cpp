#include <webswarm/ai/ai_oracle.hpp>
#include <webswarm/core/error.hpp>
#include <webswarm/core/logger.hpp>
#include <webswarm/core/utils.hpp>
#include <sstream>

namespace webswarm {

namespace {

std::string format_results(const std::vector<LabelledResult>& results) {
    std::ostringstream oss;
    for (size_t i = 0; i < results.size(); ++i) {
        if (i > 0) oss << "\n\n";
        oss << "### " << results[i].label << "\n" << results[i].text;
    }
    return oss.str();
}

} // namespace

// ============================================================================
// Planning
// ============================================================================

AIPlanningOracle::AIPlanningOracle(AIProvider& ai, size_t max_agents)
    : ai_(ai)
    , max_agents_(max_agents > 0 ? max_agents : 1) {
}

std::string AIPlanningOracle::build_prompt(const std::string& instruction) const {
    std::ostringstream p;
    p << "Analyze this user request and decide how to execute it with several browser agents "
      << "working in parallel.\n\n"
      << "User request: \"" << instruction << "\"\n\n"
      << "Determine:\n"
      << "1. task_type, one of:\n"
      << "   - \"pre_assigned\": the user named the exact items (\"look up Stripe, Airbnb, Dropbox\")\n"
      << "   - \"dynamic_discovery\": the user wants N items without naming them (\"find 5 YC companies\")\n"
      << "   - \"comparative\": the user wants the best item under some criterion "
      << "(\"which YC company has the highest valuation\")\n"
      << "2. target_count: how many agents are needed (1-" << max_agents_ << ")\n"
      << "3. pre_assigned: one sub-task per agent. dynamic_discovery: the base task every agent "
      << "performs. comparative: the base task and the comparison criteria.\n\n"
      << "Respond with JSON only:\n"
      << "```json\n"
      << "{\"task_type\": \"pre_assigned\" | \"dynamic_discovery\" | \"comparative\",\n"
      << " \"target_count\": <number>,\n"
      << " \"sub_tasks\": [\"...\"],\n"
      << " \"base_task\": \"...\",\n"
      << " \"comparison_criteria\": \"...\"}\n"
      << "```\n\n"
      << "Examples:\n"
      << "\"Look up Stripe, Airbnb, and Coinbase\" -> "
      << "{\"task_type\": \"pre_assigned\", \"target_count\": 3, \"sub_tasks\": ["
      << "\"Research Stripe - find their valuation, founders, and what they do\", "
      << "\"Research Airbnb - find their valuation, founders, and what they do\", "
      << "\"Research Coinbase - find their valuation, founders, and what they do\"]}\n"
      << "\"Find 5 YC companies\" -> "
      << "{\"task_type\": \"dynamic_discovery\", \"target_count\": 5, \"base_task\": "
      << "\"Find and research one YC company. Look up their valuation, founders, and what they do. "
      << "Pick a company that hasn't been claimed yet.\"}\n"
      << "\"Which YC company has the highest valuation?\" -> "
      << "{\"task_type\": \"comparative\", \"target_count\": " << max_agents_ << ", \"base_task\": "
      << "\"Find and research one YC company. Focus on finding their current valuation.\", "
      << "\"comparison_criteria\": \"highest valuation\"}\n";
    return p.str();
}

Json AIPlanningOracle::plan(const std::string& instruction) {
    if (!ai_.is_configured()) {
        throw SwarmError(ErrorKind::ORACLE, "planning provider not configured");
    }

    CompletionOptions opts;
    opts.max_tokens = 2048;
    opts.temperature = 0.2;

    CompletionResult result = ai_.complete(build_prompt(instruction), opts);
    if (!result.success) {
        throw SwarmError(ErrorKind::ORACLE, "planning call failed: " + result.error);
    }

    std::string block = extract_json_block(result.content);
    if (block.empty()) {
        throw SwarmError(ErrorKind::ORACLE, "planner reply contains no JSON object");
    }

    Json data = parse_json_lenient(block);
    if (data.is_discarded()) {
        throw SwarmError(ErrorKind::ORACLE, "planner reply is not valid JSON");
    }
    LOG_DEBUG("Planner output: %s", block.c_str());
    return data;
}

// ============================================================================
// Synthesis
// ============================================================================

AISynthesisOracle::AISynthesisOracle(AIProvider& ai) : ai_(ai) {
}

std::string AISynthesisOracle::build_prompt(const SynthesisRequest& request) const {
    std::ostringstream p;
    if (request.mode == TaskMode::COMPARATIVE) {
        p << "Based on these research results, answer the user's original question.\n\n"
          << "Original question: \"" << request.original_instruction << "\"\n"
          << "Comparison criteria: " << request.comparison_criterion << "\n\n"
          << "Results from research:\n" << format_results(request.results) << "\n\n"
          << "Rank the candidates by the comparison criteria and clearly name the winner, "
          << "citing supporting evidence from the research.";
    } else {
        p << "Summarize these research results into one cohesive response.\n\n"
          << "Original request: \"" << request.original_instruction << "\"\n\n"
          << "Results from research:\n" << format_results(request.results) << "\n\n"
          << "Provide a clear, organized summary of all findings. Use a table if appropriate.";
    }
    return p.str();
}

std::string AISynthesisOracle::synthesize(const SynthesisRequest& request) {
    if (!ai_.is_configured()) {
        throw SwarmError(ErrorKind::ORACLE, "synthesis provider not configured");
    }

    CompletionResult result = ai_.complete(build_prompt(request));
    if (!result.success) {
        throw SwarmError(ErrorKind::ORACLE, "synthesis call failed: " + result.error);
    }
    return result.content;
}

} // namespace webswarm
