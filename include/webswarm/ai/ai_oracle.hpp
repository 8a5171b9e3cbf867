/*
 * webswarm - Oracles backed by an AI provider
 */
#ifndef WEBSWARM_AI_AI_ORACLE_HPP
#define WEBSWARM_AI_AI_ORACLE_HPP

#include "ai.hpp"
#include "../swarm/oracle.hpp"

namespace webswarm {

// Asks the provider to classify a request. Throws SwarmError(ORACLE) when
// the provider is unavailable or its reply carries no JSON object.
class AIPlanningOracle : public PlanningOracle {
public:
    // max_agents is quoted in the prompt as the allowed target_count range
    AIPlanningOracle(AIProvider& ai, size_t max_agents);

    Json plan(const std::string& instruction);

    std::string build_prompt(const std::string& instruction) const;

private:
    AIProvider& ai_;
    size_t max_agents_;
};

// Merges findings; comparative runs ask for a winner under the criterion.
// Throws SwarmError(ORACLE) on provider failure.
class AISynthesisOracle : public SynthesisOracle {
public:
    explicit AISynthesisOracle(AIProvider& ai);

    std::string synthesize(const SynthesisRequest& request);

    std::string build_prompt(const SynthesisRequest& request) const;

private:
    AIProvider& ai_;
};

} // namespace webswarm

#endif // WEBSWARM_AI_AI_ORACLE_HPP
