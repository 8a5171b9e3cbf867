/*
 * webswarm - Browser agent
 *
 * Runs on a worker. Drives the reasoning provider in a loop, executing the
 * browser operations it asks for through the automation protocol client:
 *
 *   <tool_call name="browser_navigate">{"url": "https://..."}</tool_call>
 *
 * Lines of the form "CLAIM: <label>" are forwarded to the coordinator's
 * claim endpoint and the verdict is fed back to the model, which is
 * expected to pick another target when a claim is rejected.
 */
#ifndef WEBSWARM_AGENT_BROWSER_AGENT_HPP
#define WEBSWARM_AGENT_BROWSER_AGENT_HPP

#include "../ai/ai.hpp"
#include "../mcp/mcp_client.hpp"
#include "../core/http_client.hpp"
#include "../core/json.hpp"
#include <string>
#include <vector>
#include <set>

namespace webswarm {

// ============================================================================
// Claims
// ============================================================================

enum class ClaimOutcome {
    APPROVED,
    REJECTED,
    UNAVAILABLE  // no coordinator configured or it could not be reached
};

// POST {coordinator}/swarm/claim {"agent_id", "item"} -> {"approved"}
class ClaimGateway {
public:
    // An empty coordinator_url disables claiming
    ClaimGateway(HttpTransport& http, const std::string& coordinator_url, int agent_id);

    ClaimOutcome request(const std::string& label);

    bool enabled() const { return !url_.empty(); }
    int agent_id() const { return agent_id_; }

private:
    HttpTransport& http_;
    std::string url_;
    int agent_id_;
};

// ============================================================================
// Agent loop
// ============================================================================

struct ParsedToolCall {
    std::string tool_name;
    Json params;
    std::string raw_content;
    size_t start_pos;
    size_t end_pos;
    bool valid;
    std::string parse_error;

    ParsedToolCall() : params(Json::object()), start_pos(0), end_pos(0), valid(false) {}
};

struct AgentConfig {
    int max_steps;                  // Model round trips per instruction
    int max_consecutive_errors;     // Stop after this many failed model calls
    size_t max_tool_result_size;    // Tool output beyond this is truncated

    AgentConfig()
        : max_steps(8)
        , max_consecutive_errors(3)
        , max_tool_result_size(15000) {}
};

struct AgentResult {
    bool success;
    std::string final_response;
    std::string error;
    int iterations;
    int tool_calls_made;
    std::string claimed_label;      // last approved claim

    AgentResult() : success(false), iterations(0), tool_calls_made(0) {}
};

class BrowserAgent {
public:
    // claims may be null (no claim forwarding)
    BrowserAgent(AIProvider& ai, McpClient& mcp, ClaimGateway* claims,
                 const AgentConfig& config = AgentConfig());

    AgentResult run(const std::string& instruction);

    std::string build_system_prompt() const;

    std::vector<ParsedToolCall> parse_tool_calls(const std::string& response) const;

    std::string format_tool_result(const std::string& tool_name, const OperationResult& result) const;

    // Text outside the tool call blocks, trimmed
    std::string extract_response_text(const std::string& response,
                                      const std::vector<ParsedToolCall>& calls) const;

    // Every "CLAIM: <label>" line, in order
    static std::vector<std::string> extract_claims(const std::string& response);

private:
    // Forwards claims not requested before; returns feedback for the model
    // (empty when nothing was claimed) and sets rejected when any claim lost
    std::string process_claims(const std::string& response, std::set<std::string>& requested,
                               AgentResult& result, bool& rejected);

    AIProvider& ai_;
    McpClient& mcp_;
    ClaimGateway* claims_;
    AgentConfig config_;
};

} // namespace webswarm

#endif // WEBSWARM_AGENT_BROWSER_AGENT_HPP
