#include <webswarm/agent/browser_agent.hpp>
#include <webswarm/core/logger.hpp>
#include <webswarm/core/utils.hpp>
#include <sstream>

namespace webswarm {

// ============================================================================
// ClaimGateway
// ============================================================================

ClaimGateway::ClaimGateway(HttpTransport& http, const std::string& coordinator_url, int agent_id)
    : http_(http)
    , agent_id_(agent_id) {
    std::string base = trim(coordinator_url);
    while (!base.empty() && base[base.size() - 1] == '/') {
        base.erase(base.size() - 1);
    }
    if (!base.empty()) {
        url_ = base + "/swarm/claim";
    }
}

ClaimOutcome ClaimGateway::request(const std::string& label) {
    if (url_.empty()) {
        return ClaimOutcome::UNAVAILABLE;
    }

    Json body = Json::object();
    body["agent_id"] = agent_id_;
    body["item"] = label;

    HttpResponse resp = http_.post_json(url_, body.dump(), HttpHeaders(), 10000);
    if (!resp.ok()) {
        LOG_WARN("[Agent] Claim request for '%s' failed: %s", label.c_str(),
                 resp.error.empty() ? ("HTTP " + std::to_string(resp.status_code)).c_str()
                                    : resp.error.c_str());
        return ClaimOutcome::UNAVAILABLE;
    }

    Json reply = resp.json();
    if (!reply.is_object() || !reply.contains("approved") || !reply["approved"].is_boolean()) {
        LOG_WARN("[Agent] Malformed claim reply: %s", truncate_safe(resp.body, 200).c_str());
        return ClaimOutcome::UNAVAILABLE;
    }
    return reply["approved"].get<bool>() ? ClaimOutcome::APPROVED : ClaimOutcome::REJECTED;
}

// ============================================================================
// BrowserAgent
// ============================================================================

BrowserAgent::BrowserAgent(AIProvider& ai, McpClient& mcp, ClaimGateway* claims,
                           const AgentConfig& config)
    : ai_(ai)
    , mcp_(mcp)
    , claims_(claims)
    , config_(config) {
}

std::string BrowserAgent::build_system_prompt() const {
    std::vector<OperationInfo> ops = mcp_.operations();

    std::ostringstream oss;
    oss << "You are a browser automation agent. You control a real web browser to research "
        << "the task you are given.\n\n";
    oss << "## Available Tools\n\n";
    oss << "Use tools with this exact format:\n\n";
    oss << "<tool_call name=\"TOOLNAME\">\n";
    oss << "{\"param\": \"value\"}\n";
    oss << "</tool_call>\n\n";

    for (size_t i = 0; i < ops.size(); ++i) {
        oss << "- **" << ops[i].name << "**: " << ops[i].description;
        const Json& schema = ops[i].input_schema;
        if (schema.contains("properties") && schema["properties"].is_object() &&
            !schema["properties"].empty()) {
            std::vector<std::string> params;
            for (Json::const_iterator it = schema["properties"].begin();
                 it != schema["properties"].end(); ++it) {
                params.push_back(it.key());
            }
            oss << " (params: " << join(params, ", ") << ")";
        }
        oss << "\n";
    }

    oss << "\n## Guidelines\n";
    oss << "1. Start with browser_snapshot to see the page and get element references.\n";
    oss << "2. Use the references from snapshots when clicking or typing.\n";
    oss << "3. After an action, take another snapshot to check the result.\n";
    oss << "4. When you are done, answer without any tool call and include the facts you found "
        << "(figures, sources).\n";
    if (claims_ && claims_->enabled()) {
        oss << "5. If the task asks you to claim a target, write a line \"CLAIM: <name>\" and "
            << "wait for the confirmation before researching it.\n";
    }
    return oss.str();
}

std::vector<ParsedToolCall> BrowserAgent::parse_tool_calls(const std::string& response) const {
    std::vector<ParsedToolCall> calls;

    size_t pos = 0;
    while (pos < response.size()) {
        size_t start = response.find("<tool_call", pos);
        if (start == std::string::npos) break;

        size_t name_start = response.find("name=\"", start);
        if (name_start == std::string::npos || name_start > start + 50) {
            pos = start + 10;
            continue;
        }
        name_start += 6;

        size_t name_end = response.find("\"", name_start);
        if (name_end == std::string::npos) {
            pos = start + 10;
            continue;
        }
        std::string tool_name = response.substr(name_start, name_end - name_start);

        size_t tag_end = response.find(">", name_end);
        if (tag_end == std::string::npos) {
            pos = start + 10;
            continue;
        }
        tag_end++;

        ParsedToolCall call;
        call.tool_name = tool_name;
        call.start_pos = start;

        size_t close_tag = response.find("</tool_call>", tag_end);
        std::string content;
        if (close_tag == std::string::npos) {
            // Missing closing tag: recover a JSON object if one follows
            std::string tail = response.substr(tag_end);
            std::string block = extract_json_block(tail);
            if (block.empty()) {
                LOG_DEBUG("[Agent] Unterminated tool_call for '%s', skipping", tool_name.c_str());
                pos = tag_end;
                continue;
            }
            content = block;
            call.end_pos = tag_end + tail.find(block) + block.size();
        } else {
            content = response.substr(tag_end, close_tag - tag_end);
            call.end_pos = close_tag + 12;  // Length of </tool_call>
        }

        content = trim(content);
        call.raw_content = content;

        if (content.empty() || content == "{}") {
            call.params = Json::object();
            call.valid = true;
        } else {
            Json parsed = parse_json_lenient(content);
            if (parsed.is_discarded()) {
                std::string block = extract_json_block(content);
                if (!block.empty()) parsed = parse_json_lenient(block);
            }
            if (!parsed.is_discarded() && parsed.is_object()) {
                call.params = parsed;
                call.valid = true;
            } else {
                call.valid = false;
                call.parse_error = "JSON parse error in tool parameters";
                LOG_WARN("[Agent] Failed to parse tool call params for '%s'", tool_name.c_str());
            }
        }

        calls.push_back(call);
        pos = call.end_pos;
    }
    return calls;
}

std::string BrowserAgent::format_tool_result(const std::string& tool_name, const OperationResult& result) const {
    std::ostringstream oss;
    oss << "<tool_result name=\"" << tool_name << "\" success=\""
        << (result.success ? "true" : "false") << "\">\n";

    if (!result.success) {
        oss << "Error: " << result.error << "\n";
    }

    std::string text = result.text();
    if (text.size() > config_.max_tool_result_size) {
        oss << truncate_safe(text, config_.max_tool_result_size)
            << "\n... [truncated " << (text.size() - config_.max_tool_result_size) << " characters]";
    } else if (!text.empty()) {
        oss << text;
    } else if (result.success) {
        oss << "Done.";
    }

    for (size_t i = 0; i < result.images.size(); ++i) {
        oss << "\n[image attachment: " << result.images[i].mime_type << ", "
            << result.images[i].data.size() << " bytes]";
    }
    oss << "\n</tool_result>";
    return oss.str();
}

std::string BrowserAgent::extract_response_text(const std::string& response,
                                                const std::vector<ParsedToolCall>& calls) const {
    if (calls.empty()) {
        return trim(response);
    }

    std::string result;
    size_t pos = 0;
    for (size_t i = 0; i < calls.size(); ++i) {
        if (calls[i].start_pos > pos) {
            result += response.substr(pos, calls[i].start_pos - pos);
        }
        pos = calls[i].end_pos;
    }
    if (pos < response.size()) {
        result += response.substr(pos);
    }
    return trim(result);
}

std::vector<std::string> BrowserAgent::extract_claims(const std::string& response) {
    return claim_labels(response);
}

std::string BrowserAgent::process_claims(const std::string& response, std::set<std::string>& requested,
                                         AgentResult& result, bool& rejected) {
    rejected = false;
    std::vector<std::string> labels = extract_claims(response);
    if (labels.empty() || !claims_) {
        return "";
    }

    std::ostringstream feedback;
    for (size_t i = 0; i < labels.size(); ++i) {
        std::string key = normalize_label(labels[i]);
        if (requested.count(key)) continue;
        requested.insert(key);

        ClaimOutcome outcome = claims_->request(labels[i]);
        switch (outcome) {
            case ClaimOutcome::APPROVED:
                LOG_INFO("[Agent] Claim for '%s' approved", labels[i].c_str());
                result.claimed_label = labels[i];
                feedback << "Claim for '" << labels[i] << "' approved. Proceed with the research.\n";
                break;
            case ClaimOutcome::REJECTED:
                LOG_INFO("[Agent] Claim for '%s' rejected", labels[i].c_str());
                rejected = true;
                feedback << "Claim for '" << labels[i] << "' rejected: another agent already took it. "
                         << "Choose a different target and claim it.\n";
                break;
            case ClaimOutcome::UNAVAILABLE:
                feedback << "Claim service unavailable for '" << labels[i]
                         << "'. Proceed with the research.\n";
                if (result.claimed_label.empty()) result.claimed_label = labels[i];
                break;
        }
    }
    return feedback.str();
}

AgentResult BrowserAgent::run(const std::string& instruction) {
    AgentResult result;

    if (!ai_.is_configured()) {
        result.error = "AI not configured";
        return result;
    }

    LOG_INFO("[Agent] Starting browser task: %s", truncate_safe(instruction, 100).c_str());

    std::vector<ConversationMessage> history;
    history.push_back(ConversationMessage::user(instruction));

    CompletionOptions opts;
    opts.system_prompt = build_system_prompt();
    opts.max_tokens = 4096;

    std::set<std::string> requested_claims;
    std::string accumulated;
    int consecutive_errors = 0;

    while (result.iterations < config_.max_steps) {
        result.iterations++;

        CompletionResult reply = ai_.chat(history, opts);
        if (!reply.success) {
            LOG_ERROR("[Agent] AI call failed: %s", reply.error.c_str());
            if (++consecutive_errors >= config_.max_consecutive_errors) {
                result.error = "Too many consecutive AI errors: " + reply.error;
                return result;
            }
            continue;
        }
        consecutive_errors = 0;

        std::string response = reply.content;
        history.push_back(ConversationMessage::assistant(response));

        bool rejected = false;
        std::string claim_feedback = process_claims(response, requested_claims, result, rejected);
        std::vector<ParsedToolCall> calls = parse_tool_calls(response);

        if (calls.empty() && claim_feedback.empty()) {
            LOG_INFO("[Agent] Task complete after %d iterations, %d tool calls",
                     result.iterations, result.tool_calls_made);
            result.success = true;
            result.final_response = response;
            break;
        }

        std::ostringstream next;
        if (!claim_feedback.empty()) {
            next << claim_feedback << "\n";
        }
        if (!rejected) {
            for (size_t i = 0; i < calls.size(); ++i) {
                const ParsedToolCall& call = calls[i];
                result.tool_calls_made++;
                OperationResult op = call.valid
                    ? mcp_.call_operation(call.tool_name, call.params)
                    : OperationResult::fail(ErrorKind::PROTOCOL, call.parse_error);
                LOG_INFO("[Agent] Tool %s: %s", call.tool_name.c_str(), op.success ? "ok" : op.error.c_str());
                next << format_tool_result(call.tool_name, op) << "\n";
            }
        }

        std::string text = extract_response_text(response, calls);
        if (!text.empty()) {
            if (!accumulated.empty()) accumulated += "\n\n";
            accumulated += text;
        }

        history.push_back(ConversationMessage::user(next.str()));
    }

    if (!result.success) {
        LOG_WARN("[Agent] Reached max steps (%d)", config_.max_steps);
        result.success = true;
        result.final_response = accumulated.empty()
            ? "Reached maximum browser steps without a final answer."
            : accumulated + "\n\n(Reached maximum steps)";
    }

    // Keep the approved claim visible to the coordinator
    if (!result.claimed_label.empty() && extract_claims(result.final_response).empty()) {
        result.final_response = "CLAIM: " + result.claimed_label + "\n\n" + result.final_response;
    }
    return result;
}

} // namespace webswarm
