#include <webswarm/ai/claude.hpp>
#include <webswarm/core/logger.hpp>
#include <webswarm/core/json.hpp>
#include <cstdlib>
#include <sstream>

namespace webswarm {

ClaudeProvider::ClaudeProvider(HttpTransport& http)
    : http_(http)
    , api_key_()
    , default_model_("claude-sonnet-4-20250514")
    , api_url_("https://api.anthropic.com/v1/messages")
    , api_version_("2023-06-01")
    , timeout_ms_(120000)
{}

bool ClaudeProvider::init(const Config& cfg) {
    api_key_ = cfg.get_string("claude.api_key", "");
    if (api_key_.empty()) {
        const char* env_key = std::getenv("ANTHROPIC_API_KEY");
        if (env_key) api_key_ = env_key;
    }

    std::string model = cfg.get_string("claude.model", "");
    if (!model.empty()) {
        default_model_ = model;
    }

    std::string url = cfg.get_string("claude.api_url", "");
    if (!url.empty()) {
        api_url_ = url;
    }

    timeout_ms_ = static_cast<long>(cfg.get_int("claude.timeout_ms", timeout_ms_));

    if (api_key_.empty()) {
        LOG_WARN("Claude AI: No API key configured (set ANTHROPIC_API_KEY)");
        return false;
    }

    LOG_INFO("Claude AI initialized with model: %s", default_model_.c_str());
    return true;
}

std::string ClaudeProvider::provider_id() const { return "claude"; }

std::string ClaudeProvider::default_model() const { return default_model_; }

bool ClaudeProvider::is_configured() const { return !api_key_.empty(); }

CompletionResult ClaudeProvider::complete(
    const std::string& prompt,
    const CompletionOptions& opts
) {
    std::vector<ConversationMessage> messages;
    messages.push_back(ConversationMessage::user(prompt));
    return chat(messages, opts);
}

CompletionResult ClaudeProvider::chat(
    const std::vector<ConversationMessage>& messages,
    const CompletionOptions& opts
) {
    if (!is_configured()) {
        return CompletionResult::fail("Claude AI not configured");
    }

    if (messages.empty()) {
        return CompletionResult::fail("No messages provided");
    }

    Json request = Json::object();
    request["model"] = opts.model.empty() ? default_model_ : opts.model;
    request["max_tokens"] = opts.max_tokens > 0 ? opts.max_tokens : 4096;

    if (opts.temperature >= 0.0 && opts.temperature <= 1.0) {
        request["temperature"] = opts.temperature;
    }

    if (!opts.system_prompt.empty()) {
        request["system"] = opts.system_prompt;
    }

    Json msgs = Json::array();
    for (size_t i = 0; i < messages.size(); ++i) {
        const ConversationMessage& msg = messages[i];

        if (msg.role == MessageRole::SYSTEM) {
            if (opts.system_prompt.empty() && i == 0) {
                request["system"] = msg.content;
            }
            continue;
        }

        Json m = Json::object();
        m["role"] = role_to_string(msg.role);
        m["content"] = msg.content;
        msgs.push_back(m);
    }
    request["messages"] = msgs;

    std::string request_body = request.dump();
    LOG_DEBUG("Claude request: %s", request_body.c_str());

    HttpHeaders headers;
    headers["x-api-key"] = api_key_;
    headers["anthropic-version"] = api_version_;

    HttpResponse response = http_.post_json(api_url_, request_body, headers, timeout_ms_);

    if (response.transport_failed()) {
        return CompletionResult::fail("HTTP request failed: " + response.error);
    }

    LOG_DEBUG("Claude response [%ld]: %s", response.status_code, response.body.c_str());

    Json resp = response.json();

    if (response.status_code != 200) {
        std::string error_msg = "API error";
        if (resp.is_object() && resp.contains("error") && resp["error"].is_object()) {
            std::string msg = json_string(resp["error"], "message");
            std::string type = json_string(resp["error"], "type");
            if (!msg.empty()) {
                error_msg = type.empty() ? msg : (type + ": " + msg);
            }
        }
        return CompletionResult::fail(error_msg + " (HTTP " +
                                      std::to_string(response.status_code) + ")");
    }

    if (!resp.is_object()) {
        return CompletionResult::fail("Malformed API response");
    }

    CompletionResult result;
    result.success = true;
    result.model = json_string(resp, "model");
    result.stop_reason = json_string(resp, "stop_reason");

    if (resp.contains("content") && resp["content"].is_array()) {
        std::ostringstream text;
        const Json& blocks = resp["content"];
        for (size_t i = 0; i < blocks.size(); ++i) {
            if (json_string(blocks[i], "type") == "text") {
                text << json_string(blocks[i], "text");
            }
        }
        result.content = text.str();
    }

    if (resp.contains("usage") && resp["usage"].is_object()) {
        const Json& usage = resp["usage"];
        result.usage.input_tokens = static_cast<int>(json_int(usage, "input_tokens"));
        result.usage.output_tokens = static_cast<int>(json_int(usage, "output_tokens"));
        result.usage.total_tokens = result.usage.input_tokens + result.usage.output_tokens;
    }

    return result;
}

} // namespace webswarm
