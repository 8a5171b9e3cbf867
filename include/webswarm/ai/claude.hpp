/*
 * webswarm - Claude provider
 *
 * Anthropic Messages API (https://api.anthropic.com/v1/messages) over the
 * service's shared HTTP transport.
 *
 * Configuration:
 *   claude.api_key  - or ANTHROPIC_API_KEY
 *   claude.model    - default claude-sonnet-4-20250514
 *   claude.api_url  - override the endpoint
 */
#ifndef WEBSWARM_AI_CLAUDE_HPP
#define WEBSWARM_AI_CLAUDE_HPP

#include "ai.hpp"
#include "../core/http_client.hpp"
#include "../core/config.hpp"

namespace webswarm {

class ClaudeProvider : public AIProvider {
public:
    // The transport must outlive the provider
    explicit ClaudeProvider(HttpTransport& http);

    // Returns false (and stays unconfigured) without an API key
    bool init(const Config& cfg);

    std::string provider_id() const;
    std::string default_model() const;
    bool is_configured() const;

    CompletionResult complete(
        const std::string& prompt,
        const CompletionOptions& opts = CompletionOptions()
    );

    CompletionResult chat(
        const std::vector<ConversationMessage>& messages,
        const CompletionOptions& opts = CompletionOptions()
    );

private:
    HttpTransport& http_;
    std::string api_key_;
    std::string default_model_;
    std::string api_url_;
    std::string api_version_;
    long timeout_ms_;
};

} // namespace webswarm

#endif // WEBSWARM_AI_CLAUDE_HPP
