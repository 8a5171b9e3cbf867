/*
 * webswarm - Reasoning provider interface
 *
 * Abstract interface for LLM providers. Used by the planning and synthesis
 * oracles on the orchestrator and by the browser agent loop on workers.
 */
#ifndef WEBSWARM_AI_AI_HPP
#define WEBSWARM_AI_AI_HPP

#include <string>
#include <vector>

namespace webswarm {

// Message role in a conversation
enum class MessageRole {
    SYSTEM,
    USER,
    ASSISTANT
};

std::string role_to_string(MessageRole role);

// A message in a conversation
struct ConversationMessage {
    MessageRole role;
    std::string content;

    ConversationMessage() : role(MessageRole::USER) {}
    ConversationMessage(MessageRole r, const std::string& c) : role(r), content(c) {}

    static ConversationMessage system(const std::string& content) {
        return ConversationMessage(MessageRole::SYSTEM, content);
    }
    static ConversationMessage user(const std::string& content) {
        return ConversationMessage(MessageRole::USER, content);
    }
    static ConversationMessage assistant(const std::string& content) {
        return ConversationMessage(MessageRole::ASSISTANT, content);
    }
};

// Usage stats from API response
struct UsageStats {
    int input_tokens;
    int output_tokens;
    int total_tokens;

    UsageStats() : input_tokens(0), output_tokens(0), total_tokens(0) {}
};

// Result of an AI completion request
struct CompletionResult {
    bool success;
    std::string content;      // The AI's response text
    std::string error;        // Error message if failed
    std::string stop_reason;  // Why the model stopped (end_turn, max_tokens, etc.)
    std::string model;        // Model that was used
    UsageStats usage;

    CompletionResult() : success(false) {}

    static CompletionResult ok(const std::string& text) {
        CompletionResult r;
        r.success = true;
        r.content = text;
        return r;
    }

    static CompletionResult fail(const std::string& error) {
        CompletionResult r;
        r.success = false;
        r.error = error;
        return r;
    }
};

// AI completion options
struct CompletionOptions {
    std::string model;           // Model to use (empty = provider default)
    std::string system_prompt;   // System prompt/instructions
    int max_tokens;              // Max tokens to generate (0 = default)
    double temperature;          // Sampling temperature (0-1)

    CompletionOptions()
        : max_tokens(4096), temperature(0.7) {}
};

// Abstract AI provider interface
class AIProvider {
public:
    virtual ~AIProvider() {}

    // Get the provider identifier (e.g., "claude")
    virtual std::string provider_id() const = 0;

    // Get the default model
    virtual std::string default_model() const = 0;

    // Check if the provider is properly configured
    virtual bool is_configured() const = 0;

    // Send a single prompt and get a response
    virtual CompletionResult complete(
        const std::string& prompt,
        const CompletionOptions& opts = CompletionOptions()
    ) = 0;

    // Send a conversation (with history) and get a response
    virtual CompletionResult chat(
        const std::vector<ConversationMessage>& messages,
        const CompletionOptions& opts = CompletionOptions()
    ) = 0;
};

} // namespace webswarm

#endif // WEBSWARM_AI_AI_HPP
