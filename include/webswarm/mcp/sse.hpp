#ifndef WEBSWARM_MCP_SSE_HPP
#define WEBSWARM_MCP_SSE_HPP

#include <string>
#include <vector>

namespace webswarm {

// One server-sent event. data lines are joined with '\n'.
struct SseEvent {
    std::string event;
    std::string data;
    std::string id;
};

// Incremental text/event-stream parser. Chunks may split lines anywhere.
class SseParser {
public:
    SseParser() : has_data_(false) {}

    // Events completed by this chunk (terminated by a blank line)
    std::vector<SseEvent> feed(const std::string& chunk);

    // Flush a trailing event that was not followed by a blank line
    std::vector<SseEvent> finish();

private:
    void process_line(const std::string& line, std::vector<SseEvent>& out);
    void dispatch(std::vector<SseEvent>& out);

    std::string buffer_;
    SseEvent current_;
    bool has_data_;
};

// Parse a complete event-stream body
std::vector<SseEvent> parse_sse(const std::string& body);

} // namespace webswarm

#endif // WEBSWARM_MCP_SSE_HPP
