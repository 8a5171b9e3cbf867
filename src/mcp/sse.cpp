#include <webswarm/mcp/sse.hpp>

namespace webswarm {

std::vector<SseEvent> SseParser::feed(const std::string& chunk) {
    std::vector<SseEvent> out;
    buffer_ += chunk;

    size_t pos;
    while ((pos = buffer_.find('\n')) != std::string::npos) {
        std::string line = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 1);
        if (!line.empty() && line[line.size() - 1] == '\r') {
            line.erase(line.size() - 1);
        }
        process_line(line, out);
    }
    return out;
}

std::vector<SseEvent> SseParser::finish() {
    std::vector<SseEvent> out;
    if (!buffer_.empty()) {
        std::string line = buffer_;
        buffer_.clear();
        if (line[line.size() - 1] == '\r') line.erase(line.size() - 1);
        process_line(line, out);
    }
    dispatch(out);
    return out;
}

void SseParser::process_line(const std::string& line, std::vector<SseEvent>& out) {
    if (line.empty()) {
        dispatch(out);
        return;
    }
    if (line[0] == ':') return;  // comment / keep-alive

    std::string field;
    std::string value;
    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        field = line;
    } else {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value[0] == ' ') value.erase(0, 1);
    }

    if (field == "data") {
        if (has_data_) current_.data += "\n";
        current_.data += value;
        has_data_ = true;
    } else if (field == "event") {
        current_.event = value;
    } else if (field == "id") {
        current_.id = value;
    }
}

void SseParser::dispatch(std::vector<SseEvent>& out) {
    if (has_data_) {
        out.push_back(current_);
    }
    current_ = SseEvent();
    has_data_ = false;
}

std::vector<SseEvent> parse_sse(const std::string& body) {
    SseParser parser;
    std::vector<SseEvent> events = parser.feed(body);
    std::vector<SseEvent> rest = parser.finish();
    events.insert(events.end(), rest.begin(), rest.end());
    return events;
}

} // namespace webswarm
