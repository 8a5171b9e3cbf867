#include <webswarm/pool/field_extractor.hpp>
#include <webswarm/core/utils.hpp>
#include <regex>
#include <sstream>

namespace webswarm {

namespace {

const std::regex& money_patterns(size_t i) {
    static const std::regex patterns[] = {
        std::regex("\\$[\\d,]+(?:\\.\\d+)?[BMK]?(?:\\s*billion)?(?:\\s*million)?",
                   std::regex::icase),
        std::regex("(?:valued at|valuation of|worth)\\s*\\$?[\\d,]+(?:\\.\\d+)?[BMK]?\\s*(?:billion|million)?",
                   std::regex::icase),
    };
    return patterns[i];
}

const std::regex& source_patterns(size_t i) {
    static const std::regex patterns[] = {
        std::regex("(?:according to|source:|from|per)\\s+([A-Za-z ]+?)(?:\\.|,|$)",
                   std::regex::icase),
        std::regex("(?:TechCrunch|Forbes|Bloomberg|Crunchbase|PitchBook|WSJ)",
                   std::regex::icase),
    };
    return patterns[i];
}

const size_t kPatternCount = 2;

// std::regex recursion grows with the matched span, so patterns only ever
// see one line, and long lines are cut into pieces of this size
const size_t kMaxSegment = 512;

std::vector<std::string> bounded_segments(const std::string& text) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        for (size_t pos = start; pos < end; pos += kMaxSegment) {
            size_t len = end - pos < kMaxSegment ? end - pos : kMaxSegment;
            segments.push_back(text.substr(pos, len));
        }
        start = end + 1;
    }
    return segments;
}

bool search_segments(const std::vector<std::string>& segments, const std::regex& re, std::string& out) {
    std::smatch m;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (std::regex_search(segments[i], m, re)) {
            out = trim(m.str(0));
            return true;
        }
    }
    return false;
}

} // namespace

PartialFields extract_structured_fields(const std::string& text) {
    PartialFields fields;
    std::vector<std::string> segments = bounded_segments(text);

    for (size_t i = 0; i < kPatternCount; ++i) {
        if (search_segments(segments, money_patterns(i), fields.valuation)) {
            fields.confidence = "Medium";
            break;
        }
    }

    for (size_t i = 0; i < kPatternCount; ++i) {
        if (search_segments(segments, source_patterns(i), fields.source)) {
            break;
        }
    }

    if (fields.valuation != "Unknown" && fields.source != "Unknown") {
        fields.confidence = "High";
    }
    return fields;
}

std::string format_results_table(const std::vector<UnitResult>& results,
                                 const std::string& query_type) {
    std::ostringstream oss;

    if (query_type == "valuation") {
        oss << "## Valuations\n\n";
        oss << "| Label | Valuation | Source | Confidence | Status |\n";
        oss << "|-------|-----------|--------|------------|--------|\n";
        for (size_t i = 0; i < results.size(); ++i) {
            const UnitResult& r = results[i];
            oss << "| " << (r.label.empty() ? "Unknown" : r.label)
                << " | " << r.fields.valuation
                << " | " << r.fields.source
                << " | " << r.fields.confidence
                << " | " << (r.completed() ? "\xE2\x9C\x93" : "\xE2\x9C\x97") << " |\n";
        }
    } else {
        oss << "## Research Results\n\n";
        oss << "| Label | Result | Status |\n";
        oss << "|-------|--------|--------|\n";
        for (size_t i = 0; i < results.size(); ++i) {
            const UnitResult& r = results[i];
            std::string summary = replace_all(truncate_safe(r.raw_response, 100), "\n", " ");
            oss << "| " << (r.label.empty() ? "Unknown" : r.label)
                << " | " << summary << "..."
                << " | " << (r.completed() ? "\xE2\x9C\x93" : "\xE2\x9C\x97") << " |\n";
        }
    }

    std::string table = oss.str();
    if (!table.empty() && table[table.size() - 1] == '\n') {
        table.erase(table.size() - 1);
    }
    return table;
}

} // namespace webswarm
