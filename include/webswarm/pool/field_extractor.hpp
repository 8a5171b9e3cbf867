#ifndef WEBSWARM_POOL_FIELD_EXTRACTOR_HPP
#define WEBSWARM_POOL_FIELD_EXTRACTOR_HPP

#include "types.hpp"
#include <string>
#include <vector>

namespace webswarm {

// Best effort: scans free text for a money amount ("$1.2B", "valued at
// $500 million") and a source phrase ("according to Forbes", "Crunchbase").
// Anything not found stays "Unknown". Confidence is Low with nothing found,
// Medium with a valuation, High with valuation and source.
// Not part of the coordination guarantees; callers must tolerate unknowns.
PartialFields extract_structured_fields(const std::string& text);

// Markdown table of unit results. query_type "valuation" renders
// Label | Valuation | Source | Confidence | Status, anything else renders
// Label | Result | Status with the first 100 chars of the reply.
std::string format_results_table(const std::vector<UnitResult>& results,
                                 const std::string& query_type = "valuation");

} // namespace webswarm

#endif // WEBSWARM_POOL_FIELD_EXTRACTOR_HPP
