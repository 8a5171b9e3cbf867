#ifndef WEBSWARM_SWARM_CLAIM_REGISTRY_HPP
#define WEBSWARM_SWARM_CLAIM_REGISTRY_HPP

#include <string>
#include <vector>
#include <map>
#include <mutex>

namespace webswarm {

// Run-scoped set of claimed target labels. Labels are compared in
// normalized form (trimmed, lower-cased); two claims for the same
// normalized label never both succeed.
class ClaimRegistry {
public:
    ClaimRegistry() {}

    // True if the label was free and now belongs to agent_id.
    // Empty labels are always rejected.
    bool claim(int agent_id, const std::string& label);

    void clear();

    // Agent owning the label, 0 if unclaimed
    int owner(const std::string& label) const;

    // Most recent label approved for agent_id, as the agent spelled it
    std::string label_for(int agent_id) const;

    // Normalized labels, sorted
    std::vector<std::string> labels() const;

    size_t size() const;

private:
    ClaimRegistry(const ClaimRegistry&);
    ClaimRegistry& operator=(const ClaimRegistry&);

    struct Entry {
        int agent_id;
        std::string label;
        size_t order;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};

} // namespace webswarm

#endif // WEBSWARM_SWARM_CLAIM_REGISTRY_HPP
