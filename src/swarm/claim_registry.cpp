#include <webswarm/swarm/claim_registry.hpp>
#include <webswarm/core/utils.hpp>

namespace webswarm {

bool ClaimRegistry::claim(int agent_id, const std::string& label) {
    std::string key = normalize_label(label);
    if (key.empty()) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.count(key)) {
        return false;
    }
    Entry e;
    e.agent_id = agent_id;
    e.label = trim(label);
    e.order = entries_.size();
    entries_[key] = e;
    return true;
}

void ClaimRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

int ClaimRegistry::owner(const std::string& label) const {
    std::string key = normalize_label(label);
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, Entry>::const_iterator it = entries_.find(key);
    return it == entries_.end() ? 0 : it->second.agent_id;
}

std::string ClaimRegistry::label_for(int agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Entry* latest = nullptr;
    for (std::map<std::string, Entry>::const_iterator it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->second.agent_id == agent_id && (!latest || it->second.order > latest->order)) {
            latest = &it->second;
        }
    }
    return latest ? latest->label : std::string();
}

std::vector<std::string> ClaimRegistry::labels() const {
    std::vector<std::string> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::map<std::string, Entry>::const_iterator it = entries_.begin(); it != entries_.end(); ++it) {
        out.push_back(it->first);
    }
    return out;
}

size_t ClaimRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace webswarm
