#include <webswarm/status/status_channel.hpp>
#include <webswarm/core/logger.hpp>
#include <algorithm>

namespace webswarm {

StatusChannel::StatusChannel(EventQueue& queue)
    : queue_(queue)
    , running_(false) {
}

StatusChannel::~StatusChannel() {
    stop();
}

void StatusChannel::set_snapshot_provider(const SnapshotProvider& provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_ = provider;
}

bool StatusChannel::add_observer(const std::shared_ptr<StatusObserver>& observer) {
    if (!observer) return false;

    SnapshotProvider provider;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        provider = snapshot_;
    }

    StatusEvent snapshot("snapshot", provider ? provider() : Json::object());
    if (!observer->send(snapshot.serialize())) {
        LOG_WARN("Status observer dropped before initial snapshot");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    observers_.push_back(observer);
    LOG_INFO("Status observer connected (%zu total)", observers_.size());
    return true;
}

void StatusChannel::remove_observer(const StatusObserver* observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < observers_.size(); ++i) {
        if (observers_[i].get() == observer) {
            observers_.erase(observers_.begin() + i);
            LOG_INFO("Status observer disconnected (%zu remaining)", observers_.size());
            return;
        }
    }
}

size_t StatusChannel::broadcast(const StatusEvent& event) {
    std::vector<std::shared_ptr<StatusObserver> > targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets = observers_;
    }
    if (targets.empty()) return 0;

    std::string message = event.serialize();
    std::vector<StatusObserver*> failed;
    size_t delivered = 0;
    for (size_t i = 0; i < targets.size(); ++i) {
        if (targets[i]->send(message)) {
            ++delivered;
        } else {
            failed.push_back(targets[i].get());
        }
    }

    if (!failed.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < failed.size(); ++i) {
            for (size_t j = 0; j < observers_.size(); ++j) {
                if (observers_[j].get() == failed[i]) {
                    observers_.erase(observers_.begin() + j);
                    break;
                }
            }
        }
        LOG_DEBUG("Pruned %zu stale status observers", failed.size());
    }
    return delivered;
}

void StatusChannel::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread(&StatusChannel::run, this);
}

void StatusChannel::stop() {
    if (!running_.exchange(false)) return;
    if (thread_.joinable()) {
        thread_.join();
    }
}

size_t StatusChannel::observer_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return observers_.size();
}

void StatusChannel::run() {
    LOG_DEBUG("Status channel started");
    while (running_) {
        StatusEvent event;
        if (!queue_.pop(event, 200)) {
            if (queue_.closed() && queue_.size() == 0) break;
            continue;
        }
        try {
            broadcast(event);
        } catch (const std::exception& e) {
            LOG_ERROR("Status broadcast failed: %s", e.what());
        }
    }
    LOG_DEBUG("Status channel stopped");
}

} // namespace webswarm
