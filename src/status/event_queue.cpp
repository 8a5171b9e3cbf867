#include <webswarm/status/event_queue.hpp>
#include <webswarm/core/logger.hpp>
#include <chrono>

namespace webswarm {

Json StatusEvent::to_json() const {
    Json j = Json::object();
    j["type"] = type;
    j["payload"] = payload;
    return j;
}

EventQueue::EventQueue(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity)
    , dropped_(0)
    , closed_(false) {}

void EventQueue::publish(const StatusEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        if (events_.size() >= capacity_) {
            events_.pop_front();
            ++dropped_;
            if (dropped_ == 1 || dropped_ % 100 == 0) {
                LOG_WARN("Status queue full, dropped %zu events so far", dropped_);
            }
        }
        events_.push_back(event);
    }
    cv_.notify_one();
}

void EventQueue::publish(const std::string& type, const Json& payload) {
    publish(StatusEvent(type, payload));
}

bool EventQueue::pop(StatusEvent& out, int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] {
        return closed_ || !events_.empty();
    });
    if (events_.empty()) return false;
    out = events_.front();
    events_.pop_front();
    return true;
}

void EventQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

size_t EventQueue::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace webswarm
