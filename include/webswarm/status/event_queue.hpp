#ifndef WEBSWARM_STATUS_EVENT_QUEUE_HPP
#define WEBSWARM_STATUS_EVENT_QUEUE_HPP

#include "../core/json.hpp"
#include <string>
#include <deque>
#include <mutex>
#include <condition_variable>

namespace webswarm {

// One state transition published to observers as {"type":..., "payload":...}
struct StatusEvent {
    std::string type;
    Json payload;

    StatusEvent() {}
    StatusEvent(const std::string& t, const Json& p) : type(t), payload(p) {}

    Json to_json() const;
    std::string serialize() const { return to_json().dump(); }
};

// Producer side never blocks on observers: publish() only appends. The
// status channel drains the queue from its own thread.
class EventQueue {
public:
    explicit EventQueue(size_t capacity = 1024);

    // Drops the oldest event when full; no-op once closed
    void publish(const StatusEvent& event);
    void publish(const std::string& type, const Json& payload);

    // Wait up to timeout_ms for an event. Returns false on timeout or
    // when the queue is closed and empty.
    bool pop(StatusEvent& out, int timeout_ms);

    void close();
    bool closed() const;
    size_t size() const;
    size_t dropped() const;

private:
    size_t capacity_;
    size_t dropped_;
    bool closed_;
    std::deque<StatusEvent> events_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace webswarm

#endif // WEBSWARM_STATUS_EVENT_QUEUE_HPP
