/*
 * webswarm - Status/notification channel
 *
 * Drains the EventQueue on its own thread and pushes each event to every
 * connected observer. A failed send marks the observer for removal at the
 * end of that broadcast pass. Delivery is best effort: there is no replay,
 * late joiners get one full snapshot when they connect.
 */
#ifndef WEBSWARM_STATUS_STATUS_CHANNEL_HPP
#define WEBSWARM_STATUS_STATUS_CHANNEL_HPP

#include "event_queue.hpp"
#include "../core/json.hpp"
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <functional>

namespace webswarm {

// One connected observer (a WebSocket in production)
class StatusObserver {
public:
    virtual ~StatusObserver() {}

    // Returns false when the connection is gone
    virtual bool send(const std::string& message) = 0;
};

// Builds the payload of the snapshot sent to new observers
typedef std::function<Json()> SnapshotProvider;

class StatusChannel {
public:
    explicit StatusChannel(EventQueue& queue);
    ~StatusChannel();

    void set_snapshot_provider(const SnapshotProvider& provider);

    // Sends {"type":"snapshot","payload":...} first; an observer that cannot
    // take the snapshot is not registered. Returns whether it was added.
    bool add_observer(const std::shared_ptr<StatusObserver>& observer);
    void remove_observer(const StatusObserver* observer);

    // Returns the number of observers that received the event
    size_t broadcast(const StatusEvent& event);

    // Drain thread
    void start();
    void stop();

    size_t observer_count() const;

private:
    StatusChannel(const StatusChannel&);
    StatusChannel& operator=(const StatusChannel&);

    void run();

    EventQueue& queue_;
    SnapshotProvider snapshot_;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<StatusObserver> > observers_;

    std::thread thread_;
    std::atomic<bool> running_;
};

} // namespace webswarm

#endif // WEBSWARM_STATUS_STATUS_CHANNEL_HPP
