#pragma once

#include "peerlink/engine/events.hpp"
#include <condition_variable>
#include <functional>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>
#include <chrono>

namespace peerlink::engine {

// Delivers events in publication order to every subscriber from a single
// dispatcher thread. Publishing never blocks on subscribers.
class EventChannel {
public:
    using Handler = std::function<void(const Event&)>;

    EventChannel();
    ~EventChannel();

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    void start();

    // Delivers what is already queued, then joins the dispatcher.
    void stop();

    void subscribe(Handler handler);
    void publish(Event event);

    // Waits until every event published so far has been delivered.
    bool flush(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    bool is_running() const;

private:
    void dispatch_loop();

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<Event> queue_;
    std::vector<Handler> handlers_;
    std::thread dispatcher_;
    bool running_;
    bool delivering_;
};

}
