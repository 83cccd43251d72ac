#include "peerlink/engine/event_channel.hpp"
#include "peerlink/core/logger.hpp"

namespace peerlink::engine {

EventChannel::EventChannel()
    : running_(false)
    , delivering_(false) {
}

EventChannel::~EventChannel() {
    stop();
}

void EventChannel::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    dispatcher_ = std::thread(&EventChannel::dispatch_loop, this);
}

void EventChannel::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    queue_cv_.notify_all();

    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
}

bool EventChannel::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void EventChannel::subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.push_back(std::move(handler));
}

void EventChannel::publish(Event event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(event));
    }
    queue_cv_.notify_one();
}

bool EventChannel::flush(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] {
        return queue_.empty() && !delivering_;
    });
}

void EventChannel::dispatch_loop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        queue_cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });

        if (queue_.empty()) {
            break;  // stopped and drained
        }

        Event event = std::move(queue_.front());
        queue_.pop_front();
        auto handlers = handlers_;
        delivering_ = true;
        lock.unlock();

        for (auto& handler : handlers) {
            try {
                handler(event);
            } catch (const std::exception& e) {
                LOG_ERROR("Event handler failed on '{}': {}", describe(event), e.what());
            }
        }

        lock.lock();
        delivering_ = false;
        idle_cv_.notify_all();
    }

    idle_cv_.notify_all();
}

}
