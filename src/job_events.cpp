#include "job_events.hpp"
#include <algorithm>

std::string_view jobEventTypeName(JobEventType type) {
    switch (type) {
    case JobEventType::Output: return "output";
    case JobEventType::Progress: return "progress";
    case JobEventType::Complete: return "complete";
    }
    return "unknown";
}

EventChannel::EventChannel(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

void EventChannel::push(JobEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        if (events_.size() >= capacity_) {
            events_.pop_front();
            ++dropped_;
        }
        events_.push_back(std::move(event));
    }
    ready_.notify_one();
}

std::optional<JobEvent> EventChannel::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; });
    if (events_.empty()) {
        return std::nullopt;
    }
    JobEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<JobEvent> EventChannel::tryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    JobEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    ready_.notify_all();
}

bool EventChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t EventChannel::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}
