#include <nexusexec/execution/event_channel.hpp>

#include <nexusexec/execution/output_event.hpp>

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <utility>

namespace nexusexec {

EventChannel::EventChannel(std::size_t capacity_bytes)
    : capacity_{capacity_bytes}
    , last_consumed_{Clock::now()} {}

bool EventChannel::push(OutputEvent event, Clock::time_point deadline) {
    const std::size_t size = payload_size(event);

    std::unique_lock lock{mutex_};

    // An oversized event still goes through once the queue has drained completely
    auto has_room = [&] { return consumer_closed_ || queue_.empty() || bytes_ + size <= capacity_; };

    if (!is_end(event) && !not_full_.wait_until(lock, deadline, has_room)) {
        return false;
    }

    if (consumer_closed_) {
        return false;
    }

    bytes_ += size;
    queue_.push_back(std::move(event));

    lock.unlock();
    not_empty_.notify_one();

    return true;
}

std::optional<OutputEvent> EventChannel::pop(std::chrono::milliseconds timeout) {
    std::unique_lock lock{mutex_};

    if (!not_empty_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
        return std::nullopt;
    }

    OutputEvent event = std::move(queue_.front());
    queue_.pop_front();
    bytes_ -= payload_size(event);
    last_consumed_ = Clock::now();

    lock.unlock();
    not_full_.notify_one();

    return event;
}

void EventChannel::close_consumer() {
    {
        std::lock_guard lock{mutex_};
        consumer_closed_ = true;
        queue_.clear();
        bytes_ = 0;
    }
    not_full_.notify_all();
}

bool EventChannel::is_consumer_closed() const {
    std::lock_guard lock{mutex_};
    return consumer_closed_;
}

EventChannel::Clock::time_point EventChannel::last_consumed() const {
    std::lock_guard lock{mutex_};
    return last_consumed_;
}

std::size_t EventChannel::buffered_bytes() const {
    std::lock_guard lock{mutex_};
    return bytes_;
}

} // namespace nexusexec
