#pragma once

#include <nexusexec/common/class_traits.hpp>
#include <nexusexec/execution/output_event.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace nexusexec {

/// Single-producer, single-consumer queue of output events, bounded by payload bytes.
///
/// The producer blocks while the queue is full, up to a deadline. ``EndOfStream`` is never
/// refused for lack of space, so the end of a stream can always be delivered.
class EventChannel : NonMovable
{
public:
    using Clock = std::chrono::steady_clock;

    explicit EventChannel(std::size_t capacity_bytes);

    /// Returns false if ``deadline`` passed while the queue was full, or if the consumer has gone
    bool push(OutputEvent event, Clock::time_point deadline);

    /// Waits up to ``timeout`` for the next event
    std::optional<OutputEvent> pop(std::chrono::milliseconds timeout);

    /// The consumer will not read any more; pending and future events are dropped
    void close_consumer();
    bool is_consumer_closed() const;

    /// Last time the consumer took an event, or the channel's creation time
    Clock::time_point last_consumed() const;

    std::size_t buffered_bytes() const;
    std::size_t capacity() const { return capacity_; }

private:
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;

    std::deque<OutputEvent> queue_;
    std::size_t bytes_ = 0;
    bool consumer_closed_ = false;
    Clock::time_point last_consumed_;
};

} // namespace nexusexec
