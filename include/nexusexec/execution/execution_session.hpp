#pragma once

#include <nexusexec/common/class_traits.hpp>
#include <nexusexec/common/error_types.hpp>
#include <nexusexec/execution/event_channel.hpp>
#include <nexusexec/execution/execution_types.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace nexusexec {

enum class CancelReason { User, Disconnect, Idle, Shutdown };

std::string_view format_as(CancelReason reason);

/// State shared between the worker driving one run and everyone else who may touch it
/// (gateway callers, the idle reaper). All members are thread-safe.
class ExecutionSession : NonMovable
{
public:
    using Clock = std::chrono::steady_clock;

    static Result<std::shared_ptr<ExecutionSession>> create(std::string id, std::size_t channel_bytes);

    ~ExecutionSession();

    const std::string& id() const { return id_; }
    Clock::time_point created_at() const { return created_at_; }

    /// Queue ``text`` for the program's stdin. Fails with SessionNotFound once the run is over.
    Result<void> send_input(std::string_view text);

    /// Everything queued by ``send_input`` since the last call
    std::string take_pending_input();

    /// Request termination. The first reason sticks.
    void cancel(CancelReason reason);
    bool is_cancelled() const;
    std::optional<CancelReason> cancel_reason() const;

    /// Record activity for the idle reaper; called while a step is running
    void touch();

    /// Latest of: own activity, consumer taking an event
    Clock::time_point last_activity() const;

    /// Output captured so far, stdout and stderr interleaved in arrival order
    void append_output(std::string_view data);
    std::string output() const;

    void finish(ExecutionResult result);
    bool is_finished() const;
    std::optional<ExecutionResult> result() const;

    /// Blocks until ``finish`` or ``timeout``
    std::optional<ExecutionResult> wait_for_result(std::chrono::milliseconds timeout) const;

    EventChannel& events() { return events_; }

    /// Readable whenever input was queued or the session was cancelled
    int wake_fd() const { return wake_fd_; }

    /// Reset ``wake_fd`` to not-readable
    void clear_wake();

private:
    ExecutionSession(std::string id, std::size_t channel_bytes, int wake_fd);

    void wake() const;

    const std::string id_;
    const Clock::time_point created_at_;

    EventChannel events_;
    int wake_fd_;

    std::atomic<bool> cancelled_ = false;

    mutable std::mutex mutex_;
    mutable std::condition_variable finished_cv_;

    std::string pending_input_;
    std::string output_;
    std::optional<CancelReason> cancel_reason_;
    Clock::time_point last_activity_;
    std::optional<ExecutionResult> result_;
};

} // namespace nexusexec
