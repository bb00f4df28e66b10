#include <nexusexec/execution/execution_session.hpp>

#include <nexusexec/common/error_types.hpp>
#include <nexusexec/common/linux.hpp>
#include <nexusexec/logging.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

#include <sys/eventfd.h>

namespace nexusexec {

std::string_view format_as(CancelReason reason) {
    switch (reason) {
    case CancelReason::User:
        return "cancelled by user";
    case CancelReason::Disconnect:
        return "client disconnected";
    case CancelReason::Idle:
        return "idle timeout";
    case CancelReason::Shutdown:
        return "engine shutting down";
    }
    return "<unknown reason>";
}

Result<std::shared_ptr<ExecutionSession>> ExecutionSession::create(std::string id, std::size_t channel_bytes) {
    int wake_fd = TRYE(linux::eventfd(), SyscallFailure);

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory) - private constructor
    return std::shared_ptr<ExecutionSession>{new ExecutionSession{std::move(id), channel_bytes, wake_fd}};
}

ExecutionSession::ExecutionSession(std::string id, std::size_t channel_bytes, int wake_fd)
    : id_{std::move(id)}
    , created_at_{Clock::now()}
    , events_{channel_bytes}
    , wake_fd_{wake_fd}
    , last_activity_{created_at_} {}

ExecutionSession::~ExecutionSession() {
    std::ignore = linux::close(wake_fd_);
}

Result<void> ExecutionSession::send_input(std::string_view text) {
    {
        std::lock_guard lock{mutex_};

        if (result_) {
            return Error{ErrorKind::SessionNotFound, "Session not found"};
        }

        pending_input_ += text;
        last_activity_ = Clock::now();
    }

    wake();
    return {};
}

std::string ExecutionSession::take_pending_input() {
    std::lock_guard lock{mutex_};
    return std::exchange(pending_input_, {});
}

void ExecutionSession::cancel(CancelReason reason) {
    {
        std::lock_guard lock{mutex_};
        if (result_ || cancel_reason_) {
            return;
        }
        cancel_reason_ = reason;
    }

    cancelled_ = true;
    LOG_DEBUG("Session {:?}: {}", id_, format_as(reason));

    wake();
}

bool ExecutionSession::is_cancelled() const {
    return cancelled_;
}

std::optional<CancelReason> ExecutionSession::cancel_reason() const {
    std::lock_guard lock{mutex_};
    return cancel_reason_;
}

void ExecutionSession::touch() {
    std::lock_guard lock{mutex_};
    last_activity_ = Clock::now();
}

ExecutionSession::Clock::time_point ExecutionSession::last_activity() const {
    Clock::time_point own = [this] {
        std::lock_guard lock{mutex_};
        return last_activity_;
    }();

    return std::max(own, events_.last_consumed());
}

void ExecutionSession::append_output(std::string_view data) {
    std::lock_guard lock{mutex_};
    output_ += data;
    last_activity_ = Clock::now();
}

std::string ExecutionSession::output() const {
    std::lock_guard lock{mutex_};
    return output_;
}

void ExecutionSession::finish(ExecutionResult result) {
    {
        std::lock_guard lock{mutex_};
        result_ = std::move(result);
        pending_input_.clear();
    }
    finished_cv_.notify_all();
}

bool ExecutionSession::is_finished() const {
    std::lock_guard lock{mutex_};
    return result_.has_value();
}

std::optional<ExecutionResult> ExecutionSession::result() const {
    std::lock_guard lock{mutex_};
    return result_;
}

std::optional<ExecutionResult> ExecutionSession::wait_for_result(std::chrono::milliseconds timeout) const {
    std::unique_lock lock{mutex_};
    finished_cv_.wait_for(lock, timeout, [this] { return result_.has_value(); });
    return result_;
}

void ExecutionSession::wake() const {
    const std::uint64_t one = 1;
    std::ignore = linux::write(wake_fd_, std::string_view{reinterpret_cast<const char*>(&one), sizeof(one)});
}

void ExecutionSession::clear_wake() {
    // eventfd reads reset the counter; EAGAIN just means it was already clear
    std::ignore = linux::read(wake_fd_, sizeof(std::uint64_t));
}

} // namespace nexusexec
