#pragma once

#include <nexusexec/common/class_traits.hpp>
#include <nexusexec/common/error_types.hpp>
#include <nexusexec/execution/execution_session.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

namespace nexusexec {

/// Live sessions by id. The only mutable structure shared between runs.
///
/// A background reaper cancels and drops sessions that showed no activity for ``idle_grace``.
/// A step that is still running counts as activity.
class SessionRegistry : NonMovable
{
public:
    using Clock = ExecutionSession::Clock;

    /// ``start_reaper = false`` leaves reaping to explicit ``reap_idle`` calls
    SessionRegistry(std::chrono::milliseconds idle_grace, std::size_t channel_bytes, bool start_reaper = true);
    ~SessionRegistry();

    /// Fails with DuplicateSession if ``session_id`` is live; the existing session is untouched
    Result<std::shared_ptr<ExecutionSession>> create(std::string_view session_id);

    /// Fails with SessionNotFound
    Result<std::shared_ptr<ExecutionSession>> get(std::string_view session_id) const;

    void remove(std::string_view session_id);

    /// Remove ``session`` only if its id still maps to it (not to a newer session with the same id)
    void remove_if_same(const std::shared_ptr<ExecutionSession>& session);

    std::size_t size() const;

    /// Cancel and remove every session idle since before ``now - idle_grace``.
    /// Returns the number of sessions reaped.
    std::size_t reap_idle(Clock::time_point now);

    std::chrono::milliseconds reap_interval() const;

private:
    void reaper_loop(const std::stop_token& stop);

    const std::chrono::milliseconds idle_grace_;
    const std::size_t channel_bytes_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ExecutionSession>, std::less<>> sessions_;

    std::mutex reaper_mutex_;
    std::condition_variable_any reaper_cv_;

    // Declared last: stopped and joined before the members it uses are destroyed
    std::jthread reaper_;
};

} // namespace nexusexec
