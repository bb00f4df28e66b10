#include <nexusexec/session/session_registry.hpp>

#include <nexusexec/common/error_types.hpp>
#include <nexusexec/execution/execution_session.hpp>
#include <nexusexec/logging.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace nexusexec {

SessionRegistry::SessionRegistry(std::chrono::milliseconds idle_grace, std::size_t channel_bytes, bool start_reaper)
    : idle_grace_{idle_grace}
    , channel_bytes_{channel_bytes} {
    if (start_reaper) {
        reaper_ = std::jthread{[this](const std::stop_token& stop) { reaper_loop(stop); }};
    }
}

SessionRegistry::~SessionRegistry() {
    if (reaper_.joinable()) {
        reaper_.request_stop();
        reaper_.join();
    }

    std::lock_guard lock{mutex_};
    for (const auto& [id, session] : sessions_) {
        session->cancel(CancelReason::Shutdown);
    }
}

Result<std::shared_ptr<ExecutionSession>> SessionRegistry::create(std::string_view session_id) {
    if (session_id.empty()) {
        return Error{ErrorKind::InvalidRequest, "session id must not be empty"};
    }

    std::lock_guard lock{mutex_};

    if (sessions_.contains(session_id)) {
        return Error{ErrorKind::DuplicateSession, fmt::format("Session {:?} already exists", session_id)};
    }

    auto session = TRY(ExecutionSession::create(std::string{session_id}, channel_bytes_));
    sessions_.emplace(std::string{session_id}, session);

    LOG_DEBUG("Registered session {:?} ({} live)", session_id, sessions_.size());

    return session;
}

Result<std::shared_ptr<ExecutionSession>> SessionRegistry::get(std::string_view session_id) const {
    std::lock_guard lock{mutex_};

    auto iter = sessions_.find(session_id);
    if (iter == sessions_.end()) {
        return Error{ErrorKind::SessionNotFound, "Session not found"};
    }

    return iter->second;
}

void SessionRegistry::remove(std::string_view session_id) {
    std::lock_guard lock{mutex_};

    if (auto iter = sessions_.find(session_id); iter != sessions_.end()) {
        sessions_.erase(iter);
        LOG_DEBUG("Removed session {:?} ({} live)", session_id, sessions_.size());
    }
}

void SessionRegistry::remove_if_same(const std::shared_ptr<ExecutionSession>& session) {
    std::lock_guard lock{mutex_};

    if (auto iter = sessions_.find(session->id()); iter != sessions_.end() && iter->second == session) {
        sessions_.erase(iter);
        LOG_DEBUG("Removed session {:?} ({} live)", session->id(), sessions_.size());
    }
}

std::size_t SessionRegistry::size() const {
    std::lock_guard lock{mutex_};
    return sessions_.size();
}

std::size_t SessionRegistry::reap_idle(Clock::time_point now) {
    std::vector<std::shared_ptr<ExecutionSession>> idle;

    {
        std::lock_guard lock{mutex_};

        std::erase_if(sessions_, [&](const auto& entry) {
            if (now - entry.second->last_activity() < idle_grace_) {
                return false;
            }
            idle.push_back(entry.second);
            return true;
        });
    }

    // Cancelling wakes the worker; done outside the lock
    for (const auto& session : idle) {
        LOG_INFO("Reaping idle session {:?}", session->id());
        session->cancel(CancelReason::Idle);
    }

    return idle.size();
}

std::chrono::milliseconds SessionRegistry::reap_interval() const {
    using namespace std::chrono_literals;
    return std::max<std::chrono::milliseconds>(idle_grace_ / 4, 100ms);
}

void SessionRegistry::reaper_loop(const std::stop_token& stop) {
    LOG_DEBUG("Idle session reaper running every {}", reap_interval());

    while (!stop.stop_requested()) {
        {
            std::unique_lock lock{reaper_mutex_};
            if (reaper_cv_.wait_for(lock, stop, reap_interval(), [&stop] { return stop.stop_requested(); })) {
                break;
            }
        }

        reap_idle(Clock::now());
    }
}

} // namespace nexusexec
