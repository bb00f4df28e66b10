#pragma once

#include <nexusexec/common/class_traits.hpp>
#include <nexusexec/common/error_types.hpp>
#include <nexusexec/config/engine_config.hpp>
#include <nexusexec/execution/execution_session.hpp>
#include <nexusexec/execution/execution_types.hpp>
#include <nexusexec/execution/orchestrator.hpp>
#include <nexusexec/execution/output_event.hpp>
#include <nexusexec/grading/grading_types.hpp>
#include <nexusexec/grading/test_harness.hpp>
#include <nexusexec/language/language_registry.hpp>
#include <nexusexec/sandbox/isolation_backend.hpp>
#include <nexusexec/session/session_registry.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nexusexec {

/// Consumer end of a streaming run.
///
/// Destroying (or ``disconnect``ing) a stream before its end event counts as the peer going
/// away: the run is cancelled and its remaining output discarded.
class EventStream : NonCopyable
{
public:
    explicit EventStream(std::shared_ptr<ExecutionSession> session);

    EventStream(EventStream&& other) noexcept;
    EventStream& operator=(EventStream&& rhs) noexcept;
    ~EventStream();

    /// Next event, or std::nullopt if none arrived within ``timeout`` (or the stream already ended)
    std::optional<OutputEvent> next(std::chrono::milliseconds timeout);

    /// Whether the end event has been taken
    bool finished() const { return ended_; }

    /// Final result; only available once the end event has been taken
    std::optional<ExecutionResult> result() const;

    const std::string& session_id() const;

    void disconnect();

private:
    std::shared_ptr<ExecutionSession> session_;
    bool ended_ = false;
};

/// The engine's public entry point. Owns the backend, the session registry and the
/// orchestrator; safe to call from any number of threads.
class ExecutionGateway : NonMovable
{
public:
    /// Uses the backend named by ``config``. Throws ConfigError.
    explicit ExecutionGateway(EngineConfig config);

    /// Uses ``backend`` instead of the configured one
    ExecutionGateway(EngineConfig config, std::unique_ptr<IsolationBackend> backend);

    ~ExecutionGateway();

    Result<ExecutionResult> execute(const ExecutionRequest& request);

    Result<EventStream> stream(const ExecutionRequest& request);

    /// Queue input for a running program. Fails with SessionNotFound once it has terminated.
    Result<void> send_input(std::string_view session_id, std::string_view text, bool append_newline = true);

    Result<void> cancel(std::string_view session_id);

    GradingResult grade(const GradingRequest& request);

    /// Canonical ids of the supported languages
    std::vector<std::string> languages() const;

    const EngineConfig& config() const { return config_; }
    std::size_t live_sessions() const { return sessions_.size(); }

private:
    EngineConfig config_;
    LanguageRegistry languages_;
    std::unique_ptr<IsolationBackend> backend_;
    SessionRegistry sessions_;
    Orchestrator orchestrator_;
    TestHarness harness_;
};

} // namespace nexusexec
