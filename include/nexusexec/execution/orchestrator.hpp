#pragma once

#include <nexusexec/common/class_traits.hpp>
#include <nexusexec/common/error_types.hpp>
#include <nexusexec/config/engine_config.hpp>
#include <nexusexec/dependency/dependency_resolver.hpp>
#include <nexusexec/execution/execution_session.hpp>
#include <nexusexec/execution/execution_types.hpp>
#include <nexusexec/language/language_registry.hpp>
#include <nexusexec/sandbox/isolation_backend.hpp>
#include <nexusexec/session/session_registry.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>
#include <vector>

namespace nexusexec {

enum class OutputStream { Stdout, Stderr };

/// Drives runs through their install, compile and run steps.
///
/// ``run`` blocks its caller; ``start`` hands the run to a worker thread that feeds the
/// session's event channel. Either way the session is registered for the duration of the
/// run, so it can be cancelled or sent input by id.
class Orchestrator : NonMovable
{
public:
    /// Receives output as it is read. Returns false if the output could not be delivered
    /// before ``deadline`` (or will never be).
    using Forwarder = std::function<bool(OutputStream stream, std::string_view data,
                                         std::chrono::steady_clock::time_point deadline)>;

    /// All references must outlive the orchestrator
    Orchestrator(const EngineConfig& config, const LanguageRegistry& languages, IsolationBackend& backend,
                 SessionRegistry& sessions);

    /// Cancels every streaming run and waits for its worker
    ~Orchestrator();

    /// Fails only for requests that cannot start: UnsupportedLanguage, InvalidRequest, DuplicateSession
    Result<ExecutionResult> run(const ExecutionRequest& request);

    Result<std::shared_ptr<ExecutionSession>> start(const ExecutionRequest& request);

    /// Fails with SessionNotFound
    Result<void> cancel(std::string_view session_id, CancelReason reason = CancelReason::User);

    /// Worker threads that have not returned yet
    std::size_t active_workers() const;

private:
    struct PreparedRun;
    struct StepIo;
    struct StepOutcome;

    Result<PreparedRun> prepare(const ExecutionRequest& request) const;

    ExecutionResult execute(const ExecutionRequest& request, const PreparedRun& prepared, ExecutionSession& session,
                            const Forwarder& forward);

    Result<StepOutcome> run_step(Sandbox& sandbox, const StepSpec& step, ExecutionSession& session,
                                 const StepIo& io) const;

    Result<StepOutcome> drive(Subprocess& proc, ExecutionSession& session, const StepIo& io) const;

    ResourceLimits toolchain_limits(const ResourceLimits& run_limits, std::chrono::milliseconds timeout) const;

    void stream_worker(const ExecutionRequest& request, const PreparedRun& prepared,
                       const std::shared_ptr<ExecutionSession>& session);

    void prune_workers();

    struct Worker
    {
        std::shared_ptr<ExecutionSession> session;
        /// Set as the thread's last action, after the end of the stream was delivered
        std::shared_ptr<std::atomic<bool>> done;
        std::jthread thread;
    };

    const EngineConfig& config_;
    const LanguageRegistry& languages_;
    IsolationBackend& backend_;
    SessionRegistry& sessions_;
    DependencyResolver resolver_;

    mutable std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};

} // namespace nexusexec
