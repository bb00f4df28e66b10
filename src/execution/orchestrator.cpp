#include <nexusexec/execution/orchestrator.hpp>

#include <nexusexec/common/linux.hpp>
#include <nexusexec/execution/output_event.hpp>
#include <nexusexec/logging.hpp>
#include <nexusexec/sandbox/workspace.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <gsl/util>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/find_if.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <poll.h>

namespace nexusexec {

using Clock = std::chrono::steady_clock;

namespace {

/// Longest a single poll may block; bounds how late a cancel or deadline is noticed
constexpr std::chrono::milliseconds POLL_SLICE{50};

/// Install and compile logs are capped but never abort the step
constexpr std::uint64_t TOOLCHAIN_LOG_LIMIT = 4ULL * 1024 * 1024;
constexpr std::uint32_t TOOLCHAIN_MAX_PROCESSES = 256;
constexpr std::uint64_t TOOLCHAIN_FILE_SIZE = 1024ULL * 1024 * 1024;

/// How long the trailing error notice may wait for room in a full channel
constexpr std::chrono::milliseconds NOTICE_DELIVERY_GRACE{2'000};

constexpr std::string_view INTERNAL_ERROR_MESSAGE = "internal sandbox error";

ExecutionResult internal_failure(ExecutionResult result, std::string_view session_id, const Error& err) {
    LOG_ERROR("Session {:?}: {}", session_id, format_as(err));
    result.status = ExecutionStatus::InternalError;
    result.diagnostics = INTERNAL_ERROR_MESSAGE;
    return result;
}

ExecutionResult cancelled(ExecutionResult result, const ExecutionSession& session) {
    result.status = ExecutionStatus::Cancelled;
    auto reason = session.cancel_reason().value_or(CancelReason::User);
    result.diagnostics = fmt::format("cancelled ({})", format_as(reason));
    return result;
}

bool exited_cleanly(const std::optional<RunResult>& exit) {
    return exit && exit->get_kind() == RunResult::Kind::Exited && exit->get_code() == 0;
}

/// Message carried by the stream's trailing error event, if the status calls for one
std::optional<std::string> error_notice(const ExecutionResult& result) {
    switch (result.status) {
    case ExecutionStatus::Ok:
    case ExecutionStatus::RuntimeError:
        return std::nullopt;
    case ExecutionStatus::InternalError:
        return std::string{INTERNAL_ERROR_MESSAGE};
    case ExecutionStatus::CompileError:
    case ExecutionStatus::DependencyInstallError:
    case ExecutionStatus::Timeout:
    case ExecutionStatus::ResourceLimit:
    case ExecutionStatus::Cancelled:
        break;
    }
    if (result.diagnostics.empty()) {
        return std::string{format_as(result.status)};
    }
    return fmt::format("{}: {}", format_as(result.status), result.diagnostics);
}

} // namespace

struct Orchestrator::PreparedRun
{
    const LanguageDescriptor* descriptor = nullptr;
    std::vector<SourceFile> files;
    std::string main_file;
    ResourceLimits limits;
    std::optional<InstallPlan> install;

    /// Set when the dependency map could not be turned into a manifest; the run fails
    /// with DependencyInstallError without acquiring a sandbox
    std::optional<Error> dependency_error;
};

struct Orchestrator::StepIo
{
    std::string initial_input;

    /// Keep stdin open and feed it from the session's pending input
    bool interactive = false;

    std::chrono::milliseconds timeout{0};

    std::uint64_t output_cap = 0;

    /// Whether hitting ``output_cap`` ends the step; otherwise the rest is discarded
    bool kill_on_output_cap = true;

    /// Report everything as stderr (toolchain logs)
    bool forward_as_stderr = false;

    const Forwarder* forward = nullptr;
};

struct Orchestrator::StepOutcome
{
    std::optional<RunResult> exit;
    bool timed_out = false;
    bool cancelled = false;
    bool output_exceeded = false;
    std::string stdout_text;
    std::string stderr_text;
    std::chrono::milliseconds duration{0};
};

Orchestrator::Orchestrator(const EngineConfig& config, const LanguageRegistry& languages, IsolationBackend& backend,
                           SessionRegistry& sessions)
    : config_{config}
    , languages_{languages}
    , backend_{backend}
    , sessions_{sessions}
    , resolver_{config.install_timeout} {}

Orchestrator::~Orchestrator() {
    std::vector<Worker> workers;
    {
        std::lock_guard lock{workers_mutex_};
        workers = std::move(workers_);
    }

    for (auto& worker : workers) {
        worker.session->cancel(CancelReason::Shutdown);
    }

    // jthreads join as ``workers`` goes out of scope
}

Result<Orchestrator::PreparedRun> Orchestrator::prepare(const ExecutionRequest& request) const {
    if (request.session_id.empty()) {
        return Error{ErrorKind::InvalidRequest, "session id must not be empty"};
    }

    auto descriptor_ref = TRY(languages_.resolve(request.language));
    const LanguageDescriptor& descriptor = descriptor_ref.get();

    if (request.files.empty()) {
        return Error{ErrorKind::InvalidRequest, "no source files submitted"};
    }

    std::set<std::string_view> names;
    for (const auto& file : request.files) {
        if (!Workspace::is_valid_file_name(file.name)) {
            return Error{ErrorKind::InvalidRequest, fmt::format("invalid file name {:?}", file.name)};
        }
        if (!names.insert(file.name).second) {
            return Error{ErrorKind::InvalidRequest, fmt::format("file {:?} submitted twice", file.name)};
        }
    }

    PreparedRun prepared;
    prepared.descriptor = &descriptor;
    prepared.files = request.files;
    prepared.main_file = request.main_file.empty() ? descriptor.entry_file : request.main_file;

    if (!names.contains(prepared.main_file)) {
        return Error{ErrorKind::InvalidRequest,
                     fmt::format("main file {:?} is not among the submitted files", prepared.main_file)};
    }

    if (auto valid = request.limits.validate(); !valid) {
        return Error{ErrorKind::InvalidRequest, valid.error()};
    }

    auto limits = config_.limits_for(descriptor, request.policy, request.limits);
    if (!limits) {
        return Error{ErrorKind::InvalidRequest, limits.error()};
    }
    prepared.limits = *limits;

    if (request.fixed_timeout) {
        if (*request.fixed_timeout <= std::chrono::milliseconds{0}) {
            return Error{ErrorKind::InvalidRequest, "timeout must be positive"};
        }
        prepared.limits.wall_timeout = *request.fixed_timeout;
    }

    auto plan = resolver_.plan(descriptor, request.dependencies, request.files);
    if (!plan) {
        prepared.dependency_error = plan.error();
        return prepared;
    }

    if (plan->has_value()) {
        const InstallPlan& install = **plan;
        auto existing = ranges::find_if(prepared.files,
                                        [&install](const SourceFile& file) { return file.name == install.manifest.name; });
        if (existing != prepared.files.end()) {
            *existing = install.manifest;
        } else {
            prepared.files.push_back(install.manifest);
        }
        prepared.install = install;
    }

    return prepared;
}

ResourceLimits Orchestrator::toolchain_limits(const ResourceLimits& run_limits,
                                              std::chrono::milliseconds timeout) const {
    ResourceLimits limits = run_limits;
    limits.wall_timeout = timeout;
    limits.memory_bytes = std::max(run_limits.memory_bytes, config_.install_memory_bytes);
    limits.max_processes = std::max(run_limits.max_processes, TOOLCHAIN_MAX_PROCESSES);
    limits.cpu_cores = std::max(run_limits.cpu_cores, 1.0);
    limits.output_bytes = TOOLCHAIN_LOG_LIMIT;
    limits.file_size_bytes = std::max(run_limits.file_size_bytes, TOOLCHAIN_FILE_SIZE);
    limits.open_files = std::max<std::uint32_t>(run_limits.open_files, 1024);
    return limits;
}

Result<Orchestrator::StepOutcome> Orchestrator::run_step(Sandbox& sandbox, const StepSpec& step,
                                                         ExecutionSession& session, const StepIo& io) const {
    LOG_DEBUG("Session {:?}: {} step: {}", session.id(), format_as(step.kind), step.argv);

    auto proc = TRY(sandbox.spawn(step));
    return drive(*proc, session, io);
}

Result<Orchestrator::StepOutcome> Orchestrator::drive(Subprocess& proc, ExecutionSession& session,
                                                      const StepIo& io) const {
    StepOutcome outcome;

    const auto started = Clock::now();
    const auto deadline = started + io.timeout;
    auto ended = started;

    std::string pending = io.initial_input;
    std::uint64_t captured = 0;
    bool stop = false;

    auto handle_output = [&](OutputStream stream, std::string chunk) {
        if (chunk.empty() || captured >= io.output_cap) {
            if (!chunk.empty() && io.kill_on_output_cap) {
                outcome.output_exceeded = true;
                stop = true;
            }
            return;
        }

        if (captured + chunk.size() > io.output_cap) {
            chunk.resize(gsl::narrow_cast<std::size_t>(io.output_cap - captured));
            if (io.kill_on_output_cap) {
                outcome.output_exceeded = true;
                stop = true;
            }
        }
        captured += chunk.size();

        session.append_output(chunk);
        (stream == OutputStream::Stdout ? outcome.stdout_text : outcome.stderr_text) += chunk;

        if (io.forward == nullptr || !*io.forward) {
            return;
        }

        auto forwarded_as = io.forward_as_stderr ? OutputStream::Stderr : stream;
        if (!(*io.forward)(forwarded_as, chunk, deadline)) {
            if (session.events().is_consumer_closed()) {
                session.cancel(CancelReason::Disconnect);
                outcome.cancelled = true;
            } else {
                // Consumer stopped reading; the run counts as stalled
                outcome.timed_out = true;
            }
            stop = true;
        }
    };

    auto read_available = [&]() -> Result<void> {
        if (proc.get_stdout_fd() != -1) {
            handle_output(OutputStream::Stdout, TRY(proc.read_stdout()));
        }
        if (!stop && proc.get_stderr_fd() != -1) {
            handle_output(OutputStream::Stderr, TRY(proc.read_stderr()));
        }
        return {};
    };

    while (!stop) {
        if (session.is_cancelled()) {
            outcome.cancelled = true;
            break;
        }

        const auto now = Clock::now();
        if (now >= deadline) {
            outcome.timed_out = true;
            break;
        }

        session.clear_wake();
        if (io.interactive) {
            pending += session.take_pending_input();
        }

        if (!pending.empty() && proc.get_stdin_fd() != -1) {
            auto written = proc.write_stdin(pending);
            if (written) {
                pending.erase(0, *written);
            } else {
                LOG_WARN("Session {:?}: dropping {} bytes of input ({})", session.id(), pending.size(),
                         format_as(written.error()));
                pending.clear();
                TRY(proc.close_stdin());
            }
        }

        if (!io.interactive && pending.empty() && proc.get_stdin_fd() != -1) {
            TRY(proc.close_stdin());
        }

        std::vector<pollfd> fds;
        if (proc.get_stdout_fd() != -1) {
            fds.push_back({.fd = proc.get_stdout_fd(), .events = POLLIN, .revents = 0});
        }
        if (proc.get_stderr_fd() != -1) {
            fds.push_back({.fd = proc.get_stderr_fd(), .events = POLLIN, .revents = 0});
        }
        if (!pending.empty() && proc.get_stdin_fd() != -1) {
            fds.push_back({.fd = proc.get_stdin_fd(), .events = POLLOUT, .revents = 0});
        }
        fds.push_back({.fd = session.wake_fd(), .events = POLLIN, .revents = 0});

        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        auto slice = std::min(remaining, POLL_SLICE);
        TRYE(linux::poll(fds, gsl::narrow_cast<int>(slice.count())), SyscallFailure);

        TRY(read_available());
        if (stop) {
            break;
        }

        if (auto exited = TRY(proc.poll_exit())) {
            ended = Clock::now();

            // Output written right before exit may still sit in the pipes
            while (!stop) {
                auto before = captured;
                TRY(read_available());
                if (captured == before) {
                    break;
                }
            }

            outcome.exit = exited;
            break;
        }

        // A step that is still running counts as activity for the idle reaper
        session.touch();
    }

    if (!outcome.exit) {
        ended = Clock::now();
    }

    if (proc.is_alive()) {
        TRY(proc.terminate(config_.kill_grace));
    } else {
        // The leader has been reaped; background children may still hold its process group
        TRY(proc.kill());
    }

    if (!outcome.exit) {
        outcome.exit = proc.get_run_result();
    }

    outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(ended - started);

    return outcome;
}

ExecutionResult Orchestrator::execute(const ExecutionRequest& request, const PreparedRun& prepared,
                                      ExecutionSession& session, const Forwarder& forward) {
    using namespace std::chrono_literals;

    ASSERT(prepared.descriptor != nullptr);
    const LanguageDescriptor& descriptor = *prepared.descriptor;

    ExecutionResult result;
    result.correlation = request.correlation;

    if (prepared.dependency_error) {
        result.status = ExecutionStatus::DependencyInstallError;
        result.diagnostics = prepared.dependency_error->message;
        return result;
    }

    auto acquired = backend_.acquire(prepared.files, descriptor, prepared.limits);
    if (!acquired) {
        return internal_failure(std::move(result), session.id(), acquired.error());
    }
    std::unique_ptr<Sandbox> sandbox = std::move(acquired).value();

    auto release_sandbox = gsl::finally([&sandbox, &session] {
        if (auto res = sandbox->release(); !res) {
            LOG_ERROR("Session {:?}: failed to release sandbox: {}", session.id(), format_as(res.error()));
        }
    });

    const CommandContext ctx = descriptor.make_context(prepared.files, prepared.main_file, sandbox->workspace_view());

    if (prepared.install) {
        StepSpec step{
            .kind = StepKind::Install,
            .argv = expand_command(prepared.install->command, ctx),
            .env = {},
            .limits = toolchain_limits(prepared.limits, prepared.install->timeout),
            .network = true,
            .merge_stderr = true,
        };
        StepIo io{
            .initial_input = {},
            .interactive = false,
            .timeout = prepared.install->timeout,
            .output_cap = TOOLCHAIN_LOG_LIMIT,
            .kill_on_output_cap = false,
            .forward_as_stderr = true,
            .forward = &forward,
        };

        auto outcome = run_step(*sandbox, step, session, io);
        if (!outcome) {
            return internal_failure(std::move(result), session.id(), outcome.error());
        }
        if (outcome->cancelled) {
            return cancelled(std::move(result), session);
        }

        if (outcome->timed_out || !exited_cleanly(outcome->exit)) {
            result.status = ExecutionStatus::DependencyInstallError;
            result.diagnostics = std::move(outcome->stdout_text);
            if (outcome->timed_out) {
                result.diagnostics += fmt::format("\ndependency installation timed out after {}", io.timeout);
            }
            LOG_INFO("Session {:?}: dependency installation failed", session.id());
            return result;
        }
    }

    if (descriptor.is_compiled()) {
        StepSpec step{
            .kind = StepKind::Compile,
            .argv = expand_command(*descriptor.compile_command, ctx),
            .env = {},
            .limits = toolchain_limits(prepared.limits, config_.compile_timeout),
            .network = false,
            .merge_stderr = true,
        };
        StepIo io{
            .initial_input = {},
            .interactive = false,
            .timeout = config_.compile_timeout,
            .output_cap = TOOLCHAIN_LOG_LIMIT,
            .kill_on_output_cap = false,
            .forward_as_stderr = true,
            .forward = &forward,
        };

        auto outcome = run_step(*sandbox, step, session, io);
        if (!outcome) {
            return internal_failure(std::move(result), session.id(), outcome.error());
        }
        if (outcome->cancelled) {
            return cancelled(std::move(result), session);
        }

        if (outcome->timed_out || !exited_cleanly(outcome->exit)) {
            result.status = ExecutionStatus::CompileError;
            result.diagnostics = std::move(outcome->stdout_text);
            if (outcome->timed_out) {
                result.diagnostics += fmt::format("\ncompilation timed out after {}", io.timeout);
            } else if (outcome->exit) {
                result.exit_code = outcome->exit->get_shell_code();
            }
            return result;
        }
    }

    StepSpec step{
        .kind = StepKind::Run,
        .argv = expand_command(descriptor.run_command, ctx),
        .env = {},
        .limits = prepared.limits,
        .network = false,
        .merge_stderr = false,
    };
    StepIo io{
        .initial_input = request.stdin_data.value_or(""),
        .interactive = request.interactive,
        .timeout = prepared.limits.wall_timeout,
        .output_cap = prepared.limits.output_bytes,
        .kill_on_output_cap = true,
        .forward_as_stderr = false,
        .forward = &forward,
    };

    auto outcome = run_step(*sandbox, step, session, io);
    if (!outcome) {
        return internal_failure(std::move(result), session.id(), outcome.error());
    }

    result.stdout_text = std::move(outcome->stdout_text);
    result.stderr_text = std::move(outcome->stderr_text);
    result.duration_ms = outcome->duration.count();
    if (outcome->exit) {
        result.exit_code = outcome->exit->get_shell_code();
    }

    if (outcome->cancelled) {
        return cancelled(std::move(result), session);
    }

    if (outcome->timed_out) {
        result.status = ExecutionStatus::Timeout;
        result.timed_out = true;
        result.diagnostics = fmt::format("execution timed out after {}", io.timeout);
    } else if (outcome->output_exceeded) {
        result.status = ExecutionStatus::ResourceLimit;
        result.diagnostics = fmt::format("output limit of {} bytes exceeded", io.output_cap);
    } else if (!outcome->exit) {
        return internal_failure(std::move(result), session.id(),
                                Error{ErrorKind::InternalSandboxError, "program ended without an exit status"});
    } else if (sandbox->limit_exceeded(*outcome->exit)) {
        result.status = ExecutionStatus::ResourceLimit;
        result.diagnostics = fmt::format("resource limit exceeded ({})", format_as(*outcome->exit));
    } else if (exited_cleanly(outcome->exit)) {
        result.status = ExecutionStatus::Ok;
    } else {
        result.status = ExecutionStatus::RuntimeError;
    }

    return result;
}

Result<ExecutionResult> Orchestrator::run(const ExecutionRequest& request) {
    auto prepared = TRY(prepare(request));
    auto session = TRY(sessions_.create(request.session_id));

    auto unregister = gsl::finally([this, &session] { sessions_.remove_if_same(session); });

    LOG_INFO("Session {:?}: running {} program", session->id(), prepared.descriptor->id);

    ExecutionResult result;
    try {
        result = execute(request, prepared, *session, Forwarder{});
    } catch (const std::exception& ex) {
        result = internal_failure(ExecutionResult{.correlation = request.correlation}, session->id(),
                                  Error{ErrorKind::InternalSandboxError, ex.what()});
    }
    session->finish(result);

    LOG_INFO("Session {:?}: {}", session->id(), format_as(result));

    return result;
}

Result<std::shared_ptr<ExecutionSession>> Orchestrator::start(const ExecutionRequest& request) {
    auto prepared = TRY(prepare(request));
    auto session = TRY(sessions_.create(request.session_id));

    prune_workers();

    LOG_INFO("Session {:?}: streaming {} program", session->id(), prepared.descriptor->id);

    auto done = std::make_shared<std::atomic<bool>>(false);

    std::lock_guard lock{workers_mutex_};
    workers_.push_back(Worker{
        .session = session,
        .done = done,
        .thread = std::jthread{[this, request, prepared = std::move(prepared), session, done] {
            stream_worker(request, prepared, session);
            done->store(true);
        }},
    });

    return session;
}

void Orchestrator::stream_worker(const ExecutionRequest& request, const PreparedRun& prepared,
                                 const std::shared_ptr<ExecutionSession>& session) {
    Forwarder forward = [&session](OutputStream stream, std::string_view data, Clock::time_point deadline) {
        OutputEvent event = stream == OutputStream::Stdout ? OutputEvent{StdoutChunk{std::string{data}}}
                                                           : OutputEvent{StderrChunk{std::string{data}}};
        return session->events().push(std::move(event), deadline);
    };

    ExecutionResult result;
    try {
        result = execute(request, prepared, *session, forward);
    } catch (const std::exception& ex) {
        result = internal_failure(ExecutionResult{.correlation = request.correlation}, session->id(),
                                  Error{ErrorKind::InternalSandboxError, ex.what()});
    }

    auto notice = error_notice(result);

    session->finish(result);
    sessions_.remove_if_same(session);

    if (notice) {
        session->events().push(ErrorNotice{std::move(*notice)}, Clock::now() + NOTICE_DELIVERY_GRACE);
    }
    session->events().push(EndOfStream{}, Clock::now());

    LOG_INFO("Session {:?}: {}", session->id(), format_as(result));
}

Result<void> Orchestrator::cancel(std::string_view session_id, CancelReason reason) {
    auto session = TRY(sessions_.get(session_id));

    LOG_INFO("Session {:?}: cancel requested ({})", session->id(), format_as(reason));
    session->cancel(reason);

    return {};
}

void Orchestrator::prune_workers() {
    std::lock_guard lock{workers_mutex_};
    // Only threads that already returned are erased, so the implied join never blocks
    std::erase_if(workers_, [](const Worker& worker) { return worker.done->load(); });
}

std::size_t Orchestrator::active_workers() const {
    std::lock_guard lock{workers_mutex_};
    return static_cast<std::size_t>(std::count_if(workers_.begin(), workers_.end(), [](const Worker& worker) {
        return !worker.done->load();
    }));
}

} // namespace nexusexec
