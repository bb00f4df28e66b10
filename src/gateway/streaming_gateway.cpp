#include <nexusexec/gateway/streaming_gateway.hpp>

#include <nexusexec/exceptions.hpp>
#include <nexusexec/logging.hpp>

#include <fmt/format.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nexusexec {

namespace {

std::unique_ptr<IsolationBackend> require_backend(std::unique_ptr<IsolationBackend> backend) {
    if (!backend) {
        throw EngineError("execution gateway needs an isolation backend");
    }
    return backend;
}

} // namespace

EventStream::EventStream(std::shared_ptr<ExecutionSession> session)
    : session_{std::move(session)} {}

EventStream::EventStream(EventStream&& other) noexcept
    : session_{std::exchange(other.session_, nullptr)}
    , ended_{other.ended_} {}

EventStream& EventStream::operator=(EventStream&& rhs) noexcept {
    if (this != &rhs) {
        disconnect();
        session_ = std::exchange(rhs.session_, nullptr);
        ended_ = rhs.ended_;
    }
    return *this;
}

EventStream::~EventStream() {
    disconnect();
}

std::optional<OutputEvent> EventStream::next(std::chrono::milliseconds timeout) {
    if (!session_ || ended_) {
        return std::nullopt;
    }

    auto event = session_->events().pop(timeout);
    if (event && is_end(*event)) {
        ended_ = true;
    }
    return event;
}

std::optional<ExecutionResult> EventStream::result() const {
    if (!session_ || !ended_) {
        return std::nullopt;
    }
    return session_->result();
}

const std::string& EventStream::session_id() const {
    static const std::string empty;
    return session_ ? session_->id() : empty;
}

void EventStream::disconnect() {
    if (!session_ || ended_) {
        return;
    }

    LOG_DEBUG("Session {:?}: stream consumer disconnected", session_->id());

    session_->events().close_consumer();
    session_->cancel(CancelReason::Disconnect);
    ended_ = true;
}

ExecutionGateway::ExecutionGateway(EngineConfig config)
    : ExecutionGateway{config, make_isolation_backend(config)} {}

ExecutionGateway::ExecutionGateway(EngineConfig config, std::unique_ptr<IsolationBackend> backend)
    : config_{std::move(config)}
    , languages_{config_.languages}
    , backend_{require_backend(std::move(backend))}
    , sessions_{config_.idle_grace, config_.event_channel_bytes}
    , orchestrator_{config_, languages_, *backend_, sessions_}
    , harness_{config_, languages_, orchestrator_} {
    LOG_INFO("Engine ready: {} backend, {} languages ({})", backend_->name(), languages_.size(),
             fmt::join(languages_.ids(), ", "));
}

ExecutionGateway::~ExecutionGateway() = default;

Result<ExecutionResult> ExecutionGateway::execute(const ExecutionRequest& request) {
    return orchestrator_.run(request);
}

Result<EventStream> ExecutionGateway::stream(const ExecutionRequest& request) {
    auto session = TRY(orchestrator_.start(request));
    return EventStream{std::move(session)};
}

Result<void> ExecutionGateway::send_input(std::string_view session_id, std::string_view text, bool append_newline) {
    auto session = TRY(sessions_.get(session_id));

    if (append_newline) {
        return session->send_input(fmt::format("{}\n", text));
    }
    return session->send_input(text);
}

Result<void> ExecutionGateway::cancel(std::string_view session_id) {
    return orchestrator_.cancel(session_id, CancelReason::User);
}

GradingResult ExecutionGateway::grade(const GradingRequest& request) {
    return harness_.grade(request);
}

std::vector<std::string> ExecutionGateway::languages() const {
    return languages_.ids();
}

} // namespace nexusexec
