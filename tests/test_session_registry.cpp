#include "catch2_custom.hpp"

#include <nexusexec/common/error_types.hpp>
#include <nexusexec/execution/execution_session.hpp>
#include <nexusexec/execution/execution_types.hpp>
#include <nexusexec/session/session_registry.hpp>

#include <chrono>
#include <memory>
#include <thread>

#include <poll.h>

using namespace std::chrono_literals;
using nexusexec::CancelReason;
using nexusexec::ErrorKind;
using nexusexec::ExecutionResult;
using nexusexec::ExecutionSession;
using nexusexec::ExecutionStatus;
using nexusexec::SessionRegistry;

namespace {

bool is_readable(int fd) {
    pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
    return ::poll(&pfd, 1, 0) == 1;
}

} // namespace

TEST_CASE("Sessions are registered under unique ids") {
    SessionRegistry registry{60s, 1024, false};

    auto first = registry.create("abc");
    REQUIRE(first);
    REQUIRE(registry.size() == 1);

    auto duplicate = registry.create("abc");
    REQUIRE(duplicate.has_error());
    REQUIRE(duplicate.error().kind == ErrorKind::DuplicateSession);

    // The existing session is untouched by the rejected duplicate
    REQUIRE(registry.get("abc").value() == first.value());
    REQUIRE_FALSE((*first)->is_cancelled());

    REQUIRE(registry.create("").error().kind == ErrorKind::InvalidRequest);
    REQUIRE(registry.get("missing").error().kind == ErrorKind::SessionNotFound);

    registry.remove("abc");
    REQUIRE(registry.size() == 0);
    REQUIRE(registry.create("abc"));
}

TEST_CASE("Only the session that owns an id removes it") {
    SessionRegistry registry{60s, 1024, false};

    auto old_session = registry.create("reused").value();
    registry.remove("reused");
    auto new_session = registry.create("reused").value();

    registry.remove_if_same(old_session);
    REQUIRE(registry.get("reused").value() == new_session);

    registry.remove_if_same(new_session);
    REQUIRE(registry.size() == 0);
}

TEST_CASE("Idle sessions are cancelled and dropped") {
    SessionRegistry registry{100ms, 1024, false};

    auto idle = registry.create("idle").value();
    auto busy = registry.create("busy").value();

    const auto later = SessionRegistry::Clock::now() + 150ms;
    busy->touch();

    REQUIRE(registry.reap_idle(SessionRegistry::Clock::now()) == 0);

    std::this_thread::sleep_for(110ms);
    busy->touch();

    REQUIRE(registry.reap_idle(SessionRegistry::Clock::now()) == 1);
    REQUIRE(idle->is_cancelled());
    REQUIRE(idle->cancel_reason() == CancelReason::Idle);
    REQUIRE_FALSE(busy->is_cancelled());
    REQUIRE(registry.get("idle").error().kind == ErrorKind::SessionNotFound);

    REQUIRE(registry.reap_idle(later + 1s) == 1);
    REQUIRE(registry.size() == 0);
}

TEST_CASE("The background reaper runs on its own") {
    SessionRegistry registry{100ms, 1024};
    REQUIRE(registry.reap_interval() == 100ms);

    auto session = registry.create("forgotten").value();

    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (!session->is_cancelled() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
    }

    REQUIRE(session->cancel_reason() == CancelReason::Idle);
    REQUIRE(registry.size() == 0);
}

TEST_CASE("Destroying the registry cancels live sessions") {
    std::shared_ptr<ExecutionSession> session;
    {
        SessionRegistry registry{60s, 1024, false};
        session = registry.create("live").value();
    }

    REQUIRE(session->cancel_reason() == CancelReason::Shutdown);
}

TEST_CASE("Session input and cancellation") {
    auto session = ExecutionSession::create("s1", 1024).value();

    REQUIRE_FALSE(is_readable(session->wake_fd()));

    REQUIRE(session->send_input("hello\n"));
    REQUIRE(session->send_input("world\n"));
    REQUIRE(is_readable(session->wake_fd()));

    REQUIRE(session->take_pending_input() == "hello\nworld\n");
    REQUIRE(session->take_pending_input().empty());

    session->clear_wake();
    REQUIRE_FALSE(is_readable(session->wake_fd()));

    session->cancel(CancelReason::User);
    session->cancel(CancelReason::Idle);
    REQUIRE(session->is_cancelled());
    REQUIRE(session->cancel_reason() == CancelReason::User);
    REQUIRE(is_readable(session->wake_fd()));
}

TEST_CASE("Finished sessions refuse input") {
    auto session = ExecutionSession::create("s2", 1024).value();
    REQUIRE_FALSE(session->is_finished());
    REQUIRE_FALSE(session->wait_for_result(10ms));

    std::jthread finisher{[&session] {
        std::this_thread::sleep_for(20ms);
        session->finish(ExecutionResult{.stdout_text = "done", .status = ExecutionStatus::Ok});
    }};

    auto result = session->wait_for_result(5s);
    REQUIRE(result);
    REQUIRE(result->stdout_text == "done");
    REQUIRE(session->is_finished());

    auto input = session->send_input("late");
    REQUIRE(input.has_error());
    REQUIRE(input.error().kind == ErrorKind::SessionNotFound);

    // Cancelling after the fact changes nothing
    session->cancel(CancelReason::User);
    REQUIRE_FALSE(session->is_cancelled());
}

TEST_CASE("Session output accumulates") {
    auto session = ExecutionSession::create("s3", 1024).value();

    session->append_output("a");
    session->append_output("bc");
    REQUIRE(session->output() == "abc");
    REQUIRE(session->last_activity() >= session->created_at());
}
