#include "app/run_app.hpp"

#include <nexusexec/common/linux.hpp>
#include <nexusexec/gateway/streaming_gateway.hpp>
#include <nexusexec/logging.hpp>

#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <optional>
#include <string>
#include <vector>

#include <poll.h>
#include <unistd.h>

namespace nexusexec {

namespace {

constexpr std::chrono::milliseconds EVENT_POLL_INTERVAL{20};

std::string make_session_id() {
    return fmt::format("cli-{}-{}", ::getpid(), std::chrono::steady_clock::now().time_since_epoch().count());
}

} // namespace

int RunApp::run_impl() {
    ExecutionGateway gateway{load_config()};

    ExecutionRequest request{
        .session_id = make_session_id(),
        .language = OPTS.language,
        .files = read_source_files(),
        .main_file = OPTS.main_file,
        .dependencies = parse_dependencies(),
        .stdin_data = std::nullopt,
        .interactive = OPTS.interactive,
        .policy = OPTS.policy,
        .limits = {},
        .fixed_timeout = std::nullopt,
        .correlation = {},
    };

    if (OPTS.stdin_path) {
        std::ifstream in_file{*OPTS.stdin_path};
        std::stringstream buffer;
        buffer << in_file.rdbuf();
        request.stdin_data = buffer.str();
    }

    int status = OPTS.stream ? run_streaming(gateway, request) : run_batch(gateway, request);

    serializer_->finalize();

    return status;
}

int RunApp::run_batch(ExecutionGateway& gateway, const ExecutionRequest& request) {
    auto result = gateway.execute(request);

    if (!result) {
        serializer_->on_error(format_as(result.error()));
        return EXIT_FAILURE_STATUS;
    }

    serializer_->on_execution_result(*result, /*streamed=*/false);

    return result->ok() ? EXIT_SUCCESS : EXIT_FAILURE_STATUS;
}

int RunApp::run_streaming(ExecutionGateway& gateway, const ExecutionRequest& request) {
    auto stream = gateway.stream(request);

    if (!stream) {
        serializer_->on_error(format_as(stream.error()));
        return EXIT_FAILURE_STATUS;
    }

    bool forward_input = OPTS.interactive;

    while (!stream->finished()) {
        if (auto event = stream->next(EVENT_POLL_INTERVAL)) {
            serializer_->on_output_event(*event);
        }

        if (forward_input && !stream->finished()) {
            forward_input = forward_terminal_input(gateway, stream->session_id());
        }
    }

    auto result = stream->result();
    if (!result) {
        serializer_->on_error("stream ended without a result");
        return EXIT_FAILURE_STATUS;
    }

    serializer_->on_execution_result(*result, /*streamed=*/true);

    return result->ok() ? EXIT_SUCCESS : EXIT_FAILURE_STATUS;
}

bool RunApp::forward_terminal_input(ExecutionGateway& gateway, const std::string& session_id) {
    std::vector<pollfd> fds{{.fd = STDIN_FILENO, .events = POLLIN, .revents = 0}};

    auto ready = linux::poll(fds, 0);
    if (!ready || *ready == 0) {
        return true;
    }

    constexpr std::size_t CHUNK_SIZE = 4096;
    auto data = linux::read(STDIN_FILENO, CHUNK_SIZE);

    if (!data || data->empty()) {
        LOG_DEBUG("Terminal input closed");
        return false;
    }

    if (auto sent = gateway.send_input(session_id, *data, /*append_newline=*/false); !sent) {
        LOG_DEBUG("Input not delivered: {}", format_as(sent.error()));
    }

    return true;
}

} // namespace nexusexec
