#pragma once

#include <nexusexec/gateway/streaming_gateway.hpp>

#include "app/app.hpp" // IWYU pragma: export

namespace nexusexec {

/// ``nexusexec run``: one execution, batch or streamed
class RunApp final : public App
{
public:
    using App::App;

private:
    int run_impl() override;

    int run_batch(ExecutionGateway& gateway, const ExecutionRequest& request);
    int run_streaming(ExecutionGateway& gateway, const ExecutionRequest& request);

    /// Forward whatever is available on this process's stdin to the session. Returns false on EOF.
    bool forward_terminal_input(ExecutionGateway& gateway, const std::string& session_id);
};

} // namespace nexusexec
