#pragma once

#include <nexusexec/common/error_types.hpp>

#include <fmt/format.h>

#include <stdexcept>
#include <string>

namespace nexusexec {

/// Failure that leaves the engine unable to serve requests at all
class EngineError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;

    explicit EngineError(const Error& error)
        : std::runtime_error{format_as(error)}
        , error_{error.kind} {}

    ErrorKind get_error() const { return error_; }

private:
    ErrorKind error_ = ErrorKind::InternalSandboxError;
};

/// Invalid or unusable configuration, detected at startup
class ConfigError : public EngineError
{
public:
    using EngineError::EngineError;
};

} // namespace nexusexec
