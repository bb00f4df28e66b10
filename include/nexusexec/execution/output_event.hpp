#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace nexusexec {

/// Visitor built from a set of lambdas, one per event alternative
template <typename... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};

struct StdoutChunk
{
    std::string data;

    bool operator==(const StdoutChunk&) const = default;
};

struct StderrChunk
{
    std::string data;

    bool operator==(const StderrChunk&) const = default;
};

/// Human-readable, path-free description of why a run did not finish normally
struct ErrorNotice
{
    std::string message;

    bool operator==(const ErrorNotice&) const = default;
};

/// Last event of every stream, emitted exactly once
struct EndOfStream
{
    bool operator==(const EndOfStream&) const = default;
};

using OutputEvent = std::variant<StdoutChunk, StderrChunk, ErrorNotice, EndOfStream>;

/// Bytes of payload an event carries
inline std::size_t payload_size(const OutputEvent& event) {
    return std::visit(Overloaded{
                          [](const StdoutChunk& chunk) { return chunk.data.size(); },
                          [](const StderrChunk& chunk) { return chunk.data.size(); },
                          [](const ErrorNotice& notice) { return notice.message.size(); },
                          [](const EndOfStream&) { return std::size_t{0}; },
                      },
                      event);
}

inline bool is_end(const OutputEvent& event) {
    return std::holds_alternative<EndOfStream>(event);
}

std::string_view format_as(const OutputEvent& event);

} // namespace nexusexec
