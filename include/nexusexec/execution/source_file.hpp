#pragma once

#include <string>

namespace nexusexec {

/// One user-supplied file. ``name`` is relative to the workspace root.
struct SourceFile
{
    std::string name;
    std::string content;

    bool operator==(const SourceFile&) const = default;
};

} // namespace nexusexec
