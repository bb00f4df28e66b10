#pragma once

#include <nexusexec/common/class_traits.hpp>
#include <nexusexec/common/error_types.hpp>
#include <nexusexec/execution/source_file.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace nexusexec {

/// A private scratch directory (mode 0700) holding one run's files.
/// Removed, with everything in it, when the object is destroyed.
class Workspace : NonCopyable
{
public:
    /// Create a fresh, uniquely named directory under ``root`` (created if missing)
    static Result<Workspace> create(const std::filesystem::path& root);

    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& rhs) noexcept;
    ~Workspace();

    const std::filesystem::path& path() const;

    /// Unique directory name, also used to name containers and cgroups
    std::string id() const;

    /// Write ``file`` below the workspace root, creating intermediate directories.
    /// Fails with InvalidRequest if the name is not a safe relative path.
    Result<void> write_file(const SourceFile& file) const;
    Result<void> write_files(const std::vector<SourceFile>& files) const;

    bool contains(std::string_view name) const;

    Result<void> remove();

    /// Relative, no ``..`` or ``.`` components, only ``[A-Za-z0-9._/-]``
    static bool is_valid_file_name(std::string_view name);

private:
    explicit Workspace(std::filesystem::path path);

    std::filesystem::path path_;
};

} // namespace nexusexec
