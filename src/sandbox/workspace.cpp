#include <nexusexec/sandbox/workspace.hpp>

#include <nexusexec/common/error_types.hpp>
#include <nexusexec/logging.hpp>

#include <fmt/format.h>
#include <fmt/std.h>
#include <range/v3/algorithm/all_of.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace nexusexec {

namespace fs = std::filesystem;

Workspace::Workspace(fs::path path)
    : path_{std::move(path)} {}

Workspace::Workspace(Workspace&& other) noexcept
    : path_{std::exchange(other.path_, {})} {}

Workspace& Workspace::operator=(Workspace&& rhs) noexcept {
    if (this != &rhs) {
        std::ignore = remove();
        path_ = std::exchange(rhs.path_, {});
    }
    return *this;
}

Workspace::~Workspace() {
    if (auto res = remove(); !res) {
        LOG_ERROR("Leaking workspace {}: {}", path_, format_as(res.error()));
    }
}

Result<Workspace> Workspace::create(const fs::path& root) {
    std::error_code err;
    fs::create_directories(root, err);

    if (err) {
        LOG_ERROR("Could not create workspace root {}: {}", root, err.message());
        return Error{ErrorKind::InternalSandboxError, "internal sandbox error"};
    }

    // mkdtemp creates the directory with mode 0700
    std::string templ = (root / "ws-XXXXXX").string();
    if (::mkdtemp(templ.data()) == nullptr) {
        LOG_ERROR("mkdtemp({:?}) failed: {}", templ, get_err_msg());
        return Error{ErrorKind::InternalSandboxError, "internal sandbox error"};
    }

    LOG_DEBUG("Created workspace {}", templ);

    return Workspace{fs::path{templ}};
}

const fs::path& Workspace::path() const {
    return path_;
}

std::string Workspace::id() const {
    return path_.filename().string();
}

bool Workspace::is_valid_file_name(std::string_view name) {
    constexpr std::size_t MAX_NAME_LEN = 255;

    if (name.empty() || name.size() > MAX_NAME_LEN || name.front() == '/' || name.back() == '/') {
        return false;
    }

    auto is_allowed_char = [](char chr) {
        return (chr >= 'a' && chr <= 'z') || (chr >= 'A' && chr <= 'Z') || (chr >= '0' && chr <= '9') ||
               chr == '.' || chr == '_' || chr == '-' || chr == '/';
    };

    if (!ranges::all_of(name, is_allowed_char)) {
        return false;
    }

    while (!name.empty()) {
        auto slash = name.find('/');
        auto component = name.substr(0, slash);

        if (component.empty() || component == "." || component == "..") {
            return false;
        }

        name = slash == std::string_view::npos ? std::string_view{} : name.substr(slash + 1);
    }

    return true;
}

bool Workspace::contains(std::string_view name) const {
    std::error_code err;
    return is_valid_file_name(name) && fs::exists(path_ / name, err);
}

Result<void> Workspace::write_file(const SourceFile& file) const {
    if (!is_valid_file_name(file.name)) {
        return Error{ErrorKind::InvalidRequest, fmt::format("invalid file name {:?}", file.name)};
    }

    const fs::path target = path_ / file.name;

    std::error_code err;
    fs::create_directories(target.parent_path(), err);
    if (err) {
        LOG_ERROR("Could not create directory {}: {}", target.parent_path(), err.message());
        return Error{ErrorKind::InternalSandboxError, "internal sandbox error"};
    }

    std::ofstream out{target, std::ios::binary | std::ios::trunc};
    out.write(file.content.data(), static_cast<std::streamsize>(file.content.size()));

    if (!out) {
        LOG_ERROR("Could not write {}", target);
        return Error{ErrorKind::InternalSandboxError, "internal sandbox error"};
    }

    LOG_TRACE("Wrote {} ({} bytes)", target, file.content.size());

    return {};
}

Result<void> Workspace::write_files(const std::vector<SourceFile>& files) const {
    for (const auto& file : files) {
        TRY(write_file(file));
    }

    return {};
}

Result<void> Workspace::remove() {
    if (path_.empty()) {
        return {};
    }

    std::error_code err;

    // Programs may have dropped write permission on their own files / directories
    for (auto it = fs::recursive_directory_iterator(path_, fs::directory_options::skip_permission_denied, err);
         !err && it != fs::recursive_directory_iterator(); it.increment(err)) {
        if (it->is_directory(err) && !it->is_symlink(err)) {
            fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, err);
        }
    }

    err.clear();
    fs::remove_all(path_, err);

    if (err) {
        LOG_ERROR("Could not remove workspace {}: {}", path_, err.message());
        return ErrorKind::InternalSandboxError;
    }

    LOG_DEBUG("Removed workspace {}", path_);
    path_.clear();

    return {};
}

} // namespace nexusexec
