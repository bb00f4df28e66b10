#include "sandbox/cgroup.hpp"

#include <nexusexec/common/error_types.hpp>
#include <nexusexec/common/linux.hpp>
#include <nexusexec/logging.hpp>
#include <nexusexec/sandbox/resource_limits.hpp>

#include <fmt/format.h>
#include <fmt/std.h>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <tuple>
#include <utility>

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace nexusexec {

namespace fs = std::filesystem;

namespace {

std::uint64_t parse_key(std::string_view content, std::string_view key) {
    while (!content.empty()) {
        auto newline = content.find('\n');
        auto line = content.substr(0, newline);
        content = newline == std::string_view::npos ? std::string_view{} : content.substr(newline + 1);

        if (line.size() > key.size() && line.starts_with(key) && line[key.size()] == ' ') {
            std::uint64_t value = 0;
            auto digits = line.substr(key.size() + 1);
            if (std::from_chars(digits.data(), digits.data() + digits.size(), value).ec != std::errc{}) {
                return 0;
            }
            return value;
        }
    }

    return 0;
}

} // namespace

Cgroup::Cgroup(fs::path path)
    : path_{std::move(path)} {}

Cgroup::Cgroup(Cgroup&& other) noexcept
    : path_{std::exchange(other.path_, {})} {}

Cgroup& Cgroup::operator=(Cgroup&& rhs) noexcept {
    if (this != &rhs) {
        std::ignore = remove();
        path_ = std::exchange(rhs.path_, {});
    }
    return *this;
}

Cgroup::~Cgroup() {
    if (auto res = remove(); !res) {
        LOG_ERROR("Leaking cgroup {}: {}", path_, format_as(res.error()));
    }
}

Result<Cgroup> Cgroup::create(const fs::path& parent, std::string_view name) {
    // Controllers may already be enabled, or the parent may not allow enabling them; the
    // limit writes below are what actually matter
    if (auto res = linux::write_file((parent / "cgroup.subtree_control").string(), "+memory +cpu +pids"); !res) {
        LOG_DEBUG("Could not enable controllers in {}: {}", parent, res.error().message());
    }

    fs::path path = parent / name;

    if (::mkdir(path.c_str(), 0755) == -1) {
        LOG_ERROR("Could not create cgroup {}: {}", path, get_err_msg());
        return Error{ErrorKind::InternalSandboxError, "internal sandbox error"};
    }

    LOG_DEBUG("Created cgroup {}", path);

    return Cgroup{std::move(path)};
}

Result<void> Cgroup::write_control(std::string_view file, std::string_view value) const {
    auto res = linux::write_file((path_ / file).string(), value);

    if (!res) {
        LOG_ERROR("Could not write {:?} to {}: {}", value, path_ / file, res.error().message());
        return Error{ErrorKind::InternalSandboxError, "internal sandbox error"};
    }

    return {};
}

Result<void> Cgroup::apply_limits(const ResourceLimits& limits) {
    TRY(write_control("memory.max", std::to_string(limits.memory_bytes)));
    TRY(write_control("memory.swap.max", "0"));
    TRY(write_control("pids.max", std::to_string(limits.max_processes)));

    auto quota = static_cast<std::uint64_t>(limits.cpu_cores * static_cast<double>(CPU_PERIOD_USEC));
    TRY(write_control("cpu.max", fmt::format("{} {}", std::max<std::uint64_t>(quota, 1000), CPU_PERIOD_USEC)));

    return {};
}

Result<void> Cgroup::add_process(pid_t pid) {
    return write_control("cgroup.procs", std::to_string(pid));
}

std::uint64_t Cgroup::oom_kill_count() const {
    auto events = linux::read_file((path_ / "memory.events").string());

    if (!events) {
        LOG_WARN("Could not read {}: {}", path_ / "memory.events", events.error().message());
        return 0;
    }

    return parse_key(*events, "oom_kill");
}

Result<void> Cgroup::kill_all() {
    if (linux::write_file((path_ / "cgroup.kill").string(), "1")) {
        return {};
    }

    // cgroup.kill needs Linux 5.14; fall back to signalling every member
    auto procs = linux::read_file((path_ / "cgroup.procs").string());
    if (!procs) {
        LOG_ERROR("Could not read {}: {}", path_ / "cgroup.procs", procs.error().message());
        return Error{ErrorKind::InternalSandboxError, "internal sandbox error"};
    }

    std::string_view pids = *procs;
    while (!pids.empty()) {
        auto newline = pids.find('\n');
        auto line = pids.substr(0, newline);
        pids = newline == std::string_view::npos ? std::string_view{} : pids.substr(newline + 1);

        pid_t pid = 0;
        if (std::from_chars(line.data(), line.data() + line.size(), pid).ec == std::errc{} && pid > 0) {
            std::ignore = linux::kill(pid, SIGKILL);
        }
    }

    return {};
}

Result<void> Cgroup::remove() {
    using namespace std::chrono_literals;

    if (path_.empty()) {
        return {};
    }

    TRY(kill_all());

    // Killed processes leave the cgroup asynchronously
    constexpr int MAX_ATTEMPTS = 50;
    for (int attempt = 0; attempt < MAX_ATTEMPTS; ++attempt) {
        if (::rmdir(path_.c_str()) == 0 || errno == ENOENT) {
            LOG_DEBUG("Removed cgroup {}", path_);
            path_.clear();
            return {};
        }
        if (errno != EBUSY) {
            break;
        }
        std::this_thread::sleep_for(2ms);
    }

    LOG_ERROR("Could not remove cgroup {}: {}", path_, get_err_msg());
    return Error{ErrorKind::InternalSandboxError, "internal sandbox error"};
}

} // namespace nexusexec
