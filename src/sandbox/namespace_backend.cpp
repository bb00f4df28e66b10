#include <nexusexec/sandbox/namespace_backend.hpp>

#include "sandbox/cgroup.hpp"
#include "sandbox/limited_subprocess.hpp"

#include <nexusexec/common/error_types.hpp>
#include <nexusexec/common/linux.hpp>
#include <nexusexec/logging.hpp>
#include <nexusexec/sandbox/isolation_backend.hpp>
#include <nexusexec/sandbox/workspace.hpp>
#include <nexusexec/subprocess/run_result.hpp>
#include <nexusexec/subprocess/subprocess.hpp>

#include <fmt/format.h>
#include <fmt/std.h>

#include <cerrno>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sched.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace nexusexec {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view SANDBOX_HOSTNAME = "sandbox";
constexpr std::string_view SANDBOX_WORKSPACE = "/workspace";

/// Host directories made visible (read-only) inside the sandbox, when present
constexpr std::string_view SYSTEM_DIRS[] = {"/usr", "/bin", "/sbin", "/lib", "/lib32", "/lib64", "/etc"};

constexpr std::string_view DEVICES[] = {"/dev/null", "/dev/zero", "/dev/random", "/dev/urandom"};

struct MountOp
{
    enum class Kind { Mkdir, Symlink, BindReadOnly, BindReadWrite, BindFile, Tmpfs, Proc };

    Kind kind;
    std::string source;
    std::string target;

    /// Flags that must be kept when remounting read-only (locked by the parent user namespace)
    unsigned long remount_flags = 0;

    std::string data;
};

unsigned long locked_mount_flags(const std::string& path) {
    struct ::statvfs info{};
    if (::statvfs(path.c_str(), &info) == -1) {
        return 0;
    }

    struct FlagPair
    {
        unsigned long statvfs_flag;
        unsigned long mount_flag;
    };

    constexpr FlagPair FLAGS[] = {
        {ST_NOSUID, MS_NOSUID},         {ST_NODEV, MS_NODEV},     {ST_NOEXEC, MS_NOEXEC},
        {ST_NOATIME, MS_NOATIME},       {ST_RELATIME, MS_RELATIME}, {ST_NODIRATIME, MS_NODIRATIME},
    };

    unsigned long flags = 0;
    for (const auto& [statvfs_flag, mount_flag] : FLAGS) {
        if ((info.f_flag & statvfs_flag) != 0) {
            flags |= mount_flag;
        }
    }

    return flags;
}

/// Everything needed to populate the new root, resolved in the parent
std::vector<MountOp> make_mount_plan(const std::string& root, const std::string& host_workspace) {
    using enum MountOp::Kind;

    std::vector<MountOp> plan;

    for (std::string_view dir : SYSTEM_DIRS) {
        const std::string source{dir};
        const std::string target = root + source;

        std::error_code err;
        auto status = fs::symlink_status(source, err);

        if (err || !fs::exists(status)) {
            continue;
        }

        // Merged-/usr systems have /bin -> usr/bin and the like
        if (fs::is_symlink(status)) {
            auto link_target = fs::read_symlink(source, err);
            if (!err) {
                plan.push_back({.kind = Symlink, .source = link_target.string(), .target = target});
            }
            continue;
        }

        if (fs::is_directory(status)) {
            plan.push_back({.kind = Mkdir, .source = {}, .target = target});
            plan.push_back(
                {.kind = BindReadOnly, .source = source, .target = target, .remount_flags = locked_mount_flags(source)});
        }
    }

    const std::string workspace = root + std::string{SANDBOX_WORKSPACE};
    plan.push_back({.kind = Mkdir, .source = {}, .target = workspace});
    plan.push_back({.kind = BindReadWrite, .source = host_workspace, .target = workspace});

    plan.push_back({.kind = Mkdir, .source = {}, .target = root + "/tmp"});
    plan.push_back({.kind = Tmpfs, .source = {}, .target = root + "/tmp", .data = "mode=1777,size=64m"});

    plan.push_back({.kind = Mkdir, .source = {}, .target = root + "/proc"});
    plan.push_back({.kind = Proc, .source = {}, .target = root + "/proc"});

    plan.push_back({.kind = Mkdir, .source = {}, .target = root + "/dev"});
    for (std::string_view device : DEVICES) {
        plan.push_back({.kind = BindFile, .source = std::string{device}, .target = root + std::string{device}});
    }

    return plan;
}

/// Async-signal-safe write of a whole (short) string to a /proc file
int write_proc_file(const char* path, const std::string& data) noexcept {
    int fd = ::open(path, O_WRONLY | O_CLOEXEC);
    if (fd == -1) {
        return errno;
    }

    ssize_t res = ::write(fd, data.data(), data.size());
    int err = res == -1 ? errno : 0;
    ::close(fd);

    return err;
}

struct IdMaps
{
    std::string uid_map;
    std::string gid_map;

    /// Maps root inside the namespace to the engine's own uid / gid
    static IdMaps for_current_user() {
        return {.uid_map = fmt::format("0 {} 1", ::getuid()), .gid_map = fmt::format("0 {} 1", ::getgid())};
    }

    int write() const noexcept {
        // Absent on kernels older than 3.19, where writing gid_map needs no "deny"
        if (int err = write_proc_file("/proc/self/setgroups", "deny"); err != 0 && err != ENOENT) {
            return err;
        }
        if (int err = write_proc_file("/proc/self/uid_map", uid_map); err != 0) {
            return err;
        }
        return write_proc_file("/proc/self/gid_map", gid_map);
    }
};

/// Child process confined to new namespaces and a new root.
///
/// After unshare(2), the child forks once more: only that grandchild lives in the new PID
/// namespace (as its init). The intermediate process waits for it and mirrors its exit
/// status, so the engine sees the program's result on the pid it knows.
class NamespaceSubprocess : public LimitedSubprocess
{
public:
    NamespaceSubprocess(std::string exec, std::vector<std::string> args, SpawnOptions options,
                        const ResourceLimits& limits, std::optional<rlim_t> nproc, int ns_flags, std::string root,
                        std::vector<MountOp> mounts, Cgroup* cgroup)
        : LimitedSubprocess{std::move(exec), std::move(args), std::move(options), limits, nproc}
        , ns_flags_{ns_flags}
        , id_maps_{IdMaps::for_current_user()}
        , root_{std::move(root)}
        , mounts_{std::move(mounts)}
        , cgroup_{cgroup} {}

protected:
    int init_child() noexcept override {
        if (int err = Subprocess::init_child(); err != 0) {
            return err;
        }

        if (::unshare(ns_flags_) == -1) {
            return errno;
        }

        if (int err = id_maps_.write(); err != 0) {
            return err;
        }

        pid_t inner = ::fork();
        if (inner == -1) {
            return errno;
        }
        if (inner != 0) {
            supervise(inner);
        }

        if (int err = enter_root(); err != 0) {
            return err;
        }

        return apply_rlimits();
    }

    Result<void> init_parent() override {
        if (cgroup_ != nullptr) {
            TRY(cgroup_->add_process(get_pid()));
        }
        return {};
    }

private:
    [[noreturn]] void supervise(pid_t inner) const noexcept {
        // Never execs, so close-on-exec does not apply: drop every descriptor, or the
        // program would not see EOF on stdin and the engine would miss exec failures
        if (::syscall(SYS_close_range, 0U, ~0U, 0U) == -1) {
            constexpr int FALLBACK_FD_LIMIT = 1024;
            for (int fd = 0; fd < FALLBACK_FD_LIMIT; ++fd) {
                ::close(fd);
            }
        }

        int status = 0;
        while (::waitpid(inner, &status, 0) == -1) {
            if (errno != EINTR) {
                ::_exit(127);
            }
        }

        if (WIFSIGNALED(status)) {
            int sig = WTERMSIG(status);
            ::signal(sig, SIG_DFL);
            ::kill(::getpid(), sig);
            ::_exit(128 + sig);
        }

        ::_exit(WIFEXITED(status) ? WEXITSTATUS(status) : 127);
    }

    int enter_root() const noexcept {
        if (::mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) == -1) {
            return errno;
        }

        if (::mount("tmpfs", root_.c_str(), "tmpfs", MS_NOSUID, "mode=0755,size=16m") == -1) {
            return errno;
        }

        for (const auto& op : mounts_) {
            if (int err = apply(op); err != 0) {
                return err;
            }
        }

        if (::chdir(root_.c_str()) == -1) {
            return errno;
        }

        // pivot_root(".", ".") stacks the old root on top of the new one; detaching it leaves
        // only the new root. chroot is the fallback where pivot_root is refused.
        if (::syscall(SYS_pivot_root, ".", ".") == 0) {
            if (::umount2(".", MNT_DETACH) == -1) {
                return errno;
            }
        } else if (::chroot(".") == -1) {
            return errno;
        }

        if (::chdir(SANDBOX_WORKSPACE.data()) == -1) {
            return errno;
        }

        if (::sethostname(SANDBOX_HOSTNAME.data(), SANDBOX_HOSTNAME.size()) == -1) {
            return errno;
        }

        return 0;
    }

    static int apply(const MountOp& op) noexcept {
        using enum MountOp::Kind;

        switch (op.kind) {
        case Mkdir:
            if (::mkdir(op.target.c_str(), 0755) == -1 && errno != EEXIST) {
                return errno;
            }
            return 0;

        case Symlink:
            return ::symlink(op.source.c_str(), op.target.c_str()) == -1 ? errno : 0;

        case BindReadOnly:
            if (::mount(op.source.c_str(), op.target.c_str(), nullptr, MS_BIND | MS_REC, nullptr) == -1) {
                return errno;
            }
            if (::mount(nullptr, op.target.c_str(), nullptr, MS_BIND | MS_REMOUNT | MS_RDONLY | op.remount_flags,
                        nullptr) == -1) {
                return errno;
            }
            return 0;

        case BindReadWrite:
            return ::mount(op.source.c_str(), op.target.c_str(), nullptr, MS_BIND | MS_REC, nullptr) == -1 ? errno : 0;

        case BindFile: {
            int fd = ::open(op.target.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
            if (fd == -1) {
                return errno;
            }
            ::close(fd);
            return ::mount(op.source.c_str(), op.target.c_str(), nullptr, MS_BIND, nullptr) == -1 ? errno : 0;
        }

        case Tmpfs:
            return ::mount("tmpfs", op.target.c_str(), "tmpfs", MS_NOSUID | MS_NODEV, op.data.c_str()) == -1 ? errno
                                                                                                          : 0;

        case Proc:
            // Hosts that mask parts of their own /proc refuse a fresh proc mount; programs then
            // run without /proc rather than not at all
            std::ignore = ::mount("proc", op.target.c_str(), "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr);
            return 0;
        }

        return EINVAL;
    }

    int ns_flags_;
    IdMaps id_maps_;
    std::string root_;
    std::vector<MountOp> mounts_;
    Cgroup* cgroup_;
};

class NamespaceSandbox : public Sandbox
{
public:
    NamespaceSandbox(Workspace workspace, LanguageDescriptor descriptor, ResourceLimits limits, fs::path root,
                     std::optional<Cgroup> cgroup)
        : Sandbox{std::move(workspace), std::move(descriptor), limits}
        , root_{std::move(root)}
        , cgroup_{std::move(cgroup)} {}

    ~NamespaceSandbox() override {
        if (auto res = NamespaceSandbox::release(); !res) {
            LOG_ERROR("Failed to release sandbox {}: {}", root_, format_as(res.error()));
        }
    }

    Result<std::unique_ptr<Subprocess>> spawn(const StepSpec& step) override {
        if (step.argv.empty()) {
            return Error{ErrorKind::InternalSandboxError, "empty command"};
        }

        std::optional<rlim_t> nproc;
        if (cgroup_) {
            TRY(cgroup_->apply_limits(step.limits));
            oom_baseline_ = cgroup_->oom_kill_count();
        } else {
            nproc = LimitedSubprocess::count_user_processes() + step.limits.max_processes;
        }

        int ns_flags = CLONE_NEWUSER | CLONE_NEWPID | CLONE_NEWNS | CLONE_NEWIPC | CLONE_NEWUTS;
        if (!step.network) {
            ns_flags |= CLONE_NEWNET;
        }

        SpawnOptions options{
            .env = make_environment(step),
            .working_dir = {},
            .merge_stderr = step.merge_stderr,
        };

        std::vector<std::string> args(step.argv.begin() + 1, step.argv.end());
        auto proc = std::make_unique<NamespaceSubprocess>(
            step.argv.front(), std::move(args), std::move(options), step.limits, nproc, ns_flags, root_.string(),
            make_mount_plan(root_.string(), workspace().path().string()), cgroup_ ? &*cgroup_ : nullptr);

        TRY(proc->start());

        LOG_DEBUG("{} step of {} running as pid {} (network: {})", format_as(step.kind), descriptor().id,
                  proc->get_pid(), step.network);

        return std::unique_ptr<Subprocess>{std::move(proc)};
    }

    bool limit_exceeded(const RunResult& result) const override {
        if (Sandbox::limit_exceeded(result)) {
            return true;
        }
        return cgroup_ && cgroup_->oom_kill_count() > oom_baseline_;
    }

    Result<void> release() override {
        if (cgroup_) {
            TRY(cgroup_->remove());
            cgroup_.reset();
        }

        if (!root_.empty()) {
            std::error_code err;
            fs::remove(root_, err);
            if (err) {
                LOG_WARN("Could not remove sandbox root {}: {}", root_, err.message());
            }
            root_.clear();
        }

        return Sandbox::release();
    }

    std::string workspace_view() const override { return std::string{SANDBOX_WORKSPACE}; }

private:
    fs::path root_;
    std::optional<Cgroup> cgroup_;
    std::uint64_t oom_baseline_ = 0;
};

} // namespace

NamespaceBackend::NamespaceBackend(fs::path workspace_root, std::optional<fs::path> cgroup_root)
    : workspace_root_{std::move(workspace_root)}
    , cgroup_root_{std::move(cgroup_root)} {}

Result<std::unique_ptr<Sandbox>> NamespaceBackend::acquire(const std::vector<SourceFile>& files,
                                                           const LanguageDescriptor& descriptor,
                                                           const ResourceLimits& limits) {
    Workspace workspace = TRY(Workspace::create(workspace_root_));
    TRY(workspace.write_files(files));

    // Empty mount point for the sandbox's root; it only ever gets content inside the sandbox's
    // own mount namespace
    fs::path root = workspace_root_ / fmt::format("{}.root", workspace.id());
    if (::mkdir(root.c_str(), 0700) == -1) {
        LOG_ERROR("Could not create sandbox root {}: {}", root, get_err_msg());
        return Error{ErrorKind::InternalSandboxError, "internal sandbox error"};
    }

    std::optional<Cgroup> cgroup;
    if (cgroup_root_) {
        auto created = Cgroup::create(*cgroup_root_, fmt::format("nexusexec-{}", workspace.id()));
        if (!created) {
            std::error_code err;
            fs::remove(root, err);
            return created.error();
        }
        cgroup = std::move(created).value();
    }

    return std::unique_ptr<Sandbox>{std::make_unique<NamespaceSandbox>(std::move(workspace), descriptor, limits,
                                                                       std::move(root), std::move(cgroup))};
}

bool NamespaceBackend::is_supported() {
    const auto id_maps = IdMaps::for_current_user();

    auto fork_res = linux::fork();
    if (!fork_res) {
        return false;
    }

    if (fork_res->which == linux::Fork::Child) {
        bool ok = ::unshare(CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWPID | CLONE_NEWNET) == 0 && id_maps.write() == 0 &&
                  ::mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) == 0;
        ::_exit(ok ? 0 : 1);
    }

    auto wait_res = linux::waitpid(fork_res->pid);
    if (!wait_res) {
        return false;
    }

    auto result = RunResult::from_wait_status(wait_res->status);
    LOG_DEBUG("User namespace probe: {}", format_as(result));

    return result == RunResult::make_exited(0);
}

} // namespace nexusexec
