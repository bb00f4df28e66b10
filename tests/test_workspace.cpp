#include "catch2_custom.hpp"

#include <nexusexec/common/error_types.hpp>
#include <nexusexec/execution/source_file.hpp>
#include <nexusexec/sandbox/workspace.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>

#include <sys/stat.h>

namespace fs = std::filesystem;

using nexusexec::ErrorKind;
using nexusexec::SourceFile;
using nexusexec::Workspace;

namespace {

fs::path test_root() {
    return fs::temp_directory_path() / "nexusexec-workspace-tests";
}

std::string slurp(const fs::path& path) {
    std::ifstream file{path};
    return {std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
}

} // namespace

TEST_CASE("File name validation") {
    REQUIRE(Workspace::is_valid_file_name("main.py"));
    REQUIRE(Workspace::is_valid_file_name("src/util/helpers.py"));
    REQUIRE(Workspace::is_valid_file_name("com/example/Main.java"));
    REQUIRE(Workspace::is_valid_file_name(".hidden"));

    REQUIRE_FALSE(Workspace::is_valid_file_name(""));
    REQUIRE_FALSE(Workspace::is_valid_file_name("/etc/passwd"));
    REQUIRE_FALSE(Workspace::is_valid_file_name("../escape.py"));
    REQUIRE_FALSE(Workspace::is_valid_file_name("src/../../escape.py"));
    REQUIRE_FALSE(Workspace::is_valid_file_name("./main.py"));
    REQUIRE_FALSE(Workspace::is_valid_file_name("dir/"));
    REQUIRE_FALSE(Workspace::is_valid_file_name("a//b.py"));
    REQUIRE_FALSE(Workspace::is_valid_file_name("with space.py"));
    REQUIRE_FALSE(Workspace::is_valid_file_name("semi;colon.py"));
    REQUIRE_FALSE(Workspace::is_valid_file_name(std::string(300, 'a')));
}

TEST_CASE("Workspaces are private and removed on destruction") {
    fs::path path;

    {
        auto workspace = Workspace::create(test_root());
        REQUIRE(workspace);

        path = workspace->path();
        REQUIRE(fs::is_directory(path));
        REQUIRE(path.parent_path() == test_root());
        REQUIRE(workspace->id() == path.filename().string());

        struct stat info{};
        REQUIRE(::stat(path.c_str(), &info) == 0);
        REQUIRE((info.st_mode & 0777) == 0700);

        REQUIRE(workspace->write_files({
            SourceFile{.name = "main.py", .content = "print('hi')\n"},
            SourceFile{.name = "pkg/util.py", .content = "X = 1\n"},
        }));

        REQUIRE(slurp(path / "main.py") == "print('hi')\n");
        REQUIRE(slurp(path / "pkg" / "util.py") == "X = 1\n");
        REQUIRE(workspace->contains("pkg/util.py"));
        REQUIRE_FALSE(workspace->contains("missing.py"));
    }

    REQUIRE_FALSE(fs::exists(path));
}

TEST_CASE("Unsafe names are rejected before touching the disk") {
    auto workspace = Workspace::create(test_root());
    REQUIRE(workspace);

    auto res = workspace->write_file(SourceFile{.name = "../outside.txt", .content = "x"});
    REQUIRE(res.has_error());
    REQUIRE(res.error().kind == ErrorKind::InvalidRequest);
    REQUIRE_FALSE(fs::exists(test_root() / "outside.txt"));
}

TEST_CASE("Removal copes with read-only directories") {
    auto workspace = Workspace::create(test_root());
    REQUIRE(workspace);

    const fs::path locked = workspace->path() / "locked";
    REQUIRE(workspace->write_file(SourceFile{.name = "locked/file.txt", .content = "data"}));
    fs::permissions(locked, fs::perms::owner_read | fs::perms::owner_exec);

    const fs::path path = workspace->path();
    REQUIRE(workspace->remove());
    REQUIRE_FALSE(fs::exists(path));

    // Removing twice is harmless
    REQUIRE(workspace->remove());
}

TEST_CASE("Moving a workspace transfers ownership") {
    auto created = Workspace::create(test_root());
    REQUIRE(created);

    Workspace first = std::move(created).value();
    const fs::path path = first.path();

    Workspace second = std::move(first);
    REQUIRE(second.path() == path);
    REQUIRE(first.path().empty()); // NOLINT(bugprone-use-after-move)
    REQUIRE(fs::exists(path));
}
