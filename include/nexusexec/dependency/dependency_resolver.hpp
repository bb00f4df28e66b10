#pragma once

#include <nexusexec/common/error_types.hpp>
#include <nexusexec/execution/source_file.hpp>
#include <nexusexec/language/language_descriptor.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nexusexec {

/// package name -> version; version "*" means "any"
using DependencyMap = std::map<std::string, std::string>;

/// What has to happen inside the sandbox before the program can run
struct InstallPlan
{
    /// Manifest to write into the workspace root (replaces a user file of the same name)
    SourceFile manifest;

    /// Install argv template, expanded like any other descriptor command
    std::vector<std::string> command;

    std::chrono::milliseconds timeout;
};

/// Turns a dependency map into a manifest file and an install command for a language
class DependencyResolver
{
public:
    static constexpr std::chrono::milliseconds DEFAULT_INSTALL_TIMEOUT{120'000};

    explicit DependencyResolver(std::chrono::milliseconds install_timeout = DEFAULT_INSTALL_TIMEOUT);

    /// Returns std::nullopt when there is nothing to install.
    /// Fails with DependencyInstallError for invalid names / versions, malformed user manifests,
    /// or dependencies for a language without a package manager.
    Result<std::optional<InstallPlan>> plan(const LanguageDescriptor& descriptor, const DependencyMap& dependencies,
                                            const std::vector<SourceFile>& files) const;

    /// Non-empty, no leading '-', only ``[A-Za-z0-9._@/:+~^<>=*-]``
    static bool is_valid_package_token(std::string_view token);

    static std::string render_requirements(const DependencyMap& dependencies);
    static Result<std::string> render_package_json(const DependencyMap& dependencies,
                                                   const std::optional<std::string>& existing);
    static Result<std::string> render_pom(const DependencyMap& dependencies);
    static std::string render_conanfile(const DependencyMap& dependencies);

    /// Parse the ``pkg==version`` / ``pkg`` lines of a requirements.txt. Comments and blanks are skipped.
    static DependencyMap parse_requirements(std::string_view content);

private:
    std::chrono::milliseconds install_timeout_;
};

} // namespace nexusexec
