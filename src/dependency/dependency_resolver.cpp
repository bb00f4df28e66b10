#include <nexusexec/dependency/dependency_resolver.hpp>

#include <nexusexec/common/error_types.hpp>
#include <nexusexec/language/language_descriptor.hpp>
#include <nexusexec/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/algorithm/sort.hpp>

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nexusexec {

namespace {

std::string_view trim(std::string_view str) {
    constexpr std::string_view WHITESPACE = " \t\r\n";

    auto first = str.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = str.find_last_not_of(WHITESPACE);

    return str.substr(first, last - first + 1);
}

bool is_unpinned(std::string_view version) {
    return version.empty() || version == "*";
}

/// Versions such as ">=1.2" or "~=3.0" already carry their comparison operator
bool has_operator(std::string_view version) {
    return !version.empty() && std::string_view{"<>=!~"}.find(version.front()) != std::string_view::npos;
}

std::optional<std::string> find_file(const std::vector<SourceFile>& files, std::string_view name) {
    auto iter = ranges::find_if(files, [name](const SourceFile& file) { return file.name == name; });

    if (iter == files.end()) {
        return std::nullopt;
    }
    return iter->content;
}

Error install_error(std::string message) {
    return Error{ErrorKind::DependencyInstallError, std::move(message)};
}

} // namespace

DependencyResolver::DependencyResolver(std::chrono::milliseconds install_timeout)
    : install_timeout_{install_timeout} {}

bool DependencyResolver::is_valid_package_token(std::string_view token) {
    constexpr std::string_view EXTRA_CHARS = "._@/:+~^<>=*-";

    if (token.empty() || token.front() == '-') {
        return false;
    }

    return ranges::all_of(token, [EXTRA_CHARS](char chr) {
        return (chr >= 'a' && chr <= 'z') || (chr >= 'A' && chr <= 'Z') || (chr >= '0' && chr <= '9') ||
               EXTRA_CHARS.find(chr) != std::string_view::npos;
    });
}

DependencyMap DependencyResolver::parse_requirements(std::string_view content) {
    DependencyMap res;

    while (!content.empty()) {
        auto newline = content.find('\n');
        auto line = trim(content.substr(0, newline));
        content = newline == std::string_view::npos ? std::string_view{} : content.substr(newline + 1);

        if (line.empty() || line.front() == '#') {
            continue;
        }

        // The name ends at the first comparison operator; "==" pins, anything else is kept verbatim
        auto sep = line.find_first_of("<>=!~");
        if (sep == std::string_view::npos) {
            res[std::string{line}] = "*";
            continue;
        }

        auto name = trim(line.substr(0, sep));
        auto constraint = trim(line.substr(sep));
        if (constraint.starts_with("==") && !has_operator(trim(constraint.substr(2)))) {
            constraint = trim(constraint.substr(2));
        }
        res[std::string{name}] = std::string{constraint};
    }

    return res;
}

std::string DependencyResolver::render_requirements(const DependencyMap& dependencies) {
    std::vector<std::string> lines;

    for (const auto& [name, version] : dependencies) {
        if (is_unpinned(version)) {
            lines.push_back(name);
        } else if (has_operator(version)) {
            lines.push_back(name + version);
        } else {
            lines.push_back(fmt::format("{}=={}", name, version));
        }
    }

    ranges::sort(lines);

    return fmt::format("{}\n", fmt::join(lines, "\n"));
}

Result<std::string> DependencyResolver::render_package_json(const DependencyMap& dependencies,
                                                            const std::optional<std::string>& existing) {
    using nlohmann::json;

    json package = {
        {"name", "sandbox-project"},
        {"version", "1.0.0"},
        {"private", true},
        {"description", "Generated for a sandboxed run"},
        {"main", "main.js"},
        {"dependencies", json::object()},
    };

    if (existing) {
        package = json::parse(*existing, nullptr, /*allow_exceptions=*/false);

        if (package.is_discarded() || !package.is_object()) {
            return install_error("package.json is not a valid JSON object");
        }

        if (!package.contains("dependencies") || !package["dependencies"].is_object()) {
            package["dependencies"] = json::object();
        }
    }

    for (const auto& [name, version] : dependencies) {
        package["dependencies"][name] = is_unpinned(version) ? "*" : version;
    }

    return package.dump(2) + "\n";
}

Result<std::string> DependencyResolver::render_pom(const DependencyMap& dependencies) {
    std::string entries;

    for (const auto& [name, version] : dependencies) {
        auto colon = name.find(':');

        if (colon == std::string::npos || colon == 0 || colon + 1 == name.size() ||
            name.find(':', colon + 1) != std::string::npos) {
            return install_error(fmt::format("Maven dependency {:?} must be written as group:artifact", name));
        }
        if (is_unpinned(version)) {
            return install_error(fmt::format("Maven dependency {:?} needs an explicit version", name));
        }
        if (name.find_first_of("<>") != std::string::npos || version.find_first_of("<>") != std::string::npos) {
            return install_error(fmt::format("Maven dependency {:?} contains invalid characters", name));
        }

        entries += fmt::format("    <dependency>\n"
                               "      <groupId>{}</groupId>\n"
                               "      <artifactId>{}</artifactId>\n"
                               "      <version>{}</version>\n"
                               "    </dependency>\n",
                               name.substr(0, colon), name.substr(colon + 1), version);
    }

    return fmt::format("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                       "<project xmlns=\"http://maven.apache.org/POM/4.0.0\"\n"
                       "         xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\"\n"
                       "         xsi:schemaLocation=\"http://maven.apache.org/POM/4.0.0 "
                       "http://maven.apache.org/xsd/maven-4.0.0.xsd\">\n"
                       "  <modelVersion>4.0.0</modelVersion>\n"
                       "  <groupId>sandbox</groupId>\n"
                       "  <artifactId>project</artifactId>\n"
                       "  <version>1.0.0</version>\n"
                       "  <packaging>jar</packaging>\n"
                       "  <dependencies>\n"
                       "{}"
                       "  </dependencies>\n"
                       "</project>\n",
                       entries);
}

std::string DependencyResolver::render_conanfile(const DependencyMap& dependencies) {
    std::string content = "[requires]\n";

    for (const auto& [name, version] : dependencies) {
        content += fmt::format("{}/{}\n", name, is_unpinned(version) ? "[*]" : version);
    }

    content += "\n[generators]\nCMakeDeps\nCMakeToolchain\n";

    return content;
}

Result<std::optional<InstallPlan>> DependencyResolver::plan(const LanguageDescriptor& descriptor,
                                                            const DependencyMap& dependencies,
                                                            const std::vector<SourceFile>& files) const {
    if (dependencies.empty()) {
        return std::optional<InstallPlan>{};
    }

    if (descriptor.manifest == ManifestFormat::None || descriptor.install_command.empty()) {
        return install_error(fmt::format("{} does not support dependencies", descriptor.id));
    }

    for (const auto& [name, version] : dependencies) {
        if (!is_valid_package_token(name) || (!is_unpinned(version) && !is_valid_package_token(version))) {
            return install_error(fmt::format("Invalid dependency {:?} {:?}", name, version));
        }
    }

    const std::string manifest_name{manifest_file_name(descriptor.manifest)};
    const auto existing = find_file(files, manifest_name);

    std::string content;

    switch (descriptor.manifest) {
    case ManifestFormat::Requirements: {
        DependencyMap merged = existing ? parse_requirements(*existing) : DependencyMap{};
        for (const auto& [name, version] : dependencies) {
            merged[name] = version;
        }
        content = render_requirements(merged);
        break;
    }
    case ManifestFormat::PackageJson:
        content = TRY(render_package_json(dependencies, existing));
        break;
    case ManifestFormat::PomXml:
    case ManifestFormat::Conanfile:
        if (existing) {
            LOG_WARN("Request supplies its own {}; ignoring {} declared dependencies", manifest_name,
                     dependencies.size());
            content = *existing;
        } else if (descriptor.manifest == ManifestFormat::PomXml) {
            content = TRY(render_pom(dependencies));
        } else {
            content = render_conanfile(dependencies);
        }
        break;
    case ManifestFormat::None:
        break;
    }

    LOG_DEBUG("Install plan for {}: {} with {} dependencies", descriptor.id, manifest_name, dependencies.size());

    return InstallPlan{
        .manifest = SourceFile{.name = manifest_name, .content = std::move(content)},
        .command = descriptor.install_command,
        .timeout = install_timeout_,
    };
}

} // namespace nexusexec
