#include "app/app.hpp"

#include <nexusexec/exceptions.hpp>
#include <nexusexec/logging.hpp>

#include "output/plaintext_serializer.hpp"

#include <fmt/format.h>
#include <fmt/std.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace nexusexec {

App::App(ProgramOptions opts)
    : OPTS{std::move(opts)}
    , serializer_{std::make_unique<PlainTextSerializer>(output_sink_, OPTS.colorize_option, OPTS.verbosity)} {}

EngineConfig App::load_config() const {
    if (OPTS.config_path) {
        return EngineConfig::load(*OPTS.config_path);
    }

    return EngineConfig::defaults();
}

std::vector<SourceFile> App::read_source_files() const {
    std::vector<SourceFile> files;

    for (const auto& path : OPTS.files) {
        std::ifstream in_file{path};

        if (not in_file.is_open()) {
            throw EngineError(fmt::format("Failed to open source file {}", path));
        }

        std::stringstream buffer;
        buffer << in_file.rdbuf();

        files.push_back(SourceFile{.name = path.filename().string(), .content = buffer.str()});
    }

    return files;
}

DependencyMap App::parse_dependencies() const {
    DependencyMap deps;

    for (const auto& spec : OPTS.dependencies) {
        auto eq_pos = spec.find('=');

        if (eq_pos == std::string::npos) {
            deps[spec] = "*";
        } else {
            deps[spec.substr(0, eq_pos)] = spec.substr(eq_pos + 1);
        }
    }

    return deps;
}

} // namespace nexusexec
