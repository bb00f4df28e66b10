#pragma once

#include <nexusexec/common/class_traits.hpp>
#include <nexusexec/config/engine_config.hpp>
#include <nexusexec/dependency/dependency_resolver.hpp>
#include <nexusexec/execution/source_file.hpp>

#include "app/trace_exception.hpp"
#include "output/serializer.hpp"
#include "output/stdout_sink.hpp"
#include "user/program_options.hpp"

#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace nexusexec {

class App : NonCopyable
{
public:
    explicit App(ProgramOptions opts);

    virtual ~App() = default;

    const ProgramOptions& get_opts() const noexcept { return OPTS; }

    /// Exit status of the command; 1 if it threw
    int run() noexcept {
        std::optional res = wrap_throwable_fn(&App::run_impl, this);

        return res.value_or(EXIT_FAILURE_STATUS);
    }

    const ProgramOptions OPTS;

    static constexpr int EXIT_FAILURE_STATUS = 1;

protected:
    virtual int run_impl() = 0;

    /// Configuration file if one was given, otherwise defaults. Throws ConfigError.
    EngineConfig load_config() const;

    /// Submitted files, named by their base names
    std::vector<SourceFile> read_source_files() const;

    /// ``--dep`` values as a dependency map ("name" alone means any version)
    DependencyMap parse_dependencies() const;

    StdoutSink output_sink_;
    std::unique_ptr<Serializer> serializer_;
};

} // namespace nexusexec
