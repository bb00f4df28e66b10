#include <nexusexec/logging.hpp>

#include "app/app.hpp"
#include "app/grade_app.hpp"
#include "app/run_app.hpp"
#include "output/verbosity.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdlib>
#include <memory>
#include <span>
#include <utility>

int main(int argc, const char* argv[]) {
    using namespace nexusexec;

    init_loggers();

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    ProgramOptions options = parse_args_or_exit(args);

    // An explicit LOG_LEVEL still wins over -v / -q
    if (std::getenv("LOG_LEVEL") == nullptr) {
        spdlog::set_level(log_level_for(options.verbosity));
    }

    std::unique_ptr<App> app;
    if (options.command == ProgramOptions::Command::Grade) {
        app = std::make_unique<GradeApp>(std::move(options));
    } else {
        app = std::make_unique<RunApp>(std::move(options));
    }

    return app->run();
}
