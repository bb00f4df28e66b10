#include "app/grade_app.hpp"

#include <nexusexec/gateway/streaming_gateway.hpp>
#include <nexusexec/grading/grading_types.hpp>
#include <nexusexec/logging.hpp>

#include "user/fixture_reader.hpp"

#include <cstdlib>

namespace nexusexec {

int GradeApp::run_impl() {
    auto test_cases = FixtureReader{OPTS.fixtures_path}.read();

    if (!test_cases) {
        serializer_->on_error(test_cases.error());
        return EXIT_FAILURE_STATUS;
    }

    LOG_DEBUG("Loaded {} test cases from {}", test_cases->size(), OPTS.fixtures_path.string());

    ExecutionGateway gateway{load_config()};

    GradingRequest request{
        .language = OPTS.language,
        .files = read_source_files(),
        .code = std::nullopt,
        .main_file = OPTS.main_file,
        .dependencies = parse_dependencies(),
        .test_cases = std::move(*test_cases),
        .visible_only = OPTS.visible_only,
        .policy = OPTS.policy,
        .correlation = {},
    };

    GradingResult result = gateway.grade(request);

    for (const auto& test : result.results) {
        serializer_->on_test_result(test);
    }
    serializer_->on_grading_result(result);
    serializer_->finalize();

    return result.all_passed ? EXIT_SUCCESS : EXIT_FAILURE_STATUS;
}

} // namespace nexusexec
