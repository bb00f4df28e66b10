#include <nexusexec/grading/test_harness.hpp>

#include <nexusexec/logging.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/count_if.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace nexusexec {

namespace {

/// Distinguishes the session ids of concurrent grading requests
std::string make_batch_id() {
    static std::atomic<std::uint64_t> counter = 0;

    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    return fmt::format("{:x}{:04x}", ticks, counter++ & 0xFFFF);
}

/// What a failed run shows in place of its output
std::string describe_failure(const ExecutionResult& result) {
    switch (result.status) {
    case ExecutionStatus::RuntimeError:
        if (!result.stderr_text.empty()) {
            return result.stderr_text;
        }
        return fmt::format("program exited with code {}", result.exit_code);
    case ExecutionStatus::Ok:
        return {};
    case ExecutionStatus::CompileError:
    case ExecutionStatus::DependencyInstallError:
    case ExecutionStatus::Timeout:
    case ExecutionStatus::ResourceLimit:
    case ExecutionStatus::Cancelled:
    case ExecutionStatus::InternalError:
        break;
    }

    if (result.diagnostics.empty()) {
        return std::string{format_as(result.status)};
    }
    return fmt::format("{}: {}", format_as(result.status), result.diagnostics);
}

} // namespace

TestHarness::TestHarness(const EngineConfig& config, const LanguageRegistry& languages, Orchestrator& orchestrator)
    : config_{config}
    , languages_{languages}
    , orchestrator_{orchestrator} {}

std::string TestHarness::normalize_output(std::string_view output) {
    std::string res;
    res.reserve(output.size());

    for (std::size_t i = 0; i < output.size(); ++i) {
        if (output[i] == '\r') {
            res += '\n';
            if (i + 1 < output.size() && output[i + 1] == '\n') {
                ++i;
            }
        } else {
            res += output[i];
        }
    }

    constexpr std::string_view WHITESPACE = " \t\n\v\f";

    auto first = res.find_first_not_of(WHITESPACE);
    if (first == std::string::npos) {
        return {};
    }
    auto last = res.find_last_not_of(WHITESPACE);

    return res.substr(first, last - first + 1);
}

std::string TestHarness::file_name_for_code(const LanguageDescriptor& descriptor, std::string_view code) {
    if (descriptor.source_extension != ".java") {
        return descriptor.entry_file;
    }

    static const std::regex public_class{R"(public\s+(?:(?:final|abstract)\s+)*class\s+([A-Za-z_$][A-Za-z0-9_$]*))"};

    std::match_results<std::string_view::const_iterator> match;
    if (std::regex_search(code.begin(), code.end(), match, public_class)) {
        return match[1].str() + descriptor.source_extension;
    }

    return descriptor.entry_file;
}

std::vector<SourceFile> TestHarness::submission_files(const GradingRequest& request) const {
    if (!request.files.empty() || !request.code) {
        return request.files;
    }

    // Unknown languages are reported per test by the orchestrator
    auto descriptor = languages_.resolve(request.language);
    if (!descriptor) {
        return {SourceFile{.name = "main", .content = *request.code}};
    }

    return {SourceFile{.name = file_name_for_code(descriptor->get(), *request.code), .content = *request.code}};
}

GradingResult TestHarness::grade(const GradingRequest& request) {
    const std::vector<SourceFile> files = submission_files(request);
    const std::string batch_id = make_batch_id();

    GradingResult grading;

    for (std::size_t i = 0; i < request.test_cases.size(); ++i) {
        const TestCase& test = request.test_cases[i];

        if (request.visible_only && test.is_hidden) {
            continue;
        }

        grading.results.push_back(run_test(request, files, test, i, batch_id));
    }

    grading.total = grading.results.size();
    grading.passed_count =
        static_cast<std::size_t>(ranges::count_if(grading.results, [](const TestResult& res) { return res.passed; }));
    grading.all_passed = grading.passed_count == grading.total;

    LOG_INFO("Grading {}: {}/{} tests passed", batch_id, grading.passed_count, grading.total);

    return grading;
}

TestResult TestHarness::run_test(const GradingRequest& request, const std::vector<SourceFile>& files,
                                 const TestCase& test, std::size_t index, std::string_view batch_id) {
    ExecutionRequest exec{
        .session_id = fmt::format("grade-{}-{}", batch_id, index),
        .language = request.language,
        .files = files,
        .main_file = request.main_file,
        .dependencies = request.dependencies,
        .stdin_data = test.input,
        .interactive = false,
        .policy = request.policy,
        .limits = {},
        .fixed_timeout = config_.grading_timeout,
        .correlation = request.correlation,
    };

    TestResult res;
    res.index = index;

    std::string actual;

    // A failure in one test must not stop the remaining ones
    auto outcome = [&]() -> Result<ExecutionResult> {
        try {
            return orchestrator_.run(exec);
        } catch (const std::exception& ex) {
            LOG_ERROR("Grading {}: test #{} threw: {}", batch_id, index, ex.what());
            return Error{ErrorKind::InternalSandboxError, "internal sandbox error"};
        }
    }();
    if (!outcome) {
        res.passed = false;
        res.error = format_as(outcome.error());
        LOG_WARN("Grading {}: test #{} could not run ({})", batch_id, index, format_as(outcome.error().kind));
    } else if (!outcome->ok()) {
        res.passed = false;
        actual = describe_failure(*outcome);
        res.error = test.is_hidden ? std::string{format_as(outcome->status)} : actual;
    } else {
        actual = outcome->stdout_text;
        res.passed = normalize_output(actual) == normalize_output(test.expected_output);
    }

    LOG_DEBUG("Grading {}: test #{} {}", batch_id, index, res.passed ? "passed" : "failed");

    if (test.is_hidden) {
        res.input = HIDDEN_PLACEHOLDER;
        res.expected_output = HIDDEN_PLACEHOLDER;
        res.actual_output = res.passed ? CORRECT_PLACEHOLDER : INCORRECT_PLACEHOLDER;
        if (res.error && !outcome) {
            res.error = std::string{format_as(outcome.error().kind)};
        }
    } else {
        res.input = test.input;
        res.expected_output = test.expected_output;
        res.actual_output = std::move(actual);
    }

    return res;
}

} // namespace nexusexec
