#pragma once

#include <nexusexec/common/class_traits.hpp>
#include <nexusexec/config/engine_config.hpp>
#include <nexusexec/execution/execution_types.hpp>
#include <nexusexec/execution/orchestrator.hpp>
#include <nexusexec/grading/grading_types.hpp>
#include <nexusexec/language/language_registry.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nexusexec {

/// Runs a submission once per test case and compares its output with the expected output
class TestHarness : NonMovable
{
public:
    static constexpr std::string_view HIDDEN_PLACEHOLDER = "(hidden)";
    static constexpr std::string_view CORRECT_PLACEHOLDER = "(correct)";
    static constexpr std::string_view INCORRECT_PLACEHOLDER = "(incorrect)";

    TestHarness(const EngineConfig& config, const LanguageRegistry& languages, Orchestrator& orchestrator);

    /// Never fails as a whole; a test that could not run is reported as failed
    GradingResult grade(const GradingRequest& request);

    /// CRLF and lone CR become LF, then leading and trailing whitespace is trimmed
    static std::string normalize_output(std::string_view output);

    /// File name for a single-file submission: the public class for Java, else the entry file
    static std::string file_name_for_code(const LanguageDescriptor& descriptor, std::string_view code);

private:
    std::vector<SourceFile> submission_files(const GradingRequest& request) const;

    TestResult run_test(const GradingRequest& request, const std::vector<SourceFile>& files, const TestCase& test,
                        std::size_t index, std::string_view batch_id);

    const EngineConfig& config_;
    const LanguageRegistry& languages_;
    Orchestrator& orchestrator_;
};

} // namespace nexusexec
