#pragma once

#include <nexusexec/dependency/dependency_resolver.hpp>
#include <nexusexec/execution/source_file.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace nexusexec {

struct TestCase
{
    std::string input;
    std::string expected_output;
    bool is_hidden = false;
};

struct TestResult
{
    std::size_t index = 0;
    bool passed = false;

    /// "(hidden)" for hidden tests
    std::string input;
    std::string expected_output;

    /// "(correct)" / "(incorrect)" for hidden tests
    std::string actual_output;

    std::optional<std::string> error;
};

struct GradingResult
{
    std::vector<TestResult> results;
    std::size_t passed_count = 0;
    std::size_t total = 0;
    bool all_passed = false;
};

struct GradingRequest
{
    std::string language;

    std::vector<SourceFile> files;

    /// Single-file shorthand, used when ``files`` is empty
    std::optional<std::string> code;

    /// Defaults to the language's entry file
    std::string main_file;

    DependencyMap dependencies;

    std::vector<TestCase> test_cases;

    /// Skip hidden tests entirely
    bool visible_only = false;

    std::string policy;
    std::string correlation;
};

} // namespace nexusexec
