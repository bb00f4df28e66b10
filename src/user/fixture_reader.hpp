#pragma once

#include <nexusexec/common/expected.hpp>
#include <nexusexec/grading/grading_types.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace nexusexec {

/// Reads grading test cases from a JSON file of the form
/// \code{.json}
/// {"test_cases": [{"input": "1 2", "expected_output": "3", "is_hidden": false}]}
/// \endcode
/// The camelCase spellings ``expectedOutput`` / ``isHidden`` are accepted as well.
class FixtureReader
{
public:
    explicit FixtureReader(std::filesystem::path path);

    Expected<std::vector<TestCase>, std::string> read() const;

    static Expected<std::vector<TestCase>, std::string> parse(std::string_view json_text);

private:
    std::filesystem::path path_;
};

} // namespace nexusexec
