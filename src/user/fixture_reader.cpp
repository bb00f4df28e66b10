#include "user/fixture_reader.hpp"

#include <nexusexec/logging.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nexusexec {

using nlohmann::json;

namespace {

/// Value under ``key``, or under ``alt_key`` if only that one is present
template <typename T>
std::optional<T> get_either(const json& obj, const std::string& key, const std::string& alt_key) {
    if (obj.contains(key)) {
        return obj.at(key).get<T>();
    }
    if (obj.contains(alt_key)) {
        return obj.at(alt_key).get<T>();
    }
    return std::nullopt;
}

} // namespace

FixtureReader::FixtureReader(std::filesystem::path path)
    : path_{std::move(path)} {}

Expected<std::vector<TestCase>, std::string> FixtureReader::read() const {
    std::ifstream in_file{path_};

    if (not in_file.is_open()) {
        return fmt::format("Failed to open fixture file {}", path_.string());
    }

    std::stringstream buffer;
    buffer << in_file.rdbuf();

    if (in_file.bad()) {
        return "IO error in reading";
    }

    return parse(buffer.str());
}

Expected<std::vector<TestCase>, std::string> FixtureReader::parse(std::string_view json_text) {
    std::vector<TestCase> result;

    try {
        json doc = json::parse(json_text);

        const json& cases = doc.is_array() ? doc : doc.at("test_cases");
        if (!cases.is_array()) {
            return "\"test_cases\" must be an array";
        }

        for (const auto& entry : cases) {
            auto expected = get_either<std::string>(entry, "expected_output", "expectedOutput");
            if (!expected) {
                return fmt::format("Test case #{} has no expected output", result.size());
            }

            result.push_back(TestCase{
                .input = entry.value("input", std::string{}),
                .expected_output = std::move(*expected),
                .is_hidden = get_either<bool>(entry, "is_hidden", "isHidden").value_or(false),
            });
        }
    } catch (const json::exception& ex) {
        return fmt::format("Invalid fixture file: {}", ex.what());
    }

    if (result.empty()) {
        LOG_WARN("Fixture file contains no test cases");
    }

    return result;
}

} // namespace nexusexec
