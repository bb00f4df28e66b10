#include "catch2_custom.hpp"

#include "user/fixture_reader.hpp"

#include <nexusexec/grading/grading_types.hpp>

#include <string>
#include <vector>

using Catch::Matchers::ContainsSubstring;
using nexusexec::FixtureReader;
using nexusexec::TestCase;

TEST_CASE("Read the fixture file in resources") {
    FixtureReader reader{RESOURCES_DIR "/fixtures.json"};

    auto cases = reader.read();
    REQUIRE(cases);
    REQUIRE(cases->size() == 3);

    REQUIRE(cases->at(0).input == "2 3\n");
    REQUIRE(cases->at(0).expected_output == "5\n");
    REQUIRE_FALSE(cases->at(0).is_hidden);

    // camelCase keys
    REQUIRE(cases->at(1).expected_output == "6");
    REQUIRE(cases->at(1).is_hidden);

    REQUIRE(cases->at(2).input.empty());
}

TEST_CASE("A bare array of test cases is accepted") {
    auto cases = FixtureReader::parse(R"([{"expected_output": "hi"}])");
    REQUIRE(cases);
    REQUIRE(cases->size() == 1);
    REQUIRE(cases->front().input.empty());
    REQUIRE_FALSE(cases->front().is_hidden);
}

TEST_CASE("Broken fixture files are reported") {
    REQUIRE_THAT(FixtureReader{"/nonexistent/fixtures.json"}.read().error(), ContainsSubstring("Failed to open"));

    REQUIRE_THAT(FixtureReader::parse("{").error(), ContainsSubstring("Invalid fixture file"));
    REQUIRE_THAT(FixtureReader::parse(R"({"cases": []})").error(), ContainsSubstring("Invalid fixture file"));
    REQUIRE_THAT(FixtureReader::parse(R"({"test_cases": {}})").error(), ContainsSubstring("must be an array"));
    REQUIRE_THAT(FixtureReader::parse(R"({"test_cases": [{"input": "1"}]})").error(),
                 ContainsSubstring("no expected output"));
    REQUIRE_THAT(FixtureReader::parse(R"({"test_cases": [{"expected_output": 42}]})").error(),
                 ContainsSubstring("Invalid fixture file"));
}

TEST_CASE("An empty fixture file yields no test cases") {
    auto cases = FixtureReader::parse(R"({"test_cases": []})");
    REQUIRE(cases);
    REQUIRE(cases->empty());
}
