// tests/test_resolver.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/resolver/variable_resolver.h"

using namespace canvasflow;

TEST_CASE("Both reference syntaxes resolve", "[resolver]") {
    PatternVariableResolver resolver;
    UpstreamData upstream{{"A01", "apples"}, {"B02", "pears"}};

    REQUIRE(resolver.resolve("Compare [A01] with {B02}.", upstream) == "Compare apples with pears.");
}

TEST_CASE("Unresolved references stay literal", "[resolver]") {
    PatternVariableResolver resolver;
    UpstreamData upstream{{"A01", "x"}};

    REQUIRE(resolver.resolve("[A01] [A02] {C03}", upstream) == "x [A02] {C03}");
    REQUIRE(resolver.resolve("no references here", upstream) == "no references here");
    REQUIRE(resolver.resolve("", upstream).empty());
}

TEST_CASE("Repeated references are all replaced", "[resolver]") {
    PatternVariableResolver resolver;
    REQUIRE(resolver.resolve("[A01]-[A01]-{A01}", {{"A01", "z"}}) == "z-z-z");
}

TEST_CASE("Lowercase and malformed tokens are not references", "[resolver]") {
    PatternVariableResolver resolver;
    REQUIRE_FALSE(resolver.has_variables("{data} [a01] [AA1] {A}"));
    REQUIRE(resolver.has_variables("see [Z9]"));
}

TEST_CASE("Output containing reference syntax is not re-resolved", "[resolver]") {
    PatternVariableResolver resolver;
    UpstreamData upstream{{"A01", "[A02]"}, {"A02", "second"}};
    REQUIRE(resolver.resolve("[A01]", upstream) == "[A02]");
}

TEST_CASE("Validation reports each out-of-scope reference", "[resolver]") {
    PatternVariableResolver resolver;

    auto errors = resolver.validate("[A01] [A09] {A09}", {"A01"});
    REQUIRE(errors.size() == 2);
    for (const auto& error : errors) {
        REQUIRE(error.type == ValidationErrorType::INVALID_VARIABLE);
    }
    REQUIRE(errors[0].message == "Variable [A09] references unavailable block A09");
    REQUIRE(errors[1].message == "Variable {A09} references unavailable block A09");

    REQUIRE(resolver.validate("[A01]", {"A01"}).empty());
}

TEST_CASE("Parsed references carry positions", "[resolver]") {
    PatternVariableResolver resolver;
    auto refs = resolver.parse_variables("ab [C12] {D3}");

    REQUIRE(refs.size() == 2);
    REQUIRE(refs[0].variable == "[C12]");
    REQUIRE(refs[0].block_number == "C12");
    REQUIRE(refs[0].begin == 3);
    REQUIRE(refs[0].end == 8);
    REQUIRE(refs[1].block_number == "D3");
}

TEST_CASE("Unique variables are sorted", "[resolver]") {
    PatternVariableResolver resolver;
    REQUIRE(resolver.unique_variables("[B01] [A01] {B01}") == std::vector<BlockNumber>{"A01", "B01"});
}

TEST_CASE("Custom pattern", "[resolver]") {
    PatternVariableResolver resolver(R"(\$\{([A-Z][0-9]+)\})");
    UpstreamData upstream{{"A01", "v"}};

    REQUIRE(resolver.resolve("${A01} [A01]", upstream) == "v [A01]");
    REQUIRE(resolver.validate("${B07}", {}).size() == 1);
}

TEST_CASE("Bad patterns are rejected", "[resolver]") {
    REQUIRE_THROWS_AS(PatternVariableResolver("[unclosed"), std::runtime_error);
    REQUIRE_THROWS_AS(PatternVariableResolver(R"(\[[A-Z]\d+\])"), std::runtime_error);
}
