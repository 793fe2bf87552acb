#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "binder.hpp"
#include "errors.hpp"

using namespace tooledchat;
using Catch::Matchers::ContainsSubstring;

namespace {

ParamSpec param(const std::string& name, ParamType type, bool required = false) {
    ParamSpec p;
    p.name = name;
    p.type = type;
    p.required = required;
    return p;
}

std::shared_ptr<Tool> weather_tool() {
    ParamSpec units = param("units", ParamType::String);
    units.default_value = "metric";
    return std::make_shared<FunctionTool>(
        "weather", "Current weather",
        std::vector<ParamSpec>{param("location", ParamType::String, true), units,
                               param("days", ParamType::Integer)},
        [](const BoundArguments& args, const CancellationToken&) { return args; });
}

ErrorKind bind_error_kind(const std::string& tool, const std::string& raw,
                          const ToolSnapshot& tools) {
    try {
        bind_arguments(ToolInvocationRequest{tool, raw}, tools);
    } catch (const Error& e) {
        return e.kind();
    }
    FAIL("expected bind_arguments to throw");
    return ErrorKind::Unknown;
}

} // namespace

// ── split_arguments ─────────────────────────────────────────────

TEST_CASE("split_arguments: top-level commas only", "[binder]") {
    auto parts = split_arguments("a=1, b=\"x, y\", c=(1,2), d=[3,4]");
    REQUIRE(parts.size() == 4);
    REQUIRE(parts[0] == "a=1");
    REQUIRE(parts[1] == "b=\"x, y\"");
    REQUIRE(parts[2] == "c=(1,2)");
    REQUIRE(parts[3] == "d=[3,4]");
}

TEST_CASE("split_arguments: blank segments are dropped", "[binder]") {
    REQUIRE(split_arguments("").empty());
    REQUIRE(split_arguments("   ").empty());
    auto parts = split_arguments("a=1,, b=2,");
    REQUIRE(parts.size() == 2);
    REQUIRE(parts[1] == "b=2");
}

// ── split_key_value / unquote ───────────────────────────────────

TEST_CASE("split_key_value: equals sign", "[binder]") {
    auto [key, value] = split_key_value("location = Paris");
    REQUIRE(key == "location");
    REQUIRE(value == "Paris");
}

TEST_CASE("split_key_value: first equals wins", "[binder]") {
    auto [key, value] = split_key_value("expr=a=b");
    REQUIRE(key == "expr");
    REQUIRE(value == "a=b");
}

TEST_CASE("split_key_value: colon fallback", "[binder]") {
    auto [key, value] = split_key_value("location: Paris");
    REQUIRE(key == "location");
    REQUIRE(value == "Paris");
}

TEST_CASE("split_key_value: equals preferred over earlier colon", "[binder]") {
    auto [key, value] = split_key_value("time=12:30");
    REQUIRE(key == "time");
    REQUIRE(value == "12:30");
}

TEST_CASE("split_key_value: missing separator is a parse error", "[binder]") {
    try {
        split_key_value("Paris");
        FAIL("expected Error");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::Parse);
    }
}

TEST_CASE("split_key_value: empty key is a parse error", "[binder]") {
    REQUIRE_THROWS_AS(split_key_value("=Paris"), Error);
}

TEST_CASE("unquote: strips matching quotes and resolves escapes", "[binder]") {
    REQUIRE(unquote("'New York'") == "New York");
    REQUIRE(unquote("\"a\\\"b\"") == "a\"b");
    REQUIRE(unquote("\"line\\nbreak\"") == "line\nbreak");
    REQUIRE(unquote("  bare  ") == "bare");
    REQUIRE(unquote("'mismatched\"") == "'mismatched\"");
    REQUIRE(unquote("\"\"").empty());
}

// ── coerce_value ────────────────────────────────────────────────

TEST_CASE("coerce_value: string is passed through", "[binder]") {
    auto v = coerce_value("42", param("x", ParamType::String));
    REQUIRE(v.is_string());
    REQUIRE(v.get<std::string>() == "42");
}

TEST_CASE("coerce_value: number", "[binder]") {
    auto spec = param("x", ParamType::Number);
    REQUIRE(coerce_value("3.5", spec).get<double>() == 3.5);
    REQUIRE(coerce_value("-2", spec).get<double>() == -2.0);
    REQUIRE(coerce_value("1e3", spec).get<double>() == 1000.0);
    REQUIRE_THROWS_AS(coerce_value("abc", spec), Error);
    REQUIRE_THROWS_AS(coerce_value("12abc", spec), Error);
    REQUIRE_THROWS_AS(coerce_value("inf", spec), Error);
}

TEST_CASE("coerce_value: integer", "[binder]") {
    auto spec = param("n", ParamType::Integer);
    REQUIRE(coerce_value("7", spec).get<int64_t>() == 7);
    REQUIRE(coerce_value("-12", spec).get<int64_t>() == -12);
    REQUIRE(coerce_value("3.0", spec).get<int64_t>() == 3);
    REQUIRE(coerce_value("7", spec).is_number_integer());
    REQUIRE_THROWS_AS(coerce_value("3.5", spec), Error);
    REQUIRE_THROWS_AS(coerce_value("seven", spec), Error);
    REQUIRE_THROWS_AS(coerce_value("", spec), Error);
}

TEST_CASE("coerce_value: boolean is case-insensitive", "[binder]") {
    auto spec = param("b", ParamType::Boolean);
    REQUIRE(coerce_value("true", spec).get<bool>());
    REQUIRE(coerce_value("TRUE", spec).get<bool>());
    REQUIRE_FALSE(coerce_value("False", spec).get<bool>());
    REQUIRE_THROWS_AS(coerce_value("yes", spec), Error);
    REQUIRE_THROWS_AS(coerce_value("1", spec), Error);
}

TEST_CASE("coerce_value: mismatch message names parameter and type", "[binder]") {
    try {
        coerce_value("abc", param("days", ParamType::Integer));
        FAIL("expected Error");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::TypeMismatch);
        REQUIRE_THAT(e.what(), ContainsSubstring("days"));
        REQUIRE_THAT(e.what(), ContainsSubstring("integer"));
        REQUIRE_THAT(e.what(), ContainsSubstring("abc"));
    }
}

// ── bind_arguments ──────────────────────────────────────────────

TEST_CASE("bind_arguments: binds typed values and fills defaults", "[binder]") {
    ToolSnapshot tools({weather_tool()});
    auto args = bind_arguments({"weather", "location='New York', days=3"}, tools);
    REQUIRE(args["location"] == "New York");
    REQUIRE(args["days"] == 3);
    REQUIRE(args["units"] == "metric");
}

TEST_CASE("bind_arguments: absent optional without default is omitted", "[binder]") {
    ToolSnapshot tools({weather_tool()});
    auto args = bind_arguments({"weather", "location=Paris"}, tools);
    REQUIRE_FALSE(args.contains("days"));
    REQUIRE(args.size() == 2);
}

TEST_CASE("bind_arguments: quoted value keeps commas and parentheses", "[binder]") {
    ToolSnapshot tools({weather_tool()});
    auto args = bind_arguments({"weather", "location=\"Paris, (France)\""}, tools);
    REQUIRE(args["location"] == "Paris, (France)");
}

TEST_CASE("bind_arguments: colon separator and trailing comma", "[binder]") {
    ToolSnapshot tools({weather_tool()});
    auto args = bind_arguments({"weather", "location: Paris, days: 2,"}, tools);
    REQUIRE(args["location"] == "Paris");
    REQUIRE(args["days"] == 2);
}

TEST_CASE("bind_arguments: unknown tool", "[binder]") {
    ToolSnapshot tools({weather_tool()});
    REQUIRE(bind_error_kind("stocks", "symbol=ACME", tools) == ErrorKind::UnknownTool);
}

TEST_CASE("bind_arguments: unknown parameter", "[binder]") {
    ToolSnapshot tools({weather_tool()});
    REQUIRE(bind_error_kind("weather", "location=Paris, colour=red", tools) ==
            ErrorKind::UnknownParameter);
}

TEST_CASE("bind_arguments: missing required parameter", "[binder]") {
    ToolSnapshot tools({weather_tool()});
    REQUIRE(bind_error_kind("weather", "days=2", tools) == ErrorKind::MissingParameter);
    REQUIRE(bind_error_kind("weather", "", tools) == ErrorKind::MissingParameter);
}

TEST_CASE("bind_arguments: type mismatch", "[binder]") {
    ToolSnapshot tools({weather_tool()});
    REQUIRE(bind_error_kind("weather", "location=Paris, days=soon", tools) ==
            ErrorKind::TypeMismatch);
}

TEST_CASE("bind_arguments: duplicate parameter is a parse error", "[binder]") {
    ToolSnapshot tools({weather_tool()});
    REQUIRE(bind_error_kind("weather", "location=Paris, location=Rome", tools) ==
            ErrorKind::Parse);
}

TEST_CASE("bind_arguments: positional value is a parse error", "[binder]") {
    ToolSnapshot tools({weather_tool()});
    REQUIRE(bind_error_kind("weather", "Paris", tools) == ErrorKind::Parse);
}

TEST_CASE("bind_arguments: no-parameter tool accepts empty list", "[binder]") {
    auto clock = std::make_shared<FunctionTool>(
        "get_time", "Current time", std::vector<ParamSpec>{},
        [](const BoundArguments&, const CancellationToken&) { return nlohmann::json("12:00"); });
    ToolSnapshot tools({clock});
    auto args = bind_arguments({"get_time", ""}, tools);
    REQUIRE(args.is_object());
    REQUIRE(args.empty());
}
