#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "tools/command.hpp"
#include "dispatcher.hpp"
#include "errors.hpp"
#include <chrono>
#include <cstdlib>

using namespace tooledchat;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::EndsWith;

namespace {

ToolDefinition command_def(const std::string& name, const std::string& command,
                           uint32_t timeout = 10) {
    ToolDefinition def;
    def.name = name;
    def.description = "Runs " + command;
    def.command = command;
    def.timeout = timeout;
    return def;
}

} // namespace

TEST_CASE("CommandTool: env_var_name", "[command_tool]") {
    REQUIRE(CommandTool::env_var_name("location") == "TOOL_ARG_LOCATION");
    REQUIRE(CommandTool::env_var_name("unit.system") == "TOOL_ARG_UNIT_SYSTEM");
    REQUIRE(CommandTool::env_var_name("maxDays2") == "TOOL_ARG_MAXDAYS2");
}

TEST_CASE("CommandTool: empty command is rejected", "[command_tool]") {
    REQUIRE_THROWS_AS(CommandTool(command_def("t", "")), std::invalid_argument);
}

TEST_CASE("CommandTool: exposes its definition", "[command_tool]") {
    auto def = command_def("weather", "true");
    ParamSpec p;
    p.name = "location";
    def.parameters.push_back(p);
    CommandTool tool(def);
    REQUIRE(tool.tool_name() == "weather");
    REQUIRE(tool.description() == "Runs true");
    REQUIRE(tool.parameters().size() == 1);
}

TEST_CASE("CommandTool: arguments arrive as environment variables", "[command_tool]") {
    CommandTool tool(command_def("greet",
        "printf '%s in %s for %s days' \"$TOOL_ARG_NAME\" \"$TOOL_ARG_CITY\" \"$TOOL_ARG_DAYS\""));
    nlohmann::json args = {{"name", "Ada"}, {"city", "New York"}, {"days", 3}};
    auto result = tool.execute(args, CancellationToken());
    REQUIRE(result == "Ada in New York for 3 days");
}

TEST_CASE("CommandTool: arguments arrive as JSON on stdin", "[command_tool]") {
    CommandTool tool(command_def("echo_json", "cat"));
    nlohmann::json args = {{"location", "Paris"}, {"celsius", true}};
    auto result = tool.execute(args, CancellationToken());
    REQUIRE(result.is_object());
    REQUIRE(result == args);
}

TEST_CASE("CommandTool: JSON output is parsed", "[command_tool]") {
    CommandTool tool(command_def("forecast", "echo '{\"temp\": 21, \"sky\": \"clear\"}'"));
    auto result = tool.execute(nlohmann::json::object(), CancellationToken());
    REQUIRE(result["temp"] == 21);
    REQUIRE(result["sky"] == "clear");
}

TEST_CASE("CommandTool: plain output is trimmed text", "[command_tool]") {
    CommandTool tool(command_def("hello", "echo '  hello world  '"));
    auto result = tool.execute(nlohmann::json::object(), CancellationToken());
    REQUIRE(result == "hello world");
}

TEST_CASE("CommandTool: stale TOOL_ARG variables are not inherited", "[command_tool]") {
    setenv("TOOL_ARG_STALE", "leaked", 1);
    CommandTool tool(command_def("stale", "printf '%s' \"${TOOL_ARG_STALE:-none}\""));
    auto result = tool.execute(nlohmann::json::object(), CancellationToken());
    unsetenv("TOOL_ARG_STALE");
    REQUIRE(result == "none");
}

TEST_CASE("CommandTool: non-zero exit throws with output", "[command_tool]") {
    CommandTool tool(command_def("fail", "echo 'no such city'; exit 3"));
    try {
        tool.execute(nlohmann::json::object(), CancellationToken());
        FAIL("expected exception");
    } catch (const std::runtime_error& e) {
        REQUIRE_THAT(e.what(), ContainsSubstring("exited with status 3"));
        REQUIRE_THAT(e.what(), ContainsSubstring("no such city"));
    }
}

TEST_CASE("CommandTool: long output is truncated", "[command_tool]") {
    CommandTool tool(command_def("flood", "head -c 20000 /dev/zero | tr '\\0' 'a'"));
    auto result = tool.execute(nlohmann::json::object(), CancellationToken());
    REQUIRE(result.is_string());
    auto text = result.get<std::string>();
    REQUIRE_THAT(text, EndsWith("\n[truncated]"));
    REQUIRE(text.size() == 10000 + std::string("\n[truncated]").size());
}

TEST_CASE("CommandTool: timeout kills the command", "[command_tool]") {
    CommandTool tool(command_def("sleepy", "sleep 10", 1));
    auto start = std::chrono::steady_clock::now();
    try {
        tool.execute(nlohmann::json::object(), CancellationToken());
        FAIL("expected exception");
    } catch (const std::runtime_error& e) {
        REQUIRE_THAT(e.what(), ContainsSubstring("timed out after 1s"));
    }
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
}

TEST_CASE("CommandTool: large stdin is delivered in full", "[command_tool]") {
    CommandTool tool(command_def("count", "wc -c"));
    // Bigger than a pipe buffer; {"blob":"..."} adds 11 bytes
    nlohmann::json args = {{"blob", std::string(100000, 'x')}};
    auto result = tool.execute(args, CancellationToken());
    REQUIRE(result == 100011);
}

TEST_CASE("CommandTool: timeout holds when the command ignores large stdin", "[command_tool]") {
    CommandTool tool(command_def("deaf", "sleep 10", 1));
    nlohmann::json args = {{"blob", std::string(100000, 'x')}};
    auto start = std::chrono::steady_clock::now();
    try {
        tool.execute(args, CancellationToken());
        FAIL("expected exception");
    } catch (const std::runtime_error& e) {
        REQUIRE_THAT(e.what(), ContainsSubstring("timed out after 1s"));
    }
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
}

TEST_CASE("CommandTool: cancellation holds when the command ignores large stdin", "[command_tool]") {
    CommandTool tool(command_def("deaf", "sleep 10", 30));
    nlohmann::json args = {{"blob", std::string(100000, 'x')}};
    CancellationToken token;
    token.cancel_after(std::chrono::milliseconds(200));
    auto start = std::chrono::steady_clock::now();
    try {
        tool.execute(args, token);
        FAIL("expected Error");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::Cancelled);
    }
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
}

TEST_CASE("CommandTool: cancellation kills the command", "[command_tool]") {
    CommandTool tool(command_def("sleepy", "sleep 10", 30));
    CancellationToken token;
    token.cancel_after(std::chrono::milliseconds(200));
    auto start = std::chrono::steady_clock::now();
    try {
        tool.execute(nlohmann::json::object(), token);
        FAIL("expected Error");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::Cancelled);
    }
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
}

TEST_CASE("CommandTool: failures become tool results through the dispatcher", "[command_tool]") {
    ParamSpec city;
    city.name = "city";
    city.required = true;
    auto def = command_def("lookup", "echo \"unknown city $TOOL_ARG_CITY\"; exit 1");
    def.parameters.push_back(city);
    ToolSnapshot tools(create_command_tools({def}));

    auto result = dispatch_tool({"lookup", "city=Atlantis"}, tools, CancellationToken());
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error_kind == ErrorKind::ToolExecution);
    REQUIRE_THAT(result.error, ContainsSubstring("unknown city Atlantis"));
}

TEST_CASE("create_command_tools: one tool per definition", "[command_tool]") {
    auto tools = create_command_tools({command_def("a", "true"), command_def("b", "true")});
    REQUIRE(tools.size() == 2);
    REQUIRE(tools[1]->tool_name() == "b");
}
