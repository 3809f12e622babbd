#include <doctest/doctest.h>

#include "cli/CommandLine.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {
auto make_argv(std::initializer_list<const char*> list) {
    std::vector<char*> argv;
    argv.reserve(list.size());
    for (auto* value : list) {
        argv.push_back(const_cast<char*>(value));
    }
    return argv;
}
}

TEST_SUITE("cli.command_line") {
TEST_CASE("CommandLine parses flags and size options") {
    using GSP::Cli::CommandLine;
    CommandLine cli;
    cli.set_program_name("command_line_test");

    bool        quiet     = false;
    std::size_t max_nodes = 0;
    cli.add_flag("--quiet", {.on_set = [&] { quiet = true; }});
    cli.add_size("--max-nodes", {.on_value = [&](std::size_t value) { max_nodes = value; }});

    auto argv = make_argv({"prog", "--quiet", "--max-nodes=64"});
    CHECK(cli.parse(static_cast<int>(argv.size()), argv.data()));
    CHECK(quiet);
    CHECK(max_nodes == 64);
}

TEST_CASE("CommandLine value option consumes the next token") {
    using GSP::Cli::CommandLine;
    CommandLine cli;
    std::optional<std::string> marker;
    cli.add_value("--bind-marker", {.on_value = [&](std::string_view value) -> CommandLine::ParseError {
                                        marker = std::string(value);
                                        return std::nullopt;
                                    }});

    auto argv = make_argv({"prog", "--bind-marker", "@state"});
    CHECK(cli.parse(static_cast<int>(argv.size()), argv.data()));
    REQUIRE(marker.has_value());
    CHECK(*marker == "@state");
}

TEST_CASE("CommandLine rejects bad sizes and missing values") {
    using GSP::Cli::CommandLine;
    std::vector<std::string> errors;
    CommandLine              cli;
    cli.set_error_logger([&](std::string const& message) { errors.push_back(message); });
    cli.add_size("--max-nodes", {.on_value = [](std::size_t) {}});

    auto bad = make_argv({"prog", "--max-nodes=-3"});
    CHECK_FALSE(cli.parse(static_cast<int>(bad.size()), bad.data()));
    CHECK(cli.had_errors());

    auto missing = make_argv({"prog", "--max-nodes"});
    CHECK_FALSE(cli.parse(static_cast<int>(missing.size()), missing.data()));
    CHECK(errors.size() == 2);
    CHECK(errors.back().find("requires") != std::string::npos);
}

TEST_CASE("CommandLine reports unknown options and stray positionals") {
    using GSP::Cli::CommandLine;
    std::vector<std::string> errors;
    CommandLine              cli;
    cli.set_program_name("gsp_test");
    cli.set_error_logger([&](std::string const& message) { errors.push_back(message); });
    cli.add_flag("--quiet", {.on_set = [] {}, .help = "Less output"});

    auto argv = make_argv({"prog", "--mystery", "input.jsonl", "--quiet=yes"});
    CHECK_FALSE(cli.parse(static_cast<int>(argv.size()), argv.data()));
    REQUIRE(errors.size() == 3);
    CHECK(errors[0] == "gsp_test: unknown option '--mystery'");
    CHECK(errors[1] == "gsp_test: unexpected argument 'input.jsonl'");
    CHECK(errors[2].find("does not accept a value") != std::string::npos);
}

TEST_CASE("CommandLine positional handler and aliases") {
    using GSP::Cli::CommandLine;
    CommandLine              cli;
    std::vector<std::string> inputs;
    bool                     help = false;
    cli.set_positional_handler([&](std::string_view token) -> CommandLine::ParseError {
        inputs.emplace_back(token);
        return std::nullopt;
    });
    cli.add_flag("--help", {.on_set = [&] { help = true; }, .help = "Show this message"});
    cli.add_alias("-h", "--help");

    auto argv = make_argv({"prog", "stream.jsonl", "-", "-h"});
    CHECK(cli.parse(static_cast<int>(argv.size()), argv.data()));
    CHECK(help);
    CHECK(inputs == std::vector<std::string>{"stream.jsonl", "-"});

    auto usage = cli.usage();
    CHECK(usage.find("--help, -h") != std::string::npos);
    CHECK(usage.find("Show this message") != std::string::npos);
}
}
