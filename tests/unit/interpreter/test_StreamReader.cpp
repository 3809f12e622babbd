#include <doctest/doctest.h>

#include <gsp/interpreter/StreamReader.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace GSP::Interpreter;
using GSP::Error;
using GSP::Protocol::Json;

TEST_SUITE("interpreter.reader") {
TEST_CASE("StreamReader applies every line and keeps the final state readable") {
    std::istringstream input{
        R"({"messageType":"StreamHeader","sessionId":"s1","rootId":"root"})" "\n"
        R"({"messageType":"Layout","id":"root","type":"Column","children":["title"]})" "\n"
        R"({"messageType":"Layout","id":"title","type":"Text","properties":{"text":{"$bind":"greeting"}}})" "\n"
        R"({"messageType":"StateUpdate","state":{"greeting":"Hello"}})" "\n"};

    StreamInterpreter interpreter;
    StreamReader      reader{interpreter};
    auto              stats = reader.run(input);

    CHECK_EQ(stats.lines, 4U);
    CHECK_EQ(stats.applied, 4U);
    CHECK_EQ(stats.errors, 0U);
    CHECK(interpreter.isReady());

    auto layout = interpreter.currentLayout();
    REQUIRE(layout.has_value());
    REQUIRE_EQ(layout->nodes.size(), 2U);
    CHECK_EQ(layout->nodes[1].properties.at("text").value.value(), "Hello");
}

TEST_CASE("StreamReader reports failing lines with their number and continues") {
    std::istringstream input{
        R"({"messageType":"Layout","id":"early","type":"Text"})" "\n"
        R"({"messageType":"StreamHeader","sessionId":"s1"})" "\n"
        "not json at all\n"
        R"({"messageType":"Wobble"})" "\n"
        R"({"messageType":"StateUpdate","state":{"count":2}})" "\n"};

    StreamInterpreter      interpreter;
    std::vector<LineError> failures;
    StreamReader           reader{interpreter, [&](LineError const& failure) { failures.push_back(failure); }};
    auto                   stats = reader.run(input);

    CHECK_EQ(stats.lines, 5U);
    CHECK_EQ(stats.applied, 2U);
    CHECK_EQ(stats.errors, 3U);
    REQUIRE_EQ(failures.size(), 3U);
    CHECK_EQ(failures[0].line_number, 1U);
    CHECK_EQ(failures[0].error.code, Error::Code::UninitializedSession);
    CHECK_EQ(failures[1].line_number, 3U);
    CHECK_EQ(failures[1].error.code, Error::Code::MalformedMessage);
    CHECK_EQ(failures[2].line_number, 4U);
    CHECK_EQ(failures[2].error.code, Error::Code::UnknownMessageKind);

    CHECK_EQ(interpreter.stateSnapshot()["count"], 2);
    CHECK_EQ(interpreter.nodeCount(), 0U);
}

TEST_CASE("StreamReader skips blank lines and strips carriage returns") {
    std::istringstream input{"\r\n"
                             "   \n"
                             R"({"messageType":"StreamHeader","sessionId":"s1","rootId":"r"})" "\r\n"
                             "\n"
                             R"({"messageType":"Layout","id":"r","type":"Text"})" "\r\n"};

    StreamInterpreter interpreter;
    StreamReader      reader{interpreter};
    auto              stats = reader.run(input);

    CHECK_EQ(stats.lines, 5U);
    CHECK_EQ(stats.skipped, 3U);
    CHECK_EQ(stats.applied, 2U);
    CHECK_EQ(stats.errors, 0U);
    CHECK(interpreter.isReady());
}

TEST_CASE("StreamReader handles a final line without a newline") {
    std::istringstream input{R"({"messageType":"StreamHeader","sessionId":"tail"})"};

    StreamInterpreter interpreter;
    StreamReader      reader{interpreter};
    auto              stats = reader.run(input);

    CHECK_EQ(stats.applied, 1U);
    REQUIRE(interpreter.session().has_value());
    CHECK_EQ(interpreter.session()->session_id, "tail");
}
TEST_CASE("StreamReader drops an oversized line and continues with the next") {
    std::string input_text = std::string(10000, 'x') + "\n"
                             + R"({"messageType":"StreamHeader","sessionId":"after"})" + "\n";
    std::istringstream input{input_text};

    StreamInterpreter      interpreter{InterpreterOptions{.max_line_bytes = 64}};
    std::vector<LineError> failures;
    StreamReader           reader{interpreter, [&](LineError const& failure) { failures.push_back(failure); }};
    auto                   stats = reader.run(input);

    CHECK_EQ(stats.lines, 2U);
    CHECK_EQ(stats.applied, 1U);
    REQUIRE_EQ(failures.size(), 1U);
    CHECK_EQ(failures[0].line_number, 1U);
    CHECK_EQ(failures[0].error.code, Error::Code::CapacityExceeded);
    REQUIRE(interpreter.session().has_value());
    CHECK_EQ(interpreter.session()->session_id, "after");
}

TEST_CASE("StreamReader keeps a CRLF line of exactly the limit") {
    std::string const line = R"({"messageType":"StreamHeader","sessionId":"s"})";
    std::istringstream input{line + "\r\n"};

    StreamInterpreter interpreter{InterpreterOptions{.max_line_bytes = line.size()}};
    StreamReader      reader{interpreter};
    auto              stats = reader.run(input);
    CHECK_EQ(stats.applied, 1U);
    CHECK_EQ(stats.errors, 0U);
}

TEST_CASE("StreamReader survives a deeply nested line and keeps going") {
    std::string const deep = R"({"messageType":"StateUpdate","state":{"k":)" + std::string(200000, '[')
                             + std::string(200000, ']') + "}}";
    std::istringstream input{R"({"messageType":"StreamHeader","sessionId":"s1"})" "\n" + deep + "\n"
                             + R"({"messageType":"StateUpdate","state":{"k":1}})" + "\n"};

    StreamInterpreter      interpreter;
    std::vector<LineError> failures;
    StreamReader           reader{interpreter, [&](LineError const& failure) { failures.push_back(failure); }};
    auto                   stats = reader.run(input);

    CHECK_EQ(stats.applied, 2U);
    REQUIRE_EQ(failures.size(), 1U);
    CHECK_EQ(failures[0].line_number, 2U);
    CHECK_EQ(failures[0].error.code, Error::Code::MalformedMessage);
    CHECK_EQ(interpreter.stateSnapshot()["k"], 1);
}
}
