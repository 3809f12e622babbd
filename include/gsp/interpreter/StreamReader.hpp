#pragma once

#include <gsp/core/Error.hpp>
#include <gsp/interpreter/StreamInterpreter.hpp>

#include <cstddef>
#include <functional>
#include <istream>

namespace GSP::Interpreter {

struct StreamStats {
    std::size_t lines   = 0;
    std::size_t applied = 0;
    std::size_t skipped = 0;
    std::size_t errors  = 0;
};

struct LineError {
    std::size_t line_number = 0;
    Error       error;
};

/**
 * Feeds a line-delimited JSON stream into an interpreter until the stream
 * ends. Each failing line is reported and skipped; processing continues.
 * Blank lines are skipped, a trailing '\r' is stripped. A line longer than
 * max_line_bytes is reported without being held in memory in full.
 */
class StreamReader {
public:
    using ErrorHandler = std::function<void(LineError const&)>;

    explicit StreamReader(StreamInterpreter& interpreter, ErrorHandler on_error = {});

    auto run(std::istream& input) -> StreamStats;

private:
    StreamInterpreter& interpreter_;
    ErrorHandler       on_error_;
};

} // namespace GSP::Interpreter
