#include <gsp/interpreter/StreamReader.hpp>

#include "log/TaggedLogger.hpp"

#include <cctype>
#include <istream>
#include <limits>
#include <string>
#include <string_view>
#include <utility>

namespace GSP::Interpreter {
namespace {

[[nodiscard]] auto is_blank(std::string_view line) -> bool {
    for (unsigned char ch : line) {
        if (std::isspace(ch) == 0) {
            return false;
        }
    }
    return true;
}

enum class LineRead { Line, Oversized, End };

// Like getline, but keeps at most `limit` characters of a line and discards
// the rest up to the next newline.
[[nodiscard]] auto read_line(std::istream& input, std::string& line, std::size_t limit) -> LineRead {
    line.clear();
    bool any       = false;
    bool oversized = false;
    char ch        = 0;
    while (input.get(ch)) {
        any = true;
        if (ch == '\n') {
            break;
        }
        if (line.size() < limit) {
            line.push_back(ch);
        } else {
            oversized = true;
        }
    }
    if (!any) {
        return LineRead::End;
    }
    return oversized ? LineRead::Oversized : LineRead::Line;
}

} // namespace

StreamReader::StreamReader(StreamInterpreter& interpreter, ErrorHandler on_error)
    : interpreter_(interpreter), on_error_(std::move(on_error)) {}

auto StreamReader::run(std::istream& input) -> StreamStats {
    StreamStats stats;
    std::string line;
    // One extra byte so a CRLF line of exactly max_line_bytes still fits.
    auto const max_bytes = interpreter_.options().max_line_bytes;
    auto const limit     = max_bytes < std::numeric_limits<std::size_t>::max() ? max_bytes + 1 : max_bytes;
    for (auto read = read_line(input, line, limit); read != LineRead::End; read = read_line(input, line, limit)) {
        ++stats.lines;
        if (read == LineRead::Oversized) {
            ++stats.errors;
            Error error{Error::Code::CapacityExceeded,
                        "line exceeds limit of " + std::to_string(max_bytes) + " bytes"};
            gsp_log("Line " + std::to_string(stats.lines) + ": " + describeError(error), "StreamReader", "ERROR");
            if (on_error_) {
                on_error_(LineError{.line_number = stats.lines, .error = std::move(error)});
            }
            continue;
        }
        std::string_view view{line};
        if (!view.empty() && view.back() == '\r') {
            view.remove_suffix(1);
        }
        if (is_blank(view)) {
            ++stats.skipped;
            continue;
        }
        auto applied = interpreter_.applyLine(view);
        if (!applied) {
            ++stats.errors;
            gsp_log("Line " + std::to_string(stats.lines) + ": " + describeError(applied.error()),
                    "StreamReader", "ERROR");
            if (on_error_) {
                on_error_(LineError{.line_number = stats.lines, .error = applied.error()});
            }
            continue;
        }
        ++stats.applied;
    }
    gsp_log("Stream ended after " + std::to_string(stats.lines) + " lines", "StreamReader", "INFO");
    return stats;
}

} // namespace GSP::Interpreter
