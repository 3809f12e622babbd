#pragma once

#include <gsp/protocol/MessageDecoder.hpp>

#include <cstddef>
#include <string>

namespace GSP::Interpreter {

struct InterpreterOptions {
    static constexpr std::size_t kUnlimitedNodes      = 0;
    static constexpr std::size_t kDefaultMaxLineBytes = 1024 * 1024;

    // Distinct node ids the buffer accepts; 0 = unlimited.
    std::size_t max_nodes      = kUnlimitedNodes;
    std::size_t max_line_bytes = kDefaultMaxLineBytes;
    // Deepest JSON nesting a line may carry.
    std::size_t max_depth      = Protocol::kDefaultMaxDepth;
    std::string bind_marker{Protocol::kDefaultBindMarker};
};

/**
 * Defaults overridden by GSP_MAX_NODES, GSP_MAX_LINE_BYTES, GSP_MAX_DEPTH
 * and GSP_BIND_MARKER. Unparseable values are ignored.
 */
[[nodiscard]] auto interpreterOptionsFromEnvironment(InterpreterOptions defaults = {})
    -> InterpreterOptions;

} // namespace GSP::Interpreter
