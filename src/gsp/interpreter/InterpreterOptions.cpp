#include <gsp/interpreter/InterpreterOptions.hpp>

#include "log/TaggedLogger.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace GSP::Interpreter {
namespace {

[[nodiscard]] auto trim(std::string_view raw) -> std::string_view {
    while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.front())) != 0) {
        raw.remove_prefix(1);
    }
    while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.back())) != 0) {
        raw.remove_suffix(1);
    }
    return raw;
}

[[nodiscard]] auto read_size_env(char const* name) -> std::optional<std::size_t> {
    auto* raw = std::getenv(name);
    if (raw == nullptr) {
        return std::nullopt;
    }
    auto text = trim(raw);
    if (text.empty()) {
        return std::nullopt;
    }
    std::size_t value  = 0;
    auto        result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        gsp_log(std::string("Ignoring non-numeric ") + name, "Config", "WARN");
        return std::nullopt;
    }
    return value;
}

} // namespace

auto interpreterOptionsFromEnvironment(InterpreterOptions defaults) -> InterpreterOptions {
    if (auto nodes = read_size_env("GSP_MAX_NODES")) {
        defaults.max_nodes = *nodes;
    }
    if (auto bytes = read_size_env("GSP_MAX_LINE_BYTES"); bytes && *bytes > 0) {
        defaults.max_line_bytes = *bytes;
    }
    if (auto depth = read_size_env("GSP_MAX_DEPTH"); depth && *depth > 0) {
        defaults.max_depth = *depth;
    }
    if (auto* raw = std::getenv("GSP_BIND_MARKER")) {
        auto marker = trim(raw);
        if (!marker.empty()) {
            defaults.bind_marker.assign(marker.begin(), marker.end());
        }
    }
    return defaults;
}

} // namespace GSP::Interpreter
