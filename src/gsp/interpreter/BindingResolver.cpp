#include <gsp/interpreter/BindingResolver.hpp>

#include <gsp/core/Error.hpp>

#include "log/TaggedLogger.hpp"

#include <charconv>
#include <string>
#include <variant>

namespace GSP::Interpreter {
namespace {

using Protocol::Json;

[[nodiscard]] auto parse_index(std::string_view segment) -> std::optional<std::size_t> {
    if (segment.empty()) {
        return std::nullopt;
    }
    std::size_t index  = 0;
    auto        result = std::from_chars(segment.data(), segment.data() + segment.size(), index);
    if (result.ec != std::errc{} || result.ptr != segment.data() + segment.size()) {
        return std::nullopt;
    }
    return index;
}

[[nodiscard]] auto walk_dotted(Json const& state, std::string_view key) -> std::optional<Json> {
    Json const* current = &state;
    while (true) {
        auto dot     = key.find('.');
        auto segment = key.substr(0, dot);
        if (current->is_object()) {
            auto it = current->find(std::string(segment));
            if (it == current->end()) {
                return std::nullopt;
            }
            current = &*it;
        } else if (current->is_array()) {
            auto index = parse_index(segment);
            if (!index || *index >= current->size()) {
                return std::nullopt;
            }
            current = &(*current)[*index];
        } else {
            return std::nullopt;
        }
        if (dot == std::string_view::npos) {
            return *current;
        }
        key.remove_prefix(dot + 1);
    }
}

} // namespace

auto lookupStateValue(Json const& state, std::string_view key) -> std::optional<Json> {
    if (!state.is_object() || key.empty()) {
        return std::nullopt;
    }
    if (auto it = state.find(std::string(key)); it != state.end()) {
        return *it;
    }
    if (key.find('.') == std::string_view::npos) {
        return std::nullopt;
    }
    return walk_dotted(state, key);
}

auto resolveValue(Protocol::PropertyValue const& value, Json const& state) -> ResolvedValue {
    if (auto const* binding = std::get_if<Protocol::BindingRef>(&value)) {
        ResolvedValue resolved;
        resolved.binding = binding->key;
        resolved.value   = lookupStateValue(state, binding->key);
        if (!resolved.value) {
            gsp_log(describeError(Error{Error::Code::UnresolvedBinding, binding->key}), "Binding", "WARN");
        }
        return resolved;
    }
    return ResolvedValue{.value = std::get<Json>(value), .binding = std::nullopt};
}

auto resolveProperties(Protocol::PropertyMap const& properties, Json const& state) -> ResolvedProperties {
    ResolvedProperties resolved;
    for (auto const& [name, value] : properties) {
        resolved.emplace(name, resolveValue(value, state));
    }
    return resolved;
}

} // namespace GSP::Interpreter
