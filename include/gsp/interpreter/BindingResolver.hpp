#pragma once

#include <gsp/protocol/StreamMessage.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace GSP::Interpreter {

struct ResolvedValue {
    // Empty when the property is bound to a key absent from state.
    std::optional<Protocol::Json> value;
    // Set for bound properties, names the state key.
    std::optional<std::string> binding;

    [[nodiscard]] auto isMissing() const -> bool { return !value.has_value(); }
    [[nodiscard]] auto isBound() const -> bool { return binding.has_value(); }
};

using ResolvedProperties = std::map<std::string, ResolvedValue>;

/**
 * Looks up a binding key in application state. An exact top-level key
 * wins; otherwise a dotted key ("user.name", "items.0") walks nested
 * objects and arrays.
 */
[[nodiscard]] auto lookupStateValue(Protocol::Json const& state, std::string_view key)
    -> std::optional<Protocol::Json>;

[[nodiscard]] auto resolveValue(Protocol::PropertyValue const& value, Protocol::Json const& state)
    -> ResolvedValue;

/**
 * Produces the render-ready property map for one node. Literals pass
 * through, bindings take the current state value or the missing marker.
 * Nothing is cached between calls.
 */
[[nodiscard]] auto resolveProperties(Protocol::PropertyMap const& properties,
                                     Protocol::Json const&        state) -> ResolvedProperties;

} // namespace GSP::Interpreter
