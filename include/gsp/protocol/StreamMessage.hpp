#pragma once

#include <gsp/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace GSP::Protocol {

using Json = nlohmann::json;

inline constexpr std::string_view kDiscriminatorField{"messageType"};
inline constexpr std::string_view kDefaultBindMarker{"$bind"};

enum class MessageKind {
    StreamHeader,
    Layout,
    LayoutRoot,
    StateUpdate,
};

/**
 * Reference into application state. Resolved on every render pass, never
 * while decoding.
 */
struct BindingRef {
    std::string key;

    friend auto operator==(BindingRef const&, BindingRef const&) -> bool = default;
};

using PropertyValue = std::variant<Json, BindingRef>;

using PropertyMap = std::map<std::string, PropertyValue>;

struct LayoutNode {
    std::string              id;
    std::string              kind;
    PropertyMap              properties;
    std::vector<std::string> children;
};

struct StreamHeader {
    std::string                session_id;
    std::optional<std::string> root_id;
    std::optional<std::string> format_version;
    Json                       initial_state = Json::object();
};

struct Layout {
    LayoutNode node;
};

struct LayoutRoot {
    std::string root_id;
};

struct StateUpdate {
    Json values = Json::object();
};

// Alternatives are declared in MessageKind order.
using MessagePayload = std::variant<StreamHeader, Layout, LayoutRoot, StateUpdate>;

static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(MessageKind::Layout), MessagePayload>, Layout>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(MessageKind::LayoutRoot), MessagePayload>,
                             LayoutRoot>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(MessageKind::StateUpdate), MessagePayload>,
                             StateUpdate>);

/**
 * One decoded line. The kind is derived from the payload so the two can
 * never disagree.
 */
struct StreamMessage {
    MessagePayload payload{StreamHeader{}};

    [[nodiscard]] auto kind() const -> MessageKind { return static_cast<MessageKind>(payload.index()); }
};

/**
 * Outbound event raised by the rendered UI. Handed to a ClientRequestSink;
 * never part of the inbound stream and never stored by the interpreter.
 */
struct ClientRequest {
    std::string event;
    std::string source_id;
    Json        payload = Json::object();
};

[[nodiscard]] auto messageKindToString(MessageKind kind) -> std::string_view;
[[nodiscard]] auto parseMessageKind(std::string_view name) -> Expected<MessageKind>;

template <typename Payload>
[[nodiscard]] auto makeMessage(Payload payload) -> StreamMessage {
    return StreamMessage{.payload = std::move(payload)};
}

} // namespace GSP::Protocol
