#include <gsp/protocol/MessageDecoder.hpp>

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace GSP::Protocol {
namespace {

[[nodiscard]] auto make_error(Error::Code code,
                              std::string_view field,
                              std::string_view detail) -> Error {
    std::string message;
    message.reserve(field.size() + detail.size() + 2);
    message.append(field);
    if (!detail.empty()) {
        message.append(": ");
        message.append(detail);
    }
    return Error{code, std::move(message)};
}

[[nodiscard]] auto malformed(std::string_view field, std::string_view detail) -> Error {
    return make_error(Error::Code::MalformedMessage, field, detail);
}

[[nodiscard]] auto read_string(Json const& json, char const* key) -> Expected<std::string> {
    if (auto it = json.find(key); it != json.end()) {
        if (!it->is_string()) {
            return std::unexpected(malformed(key, "must be a string"));
        }
        return it->get<std::string>();
    }
    return std::unexpected(malformed(key, "is required"));
}

[[nodiscard]] auto read_identifier(Json const& json, char const* key) -> Expected<std::string> {
    auto value = read_string(json, key);
    if (!value) {
        return std::unexpected(value.error());
    }
    if (value->empty()) {
        return std::unexpected(malformed(key, "must not be empty"));
    }
    return value;
}

[[nodiscard]] auto read_optional_string(Json const& json, char const* key)
    -> Expected<std::optional<std::string>> {
    if (auto it = json.find(key); it != json.end()) {
        if (it->is_null()) {
            return std::optional<std::string>{std::nullopt};
        }
        if (!it->is_string()) {
            return std::unexpected(malformed(key, "must be a string"));
        }
        return std::optional<std::string>{it->get<std::string>()};
    }
    return std::optional<std::string>{std::nullopt};
}

[[nodiscard]] auto read_object(Json const& json, char const* key, bool required) -> Expected<Json> {
    if (auto it = json.find(key); it != json.end()) {
        if (it->is_null() && !required) {
            return Json::object();
        }
        if (!it->is_object()) {
            return std::unexpected(malformed(key, "must be a JSON object"));
        }
        return *it;
    }
    if (required) {
        return std::unexpected(malformed(key, "is required"));
    }
    return Json::object();
}

[[nodiscard]] auto parse_property(std::string const& name,
                                  Json const& value,
                                  std::string_view bind_marker) -> Expected<PropertyValue> {
    if (value.is_object()) {
        if (auto it = value.find(std::string(bind_marker)); it != value.end()) {
            if (!it->is_string() || it->get_ref<std::string const&>().empty()) {
                return std::unexpected(malformed("properties." + name,
                                                 "binding key must be a non-empty string"));
            }
            return PropertyValue{BindingRef{it->get<std::string>()}};
        }
    }
    return PropertyValue{std::in_place_type<Json>, value};
}

[[nodiscard]] auto parse_header(Json const& json) -> Expected<StreamHeader> {
    StreamHeader header;
    auto session = read_identifier(json, "sessionId");
    if (!session) {
        return std::unexpected(session.error());
    }
    header.session_id = std::move(*session);

    auto root = read_optional_string(json, "rootId");
    if (!root) {
        return std::unexpected(root.error());
    }
    if (root->has_value() && (*root)->empty()) {
        return std::unexpected(malformed("rootId", "must not be empty"));
    }
    header.root_id = std::move(*root);

    auto version = read_optional_string(json, "formatVersion");
    if (!version) {
        return std::unexpected(version.error());
    }
    header.format_version = std::move(*version);

    auto initial = read_object(json, "initialState", false);
    if (!initial) {
        return std::unexpected(initial.error());
    }
    header.initial_state = std::move(*initial);
    return header;
}

[[nodiscard]] auto parse_layout(Json const& json, std::string_view bind_marker) -> Expected<Layout> {
    Layout layout;
    auto id = read_identifier(json, "id");
    if (!id) {
        return std::unexpected(id.error());
    }
    layout.node.id = std::move(*id);

    auto kind = read_identifier(json, "type");
    if (!kind) {
        return std::unexpected(kind.error());
    }
    layout.node.kind = std::move(*kind);

    auto properties = read_object(json, "properties", false);
    if (!properties) {
        return std::unexpected(properties.error());
    }
    for (auto it = properties->begin(); it != properties->end(); ++it) {
        auto parsed = parse_property(it.key(), it.value(), bind_marker);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        layout.node.properties.emplace(it.key(), std::move(*parsed));
    }

    if (auto it = json.find("children"); it != json.end() && !it->is_null()) {
        if (!it->is_array()) {
            return std::unexpected(malformed("children", "must be an array"));
        }
        layout.node.children.reserve(it->size());
        for (auto const& child : *it) {
            if (!child.is_string() || child.get_ref<std::string const&>().empty()) {
                return std::unexpected(malformed("children", "entries must be non-empty strings"));
            }
            layout.node.children.push_back(child.get<std::string>());
        }
    }
    return layout;
}

[[nodiscard]] auto parse_layout_root(Json const& json) -> Expected<LayoutRoot> {
    auto root = read_identifier(json, "rootId");
    if (!root) {
        return std::unexpected(root.error());
    }
    return LayoutRoot{std::move(*root)};
}

[[nodiscard]] auto parse_state_update(Json const& json) -> Expected<StateUpdate> {
    auto values = read_object(json, "state", true);
    if (!values) {
        return std::unexpected(values.error());
    }
    return StateUpdate{std::move(*values)};
}

template <typename Payload>
[[nodiscard]] auto wrap(Expected<Payload> payload) -> Expected<StreamMessage> {
    if (!payload) {
        return std::unexpected(payload.error());
    }
    return makeMessage(std::move(*payload));
}

[[nodiscard]] auto property_to_json(PropertyValue const& value, std::string const& bind_marker) -> Json {
    if (auto const* binding = std::get_if<BindingRef>(&value)) {
        return Json{{bind_marker, binding->key}};
    }
    return std::get<Json>(value);
}

} // namespace

auto messageKindToString(MessageKind kind) -> std::string_view {
    switch (kind) {
    case MessageKind::StreamHeader:
        return "StreamHeader";
    case MessageKind::Layout:
        return "Layout";
    case MessageKind::LayoutRoot:
        return "LayoutRoot";
    case MessageKind::StateUpdate:
        return "StateUpdate";
    }
    return "Unknown";
}

auto parseMessageKind(std::string_view name) -> Expected<MessageKind> {
    if (name == "StreamHeader") {
        return MessageKind::StreamHeader;
    }
    if (name == "Layout") {
        return MessageKind::Layout;
    }
    if (name == "LayoutRoot") {
        return MessageKind::LayoutRoot;
    }
    if (name == "StateUpdate") {
        return MessageKind::StateUpdate;
    }
    return std::unexpected(make_error(Error::Code::UnknownMessageKind,
                                      kDiscriminatorField,
                                      "unrecognized value '" + std::string(name) + "'"));
}

auto decodeMessage(std::string_view line, DecodeOptions const& options) -> Expected<StreamMessage> {
    // Values nested past the limit are dropped while parsing, so nothing
    // deep enough to exhaust the stack on copy is ever built.
    bool too_deep = false;
    auto limit    = [&](int depth, Json::parse_event_t event, Json&) -> bool {
        if (event == Json::parse_event_t::object_start || event == Json::parse_event_t::array_start) {
            if (static_cast<std::size_t>(depth) >= options.max_depth) {
                too_deep = true;
                return false;
            }
        }
        return true;
    };
    auto json = Json::parse(line, limit, false);
    if (too_deep) {
        return std::unexpected(malformed("message",
                                         "nested deeper than " + std::to_string(options.max_depth) + " levels"));
    }
    if (json.is_discarded()) {
        return std::unexpected(malformed("message", "invalid JSON"));
    }
    if (!json.is_object()) {
        return std::unexpected(malformed("message", "must be a JSON object"));
    }
    auto type = read_string(json, kDiscriminatorField.data());
    if (!type) {
        return std::unexpected(type.error());
    }
    auto kind = parseMessageKind(*type);
    if (!kind) {
        return std::unexpected(kind.error());
    }
    switch (*kind) {
    case MessageKind::StreamHeader:
        return wrap(parse_header(json));
    case MessageKind::Layout:
        return wrap(parse_layout(json, options.bind_marker));
    case MessageKind::LayoutRoot:
        return wrap(parse_layout_root(json));
    case MessageKind::StateUpdate:
        return wrap(parse_state_update(json));
    }
    return std::unexpected(make_error(Error::Code::UnknownMessageKind, kDiscriminatorField, *type));
}

auto encodeMessage(StreamMessage const& message, DecodeOptions const& options) -> std::string {
    Json json{{std::string(kDiscriminatorField), std::string(messageKindToString(message.kind()))}};
    std::visit(
        [&](auto const& payload) {
            using Payload = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<Payload, StreamHeader>) {
                json["sessionId"] = payload.session_id;
                if (payload.root_id) {
                    json["rootId"] = *payload.root_id;
                }
                if (payload.format_version) {
                    json["formatVersion"] = *payload.format_version;
                }
                if (!payload.initial_state.empty()) {
                    json["initialState"] = payload.initial_state;
                }
            } else if constexpr (std::is_same_v<Payload, Layout>) {
                json["id"]   = payload.node.id;
                json["type"] = payload.node.kind;
                Json properties = Json::object();
                for (auto const& [name, value] : payload.node.properties) {
                    properties[name] = property_to_json(value, options.bind_marker);
                }
                json["properties"] = std::move(properties);
                json["children"]   = payload.node.children;
            } else if constexpr (std::is_same_v<Payload, LayoutRoot>) {
                json["rootId"] = payload.root_id;
            } else {
                json["state"] = payload.values;
            }
        },
        message.payload);
    return json.dump();
}

auto encodeClientRequest(ClientRequest const& request) -> std::string {
    Json json{{"event", request.event},
              {"sourceId", request.source_id},
              {"payload", request.payload}};
    return json.dump();
}

} // namespace GSP::Protocol
