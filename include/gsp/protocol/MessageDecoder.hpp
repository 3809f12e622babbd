#pragma once

#include <gsp/core/Error.hpp>
#include <gsp/protocol/StreamMessage.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace GSP::Protocol {

inline constexpr std::size_t kDefaultMaxDepth = 256;

struct DecodeOptions {
    std::string bind_marker{kDefaultBindMarker};
    // Deepest object / array nesting accepted; the top-level object is depth 1.
    std::size_t max_depth = kDefaultMaxDepth;
};

/**
 * Decodes one line of the stream. Pure: the result depends only on the
 * text and the options.
 *
 * Errors:
 * - MalformedMessage when the text is not JSON, not an object, lacks the
 *   discriminator, nests deeper than max_depth, or a kind-specific field is
 *   missing or mistyped.
 * - UnknownMessageKind when the discriminator names no known variant.
 */
[[nodiscard]] auto decodeMessage(std::string_view line, DecodeOptions const& options = {})
    -> Expected<StreamMessage>;

[[nodiscard]] auto encodeMessage(StreamMessage const& message, DecodeOptions const& options = {})
    -> std::string;

[[nodiscard]] auto encodeClientRequest(ClientRequest const& request) -> std::string;

} // namespace GSP::Protocol
