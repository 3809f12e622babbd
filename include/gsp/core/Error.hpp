#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace GSP {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        MalformedMessage,
        UnknownMessageKind,
        UninitializedSession,
        UnresolvedBinding,
        DanglingReference,
        ReentrantMutation,
        NotSupported,
        CapacityExceeded
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::MalformedMessage:
        return "malformed_message";
    case Error::Code::UnknownMessageKind:
        return "unknown_message_kind";
    case Error::Code::UninitializedSession:
        return "uninitialized_session";
    case Error::Code::UnresolvedBinding:
        return "unresolved_binding";
    case Error::Code::DanglingReference:
        return "dangling_reference";
    case Error::Code::ReentrantMutation:
        return "reentrant_mutation";
    case Error::Code::NotSupported:
        return "not_supported";
    case Error::Code::CapacityExceeded:
        return "capacity_exceeded";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace GSP
