#pragma once

#include <gsp/core/Error.hpp>
#include <gsp/interpreter/BindingResolver.hpp>
#include <gsp/interpreter/ChangeNotifier.hpp>
#include <gsp/interpreter/ClientRequestSink.hpp>
#include <gsp/interpreter/InterpreterOptions.hpp>
#include <gsp/protocol/StreamMessage.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace GSP::Interpreter {

struct SessionInfo {
    std::string                session_id;
    std::optional<std::string> format_version;
    std::uint64_t              header_count{0};
};

struct ResolvedNode {
    std::string              id;
    std::string              kind;
    ResolvedProperties       properties;
    std::vector<std::string> children;
    std::size_t              depth{0};
};

struct ResolvedLayout {
    std::string               root_id;
    // Depth-first pre-order, each reachable node once.
    std::vector<ResolvedNode> nodes;
    // Child ids referenced under the root but not buffered.
    std::vector<std::string>  missing;
};

/**
 * StreamInterpreter applies decoded stream messages in arrival order.
 *
 * It owns the node buffer (flat id -> node map, filled out of order), the
 * application state object, the declared root id and the readiness flag.
 * Readiness holds once the declared root and every node reachable from it
 * through child ids are buffered; it never reverts.
 *
 * Listeners are notified synchronously on:
 * - the not-ready -> ready transition (exactly once),
 * - every StateUpdate applied while ready,
 * - completion of a root declared after readiness (re-rooting).
 *
 * Single consumer: calls must not overlap, and a listener must not mutate
 * the interpreter it is being notified by (rejected with ReentrantMutation).
 * The read surface is usable at any time, including after the input ends.
 */
class StreamInterpreter {
public:
    explicit StreamInterpreter(InterpreterOptions options = {});

    StreamInterpreter(StreamInterpreter const&)            = delete;
    StreamInterpreter& operator=(StreamInterpreter const&) = delete;

    [[nodiscard]] auto applyLine(std::string_view line) -> Expected<void>;
    [[nodiscard]] auto apply(Protocol::StreamMessage const& message) -> Expected<void>;

    auto subscribe(Listener listener) -> ListenerId;
    auto unsubscribe(ListenerId id) -> bool;

    void setClientRequestSink(std::weak_ptr<ClientRequestSink> sink);
    [[nodiscard]] auto emitClientRequest(Protocol::ClientRequest const& request) const -> Expected<void>;

    [[nodiscard]] auto isReady() const -> bool { return ready_; }
    [[nodiscard]] auto currentLayout() const -> std::optional<ResolvedLayout>;
    [[nodiscard]] auto stateSnapshot() const -> Protocol::Json { return state_; }
    [[nodiscard]] auto session() const -> std::optional<SessionInfo> const& { return session_; }
    [[nodiscard]] auto rootId() const -> std::optional<std::string> const& { return root_id_; }
    [[nodiscard]] auto nodeCount() const -> std::size_t { return nodes_.size(); }
    [[nodiscard]] auto findNode(std::string_view id) const -> Protocol::LayoutNode const*;
    [[nodiscard]] auto missingNodes() const -> std::vector<std::string>;
    [[nodiscard]] auto options() const -> InterpreterOptions const& { return options_; }

private:
    auto applyHeader(Protocol::StreamHeader const& header) -> Expected<void>;
    auto applyLayout(Protocol::Layout const& layout) -> Expected<void>;
    auto applyLayoutRoot(Protocol::LayoutRoot const& root) -> Expected<void>;
    auto applyStateUpdate(Protocol::StateUpdate const& update) -> Expected<void>;

    [[nodiscard]] auto requireSession(Protocol::MessageKind kind) const -> Expected<void>;
    [[nodiscard]] auto collectMissing(std::string const& root) const -> std::vector<std::string>;
    void trackRoot(std::string const& root);
    void expandFrom(std::string const& id);
    void evaluateRoot(std::string const* arrived = nullptr, bool overwrote = false);
    void publish(ChangeReason reason, std::string root, std::vector<std::string> changed_keys = {});

    InterpreterOptions                                     options_;
    phmap::flat_hash_map<std::string, Protocol::LayoutNode> nodes_;
    Protocol::Json                                         state_ = Protocol::Json::object();
    std::optional<SessionInfo>                             session_;
    std::optional<std::string>                             root_id_;
    // Root whose completion listeners were last told about.
    std::optional<std::string>                             announced_root_;
    // Walk state for the root being waited on: ids reached from it, and the
    // reached ids not buffered yet. Readiness is reached with nothing pending.
    std::optional<std::string>                             tracked_root_;
    phmap::flat_hash_set<std::string>                      reached_;
    phmap::flat_hash_set<std::string>                      pending_;
    bool                                                   ready_    = false;
    std::uint64_t                                          sequence_ = 0;
    ChangeNotifier                                         notifier_;
    std::weak_ptr<ClientRequestSink>                       request_sink_;
};

} // namespace GSP::Interpreter
