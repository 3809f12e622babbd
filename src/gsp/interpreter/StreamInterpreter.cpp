#include <gsp/interpreter/StreamInterpreter.hpp>

#include <gsp/protocol/MessageDecoder.hpp>

#include "log/TaggedLogger.hpp"

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace GSP::Interpreter {
namespace {

using Protocol::Json;

[[nodiscard]] auto make_error(Error::Code code, std::string message) -> Error {
    return Error{code, std::move(message)};
}

} // namespace

StreamInterpreter::StreamInterpreter(InterpreterOptions options)
    : options_(std::move(options)) {}

auto StreamInterpreter::applyLine(std::string_view line) -> Expected<void> {
    if (line.size() > options_.max_line_bytes) {
        return std::unexpected(make_error(Error::Code::CapacityExceeded,
                                          "line of " + std::to_string(line.size()) + " bytes exceeds limit of "
                                              + std::to_string(options_.max_line_bytes)));
    }
    Protocol::DecodeOptions decode_options{.bind_marker = options_.bind_marker, .max_depth = options_.max_depth};
    auto message = Protocol::decodeMessage(line, decode_options);
    if (!message) {
        gsp_log("Rejected line: " + describeError(message.error()), "Interpreter", "ERROR");
        return std::unexpected(message.error());
    }
    return apply(*message);
}

auto StreamInterpreter::apply(Protocol::StreamMessage const& message) -> Expected<void> {
    if (notifier_.isPublishing()) {
        return std::unexpected(make_error(Error::Code::ReentrantMutation,
                                          "listener attempted to apply a "
                                              + std::string(Protocol::messageKindToString(message.kind()))
                                              + " message while being notified"));
    }
    return std::visit(
        [this](auto const& payload) -> Expected<void> {
            using Payload = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<Payload, Protocol::StreamHeader>) {
                return applyHeader(payload);
            } else if constexpr (std::is_same_v<Payload, Protocol::Layout>) {
                return applyLayout(payload);
            } else if constexpr (std::is_same_v<Payload, Protocol::LayoutRoot>) {
                return applyLayoutRoot(payload);
            } else {
                static_assert(std::is_same_v<Payload, Protocol::StateUpdate>, "unhandled stream message");
                return applyStateUpdate(payload);
            }
        },
        message.payload);
}

auto StreamInterpreter::requireSession(Protocol::MessageKind kind) const -> Expected<void> {
    if (!session_) {
        return std::unexpected(make_error(Error::Code::UninitializedSession,
                                          std::string(Protocol::messageKindToString(kind))
                                              + " received before StreamHeader"));
    }
    return {};
}

auto StreamInterpreter::applyHeader(Protocol::StreamHeader const& header) -> Expected<void> {
    if (session_) {
        gsp_log("Session reinitialized: " + session_->session_id + " -> " + header.session_id,
                "Interpreter", "INFO");
        session_->session_id     = header.session_id;
        session_->format_version = header.format_version;
        ++session_->header_count;
    } else {
        gsp_log("Session started: " + header.session_id, "Interpreter", "INFO");
        session_ = SessionInfo{.session_id     = header.session_id,
                               .format_version = header.format_version,
                               .header_count   = 1};
    }
    if (header.root_id) {
        root_id_ = header.root_id;
    }
    for (auto it = header.initial_state.begin(); it != header.initial_state.end(); ++it) {
        state_[it.key()] = it.value();
    }
    return {};
}

auto StreamInterpreter::applyLayout(Protocol::Layout const& layout) -> Expected<void> {
    if (auto guard = requireSession(Protocol::MessageKind::Layout); !guard) {
        return guard;
    }
    auto const& node      = layout.node;
    auto        it        = nodes_.find(node.id);
    bool const  overwrote = it != nodes_.end();
    if (!overwrote) {
        if (options_.max_nodes != InterpreterOptions::kUnlimitedNodes && nodes_.size() >= options_.max_nodes) {
            return std::unexpected(make_error(Error::Code::CapacityExceeded,
                                              "node buffer is full (" + std::to_string(options_.max_nodes)
                                                  + " nodes), dropping '" + node.id + "'"));
        }
        nodes_.emplace(node.id, node);
    } else {
        it->second = node;
    }
    gsp_log("Buffered node " + node.id + " (" + node.kind + ")", "Interpreter", "Layout");
    evaluateRoot(&node.id, overwrote);
    return {};
}

auto StreamInterpreter::applyLayoutRoot(Protocol::LayoutRoot const& root) -> Expected<void> {
    if (auto guard = requireSession(Protocol::MessageKind::LayoutRoot); !guard) {
        return guard;
    }
    root_id_ = root.root_id;
    evaluateRoot();
    return {};
}

auto StreamInterpreter::applyStateUpdate(Protocol::StateUpdate const& update) -> Expected<void> {
    if (auto guard = requireSession(Protocol::MessageKind::StateUpdate); !guard) {
        return guard;
    }
    std::vector<std::string> changed;
    for (auto it = update.values.begin(); it != update.values.end(); ++it) {
        auto existing = state_.find(it.key());
        if (existing != state_.end() && *existing == it.value()) {
            continue;
        }
        state_[it.key()] = it.value();
        changed.push_back(it.key());
    }
    if (ready_) {
        publish(ChangeReason::StateChanged, announced_root_.value_or(std::string{}), std::move(changed));
    }
    return {};
}

void StreamInterpreter::trackRoot(std::string const& root) {
    tracked_root_ = root;
    reached_.clear();
    pending_.clear();
    reached_.insert(root);
    if (nodes_.contains(root)) {
        expandFrom(root);
    } else {
        pending_.insert(root);
    }
}

// Extends the walk below a buffered node; children reached for the first
// time are either walked further or recorded as pending.
void StreamInterpreter::expandFrom(std::string const& id) {
    std::vector<std::string const*> stack{&nodes_.find(id)->first};
    while (!stack.empty()) {
        auto const& current = *stack.back();
        stack.pop_back();
        for (auto const& child : nodes_.find(current)->second.children) {
            if (!reached_.insert(child).second) {
                continue;
            }
            if (auto found = nodes_.find(child); found != nodes_.end()) {
                stack.push_back(&found->first);
            } else {
                pending_.insert(child);
            }
        }
    }
}

void StreamInterpreter::evaluateRoot(std::string const* arrived, bool overwrote) {
    if (!root_id_ || root_id_ == announced_root_) {
        tracked_root_.reset();
        return;
    }
    if (tracked_root_ != root_id_) {
        trackRoot(*root_id_);
    } else if (arrived != nullptr) {
        if (overwrote && reached_.contains(*arrived) && !pending_.contains(*arrived)) {
            // A reached node changed its children; walk again from the root.
            trackRoot(*root_id_);
        } else if (pending_.erase(*arrived) > 0) {
            expandFrom(*arrived);
        }
    }
    if (!pending_.empty()) {
        gsp_log("Root " + *root_id_ + " waiting for " + std::to_string(pending_.size()) + " nodes", "Interpreter",
                "Readiness");
        return;
    }
    auto const reason = ready_ ? ChangeReason::RootReplaced : ChangeReason::BecameReady;
    ready_            = true;
    announced_root_   = root_id_;
    tracked_root_.reset();
    reached_.clear();
    gsp_log("Root " + *root_id_ + " complete", "Interpreter", "INFO");
    publish(reason, *root_id_);
}

auto StreamInterpreter::collectMissing(std::string const& root) const
    -> std::vector<std::string> {
    std::vector<std::string>             missing;
    phmap::flat_hash_set<std::string>    visited;
    std::vector<std::string const*>      pending{&root};
    while (!pending.empty()) {
        auto const& id = *pending.back();
        pending.pop_back();
        if (!visited.insert(id).second) {
            continue;
        }
        auto it = nodes_.find(id);
        if (it == nodes_.end()) {
            missing.push_back(id);
            continue;
        }
        for (auto child = it->second.children.rbegin(); child != it->second.children.rend(); ++child) {
            pending.push_back(&*child);
        }
    }
    return missing;
}

void StreamInterpreter::publish(ChangeReason reason, std::string root, std::vector<std::string> changed_keys) {
    ChangeEvent event{.reason       = reason,
                      .sequence     = ++sequence_,
                      .root_id      = std::move(root),
                      .changed_keys = std::move(changed_keys)};
    gsp_log("Notify " + std::string(changeReasonToString(reason)) + " #" + std::to_string(event.sequence),
            "Interpreter", "Notify");
    notifier_.publish(event);
}

auto StreamInterpreter::subscribe(Listener listener) -> ListenerId {
    return notifier_.subscribe(std::move(listener));
}

auto StreamInterpreter::unsubscribe(ListenerId id) -> bool {
    return notifier_.unsubscribe(id);
}

void StreamInterpreter::setClientRequestSink(std::weak_ptr<ClientRequestSink> sink) {
    request_sink_ = std::move(sink);
}

auto StreamInterpreter::emitClientRequest(Protocol::ClientRequest const& request) const -> Expected<void> {
    if (!session_) {
        return std::unexpected(make_error(Error::Code::UninitializedSession,
                                          "client request '" + request.event + "' before StreamHeader"));
    }
    auto sink = request_sink_.lock();
    if (!sink) {
        return std::unexpected(make_error(Error::Code::NotSupported,
                                          "no client request sink attached for '" + request.event + "'"));
    }
    gsp_log("Client request " + request.event + " from " + request.source_id, "Interpreter", "Request");
    sink->deliver(request);
    return {};
}

auto StreamInterpreter::currentLayout() const -> std::optional<ResolvedLayout> {
    if (!ready_ || !announced_root_) {
        return std::nullopt;
    }
    ResolvedLayout layout;
    layout.root_id = *announced_root_;

    phmap::flat_hash_set<std::string>                           visited;
    std::vector<std::pair<std::string const*, std::size_t>>     pending{{&*announced_root_, 0}};
    while (!pending.empty()) {
        auto [id, depth] = pending.back();
        pending.pop_back();
        if (!visited.insert(*id).second) {
            continue;
        }
        auto it = nodes_.find(*id);
        if (it == nodes_.end()) {
            gsp_log(describeError(make_error(Error::Code::DanglingReference, "'" + *id + "' under " + layout.root_id)),
                    "Interpreter", "Layout");
            layout.missing.push_back(*id);
            continue;
        }
        auto const& node = it->second;
        layout.nodes.push_back(ResolvedNode{.id         = node.id,
                                            .kind       = node.kind,
                                            .properties = resolveProperties(node.properties, state_),
                                            .children   = node.children,
                                            .depth      = depth});
        for (auto child = node.children.rbegin(); child != node.children.rend(); ++child) {
            pending.emplace_back(&*child, depth + 1);
        }
    }
    return layout;
}

auto StreamInterpreter::findNode(std::string_view id) const -> Protocol::LayoutNode const* {
    auto it = nodes_.find(std::string(id));
    if (it == nodes_.end()) {
        return nullptr;
    }
    return &it->second;
}

auto StreamInterpreter::missingNodes() const -> std::vector<std::string> {
    if (!root_id_) {
        return {};
    }
    return collectMissing(*root_id_);
}

} // namespace GSP::Interpreter
