#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace GSP::Interpreter {

enum class ChangeReason {
    BecameReady,
    StateChanged,
    RootReplaced,
};

[[nodiscard]] auto changeReasonToString(ChangeReason reason) -> std::string_view;

struct ChangeEvent {
    ChangeReason             reason{ChangeReason::BecameReady};
    std::uint64_t            sequence{0};
    std::string              root_id;
    std::vector<std::string> changed_keys;
};

using Listener   = std::function<void(ChangeEvent const&)>;
using ListenerId = std::uint64_t;

/**
 * Publish point for interpreter changes. Listeners are called
 * synchronously, in subscription order, on the publishing thread.
 *
 * A listener may subscribe or unsubscribe while a publish is running.
 * A listener added mid-publish is first called on the next publish; a
 * listener removed mid-publish is not called again, not even later in
 * the same publish.
 */
class ChangeNotifier {
public:
    auto subscribe(Listener listener) -> ListenerId;
    auto unsubscribe(ListenerId id) -> bool;

    void publish(ChangeEvent const& event);

    [[nodiscard]] auto listenerCount() const -> std::size_t { return listeners_.size(); }
    [[nodiscard]] auto isPublishing() const -> bool { return publishing_; }

private:
    struct Slot {
        ListenerId id;
        Listener   callback;
        bool       active = true;
    };

    std::vector<std::shared_ptr<Slot>> listeners_;
    ListenerId                         next_id_    = 1;
    bool                               publishing_ = false;
};

} // namespace GSP::Interpreter
