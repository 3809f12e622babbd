#include <gsp/interpreter/ChangeNotifier.hpp>

#include <algorithm>
#include <utility>

namespace GSP::Interpreter {

auto changeReasonToString(ChangeReason reason) -> std::string_view {
    switch (reason) {
    case ChangeReason::BecameReady:
        return "became_ready";
    case ChangeReason::StateChanged:
        return "state_changed";
    case ChangeReason::RootReplaced:
        return "root_replaced";
    }
    return "unknown";
}

auto ChangeNotifier::subscribe(Listener listener) -> ListenerId {
    auto id = next_id_++;
    listeners_.push_back(std::make_shared<Slot>(Slot{.id = id, .callback = std::move(listener)}));
    return id;
}

auto ChangeNotifier::unsubscribe(ListenerId id) -> bool {
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
                           [id](auto const& slot) { return slot->id == id; });
    if (it == listeners_.end()) {
        return false;
    }
    // A publish in progress may still hold the slot in its snapshot.
    (*it)->active = false;
    listeners_.erase(it);
    return true;
}

void ChangeNotifier::publish(ChangeEvent const& event) {
    // Snapshot so listeners can (un)subscribe from inside a callback.
    auto snapshot = listeners_;
    publishing_   = true;
    struct Reset {
        bool& flag;
        ~Reset() { flag = false; }
    } reset{publishing_};
    for (auto const& slot : snapshot) {
        if (slot->active && slot->callback) {
            slot->callback(event);
        }
    }
}

} // namespace GSP::Interpreter
