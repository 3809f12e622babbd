#include <doctest/doctest.h>

#include <gsp/interpreter/ChangeNotifier.hpp>

#include <memory>
#include <string>
#include <vector>

using namespace GSP::Interpreter;

TEST_SUITE("interpreter.notifier") {
TEST_CASE("ChangeNotifier calls listeners in subscription order") {
    ChangeNotifier           notifier;
    std::vector<std::string> calls;
    notifier.subscribe([&](ChangeEvent const& event) { calls.push_back("first:" + event.root_id); });
    notifier.subscribe([&](ChangeEvent const& event) { calls.push_back("second:" + event.root_id); });
    CHECK_EQ(notifier.listenerCount(), 2U);

    notifier.publish(ChangeEvent{.reason = ChangeReason::BecameReady, .sequence = 1, .root_id = "r"});
    CHECK_EQ(calls, std::vector<std::string>{"first:r", "second:r"});
}

TEST_CASE("ChangeNotifier unsubscribe removes only the given listener") {
    ChangeNotifier notifier;
    int            a = 0;
    int            b = 0;
    auto           idA = notifier.subscribe([&](ChangeEvent const&) { ++a; });
    notifier.subscribe([&](ChangeEvent const&) { ++b; });

    CHECK(notifier.unsubscribe(idA));
    CHECK_FALSE(notifier.unsubscribe(idA));
    CHECK_FALSE(notifier.unsubscribe(999));

    notifier.publish(ChangeEvent{});
    CHECK_EQ(a, 0);
    CHECK_EQ(b, 1);
}

TEST_CASE("ChangeNotifier tolerates unsubscribing from inside a callback") {
    ChangeNotifier notifier;
    int            calls = 0;
    ListenerId     self  = 0;
    self                 = notifier.subscribe([&](ChangeEvent const&) {
        ++calls;
        notifier.unsubscribe(self);
    });

    notifier.publish(ChangeEvent{});
    notifier.publish(ChangeEvent{});
    CHECK_EQ(calls, 1);
    CHECK_EQ(notifier.listenerCount(), 0U);
}

TEST_CASE("ChangeNotifier skips a listener removed earlier in the same publish") {
    ChangeNotifier notifier;
    int            secondCalls = 0;
    ListenerId     second      = 0;
    notifier.subscribe([&](ChangeEvent const&) { notifier.unsubscribe(second); });
    second = notifier.subscribe([&](ChangeEvent const&) { ++secondCalls; });

    notifier.publish(ChangeEvent{});
    CHECK_EQ(secondCalls, 0);
    CHECK_EQ(notifier.listenerCount(), 1U);
}

TEST_CASE("ChangeNotifier never calls into a view torn down by another listener") {
    struct ChildView {
        ChangeNotifier&          notifier;
        std::vector<std::string> seen;
        ListenerId               id = 0;

        explicit ChildView(ChangeNotifier& owner) : notifier(owner) {
            id = notifier.subscribe([this](ChangeEvent const& event) { seen.push_back(event.root_id); });
        }
        ~ChildView() { notifier.unsubscribe(id); }
    };

    ChangeNotifier             notifier;
    std::unique_ptr<ChildView> child;
    int                        parentCalls = 0;
    notifier.subscribe([&](ChangeEvent const& event) {
        ++parentCalls;
        if (event.reason == ChangeReason::RootReplaced) {
            child.reset();
        }
    });
    child = std::make_unique<ChildView>(notifier);

    notifier.publish(ChangeEvent{.reason = ChangeReason::BecameReady, .root_id = "home"});
    REQUIRE(child);
    CHECK_EQ(child->seen, std::vector<std::string>{"home"});

    notifier.publish(ChangeEvent{.reason = ChangeReason::RootReplaced, .root_id = "detail"});
    CHECK_FALSE(child);
    CHECK_EQ(parentCalls, 2);
    CHECK_EQ(notifier.listenerCount(), 1U);
}

TEST_CASE("ChangeNotifier reports when it is publishing") {
    ChangeNotifier notifier;
    bool           seen = false;
    notifier.subscribe([&](ChangeEvent const&) { seen = notifier.isPublishing(); });

    CHECK_FALSE(notifier.isPublishing());
    notifier.publish(ChangeEvent{});
    CHECK(seen);
    CHECK_FALSE(notifier.isPublishing());
}

TEST_CASE("ChangeNotifier reason labels") {
    CHECK_EQ(changeReasonToString(ChangeReason::BecameReady), "became_ready");
    CHECK_EQ(changeReasonToString(ChangeReason::StateChanged), "state_changed");
    CHECK_EQ(changeReasonToString(ChangeReason::RootReplaced), "root_replaced");
}
}
