/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <peerlink/connection_state.hpp>

#include <stdexcept>
#include <vector>

using namespace peerlink;
using namespace peerlink::session;

using S = ConnectionState;

TEST_CASE("happy path walks every negotiation state", "[state]") {
    ConnectionStateMachine sm("test");
    std::vector<StateChange> seen;
    sm.subscribe([&seen](const StateChange &c) { seen.push_back(c); });

    REQUIRE(sm.state() == S::Disconnected);
    REQUIRE(sm.transitionTo(S::Connecting));
    REQUIRE(sm.transitionTo(S::SignalingConnected));
    REQUIRE(sm.transitionTo(S::GatheringCandidates));
    REQUIRE(sm.transitionTo(S::Connected));

    REQUIRE(seen.size() == 4);
    REQUIRE(seen[0].from == S::Disconnected);
    REQUIRE(seen[3].to == S::Connected);
    for (size_t i = 1; i < seen.size(); ++i) REQUIRE(seen[i].from == seen[i - 1].to);
}

TEST_CASE("skipping a state is rejected and leaves the state unchanged", "[state]") {
    ConnectionStateMachine sm("test");
    REQUIRE(sm.transitionTo(S::Connecting));

    auto st = sm.transitionTo(S::Connected);
    REQUIRE_FALSE(st);
    REQUIRE(st.error().kind == ErrorKind::InvalidTransition);
    REQUIRE(sm.state() == S::Connecting);

    REQUIRE_FALSE(sm.transitionTo(S::Connecting)); // self transition
}

TEST_CASE("transition table", "[state]") {
    REQUIRE(isTransitionAllowed(S::Connected, S::Reconnecting));
    REQUIRE(isTransitionAllowed(S::Reconnecting, S::Connected));
    REQUIRE(isTransitionAllowed(S::GatheringCandidates, S::Failed));
    REQUIRE(isTransitionAllowed(S::Disconnected, S::Closed));
    REQUIRE_FALSE(isTransitionAllowed(S::Reconnecting, S::GatheringCandidates));
    REQUIRE_FALSE(isTransitionAllowed(S::Failed, S::Connected));
    REQUIRE_FALSE(isTransitionAllowed(S::Closed, S::Connecting));
    REQUIRE_FALSE(isTransitionAllowed(S::Closed, S::Failed));
}

TEST_CASE("Failed keeps its reason and only retry leaves it", "[state]") {
    ConnectionStateMachine sm("test");
    REQUIRE(sm.transitionTo(S::Connecting));
    REQUIRE(sm.fail("ice timeout"));
    REQUIRE(sm.state() == S::Failed);
    REQUIRE(sm.failureReason() == "ice timeout");
    REQUIRE(sm.isTerminal());

    REQUIRE_FALSE(sm.transitionTo(S::Connecting));
    REQUIRE(sm.retry());
    REQUIRE(sm.state() == S::Connecting);
    REQUIRE(sm.failureReason().empty());

    REQUIRE_FALSE(sm.retry());
}

TEST_CASE("Closed is terminal", "[state]") {
    ConnectionStateMachine sm("test");
    REQUIRE(sm.transitionTo(S::Closed));
    REQUIRE_FALSE(sm.transitionTo(S::Failed, "late"));
    REQUIRE_FALSE(sm.retry());
    REQUIRE(sm.state() == S::Closed);
}

TEST_CASE("a throwing listener does not interrupt the transition", "[state]") {
    ConnectionStateMachine sm("test");
    int calls = 0;
    sm.subscribe([](const StateChange &) { throw std::runtime_error("listener bug"); });
    sm.subscribe([&calls](const StateChange &) { ++calls; });

    REQUIRE(sm.transitionTo(S::Connecting));
    REQUIRE(sm.state() == S::Connecting);
    REQUIRE(calls == 1);
}

TEST_CASE("transitions requested from a listener are delivered in order", "[state]") {
    ConnectionStateMachine sm("test");
    std::vector<S> order;
    sm.subscribe([&sm, &order](const StateChange &c) {
        order.push_back(c.to);
        if (c.to == S::Connecting) {
            auto st = sm.transitionTo(S::SignalingConnected);
            (void)st;
        }
    });
    REQUIRE(sm.transitionTo(S::Connecting));
    REQUIRE(order == std::vector<S>{S::Connecting, S::SignalingConnected});
    REQUIRE(sm.state() == S::SignalingConnected);
}

TEST_CASE("unsubscribe stops delivery", "[state]") {
    ConnectionStateMachine sm("test");
    int calls = 0;
    auto id = sm.subscribe([&calls](const StateChange &) { ++calls; });
    REQUIRE(sm.transitionTo(S::Connecting));
    sm.unsubscribe(id);
    REQUIRE(sm.transitionTo(S::SignalingConnected));
    REQUIRE(calls == 1);
}
