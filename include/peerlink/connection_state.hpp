/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_CONNECTION_STATE_HPP
#define PEERLINK_CONNECTION_STATE_HPP

#pragma once

#include <peerlink/errors.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace peerlink::session {

    enum class ConnectionState {
        Disconnected,
        Connecting,
        SignalingConnected,
        GatheringCandidates,
        Connected,
        Reconnecting,
        Failed,
        Closed
    };

    const char *connectionStateName(ConnectionState s);

    /// True if `from -> to` is in the allowed-transition table.
    bool isTransitionAllowed(ConnectionState from, ConnectionState to);

    struct StateChange {
        ConnectionState from;
        ConnectionState to;
        std::chrono::system_clock::time_point timestamp;
        std::string reason; // set when entering Failed, optional otherwise
    };

/**
 * @brief Per-session connection lifecycle guarded by a fixed transition table.
 *
 * transitionTo() is the only setter. Subscribers run synchronously inside the transition, after the new
 * state is stored and while the transition lock is held, so no other thread can observe or cause an
 * intermediate state. Exceptions thrown by subscribers are logged and swallowed at this point only.
 * A subscriber may itself call transitionTo() (the lock is recursive); the nested change is applied
 * after the current notification round finishes.
 */
    class ConnectionStateMachine {
    public:
        using Listener = std::function<void(const StateChange&)>;
        using SubscriptionId = uint64_t;

        explicit ConnectionStateMachine(std::string label = {});

        ConnectionStateMachine(const ConnectionStateMachine&) = delete;
        ConnectionStateMachine& operator=(const ConnectionStateMachine&) = delete;

        ConnectionState state() const;
        std::string failureReason() const;
        std::chrono::system_clock::time_point lastChange() const;

        Status transitionTo(ConnectionState next, const std::string &reason = {});

        /// Convenience for transitionTo(Failed, reason).
        Status fail(const std::string &reason);

        /// Failed -> Connecting. Any other source state is rejected.
        Status retry();

        bool isTerminal() const;

        SubscriptionId subscribe(Listener l);
        void unsubscribe(SubscriptionId id);

    private:
        void notify(const StateChange &change);

        std::string label_;
        mutable std::recursive_mutex mtx_;
        ConnectionState state_{ConnectionState::Disconnected};
        std::string reason_;
        std::chrono::system_clock::time_point changedAt_;

        std::vector<std::pair<SubscriptionId, Listener>> listeners_;
        SubscriptionId nextId_{1};

        // re-entrant transitions requested by listeners are queued until the current round completes
        bool notifying_{false};
        std::vector<StateChange> pending_;
    };

} // namespace peerlink::session

#endif // PEERLINK_CONNECTION_STATE_HPP
