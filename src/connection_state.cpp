/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/connection_state.hpp>
#include <peerlink/logger.hpp>

#include <fmt/core.h>

namespace peerlink::session {

    const char *connectionStateName(ConnectionState s) {
        switch (s) {
            case ConnectionState::Disconnected:        return "Disconnected";
            case ConnectionState::Connecting:          return "Connecting";
            case ConnectionState::SignalingConnected:  return "SignalingConnected";
            case ConnectionState::GatheringCandidates: return "GatheringCandidates";
            case ConnectionState::Connected:           return "Connected";
            case ConnectionState::Reconnecting:        return "Reconnecting";
            case ConnectionState::Failed:              return "Failed";
            case ConnectionState::Closed:              return "Closed";
        }
        return "Unknown";
    }

    bool isTransitionAllowed(ConnectionState from, ConnectionState to) {
        using S = ConnectionState;
        if (from == to) return false;
        if (from == S::Closed) return false;
        if (to == S::Closed || to == S::Failed) return true;

        switch (from) {
            case S::Disconnected:        return to == S::Connecting;
            case S::Connecting:          return to == S::SignalingConnected;
            case S::SignalingConnected:  return to == S::GatheringCandidates;
            case S::GatheringCandidates: return to == S::Connected;
            case S::Connected:           return to == S::Reconnecting;
            case S::Reconnecting:        return to == S::Connected;
            case S::Failed:              return false; // only Closed, or Connecting via retry()
            case S::Closed:              return false;
        }
        return false;
    }

    ConnectionStateMachine::ConnectionStateMachine(std::string label)
            : label_(std::move(label)), changedAt_(std::chrono::system_clock::now()) {}

    ConnectionState ConnectionStateMachine::state() const {
        std::lock_guard<std::recursive_mutex> lk(mtx_);
        return state_;
    }

    std::string ConnectionStateMachine::failureReason() const {
        std::lock_guard<std::recursive_mutex> lk(mtx_);
        return reason_;
    }

    std::chrono::system_clock::time_point ConnectionStateMachine::lastChange() const {
        std::lock_guard<std::recursive_mutex> lk(mtx_);
        return changedAt_;
    }

    bool ConnectionStateMachine::isTerminal() const {
        std::lock_guard<std::recursive_mutex> lk(mtx_);
        return state_ == ConnectionState::Closed || state_ == ConnectionState::Failed;
    }

    Status ConnectionStateMachine::transitionTo(ConnectionState next, const std::string &reason) {
        std::lock_guard<std::recursive_mutex> lk(mtx_);
        if (!isTransitionAllowed(state_, next)) {
            LOG_SESSION_WARN("[{}] rejected transition {} -> {}", label_, connectionStateName(state_), connectionStateName(next));
            return Status::err(ErrorKind::InvalidTransition,
                               fmt::format("{} -> {} is not allowed", connectionStateName(state_), connectionStateName(next)));
        }

        StateChange change{state_, next, std::chrono::system_clock::now(), reason};
        state_ = next;
        reason_ = (next == ConnectionState::Failed) ? reason : std::string();
        changedAt_ = change.timestamp;

        if (reason.empty()) {
            LOG_SESSION_INFO("[{}] {} -> {}", label_, connectionStateName(change.from), connectionStateName(next));
        } else {
            LOG_SESSION_INFO("[{}] {} -> {} ({})", label_, connectionStateName(change.from), connectionStateName(next), reason);
        }

        notify(change);
        return success();
    }

    Status ConnectionStateMachine::fail(const std::string &reason) {
        return transitionTo(ConnectionState::Failed, reason);
    }

    Status ConnectionStateMachine::retry() {
        std::lock_guard<std::recursive_mutex> lk(mtx_);
        if (state_ != ConnectionState::Failed) {
            return Status::err(ErrorKind::InvalidTransition,
                               fmt::format("retry from {} is not allowed", connectionStateName(state_)));
        }
        StateChange change{state_, ConnectionState::Connecting, std::chrono::system_clock::now(), "retry"};
        state_ = ConnectionState::Connecting;
        reason_.clear();
        changedAt_ = change.timestamp;
        LOG_SESSION_INFO("[{}] Failed -> Connecting (retry)", label_);
        notify(change);
        return success();
    }

    ConnectionStateMachine::SubscriptionId ConnectionStateMachine::subscribe(Listener l) {
        std::lock_guard<std::recursive_mutex> lk(mtx_);
        SubscriptionId id = nextId_++;
        listeners_.emplace_back(id, std::move(l));
        return id;
    }

    void ConnectionStateMachine::unsubscribe(SubscriptionId id) {
        std::lock_guard<std::recursive_mutex> lk(mtx_);
        for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
            if (it->first == id) {
                listeners_.erase(it);
                return;
            }
        }
    }

    // Called with mtx_ held.
    void ConnectionStateMachine::notify(const StateChange &change) {
        if (notifying_) {
            pending_.push_back(change);
            return;
        }
        notifying_ = true;
        pending_.push_back(change);
        while (!pending_.empty()) {
            StateChange current = pending_.front();
            pending_.erase(pending_.begin());

            auto snapshot = listeners_;
            for (auto &entry : snapshot) {
                try {
                    entry.second(current);
                } catch (const std::exception &e) {
                    LOG_SESSION_ERROR("[{}] state listener #{} threw on {} -> {}: {}", label_, entry.first,
                                      connectionStateName(current.from), connectionStateName(current.to), e.what());
                } catch (...) {
                    LOG_SESSION_ERROR("[{}] state listener #{} threw a non-standard exception on {} -> {}", label_,
                                      entry.first, connectionStateName(current.from), connectionStateName(current.to));
                }
            }
        }
        notifying_ = false;
    }

} // namespace peerlink::session
