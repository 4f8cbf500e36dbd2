/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_SESSION_MANAGER_HPP
#define PEERLINK_SESSION_MANAGER_HPP

#pragma once

#include <peerlink/channel.hpp>
#include <peerlink/connection_state.hpp>
#include <peerlink/errors.hpp>
#include <peerlink/peer.hpp>
#include <peerlink/signaling_client.hpp>
#include <peerlink/signaling_message.hpp>
#include <peerlink/transport.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <variant>
#include <vector>

namespace peerlink::session {

    enum class SessionRole {
        Initiator,
        Responder
    };

    const char *sessionRoleName(SessionRole r);

/**
 * @brief One negotiated (or negotiating) connection with a remote peer. Owned by SessionManager.
 */
    struct Session {
        PeerId local;
        PeerId remote;
        SessionRole role{SessionRole::Initiator};
        std::string sessionId;
        std::chrono::system_clock::time_point createdAt;
        uint64_t generation{0};

        std::unique_ptr<ConnectionStateMachine> state;
        std::unique_ptr<transport::PeerTransport> transport;
        transport::ChannelHandles channels;

        bool remoteDescriptionApplied{false};
        std::vector<signaling::IceCandidate> pendingCandidates; // arrived before the remote description
        int remoteCandidates{0};
        int localCandidates{0};
        int sendFailures{0};
        std::chrono::steady_clock::time_point reconnectingSince;
    };

    /// Read-only copy of a Session for callers outside the coordinator task.
    struct SessionSnapshot {
        PeerId remote;
        SessionRole role;
        std::string sessionId;
        ConnectionState state;
        std::string reason;
        std::chrono::system_clock::time_point createdAt;
        int remoteCandidates;
        int localCandidates;
    };

    struct SessionManagerConfig {
        size_t eventCapacity{256};
        std::chrono::milliseconds reconnectTimeout{15000};
        int maxSendFailures{3};
        std::chrono::milliseconds pollInterval{100};
    };

/**
 * @brief Hooks for the host application. Called from the coordinator task.
 *
 * onStateChange runs synchronously at the state-transition point of the session.
 */
    class SessionObserver {
    public:
        virtual ~SessionObserver() = default;

        virtual void onStateChange(const PeerId &peer, const StateChange &change) { (void)peer; (void)change; }
        virtual void onSessionConnected(const PeerId &peer, const transport::ChannelHandles &channels) { (void)peer; (void)channels; }
        virtual void onSessionEnded(const PeerId &peer, ConnectionState finalState, const std::string &reason) { (void)peer; (void)finalState; (void)reason; }
        virtual void onPeersChanged(const std::vector<PeerInfo> &peers) { (void)peers; }
    };

    struct SignalingEvent { signaling::SignalingMessage message; };
    struct TransportEventFor { PeerId peer; uint64_t generation; transport::TransportEvent event; };
    struct ConnectCommand { PeerId peer; };
    struct CloseCommand { PeerId peer; std::string reason; };
    struct RetryCommand { PeerId peer; };
    struct SignalingFailureEvent { signaling::SignalingFailure failure; };

    using SessionEvent = std::variant<SignalingEvent, TransportEventFor, ConnectCommand, CloseCommand, RetryCommand,
            SignalingFailureEvent>;

/**
 * @brief Coordinator owning the PeerId -> Session table.
 *
 * Every mutation of the table goes through the event queue and is applied by one task: either the thread
 * started by start(), or the caller of runOnce() (used by tests). Other threads only post events or read
 * snapshots.
 */
    class SessionManager {
    public:
        using SignalingSender = std::function<Status(const signaling::SignalingMessage&)>;
        /// Return false (and fill reason) to reject an incoming connection request.
        using AcceptPolicy = std::function<bool(const PeerId &peer, std::string &reason)>;

        SessionManager(PeerId self, SignalingSender sender, std::shared_ptr<transport::PeerTransportFactory> factory,
                       SessionManagerConfig cfg = {});
        ~SessionManager();

        SessionManager(const SessionManager&) = delete;
        SessionManager& operator=(const SessionManager&) = delete;

        void setObserver(std::shared_ptr<SessionObserver> observer);
        void setAcceptPolicy(AcceptPolicy policy);

        bool post(SessionEvent ev);
        bool connectTo(const PeerId &peer);
        bool closeSession(const PeerId &peer, const std::string &reason = "closed by user");
        bool retry(const PeerId &peer);
        void handleSignalingFailure(const signaling::SignalingFailure &failure);

        /// Forward an inbound signaling stream into the event queue on a dedicated task.
        void attachSignaling(signaling::InboundStream inbound);

        /// Process at most one event, then run housekeeping. Returns true if an event was handled.
        bool runOnce(std::chrono::milliseconds timeout);

        void start();

        /// Stop the tasks and close every session.
        void stop();

        std::optional<SessionSnapshot> session(const PeerId &peer) const;
        std::vector<SessionSnapshot> sessions() const;
        std::vector<PeerInfo> knownPeers() const;
        const PeerId &localPeer() const { return self_; }

    private:
        struct Dispatch;

        Session *find(const PeerId &peer);
        Session *createSession(const PeerId &peer, SessionRole role);
        void eraseSession(const PeerId &peer);
        bool ensureTransport(Session &s);
        void sendTo(Session &s, signaling::Payload payload);
        void failSession(Session &s, const std::string &reason);
        void closeSessionNow(Session &s, const std::string &reason);
        void applyRemoteCandidate(Session &s, const signaling::IceCandidate &c);
        void housekeeping();

        void onConnect(const PeerId &peer);
        void onClose(const CloseCommand &cmd);
        void onRetry(const PeerId &peer);
        void onSignaling(const signaling::SignalingMessage &msg);
        void onTransport(const TransportEventFor &ev);
        void onSignalingFailure(const signaling::SignalingFailure &failure);

        void onConnectionRequest(const signaling::SignalingMessage &msg);
        void onConnectionAccepted(const signaling::SignalingMessage &msg, const signaling::ConnectionAccepted &acc);
        void onOffer(const signaling::SignalingMessage &msg, const signaling::Offer &offer);
        void onAnswer(const signaling::SignalingMessage &msg, const signaling::Answer &answer);
        void onIceCandidate(const signaling::SignalingMessage &msg, const signaling::IceCandidate &cand);
        void onPeerLeft(const PeerId &peer);

        PeerId self_;
        SignalingSender sender_;
        std::shared_ptr<transport::PeerTransportFactory> factory_;
        SessionManagerConfig cfg_;

        std::shared_ptr<SessionObserver> observer_;
        AcceptPolicy acceptPolicy_;

        BoundedChannel<SessionEvent> events_;

        mutable std::mutex tableMtx_; // guards sessions_, peers_ and the Session fields snapshots copy
        std::unordered_map<PeerId, std::unique_ptr<Session>, PeerIdHash> sessions_;
        std::vector<PeerInfo> peers_;
        uint64_t nextGeneration_{1};

        std::atomic<bool> running_{false};
        std::thread coordinatorThread_;
        std::thread pumpThread_;
        signaling::InboundStream inbound_;
    };

} // namespace peerlink::session

#endif // PEERLINK_SESSION_MANAGER_HPP
