/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_SIGNALING_CLIENT_HPP
#define PEERLINK_SIGNALING_CLIENT_HPP

#pragma once

#include <peerlink/channel.hpp>
#include <peerlink/errors.hpp>
#include <peerlink/peer.hpp>
#include <peerlink/signaling_message.hpp>
#include <peerlink/signaling_transport.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>

namespace peerlink::signaling {

/**
 * @brief Bounded exponential backoff. delayFor(n) is the wait after the n-th failed attempt (1-based).
 */
    struct BackoffPolicy {
        std::chrono::milliseconds base{1000};
        double factor{2.0};
        std::chrono::milliseconds cap{32000};
        int maxAttempts{5};

        std::chrono::milliseconds delayFor(int attempt) const;
    };

    enum class LinkState {
        Disconnected,
        Connecting,
        Connected,
        Reconnecting,
        Failed,
        Closed
    };

    const char *linkStateName(LinkState s);

    struct SignalingClientConfig {
        BackoffPolicy backoff;
        size_t inboundCapacity{256};
        size_t outboundCapacity{256};
        std::chrono::milliseconds pollInterval{200};
        std::chrono::milliseconds enqueueTimeout{1000};
        int maxConsecutiveSendFailures{3};
    };

/**
 * @brief Reported when the client gives up. `peer` is set when repeated sends to one peer failed,
 * empty when the rendezvous link itself could not be restored.
 */
    struct SignalingFailure {
        Error error;
        std::optional<PeerId> peer;
    };

    using InboundStream = std::shared_ptr<BoundedChannel<SignalingMessage>>;

/**
 * @brief Persistent connection to the rendezvous service.
 *
 * Runs two tasks once connected: a receive-loop (decode, auto-reply to Ping, reconnect on drop) and a
 * send-loop draining the outbound queue. Malformed inbound messages are logged and dropped.
 */
    class SignalingClient {
    public:
        using FailureHandler = std::function<void(const SignalingFailure&)>;

        SignalingClient(PeerId self, std::unique_ptr<SignalingTransport> transport, SignalingClientConfig cfg = {});
        ~SignalingClient();

        SignalingClient(const SignalingClient&) = delete;
        SignalingClient& operator=(const SignalingClient&) = delete;

        /// Open the link (with backoff) and return the inbound message stream.
        Result<InboundStream> connect();

        /// Queue a message. TransportError if the client is closed or failed.
        Status send(SignalingMessage msg);

        Status listPeers();
        Status requestConnection(const PeerId &peer);
        Status acceptConnection(const PeerId &peer, const std::string &sessionId);
        Status rejectConnection(const PeerId &peer, const std::string &reason);
        Status sendOffer(const PeerId &peer, const std::string &sdp);
        Status sendAnswer(const PeerId &peer, const std::string &sdp);
        Status sendIceCandidate(const PeerId &peer, const IceCandidate &candidate);

        void setFailureHandler(FailureHandler handler);

        /// Stop both loops, close the link and the inbound stream. Safe to call more than once.
        void close();

        LinkState linkState() const;
        const PeerId &localPeer() const { return self_; }

        /// Device name/type announced with every ListPeers.
        void setLocalInfo(PeerInfo info);

    private:
        bool openWithBackoff();
        bool waitInterruptible(std::chrono::milliseconds d);
        bool waitForLink();
        void setLinkState(LinkState s);

        void receiveLoop();
        void sendLoop();
        void handleInbound(const std::string &line);
        void reportFailure(const SignalingFailure &f);

        PeerId self_;
        std::mutex infoMtx_;
        std::optional<PeerInfo> localInfo_;
        std::unique_ptr<SignalingTransport> transport_;
        SignalingClientConfig cfg_;

        mutable std::mutex stateMtx_;
        std::condition_variable stateCv_;
        LinkState state_{LinkState::Disconnected};
        std::atomic<bool> stopping_{false};

        InboundStream inbound_;
        std::shared_ptr<BoundedChannel<SignalingMessage>> outbound_;

        std::thread receiveThread_;
        std::thread sendThread_;

        std::mutex handlerMtx_;
        FailureHandler failureHandler_;

        std::unordered_map<PeerId, int, PeerIdHash> sendFailures_; // send-loop only
    };

} // namespace peerlink::signaling

#endif // PEERLINK_SIGNALING_CLIENT_HPP
