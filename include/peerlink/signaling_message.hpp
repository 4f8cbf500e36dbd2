/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_SIGNALING_MESSAGE_HPP
#define PEERLINK_SIGNALING_MESSAGE_HPP

#pragma once

#include <peerlink/errors.hpp>
#include <peerlink/peer.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace peerlink::signaling {

    struct Offer { std::string sdp; };
    struct Answer { std::string sdp; };

    struct IceCandidate {
        std::string candidate;
        std::optional<std::string> sdpMid;
        std::optional<uint16_t> sdpMLineIndex;
    };

    /// `self` (wire key "peer") optionally describes the sender to the rendezvous directory.
    struct ListPeers { std::optional<PeerInfo> self; };
    struct PeerList { std::vector<PeerInfo> peers; };
    struct PeerJoined { PeerInfo peer; };
    struct PeerLeft { PeerId peer; };
    struct ConnectionRequest {};
    struct ConnectionAccepted { std::string sessionId; };
    struct ConnectionRejected { std::string reason; };
    struct Ping {};
    struct Pong {};
    struct ErrorNotice { std::string message; };

    using Payload = std::variant<Offer, Answer, IceCandidate, ListPeers, PeerList, PeerJoined, PeerLeft,
            ConnectionRequest, ConnectionAccepted, ConnectionRejected, Ping, Pong, ErrorNotice>;

    enum class MessageType {
        Offer,
        Answer,
        IceCandidate,
        ListPeers,
        PeerList,
        PeerJoined,
        PeerLeft,
        ConnectionRequest,
        ConnectionAccepted,
        ConnectionRejected,
        Ping,
        Pong,
        Error
    };

    /// Wire name of a message type ("Offer", "IceCandidate", ...).
    const char *messageTypeName(MessageType t);

/**
 * @brief One signaling message. Every kind carries from/to; messages addressed to the rendezvous service
 * itself (ListPeers, Ping) leave `to` empty.
 */
    struct SignalingMessage {
        PeerId from;
        PeerId to;
        Payload payload;

        MessageType type() const { return static_cast<MessageType>(payload.index()); }
        const char *typeName() const { return messageTypeName(type()); }

        template <typename T>
        const T *as() const { return std::get_if<T>(&payload); }
    };

    SignalingMessage makeMessage(const PeerId &from, const PeerId &to, Payload payload);

    /// Serialize to a single-line JSON document (no trailing newline).
    std::string encode(const SignalingMessage &msg);

    /// Parse one JSON document. Unknown "type", missing fields or bad JSON become ProtocolError.
    Result<SignalingMessage> decode(const std::string &text);

} // namespace peerlink::signaling

#endif // PEERLINK_SIGNALING_MESSAGE_HPP
