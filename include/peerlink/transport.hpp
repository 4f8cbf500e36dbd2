/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_TRANSPORT_HPP
#define PEERLINK_TRANSPORT_HPP

#pragma once

#include <peerlink/errors.hpp>
#include <peerlink/peer.hpp>
#include <peerlink/signaling_message.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace peerlink::transport {

    using Bytes = std::vector<uint8_t>;

    enum class ChannelLabel {
        Screen,
        Control,
        Clipboard
    };

    /// "screen", "control", "clipboard".
    const char *channelLabelName(ChannelLabel l);

    /// Accepts the names above plus "input" as an alias of control.
    std::optional<ChannelLabel> channelLabelFromName(const std::string &name);

    struct ChannelOptions {
        bool reliable;
        bool ordered;
    };

    /// screen: unreliable/unordered, control: reliable/ordered, clipboard: reliable/unordered.
    ChannelOptions channelOptionsFor(ChannelLabel l);

/**
 * @brief One logical channel of the opaque encrypted peer connection.
 */
    class MediaChannel {
    public:
        virtual ~MediaChannel() = default;

        virtual ChannelLabel label() const = 0;
        virtual bool isOpen() const = 0;

        /// False while the underlying buffer is above its high-water mark.
        virtual bool canSend() const = 0;

        virtual Status send(const Bytes &data) = 0;

        /// Next inbound message, or nullopt on timeout / closed channel.
        virtual std::optional<Bytes> receive(std::chrono::milliseconds timeout) = 0;

        virtual void close() = 0;
    };

    struct ChannelHandles {
        std::shared_ptr<MediaChannel> screen;
        std::shared_ptr<MediaChannel> control;
        std::shared_ptr<MediaChannel> clipboard;
    };

    struct TransportEvent {
        enum class Kind {
            LocalDescription, // sdp holds our offer or answer
            LocalCandidate,   // candidate holds a trickled local ICE candidate
            Connected,
            Disconnected,
            Failed
        };

        Kind kind;
        std::string sdp;
        signaling::IceCandidate candidate;
        std::string reason;
    };

    const char *transportEventName(TransportEvent::Kind k);

/**
 * @brief Peer connection as seen by the session coordinator.
 *
 * Negotiation results are delivered asynchronously through the event sink (which may be invoked from any
 * thread); the coordinator only ever calls into the transport from its own task.
 */
    class PeerTransport {
    public:
        using EventSink = std::function<void(const TransportEvent&)>;

        virtual ~PeerTransport() = default;

        virtual void setEventSink(EventSink sink) = 0;

        /// Initiator: produce an offer (LocalDescription event).
        virtual Status createOffer() = 0;

        /// Responder: apply the remote offer and produce an answer (LocalDescription event).
        virtual Status acceptOffer(const std::string &sdp) = 0;

        /// Initiator: apply the remote answer.
        virtual Status applyAnswer(const std::string &sdp) = 0;

        virtual Status addRemoteCandidate(const signaling::IceCandidate &candidate) = 0;

        virtual ChannelHandles channels() = 0;

        virtual void close() = 0;
    };

    class PeerTransportFactory {
    public:
        virtual ~PeerTransportFactory() = default;

        virtual std::unique_ptr<PeerTransport> create(const PeerId &remote) = 0;
    };

} // namespace peerlink::transport

#endif // PEERLINK_TRANSPORT_HPP
