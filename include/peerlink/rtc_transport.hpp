/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_RTC_TRANSPORT_HPP
#define PEERLINK_RTC_TRANSPORT_HPP

#pragma once

#include <peerlink/channel.hpp>
#include <peerlink/config.hpp>
#include <peerlink/transport.hpp>

#include <rtc/rtc.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace peerlink::transport {

    constexpr size_t RTC_SEND_HIGH_WATER = 1024 * 1024;  // bytes buffered in SCTP before canSend() says no
    constexpr size_t RTC_INBOUND_CAPACITY = 512;          // messages queued per channel

/**
 * @brief MediaChannel over a libdatachannel DataChannel.
 *
 * Created before the DataChannel exists (the responder learns about it from onDataChannel), bound later.
 */
    class RtcMediaChannel : public MediaChannel {
    public:
        explicit RtcMediaChannel(ChannelLabel label);
        ~RtcMediaChannel() override;

        void bind(std::shared_ptr<rtc::DataChannel> dc);

        ChannelLabel label() const override { return label_; }
        bool isOpen() const override;
        bool canSend() const override;
        Status send(const Bytes &data) override;
        std::optional<Bytes> receive(std::chrono::milliseconds timeout) override;
        void close() override;

    private:
        const ChannelLabel label_;
        mutable std::mutex mtx_;
        std::shared_ptr<rtc::DataChannel> dc_;
        BoundedChannel<Bytes> inbound_;
    };

/**
 * @brief PeerTransport backed by rtc::PeerConnection. The initiator opens the three labelled channels
 * before its offer; the responder picks them up as they arrive.
 */
    class RtcPeerTransport : public PeerTransport {
    public:
        RtcPeerTransport(const PeerId &remote, const rtc::Configuration &cfg);
        ~RtcPeerTransport() override;

        void setEventSink(EventSink sink) override;
        Status createOffer() override;
        Status acceptOffer(const std::string &sdp) override;
        Status applyAnswer(const std::string &sdp) override;
        Status addRemoteCandidate(const signaling::IceCandidate &candidate) override;
        ChannelHandles channels() override;
        void close() override;

        std::shared_ptr<rtc::PeerConnection> connection() const { return pc_; }

    private:
        void emit(const TransportEvent &ev);
        void wireChannel(const std::shared_ptr<rtc::DataChannel> &dc);
        std::shared_ptr<RtcMediaChannel> channelFor(ChannelLabel l) const;

        PeerId remote_;
        std::shared_ptr<rtc::PeerConnection> pc_;
        std::shared_ptr<RtcMediaChannel> screen_;
        std::shared_ptr<RtcMediaChannel> control_;
        std::shared_ptr<RtcMediaChannel> clipboard_;

        std::mutex sinkMtx_;
        EventSink sink_;
        std::atomic<bool> closed_{false};
    };

    class RtcPeerTransportFactory : public PeerTransportFactory {
    public:
        explicit RtcPeerTransportFactory(const std::vector<config::IceServer> &servers);

        std::unique_ptr<PeerTransport> create(const PeerId &remote) override;

        /// Round-trip time of the live connection to `remote`, if the ICE transport has measured one.
        std::optional<double> rttMs(const PeerId &remote) const;

    private:
        rtc::Configuration rtcConfig_;
        mutable std::mutex mtx_;
        std::map<PeerId, std::weak_ptr<rtc::PeerConnection>> live_;
    };

} // namespace peerlink::transport

#endif // PEERLINK_RTC_TRANSPORT_HPP
