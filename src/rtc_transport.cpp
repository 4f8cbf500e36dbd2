/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/rtc_transport.hpp>
#include <peerlink/logger.hpp>

#include <cstddef>
#include <cstring>

namespace peerlink::transport {

    RtcMediaChannel::RtcMediaChannel(ChannelLabel label)
            : label_(label), inbound_(RTC_INBOUND_CAPACITY, BoundedChannel<Bytes>::Overflow::DropOldest) {}

    RtcMediaChannel::~RtcMediaChannel() {
        std::lock_guard<std::mutex> lk(mtx_);
        if (dc_) dc_->resetCallbacks();
    }

    void RtcMediaChannel::bind(std::shared_ptr<rtc::DataChannel> dc) {
        dc->onOpen([label = label_]() {
            LOG_NET_INFO("data channel '{}' open", channelLabelName(label));
        });
        dc->onClosed([label = label_]() {
            LOG_NET_INFO("data channel '{}' closed", channelLabelName(label));
        });
        dc->onMessage(
            [this](rtc::binary data) {
                Bytes bytes(data.size());
                if (!data.empty()) std::memcpy(bytes.data(), data.data(), data.size());
                inbound_.tryPush(std::move(bytes));
            },
            [this](rtc::string text) {
                inbound_.tryPush(Bytes(text.begin(), text.end()));
            });

        std::lock_guard<std::mutex> lk(mtx_);
        dc_ = std::move(dc);
    }

    bool RtcMediaChannel::isOpen() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return dc_ && dc_->isOpen();
    }

    bool RtcMediaChannel::canSend() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return dc_ && dc_->isOpen() && dc_->bufferedAmount() < RTC_SEND_HIGH_WATER;
    }

    Status RtcMediaChannel::send(const Bytes &data) {
        std::shared_ptr<rtc::DataChannel> dc;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            dc = dc_;
        }
        if (!dc || !dc->isOpen()) {
            return Status::err(ErrorKind::TransportError, fmt::format("channel '{}' is not open", channelLabelName(label_)));
        }
        try {
            dc->send(reinterpret_cast<const std::byte *>(data.data()), data.size());
        } catch (const std::exception &e) {
            return Status::err(ErrorKind::TransportError, fmt::format("send on '{}': {}", channelLabelName(label_), e.what()));
        }
        return success();
    }

    std::optional<Bytes> RtcMediaChannel::receive(std::chrono::milliseconds timeout) {
        return inbound_.pop(timeout);
    }

    void RtcMediaChannel::close() {
        std::shared_ptr<rtc::DataChannel> dc;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            dc = dc_;
        }
        if (dc) {
            try {
                dc->close();
            } catch (const std::exception &e) {
                LOG_NET_WARN("closing '{}': {}", channelLabelName(label_), e.what());
            }
        }
        inbound_.close();
    }

    // ---------------- RtcPeerTransport ----------------

    RtcPeerTransport::RtcPeerTransport(const PeerId &remote, const rtc::Configuration &cfg)
            : remote_(remote),
              pc_(std::make_shared<rtc::PeerConnection>(cfg)),
              screen_(std::make_shared<RtcMediaChannel>(ChannelLabel::Screen)),
              control_(std::make_shared<RtcMediaChannel>(ChannelLabel::Control)),
              clipboard_(std::make_shared<RtcMediaChannel>(ChannelLabel::Clipboard)) {

        pc_->onLocalDescription([this](rtc::Description d) {
            TransportEvent ev{TransportEvent::Kind::LocalDescription, std::string(d), {}, {}};
            emit(ev);
        });

        pc_->onLocalCandidate([this](rtc::Candidate c) {
            TransportEvent ev{TransportEvent::Kind::LocalCandidate, {}, {}, {}};
            ev.candidate.candidate = c.candidate();
            ev.candidate.sdpMid = c.mid();
            emit(ev);
        });

        pc_->onStateChange([this](rtc::PeerConnection::State state) {
            using S = rtc::PeerConnection::State;
            switch (state) {
                case S::Connected:
                    emit({TransportEvent::Kind::Connected, {}, {}, {}});
                    break;
                case S::Disconnected:
                    emit({TransportEvent::Kind::Disconnected, {}, {}, "ice disconnected"});
                    break;
                case S::Failed:
                    emit({TransportEvent::Kind::Failed, {}, {}, "ice failed"});
                    break;
                default:
                    break;
            }
        });

        pc_->onDataChannel([this](std::shared_ptr<rtc::DataChannel> dc) {
            wireChannel(dc);
        });
    }

    RtcPeerTransport::~RtcPeerTransport() {
        close();
    }

    void RtcPeerTransport::setEventSink(EventSink sink) {
        std::lock_guard<std::mutex> lk(sinkMtx_);
        sink_ = std::move(sink);
    }

    void RtcPeerTransport::emit(const TransportEvent &ev) {
        if (closed_.load()) return;
        EventSink sink;
        {
            std::lock_guard<std::mutex> lk(sinkMtx_);
            sink = sink_;
        }
        LOG_NET_DEBUG("[{}] transport event {}", remote_.str(), transportEventName(ev.kind));
        if (sink) sink(ev);
    }

    std::shared_ptr<RtcMediaChannel> RtcPeerTransport::channelFor(ChannelLabel l) const {
        switch (l) {
            case ChannelLabel::Screen:    return screen_;
            case ChannelLabel::Control:   return control_;
            case ChannelLabel::Clipboard: return clipboard_;
        }
        return nullptr;
    }

    void RtcPeerTransport::wireChannel(const std::shared_ptr<rtc::DataChannel> &dc) {
        auto label = channelLabelFromName(dc->label());
        if (!label) {
            LOG_NET_WARN("[{}] ignoring data channel with unknown label '{}'", remote_.str(), dc->label());
            return;
        }
        channelFor(*label)->bind(dc);
    }

    Status RtcPeerTransport::createOffer() {
        try {
            for (ChannelLabel l : {ChannelLabel::Screen, ChannelLabel::Control, ChannelLabel::Clipboard}) {
                ChannelOptions opt = channelOptionsFor(l);
                rtc::DataChannelInit init;
                init.reliability.unordered = !opt.ordered;
                if (!opt.reliable) init.reliability.maxRetransmits = 0;
                wireChannel(pc_->createDataChannel(channelLabelName(l), init));
            }
            pc_->setLocalDescription(rtc::Description::Type::Offer);
        } catch (const std::exception &e) {
            return Status::err(ErrorKind::TransportError, fmt::format("create offer: {}", e.what()));
        }
        return success();
    }

    Status RtcPeerTransport::acceptOffer(const std::string &sdp) {
        try {
            pc_->setRemoteDescription(rtc::Description(sdp, rtc::Description::Type::Offer));
        } catch (const std::invalid_argument &e) {
            return Status::err(ErrorKind::ProtocolError, fmt::format("bad offer: {}", e.what()));
        } catch (const std::exception &e) {
            return Status::err(ErrorKind::TransportError, fmt::format("apply offer: {}", e.what()));
        }
        return success();
    }

    Status RtcPeerTransport::applyAnswer(const std::string &sdp) {
        try {
            pc_->setRemoteDescription(rtc::Description(sdp, rtc::Description::Type::Answer));
        } catch (const std::invalid_argument &e) {
            return Status::err(ErrorKind::ProtocolError, fmt::format("bad answer: {}", e.what()));
        } catch (const std::exception &e) {
            return Status::err(ErrorKind::TransportError, fmt::format("apply answer: {}", e.what()));
        }
        return success();
    }

    Status RtcPeerTransport::addRemoteCandidate(const signaling::IceCandidate &candidate) {
        try {
            pc_->addRemoteCandidate(rtc::Candidate(candidate.candidate, candidate.sdpMid.value_or("")));
        } catch (const std::invalid_argument &e) {
            return Status::err(ErrorKind::ProtocolError, fmt::format("bad candidate: {}", e.what()));
        } catch (const std::exception &e) {
            return Status::err(ErrorKind::TransportError, fmt::format("add candidate: {}", e.what()));
        }
        return success();
    }

    ChannelHandles RtcPeerTransport::channels() {
        return ChannelHandles{screen_, control_, clipboard_};
    }

    void RtcPeerTransport::close() {
        if (closed_.exchange(true)) return;
        screen_->close();
        control_->close();
        clipboard_->close();
        try {
            pc_->resetCallbacks();
            pc_->close();
        } catch (const std::exception &e) {
            LOG_NET_WARN("[{}] closing peer connection: {}", remote_.str(), e.what());
        }
    }

    // ---------------- RtcPeerTransportFactory ----------------

    RtcPeerTransportFactory::RtcPeerTransportFactory(const std::vector<config::IceServer> &servers) {
        for (const auto &s : servers) {
            std::string url = s.url;
            // rtc::IceServer parses credentials embedded as scheme:user:pass@host:port
            if (!s.username.empty()) {
                auto colon = url.find(':');
                if (colon != std::string::npos) {
                    url = url.substr(0, colon + 1) + s.username + ":" + s.credential + "@" + url.substr(colon + 1);
                }
            }
            try {
                rtcConfig_.iceServers.emplace_back(url);
            } catch (const std::exception &e) {
                LOG_NET_WARN("ignoring ICE server {}: {}", s.url, e.what());
            }
        }
    }

    std::unique_ptr<PeerTransport> RtcPeerTransportFactory::create(const PeerId &remote) {
        auto t = std::make_unique<RtcPeerTransport>(remote, rtcConfig_);
        {
            std::lock_guard<std::mutex> lk(mtx_);
            live_[remote] = t->connection();
        }
        return t;
    }

    std::optional<double> RtcPeerTransportFactory::rttMs(const PeerId &remote) const {
        std::shared_ptr<rtc::PeerConnection> pc;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            auto it = live_.find(remote);
            if (it == live_.end()) return std::nullopt;
            pc = it->second.lock();
        }
        if (!pc) return std::nullopt;
        auto rtt = pc->rtt();
        if (!rtt) return std::nullopt;
        return static_cast<double>(rtt->count());
    }

} // namespace peerlink::transport
