/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/signaling_client.hpp>
#include <peerlink/logger.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <cmath>

namespace peerlink::signaling {

    std::chrono::milliseconds BackoffPolicy::delayFor(int attempt) const {
        if (attempt < 1) attempt = 1;
        double d = (double)base.count() * std::pow(factor, (double)(attempt - 1));
        double capped = std::min(d, (double)cap.count());
        return std::chrono::milliseconds((int64_t)capped);
    }

    const char *linkStateName(LinkState s) {
        switch (s) {
            case LinkState::Disconnected: return "Disconnected";
            case LinkState::Connecting:   return "Connecting";
            case LinkState::Connected:    return "Connected";
            case LinkState::Reconnecting: return "Reconnecting";
            case LinkState::Failed:       return "Failed";
            case LinkState::Closed:       return "Closed";
        }
        return "Unknown";
    }

    SignalingClient::SignalingClient(PeerId self, std::unique_ptr<SignalingTransport> transport, SignalingClientConfig cfg)
            : self_(std::move(self)), transport_(std::move(transport)), cfg_(cfg) {}

    SignalingClient::~SignalingClient() {
        close();
    }

    LinkState SignalingClient::linkState() const {
        std::lock_guard<std::mutex> lk(stateMtx_);
        return state_;
    }

    void SignalingClient::setLinkState(LinkState s) {
        LinkState prev;
        {
            std::lock_guard<std::mutex> lk(stateMtx_);
            prev = state_;
            state_ = s;
        }
        stateCv_.notify_all();
        if (prev != s) {
            LOG_SIG_DEBUG("link {} -> {}", linkStateName(prev), linkStateName(s));
        }
    }

    void SignalingClient::setFailureHandler(FailureHandler handler) {
        std::lock_guard<std::mutex> lk(handlerMtx_);
        failureHandler_ = std::move(handler);
    }

    void SignalingClient::reportFailure(const SignalingFailure &f) {
        FailureHandler h;
        {
            std::lock_guard<std::mutex> lk(handlerMtx_);
            h = failureHandler_;
        }
        if (!h) return;
        try {
            h(f);
        } catch (const std::exception &e) {
            LOG_SIG_ERROR("failure handler threw: {}", e.what());
        }
    }

    bool SignalingClient::waitInterruptible(std::chrono::milliseconds d) {
        std::unique_lock<std::mutex> lk(stateMtx_);
        stateCv_.wait_for(lk, d, [this] { return stopping_.load(); });
        return !stopping_.load();
    }

    bool SignalingClient::openWithBackoff() {
        for (int attempt = 1; attempt <= cfg_.backoff.maxAttempts; ++attempt) {
            if (stopping_.load()) return false;
            Status st = transport_->open();
            if (st) {
                LOG_SIG_INFO("Connected to rendezvous {} (attempt {})", transport_->describe(), attempt);
                return true;
            }
            if (attempt == cfg_.backoff.maxAttempts) {
                LOG_SIG_ERROR("Giving up on {} after {} attempts: {}", transport_->describe(), attempt, st.error().message);
                break;
            }
            auto delay = cfg_.backoff.delayFor(attempt);
            LOG_SIG_WARN("Attempt {}/{} to {} failed ({}), retrying in {} ms", attempt, cfg_.backoff.maxAttempts,
                         transport_->describe(), st.error().message, delay.count());
            if (!waitInterruptible(delay)) return false;
        }
        return false;
    }

    Result<InboundStream> SignalingClient::connect() {
        {
            std::lock_guard<std::mutex> lk(stateMtx_);
            if (state_ == LinkState::Connected || state_ == LinkState::Reconnecting) return inbound_;
            if (state_ == LinkState::Closed) {
                return Result<InboundStream>::err(ErrorKind::TransportError, "signaling client is closed");
            }
        }

        // restart after a previous failure
        if (receiveThread_.joinable()) receiveThread_.join();
        if (sendThread_.joinable()) sendThread_.join();

        stopping_.store(false);
        setLinkState(LinkState::Connecting);
        if (!openWithBackoff()) {
            setLinkState(LinkState::Failed);
            return Result<InboundStream>::err(ErrorKind::TransportError,
                                              fmt::format("cannot reach rendezvous {} after {} attempts",
                                                          transport_->describe(), cfg_.backoff.maxAttempts));
        }

        inbound_ = std::make_shared<BoundedChannel<SignalingMessage>>(cfg_.inboundCapacity);
        outbound_ = std::make_shared<BoundedChannel<SignalingMessage>>(cfg_.outboundCapacity);
        sendFailures_.clear();
        setLinkState(LinkState::Connected);

        receiveThread_ = std::thread([this]() { receiveLoop(); });
        sendThread_ = std::thread([this]() { sendLoop(); });

        // announces us to the rendezvous service and fetches the current directory
        Status st = listPeers();
        if (!st) {
            LOG_SIG_WARN("initial ListPeers not queued: {}", st.error().message);
        }
        return inbound_;
    }

    Status SignalingClient::send(SignalingMessage msg) {
        LinkState s = linkState();
        auto out = outbound_;
        if (!out || s == LinkState::Failed || s == LinkState::Closed || s == LinkState::Disconnected) {
            return Status::err(ErrorKind::TransportError,
                               fmt::format("signaling channel is closed ({})", linkStateName(s)));
        }
        if (msg.from.empty()) msg.from = self_;
        std::string type = msg.typeName();
        if (!out->push(std::move(msg), cfg_.enqueueTimeout)) {
            return Status::err(ErrorKind::TransportError,
                               out->closed() ? "signaling channel is closed" : "signaling outbound queue is full");
        }
        LOG_SIG_TRACE("queued {}", type);
        return success();
    }

    void SignalingClient::setLocalInfo(PeerInfo info) {
        std::lock_guard<std::mutex> lk(infoMtx_);
        info.id = self_;
        localInfo_ = std::move(info);
    }

    Status SignalingClient::listPeers() {
        ListPeers req;
        {
            std::lock_guard<std::mutex> lk(infoMtx_);
            req.self = localInfo_;
        }
        return send(makeMessage(self_, PeerId(), std::move(req)));
    }

    Status SignalingClient::requestConnection(const PeerId &peer) {
        return send(makeMessage(self_, peer, ConnectionRequest{}));
    }

    Status SignalingClient::acceptConnection(const PeerId &peer, const std::string &sessionId) {
        return send(makeMessage(self_, peer, ConnectionAccepted{sessionId}));
    }

    Status SignalingClient::rejectConnection(const PeerId &peer, const std::string &reason) {
        return send(makeMessage(self_, peer, ConnectionRejected{reason}));
    }

    Status SignalingClient::sendOffer(const PeerId &peer, const std::string &sdp) {
        return send(makeMessage(self_, peer, Offer{sdp}));
    }

    Status SignalingClient::sendAnswer(const PeerId &peer, const std::string &sdp) {
        return send(makeMessage(self_, peer, Answer{sdp}));
    }

    Status SignalingClient::sendIceCandidate(const PeerId &peer, const IceCandidate &candidate) {
        return send(makeMessage(self_, peer, candidate));
    }

    void SignalingClient::handleInbound(const std::string &line) {
        if (line.empty()) return;
        auto decoded = decode(line);
        if (!decoded) {
            LOG_SIG_WARN("Dropping malformed signaling message: {}", decoded.error().message);
            return;
        }
        SignalingMessage msg = decoded.takeValue();
        LOG_SIG_DEBUG("received {} from '{}'", msg.typeName(), msg.from.str());

        if (msg.as<Ping>()) {
            auto out = outbound_;
            if (out && !out->tryPush(makeMessage(self_, msg.from, Pong{}))) {
                LOG_SIG_WARN("outbound queue full, Pong dropped");
            }
            return;
        }

        if (!inbound_->push(std::move(msg), cfg_.enqueueTimeout)) {
            if (!inbound_->closed()) LOG_SIG_WARN("inbound queue full, signaling message dropped");
        }
    }

    void SignalingClient::receiveLoop() {
        LOG_SIG_INFO("signaling receive-loop started");
        std::string line;
        while (!stopping_.load()) {
            ReceiveStatus rs = transport_->receiveText(line, cfg_.pollInterval);
            if (rs == ReceiveStatus::Message) {
                handleInbound(line);
                continue;
            }
            if (rs == ReceiveStatus::Timeout) continue;
            if (stopping_.load()) break;

            LOG_SIG_WARN("Rendezvous link lost, reconnecting");
            setLinkState(LinkState::Reconnecting);
            transport_->close();
            if (openWithBackoff()) {
                setLinkState(LinkState::Connected);
                Status st = listPeers();
                if (!st) LOG_SIG_WARN("re-registration not queued: {}", st.error().message);
                continue;
            }
            if (stopping_.load()) break;

            setLinkState(LinkState::Failed);
            outbound_->close();
            inbound_->close();
            reportFailure(SignalingFailure{
                    makeError(ErrorKind::TransportError,
                              fmt::format("rendezvous {} unreachable after {} attempts", transport_->describe(),
                                          cfg_.backoff.maxAttempts)),
                    std::nullopt});
            break;
        }
        LOG_SIG_INFO("signaling receive-loop exiting");
    }

    bool SignalingClient::waitForLink() {
        std::unique_lock<std::mutex> lk(stateMtx_);
        stateCv_.wait(lk, [this] {
            return stopping_.load() || state_ == LinkState::Connected || state_ == LinkState::Failed;
        });
        return !stopping_.load() && state_ == LinkState::Connected;
    }

    void SignalingClient::sendLoop() {
        LOG_SIG_INFO("signaling send-loop started");
        auto out = outbound_;
        while (!stopping_.load()) {
            auto msg = out->pop(cfg_.pollInterval);
            if (!msg) {
                if (out->closed()) break;
                continue;
            }
            if (!waitForLink()) {
                LOG_SIG_DEBUG("link down, {} discarded", msg->typeName());
                if (linkState() == LinkState::Failed) break;
                continue;
            }

            Status st = transport_->sendText(encode(*msg));
            if (st) {
                if (!msg->to.empty()) sendFailures_.erase(msg->to);
                LOG_SIG_TRACE("sent {} to '{}'", msg->typeName(), msg->to.str());
                continue;
            }

            LOG_SIG_WARN("send of {} to '{}' failed: {}", msg->typeName(), msg->to.str(), st.error().message);
            if (msg->to.empty()) continue;
            int &count = sendFailures_[msg->to];
            if (++count >= cfg_.maxConsecutiveSendFailures) {
                sendFailures_.erase(msg->to);
                reportFailure(SignalingFailure{
                        makeError(ErrorKind::TransportError,
                                  fmt::format("{} consecutive signaling sends failed", cfg_.maxConsecutiveSendFailures)),
                        msg->to});
            }
        }
        LOG_SIG_INFO("signaling send-loop exiting");
    }

    void SignalingClient::close() {
        {
            // under the lock, so a waiter between its predicate check and its block still sees it
            std::lock_guard<std::mutex> lk(stateMtx_);
            stopping_.store(true);
        }
        stateCv_.notify_all();
        transport_->close();
        if (outbound_) outbound_->close();
        if (inbound_) inbound_->close();

        for (std::thread *t : {&receiveThread_, &sendThread_}) {
            if (!t->joinable()) continue;
            if (t->get_id() == std::this_thread::get_id()) t->detach();
            else t->join();
        }

        std::lock_guard<std::mutex> lk(stateMtx_);
        if (state_ != LinkState::Closed) {
            state_ = LinkState::Closed;
            LOG_SIG_INFO("signaling client closed");
        }
    }

} // namespace peerlink::signaling
