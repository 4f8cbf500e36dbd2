/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/session_manager.hpp>
#include <peerlink/logger.hpp>

#include <fmt/core.h>

#include <algorithm>

namespace peerlink::session {

    using signaling::SignalingMessage;
    using transport::TransportEvent;

    const char *sessionRoleName(SessionRole r) {
        return r == SessionRole::Initiator ? "initiator" : "responder";
    }

    namespace {

        bool isNegotiating(ConnectionState s) {
            return s == ConnectionState::Disconnected || s == ConnectionState::Connecting ||
                   s == ConnectionState::SignalingConnected || s == ConnectionState::GatheringCandidates;
        }

        bool isLive(ConnectionState s) {
            return s != ConnectionState::Closed && s != ConnectionState::Failed;
        }

    } // namespace

    struct SessionManager::Dispatch {
        SessionManager &m;

        void operator()(const SignalingEvent &e) const { m.onSignaling(e.message); }
        void operator()(const TransportEventFor &e) const { m.onTransport(e); }
        void operator()(const ConnectCommand &e) const { m.onConnect(e.peer); }
        void operator()(const CloseCommand &e) const { m.onClose(e); }
        void operator()(const RetryCommand &e) const { m.onRetry(e.peer); }
        void operator()(const SignalingFailureEvent &e) const { m.onSignalingFailure(e.failure); }
    };

    SessionManager::SessionManager(PeerId self, SignalingSender sender,
                                   std::shared_ptr<transport::PeerTransportFactory> factory, SessionManagerConfig cfg)
            : self_(std::move(self)), sender_(std::move(sender)), factory_(std::move(factory)), cfg_(cfg),
              events_(cfg.eventCapacity) {}

    SessionManager::~SessionManager() {
        stop();
    }

    void SessionManager::setObserver(std::shared_ptr<SessionObserver> observer) {
        observer_ = std::move(observer);
    }

    void SessionManager::setAcceptPolicy(AcceptPolicy policy) {
        acceptPolicy_ = std::move(policy);
    }

    bool SessionManager::post(SessionEvent ev) {
        if (!events_.push(std::move(ev), std::chrono::milliseconds(1000))) {
            LOG_SESSION_ERROR("event queue full or closed, event dropped");
            return false;
        }
        return true;
    }

    bool SessionManager::connectTo(const PeerId &peer) { return post(ConnectCommand{peer}); }

    bool SessionManager::closeSession(const PeerId &peer, const std::string &reason) {
        return post(CloseCommand{peer, reason});
    }

    bool SessionManager::retry(const PeerId &peer) { return post(RetryCommand{peer}); }

    void SessionManager::handleSignalingFailure(const signaling::SignalingFailure &failure) {
        post(SignalingFailureEvent{failure});
    }

    void SessionManager::attachSignaling(signaling::InboundStream inbound) {
        if (pumpThread_.joinable()) {
            LOG_SESSION_WARN("signaling stream already attached");
            return;
        }
        inbound_ = inbound;
        running_.store(true);
        pumpThread_ = std::thread([this, inbound]() {
            LOG_SESSION_DEBUG("signaling pump started");
            while (running_.load()) {
                auto msg = inbound->pop(cfg_.pollInterval);
                if (!msg) {
                    if (inbound->closed()) break;
                    continue;
                }
                post(SignalingEvent{std::move(*msg)});
            }
            LOG_SESSION_DEBUG("signaling pump exiting");
        });
    }

    bool SessionManager::runOnce(std::chrono::milliseconds timeout) {
        auto ev = events_.pop(timeout);
        if (ev) {
            std::visit(Dispatch{*this}, *ev);
        }
        housekeeping();
        return ev.has_value();
    }

    void SessionManager::start() {
        if (coordinatorThread_.joinable()) return;
        running_.store(true);
        coordinatorThread_ = std::thread([this]() {
            LOG_SESSION_INFO("session coordinator started for {}", self_.str());
            while (running_.load()) {
                runOnce(cfg_.pollInterval);
            }
            LOG_SESSION_INFO("session coordinator exiting");
        });
    }

    void SessionManager::stop() {
        running_.store(false);
        if (inbound_) inbound_->close();
        if (pumpThread_.joinable()) pumpThread_.join();
        if (coordinatorThread_.joinable()) coordinatorThread_.join();

        // teardown: every remaining session is closed, then destroyed
        std::vector<PeerId> peers;
        for (auto &kv : sessions_) peers.push_back(kv.first);
        for (auto &p : peers) {
            Session *s = find(p);
            if (s) closeSessionNow(*s, "shutdown");
        }
    }

    std::optional<SessionSnapshot> SessionManager::session(const PeerId &peer) const {
        std::lock_guard<std::mutex> lk(tableMtx_);
        auto it = sessions_.find(peer);
        if (it == sessions_.end()) return std::nullopt;
        const Session &s = *it->second;
        return SessionSnapshot{s.remote, s.role, s.sessionId, s.state->state(), s.state->failureReason(),
                               s.createdAt, s.remoteCandidates, s.localCandidates};
    }

    std::vector<SessionSnapshot> SessionManager::sessions() const {
        std::lock_guard<std::mutex> lk(tableMtx_);
        std::vector<SessionSnapshot> out;
        for (const auto &kv : sessions_) {
            const Session &s = *kv.second;
            out.push_back(SessionSnapshot{s.remote, s.role, s.sessionId, s.state->state(), s.state->failureReason(),
                                          s.createdAt, s.remoteCandidates, s.localCandidates});
        }
        return out;
    }

    std::vector<PeerInfo> SessionManager::knownPeers() const {
        std::lock_guard<std::mutex> lk(tableMtx_);
        return peers_;
    }

    Session *SessionManager::find(const PeerId &peer) {
        auto it = sessions_.find(peer);
        return it == sessions_.end() ? nullptr : it->second.get();
    }

    Session *SessionManager::createSession(const PeerId &peer, SessionRole role) {
        auto s = std::make_unique<Session>();
        s->local = self_;
        s->remote = peer;
        s->role = role;
        s->createdAt = std::chrono::system_clock::now();
        s->generation = nextGeneration_++;
        s->state = std::make_unique<ConnectionStateMachine>(peer.str().substr(0, 8));

        std::weak_ptr<SessionObserver> weakObs = observer_;
        s->state->subscribe([weakObs, peer](const StateChange &change) {
            if (auto obs = weakObs.lock()) obs->onStateChange(peer, change);
        });

        Session *raw = s.get();
        {
            std::lock_guard<std::mutex> lk(tableMtx_);
            sessions_[peer] = std::move(s);
        }
        LOG_SESSION_INFO("new {} session with {}", sessionRoleName(role), peer.str());
        return raw;
    }

    void SessionManager::eraseSession(const PeerId &peer) {
        std::unique_ptr<Session> victim;
        {
            std::lock_guard<std::mutex> lk(tableMtx_);
            auto it = sessions_.find(peer);
            if (it == sessions_.end()) return;
            victim = std::move(it->second);
            sessions_.erase(it);
        }
        if (victim->transport) victim->transport->close();
    }

    bool SessionManager::ensureTransport(Session &s) {
        if (s.transport) return true;
        if (!factory_) {
            failSession(s, "no peer transport available");
            return false;
        }
        s.transport = factory_->create(s.remote);
        if (!s.transport) {
            failSession(s, "peer transport could not be created");
            return false;
        }
        PeerId peer = s.remote;
        uint64_t gen = s.generation;
        s.transport->setEventSink([this, peer, gen](const TransportEvent &ev) {
            post(TransportEventFor{peer, gen, ev});
        });
        return true;
    }

    void SessionManager::sendTo(Session &s, signaling::Payload payload) {
        SignalingMessage msg = signaling::makeMessage(self_, s.remote, std::move(payload));
        Status st = sender_ ? sender_(msg) : Status::err(ErrorKind::TransportError, "no signaling sender");
        if (st) {
            s.sendFailures = 0;
            return;
        }
        ++s.sendFailures;
        LOG_SESSION_WARN("signaling {} to {} failed ({}/{}): {}", msg.typeName(), s.remote.str(), s.sendFailures,
                         cfg_.maxSendFailures, st.error().message);
        if (s.sendFailures >= cfg_.maxSendFailures && isLive(s.state->state())) {
            failSession(s, fmt::format("signaling unavailable: {}", st.error().message));
        }
    }

    void SessionManager::failSession(Session &s, const std::string &reason) {
        ConnectionState last = s.state->state();
        if (last == ConnectionState::Failed || last == ConnectionState::Closed) return;
        Status st = s.state->fail(reason);
        if (!st) return;
        if (s.transport) {
            s.transport->close();
            s.transport.reset();
        }
        s.channels = transport::ChannelHandles{};
        s.remoteDescriptionApplied = false;
        s.pendingCandidates.clear();
        LOG_SESSION_ERROR("session with {} failed in {}: {}", s.remote.str(), connectionStateName(last), reason);
        if (observer_) observer_->onSessionEnded(s.remote, ConnectionState::Failed, reason);
    }

    void SessionManager::closeSessionNow(Session &s, const std::string &reason) {
        PeerId peer = s.remote;
        if (s.state->state() != ConnectionState::Closed) {
            Status st = s.state->transitionTo(ConnectionState::Closed, reason);
            if (!st) LOG_SESSION_WARN("close of {}: {}", peer.str(), st.error().message);
        }
        if (s.transport) {
            s.transport->close();
            s.transport.reset();
        }
        if (observer_) observer_->onSessionEnded(peer, ConnectionState::Closed, reason);
        eraseSession(peer);
    }

    void SessionManager::housekeeping() {
        auto now = std::chrono::steady_clock::now();
        for (auto &kv : sessions_) {
            Session &s = *kv.second;
            if (s.state->state() == ConnectionState::Reconnecting && now - s.reconnectingSince > cfg_.reconnectTimeout) {
                failSession(s, fmt::format("no connectivity for {} ms", cfg_.reconnectTimeout.count()));
            }
        }
    }

    void SessionManager::onConnect(const PeerId &peer) {
        if (peer.empty() || peer == self_) {
            LOG_SESSION_WARN("refusing to connect to '{}'", peer.str());
            return;
        }
        if (Session *existing = find(peer)) {
            if (isLive(existing->state->state())) {
                LOG_SESSION_WARN("session with {} already live ({})", peer.str(),
                                 connectionStateName(existing->state->state()));
                return;
            }
            eraseSession(peer);
        }

        Session *s = createSession(peer, SessionRole::Initiator);
        if (!s->state->transitionTo(ConnectionState::Connecting)) return;
        sendTo(*s, signaling::ConnectionRequest{});
    }

    void SessionManager::onClose(const CloseCommand &cmd) {
        Session *s = find(cmd.peer);
        if (!s) {
            LOG_SESSION_DEBUG("close for unknown session {}", cmd.peer.str());
            return;
        }
        closeSessionNow(*s, cmd.reason);
    }

    void SessionManager::onRetry(const PeerId &peer) {
        Session *s = find(peer);
        if (!s) {
            LOG_SESSION_WARN("retry for unknown session {}", peer.str());
            return;
        }
        Status st = s->state->retry();
        if (!st) {
            LOG_SESSION_WARN("retry of {} rejected: {}", peer.str(), st.error().message);
            return;
        }
        // the peer may have forgotten us; restart the handshake as initiator
        {
            std::lock_guard<std::mutex> lk(tableMtx_);
            s->role = SessionRole::Initiator;
            s->remoteCandidates = 0;
            s->localCandidates = 0;
        }
        s->generation = nextGeneration_++;
        s->sendFailures = 0;
        sendTo(*s, signaling::ConnectionRequest{});
    }

    void SessionManager::onSignalingFailure(const signaling::SignalingFailure &failure) {
        if (failure.peer) {
            Session *s = find(*failure.peer);
            if (s) failSession(*s, failure.error.message);
            return;
        }
        for (auto &kv : sessions_) {
            Session &s = *kv.second;
            if (isNegotiating(s.state->state())) failSession(s, failure.error.message);
        }
    }

    void SessionManager::onSignaling(const SignalingMessage &msg) {
        using namespace signaling;
        switch (msg.type()) {
            case MessageType::ConnectionRequest:
                onConnectionRequest(msg);
                break;
            case MessageType::ConnectionAccepted:
                onConnectionAccepted(msg, *msg.as<ConnectionAccepted>());
                break;
            case MessageType::ConnectionRejected: {
                Session *s = find(msg.from);
                if (s && s->role == SessionRole::Initiator && isNegotiating(s->state->state())) {
                    failSession(*s, fmt::format("rejected by peer: {}", msg.as<ConnectionRejected>()->reason));
                } else {
                    LOG_SESSION_WARN("unexpected ConnectionRejected from {}", msg.from.str());
                }
                break;
            }
            case MessageType::Offer:
                onOffer(msg, *msg.as<Offer>());
                break;
            case MessageType::Answer:
                onAnswer(msg, *msg.as<Answer>());
                break;
            case MessageType::IceCandidate:
                onIceCandidate(msg, *msg.as<IceCandidate>());
                break;
            case MessageType::PeerList: {
                std::vector<PeerInfo> list;
                for (const auto &p : msg.as<PeerList>()->peers) {
                    if (p.id != self_) list.push_back(p);
                }
                {
                    std::lock_guard<std::mutex> lk(tableMtx_);
                    peers_ = list;
                }
                LOG_SESSION_INFO("{} peer(s) online", list.size());
                if (observer_) observer_->onPeersChanged(list);
                break;
            }
            case MessageType::PeerJoined: {
                const PeerInfo &p = msg.as<PeerJoined>()->peer;
                if (p.id == self_) break;
                std::vector<PeerInfo> copy;
                {
                    std::lock_guard<std::mutex> lk(tableMtx_);
                    auto it = std::find_if(peers_.begin(), peers_.end(), [&](const PeerInfo &x) { return x.id == p.id; });
                    if (it != peers_.end()) *it = p;
                    else peers_.push_back(p);
                    copy = peers_;
                }
                LOG_SESSION_INFO("peer joined: {} ({})", p.id.str(), p.deviceName);
                if (observer_) observer_->onPeersChanged(copy);
                break;
            }
            case MessageType::PeerLeft:
                onPeerLeft(msg.as<PeerLeft>()->peer);
                break;
            case MessageType::Error: {
                const std::string &text = msg.as<ErrorNotice>()->message;
                LOG_SESSION_WARN("rendezvous error (peer '{}'): {}", msg.from.str(), text);
                // the rendezvous service names the unreachable destination in `from`
                Session *s = msg.from.empty() ? nullptr : find(msg.from);
                if (s && isNegotiating(s->state->state())) {
                    failSession(*s, fmt::format("peer unreachable: {}", text));
                }
                break;
            }
            case MessageType::Pong:
                LOG_SESSION_TRACE("pong from {}", msg.from.str());
                break;
            case MessageType::Ping:
            case MessageType::ListPeers:
                LOG_SESSION_DEBUG("ignoring {} on the session coordinator", msg.typeName());
                break;
        }
    }

    void SessionManager::onConnectionRequest(const SignalingMessage &msg) {
        const PeerId &peer = msg.from;
        if (peer.empty() || peer == self_) {
            LOG_SESSION_WARN("ConnectionRequest with invalid sender '{}'", peer.str());
            return;
        }

        if (Session *existing = find(peer)) {
            ConnectionState st = existing->state->state();
            bool glare = existing->role == SessionRole::Initiator && st == ConnectionState::Connecting;
            if (glare && self_ < peer) {
                LOG_SESSION_INFO("simultaneous connect with {}, keeping our request", peer.str());
                return;
            }
            if (!glare && isLive(st)) {
                LOG_SESSION_WARN("ConnectionRequest from {} while session is {}", peer.str(), connectionStateName(st));
                sendTo(*existing, signaling::ConnectionRejected{"session already active"});
                return;
            }
            eraseSession(peer);
        }

        std::string reason;
        if (acceptPolicy_ && !acceptPolicy_(peer, reason)) {
            LOG_SESSION_INFO("rejecting connection from {}: {}", peer.str(), reason);
            Status st = sender_ ? sender_(signaling::makeMessage(self_, peer, signaling::ConnectionRejected{reason}))
                                : Status::err(ErrorKind::TransportError, "no signaling sender");
            if (!st) LOG_SESSION_WARN("ConnectionRejected to {} not sent: {}", peer.str(), st.error().message);
            return;
        }

        Session *s = createSession(peer, SessionRole::Responder);
        {
            std::lock_guard<std::mutex> lk(tableMtx_);
            s->sessionId = randomHex(16);
        }
        if (!s->state->transitionTo(ConnectionState::Connecting)) return;
        sendTo(*s, signaling::ConnectionAccepted{s->sessionId});
        if (s->state->state() != ConnectionState::Connecting) return;
        if (!s->state->transitionTo(ConnectionState::SignalingConnected)) return;
        ensureTransport(*s);
    }

    void SessionManager::onConnectionAccepted(const SignalingMessage &msg, const signaling::ConnectionAccepted &acc) {
        Session *s = find(msg.from);
        if (!s || s->role != SessionRole::Initiator || s->state->state() != ConnectionState::Connecting) {
            LOG_SESSION_WARN("unexpected ConnectionAccepted from {}", msg.from.str());
            return;
        }
        {
            std::lock_guard<std::mutex> lk(tableMtx_);
            s->sessionId = acc.sessionId;
        }
        if (!s->state->transitionTo(ConnectionState::SignalingConnected)) return;
        if (!ensureTransport(*s)) return;

        Status st = s->transport->createOffer();
        if (!st) failSession(*s, fmt::format("offer creation failed: {}", st.error().message));
    }

    void SessionManager::onOffer(const SignalingMessage &msg, const signaling::Offer &offer) {
        const PeerId &peer = msg.from;
        Session *s = find(peer);

        if (s && !isLive(s->state->state())) {
            eraseSession(peer);
            s = nullptr;
        }

        if (!s) {
            std::string reason;
            if (acceptPolicy_ && !acceptPolicy_(peer, reason)) {
                LOG_SESSION_INFO("ignoring offer from {}: {}", peer.str(), reason);
                return;
            }
            // offer without a prior request: the signaling path is already proven by the offer itself
            s = createSession(peer, SessionRole::Responder);
            {
                std::lock_guard<std::mutex> lk(tableMtx_);
                s->sessionId = randomHex(16);
            }
            if (!s->state->transitionTo(ConnectionState::Connecting)) return;
            if (!s->state->transitionTo(ConnectionState::SignalingConnected)) return;
        }

        if (s->role != SessionRole::Responder || s->state->state() != ConnectionState::SignalingConnected) {
            LOG_SESSION_WARN("unexpected Offer from {} in {}", peer.str(), connectionStateName(s->state->state()));
            return;
        }
        if (!ensureTransport(*s)) return;

        Status st = s->transport->acceptOffer(offer.sdp);
        if (!st) {
            failSession(*s, fmt::format("remote offer rejected: {}", st.error().message));
            return;
        }
        s->remoteDescriptionApplied = true;
        auto pending = std::move(s->pendingCandidates);
        s->pendingCandidates.clear();
        for (const auto &c : pending) applyRemoteCandidate(*s, c);
    }

    void SessionManager::onAnswer(const SignalingMessage &msg, const signaling::Answer &answer) {
        Session *s = find(msg.from);
        if (!s || s->role != SessionRole::Initiator || s->state->state() != ConnectionState::SignalingConnected || !s->transport) {
            LOG_SESSION_WARN("unexpected Answer from {}", msg.from.str());
            return;
        }
        Status st = s->transport->applyAnswer(answer.sdp);
        if (!st) {
            failSession(*s, fmt::format("remote answer rejected: {}", st.error().message));
            return;
        }
        s->remoteDescriptionApplied = true;
        if (!s->state->transitionTo(ConnectionState::GatheringCandidates)) return;

        auto pending = std::move(s->pendingCandidates);
        s->pendingCandidates.clear();
        for (const auto &c : pending) applyRemoteCandidate(*s, c);
    }

    void SessionManager::onIceCandidate(const SignalingMessage &msg, const signaling::IceCandidate &cand) {
        Session *s = find(msg.from);
        if (!s || !isLive(s->state->state())) {
            LOG_SESSION_DEBUG("IceCandidate from {} without live session", msg.from.str());
            return;
        }
        if (!s->remoteDescriptionApplied || !s->transport) {
            s->pendingCandidates.push_back(cand);
            return;
        }
        applyRemoteCandidate(*s, cand);
    }

    void SessionManager::applyRemoteCandidate(Session &s, const signaling::IceCandidate &c) {
        Status st = s.transport->addRemoteCandidate(c);
        if (!st) {
            LOG_SESSION_WARN("remote candidate from {} ignored: {}", s.remote.str(), st.error().message);
            return;
        }
        int n;
        {
            std::lock_guard<std::mutex> lk(tableMtx_);
            n = ++s.remoteCandidates;
        }
        LOG_SESSION_DEBUG("remote candidate #{} from {}", n, s.remote.str());
    }

    void SessionManager::onPeerLeft(const PeerId &peer) {
        std::vector<PeerInfo> copy;
        {
            std::lock_guard<std::mutex> lk(tableMtx_);
            peers_.erase(std::remove_if(peers_.begin(), peers_.end(), [&](const PeerInfo &x) { return x.id == peer; }),
                         peers_.end());
            copy = peers_;
        }
        LOG_SESSION_INFO("peer left: {}", peer.str());
        if (observer_) observer_->onPeersChanged(copy);

        // an established session keeps its direct path; only negotiations depend on the rendezvous service
        Session *s = find(peer);
        if (s && isNegotiating(s->state->state())) failSession(*s, "peer left during negotiation");
    }

    void SessionManager::onTransport(const TransportEventFor &ev) {
        Session *s = find(ev.peer);
        if (!s || s->generation != ev.generation) {
            LOG_SESSION_DEBUG("stale transport event {} for {}", transport::transportEventName(ev.event.kind), ev.peer.str());
            return;
        }
        ConnectionState cur = s->state->state();

        switch (ev.event.kind) {
            case TransportEvent::Kind::LocalDescription:
                if (s->role == SessionRole::Initiator) {
                    if (cur != ConnectionState::SignalingConnected) break;
                    sendTo(*s, signaling::Offer{ev.event.sdp});
                } else {
                    if (cur != ConnectionState::SignalingConnected) break;
                    sendTo(*s, signaling::Answer{ev.event.sdp});
                    if (s->state->state() == ConnectionState::SignalingConnected) {
                        s->state->transitionTo(ConnectionState::GatheringCandidates);
                    }
                }
                break;

            case TransportEvent::Kind::LocalCandidate:
                if (!isLive(cur)) break;
                {
                    std::lock_guard<std::mutex> lk(tableMtx_);
                    ++s->localCandidates;
                }
                sendTo(*s, ev.event.candidate);
                break;

            case TransportEvent::Kind::Connected:
                if (cur == ConnectionState::GatheringCandidates) {
                    if (!s->state->transitionTo(ConnectionState::Connected)) break;
                    s->channels = s->transport->channels();
                    LOG_SESSION_INFO("session {} with {} established ({} remote / {} local candidates)",
                                     s->sessionId, s->remote.str(), s->remoteCandidates, s->localCandidates);
                    if (observer_) observer_->onSessionConnected(s->remote, s->channels);
                } else if (cur == ConnectionState::Reconnecting) {
                    s->state->transitionTo(ConnectionState::Connected, "connectivity restored");
                } else {
                    LOG_SESSION_DEBUG("transport connected while {}", connectionStateName(cur));
                }
                break;

            case TransportEvent::Kind::Disconnected:
                if (cur == ConnectionState::Connected) {
                    s->reconnectingSince = std::chrono::steady_clock::now();
                    s->state->transitionTo(ConnectionState::Reconnecting, ev.event.reason);
                }
                break;

            case TransportEvent::Kind::Failed:
                failSession(*s, ev.event.reason.empty() ? "peer transport failed" : ev.event.reason);
                break;
        }
    }

} // namespace peerlink::session
