/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/peer_directory.hpp>
#include <peerlink/logger.hpp>

namespace peerlink::rendezvous {

    using namespace peerlink::signaling;

    const PeerId &serviceId() {
        static const PeerId id("rendezvous");
        return id;
    }

    std::optional<PeerId> PeerDirectory::peerFor(ConnId conn) const {
        auto it = byConn_.find(conn);
        if (it == byConn_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<ConnId> PeerDirectory::connectionFor(const PeerId &peer) const {
        auto it = byPeer_.find(peer);
        if (it == byPeer_.end()) return std::nullopt;
        return it->second.conn;
    }

    std::vector<PeerInfo> PeerDirectory::peers() const {
        std::vector<PeerInfo> out;
        out.reserve(byPeer_.size());
        for (const auto &kv : byPeer_) out.push_back(kv.second.info);
        return out;
    }

    void PeerDirectory::broadcast(const Payload &payload, const PeerId &except, DirectoryUpdate &upd) const {
        for (const auto &kv : byPeer_) {
            if (kv.first == except) continue;
            upd.out.push_back({kv.second.conn, makeMessage(serviceId(), kv.first, payload)});
        }
    }

    void PeerDirectory::registerPeer(ConnId conn, const PeerId &id, int64_t nowUnix, DirectoryUpdate &upd) {
        auto existing = byPeer_.find(id);
        if (existing != byPeer_.end()) {
            // same device reconnected before its old socket timed out
            ConnId old = existing->second.conn;
            byConn_.erase(old);
            existing->second.conn = conn;
            existing->second.info.lastSeen = nowUnix;
            byConn_[conn] = id;
            upd.evict = old;
            LOG_SIG_INFO("peer {} re-registered, replacing connection #{} with #{}", id.str(), old, conn);
            return;
        }

        PeerInfo info;
        info.id = id;
        info.deviceName = id.str();
        info.online = true;
        info.lastSeen = nowUnix;
        byPeer_.emplace(id, Entry{conn, info});
        byConn_[conn] = id;
        LOG_SIG_INFO("peer {} registered on connection #{} ({} online)", id.str(), conn, byPeer_.size());
        broadcast(PeerJoined{info}, id, upd);
    }

    DirectoryUpdate PeerDirectory::onMessage(ConnId conn, const SignalingMessage &msg, int64_t nowUnix) {
        DirectoryUpdate upd;

        auto known = byConn_.find(conn);
        if (known == byConn_.end()) {
            if (msg.from.empty() || msg.from == serviceId()) {
                LOG_SIG_WARN("connection #{} sent {} without a valid sender id, ignored", conn, msg.typeName());
                return upd;
            }
            registerPeer(conn, msg.from, nowUnix, upd);
        } else if (msg.from != known->second) {
            LOG_SIG_WARN("connection #{} registered as {} sent {} claiming to be {}, dropped", conn,
                         known->second.str(), msg.typeName(), msg.from.str());
            upd.out.push_back({conn, makeMessage(serviceId(), known->second, ErrorNotice{"sender id mismatch"})});
            return upd;
        }

        const PeerId self = byConn_.at(conn);
        Entry &entry = byPeer_.at(self);
        entry.info.lastSeen = nowUnix;

        switch (msg.type()) {
            case MessageType::ListPeers: {
                const auto *req = msg.as<ListPeers>();
                if (req && req->self) {
                    entry.info.deviceName = req->self->deviceName.empty() ? self.str() : req->self->deviceName;
                    entry.info.deviceType = req->self->deviceType;
                }
                PeerList list;
                for (const auto &kv : byPeer_) {
                    if (kv.first != self) list.peers.push_back(kv.second.info);
                }
                upd.out.push_back({conn, makeMessage(serviceId(), self, std::move(list))});
                return upd;
            }
            case MessageType::Pong:
                if (msg.to.empty() || msg.to == serviceId()) return upd; // answer to our heartbeat
                break;
            case MessageType::Ping:
                if (msg.to.empty() || msg.to == serviceId()) {
                    upd.out.push_back({conn, makeMessage(serviceId(), self, Pong{})});
                    return upd;
                }
                break;
            case MessageType::PeerList:
            case MessageType::PeerJoined:
            case MessageType::PeerLeft:
                LOG_SIG_WARN("{} from {} is a service message, dropped", msg.typeName(), self.str());
                return upd;
            default:
                break;
        }

        if (msg.to.empty()) {
            upd.out.push_back({conn, makeMessage(serviceId(), self,
                                                 ErrorNotice{std::string(msg.typeName()) + " without destination"})});
            return upd;
        }

        auto target = byPeer_.find(msg.to);
        if (target == byPeer_.end()) {
            LOG_SIG_DEBUG("{} from {} to unknown peer {}", msg.typeName(), self.str(), msg.to.str());
            upd.out.push_back({conn, makeMessage(msg.to, self, ErrorNotice{"peer not found"})});
            return upd;
        }
        LOG_SIG_TRACE("route {} {} -> {}", msg.typeName(), self.str(), msg.to.str());
        upd.out.push_back({target->second.conn, msg});
        return upd;
    }

    DirectoryUpdate PeerDirectory::onDisconnect(ConnId conn) {
        DirectoryUpdate upd;
        auto it = byConn_.find(conn);
        if (it == byConn_.end()) return upd;

        PeerId gone = it->second;
        byConn_.erase(it);
        byPeer_.erase(gone);
        LOG_SIG_INFO("peer {} left ({} online)", gone.str(), byPeer_.size());
        broadcast(PeerLeft{gone}, gone, upd);
        return upd;
    }

} // namespace peerlink::rendezvous
