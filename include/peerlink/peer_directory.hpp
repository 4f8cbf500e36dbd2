/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_PEER_DIRECTORY_HPP
#define PEERLINK_PEER_DIRECTORY_HPP

#pragma once

#include <peerlink/peer.hpp>
#include <peerlink/signaling_message.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

namespace peerlink::rendezvous {

    using ConnId = uint64_t;

    /// Identity the rendezvous service uses in `from` of the messages it originates.
    const PeerId &serviceId();

    struct Outgoing {
        ConnId conn;
        signaling::SignalingMessage msg;
    };

    struct DirectoryUpdate {
        std::vector<Outgoing> out;
        std::optional<ConnId> evict; // older connection replaced by a duplicate registration
    };

/**
 * @brief Routing table of the rendezvous service. No I/O: every call returns what to write where.
 *
 * A connection registers under the `from` of its first message. Messages with a `to` are forwarded to
 * that peer's connection, or answered with Error whose `from` names the unreachable peer.
 */
    class PeerDirectory {
    public:
        DirectoryUpdate onMessage(ConnId conn, const signaling::SignalingMessage &msg, int64_t nowUnix);
        DirectoryUpdate onDisconnect(ConnId conn);

        std::optional<PeerId> peerFor(ConnId conn) const;
        std::optional<ConnId> connectionFor(const PeerId &peer) const;
        std::vector<PeerInfo> peers() const;
        size_t size() const { return byPeer_.size(); }

    private:
        struct Entry {
            ConnId conn;
            PeerInfo info;
        };

        void registerPeer(ConnId conn, const PeerId &id, int64_t nowUnix, DirectoryUpdate &upd);
        void broadcast(const signaling::Payload &payload, const PeerId &except, DirectoryUpdate &upd) const;

        std::map<PeerId, Entry> byPeer_;
        std::unordered_map<ConnId, PeerId> byConn_;
    };

} // namespace peerlink::rendezvous

#endif // PEERLINK_PEER_DIRECTORY_HPP
