/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <peerlink/peer_directory.hpp>

using namespace peerlink;
using namespace peerlink::signaling;
using namespace peerlink::rendezvous;

namespace {

    SignalingMessage listPeers(const char *from, const char *deviceName = nullptr) {
        ListPeers lp;
        if (deviceName) {
            PeerInfo self;
            self.id = PeerId(from);
            self.deviceName = deviceName;
            self.deviceType = DeviceType::Laptop;
            lp.self = self;
        }
        return makeMessage(PeerId(from), PeerId(), lp);
    }

    const Outgoing *findTo(const DirectoryUpdate &u, ConnId conn, MessageType type) {
        for (const auto &o : u.out) {
            if (o.conn == conn && o.msg.type() == type) return &o;
        }
        return nullptr;
    }

} // namespace

TEST_CASE("first message registers the sender and announces it", "[rendezvous]") {
    PeerDirectory dir;
    auto u1 = dir.onMessage(1, listPeers("host-a", "office-pc"), 100);
    REQUIRE(dir.size() == 1);
    REQUIRE(dir.peerFor(1) == std::optional<PeerId>(PeerId("host-a")));

    const Outgoing *list = findTo(u1, 1, MessageType::PeerList);
    REQUIRE(list != nullptr);
    REQUIRE(list->msg.as<PeerList>()->peers.empty());

    auto u2 = dir.onMessage(2, listPeers("viewer-b"), 101);
    const Outgoing *joined = findTo(u2, 1, MessageType::PeerJoined);
    REQUIRE(joined != nullptr);
    REQUIRE(joined->msg.as<PeerJoined>()->peer.id == PeerId("viewer-b"));
    REQUIRE(joined->msg.from == serviceId());

    // the list sent to viewer-b holds host-a only, with the self-description it sent
    const Outgoing *list2 = findTo(u2, 2, MessageType::PeerList);
    REQUIRE(list2 != nullptr);
    const auto &peers = list2->msg.as<PeerList>()->peers;
    REQUIRE(peers.size() == 1);
    REQUIRE(peers[0].id == PeerId("host-a"));
    REQUIRE(peers[0].deviceName == "office-pc");
    REQUIRE(peers[0].deviceType == DeviceType::Laptop);
    REQUIRE(peers[0].lastSeen == std::optional<int64_t>(100));
}

TEST_CASE("addressed messages are forwarded unchanged", "[rendezvous]") {
    PeerDirectory dir;
    dir.onMessage(1, listPeers("host-a"), 100);
    dir.onMessage(2, listPeers("viewer-b"), 100);

    auto offer = makeMessage(PeerId("viewer-b"), PeerId("host-a"), Offer{"v=0"});
    auto u = dir.onMessage(2, offer, 101);
    REQUIRE(u.out.size() == 1);
    REQUIRE(u.out[0].conn == 1);
    REQUIRE(u.out[0].msg.as<Offer>()->sdp == "v=0");
    REQUIRE(u.out[0].msg.from == PeerId("viewer-b"));
}

TEST_CASE("unknown destination is answered with an Error from that peer", "[rendezvous]") {
    PeerDirectory dir;
    dir.onMessage(1, listPeers("host-a"), 100);

    auto u = dir.onMessage(1, makeMessage(PeerId("host-a"), PeerId("ghost"), ConnectionRequest{}), 101);
    REQUIRE(u.out.size() == 1);
    REQUIRE(u.out[0].conn == 1);
    REQUIRE(u.out[0].msg.type() == MessageType::Error);
    REQUIRE(u.out[0].msg.from == PeerId("ghost"));
    REQUIRE(u.out[0].msg.as<ErrorNotice>()->message == "peer not found");

    auto noDest = dir.onMessage(1, makeMessage(PeerId("host-a"), PeerId(), Offer{"v=0"}), 102);
    REQUIRE(noDest.out.size() == 1);
    REQUIRE(noDest.out[0].msg.type() == MessageType::Error);
}

TEST_CASE("a connection cannot speak for another peer", "[rendezvous]") {
    PeerDirectory dir;
    dir.onMessage(1, listPeers("host-a"), 100);
    dir.onMessage(2, listPeers("viewer-b"), 100);

    auto u = dir.onMessage(2, makeMessage(PeerId("host-a"), PeerId("viewer-b"), Offer{"v=0"}), 101);
    REQUIRE(u.out.size() == 1);
    REQUIRE(u.out[0].conn == 2);
    REQUIRE(u.out[0].msg.as<ErrorNotice>()->message == "sender id mismatch");
}

TEST_CASE("messages without a sender are ignored", "[rendezvous]") {
    PeerDirectory dir;
    auto u = dir.onMessage(1, makeMessage(PeerId(), PeerId(), ListPeers{}), 100);
    REQUIRE(u.out.empty());
    REQUIRE(dir.size() == 0);

    auto spoof = dir.onMessage(1, makeMessage(serviceId(), PeerId(), ListPeers{}), 100);
    REQUIRE(spoof.out.empty());
}

TEST_CASE("re-registration replaces the old connection", "[rendezvous]") {
    PeerDirectory dir;
    dir.onMessage(1, listPeers("host-a"), 100);
    dir.onMessage(2, listPeers("viewer-b"), 100);

    auto u = dir.onMessage(3, listPeers("host-a"), 200);
    REQUIRE(u.evict == std::optional<ConnId>(1));
    REQUIRE(dir.size() == 2);
    REQUIRE(dir.connectionFor(PeerId("host-a")) == std::optional<ConnId>(3));
    REQUIRE_FALSE(dir.peerFor(1).has_value());
    // no second PeerJoined for a known device
    REQUIRE(findTo(u, 2, MessageType::PeerJoined) == nullptr);

    // the evicted connection closing must not remove the peer
    REQUIRE(dir.onDisconnect(1).out.empty());
    REQUIRE(dir.size() == 2);
}

TEST_CASE("disconnect announces PeerLeft to the others", "[rendezvous]") {
    PeerDirectory dir;
    dir.onMessage(1, listPeers("host-a"), 100);
    dir.onMessage(2, listPeers("viewer-b"), 100);
    dir.onMessage(3, listPeers("viewer-c"), 100);

    auto u = dir.onDisconnect(2);
    REQUIRE(dir.size() == 2);
    REQUIRE(u.out.size() == 2);
    for (const auto &o : u.out) {
        REQUIRE(o.conn != 2);
        REQUIRE(o.msg.as<PeerLeft>()->peer == PeerId("viewer-b"));
    }
    REQUIRE(dir.onDisconnect(2).out.empty());
    REQUIRE(dir.peers().size() == 2);
}

TEST_CASE("heartbeat messages addressed to the service", "[rendezvous]") {
    PeerDirectory dir;
    dir.onMessage(1, listPeers("host-a"), 100);

    auto ping = dir.onMessage(1, makeMessage(PeerId("host-a"), serviceId(), Ping{}), 101);
    REQUIRE(ping.out.size() == 1);
    REQUIRE(ping.out[0].msg.type() == MessageType::Pong);

    auto pong = dir.onMessage(1, makeMessage(PeerId("host-a"), PeerId(), Pong{}), 102);
    REQUIRE(pong.out.empty());

    auto forged = dir.onMessage(1, makeMessage(PeerId("host-a"), PeerId(), PeerLeft{PeerId("x")}), 103);
    REQUIRE(forged.out.empty());
}
