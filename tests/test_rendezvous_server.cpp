/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <peerlink/rendezvous_server.hpp>
#include <peerlink/signaling_transport.hpp>

#include <thread>

using namespace peerlink;
using namespace peerlink::signaling;
using namespace peerlink::rendezvous;

namespace {

    /// Reads lines until one of the wanted type arrives or the deadline passes.
    std::optional<SignalingMessage> awaitType(TcpSignalingTransport &t, MessageType type) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
        while (std::chrono::steady_clock::now() < deadline) {
            std::string line;
            auto st = t.receiveText(line, std::chrono::milliseconds(100));
            if (st == ReceiveStatus::Closed) return std::nullopt;
            if (st != ReceiveStatus::Message) continue;
            auto msg = decode(line);
            if (msg && msg.value().type() == type) return msg.takeValue();
        }
        return std::nullopt;
    }

    struct RunningServer {
        explicit RunningServer(ServerConfig cfg) : server(cfg) {}

        bool start() {
            if (!server.start()) return false;
            loop = std::thread([this] { server.runLoop(); });
            return true;
        }

        ~RunningServer() {
            server.requestStop();
            if (loop.joinable()) loop.join();
        }

        RendezvousServer server;
        std::thread loop;
    };

} // namespace

TEST_CASE("two peers meet and exchange an offer through the rendezvous", "[rendezvous][tcp]") {
    ServerConfig cfg;
    cfg.port = 0;
    RunningServer rs(cfg);
    REQUIRE(rs.start());
    const int port = rs.server.boundPort();
    REQUIRE(port > 0);

    TcpSignalingTransport host("127.0.0.1", port, 2000);
    TcpSignalingTransport viewer("127.0.0.1", port, 2000);
    REQUIRE(host.open());
    REQUIRE(viewer.open());

    PeerInfo hostInfo;
    hostInfo.id = PeerId("host-a");
    hostInfo.deviceName = "office-pc";
    REQUIRE(host.sendText(encode(makeMessage(hostInfo.id, PeerId(), ListPeers{hostInfo}))));
    REQUIRE(awaitType(host, MessageType::PeerList).has_value());

    REQUIRE(viewer.sendText(encode(makeMessage(PeerId("viewer-b"), PeerId(), ListPeers{}))));
    auto list = awaitType(viewer, MessageType::PeerList);
    REQUIRE(list.has_value());
    const auto &peers = list->as<PeerList>()->peers;
    REQUIRE(peers.size() == 1);
    REQUIRE(peers[0].deviceName == "office-pc");

    auto joined = awaitType(host, MessageType::PeerJoined);
    REQUIRE(joined.has_value());
    REQUIRE(joined->as<PeerJoined>()->peer.id == PeerId("viewer-b"));

    REQUIRE(viewer.sendText(encode(makeMessage(PeerId("viewer-b"), PeerId("host-a"), Offer{"v=0"}))));
    auto offer = awaitType(host, MessageType::Offer);
    REQUIRE(offer.has_value());
    REQUIRE(offer->from == PeerId("viewer-b"));
    REQUIRE(offer->as<Offer>()->sdp == "v=0");

    viewer.close();
    auto left = awaitType(host, MessageType::PeerLeft);
    REQUIRE(left.has_value());
    REQUIRE(left->as<PeerLeft>()->peer == PeerId("viewer-b"));

    host.close();
}

TEST_CASE("an unknown destination is reported back to the sender", "[rendezvous][tcp]") {
    ServerConfig cfg;
    cfg.port = 0;
    RunningServer rs(cfg);
    REQUIRE(rs.start());

    TcpSignalingTransport host("127.0.0.1", rs.server.boundPort(), 2000);
    REQUIRE(host.open());
    REQUIRE(host.sendText(encode(makeMessage(PeerId("host-a"), PeerId("ghost"), ConnectionRequest{}))));

    auto err = awaitType(host, MessageType::Error);
    REQUIRE(err.has_value());
    REQUIRE(err->from == PeerId("ghost"));
    REQUIRE(err->as<ErrorNotice>()->message == "peer not found");
    host.close();
}
