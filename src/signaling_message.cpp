/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/signaling_message.hpp>

#include <nlohmann/json.hpp>
#include <fmt/core.h>

namespace peerlink::signaling {

    using nlohmann::json;

    namespace {

        static_assert(std::variant_size_v<Payload> == 13, "MessageType must mirror Payload alternatives");

        json peerInfoToJson(const PeerInfo &p) {
            json j;
            j["device_id"] = p.id.str();
            j["device_name"] = p.deviceName;
            j["device_type"] = deviceTypeName(p.deviceType);
            j["online"] = p.online;
            if (p.lastSeen) j["last_seen"] = *p.lastSeen;
            else j["last_seen"] = nullptr;
            return j;
        }

        PeerInfo peerInfoFromJson(const json &j) {
            PeerInfo p;
            p.id = PeerId(j.at("device_id").get<std::string>());
            p.deviceName = j.value("device_name", std::string());
            p.deviceType = deviceTypeFromName(j.value("device_type", std::string("Unknown")));
            p.online = j.value("online", true);
            auto it = j.find("last_seen");
            if (it != j.end() && !it->is_null()) p.lastSeen = it->get<int64_t>();
            return p;
        }

        struct PayloadWriter {
            json &j;

            void operator()(const Offer &m) const { j["sdp"] = m.sdp; }
            void operator()(const Answer &m) const { j["sdp"] = m.sdp; }
            void operator()(const IceCandidate &m) const {
                j["candidate"] = m.candidate;
                j["sdp_mid"] = m.sdpMid ? json(*m.sdpMid) : json(nullptr);
                j["sdp_m_line_index"] = m.sdpMLineIndex ? json(*m.sdpMLineIndex) : json(nullptr);
            }
            void operator()(const ListPeers &m) const {
                if (m.self) j["peer"] = peerInfoToJson(*m.self);
            }
            void operator()(const PeerList &m) const {
                json arr = json::array();
                for (const auto &p : m.peers) arr.push_back(peerInfoToJson(p));
                j["peers"] = std::move(arr);
            }
            void operator()(const PeerJoined &m) const { j["peer"] = peerInfoToJson(m.peer); }
            void operator()(const PeerLeft &m) const { j["device_id"] = m.peer.str(); }
            void operator()(const ConnectionRequest &) const {}
            void operator()(const ConnectionAccepted &m) const { j["session_id"] = m.sessionId; }
            void operator()(const ConnectionRejected &m) const { j["reason"] = m.reason; }
            void operator()(const Ping &) const {}
            void operator()(const Pong &) const {}
            void operator()(const ErrorNotice &m) const { j["message"] = m.message; }
        };

        Payload decodePayload(const std::string &type, const json &j) {
            if (type == "Offer") return Offer{j.at("sdp").get<std::string>()};
            if (type == "Answer") return Answer{j.at("sdp").get<std::string>()};
            if (type == "IceCandidate") {
                IceCandidate c;
                c.candidate = j.at("candidate").get<std::string>();
                auto mid = j.find("sdp_mid");
                if (mid != j.end() && !mid->is_null()) c.sdpMid = mid->get<std::string>();
                auto idx = j.find("sdp_m_line_index");
                if (idx != j.end() && !idx->is_null()) c.sdpMLineIndex = idx->get<uint16_t>();
                return c;
            }
            if (type == "ListPeers") {
                ListPeers l;
                auto self = j.find("peer");
                if (self != j.end() && !self->is_null()) l.self = peerInfoFromJson(*self);
                return l;
            }
            if (type == "PeerList") {
                PeerList l;
                for (const auto &p : j.at("peers")) l.peers.push_back(peerInfoFromJson(p));
                return l;
            }
            if (type == "PeerJoined") return PeerJoined{peerInfoFromJson(j.at("peer"))};
            if (type == "PeerLeft") return PeerLeft{PeerId(j.at("device_id").get<std::string>())};
            if (type == "ConnectionRequest") return ConnectionRequest{};
            if (type == "ConnectionAccepted") return ConnectionAccepted{j.at("session_id").get<std::string>()};
            if (type == "ConnectionRejected") return ConnectionRejected{j.value("reason", std::string())};
            if (type == "Ping") return Ping{};
            if (type == "Pong") return Pong{};
            if (type == "Error") return ErrorNotice{j.value("message", std::string())};
            throw std::invalid_argument(fmt::format("unknown message type '{}'", type));
        }

    } // namespace

    const char *messageTypeName(MessageType t) {
        switch (t) {
            case MessageType::Offer:              return "Offer";
            case MessageType::Answer:             return "Answer";
            case MessageType::IceCandidate:       return "IceCandidate";
            case MessageType::ListPeers:          return "ListPeers";
            case MessageType::PeerList:           return "PeerList";
            case MessageType::PeerJoined:         return "PeerJoined";
            case MessageType::PeerLeft:           return "PeerLeft";
            case MessageType::ConnectionRequest:  return "ConnectionRequest";
            case MessageType::ConnectionAccepted: return "ConnectionAccepted";
            case MessageType::ConnectionRejected: return "ConnectionRejected";
            case MessageType::Ping:               return "Ping";
            case MessageType::Pong:               return "Pong";
            case MessageType::Error:              return "Error";
        }
        return "Unknown";
    }

    SignalingMessage makeMessage(const PeerId &from, const PeerId &to, Payload payload) {
        SignalingMessage m;
        m.from = from;
        m.to = to;
        m.payload = std::move(payload);
        return m;
    }

    std::string encode(const SignalingMessage &msg) {
        json j;
        j["type"] = msg.typeName();
        j["from"] = msg.from.str();
        j["to"] = msg.to.str();
        std::visit(PayloadWriter{j}, msg.payload);
        return j.dump();
    }

    // Single dispatch point for inbound wire messages.
    Result<SignalingMessage> decode(const std::string &text) {
        try {
            json j = json::parse(text);
            if (!j.is_object()) {
                return Result<SignalingMessage>::err(ErrorKind::ProtocolError, "message is not a JSON object");
            }
            auto t = j.find("type");
            if (t == j.end() || !t->is_string()) {
                return Result<SignalingMessage>::err(ErrorKind::ProtocolError, "missing \"type\" discriminator");
            }
            SignalingMessage m;
            m.from = PeerId(j.value("from", std::string()));
            m.to = PeerId(j.value("to", std::string()));
            m.payload = decodePayload(t->get<std::string>(), j);
            return m;
        } catch (const json::exception &e) {
            return Result<SignalingMessage>::err(ErrorKind::ProtocolError, e.what());
        } catch (const std::invalid_argument &e) {
            return Result<SignalingMessage>::err(ErrorKind::ProtocolError, e.what());
        }
    }

} // namespace peerlink::signaling
