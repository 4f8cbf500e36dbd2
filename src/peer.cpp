/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/peer.hpp>
#include <peerlink/logger.hpp>

#include <nlohmann/json.hpp>
#include <fmt/core.h>

#include <array>
#include <fstream>
#include <random>

namespace peerlink {

    namespace {

        std::mt19937_64 &rng() {
            thread_local std::mt19937_64 gen{std::random_device{}()};
            return gen;
        }

    } // namespace

    std::string randomHex(size_t bytes) {
        std::string out;
        out.reserve(bytes * 2);
        std::uniform_int_distribution<int> dist(0, 255);
        for (size_t i = 0; i < bytes; ++i) {
            out += fmt::format("{:02x}", dist(rng()));
        }
        return out;
    }

    PeerId PeerId::generate() {
        std::array<uint8_t, 16> b{};
        std::uniform_int_distribution<int> dist(0, 255);
        for (auto &x : b) x = (uint8_t)dist(rng());
        b[6] = (uint8_t)((b[6] & 0x0F) | 0x40); // version 4
        b[8] = (uint8_t)((b[8] & 0x3F) | 0x80); // RFC 4122 variant

        std::string s;
        s.reserve(36);
        for (size_t i = 0; i < b.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) s += '-';
            s += fmt::format("{:02x}", b[i]);
        }
        return PeerId(s);
    }

    const char *deviceTypeName(DeviceType t) {
        switch (t) {
            case DeviceType::Desktop: return "Desktop";
            case DeviceType::Laptop:  return "Laptop";
            case DeviceType::Mobile:  return "Mobile";
            case DeviceType::Tablet:  return "Tablet";
            case DeviceType::Unknown: return "Unknown";
        }
        return "Unknown";
    }

    DeviceType deviceTypeFromName(const std::string &name) {
        if (name == "Desktop") return DeviceType::Desktop;
        if (name == "Laptop") return DeviceType::Laptop;
        if (name == "Mobile") return DeviceType::Mobile;
        if (name == "Tablet") return DeviceType::Tablet;
        return DeviceType::Unknown;
    }

    FileCredentialProvider::FileCredentialProvider(std::string path, std::string defaultDeviceName)
            : path_(std::move(path)), deviceName_(std::move(defaultDeviceName)) {}

    Status FileCredentialProvider::load() {
        std::ifstream in(path_);
        if (in.is_open()) {
            try {
                nlohmann::json j;
                in >> j;
                std::string id = j.value("peer_id", std::string());
                if (id.empty()) {
                    return Status::err(ErrorKind::ConfigError, fmt::format("{}: missing peer_id", path_));
                }
                peerId_ = PeerId(id);
                deviceName_ = j.value("device_name", deviceName_);
                secret_ = j.value("session_secret", std::string());
            } catch (const nlohmann::json::exception &e) {
                return Status::err(ErrorKind::ConfigError, fmt::format("{}: {}", path_, e.what()));
            }
            if (secret_.empty()) {
                secret_ = randomHex(32);
                return persist();
            }
            LOG_GEN_INFO("Loaded identity {} from {}", peerId_.str(), path_);
            return success();
        }

        peerId_ = PeerId::generate();
        secret_ = randomHex(32);
        LOG_GEN_INFO("Generated new identity {} ({})", peerId_.str(), path_);
        return persist();
    }

    Status FileCredentialProvider::persist() const {
        nlohmann::json j;
        j["peer_id"] = peerId_.str();
        j["device_name"] = deviceName_;
        j["session_secret"] = secret_;

        std::ofstream out(path_, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            return Status::err(ErrorKind::ConfigError, fmt::format("cannot write credentials to {}", path_));
        }
        out << j.dump(2) << "\n";
        return success();
    }

} // namespace peerlink
