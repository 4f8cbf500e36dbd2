/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_PEER_HPP
#define PEERLINK_PEER_HPP

#pragma once

#include <peerlink/errors.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace peerlink {

/**
 * @brief Opaque, immutable device identifier. Generated once per install (UUIDv4 text form).
 */
    class PeerId {
    public:
        PeerId() = default;
        explicit PeerId(std::string value) : value_(std::move(value)) {}

        static PeerId generate();

        const std::string &str() const { return value_; }
        bool empty() const { return value_.empty(); }

        bool operator==(const PeerId &o) const { return value_ == o.value_; }
        bool operator!=(const PeerId &o) const { return value_ != o.value_; }
        bool operator<(const PeerId &o) const { return value_ < o.value_; }

    private:
        std::string value_;
    };

    struct PeerIdHash {
        size_t operator()(const PeerId &id) const noexcept { return std::hash<std::string>()(id.str()); }
    };

    enum class DeviceType {
        Desktop,
        Laptop,
        Mobile,
        Tablet,
        Unknown
    };

    const char *deviceTypeName(DeviceType t);
    DeviceType deviceTypeFromName(const std::string &name);

    struct PeerInfo {
        PeerId id;
        std::string deviceName;
        DeviceType deviceType{DeviceType::Unknown};
        bool online{true};
        std::optional<int64_t> lastSeen; // unix seconds
    };

/**
 * @brief Supplies the local identity. Owned by the platform/licensing layer.
 */
    class CredentialProvider {
    public:
        virtual ~CredentialProvider() = default;

        virtual PeerId peerId() const = 0;
        virtual std::string deviceName() const = 0;
        virtual std::string sessionSecret() const = 0;
    };

/**
 * @brief Credential provider backed by a small JSON file.
 *
 * load() creates the file with a fresh PeerId and secret on first run and reuses it afterwards, so the
 * PeerId stays stable for the lifetime of the install.
 */
    class FileCredentialProvider : public CredentialProvider {
    public:
        FileCredentialProvider(std::string path, std::string defaultDeviceName);

        Status load();

        PeerId peerId() const override { return peerId_; }
        std::string deviceName() const override { return deviceName_; }
        std::string sessionSecret() const override { return secret_; }

    private:
        Status persist() const;

        std::string path_;
        PeerId peerId_;
        std::string deviceName_;
        std::string secret_;
    };

    /// Random lowercase hex string of the given byte length.
    std::string randomHex(size_t bytes);

} // namespace peerlink

#endif // PEERLINK_PEER_HPP
