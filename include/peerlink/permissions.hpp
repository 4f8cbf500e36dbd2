/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_PERMISSIONS_HPP
#define PEERLINK_PERMISSIONS_HPP

#pragma once

#include <peerlink/errors.hpp>

#include <nlohmann/json.hpp>

#include <bitset>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace peerlink::control {

    enum class Capability {
        ControlMouse = 0,
        ControlKeyboard,
        ClipboardAccess,
        ClipboardFileTransfer,
        RestartDevice,
        LockDevice,
        SignOutUser,
        SendCtrlAltDel,
        BlockInputDevices,
        FileAccess,
        RecordSession,
        HearDeviceSound,
        SeeSystemInformation,
        DrawOnScreen,
        CreateTcpTunnels,
        PrivacyMode,
        Count_
    };

    constexpr size_t CAPABILITY_COUNT = static_cast<size_t>(Capability::Count_);

    /// snake_case key used in JSON ("control_mouse", ...).
    const char *capabilityName(Capability c);
    std::optional<Capability> capabilityFromName(const std::string &name);

/**
 * @brief Named set of capability flags, selected per session.
 */
    class PermissionProfile {
    public:
        PermissionProfile() = default;
        explicit PermissionProfile(std::string name) : name_(std::move(name)) {}

        const std::string &name() const { return name_; }

        bool allows(Capability c) const { return flags_.test(static_cast<size_t>(c)); }
        PermissionProfile &set(Capability c, bool enabled = true);
        PermissionProfile &setAll(bool enabled);

        std::vector<Capability> granted() const;

        bool operator==(const PermissionProfile &o) const { return name_ == o.name_ && flags_ == o.flags_; }
        bool operator!=(const PermissionProfile &o) const { return !(*this == o); }

        // presets
        static PermissionProfile defaults();
        static PermissionProfile screenSharing();
        static PermissionProfile fullAccess();
        static PermissionProfile unattendedAccess();

        /// "default", "screen_sharing", "full_access", "unattended_access".
        static std::optional<PermissionProfile> preset(const std::string &name);
        static std::vector<std::string> presetNames();

    private:
        std::string name_{"default"};
        std::bitset<CAPABILITY_COUNT> flags_;
    };

    /// {"name": "...", "capabilities": {"control_mouse": true, ...}}
    nlohmann::json profileToJson(const PermissionProfile &p);

    /**
     * Accepts an optional "base" preset the capabilities are applied on top of.
     * Unknown capability keys and non-boolean values are a ConfigError.
     */
    Result<PermissionProfile> profileFromJson(const nlohmann::json &j);

/**
 * @brief Presets plus custom profiles from configuration. Custom profiles shadow presets of the same name.
 */
    class ProfileCatalog {
    public:
        ProfileCatalog();

        Status add(PermissionProfile profile);
        std::optional<PermissionProfile> find(const std::string &name) const;
        std::vector<std::string> names() const;

    private:
        std::map<std::string, PermissionProfile> profiles_;
    };

} // namespace peerlink::control

#endif // PEERLINK_PERMISSIONS_HPP
