/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/permissions.hpp>

#include <fmt/core.h>

#include <array>

namespace peerlink::control {

    namespace {
        const std::array<const char *, CAPABILITY_COUNT> kCapabilityNames = {{
            "control_mouse",
            "control_keyboard",
            "clipboard_access",
            "clipboard_file_transfer",
            "restart_device",
            "lock_device",
            "sign_out_user",
            "send_ctrl_alt_del",
            "block_input_devices",
            "file_access",
            "record_session",
            "hear_device_sound",
            "see_system_information",
            "draw_on_screen",
            "create_tcp_tunnels",
            "privacy_mode",
        }};
    }

    const char *capabilityName(Capability c) {
        auto idx = static_cast<size_t>(c);
        return idx < CAPABILITY_COUNT ? kCapabilityNames[idx] : "unknown";
    }

    std::optional<Capability> capabilityFromName(const std::string &name) {
        for (size_t i = 0; i < CAPABILITY_COUNT; ++i) {
            if (name == kCapabilityNames[i]) return static_cast<Capability>(i);
        }
        return std::nullopt;
    }

    PermissionProfile &PermissionProfile::set(Capability c, bool enabled) {
        flags_.set(static_cast<size_t>(c), enabled);
        return *this;
    }

    PermissionProfile &PermissionProfile::setAll(bool enabled) {
        if (enabled) flags_.set(); else flags_.reset();
        return *this;
    }

    std::vector<Capability> PermissionProfile::granted() const {
        std::vector<Capability> out;
        for (size_t i = 0; i < CAPABILITY_COUNT; ++i) {
            if (flags_.test(i)) out.push_back(static_cast<Capability>(i));
        }
        return out;
    }

    PermissionProfile PermissionProfile::defaults() {
        PermissionProfile p("default");
        p.setAll(true)
         .set(Capability::SignOutUser, false)
         .set(Capability::CreateTcpTunnels, false)
         .set(Capability::PrivacyMode, false);
        return p;
    }

    PermissionProfile PermissionProfile::screenSharing() {
        return PermissionProfile("screen_sharing");
    }

    PermissionProfile PermissionProfile::fullAccess() {
        PermissionProfile p("full_access");
        p.setAll(true).set(Capability::PrivacyMode, false);
        return p;
    }

    PermissionProfile PermissionProfile::unattendedAccess() {
        PermissionProfile p("unattended_access");
        p.setAll(true)
         .set(Capability::SignOutUser, false)
         .set(Capability::PrivacyMode, false);
        return p;
    }

    std::optional<PermissionProfile> PermissionProfile::preset(const std::string &name) {
        if (name == "default") return defaults();
        if (name == "screen_sharing") return screenSharing();
        if (name == "full_access") return fullAccess();
        if (name == "unattended_access") return unattendedAccess();
        return std::nullopt;
    }

    std::vector<std::string> PermissionProfile::presetNames() {
        return {"default", "screen_sharing", "full_access", "unattended_access"};
    }

    nlohmann::json profileToJson(const PermissionProfile &p) {
        nlohmann::json caps = nlohmann::json::object();
        for (size_t i = 0; i < CAPABILITY_COUNT; ++i) {
            caps[kCapabilityNames[i]] = p.allows(static_cast<Capability>(i));
        }
        return nlohmann::json{{"name", p.name()}, {"capabilities", caps}};
    }

    Result<PermissionProfile> profileFromJson(const nlohmann::json &j) {
        if (!j.is_object()) return makeError(ErrorKind::ConfigError, "permission profile must be an object");

        auto nameIt = j.find("name");
        if (nameIt == j.end() || !nameIt->is_string() || nameIt->get<std::string>().empty())
            return makeError(ErrorKind::ConfigError, "permission profile needs a non-empty \"name\"");
        const std::string name = nameIt->get<std::string>();

        PermissionProfile profile(name);
        auto baseIt = j.find("base");
        if (baseIt != j.end()) {
            if (!baseIt->is_string())
                return makeError(ErrorKind::ConfigError, fmt::format("profile {}: \"base\" must be a string", name));
            auto base = PermissionProfile::preset(baseIt->get<std::string>());
            if (!base)
                return makeError(ErrorKind::ConfigError,
                                 fmt::format("profile {}: unknown base preset \"{}\"", name, baseIt->get<std::string>()));
            for (Capability c : base->granted()) profile.set(c);
        }

        auto capsIt = j.find("capabilities");
        if (capsIt != j.end()) {
            if (!capsIt->is_object())
                return makeError(ErrorKind::ConfigError, fmt::format("profile {}: \"capabilities\" must be an object", name));
            for (auto it = capsIt->begin(); it != capsIt->end(); ++it) {
                auto cap = capabilityFromName(it.key());
                if (!cap)
                    return makeError(ErrorKind::ConfigError, fmt::format("profile {}: unknown capability \"{}\"", name, it.key()));
                if (!it.value().is_boolean())
                    return makeError(ErrorKind::ConfigError, fmt::format("profile {}: capability \"{}\" must be a boolean", name, it.key()));
                profile.set(*cap, it.value().get<bool>());
            }
        }
        return profile;
    }

    ProfileCatalog::ProfileCatalog() {
        for (const auto &name : PermissionProfile::presetNames()) {
            profiles_.emplace(name, *PermissionProfile::preset(name));
        }
    }

    Status ProfileCatalog::add(PermissionProfile profile) {
        if (profile.name().empty()) return Status::err(ErrorKind::ConfigError, "permission profile without a name");
        std::string key = profile.name();
        profiles_[key] = std::move(profile);
        return success();
    }

    std::optional<PermissionProfile> ProfileCatalog::find(const std::string &name) const {
        auto it = profiles_.find(name);
        if (it == profiles_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<std::string> ProfileCatalog::names() const {
        std::vector<std::string> out;
        out.reserve(profiles_.size());
        for (const auto &kv : profiles_) out.push_back(kv.first);
        return out;
    }

} // namespace peerlink::control
