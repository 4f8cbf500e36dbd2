/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_CONFIG_HPP
#define PEERLINK_CONFIG_HPP

#pragma once

#include <peerlink/bitrate_controller.hpp>
#include <peerlink/common.hpp>
#include <peerlink/errors.hpp>
#include <peerlink/logger.hpp>
#include <peerlink/permissions.hpp>
#include <peerlink/session_manager.hpp>
#include <peerlink/signaling_client.hpp>
#include <peerlink/streaming_pipeline.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace peerlink::config {

    struct SignalingSection {
        std::string host{"127.0.0.1"};
        uint16_t port{common::DEFAULT_RENDEZVOUS_PORT};
        int connectTimeoutMs{5000};
        signaling::SignalingClientConfig client;
    };

    struct SessionSection {
        session::SessionManagerConfig manager;
    };

    struct PipelineSection {
        video::EncoderConfig encoder;
        video::PipelineConfig pipeline;
        std::string ffmpegPath{"ffmpeg"};
    };

    struct BitrateSection {
        abr::ControllerConfig controller;
        abr::QualityTier initialTier{abr::QualityTier::High};
        bool autoTierSwitch{true};
        size_t historyCapacity{64};
    };

    struct PermissionsSection {
        std::string activeProfile{"default"};
        std::vector<control::PermissionProfile> custom;

        control::ProfileCatalog catalog() const;
    };

    struct IceServer {
        std::string url;
        std::string username;
        std::string credential;
    };

    struct IceSection {
        std::vector<IceServer> servers{{"stun:stun.l.google.com:19302", "", ""}};
    };

    struct IdentitySection {
        std::string credentialFile{"peerlink_identity.json"};
        std::string deviceName;
    };

    struct LoggingSection {
        std::string file;
        log::Level level{log::Level::INFO};
    };

/**
 * @brief Everything the host engine reads at startup.
 *
 * Loaded from config.json next to the executable; command-line flags override individual fields.
 * Unknown keys are ignored. Wrong types and out-of-range values are a ConfigError naming the key.
 */
    struct EngineConfig {
        SignalingSection signaling;
        SessionSection session;
        PipelineSection pipeline;
        BitrateSection bitrate;
        PermissionsSection permissions;
        IceSection ice;
        IdentitySection identity;
        LoggingSection logging;

        /// Cross-field checks: encoder bounds, controller thresholds, active profile exists.
        Status validate() const;

        Result<control::PermissionProfile> activeProfile() const;
    };

    Result<EngineConfig> parseConfig(const nlohmann::json &j);
    Result<EngineConfig> parseConfigText(const std::string &text);

    /// NotFound if the file does not exist, ConfigError if it cannot be parsed.
    Result<EngineConfig> loadConfigFile(const std::string &path);

} // namespace peerlink::config

#endif // PEERLINK_CONFIG_HPP
