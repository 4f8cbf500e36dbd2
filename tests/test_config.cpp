/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <peerlink/config.hpp>

#include <cstdio>
#include <fstream>
#include <string>

using namespace peerlink;
using namespace peerlink::config;

TEST_CASE("empty configuration gives the defaults", "[config]") {
    auto r = parseConfigText("{}");
    REQUIRE(r);
    const EngineConfig &cfg = r.value();
    REQUIRE(cfg.signaling.port == common::DEFAULT_RENDEZVOUS_PORT);
    REQUIRE(cfg.pipeline.encoder.targetFps == 30);
    REQUIRE(cfg.bitrate.initialTier == abr::QualityTier::High);
    REQUIRE(cfg.permissions.activeProfile == "default");
    REQUIRE(cfg.ice.servers.size() == 1);
    REQUIRE(cfg.validate());
    REQUIRE(cfg.activeProfile().value().name() == "default");
}

TEST_CASE("sections override individual fields", "[config]") {
    const char *text = R"({
        "signaling": {"host": "rdv.example.org", "port": 9100, "backoff_base_ms": 500, "max_attempts": 3},
        "session": {"reconnect_timeout_ms": 5000},
        "pipeline": {"width": 1280, "height": 720, "fps": 24, "bitrate": 1500000, "max_consecutive_failures": 4},
        "bitrate": {"initial_tier": "medium", "cycle_ms": 1000, "auto_tier_switch": false, "unused": 1},
        "permissions": {"profile": "screen_sharing"},
        "logging": {"level": "debug", "file": "/tmp/peerlink.log"},
        "identity": {"device_name": "lab-box"}
    })";
    auto r = parseConfigText(text);
    REQUIRE(r);
    const EngineConfig &cfg = r.value();
    REQUIRE(cfg.signaling.host == "rdv.example.org");
    REQUIRE(cfg.signaling.port == 9100);
    REQUIRE(cfg.signaling.client.backoff.base == std::chrono::milliseconds(500));
    REQUIRE(cfg.signaling.client.backoff.maxAttempts == 3);
    REQUIRE(cfg.session.manager.reconnectTimeout == std::chrono::milliseconds(5000));
    REQUIRE(cfg.pipeline.encoder.width == 1280);
    REQUIRE(cfg.pipeline.encoder.targetFps == 24);
    REQUIRE(cfg.pipeline.pipeline.maxConsecutiveFailures == 4);
    REQUIRE(cfg.bitrate.initialTier == abr::QualityTier::Medium);
    REQUIRE(cfg.bitrate.controller.cycle == std::chrono::milliseconds(1000));
    REQUIRE_FALSE(cfg.bitrate.autoTierSwitch);
    REQUIRE(cfg.logging.level == log::Level::DEBUG);
    REQUIRE(cfg.identity.deviceName == "lab-box");
    REQUIRE(cfg.activeProfile().value().granted().empty());
}

TEST_CASE("bad values name the offending key", "[config]") {
    struct Case {
        const char *text;
        const char *key;
    };
    const Case cases[] = {
            {R"({"signaling": {"port": 70000}})", "signaling.port"},
            {R"({"signaling": {"port": "80"}})", "signaling.port"},
            {R"({"signaling": 5})", "signaling"},
            {R"({"pipeline": {"codec": "mjpeg"}})", "pipeline.codec"},
            {R"({"bitrate": {"high_loss": 1.5}})", "bitrate.high_loss"},
            {R"({"bitrate": {"initial_tier": "epic"}})", "bitrate.initial_tier"},
            {R"({"bitrate": {"auto_tier_switch": "yes"}})", "bitrate.auto_tier_switch"},
            {R"({"logging": {"level": "loud"}})", "logging.level"},
            {R"({"ice": {"servers": [42]}})", "ice.servers[0]"},
            {R"({"permissions": {"profiles": [{"name": "x", "capabilities": {"fly": true}}]}})", "permissions.profiles[0]"},
    };
    for (const auto &c : cases) {
        INFO(c.text);
        auto r = parseConfigText(c.text);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().kind == ErrorKind::ConfigError);
        REQUIRE(r.error().message.find(c.key) == 0);
    }
}

TEST_CASE("cross-field validation", "[config]") {
    SECTION("odd resolution") {
        auto r = parseConfigText(R"({"pipeline": {"width": 1281}})");
        REQUIRE_FALSE(r);
        REQUIRE(r.error().message.find("pipeline:") == 0);
    }
    SECTION("unknown active profile") {
        auto r = parseConfigText(R"({"permissions": {"profile": "kiosk"}})");
        REQUIRE_FALSE(r);
        REQUIRE(r.error().message.find("kiosk") != std::string::npos);
    }
    SECTION("custom profile can be selected") {
        auto r = parseConfigText(R"({"permissions": {
            "profile": "kiosk",
            "profiles": [{"name": "kiosk", "base": "screen_sharing", "capabilities": {"control_mouse": true}}]
        }})");
        REQUIRE(r);
        auto p = r.value().activeProfile();
        REQUIRE(p);
        REQUIRE(p.value().allows(control::Capability::ControlMouse));
        REQUIRE_FALSE(p.value().allows(control::Capability::ControlKeyboard));
    }
    SECTION("backoff cap below base") {
        auto r = parseConfigText(R"({"signaling": {"backoff_base_ms": 5000, "backoff_cap_ms": 100}})");
        REQUIRE_FALSE(r);
    }
    SECTION("thresholds out of order") {
        auto r = parseConfigText(R"({"bitrate": {"low_rtt_ms": 500}})");
        REQUIRE_FALSE(r);
    }
}

TEST_CASE("ICE servers accept strings and objects", "[config]") {
    auto r = parseConfigText(R"({"ice": {"servers": [
        "stun:stun.example.org:3478",
        {"url": "turn:turn.example.org:3478", "username": "u", "credential": "p"}
    ]}})");
    REQUIRE(r);
    const auto &servers = r.value().ice.servers;
    REQUIRE(servers.size() == 2);
    REQUIRE(servers[0].url == "stun:stun.example.org:3478");
    REQUIRE(servers[0].username.empty());
    REQUIRE(servers[1].username == "u");
    REQUIRE(servers[1].credential == "p");
}

TEST_CASE("invalid JSON and missing files", "[config]") {
    auto bad = parseConfigText("{\"signaling\": ");
    REQUIRE_FALSE(bad);
    REQUIRE(bad.error().kind == ErrorKind::ConfigError);

    REQUIRE(parseConfigText("[]").error().kind == ErrorKind::ConfigError);

    auto missing = loadConfigFile("/nonexistent/peerlink/config.json");
    REQUIRE_FALSE(missing);
    REQUIRE(missing.error().kind == ErrorKind::NotFound);
}

TEST_CASE("configuration file is read from disk", "[config]") {
    std::string path = "peerlink_test_config_" + randomHex(4) + ".json";
    {
        std::ofstream out(path);
        out << R"({"pipeline": {"fps": 15}})";
    }
    auto r = loadConfigFile(path);
    std::remove(path.c_str());
    REQUIRE(r);
    REQUIRE(r.value().pipeline.encoder.targetFps == 15);
}
