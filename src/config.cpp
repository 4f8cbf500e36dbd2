/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/config.hpp>

#include <fmt/core.h>

#include <fstream>
#include <limits>
#include <sstream>

namespace peerlink::config {

    using nlohmann::json;

    namespace {

        // Thrown inside the parser only, converted to ConfigError at parseConfig().
        struct ConfigFault {
            std::string key;
            std::string what;
        };

        class Section {
        public:
            Section(const json &root, const char *name) : name_(name) {
                auto it = root.find(name);
                if (it == root.end() || it->is_null()) return;
                if (!it->is_object()) throw ConfigFault{name_, "must be an object"};
                j_ = &*it;
            }

            std::string key(const char *k) const { return name_ + "." + k; }

            const json *find(const char *k) const {
                if (!j_) return nullptr;
                auto it = j_->find(k);
                if (it == j_->end() || it->is_null()) return nullptr;
                return &*it;
            }

            template<typename T>
            void integer(const char *k, T &out, int64_t lo, int64_t hi) const {
                const json *v = find(k);
                if (!v) return;
                if (!v->is_number_integer()) throw ConfigFault{key(k), "must be an integer"};
                int64_t n = v->get<int64_t>();
                if (n < lo || n > hi) throw ConfigFault{key(k), fmt::format("must be within [{}, {}], got {}", lo, hi, n)};
                out = static_cast<T>(n);
            }

            void millis(const char *k, std::chrono::milliseconds &out, int64_t lo = 1,
                        int64_t hi = 24 * 3600 * 1000) const {
                int64_t ms = out.count();
                integer(k, ms, lo, hi);
                out = std::chrono::milliseconds(ms);
            }

            void number(const char *k, double &out, double lo, double hi) const {
                const json *v = find(k);
                if (!v) return;
                if (!v->is_number()) throw ConfigFault{key(k), "must be a number"};
                double d = v->get<double>();
                if (d < lo || d > hi) throw ConfigFault{key(k), fmt::format("must be within [{}, {}], got {}", lo, hi, d)};
                out = d;
            }

            void boolean(const char *k, bool &out) const {
                const json *v = find(k);
                if (!v) return;
                if (!v->is_boolean()) throw ConfigFault{key(k), "must be true or false"};
                out = v->get<bool>();
            }

            void string(const char *k, std::string &out) const {
                const json *v = find(k);
                if (!v) return;
                if (!v->is_string()) throw ConfigFault{key(k), "must be a string"};
                out = v->get<std::string>();
            }

        private:
            std::string name_;
            const json *j_{nullptr};
        };

        constexpr int64_t kU32Max = std::numeric_limits<uint32_t>::max();

        void readSignaling(const json &root, SignalingSection &s) {
            Section sec(root, "signaling");
            sec.string("host", s.host);
            sec.integer("port", s.port, 1, 65535);
            sec.integer("connect_timeout_ms", s.connectTimeoutMs, 1, 600000);
            sec.millis("backoff_base_ms", s.client.backoff.base);
            sec.number("backoff_factor", s.client.backoff.factor, 1.0, 16.0);
            sec.millis("backoff_cap_ms", s.client.backoff.cap);
            sec.integer("max_attempts", s.client.backoff.maxAttempts, 0, 1000);
            sec.integer("inbound_capacity", s.client.inboundCapacity, 1, 1 << 20);
            sec.integer("outbound_capacity", s.client.outboundCapacity, 1, 1 << 20);
            sec.integer("max_send_failures", s.client.maxConsecutiveSendFailures, 1, 1000);
            if (s.host.empty()) throw ConfigFault{"signaling.host", "must not be empty"};
        }

        void readSession(const json &root, SessionSection &s) {
            Section sec(root, "session");
            sec.millis("reconnect_timeout_ms", s.manager.reconnectTimeout);
            sec.integer("max_send_failures", s.manager.maxSendFailures, 1, 1000);
            sec.integer("event_capacity", s.manager.eventCapacity, 1, 1 << 20);
        }

        void readPipeline(const json &root, PipelineSection &p) {
            Section sec(root, "pipeline");
            sec.integer("width", p.encoder.width, 1, kU32Max);
            sec.integer("height", p.encoder.height, 1, kU32Max);
            sec.integer("fps", p.encoder.targetFps, 1, kU32Max);
            sec.integer("bitrate", p.encoder.targetBitrate, 1, kU32Max);
            std::string codec = video::codecName(p.encoder.codec);
            sec.string("codec", codec);
            auto c = video::codecFromName(codec);
            if (!c) throw ConfigFault{"pipeline.codec", fmt::format("unknown codec \"{}\"", codec)};
            p.encoder.codec = *c;
            sec.integer("max_consecutive_failures", p.pipeline.maxConsecutiveFailures, 1, 100000);
            sec.millis("stop_timeout_ms", p.pipeline.stopTimeout);
            sec.string("ffmpeg_path", p.ffmpegPath);
        }

        void readBitrate(const json &root, BitrateSection &b) {
            Section sec(root, "bitrate");
            auto &c = b.controller;
            sec.number("high_rtt_ms", c.highRttMs, 0.0, 60000.0);
            sec.number("high_loss", c.highLossRatio, 0.0, 1.0);
            sec.number("low_rtt_ms", c.lowRttMs, 0.0, 60000.0);
            sec.number("low_loss", c.lowLossRatio, 0.0, 1.0);
            sec.number("emergency_loss", c.emergencyLossRatio, 0.0, 1.0);
            sec.number("decrease_factor", c.decreaseFactor, 0.0, 1.0);
            sec.number("increase_factor", c.increaseFactor, 1.0, 10.0);
            sec.integer("degraded_cycles", c.requiredDegradedCycles, 1, 1000);
            sec.integer("tier_switch_cycles", c.tierSwitchCycles, 1, 1000);
            sec.integer("window", c.window, 1, 10000);
            sec.millis("cycle_ms", c.cycle);
            std::string tier = abr::tierName(b.initialTier);
            sec.string("initial_tier", tier);
            auto t = abr::tierFromName(tier);
            if (!t) throw ConfigFault{"bitrate.initial_tier", fmt::format("unknown tier \"{}\"", tier)};
            b.initialTier = *t;
            sec.boolean("auto_tier_switch", b.autoTierSwitch);
            sec.integer("history", b.historyCapacity, 1, 100000);
        }

        void readPermissions(const json &root, PermissionsSection &p) {
            Section sec(root, "permissions");
            sec.string("profile", p.activeProfile);
            const json *profiles = sec.find("profiles");
            if (!profiles) return;
            if (!profiles->is_array()) throw ConfigFault{"permissions.profiles", "must be an array"};
            for (size_t i = 0; i < profiles->size(); ++i) {
                auto r = control::profileFromJson((*profiles)[i]);
                if (!r) throw ConfigFault{fmt::format("permissions.profiles[{}]", i), r.error().message};
                p.custom.push_back(r.takeValue());
            }
        }

        void readIce(const json &root, IceSection &ice) {
            Section sec(root, "ice");
            const json *servers = sec.find("servers");
            if (!servers) return;
            if (!servers->is_array()) throw ConfigFault{"ice.servers", "must be an array"};
            ice.servers.clear();
            for (size_t i = 0; i < servers->size(); ++i) {
                const json &s = (*servers)[i];
                IceServer out;
                if (s.is_string()) {
                    out.url = s.get<std::string>();
                } else if (s.is_object() && s.contains("url") && s["url"].is_string()) {
                    out.url = s["url"].get<std::string>();
                    out.username = s.value("username", std::string());
                    out.credential = s.value("credential", std::string());
                } else {
                    throw ConfigFault{fmt::format("ice.servers[{}]", i), "must be a URL string or {url, username, credential}"};
                }
                ice.servers.push_back(std::move(out));
            }
        }

        void readIdentity(const json &root, IdentitySection &id) {
            Section sec(root, "identity");
            sec.string("file", id.credentialFile);
            sec.string("device_name", id.deviceName);
        }

        void readLogging(const json &root, LoggingSection &l) {
            Section sec(root, "logging");
            sec.string("file", l.file);
            std::string level = log::level_name(l.level);
            sec.string("level", level);
            if (!log::parse_level(level, l.level)) throw ConfigFault{"logging.level", fmt::format("unknown level \"{}\"", level)};
        }

    } // namespace

    control::ProfileCatalog PermissionsSection::catalog() const {
        control::ProfileCatalog cat;
        for (const auto &p : custom) {
            Status st = cat.add(p);
            if (!st) LOG_GEN_WARN("ignoring permission profile: {}", st.error().message);
        }
        return cat;
    }

    Result<control::PermissionProfile> EngineConfig::activeProfile() const {
        auto p = permissions.catalog().find(permissions.activeProfile);
        if (!p) {
            return makeError(ErrorKind::ConfigError,
                             fmt::format("permissions.profile: unknown profile \"{}\"", permissions.activeProfile));
        }
        return *p;
    }

    Status EngineConfig::validate() const {
        Status st = pipeline.pipeline.bounds.validate(pipeline.encoder);
        if (!st) return Status::err(ErrorKind::ConfigError, "pipeline: " + st.error().message);
        st = bitrate.controller.validate();
        if (!st) return st;
        if (signaling.client.backoff.cap < signaling.client.backoff.base)
            return Status::err(ErrorKind::ConfigError, "signaling.backoff_cap_ms must not be below signaling.backoff_base_ms");
        auto profile = activeProfile();
        if (!profile) return profile.error();
        return success();
    }

    Result<EngineConfig> parseConfig(const json &j) {
        if (!j.is_object()) return makeError(ErrorKind::ConfigError, "configuration root must be an object");
        EngineConfig cfg;
        try {
            readSignaling(j, cfg.signaling);
            readSession(j, cfg.session);
            readPipeline(j, cfg.pipeline);
            readBitrate(j, cfg.bitrate);
            readPermissions(j, cfg.permissions);
            readIce(j, cfg.ice);
            readIdentity(j, cfg.identity);
            readLogging(j, cfg.logging);
        } catch (const ConfigFault &f) {
            return makeError(ErrorKind::ConfigError, f.key + ": " + f.what);
        } catch (const json::exception &e) {
            return makeError(ErrorKind::ConfigError, e.what());
        }
        Status st = cfg.validate();
        if (!st) return st.error();
        return cfg;
    }

    Result<EngineConfig> parseConfigText(const std::string &text) {
        json j;
        try {
            j = json::parse(text);
        } catch (const json::parse_error &e) {
            return makeError(ErrorKind::ConfigError, fmt::format("invalid JSON: {}", e.what()));
        }
        return parseConfig(j);
    }

    Result<EngineConfig> loadConfigFile(const std::string &path) {
        std::ifstream in(path);
        if (!in.is_open()) return makeError(ErrorKind::NotFound, fmt::format("cannot open {}", path));
        std::stringstream ss;
        ss << in.rdbuf();
        auto r = parseConfigText(ss.str());
        if (!r) return makeError(r.error().kind, fmt::format("{}: {}", path, r.error().message));
        return r;
    }

} // namespace peerlink::config
