/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/bitrate_controller.hpp>
#include <peerlink/config.hpp>
#include <peerlink/control_channel.hpp>
#include <peerlink/ffmpeg_encoder.hpp>
#include <peerlink/logger.hpp>
#include <peerlink/network_stats.hpp>
#include <peerlink/peer.hpp>
#include <peerlink/rtc_transport.hpp>
#include <peerlink/session_manager.hpp>
#include <peerlink/signaling_client.hpp>
#include <peerlink/signaling_transport.hpp>
#include <peerlink/streaming_pipeline.hpp>
#include <peerlink/test_pattern.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <limits.h>
#include <unistd.h>

using namespace peerlink;
using namespace peerlink::log;

static std::atomic<bool> g_stop{false};

static void on_signal(int) {
    g_stop.store(true);
}

static std::string get_exe_dir(const char *argv0) {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len > 0) {
        buf[len] = '\0';
        std::string p(buf);
        size_t pos = p.find_last_of('/');
        if (pos != std::string::npos) return p.substr(0, pos);
    }
    // fallback: use argv0 path if it contains directory separator
    if (argv0) {
        std::string p(argv0);
        size_t pos = p.find_last_of('/');
        if (pos != std::string::npos) return p.substr(0, pos);
    }
    return ".";
}

static std::string local_host_name() {
    char buf[HOST_NAME_MAX + 1] = {0};
    if (gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') return "peerlink-host";
    return std::string(buf);
}

static void print_usage(const char *prog) {
    std::cerr << "Usage: " << prog << " [--config <file>] [--rendezvous <host:port>] [--connect <peer_id>] [--profile <name>]"
                 " [--bitrate <kbps>] [--tier low|medium|high|ultra] [--name <device_name>]"
                 " [--log <log_file>] [--log-level trace|debug|info|warn|error]\n";
    std::cerr << "Without --config, config.json next to the binary is used when present.\n";
    std::cerr << "CLI options override values from the config file.\n";
    std::cerr << "Example: " << prog << " --rendezvous 127.0.0.1:8787 --profile full_access --log host.log\n";
}

/**
 * @brief Everything that runs for one connected viewer: capture/encode pipeline, bitrate loop,
 * control and clipboard receivers, and the telemetry sampler that feeds NetworkStats.
 */
class HostStream {
public:
    HostStream(PeerId peer, const config::EngineConfig &cfg, control::PermissionProfile profile,
               std::shared_ptr<transport::RtcPeerTransportFactory> factory)
            : peer_(std::move(peer)), cfg_(cfg), profile_(std::move(profile)), factory_(std::move(factory)),
              stats_(std::make_shared<abr::NetworkStats>(cfg.bitrate.historyCapacity)) {}

    ~HostStream() { stop(); }

    Status start(const transport::ChannelHandles &channels,
                 video::StreamingPipeline::FatalHandler onFatal,
                 video::StreamingPipeline::StateProvider stateProvider) {
        const auto &enc = cfg_.pipeline.encoder;
        capture_ = std::make_shared<video::TestPatternCapture>(enc.width, enc.height);
        auto encoder = std::make_shared<video::FfmpegEncoder>(cfg_.pipeline.ffmpegPath);

        pipeline_ = std::make_unique<video::StreamingPipeline>(capture_, encoder, channels.screen, enc,
                                                               cfg_.pipeline.pipeline);
        pipeline_->setFatalHandler(std::move(onFatal));
        pipeline_->setStateProvider(std::move(stateProvider));
        auto st = pipeline_->start();
        if (!st) return st;

        video::StreamingPipeline *pipeline = pipeline_.get();
        abr::BitrateController controller(cfg_.bitrate.controller, cfg_.bitrate.initialTier, enc.targetBitrate);
        abr_ = std::make_unique<abr::AdaptiveBitrateLoop>(
                stats_, controller, enc,
                [pipeline](const video::EncoderConfig &next) { return pipeline->updateConfig(next); },
                cfg_.bitrate.autoTierSwitch);
        abr_->start();

        auto injector = std::make_shared<control::LoggingInputInjector>();
        auto audit = [peer = peer_](const control::PermissionDeniedEvent &ev) {
            LOG_CTRL_INFO("audit: peer {} denied {} (seq {}, profile '{}')", peer.str(),
                          control::capabilityName(ev.capability), ev.seq, ev.profile);
        };
        if (channels.control) {
            control_ = std::make_unique<control::ControlChannel>(injector, profile_);
            control_->setDeniedHandler(audit);
            control_->attach(channels.control);
        }
        if (channels.clipboard) {
            clipboard_ = std::make_unique<control::ControlChannel>(injector, profile_);
            clipboard_->setDeniedHandler(audit);
            clipboard_->attach(channels.clipboard);
        }

        stopTelemetry_ = false;
        telemetry_ = std::thread(&HostStream::telemetryLoop, this);
        LOG_GEN_INFO("Streaming to {} started ({}x{}@{} {} bps, profile '{}')", peer_.str(), enc.width, enc.height,
                     enc.targetFps, enc.targetBitrate, profile_.name());
        return success();
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lk(waitMtx_);
            stopTelemetry_ = true;
        }
        waitCv_.notify_all();
        if (telemetry_.joinable()) telemetry_.join();

        if (abr_) abr_->stop();
        if (control_) control_->detach();
        if (clipboard_) clipboard_->detach();
        if (pipeline_) {
            pipeline_->stop();
            auto s = pipeline_->snapshot();
            LOG_GEN_INFO("Streaming to {} stopped: encoded={} sent={} dropped={} fps={:.1f}", peer_.str(),
                         s.encodedFrames, s.sentFrames, s.droppedFrameCount, s.fps);
        }
        abr_.reset();
        control_.reset();
        clipboard_.reset();
        pipeline_.reset();
    }

    void logStats() const {
        if (!pipeline_) return;
        auto s = pipeline_->snapshot();
        auto cfg = pipeline_->activeConfig();
        LOG_VIDEO_INFO("[{}] fps={:.1f} encode={:.2f}ms encoded={} sent={} skipped={} superseded={} bitrate={} {}x{}",
                       peer_.str(), s.fps, s.encodeTimeMs, s.encodedFrames, s.sentFrames, s.skippedFrames,
                       s.supersededFrames, cfg.targetBitrate, cfg.width, cfg.height);
        if (control_) {
            auto c = control_->stats();
            LOG_CTRL_INFO("[{}] control: received={} injected={} denied={} gaps={} duplicates={}", peer_.str(),
                          c.received, c.injected, c.denied, c.gaps, c.duplicates);
        }
    }

private:
    // Loss is approximated by the share of encoded frames that a newer frame superseded before the
    // screen channel accepted them; RTT comes from the ICE transport.
    void telemetryLoop() {
        uint64_t lastEncoded = 0;
        uint64_t lastSuperseded = 0;
        std::unique_lock<std::mutex> lk(waitMtx_);
        while (!stopTelemetry_) {
            waitCv_.wait_for(lk, std::chrono::milliseconds(500), [this] { return stopTelemetry_; });
            if (stopTelemetry_) break;

            auto s = pipeline_->snapshot();
            uint64_t encoded = s.encodedFrames - lastEncoded;
            uint64_t superseded = s.supersededFrames - lastSuperseded;
            lastEncoded = s.encodedFrames;
            lastSuperseded = s.supersededFrames;

            auto rtt = factory_->rttMs(peer_);
            if (!rtt) continue;
            double loss = encoded > 0 ? static_cast<double>(superseded) / static_cast<double>(encoded) : 0.0;
            stats_->record(*rtt, loss);
            LOG_ABR_TRACE("[{}] sample rtt={:.1f}ms loss={:.3f}", peer_.str(), *rtt, loss);
        }
    }

    PeerId peer_;
    const config::EngineConfig &cfg_;
    control::PermissionProfile profile_;
    std::shared_ptr<transport::RtcPeerTransportFactory> factory_;
    std::shared_ptr<abr::NetworkStats> stats_;

    std::shared_ptr<video::TestPatternCapture> capture_;
    std::unique_ptr<video::StreamingPipeline> pipeline_;
    std::unique_ptr<abr::AdaptiveBitrateLoop> abr_;
    std::unique_ptr<control::ControlChannel> control_;
    std::unique_ptr<control::ControlChannel> clipboard_;

    std::mutex waitMtx_;
    std::condition_variable waitCv_;
    bool stopTelemetry_{false};
    std::thread telemetry_;
};

/**
 * @brief Starts a HostStream when a session reaches Connected and tears it down when the session ends.
 * Callbacks arrive on the session coordinator thread.
 */
class HostObserver : public session::SessionObserver {
public:
    HostObserver(const config::EngineConfig &cfg, control::PermissionProfile profile,
                 std::shared_ptr<transport::RtcPeerTransportFactory> factory)
            : cfg_(cfg), profile_(std::move(profile)), factory_(std::move(factory)) {}

    void setManager(session::SessionManager *mgr) { mgr_ = mgr; }

    void onSessionConnected(const PeerId &peer, const transport::ChannelHandles &channels) override {
        std::lock_guard<std::mutex> lk(mtx_);
        if (streams_.count(peer)) return; // reconnect of a live session keeps its stream

        auto stream = std::make_unique<HostStream>(peer, cfg_, profile_, factory_);
        session::SessionManager *mgr = mgr_;
        auto onFatal = [mgr, peer](const Error &err) {
            LOG_VIDEO_ERROR("Pipeline for {} failed: {}", peer.str(), err.message);
            if (mgr) mgr->closeSession(peer, "streaming pipeline failed");
        };
        auto stateProvider = [mgr, peer]() {
            if (!mgr) return session::ConnectionState::Closed;
            auto s = mgr->session(peer);
            return s ? s->state : session::ConnectionState::Closed;
        };
        auto st = stream->start(channels, onFatal, stateProvider);
        if (!st) {
            LOG_GEN_ERROR("Could not start streaming to {}: {}", peer.str(), st.error().message);
            stream->stop();
            if (mgr) mgr->closeSession(peer, "streaming pipeline could not start");
            return;
        }
        streams_.emplace(peer, std::move(stream));
    }

    void onSessionEnded(const PeerId &peer, session::ConnectionState finalState, const std::string &reason) override {
        std::unique_ptr<HostStream> stream;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            auto it = streams_.find(peer);
            if (it == streams_.end()) return;
            stream = std::move(it->second);
            streams_.erase(it);
        }
        LOG_GEN_INFO("Session with {} ended ({}{}{})", peer.str(), session::connectionStateName(finalState),
                     reason.empty() ? "" : ": ", reason);
        stream->stop();
    }

    void onPeersChanged(const std::vector<PeerInfo> &peers) override {
        LOG_GEN_INFO("{} peer(s) online", peers.size());
        for (const auto &p : peers) {
            LOG_GEN_DEBUG("  {} '{}' ({})", p.id.str(), p.deviceName, deviceTypeName(p.deviceType));
        }
    }

    void logStats() {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto &kv : streams_) kv.second->logStats();
    }

    void stopAll() {
        std::map<PeerId, std::unique_ptr<HostStream>> streams;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            streams.swap(streams_);
        }
        for (auto &kv : streams) kv.second->stop();
    }

private:
    const config::EngineConfig &cfg_;
    control::PermissionProfile profile_;
    std::shared_ptr<transport::RtcPeerTransportFactory> factory_;
    session::SessionManager *mgr_{nullptr};

    std::mutex mtx_;
    std::map<PeerId, std::unique_ptr<HostStream>> streams_;
};

int main(int argc, char **argv) {
    std::string config_cli;
    std::string rendezvous_cli;
    std::string connect_cli;
    std::string profile_cli;
    std::string tier_cli;
    std::string name_cli;
    uint32_t bitrate_cli = 0;        bool bitrate_cli_set = false;
    std::string log_file_cli;        bool log_file_cli_set = false;
    std::string log_level_cli;       bool log_level_cli_set = false;

    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        auto need_value = [&](const char *what) {
            if (i + 1 >= argc) {
                std::cerr << a << " requires " << what << "\n";
                return false;
            }
            return true;
        };
        if (a == "--config") {
            if (!need_value("a path")) return 1;
            config_cli = argv[++i];
        } else if (a == "--rendezvous") {
            if (!need_value("host:port")) return 1;
            rendezvous_cli = argv[++i];
        } else if (a == "--connect") {
            if (!need_value("a peer id")) return 1;
            connect_cli = argv[++i];
        } else if (a == "--profile") {
            if (!need_value("a profile name")) return 1;
            profile_cli = argv[++i];
        } else if (a == "--tier") {
            if (!need_value("a tier name")) return 1;
            tier_cli = argv[++i];
        } else if (a == "--name") {
            if (!need_value("a device name")) return 1;
            name_cli = argv[++i];
        } else if (a == "--bitrate") {
            if (!need_value("a value")) return 1;
            try {
                bitrate_cli = static_cast<uint32_t>(std::stoul(argv[++i]));
            } catch (const std::exception &) {
                std::cerr << "Invalid bitrate: " << argv[i] << "\n";
                return 1;
            }
            bitrate_cli_set = true;
        } else if (a == "--log") {
            if (!need_value("a path")) return 1;
            log_file_cli = argv[++i];
            log_file_cli_set = true;
        } else if (a == "--log-level") {
            if (!need_value("a value")) return 1;
            log_level_cli = argv[++i];
            log_level_cli_set = true;
        } else if (a == "--help" || a == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << a << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    std::string exe_dir = get_exe_dir(argc > 0 ? argv[0] : nullptr);
    std::string config_path = config_cli.empty() ? exe_dir + "/config.json" : config_cli;

    config::EngineConfig cfg;
    bool config_loaded = false;
    auto loaded = config::loadConfigFile(config_path);
    if (loaded) {
        cfg = loaded.takeValue();
        config_loaded = true;
    } else if (loaded.error().kind != ErrorKind::NotFound || !config_cli.empty()) {
        std::cerr << "Error: " << loaded.error().message << "\n";
        return 1;
    }

    // Override with explicit flags
    if (!rendezvous_cli.empty()) {
        size_t colon = rendezvous_cli.rfind(':');
        if (colon == std::string::npos) {
            std::cerr << "--rendezvous requires host:port\n";
            return 1;
        }
        cfg.signaling.host = rendezvous_cli.substr(0, colon);
        try {
            int port = std::stoi(rendezvous_cli.substr(colon + 1));
            if (port <= 0 || port > 65535) throw std::out_of_range("port");
            cfg.signaling.port = static_cast<uint16_t>(port);
        } catch (const std::exception &) {
            std::cerr << "Invalid port: " << rendezvous_cli.substr(colon + 1) << "\n";
            return 1;
        }
    }
    if (!profile_cli.empty()) cfg.permissions.activeProfile = profile_cli;
    if (bitrate_cli_set) cfg.pipeline.encoder.targetBitrate = bitrate_cli * 1000;
    if (!tier_cli.empty()) {
        auto tier = abr::tierFromName(tier_cli);
        if (!tier) {
            std::cerr << "Unknown tier: " << tier_cli << "\n";
            return 1;
        }
        cfg.bitrate.initialTier = *tier;
    }
    if (!name_cli.empty()) cfg.identity.deviceName = name_cli;
    if (log_file_cli_set) cfg.logging.file = log_file_cli;
    if (log_level_cli_set && !parse_level(log_level_cli, cfg.logging.level)) {
        std::cerr << "Warning: unknown log level '" << log_level_cli << "', using " << level_name(cfg.logging.level) << ".\n";
    }

    auto valid = cfg.validate();
    if (!valid) {
        std::cerr << "Error: invalid configuration: " << valid.error().message << "\n";
        return 1;
    }
    auto profile = cfg.activeProfile();
    if (!profile) {
        std::cerr << "Error: " << profile.error().message << "\n";
        return 1;
    }

    Logger::instance().set_level(cfg.logging.level);
    if (!cfg.logging.file.empty()) {
        std::ofstream ofs(cfg.logging.file.c_str(), std::ios::app);
        if (!ofs) {
            std::cerr << "Warning: could not open log file '" << cfg.logging.file << "' for append, continuing without file logging\n";
        } else {
            ofs.close();
            Logger::instance().open_logfile(cfg.logging.file);
        }
    }
    if (config_loaded) LOG_GEN_INFO("Loaded host config from '{}'", config_path);

    std::string identity_path = cfg.identity.credentialFile;
    if (!identity_path.empty() && identity_path[0] != '/') identity_path = exe_dir + "/" + identity_path;
    FileCredentialProvider identity(identity_path,
                                    cfg.identity.deviceName.empty() ? local_host_name() : cfg.identity.deviceName);
    auto idStatus = identity.load();
    if (!idStatus) {
        LOG_GEN_ERROR("Cannot load identity: {}", idStatus.error().message);
        return 1;
    }
    PeerId self = identity.peerId();
    LOG_GEN_INFO("Starting host {} ('{}') -> rendezvous {}:{} profile='{}'", self.str(), identity.deviceName(),
                 cfg.signaling.host, cfg.signaling.port, profile.value().name());

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::signal(SIGPIPE, SIG_IGN);

    auto sigTransport = std::make_unique<signaling::TcpSignalingTransport>(cfg.signaling.host, cfg.signaling.port,
                                                                          cfg.signaling.connectTimeoutMs);
    signaling::SignalingClient client(self, std::move(sigTransport), cfg.signaling.client);
    PeerInfo localInfo;
    localInfo.id = self;
    localInfo.deviceName = identity.deviceName();
    localInfo.deviceType = DeviceType::Desktop;
    client.setLocalInfo(localInfo);

    auto factory = std::make_shared<transport::RtcPeerTransportFactory>(cfg.ice.servers);
    auto observer = std::make_shared<HostObserver>(cfg, profile.value(), factory);

    session::SessionManager mgr(self, [&client](const signaling::SignalingMessage &m) { return client.send(m); },
                                factory, cfg.session.manager);
    observer->setManager(&mgr);
    mgr.setObserver(observer);
    mgr.setAcceptPolicy([](const PeerId &peer, std::string &reason) {
        (void)reason;
        LOG_SESSION_INFO("Accepting connection request from {}", peer.str());
        return true;
    });
    client.setFailureHandler([&mgr](const signaling::SignalingFailure &f) { mgr.handleSignalingFailure(f); });

    auto inbound = client.connect();
    if (!inbound) {
        LOG_GEN_ERROR("Signaling connect failed: {}", inbound.error().message);
        client.close();
        return 2;
    }
    mgr.attachSignaling(inbound.value());
    mgr.start();

    if (!connect_cli.empty()) {
        if (!mgr.connectTo(PeerId(connect_cli))) {
            LOG_GEN_ERROR("Could not queue connection to {}", connect_cli);
        }
    }

    auto lastStats = std::chrono::steady_clock::now();
    while (!g_stop.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (client.linkState() == signaling::LinkState::Failed) {
            LOG_GEN_ERROR("Signaling link failed, shutting down");
            break;
        }
        auto now = std::chrono::steady_clock::now();
        if (now - lastStats >= std::chrono::seconds(10)) {
            observer->logStats();
            lastStats = now;
        }
    }

    LOG_GEN_INFO("Shutting down");
    mgr.stop();
    observer->stopAll();
    client.close();
    return 0;
}
