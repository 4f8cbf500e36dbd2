/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/streaming_pipeline.hpp>
#include <peerlink/channel.hpp>
#include <peerlink/video_packet.hpp>
#include <peerlink/logger.hpp>

#include <fmt/core.h>

#include <atomic>
#include <condition_variable>
#include <optional>

namespace peerlink::video {

    using namespace std::chrono;

    struct StreamingPipeline::Core {
        Core(std::shared_ptr<CaptureSource> capture, std::shared_ptr<VideoEncoder> encoder,
             std::shared_ptr<transport::MediaChannel> screen, EncoderConfig initial, PipelineConfig cfg)
                : capture(std::move(capture)), encoder(std::move(encoder)), screen(std::move(screen)), cfg(cfg),
                  config(initial) {}

        void tickLoop();
        void sendLoop();
        void tick(microseconds period);
        void applyPendingConfig();
        void onFrameFailure(const std::string &reason);
        void releaseHandles();
        void requestStop();
        bool waitUntil(steady_clock::time_point deadline);
        EncoderConfig activeConfig() const;

        const std::shared_ptr<CaptureSource> capture;
        const std::shared_ptr<VideoEncoder> encoder;
        const std::shared_ptr<transport::MediaChannel> screen;
        const PipelineConfig cfg;

        mutable std::mutex configMtx;
        EncoderConfig config;                        // written by the tick-loop only while running
        std::optional<EncoderConfig> pendingConfig;

        std::mutex handlesMtx;
        bool handlesHeld{false};

        std::mutex waitMtx;
        std::condition_variable waitCv;

        std::atomic<bool> running{false};
        std::atomic<bool> stopRequested{false};
        std::atomic<bool> failed{false};
        std::atomic<bool> keyframeRequested{false};

        std::shared_ptr<BoundedChannel<EncodedFrame>> outbound;

        // tick-loop private
        uint64_t sequence{0};
        uint32_t framesSinceKeyframe{0};
        uint32_t consecutiveFailures{0};

        PerformanceMonitor perf;

        std::mutex handlerMtx;
        FatalHandler fatalHandler;
        StateProvider stateProvider;
    };

    StreamingPipeline::StreamingPipeline(std::shared_ptr<CaptureSource> capture, std::shared_ptr<VideoEncoder> encoder,
                                         std::shared_ptr<transport::MediaChannel> screen, EncoderConfig initial,
                                         PipelineConfig cfg)
            : core_(std::make_shared<Core>(std::move(capture), std::move(encoder), std::move(screen), initial, cfg)) {}

    StreamingPipeline::~StreamingPipeline() {
        stop();
    }

    void StreamingPipeline::setFatalHandler(FatalHandler handler) {
        std::lock_guard<std::mutex> lk(core_->handlerMtx);
        core_->fatalHandler = std::move(handler);
    }

    void StreamingPipeline::setStateProvider(StateProvider provider) {
        std::lock_guard<std::mutex> lk(core_->handlerMtx);
        core_->stateProvider = std::move(provider);
    }

    bool StreamingPipeline::running() const {
        return core_->running.load() && !core_->failed.load();
    }

    bool StreamingPipeline::failed() const {
        return core_->failed.load();
    }

    EncoderConfig StreamingPipeline::activeConfig() const {
        return core_->activeConfig();
    }

    PerformanceSnapshot StreamingPipeline::snapshot() const {
        return core_->perf.snapshot();
    }

    void StreamingPipeline::requestKeyframe() {
        core_->keyframeRequested.store(true);
    }

    Status StreamingPipeline::updateConfig(const EncoderConfig &cfg) {
        Status st = core_->cfg.bounds.validate(cfg);
        if (!st) {
            LOG_VIDEO_WARN("config update rejected: {}", st.error().message);
            return st;
        }
        std::lock_guard<std::mutex> lk(core_->configMtx);
        if (!core_->running.load()) {
            core_->config = cfg;
            core_->pendingConfig.reset();
        } else {
            core_->pendingConfig = cfg;
        }
        LOG_VIDEO_DEBUG("config update queued: {}x{}@{} {} bps", cfg.width, cfg.height, cfg.targetFps, cfg.targetBitrate);
        return success();
    }

    Status StreamingPipeline::start() {
        std::lock_guard<std::mutex> lk(lifecycleMtx_);
        Core &c = *core_;
        if (c.running.load()) {
            LOG_VIDEO_DEBUG("pipeline already running");
            return success();
        }
        if (!c.capture || !c.encoder || !c.screen) {
            return Status::err(ErrorKind::ConfigError, "pipeline needs a capture source, an encoder and a screen channel");
        }

        // leftovers of a run that ended on the fatal path
        if (tickThread_.joinable()) joinOrAbandon(tickThread_, tickDone_, "tick-loop");
        if (sendThread_.joinable()) joinOrAbandon(sendThread_, sendDone_, "sender");

        // a detached tick-loop may still be inside its last encode
        auto busy = [](std::future<void> &f) {
            return f.valid() && f.wait_for(milliseconds(0)) != std::future_status::ready;
        };
        if (busy(tickDone_) || busy(sendDone_)) {
            return Status::err(ErrorKind::Timeout, "previous run is still finishing its last frame");
        }

        EncoderConfig initial = c.activeConfig();
        Status st = c.cfg.bounds.validate(initial);
        if (!st) return st;

        {
            std::lock_guard<std::mutex> hk(c.handlesMtx);
            c.handlesHeld = true;
        }
        st = c.encoder->configure(initial);
        if (!st) {
            LOG_VIDEO_ERROR("encoder {} refused initial config: {}", c.encoder->name(), st.error().message);
            c.releaseHandles();
            return st;
        }

        c.sequence = 0;
        c.framesSinceKeyframe = 0;
        c.consecutiveFailures = 0;
        c.perf.reset();
        c.keyframeRequested.store(true);
        c.failed.store(false);
        c.stopRequested.store(false);
        c.outbound = std::make_shared<BoundedChannel<EncodedFrame>>(1, BoundedChannel<EncodedFrame>::Overflow::DropOldest);
        c.running.store(true);

        std::promise<void> tickPromise;
        std::promise<void> sendPromise;
        tickDone_ = tickPromise.get_future();
        sendDone_ = sendPromise.get_future();
        tickThread_ = std::thread([core = core_, p = std::move(tickPromise)]() mutable {
            core->tickLoop();
            core->releaseHandles();
            p.set_value();
        });
        sendThread_ = std::thread([core = core_, p = std::move(sendPromise)]() mutable {
            core->sendLoop();
            p.set_value();
        });

        LOG_VIDEO_INFO("pipeline started: {} {}x{}@{} {} bps", c.encoder->name(), initial.width, initial.height,
                       initial.targetFps, initial.targetBitrate);
        return success();
    }

    bool StreamingPipeline::joinOrAbandon(std::thread &t, std::future<void> &done, const char *what) {
        if (!t.joinable()) return true;
        if (t.get_id() == std::this_thread::get_id()) {
            t.detach();
            return false;
        }
        if (done.valid() && done.wait_for(core_->cfg.stopTimeout) != std::future_status::ready) {
            LOG_VIDEO_ERROR("pipeline {} did not finish within {} ms, leaving it to exit on its own", what,
                            core_->cfg.stopTimeout.count());
            t.detach();
            return false;
        }
        t.join();
        return true;
    }

    void StreamingPipeline::stop() {
        std::lock_guard<std::mutex> lk(lifecycleMtx_);
        Core &c = *core_;
        c.requestStop();

        bool tickJoined = joinOrAbandon(tickThread_, tickDone_, "tick-loop");
        joinOrAbandon(sendThread_, sendDone_, "sender");

        if (tickJoined) {
            c.releaseHandles();
        } else {
            LOG_VIDEO_WARN("capture and encoder handles will be released when the current frame completes");
        }
        if (c.running.exchange(false)) {
            auto s = c.perf.snapshot();
            LOG_VIDEO_INFO("pipeline stopped: {} sent, {} skipped, {} superseded, {:.1f} fps", s.sentFrames,
                           s.skippedFrames, s.supersededFrames, s.fps);
        }
    }

    // ---------------- Core ----------------

    EncoderConfig StreamingPipeline::Core::activeConfig() const {
        std::lock_guard<std::mutex> lk(configMtx);
        return config;
    }

    void StreamingPipeline::Core::requestStop() {
        {
            std::lock_guard<std::mutex> wk(waitMtx);
            stopRequested.store(true);
        }
        waitCv.notify_all();
        if (outbound) outbound->close();
    }

    void StreamingPipeline::Core::releaseHandles() {
        std::lock_guard<std::mutex> lk(handlesMtx);
        if (!handlesHeld) return;
        handlesHeld = false;
        capture->release();
        encoder->release();
        LOG_VIDEO_DEBUG("capture and encoder handles released");
    }

    bool StreamingPipeline::Core::waitUntil(steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lk(waitMtx);
        waitCv.wait_until(lk, deadline, [this] { return stopRequested.load(); });
        return !stopRequested.load();
    }

    void StreamingPipeline::Core::applyPendingConfig() {
        std::optional<EncoderConfig> next;
        EncoderConfig current;
        {
            std::lock_guard<std::mutex> lk(configMtx);
            next.swap(pendingConfig);
            current = config;
        }
        if (!next || *next == current) return;

        Status st = encoder->configure(*next);
        if (!st) {
            LOG_VIDEO_ERROR("encoder rejected {}x{}@{} {} bps, keeping previous config: {}", next->width, next->height,
                            next->targetFps, next->targetBitrate, st.error().message);
            Status back = encoder->configure(current);
            if (!back) LOG_VIDEO_ERROR("encoder restore failed: {}", back.error().message);
            return;
        }
        {
            std::lock_guard<std::mutex> lk(configMtx);
            config = *next;
        }
        keyframeRequested.store(true);
        LOG_VIDEO_INFO("encoder reconfigured: {}x{}@{} {} bps", next->width, next->height, next->targetFps,
                       next->targetBitrate);
    }

    void StreamingPipeline::Core::onFrameFailure(const std::string &reason) {
        perf.recordSkipped();
        ++consecutiveFailures;
        LOG_VIDEO_WARN("frame skipped ({}), {} consecutive", reason, consecutiveFailures);
        if (consecutiveFailures < cfg.maxConsecutiveFailures) return;

        std::string stateName = "unknown";
        FatalHandler handler;
        {
            std::lock_guard<std::mutex> lk(handlerMtx);
            handler = fatalHandler;
            if (stateProvider) stateName = session::connectionStateName(stateProvider());
        }
        Error err = makeError(ErrorKind::EncodeError,
                              fmt::format("{} consecutive frame failures, last: {} (connection {})",
                                          consecutiveFailures, reason, stateName));
        LOG_VIDEO_ERROR("pipeline stopping: {}", err.message);

        failed.store(true);
        stopRequested.store(true);
        if (outbound) outbound->close();
        releaseHandles();
        running.store(false);

        if (handler) {
            try {
                handler(err);
            } catch (const std::exception &e) {
                LOG_VIDEO_ERROR("fatal handler threw: {}", e.what());
            }
        }
    }

    void StreamingPipeline::Core::tick(microseconds period) {
        RawFrame raw;
        CaptureStatus cs = capture->nextFrame(raw, duration_cast<milliseconds>(period));
        if (cs == CaptureStatus::Timeout) {
            onFrameFailure("capture timeout");
            return;
        }
        if (cs == CaptureStatus::Error) {
            onFrameFailure("capture error");
            return;
        }

        uint32_t fps = activeConfig().targetFps;
        bool force = keyframeRequested.exchange(false) || framesSinceKeyframe + 1 >= fps;

        auto t0 = steady_clock::now();
        Result<EncodedFrame> r = encoder->encode(raw, force);
        auto encodeTime = duration_cast<microseconds>(steady_clock::now() - t0);
        if (!r) {
            if (force) keyframeRequested.store(true);
            onFrameFailure(r.error().message);
            return;
        }
        consecutiveFailures = 0;
        framesSinceKeyframe = force ? 0 : framesSinceKeyframe + 1;

        EncodedFrame frame = r.takeValue();
        if (frame.payload.empty()) return; // encoder is still buffering

        frame.sequenceNumber = sequence++;
        if (frame.captureTimestamp == 0) frame.captureTimestamp = raw.captureTimestampUs;
        perf.recordEncoded(encodeTime, frame.isKeyframe);

        uint64_t before = outbound->dropped();
        if (!outbound->push(std::move(frame))) return; // closed
        uint64_t after = outbound->dropped();
        if (after > before) {
            perf.recordSuperseded(after - before);
            LOG_VIDEO_DEBUG("transport busy, unsent frame superseded");
        }
    }

    void StreamingPipeline::Core::tickLoop() {
        LOG_VIDEO_DEBUG("tick-loop started");
        auto next = steady_clock::now();
        while (!stopRequested.load()) {
            applyPendingConfig();
            uint32_t fps = activeConfig().targetFps;
            microseconds period(1000000 / (fps ? fps : 1));

            tick(period);
            if (failed.load()) break;

            next += period;
            auto now = steady_clock::now();
            if (next < now) next = now; // behind schedule: no catch-up burst
            if (!waitUntil(next)) break;
        }
        LOG_VIDEO_DEBUG("tick-loop exiting");
    }

    void StreamingPipeline::Core::sendLoop() {
        LOG_VIDEO_DEBUG("sender started");
        auto queue = outbound;
        while (!stopRequested.load()) {
            if (!screen->isOpen() || !screen->canSend()) {
                std::this_thread::sleep_for(cfg.sendPollInterval);
                continue;
            }
            auto frame = queue->pop(milliseconds(100));
            if (!frame) {
                if (queue->closed()) break;
                continue;
            }
            Status st = screen->send(buildVideoPacket(*frame));
            if (st) {
                perf.recordSent();
                LOG_VIDEO_TRACE("frame #{} sent ({} bytes{})", frame->sequenceNumber, frame->payload.size(),
                                frame->isKeyframe ? ", keyframe" : "");
            } else {
                LOG_VIDEO_WARN("screen channel send failed for frame #{}: {}", frame->sequenceNumber, st.error().message);
            }
        }
        LOG_VIDEO_DEBUG("sender exiting");
    }

} // namespace peerlink::video
