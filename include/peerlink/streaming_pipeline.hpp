/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_STREAMING_PIPELINE_HPP
#define PEERLINK_STREAMING_PIPELINE_HPP

#pragma once

#include <peerlink/connection_state.hpp>
#include <peerlink/errors.hpp>
#include <peerlink/performance.hpp>
#include <peerlink/transport.hpp>
#include <peerlink/video_types.hpp>

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>

namespace peerlink::video {

    struct PipelineConfig {
        uint32_t maxConsecutiveFailures{10};
        std::chrono::milliseconds stopTimeout{2000};
        std::chrono::milliseconds sendPollInterval{5};
        EncoderBounds bounds;
    };

/**
 * @brief capture -> encode -> transmit at a fixed cadence (period = 1000 ms / targetFps).
 *
 * Two tasks: the tick-loop (capture + encode, CPU work runs to completion) and a sender that moves frames
 * to the `screen` channel. They share a depth-1 drop-oldest queue, so a frame the transport could not take
 * before the next tick is replaced by the newer one.
 *
 * Single-frame failures are skipped; maxConsecutiveFailures of them in a row stop the pipeline and report
 * a fatal EncodeError. Capture and encoder handles are released on every exit path, never while a
 * frame is being encoded: a tick-loop that misses stopTimeout is detached and releases them when its
 * current frame completes. A restart is refused until that happens.
 */
    class StreamingPipeline {
    public:
        using FatalHandler = std::function<void(const Error&)>;
        using StateProvider = std::function<session::ConnectionState()>;

        StreamingPipeline(std::shared_ptr<CaptureSource> capture, std::shared_ptr<VideoEncoder> encoder,
                          std::shared_ptr<transport::MediaChannel> screen, EncoderConfig initial,
                          PipelineConfig cfg = {});
        ~StreamingPipeline();

        StreamingPipeline(const StreamingPipeline&) = delete;
        StreamingPipeline& operator=(const StreamingPipeline&) = delete;

        /// No-op if already running.
        Status start();

        /// Safe to call any number of times.
        void stop();

        /// ConfigError if out of bounds; otherwise applied at the next tick boundary.
        Status updateConfig(const EncoderConfig &cfg);

        void requestKeyframe();

        bool running() const;
        bool failed() const;
        EncoderConfig activeConfig() const;
        PerformanceSnapshot snapshot() const;

        void setFatalHandler(FatalHandler handler);

        /// Used to attach the last known ConnectionState to a fatal report.
        void setStateProvider(StateProvider provider);

    private:
        struct Core;

        /// False if the thread had to be left running; it then releases the handles itself on exit.
        bool joinOrAbandon(std::thread &t, std::future<void> &done, const char *what);

        // everything the worker threads touch; they hold their own reference, so an abandoned
        // tick-loop never outlives it
        std::shared_ptr<Core> core_;

        std::mutex lifecycleMtx_;
        std::thread tickThread_;
        std::thread sendThread_;
        std::future<void> tickDone_;
        std::future<void> sendDone_;
    };

} // namespace peerlink::video

#endif // PEERLINK_STREAMING_PIPELINE_HPP
