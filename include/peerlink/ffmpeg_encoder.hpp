/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_FFMPEG_ENCODER_HPP
#define PEERLINK_FFMPEG_ENCODER_HPP

#pragma once

#include <peerlink/video_types.hpp>

#include <sys/types.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace peerlink::video {

    namespace h264 {
        constexpr uint8_t NAL_IDR = 5;
        constexpr uint8_t NAL_SPS = 7;
        constexpr uint8_t NAL_PPS = 8;
        constexpr uint8_t NAL_AUD = 9;

        /// Split an Annex-B buffer into NAL units (each keeps its start code).
        std::vector<std::vector<uint8_t>> splitNals(const std::vector<uint8_t> &data);

        /// NAL type of a unit that starts with a 3- or 4-byte start code, or 0xFF if malformed.
        uint8_t nalType(const std::vector<uint8_t> &nal);

        /**
         * @brief Pop complete access units from an accumulating encoder output buffer.
         *
         * An access unit is complete once the access unit delimiter of the next one has arrived, so the
         * last (possibly partial) unit always stays in `accum`.
         */
        std::vector<std::vector<uint8_t>> extractCompleteAccessUnits(std::vector<uint8_t> &accum);

        bool containsIdr(const std::vector<uint8_t> &accessUnit);
    } // namespace h264

/**
 * @brief Child encoder process with its stdin and stdout attached to non-blocking pipes.
 */
    class EncoderProcess {
    public:
        static std::unique_ptr<EncoderProcess> launch(const std::string &cmd, const std::vector<std::string> &args);

        ~EncoderProcess();

        EncoderProcess(const EncoderProcess&) = delete;
        EncoderProcess& operator=(const EncoderProcess&) = delete;

        /// Bytes written, 0 if the pipe is full, -1 on error (child gone).
        ssize_t writeSome(const uint8_t *buf, size_t len);

        /// Bytes read, 0 if nothing is available, -1 on EOF or error.
        ssize_t readSome(uint8_t *buf, size_t len);

        int writeFd() const { return writeFd_; }
        int readFd() const { return readFd_; }
        pid_t pid() const { return pid_; }

        /// Close the pipes and reap the child. Safe to call more than once.
        void stop();

    private:
        EncoderProcess() = default;

        int writeFd_{-1};
        int readFd_{-1};
        pid_t pid_{-1};
    };

/**
 * @brief H.264 encoder running ffmpeg/libx264 as a subprocess.
 *
 * Raw BGRA frames of any size go to ffmpeg's stdin and are scaled to the configured resolution;
 * Annex-B access units (with AUDs) are read back from stdout.
 * Output lags input by one frame. A forced keyframe off the GOP boundary restarts the child process,
 * whose first output is always an IDR.
 */
    class FfmpegEncoder : public VideoEncoder {
    public:
        explicit FfmpegEncoder(std::string ffmpegPath = "ffmpeg");
        ~FfmpegEncoder() override;

        Status configure(const EncoderConfig &cfg) override;
        Result<EncodedFrame> encode(const RawFrame &frame, bool forceKeyframe) override;
        void release() override;
        std::string name() const override { return "ffmpeg-libx264"; }

        /// ffmpeg command line for a given config; input frames of another size are scaled to cfg.
        static std::vector<std::string> buildArgs(const EncoderConfig &cfg, uint32_t inputWidth = 0,
                                                  uint32_t inputHeight = 0);

    private:
        Status restart();
        Status writeFrame(const RawFrame &frame);
        bool drainOutput(int timeoutMs);

        std::string ffmpegPath_;
        std::mutex mtx_;                             // release() waits for an in-flight encode()
        EncoderConfig config_;
        bool configured_{false};
        std::unique_ptr<EncoderProcess> process_;
        std::vector<uint8_t> accum_;
        uint64_t framesSinceStart_{0};
        uint32_t inputWidth_{0};
        uint32_t inputHeight_{0};
    };

} // namespace peerlink::video

#endif // PEERLINK_FFMPEG_ENCODER_HPP
