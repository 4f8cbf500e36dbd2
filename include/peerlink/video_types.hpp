/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_VIDEO_TYPES_HPP
#define PEERLINK_VIDEO_TYPES_HPP

#pragma once

#include <peerlink/errors.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace peerlink::video {

    enum class Codec {
        H264,
        VP8,
        VP9,
        AV1
    };

    const char *codecName(Codec c);
    std::optional<Codec> codecFromName(const std::string &name);

    struct EncoderConfig {
        uint32_t width{1920};
        uint32_t height{1080};
        uint32_t targetFps{30};
        uint32_t targetBitrate{2000000}; // bits per second
        Codec codec{Codec::H264};

        bool operator==(const EncoderConfig &o) const {
            return width == o.width && height == o.height && targetFps == o.targetFps &&
                   targetBitrate == o.targetBitrate && codec == o.codec;
        }
        bool operator!=(const EncoderConfig &o) const { return !(*this == o); }
    };

/**
 * @brief Limits an EncoderConfig must respect. Configs outside are rejected with ConfigError.
 */
    struct EncoderBounds {
        uint32_t minWidth{160};
        uint32_t maxWidth{3840};
        uint32_t minHeight{120};
        uint32_t maxHeight{2160};
        uint32_t minFps{1};
        uint32_t maxFps{60};
        uint32_t minBitrate{100000};
        uint32_t maxBitrate{20000000};

        Status validate(const EncoderConfig &cfg) const;
    };

    enum class PixelFormat {
        BGRA,
        RGBA
    };

    struct RawFrame {
        std::vector<uint8_t> pixels;
        uint32_t width{0};
        uint32_t height{0};
        uint32_t stride{0}; // bytes per row
        PixelFormat format{PixelFormat::BGRA};
        uint64_t captureTimestampUs{0};
    };

/**
 * @brief Produced once by the pipeline, consumed once by the screen channel sender.
 */
    struct EncodedFrame {
        std::vector<uint8_t> payload;
        bool isKeyframe{false};
        uint64_t captureTimestamp{0}; // microseconds, capture clock
        uint64_t sequenceNumber{0};
    };

    enum class CaptureStatus {
        Frame,
        Timeout,
        Error
    };

/**
 * @brief Platform screen capture, implemented outside the core.
 */
    class CaptureSource {
    public:
        virtual ~CaptureSource() = default;

        virtual CaptureStatus nextFrame(RawFrame &out, std::chrono::milliseconds timeout) = 0;

        /// Release the capture handle. Must be idempotent.
        virtual void release() {}
    };

/**
 * @brief Frame compressor.
 *
 * encode() may return a frame with an empty payload when the encoder buffers input (pipeline latency);
 * that is not an error.
 */
    class VideoEncoder {
    public:
        virtual ~VideoEncoder() = default;

        virtual Status configure(const EncoderConfig &cfg) = 0;
        virtual Result<EncodedFrame> encode(const RawFrame &frame, bool forceKeyframe) = 0;

        /// Release encoder state and any child process. Must be idempotent.
        virtual void release() = 0;

        virtual std::string name() const = 0;
    };

} // namespace peerlink::video

#endif // PEERLINK_VIDEO_TYPES_HPP
