/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/video_types.hpp>

#include <fmt/core.h>

namespace peerlink::video {

    const char *codecName(Codec c) {
        switch (c) {
            case Codec::H264: return "h264";
            case Codec::VP8:  return "vp8";
            case Codec::VP9:  return "vp9";
            case Codec::AV1:  return "av1";
        }
        return "unknown";
    }

    std::optional<Codec> codecFromName(const std::string &name) {
        if (name == "h264" || name == "H264") return Codec::H264;
        if (name == "vp8" || name == "VP8") return Codec::VP8;
        if (name == "vp9" || name == "VP9") return Codec::VP9;
        if (name == "av1" || name == "AV1") return Codec::AV1;
        return std::nullopt;
    }

    Status EncoderBounds::validate(const EncoderConfig &cfg) const {
        if (cfg.width < minWidth || cfg.width > maxWidth) {
            return Status::err(ErrorKind::ConfigError, fmt::format("width {} outside [{}, {}]", cfg.width, minWidth, maxWidth));
        }
        if (cfg.height < minHeight || cfg.height > maxHeight) {
            return Status::err(ErrorKind::ConfigError, fmt::format("height {} outside [{}, {}]", cfg.height, minHeight, maxHeight));
        }
        if (cfg.width % 2 != 0 || cfg.height % 2 != 0) {
            return Status::err(ErrorKind::ConfigError, fmt::format("resolution {}x{} must be even", cfg.width, cfg.height));
        }
        if (cfg.targetFps < minFps || cfg.targetFps > maxFps) {
            return Status::err(ErrorKind::ConfigError, fmt::format("fps {} outside [{}, {}]", cfg.targetFps, minFps, maxFps));
        }
        if (cfg.targetBitrate < minBitrate || cfg.targetBitrate > maxBitrate) {
            return Status::err(ErrorKind::ConfigError,
                               fmt::format("bitrate {} outside [{}, {}]", cfg.targetBitrate, minBitrate, maxBitrate));
        }
        return success();
    }

} // namespace peerlink::video
