/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/video_packet.hpp>
#include <peerlink/common.hpp>
#include <peerlink/logger.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <cstring>

namespace peerlink::video {

    using namespace peerlink::common;

    std::string hexdumpPrefix(const uint8_t *data, size_t len, size_t maxBytes) {
        size_t n = std::min(len, maxBytes);
        std::string out;
        out.reserve(n * 3 + 24);
        for (size_t i = 0; i < n; ++i) {
            out += fmt::format("{:02x}", data[i]);
            if (i + 1 < n) out += ' ';
        }
        if (len > n) out += fmt::format(" ... (+{} bytes)", len - n);
        return out;
    }

    std::vector<uint8_t> buildVideoPacket(const EncodedFrame &frame) {
        VideoPacketHeader net{};
        net.magic = hton_u32(VIDEO_PACKET_MAGIC);
        net.sequence = hton_u32((uint32_t)(frame.sequenceNumber & 0xFFFFFFFFULL));
        net.flags = hton_u16(frame.isKeyframe ? VIDEO_FLAG_KEYFRAME : 0);
        net.reserved = 0;
        net.capture_ts_us = hton_u64(frame.captureTimestamp);
        net.payload_len = hton_u32((uint32_t)frame.payload.size());

        std::vector<uint8_t> out(VIDEO_PACKET_HEADER_SIZE + frame.payload.size());
        std::memcpy(out.data(), &net, VIDEO_PACKET_HEADER_SIZE);
        if (!frame.payload.empty()) {
            std::memcpy(out.data() + VIDEO_PACKET_HEADER_SIZE, frame.payload.data(), frame.payload.size());
        }
        return out;
    }

    Result<EncodedFrame> parseVideoPacket(const uint8_t *data, size_t len) {
        if (!data || len < VIDEO_PACKET_HEADER_SIZE) {
            return Result<EncodedFrame>::err(ErrorKind::ProtocolError,
                                             fmt::format("video packet too short ({} bytes)", len));
        }
        VideoPacketHeader net{};
        std::memcpy(&net, data, VIDEO_PACKET_HEADER_SIZE);
        if (ntoh_u32(net.magic) != VIDEO_PACKET_MAGIC) {
            LOG_VIDEO_DEBUG("bad video packet magic: {}", hexdumpPrefix(data, len, 8));
            return Result<EncodedFrame>::err(ErrorKind::ProtocolError, "bad video packet magic");
        }
        uint32_t payloadLen = ntoh_u32(net.payload_len);
        if (payloadLen != len - VIDEO_PACKET_HEADER_SIZE) {
            return Result<EncodedFrame>::err(ErrorKind::ProtocolError,
                                             fmt::format("video payload length {} does not match packet ({} bytes)",
                                                         payloadLen, len - VIDEO_PACKET_HEADER_SIZE));
        }

        EncodedFrame f;
        f.sequenceNumber = ntoh_u32(net.sequence);
        f.isKeyframe = (ntoh_u16(net.flags) & VIDEO_FLAG_KEYFRAME) != 0;
        f.captureTimestamp = ntoh_u64(net.capture_ts_us);
        f.payload.assign(data + VIDEO_PACKET_HEADER_SIZE, data + len);
        return f;
    }

} // namespace peerlink::video
