/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_VIDEO_PACKET_HPP
#define PEERLINK_VIDEO_PACKET_HPP

#pragma once

#include <peerlink/errors.hpp>
#include <peerlink/video_types.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace peerlink::video {

/**
 * @brief Header prepended to each encoded frame on the `screen` channel.
 *
 * Fields are stored on the wire in network byte order.
 *
 * Layout (packed, 24 bytes):
 *   uint32_t magic;         // 'PLVF'
 *   uint32_t sequence;      // low 32 bits of EncodedFrame::sequenceNumber
 *   uint16_t flags;         // bit0 = keyframe
 *   uint16_t reserved;
 *   uint64_t capture_ts_us; // capture timestamp in microseconds
 *   uint32_t payload_len;   // bytes following the header
 */
#pragma pack(push,1)
    struct VideoPacketHeader {
        uint32_t magic;
        uint32_t sequence;
        uint16_t flags;
        uint16_t reserved;
        uint64_t capture_ts_us;
        uint32_t payload_len;
    };
#pragma pack(pop)

    constexpr size_t VIDEO_PACKET_HEADER_SIZE = sizeof(VideoPacketHeader);
    constexpr uint32_t VIDEO_PACKET_MAGIC = 0x504C5646; // "PLVF"
    constexpr uint16_t VIDEO_FLAG_KEYFRAME = 0x0001;

    static_assert(VIDEO_PACKET_HEADER_SIZE == 24, "VideoPacketHeader must stay 24 bytes on the wire");

    /// Build a wire packet: header (network order) + payload.
    std::vector<uint8_t> buildVideoPacket(const EncodedFrame &frame);

    /// Parse a wire packet. Short, truncated or foreign packets are a ProtocolError.
    Result<EncodedFrame> parseVideoPacket(const uint8_t *data, size_t len);

    /// Hex of the first bytes of a buffer, for debug logging.
    std::string hexdumpPrefix(const uint8_t *data, size_t len, size_t maxBytes = 32);

} // namespace peerlink::video

#endif // PEERLINK_VIDEO_PACKET_HPP
