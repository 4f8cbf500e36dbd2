/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <peerlink/video_packet.hpp>
#include <peerlink/ffmpeg_encoder.hpp>
#include <peerlink/performance.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace peerlink;
using namespace peerlink::video;

namespace {

    bool hasPair(const std::vector<std::string> &args, const std::string &flag, const std::string &value) {
        for (size_t i = 0; i + 1 < args.size(); ++i) {
            if (args[i] == flag && args[i + 1] == value) return true;
        }
        return false;
    }

    void appendNal(std::vector<uint8_t> &buf, uint8_t type, size_t bodyLen, bool longStartCode = true) {
        if (longStartCode) buf.push_back(0);
        buf.push_back(0);
        buf.push_back(0);
        buf.push_back(1);
        buf.push_back(type);
        for (size_t i = 0; i < bodyLen; ++i) buf.push_back(0xAB);
    }

} // namespace

TEST_CASE("video packet header carries sequence, flags and timestamp", "[video_packet]") {
    EncodedFrame f;
    f.payload = {0x00, 0x00, 0x00, 0x01, 0x09, 0xF0};
    f.isKeyframe = true;
    f.captureTimestamp = 123456789012ULL;
    f.sequenceNumber = 77;

    auto pkt = buildVideoPacket(f);
    REQUIRE(pkt.size() == VIDEO_PACKET_HEADER_SIZE + f.payload.size());
    // magic in network order
    REQUIRE(pkt[0] == 'P');
    REQUIRE(pkt[1] == 'L');
    REQUIRE(pkt[2] == 'V');
    REQUIRE(pkt[3] == 'F');

    auto back = parseVideoPacket(pkt.data(), pkt.size());
    REQUIRE(back);
    REQUIRE(back.value().sequenceNumber == 77);
    REQUIRE(back.value().isKeyframe);
    REQUIRE(back.value().captureTimestamp == 123456789012ULL);
    REQUIRE(back.value().payload == f.payload);
}

TEST_CASE("delta frames have the keyframe flag cleared", "[video_packet]") {
    EncodedFrame f;
    f.payload = {1, 2, 3};
    f.sequenceNumber = 5;
    auto pkt = buildVideoPacket(f);
    auto back = parseVideoPacket(pkt.data(), pkt.size());
    REQUIRE(back);
    REQUIRE_FALSE(back.value().isKeyframe);
}

TEST_CASE("damaged video packets are a ProtocolError", "[video_packet]") {
    EncodedFrame f;
    f.payload = {1, 2, 3, 4};
    auto pkt = buildVideoPacket(f);

    SECTION("too short") {
        auto r = parseVideoPacket(pkt.data(), VIDEO_PACKET_HEADER_SIZE - 1);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().kind == ErrorKind::ProtocolError);
    }
    SECTION("null buffer") {
        REQUIRE_FALSE(parseVideoPacket(nullptr, 0));
    }
    SECTION("bad magic") {
        pkt[0] = 'X';
        auto r = parseVideoPacket(pkt.data(), pkt.size());
        REQUIRE_FALSE(r);
        REQUIRE(r.error().message.find("magic") != std::string::npos);
    }
    SECTION("truncated payload") {
        auto r = parseVideoPacket(pkt.data(), pkt.size() - 1);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().kind == ErrorKind::ProtocolError);
    }
}

TEST_CASE("hexdumpPrefix truncates long buffers", "[video_packet]") {
    std::vector<uint8_t> d = {0xde, 0xad, 0xbe, 0xef, 0x01};
    REQUIRE(hexdumpPrefix(d.data(), d.size(), 8) == "de ad be ef 01");
    REQUIRE(hexdumpPrefix(d.data(), d.size(), 2) == "de ad ... (+3 bytes)");
}

TEST_CASE("splitNals keeps start codes of both lengths", "[h264]") {
    std::vector<uint8_t> buf;
    appendNal(buf, h264::NAL_AUD, 1);
    appendNal(buf, h264::NAL_SPS, 4, false);
    appendNal(buf, 0x65, 10); // nal_ref_idc 3, type 5

    auto nals = h264::splitNals(buf);
    REQUIRE(nals.size() == 3);
    REQUIRE(h264::nalType(nals[0]) == h264::NAL_AUD);
    REQUIRE(h264::nalType(nals[1]) == h264::NAL_SPS);
    REQUIRE(h264::nalType(nals[2]) == h264::NAL_IDR);
    REQUIRE(nals[1].size() == 3 + 1 + 4);

    REQUIRE(h264::nalType(std::vector<uint8_t>{0, 0, 1}) == 0xFF);
    REQUIRE(h264::nalType(std::vector<uint8_t>{1, 2, 3, 4}) == 0xFF);
}

TEST_CASE("access units are released once the next delimiter arrives", "[h264]") {
    std::vector<uint8_t> accum;
    appendNal(accum, h264::NAL_AUD, 1);
    appendNal(accum, h264::NAL_SPS, 3);
    appendNal(accum, h264::NAL_PPS, 2);
    appendNal(accum, 0x65, 20);

    // only one unit so far, and it may still be growing
    REQUIRE(h264::extractCompleteAccessUnits(accum).empty());
    size_t firstSize = accum.size();

    appendNal(accum, h264::NAL_AUD, 1);
    appendNal(accum, 0x41, 12); // non-IDR slice

    auto units = h264::extractCompleteAccessUnits(accum);
    REQUIRE(units.size() == 1);
    REQUIRE(units[0].size() == firstSize);
    REQUIRE(h264::containsIdr(units[0]));

    // the partial second unit stays behind
    REQUIRE(h264::nalType(h264::splitNals(accum).front()) == h264::NAL_AUD);
    REQUIRE_FALSE(h264::containsIdr(accum));
}

TEST_CASE("bytes before the first delimiter are discarded", "[h264]") {
    std::vector<uint8_t> accum = {0xFF, 0xFF, 0xFF};
    appendNal(accum, h264::NAL_AUD, 1);
    appendNal(accum, 0x41, 4);
    appendNal(accum, h264::NAL_AUD, 1);

    auto units = h264::extractCompleteAccessUnits(accum);
    REQUIRE(units.size() == 1);
    REQUIRE(units[0][0] == 0);
    REQUIRE(h264::nalType(h264::splitNals(units[0]).front()) == h264::NAL_AUD);
}

TEST_CASE("ffmpeg arguments follow the encoder config", "[encoder]") {
    EncoderConfig cfg;
    cfg.width = 1280;
    cfg.height = 720;
    cfg.targetFps = 30;
    cfg.targetBitrate = 2500000;

    auto args = FfmpegEncoder::buildArgs(cfg);
    REQUIRE(hasPair(args, "-s", "1280x720"));
    REQUIRE(hasPair(args, "-vf", "scale=1280:720"));
    REQUIRE(hasPair(args, "-b:v", "2500k"));
    REQUIRE(hasPair(args, "-g", "30"));
    REQUIRE(hasPair(args, "-c:v", "libx264"));
    REQUIRE(args.back() == "-");

    SECTION("captured frames of another size are scaled") {
        auto scaled = FfmpegEncoder::buildArgs(cfg, 1920, 1080);
        REQUIRE(hasPair(scaled, "-s", "1920x1080"));
        REQUIRE(hasPair(scaled, "-vf", "scale=1280:720"));
    }
}

TEST_CASE("the ffmpeg encoder only speaks h264", "[encoder]") {
    FfmpegEncoder enc("/nonexistent/ffmpeg");
    EncoderConfig cfg;
    cfg.codec = Codec::VP9;
    auto st = enc.configure(cfg);
    REQUIRE_FALSE(st);
    REQUIRE(st.error().kind == ErrorKind::ConfigError);
    enc.release();
    enc.release();
}

TEST_CASE("encoder bounds", "[encoder]") {
    EncoderBounds b;
    EncoderConfig cfg;
    REQUIRE(b.validate(cfg));

    SECTION("odd resolution") {
        cfg.width = 1281;
        REQUIRE(b.validate(cfg).error().kind == ErrorKind::ConfigError);
    }
    SECTION("too small") {
        cfg.height = 100;
        REQUIRE_FALSE(b.validate(cfg));
    }
    SECTION("fps out of range") {
        cfg.targetFps = 0;
        REQUIRE_FALSE(b.validate(cfg));
        cfg.targetFps = 61;
        REQUIRE_FALSE(b.validate(cfg));
    }
    SECTION("bitrate out of range") {
        cfg.targetBitrate = 99999;
        REQUIRE_FALSE(b.validate(cfg));
        cfg.targetBitrate = 20000001;
        REQUIRE_FALSE(b.validate(cfg));
    }
}

TEST_CASE("codec names", "[encoder]") {
    REQUIRE(std::string(codecName(Codec::VP8)) == "vp8");
    REQUIRE(codecFromName("H264") == std::optional<Codec>(Codec::H264));
    REQUIRE(codecFromName("av1") == std::optional<Codec>(Codec::AV1));
    REQUIRE_FALSE(codecFromName("mpeg2").has_value());
}

TEST_CASE("performance monitor averages sends and encodes", "[performance]") {
    PerformanceMonitor mon(4);
    auto t0 = std::chrono::steady_clock::now();
    for (int i = 0; i < 5; ++i) mon.recordSent(t0 + std::chrono::milliseconds(50 * i));
    mon.recordEncoded(std::chrono::microseconds(2000), true);
    mon.recordEncoded(std::chrono::microseconds(4000), false);
    mon.recordSkipped();
    mon.recordSuperseded(2);

    auto s = mon.snapshot();
    REQUIRE(s.fps == Approx(20.0));
    REQUIRE(s.encodeTimeMs == Approx(3.0));
    REQUIRE(s.sentFrames == 5);
    REQUIRE(s.encodedFrames == 2);
    REQUIRE(s.keyframes == 1);
    REQUIRE(s.droppedFrameCount == 3);

    mon.reset();
    REQUIRE(mon.snapshot().sentFrames == 0);
    REQUIRE(mon.snapshot().fps == 0.0);
}
