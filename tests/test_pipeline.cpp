/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <peerlink/streaming_pipeline.hpp>
#include <peerlink/test_pattern.hpp>
#include <peerlink/video_packet.hpp>

#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

using namespace peerlink;
using namespace peerlink::video;

namespace {

    class ScriptedCapture : public CaptureSource {
    public:
        /// Statuses returned first, in order; afterwards every call yields a frame.
        explicit ScriptedCapture(std::deque<CaptureStatus> script = {}) : script_(std::move(script)) {}

        CaptureStatus nextFrame(RawFrame &out, std::chrono::milliseconds) override {
            std::lock_guard<std::mutex> lk(mtx_);
            ++calls_;
            if (!script_.empty()) {
                CaptureStatus s = script_.front();
                script_.pop_front();
                if (s != CaptureStatus::Frame) return s;
            }
            out.width = 320;
            out.height = 240;
            out.stride = 320 * 4;
            out.pixels.assign((size_t)out.stride * out.height, 0x40);
            out.captureTimestampUs = 1000 + calls_;
            return CaptureStatus::Frame;
        }

        void release() override { ++releases; }

        std::atomic<int> releases{0};

    private:
        std::mutex mtx_;
        std::deque<CaptureStatus> script_;
        uint64_t calls_{0};
    };

    class FakeEncoder : public VideoEncoder {
    public:
        Status configure(const EncoderConfig &cfg) override {
            std::lock_guard<std::mutex> lk(mtx);
            configs.push_back(cfg);
            return success();
        }

        Result<EncodedFrame> encode(const RawFrame &frame, bool forceKeyframe) override {
            std::lock_guard<std::mutex> lk(mtx);
            forced.push_back(forceKeyframe);
            if (failuresLeft != 0) {
                if (failuresLeft > 0) --failuresLeft;
                return makeError(ErrorKind::EncodeError, "encoder stalled");
            }
            EncodedFrame f;
            f.payload = {0, 0, 0, 1, uint8_t(forceKeyframe ? 0x65 : 0x41), 0x88};
            f.isKeyframe = forceKeyframe;
            f.captureTimestamp = frame.captureTimestampUs;
            return f;
        }

        void release() override { ++releases; }
        std::string name() const override { return "fake"; }

        size_t encodeCalls() {
            std::lock_guard<std::mutex> lk(mtx);
            return forced.size();
        }

        std::mutex mtx;
        std::vector<EncoderConfig> configs;
        std::vector<bool> forced;
        int failuresLeft{0}; // -1 fails forever
        std::atomic<int> releases{0};
    };

    class FakeScreen : public transport::MediaChannel {
    public:
        transport::ChannelLabel label() const override { return transport::ChannelLabel::Screen; }
        bool isOpen() const override { return true; }
        bool canSend() const override { return writable.load(); }

        Status send(const transport::Bytes &data) override {
            std::lock_guard<std::mutex> lk(mtx);
            auto parsed = parseVideoPacket(data.data(), data.size());
            if (!parsed) return parsed.error();
            packets.push_back(parsed.takeValue());
            return success();
        }

        std::optional<transport::Bytes> receive(std::chrono::milliseconds) override { return std::nullopt; }
        void close() override {}

        std::vector<EncodedFrame> sent() {
            std::lock_guard<std::mutex> lk(mtx);
            return packets;
        }

        std::atomic<bool> writable{true};
        std::mutex mtx;
        std::vector<EncodedFrame> packets;
    };

    EncoderConfig smallConfig(uint32_t fps = 30) {
        EncoderConfig c;
        c.width = 320;
        c.height = 240;
        c.targetFps = fps;
        c.targetBitrate = 500000;
        return c;
    }

    bool waitFor(const std::function<bool()> &pred, std::chrono::milliseconds limit = std::chrono::milliseconds(5000)) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return pred();
    }

} // namespace

TEST_CASE("capture timeouts skip frames and the pipeline resumes", "[pipeline]") {
    auto capture = std::make_shared<ScriptedCapture>(
            std::deque<CaptureStatus>{CaptureStatus::Timeout, CaptureStatus::Timeout, CaptureStatus::Timeout});
    auto encoder = std::make_shared<FakeEncoder>();
    auto screen = std::make_shared<FakeScreen>();
    StreamingPipeline p(capture, encoder, screen, smallConfig(30));

    bool fatal = false;
    p.setFatalHandler([&fatal](const Error &) { fatal = true; });

    REQUIRE(p.start());
    REQUIRE(waitFor([&] { return screen->sent().size() >= 2; }));

    auto snap = p.snapshot();
    REQUIRE(snap.skippedFrames == 3);
    REQUIRE(p.running());
    REQUIRE_FALSE(p.failed());
    REQUIRE_FALSE(fatal);

    // the first frame after the outage is the initial keyframe
    auto sent = screen->sent();
    REQUIRE(sent[0].isKeyframe);
    REQUIRE(sent[0].sequenceNumber == 0);
    p.stop();
}

TEST_CASE("start and stop are idempotent and release handles once", "[pipeline]") {
    auto capture = std::make_shared<ScriptedCapture>();
    auto encoder = std::make_shared<FakeEncoder>();
    auto screen = std::make_shared<FakeScreen>();
    StreamingPipeline p(capture, encoder, screen, smallConfig());

    REQUIRE(p.start());
    REQUIRE(p.start());
    REQUIRE(encoder->configs.size() == 1);
    REQUIRE(waitFor([&] { return !screen->sent().empty(); }));

    p.stop();
    p.stop();
    REQUIRE_FALSE(p.running());
    REQUIRE(capture->releases.load() == 1);
    REQUIRE(encoder->releases.load() == 1);

    // a stopped pipeline can be restarted
    REQUIRE(p.start());
    REQUIRE(p.running());
    p.stop();
    REQUIRE(capture->releases.load() == 2);
}

TEST_CASE("stop without start does not touch the handles", "[pipeline]") {
    auto capture = std::make_shared<ScriptedCapture>();
    auto encoder = std::make_shared<FakeEncoder>();
    StreamingPipeline p(capture, encoder, std::make_shared<FakeScreen>(), smallConfig());
    p.stop();
    REQUIRE(capture->releases.load() == 0);
    REQUIRE(encoder->releases.load() == 0);
}

TEST_CASE("start rejects missing collaborators and bad configs", "[pipeline]") {
    auto capture = std::make_shared<ScriptedCapture>();
    auto encoder = std::make_shared<FakeEncoder>();

    StreamingPipeline noScreen(capture, encoder, nullptr, smallConfig());
    auto st = noScreen.start();
    REQUIRE_FALSE(st);
    REQUIRE(st.error().kind == ErrorKind::ConfigError);

    EncoderConfig bad = smallConfig();
    bad.targetFps = 0;
    StreamingPipeline badFps(capture, encoder, std::make_shared<FakeScreen>(), bad);
    st = badFps.start();
    REQUIRE_FALSE(st);
    REQUIRE(st.error().kind == ErrorKind::ConfigError);
    REQUIRE_FALSE(badFps.running());
}

TEST_CASE("updateConfig validates bounds and reconfigures at a tick boundary", "[pipeline]") {
    auto capture = std::make_shared<ScriptedCapture>();
    auto encoder = std::make_shared<FakeEncoder>();
    auto screen = std::make_shared<FakeScreen>();
    StreamingPipeline p(capture, encoder, screen, smallConfig());
    REQUIRE(p.start());
    REQUIRE(waitFor([&] { return encoder->encodeCalls() >= 3; }));

    EncoderConfig tooFast = smallConfig(240);
    auto st = p.updateConfig(tooFast);
    REQUIRE_FALSE(st);
    REQUIRE(st.error().kind == ErrorKind::ConfigError);

    EncoderConfig lower = smallConfig();
    lower.targetBitrate = 300000;
    size_t before = encoder->encodeCalls();
    REQUIRE(p.updateConfig(lower));
    REQUIRE(waitFor([&] { return p.activeConfig().targetBitrate == 300000; }));
    REQUIRE(waitFor([&] { return encoder->encodeCalls() > before + 1; }));

    std::lock_guard<std::mutex> lk(encoder->mtx);
    REQUIRE(encoder->configs.size() == 2);
    REQUIRE(encoder->configs.back().targetBitrate == 300000);
    // the frame after a reconfiguration is forced to be a keyframe
    bool sawForced = false;
    for (size_t i = before; i < encoder->forced.size(); ++i) sawForced = sawForced || encoder->forced[i];
    REQUIRE(sawForced);
}

TEST_CASE("a keyframe is forced once per second of frames", "[pipeline]") {
    auto capture = std::make_shared<ScriptedCapture>();
    auto encoder = std::make_shared<FakeEncoder>();
    auto screen = std::make_shared<FakeScreen>();
    StreamingPipeline p(capture, encoder, screen, smallConfig(20));
    REQUIRE(p.start());
    REQUIRE(waitFor([&] { return encoder->encodeCalls() >= 41; }));
    p.stop();

    std::lock_guard<std::mutex> lk(encoder->mtx);
    REQUIRE(encoder->forced[0]);
    for (size_t i = 1; i < 20; ++i) REQUIRE_FALSE(encoder->forced[i]);
    REQUIRE(encoder->forced[20]);
    REQUIRE(encoder->forced[40]);
}

TEST_CASE("requestKeyframe forces the next frame", "[pipeline]") {
    auto capture = std::make_shared<ScriptedCapture>();
    auto encoder = std::make_shared<FakeEncoder>();
    StreamingPipeline p(capture, encoder, std::make_shared<FakeScreen>(), smallConfig(30));
    REQUIRE(p.start());
    REQUIRE(waitFor([&] { return encoder->encodeCalls() >= 3; }));
    size_t mark = encoder->encodeCalls();
    p.requestKeyframe();
    REQUIRE(waitFor([&] { return encoder->encodeCalls() >= mark + 2; }));
    p.stop();

    std::lock_guard<std::mutex> lk(encoder->mtx);
    bool sawForced = false;
    for (size_t i = mark; i < mark + 2; ++i) sawForced = sawForced || encoder->forced[i];
    REQUIRE(sawForced);
}

TEST_CASE("a blocked transport keeps only the newest frame", "[pipeline]") {
    auto capture = std::make_shared<ScriptedCapture>();
    auto encoder = std::make_shared<FakeEncoder>();
    auto screen = std::make_shared<FakeScreen>();
    screen->writable = false;
    StreamingPipeline p(capture, encoder, screen, smallConfig(30));
    REQUIRE(p.start());

    REQUIRE(waitFor([&] { return p.snapshot().supersededFrames >= 3; }));
    REQUIRE(screen->sent().empty());

    screen->writable = true;
    REQUIRE(waitFor([&] { return screen->sent().size() >= 3; }));
    p.stop();

    auto sent = screen->sent();
    // the first delivered frame is a recent one, not the oldest encoded frame
    REQUIRE(sent[0].sequenceNumber >= 3);
    for (size_t i = 1; i < sent.size(); ++i) REQUIRE(sent[i].sequenceNumber > sent[i - 1].sequenceNumber);
    auto snap = p.snapshot();
    REQUIRE(snap.droppedFrameCount == snap.supersededFrames + snap.skippedFrames);
}

TEST_CASE("consecutive encode failures past the threshold stop the pipeline", "[pipeline]") {
    auto capture = std::make_shared<ScriptedCapture>();
    auto encoder = std::make_shared<FakeEncoder>();
    encoder->failuresLeft = -1;
    PipelineConfig cfg;
    cfg.maxConsecutiveFailures = 5;
    StreamingPipeline p(capture, encoder, std::make_shared<FakeScreen>(), smallConfig(30), cfg);

    std::mutex mtx;
    std::vector<Error> errors;
    p.setFatalHandler([&](const Error &e) {
        std::lock_guard<std::mutex> lk(mtx);
        errors.push_back(e);
    });
    p.setStateProvider([] { return session::ConnectionState::Connected; });

    REQUIRE(p.start());
    REQUIRE(waitFor([&] { return p.failed(); }));
    REQUIRE_FALSE(p.running());
    REQUIRE(waitFor([&] {
        std::lock_guard<std::mutex> lk(mtx);
        return !errors.empty();
    }));
    {
        std::lock_guard<std::mutex> lk(mtx);
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0].kind == ErrorKind::EncodeError);
        REQUIRE(errors[0].message.find("Connected") != std::string::npos);
    }
    REQUIRE(p.snapshot().skippedFrames == 5);
    REQUIRE(encoder->releases.load() == 1);
    REQUIRE(capture->releases.load() == 1);

    p.stop();
    REQUIRE(encoder->releases.load() == 1);
}

TEST_CASE("a failed forced keyframe is retried on the next frame", "[pipeline]") {
    auto capture = std::make_shared<ScriptedCapture>();
    auto encoder = std::make_shared<FakeEncoder>();
    encoder->failuresLeft = 2;
    StreamingPipeline p(capture, encoder, std::make_shared<FakeScreen>(), smallConfig(30));
    REQUIRE(p.start());
    REQUIRE(waitFor([&] { return encoder->encodeCalls() >= 4; }));
    p.stop();

    std::lock_guard<std::mutex> lk(encoder->mtx);
    REQUIRE(encoder->forced[0]);
    REQUIRE(encoder->forced[1]);
    REQUIRE(encoder->forced[2]);
    REQUIRE_FALSE(encoder->forced[3]);
    REQUIRE_FALSE(p.failed());
}

namespace {

    class SlowEncoder : public VideoEncoder {
    public:
        Status configure(const EncoderConfig &) override { return success(); }

        Result<EncodedFrame> encode(const RawFrame &, bool) override {
            inEncode = true;
            std::this_thread::sleep_for(std::chrono::milliseconds(400));
            inEncode = false;
            ++encodes;
            EncodedFrame f;
            f.payload = {0, 0, 0, 1, 0x65};
            f.isKeyframe = true;
            return f;
        }

        void release() override {
            if (inEncode.load()) releasedDuringEncode = true;
            ++releases;
        }

        std::string name() const override { return "slow"; }

        std::atomic<bool> inEncode{false};
        std::atomic<bool> releasedDuringEncode{false};
        std::atomic<int> encodes{0};
        std::atomic<int> releases{0};
    };

} // namespace

TEST_CASE("a tick-loop that outlives stopTimeout releases its handles after the frame", "[pipeline]") {
    auto capture = std::make_shared<ScriptedCapture>();
    auto encoder = std::make_shared<SlowEncoder>();
    PipelineConfig cfg;
    cfg.stopTimeout = std::chrono::milliseconds(50);
    {
        StreamingPipeline p(capture, encoder, std::make_shared<FakeScreen>(), smallConfig(30), cfg);
        REQUIRE(p.start());
        REQUIRE(waitFor([&] { return encoder->inEncode.load(); }));
    }
    // the pipeline object is gone; the detached loop finishes its frame on its own state
    REQUIRE(waitFor([&] { return encoder->releases.load() == 1; }));
    REQUIRE_FALSE(encoder->releasedDuringEncode.load());
    REQUIRE(capture->releases.load() == 1);
}

TEST_CASE("restart waits for an abandoned tick-loop", "[pipeline]") {
    auto capture = std::make_shared<ScriptedCapture>();
    auto encoder = std::make_shared<SlowEncoder>();
    PipelineConfig cfg;
    cfg.stopTimeout = std::chrono::milliseconds(50);
    StreamingPipeline p(capture, encoder, std::make_shared<FakeScreen>(), smallConfig(30), cfg);
    REQUIRE(p.start());
    REQUIRE(waitFor([&] { return encoder->inEncode.load(); }));
    p.stop();

    auto busy = p.start();
    REQUIRE_FALSE(busy);
    REQUIRE(busy.error().kind == ErrorKind::Timeout);

    REQUIRE(waitFor([&] { return encoder->releases.load() == 1; }));
    REQUIRE(waitFor([&] { return static_cast<bool>(p.start()); }));
    p.stop();
    REQUIRE(waitFor([&] { return encoder->releases.load() == 2; }));
}

TEST_CASE("test pattern frames scroll and reopen after release", "[pipeline]") {
    TestPatternCapture cap(64, 32);
    RawFrame a;
    RawFrame b;
    REQUIRE(cap.nextFrame(a, std::chrono::milliseconds(10)) == CaptureStatus::Frame);
    REQUIRE(cap.nextFrame(b, std::chrono::milliseconds(10)) == CaptureStatus::Frame);
    REQUIRE(a.width == 64);
    REQUIRE(a.stride == 64 * 4);
    REQUIRE(a.pixels.size() == (size_t)64 * 32 * 4);
    REQUIRE(a.pixels != b.pixels);
    REQUIRE(b.captureTimestampUs >= a.captureTimestampUs);

    cap.release();
    REQUIRE(cap.released());
    REQUIRE(cap.nextFrame(a, std::chrono::milliseconds(10)) == CaptureStatus::Frame);
    REQUIRE(cap.framesProduced() == 3);

    TestPatternCapture empty(0, 32);
    REQUIRE(empty.nextFrame(a, std::chrono::milliseconds(10)) == CaptureStatus::Error);
}
