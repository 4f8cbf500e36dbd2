/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/test_pattern.hpp>
#include <peerlink/logger.hpp>

#include <array>

namespace peerlink::video {

    namespace {
        // BGRA
        const std::array<std::array<uint8_t, 4>, 8> kBars = {{
            {{255, 255, 255, 255}}, {{0, 255, 255, 255}}, {{255, 255, 0, 255}}, {{0, 255, 0, 255}},
            {{255, 0, 255, 255}},   {{0, 0, 255, 255}},   {{255, 0, 0, 255}},   {{16, 16, 16, 255}},
        }};
    }

    TestPatternCapture::TestPatternCapture(uint32_t width, uint32_t height)
            : width_(width), height_(height), epoch_(std::chrono::steady_clock::now()) {}

    CaptureStatus TestPatternCapture::nextFrame(RawFrame &out, std::chrono::milliseconds) {
        if (width_ == 0 || height_ == 0) return CaptureStatus::Error;
        released_.store(false); // reopened lazily after release()

        uint64_t index = frameIndex_.fetch_add(1);
        out.width = width_;
        out.height = height_;
        out.stride = width_ * 4;
        out.format = PixelFormat::BGRA;
        out.captureTimestampUs = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - epoch_).count());
        out.pixels.resize(static_cast<size_t>(out.stride) * height_);

        const uint32_t barWidth = width_ / kBars.size() ? width_ / kBars.size() : 1;
        const uint32_t shift = static_cast<uint32_t>(index * 4 % width_);
        const uint32_t block = height_ / 8 ? height_ / 8 : 1;
        const uint32_t blockX = static_cast<uint32_t>(index * 8 % (width_ > block ? width_ - block : 1));
        const uint32_t blockY = height_ / 2 - block / 2;

        for (uint32_t y = 0; y < height_; ++y) {
            uint8_t *row = out.pixels.data() + static_cast<size_t>(y) * out.stride;
            for (uint32_t x = 0; x < width_; ++x) {
                const auto &c = kBars[((x + shift) / barWidth) % kBars.size()];
                uint8_t *px = row + static_cast<size_t>(x) * 4;
                bool inBlock = x >= blockX && x < blockX + block && y >= blockY && y < blockY + block;
                px[0] = inBlock ? 0 : c[0];
                px[1] = inBlock ? 0 : c[1];
                px[2] = inBlock ? 0 : c[2];
                px[3] = 255;
            }
        }
        return CaptureStatus::Frame;
    }

    void TestPatternCapture::release() {
        if (!released_.exchange(true)) {
            LOG_VIDEO_DEBUG("test pattern released after {} frames", frameIndex_.load());
        }
    }

} // namespace peerlink::video
