/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/performance.hpp>

namespace peerlink::video {

    PerformanceMonitor::PerformanceMonitor(size_t maxSamples) : maxSamples_(maxSamples == 0 ? 1 : maxSamples) {}

    void PerformanceMonitor::recordEncoded(std::chrono::microseconds encodeTime, bool keyframe) {
        std::lock_guard<std::mutex> lk(mtx_);
        if (encodeTimes_.size() >= maxSamples_) encodeTimes_.pop_front();
        encodeTimes_.push_back(encodeTime);
        ++totals_.encodedFrames;
        if (keyframe) ++totals_.keyframes;
    }

    void PerformanceMonitor::recordSent(std::chrono::steady_clock::time_point at) {
        std::lock_guard<std::mutex> lk(mtx_);
        if (lastSent_) {
            if (frameIntervals_.size() >= maxSamples_) frameIntervals_.pop_front();
            frameIntervals_.push_back(at - *lastSent_);
        }
        lastSent_ = at;
        ++totals_.sentFrames;
    }

    void PerformanceMonitor::recordSkipped() {
        std::lock_guard<std::mutex> lk(mtx_);
        ++totals_.skippedFrames;
    }

    void PerformanceMonitor::recordSuperseded(uint64_t count) {
        std::lock_guard<std::mutex> lk(mtx_);
        totals_.supersededFrames += count;
    }

    PerformanceSnapshot PerformanceMonitor::snapshot() const {
        std::lock_guard<std::mutex> lk(mtx_);
        PerformanceSnapshot s = totals_;
        s.droppedFrameCount = totals_.skippedFrames + totals_.supersededFrames;

        if (!frameIntervals_.empty()) {
            std::chrono::steady_clock::duration total{0};
            for (auto d : frameIntervals_) total += d;
            double avgSec = std::chrono::duration<double>(total).count() / (double)frameIntervals_.size();
            s.fps = avgSec > 0.0 ? 1.0 / avgSec : 0.0;
        }
        if (!encodeTimes_.empty()) {
            std::chrono::microseconds total{0};
            for (auto d : encodeTimes_) total += d;
            s.encodeTimeMs = (double)total.count() / 1000.0 / (double)encodeTimes_.size();
        }
        return s;
    }

    void PerformanceMonitor::reset() {
        std::lock_guard<std::mutex> lk(mtx_);
        frameIntervals_.clear();
        encodeTimes_.clear();
        lastSent_.reset();
        totals_ = PerformanceSnapshot{};
    }

} // namespace peerlink::video
