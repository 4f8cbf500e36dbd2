/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_PERFORMANCE_HPP
#define PEERLINK_PERFORMANCE_HPP

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace peerlink::video {

    struct PerformanceSnapshot {
        double fps{0.0};
        double encodeTimeMs{0.0};
        uint64_t droppedFrameCount{0}; // skipped + superseded
        uint64_t skippedFrames{0};     // capture/encode failures
        uint64_t supersededFrames{0};  // evicted by a newer frame before the transport accepted them
        uint64_t encodedFrames{0};
        uint64_t sentFrames{0};
        uint64_t keyframes{0};
    };

/**
 * @brief Rolling frame statistics for the streaming pipeline. Thread-safe.
 */
    class PerformanceMonitor {
    public:
        explicit PerformanceMonitor(size_t maxSamples = 60);

        void recordEncoded(std::chrono::microseconds encodeTime, bool keyframe);
        void recordSent(std::chrono::steady_clock::time_point at = std::chrono::steady_clock::now());
        void recordSkipped();
        void recordSuperseded(uint64_t count = 1);

        PerformanceSnapshot snapshot() const;
        void reset();

    private:
        const size_t maxSamples_;
        mutable std::mutex mtx_;
        std::deque<std::chrono::steady_clock::duration> frameIntervals_;
        std::deque<std::chrono::microseconds> encodeTimes_;
        std::optional<std::chrono::steady_clock::time_point> lastSent_;
        PerformanceSnapshot totals_;
    };

} // namespace peerlink::video

#endif // PEERLINK_PERFORMANCE_HPP
