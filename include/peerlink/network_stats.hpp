/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_NETWORK_STATS_HPP
#define PEERLINK_NETWORK_STATS_HPP

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

namespace peerlink::abr {

    struct NetworkSample {
        double rttMs{0.0};
        double lossRatio{0.0};              // 0..1
        uint64_t estimatedBandwidthBps{0};
        std::chrono::steady_clock::time_point at{std::chrono::steady_clock::now()};
    };

    /// Immutable averages over the last K samples.
    struct NetworkSnapshot {
        size_t samples{0};
        double avgRttMs{0.0};
        double avgLossRatio{0.0};
        uint64_t avgBandwidthBps{0};

        bool empty() const { return samples == 0; }
    };

/**
 * @brief Rolling window of transport telemetry.
 *
 * Written by the transport (any thread), read by the bitrate loop once per cycle.
 */
    class NetworkStats {
    public:
        explicit NetworkStats(size_t capacity = 64);

        void record(const NetworkSample &sample);
        void record(double rttMs, double lossRatio, uint64_t bandwidthBps = 0);

        /// Averages over the newest `window` samples (all of them if fewer are held).
        NetworkSnapshot snapshot(size_t window) const;

        size_t size() const;
        void clear();

    private:
        const size_t capacity_;
        mutable std::mutex mtx_;
        std::deque<NetworkSample> samples_;
    };

} // namespace peerlink::abr

#endif // PEERLINK_NETWORK_STATS_HPP
