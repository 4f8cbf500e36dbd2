/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/network_stats.hpp>

#include <algorithm>

namespace peerlink::abr {

    NetworkStats::NetworkStats(size_t capacity) : capacity_(capacity ? capacity : 1) {}

    void NetworkStats::record(const NetworkSample &sample) {
        NetworkSample s = sample;
        s.lossRatio = std::clamp(s.lossRatio, 0.0, 1.0);
        if (s.rttMs < 0.0) s.rttMs = 0.0;

        std::lock_guard<std::mutex> lk(mtx_);
        if (samples_.size() >= capacity_) samples_.pop_front();
        samples_.push_back(s);
    }

    void NetworkStats::record(double rttMs, double lossRatio, uint64_t bandwidthBps) {
        NetworkSample s;
        s.rttMs = rttMs;
        s.lossRatio = lossRatio;
        s.estimatedBandwidthBps = bandwidthBps;
        record(s);
    }

    NetworkSnapshot NetworkStats::snapshot(size_t window) const {
        std::lock_guard<std::mutex> lk(mtx_);
        NetworkSnapshot snap;
        size_t n = std::min(window, samples_.size());
        if (n == 0) return snap;

        double rtt = 0.0, loss = 0.0, bw = 0.0;
        for (auto it = samples_.end() - static_cast<std::ptrdiff_t>(n); it != samples_.end(); ++it) {
            rtt += it->rttMs;
            loss += it->lossRatio;
            bw += static_cast<double>(it->estimatedBandwidthBps);
        }
        snap.samples = n;
        snap.avgRttMs = rtt / static_cast<double>(n);
        snap.avgLossRatio = loss / static_cast<double>(n);
        snap.avgBandwidthBps = static_cast<uint64_t>(bw / static_cast<double>(n));
        return snap;
    }

    size_t NetworkStats::size() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return samples_.size();
    }

    void NetworkStats::clear() {
        std::lock_guard<std::mutex> lk(mtx_);
        samples_.clear();
    }

} // namespace peerlink::abr
