/*
* @license
* (C) zachbabanov
*
*/

#ifndef PEERLINK_BITRATE_CONTROLLER_HPP
#define PEERLINK_BITRATE_CONTROLLER_HPP

#pragma once

#include <peerlink/errors.hpp>
#include <peerlink/network_stats.hpp>
#include <peerlink/video_types.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace peerlink::abr {

    enum class QualityTier {
        Low = 0,
        Medium,
        High,
        Ultra
    };

    struct TierSpec {
        QualityTier tier;
        uint32_t width;
        uint32_t height;
        uint32_t fps;
        uint32_t minBitrate;
        uint32_t maxBitrate;
    };

    /// Ordered Low -> Ultra.
    const std::array<TierSpec, 4> &qualityLadder();
    const TierSpec &tierSpec(QualityTier t);

    const char *tierName(QualityTier t);
    std::optional<QualityTier> tierFromName(const std::string &name);

    struct ControllerConfig {
        double highRttMs{200.0};
        double highLossRatio{0.05};
        double lowRttMs{50.0};
        double lowLossRatio{0.01};
        double emergencyLossRatio{0.15};

        double decreaseFactor{0.8};
        double increaseFactor{1.2};

        uint32_t requiredDegradedCycles{2};
        uint32_t tierSwitchCycles{3};

        size_t window{10};                              // K samples per evaluation
        std::chrono::milliseconds cycle{2000};

        Status validate() const;
    };

    enum class Adjustment {
        Hold,
        Increase,
        Decrease
    };

    const char *adjustmentName(Adjustment a);

    struct BitrateDecision {
        Adjustment adjustment{Adjustment::Hold};
        uint32_t bitrate{0};                        // clamped, what the encoder should use
        uint64_t unclampedTarget{0};
        QualityTier tier{QualityTier::High};
        std::optional<QualityTier> recommendedTier; // set once the target stayed outside the tier long enough
        bool emergency{false};
        std::string reason;

        bool changed() const { return adjustment != Adjustment::Hold; }
    };

/**
 * @brief Maps NetworkStats snapshots to bitrate recommendations.
 *
 * Degraded (rtt > high OR loss > high) scales down after requiredDegradedCycles consecutive cycles, or in
 * the same cycle when loss exceeds emergencyLossRatio. Good (rtt < low AND loss < low) scales up.
 * Anything in between holds. Two consecutive moves in the same direction never share a cycle (calls
 * less than half a cycle apart count as one), except on the emergency path. The result is clamped to the active tier's range.
 *
 * Not thread-safe; owned by one bitrate loop.
 */
    class BitrateController {
    public:
        BitrateController(ControllerConfig cfg, QualityTier tier, uint32_t initialBitrate);

        BitrateDecision evaluate(const NetworkSnapshot &snapshot,
                                 std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

        /// Moves to another tier and clamps the current bitrate into its range.
        void switchTier(QualityTier tier);

        /// Restores a previous operating point (used when the encoder rejects a recommendation).
        void restore(QualityTier tier, uint32_t bitrate);

        uint32_t bitrate() const { return bitrate_; }
        QualityTier tier() const { return tier_; }
        const ControllerConfig &config() const { return cfg_; }

    private:
        uint32_t clampToTier(uint64_t target) const;
        void trackTierPressure(uint64_t unclamped, BitrateDecision &d);

        ControllerConfig cfg_;
        QualityTier tier_;
        uint32_t bitrate_;

        uint32_t degradedCycles_{0};
        uint32_t belowTierCycles_{0};
        uint32_t aboveTierCycles_{0};

        Adjustment lastMove_{Adjustment::Hold};
        std::optional<std::chrono::steady_clock::time_point> lastMoveAt_;
    };

/**
 * @brief Bitrate-adjustment task: every cycle snapshots NetworkStats, asks the controller and hands any
 * change to the pipeline (which applies it at its next tick boundary).
 */
    class AdaptiveBitrateLoop {
    public:
        using ApplyFn = std::function<Status(const video::EncoderConfig&)>;

        AdaptiveBitrateLoop(std::shared_ptr<NetworkStats> stats, BitrateController controller,
                            video::EncoderConfig base, ApplyFn apply, bool autoTierSwitch = true);
        ~AdaptiveBitrateLoop();

        AdaptiveBitrateLoop(const AdaptiveBitrateLoop&) = delete;
        AdaptiveBitrateLoop& operator=(const AdaptiveBitrateLoop&) = delete;

        void start();
        void stop();
        bool running() const { return running_.load(); }

        /// One controller cycle. The loop thread calls this; tests drive it directly.
        BitrateDecision runCycle(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

        video::EncoderConfig current() const;
        std::optional<BitrateDecision> lastDecision() const;

    private:
        void loop();

        std::shared_ptr<NetworkStats> stats_;
        ApplyFn apply_;
        const bool autoTierSwitch_;

        mutable std::mutex mtx_;
        BitrateController controller_;
        video::EncoderConfig config_;
        std::optional<BitrateDecision> last_;

        std::atomic<bool> running_{false};
        std::mutex waitMtx_;
        std::condition_variable waitCv_;
        bool stopRequested_{false};
        std::thread thread_;
    };

} // namespace peerlink::abr

#endif // PEERLINK_BITRATE_CONTROLLER_HPP
