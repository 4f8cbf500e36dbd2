/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/bitrate_controller.hpp>
#include <peerlink/logger.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <cmath>

namespace peerlink::abr {

    using namespace std::chrono;

    namespace {
        const std::array<TierSpec, 4> kLadder = {{
            {QualityTier::Low,     960,  540,  15,   100000,  1000000},
            {QualityTier::Medium,  1280, 720,  30,   250000,  2500000},
            {QualityTier::High,    1920, 1080, 30,   500000,  5000000},
            {QualityTier::Ultra,   2560, 1440, 60,  2000000, 15000000},
        }};
    }

    const std::array<TierSpec, 4> &qualityLadder() {
        return kLadder;
    }

    const TierSpec &tierSpec(QualityTier t) {
        return kLadder[static_cast<size_t>(t)];
    }

    const char *tierName(QualityTier t) {
        switch (t) {
            case QualityTier::Low:    return "low";
            case QualityTier::Medium: return "medium";
            case QualityTier::High:   return "high";
            case QualityTier::Ultra:  return "ultra";
        }
        return "unknown";
    }

    std::optional<QualityTier> tierFromName(const std::string &name) {
        for (const auto &spec : kLadder) {
            if (name == tierName(spec.tier)) return spec.tier;
        }
        return std::nullopt;
    }

    const char *adjustmentName(Adjustment a) {
        switch (a) {
            case Adjustment::Hold:     return "hold";
            case Adjustment::Increase: return "increase";
            case Adjustment::Decrease: return "decrease";
        }
        return "unknown";
    }

    Status ControllerConfig::validate() const {
        if (!(decreaseFactor > 0.0 && decreaseFactor < 1.0))
            return Status::err(ErrorKind::ConfigError, "bitrate.decrease_factor must be in (0, 1)");
        if (!(increaseFactor > 1.0))
            return Status::err(ErrorKind::ConfigError, "bitrate.increase_factor must be > 1");
        if (lowRttMs > highRttMs)
            return Status::err(ErrorKind::ConfigError, "bitrate.low_rtt_ms must not exceed bitrate.high_rtt_ms");
        if (lowLossRatio > highLossRatio || highLossRatio > emergencyLossRatio)
            return Status::err(ErrorKind::ConfigError, "bitrate loss thresholds must satisfy low <= high <= emergency");
        if (emergencyLossRatio > 1.0 || lowLossRatio < 0.0)
            return Status::err(ErrorKind::ConfigError, "bitrate loss thresholds must be within [0, 1]");
        if (requiredDegradedCycles == 0)
            return Status::err(ErrorKind::ConfigError, "bitrate.degraded_cycles must be >= 1");
        if (tierSwitchCycles == 0)
            return Status::err(ErrorKind::ConfigError, "bitrate.tier_switch_cycles must be >= 1");
        if (window == 0)
            return Status::err(ErrorKind::ConfigError, "bitrate.window must be >= 1");
        if (cycle.count() <= 0)
            return Status::err(ErrorKind::ConfigError, "bitrate.cycle_ms must be > 0");
        return success();
    }

    BitrateController::BitrateController(ControllerConfig cfg, QualityTier tier, uint32_t initialBitrate)
            : cfg_(cfg), tier_(tier), bitrate_(0) {
        bitrate_ = clampToTier(initialBitrate);
    }

    uint32_t BitrateController::clampToTier(uint64_t target) const {
        const TierSpec &spec = tierSpec(tier_);
        return static_cast<uint32_t>(std::clamp<uint64_t>(target, spec.minBitrate, spec.maxBitrate));
    }

    void BitrateController::switchTier(QualityTier tier) {
        tier_ = tier;
        bitrate_ = clampToTier(bitrate_);
        belowTierCycles_ = 0;
        aboveTierCycles_ = 0;
    }

    void BitrateController::restore(QualityTier tier, uint32_t bitrate) {
        tier_ = tier;
        bitrate_ = clampToTier(bitrate);
    }

    void BitrateController::trackTierPressure(uint64_t unclamped, BitrateDecision &d) {
        const TierSpec &spec = tierSpec(tier_);
        if (unclamped < spec.minBitrate) {
            ++belowTierCycles_;
            aboveTierCycles_ = 0;
        } else if (unclamped > spec.maxBitrate) {
            ++aboveTierCycles_;
            belowTierCycles_ = 0;
        } else {
            belowTierCycles_ = 0;
            aboveTierCycles_ = 0;
            return;
        }

        auto idx = static_cast<size_t>(tier_);
        if (belowTierCycles_ >= cfg_.tierSwitchCycles && idx > 0) {
            d.recommendedTier = static_cast<QualityTier>(idx - 1);
            belowTierCycles_ = 0;
        } else if (aboveTierCycles_ >= cfg_.tierSwitchCycles && idx + 1 < kLadder.size()) {
            d.recommendedTier = static_cast<QualityTier>(idx + 1);
            aboveTierCycles_ = 0;
        }
    }

    BitrateDecision BitrateController::evaluate(const NetworkSnapshot &snapshot, steady_clock::time_point now) {
        BitrateDecision d;
        d.tier = tier_;
        d.bitrate = bitrate_;
        d.unclampedTarget = bitrate_;

        if (snapshot.empty()) {
            d.reason = "no samples";
            return d;
        }

        const double rtt = snapshot.avgRttMs;
        const double loss = snapshot.avgLossRatio;
        const bool degraded = rtt > cfg_.highRttMs || loss > cfg_.highLossRatio;
        const bool good = rtt < cfg_.lowRttMs && loss < cfg_.lowLossRatio;

        Adjustment wanted = Adjustment::Hold;
        if (degraded) {
            ++degradedCycles_;
            if (loss > cfg_.emergencyLossRatio) {
                wanted = Adjustment::Decrease;
                d.emergency = true;
                d.reason = fmt::format("loss {:.3f} above emergency threshold", loss);
            } else if (degradedCycles_ >= cfg_.requiredDegradedCycles) {
                wanted = Adjustment::Decrease;
                d.reason = fmt::format("degraded for {} cycles (rtt {:.0f} ms, loss {:.3f})", degradedCycles_, rtt, loss);
            } else {
                d.reason = fmt::format("degraded cycle {}/{}", degradedCycles_, cfg_.requiredDegradedCycles);
            }
        } else {
            degradedCycles_ = 0;
            if (good) {
                wanted = Adjustment::Increase;
                d.reason = fmt::format("good link (rtt {:.0f} ms, loss {:.3f})", rtt, loss);
            } else {
                d.reason = "within thresholds";
            }
        }

        if (wanted == Adjustment::Hold) {
            trackTierPressure(bitrate_, d);
            return d;
        }

        // a move within half a cycle of the previous one falls in the same cycle slot
        if (!d.emergency && wanted == lastMove_ && lastMoveAt_ && now - *lastMoveAt_ < cfg_.cycle / 2) {
            d.reason = fmt::format("{} suppressed, previous {} less than one cycle ago", adjustmentName(wanted),
                                   adjustmentName(lastMove_));
            return d;
        }

        const double factor = wanted == Adjustment::Decrease ? cfg_.decreaseFactor : cfg_.increaseFactor;
        const uint64_t unclamped = static_cast<uint64_t>(std::llround(static_cast<double>(bitrate_) * factor));
        const uint32_t clamped = clampToTier(unclamped);
        d.unclampedTarget = unclamped;
        trackTierPressure(unclamped, d);

        if (clamped == bitrate_) {
            d.reason += fmt::format(", already at {} tier bound", tierName(tier_));
            return d;
        }

        bitrate_ = clamped;
        lastMove_ = wanted;
        lastMoveAt_ = now;
        d.adjustment = wanted;
        d.bitrate = clamped;
        return d;
    }

    // ---------------- AdaptiveBitrateLoop ----------------

    AdaptiveBitrateLoop::AdaptiveBitrateLoop(std::shared_ptr<NetworkStats> stats, BitrateController controller,
                                             video::EncoderConfig base, ApplyFn apply, bool autoTierSwitch)
            : stats_(std::move(stats)), apply_(std::move(apply)), autoTierSwitch_(autoTierSwitch),
              controller_(std::move(controller)), config_(base) {
        config_.targetBitrate = controller_.bitrate();
    }

    AdaptiveBitrateLoop::~AdaptiveBitrateLoop() {
        stop();
    }

    video::EncoderConfig AdaptiveBitrateLoop::current() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return config_;
    }

    std::optional<BitrateDecision> AdaptiveBitrateLoop::lastDecision() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return last_;
    }

    BitrateDecision AdaptiveBitrateLoop::runCycle(steady_clock::time_point now) {
        std::lock_guard<std::mutex> lk(mtx_);
        const QualityTier prevTier = controller_.tier();
        const uint32_t prevBitrate = controller_.bitrate();

        NetworkSnapshot snap = stats_->snapshot(controller_.config().window);
        BitrateDecision d = controller_.evaluate(snap, now);
        last_ = d;

        video::EncoderConfig next = config_;
        next.targetBitrate = controller_.bitrate();

        if (d.recommendedTier) {
            LOG_ABR_INFO("tier switch recommended: {} -> {} (target {} bps)", tierName(d.tier),
                         tierName(*d.recommendedTier), d.unclampedTarget);
            if (autoTierSwitch_) {
                controller_.switchTier(*d.recommendedTier);
                const TierSpec &spec = tierSpec(*d.recommendedTier);
                next.width = spec.width;
                next.height = spec.height;
                next.targetFps = spec.fps;
                next.targetBitrate = controller_.bitrate();
            }
        }

        if (next == config_) {
            LOG_ABR_DEBUG("hold at {} bps: {} (rtt {:.0f} ms, loss {:.3f}, {} samples)", config_.targetBitrate,
                          d.reason, snap.avgRttMs, snap.avgLossRatio, snap.samples);
            return d;
        }

        Status st = apply_ ? apply_(next) : success();
        if (!st) {
            LOG_ABR_WARN("pipeline rejected {}x{}@{} {} bps: {}", next.width, next.height, next.targetFps,
                         next.targetBitrate, st.error().message);
            controller_.restore(prevTier, prevBitrate);
            return d;
        }

        LOG_ABR_INFO("{} {} -> {} bps ({})", d.emergency ? "emergency" : adjustmentName(d.adjustment),
                     config_.targetBitrate, next.targetBitrate, d.reason);
        config_ = next;
        return d;
    }

    void AdaptiveBitrateLoop::start() {
        if (running_.exchange(true)) return;
        {
            std::lock_guard<std::mutex> lk(waitMtx_);
            stopRequested_ = false;
        }
        thread_ = std::thread(&AdaptiveBitrateLoop::loop, this);
        LOG_ABR_INFO("bitrate loop started at {} bps, cycle {} ms", current().targetBitrate,
                     controller_.config().cycle.count());
    }

    void AdaptiveBitrateLoop::stop() {
        {
            std::lock_guard<std::mutex> lk(waitMtx_);
            stopRequested_ = true;
        }
        waitCv_.notify_all();
        if (thread_.joinable()) thread_.join();
        if (running_.exchange(false)) LOG_ABR_INFO("bitrate loop stopped");
    }

    void AdaptiveBitrateLoop::loop() {
        const milliseconds cycle = controller_.config().cycle;
        auto next = steady_clock::now() + cycle;
        for (;;) {
            {
                std::unique_lock<std::mutex> lk(waitMtx_);
                if (waitCv_.wait_until(lk, next, [this] { return stopRequested_; })) break;
            }
            // the scheduled tick, not the wake-up time, so late wake-ups do not shrink the next gap
            runCycle(next);
            next += cycle;
        }
    }

} // namespace peerlink::abr
