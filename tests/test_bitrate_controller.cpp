/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <peerlink/bitrate_controller.hpp>

#include <thread>
#include <vector>

using namespace peerlink;
using namespace peerlink::abr;
using namespace std::chrono;

namespace {

    NetworkSnapshot snap(double rtt, double loss) {
        NetworkSnapshot s;
        s.samples = 10;
        s.avgRttMs = rtt;
        s.avgLossRatio = loss;
        return s;
    }

} // namespace

TEST_CASE("sustained congestion steps the bitrate down after one grace cycle", "[abr]") {
    BitrateController c(ControllerConfig{}, QualityTier::High, 2000000);
    auto t = steady_clock::now();

    std::vector<uint32_t> seen;
    for (int cycle = 1; cycle <= 5; ++cycle) {
        t += milliseconds(2000);
        auto d = c.evaluate(snap(250.0, 0.08), t);
        REQUIRE_FALSE(d.emergency);
        seen.push_back(d.bitrate);
    }

    REQUIRE(seen[0] == 2000000);
    REQUIRE(seen[1] == 1600000);
    REQUIRE(seen[2] == 1280000);
    for (auto b : seen) REQUIRE(b >= 500000);
    REQUIRE(seen[4] < seen[3]);
}

TEST_CASE("heavy loss reduces within the same cycle", "[abr]") {
    BitrateController c(ControllerConfig{}, QualityTier::High, 2000000);
    auto t = steady_clock::now();

    auto d = c.evaluate(snap(20.0, 0.2), t);
    REQUIRE(d.emergency);
    REQUIRE(d.adjustment == Adjustment::Decrease);
    REQUIRE(d.bitrate == 1600000);

    // the emergency path ignores the one-cycle spacing
    d = c.evaluate(snap(20.0, 0.2), t + milliseconds(100));
    REQUIRE(d.adjustment == Adjustment::Decrease);
    REQUIRE(d.bitrate == 1280000);
}

TEST_CASE("moves in the same direction are one cycle apart", "[abr]") {
    BitrateController c(ControllerConfig{}, QualityTier::High, 2000000);
    auto t = steady_clock::now();

    REQUIRE(c.evaluate(snap(10.0, 0.0), t).adjustment == Adjustment::Increase);
    auto d = c.evaluate(snap(10.0, 0.0), t + milliseconds(500));
    REQUIRE(d.adjustment == Adjustment::Hold);
    REQUIRE(c.bitrate() == 2400000);

    REQUIRE(c.evaluate(snap(10.0, 0.0), t + milliseconds(2000)).adjustment == Adjustment::Increase);
}

TEST_CASE("late and early wake-ups do not skip a congestion step", "[abr]") {
    BitrateController c(ControllerConfig{}, QualityTier::High, 2000000);
    auto t = steady_clock::now();

    REQUIRE(c.evaluate(snap(250.0, 0.08), t + milliseconds(2000)).bitrate == 2000000);
    REQUIRE(c.evaluate(snap(250.0, 0.08), t + milliseconds(4005)).bitrate == 1600000);
    auto d = c.evaluate(snap(250.0, 0.08), t + milliseconds(6000));
    REQUIRE(d.adjustment == Adjustment::Decrease);
    REQUIRE(d.bitrate == 1280000);
    REQUIRE(c.evaluate(snap(250.0, 0.08), t + milliseconds(7950)).bitrate == 1024000);
}

TEST_CASE("middle ground holds and resets the degraded streak", "[abr]") {
    BitrateController c(ControllerConfig{}, QualityTier::High, 2000000);
    auto t = steady_clock::now();

    REQUIRE(c.evaluate(snap(250.0, 0.0), t).adjustment == Adjustment::Hold);
    REQUIRE(c.evaluate(snap(100.0, 0.02), t + seconds(2)).adjustment == Adjustment::Hold);
    // the streak starts over, so this is again only the first breach
    REQUIRE(c.evaluate(snap(250.0, 0.0), t + seconds(4)).adjustment == Adjustment::Hold);
    REQUIRE(c.bitrate() == 2000000);

    REQUIRE(c.evaluate(NetworkSnapshot{}, t + seconds(6)).reason == "no samples");
}

TEST_CASE("a good link climbs to the tier ceiling and then recommends the next tier", "[abr]") {
    ControllerConfig cfg;
    cfg.tierSwitchCycles = 3;
    BitrateController c(cfg, QualityTier::High, 2000000);
    auto t = steady_clock::now();

    uint32_t prev = c.bitrate();
    std::optional<QualityTier> recommended;
    for (int cycle = 0; cycle < 12 && !recommended; ++cycle) {
        t += milliseconds(2000);
        auto d = c.evaluate(snap(10.0, 0.0), t);
        REQUIRE(d.bitrate <= 5000000);
        if (d.bitrate < 5000000) {
            REQUIRE(d.bitrate > prev);
        }
        prev = d.bitrate;
        recommended = d.recommendedTier;
    }

    REQUIRE(c.bitrate() == 5000000);
    REQUIRE(recommended == std::optional<QualityTier>(QualityTier::Ultra));
    REQUIRE(c.tier() == QualityTier::High);

    c.switchTier(QualityTier::Ultra);
    REQUIRE(c.tier() == QualityTier::Ultra);
    REQUIRE(c.bitrate() == 5000000);
}

TEST_CASE("initial bitrate is clamped to the tier", "[abr]") {
    BitrateController low(ControllerConfig{}, QualityTier::Low, 50000000);
    REQUIRE(low.bitrate() == tierSpec(QualityTier::Low).maxBitrate);

    low.restore(QualityTier::Medium, 10);
    REQUIRE(low.tier() == QualityTier::Medium);
    REQUIRE(low.bitrate() == tierSpec(QualityTier::Medium).minBitrate);
}

TEST_CASE("tier names and ladder order", "[abr]") {
    const auto &ladder = qualityLadder();
    for (size_t i = 1; i < ladder.size(); ++i) {
        REQUIRE(static_cast<int>(ladder[i].tier) > static_cast<int>(ladder[i - 1].tier));
        REQUIRE(ladder[i].width >= ladder[i - 1].width);
    }
    REQUIRE(tierFromName("ultra") == std::optional<QualityTier>(QualityTier::Ultra));
    REQUIRE(std::string(tierName(QualityTier::Medium)) == "medium");
    REQUIRE_FALSE(tierFromName("insane").has_value());
}

TEST_CASE("controller config validation", "[abr]") {
    ControllerConfig cfg;
    REQUIRE(cfg.validate());

    SECTION("decrease factor") {
        cfg.decreaseFactor = 1.0;
        REQUIRE(cfg.validate().error().kind == ErrorKind::ConfigError);
    }
    SECTION("increase factor") {
        cfg.increaseFactor = 0.9;
        REQUIRE_FALSE(cfg.validate());
    }
    SECTION("threshold order") {
        cfg.highLossRatio = 0.3;
        REQUIRE_FALSE(cfg.validate());
    }
    SECTION("window") {
        cfg.window = 0;
        REQUIRE_FALSE(cfg.validate());
    }
}

TEST_CASE("network stats average the newest samples", "[abr][stats]") {
    NetworkStats stats(4);
    REQUIRE(stats.snapshot(10).empty());

    stats.record(1000.0, 0.9);
    stats.record(100.0, 0.1);
    stats.record(200.0, 0.3);
    stats.record(300.0, 2.0); // clamped to 1
    stats.record(400.0, -1.0); // clamped to 0, evicts the first sample

    REQUIRE(stats.size() == 4);
    auto all = stats.snapshot(10);
    REQUIRE(all.samples == 4);
    REQUIRE(all.avgRttMs == Approx(250.0));
    REQUIRE(all.avgLossRatio == Approx((0.1 + 0.3 + 1.0 + 0.0) / 4.0));

    auto last2 = stats.snapshot(2);
    REQUIRE(last2.avgRttMs == Approx(350.0));

    stats.clear();
    REQUIRE(stats.size() == 0);
}

TEST_CASE("bitrate loop hands changes to the pipeline", "[abr][loop]") {
    auto stats = std::make_shared<NetworkStats>();
    std::vector<video::EncoderConfig> applied;

    video::EncoderConfig base;
    base.width = 1920;
    base.height = 1080;
    base.targetFps = 30;

    AdaptiveBitrateLoop loop(stats, BitrateController(ControllerConfig{}, QualityTier::High, 2000000), base,
                             [&applied](const video::EncoderConfig &cfg) {
                                 applied.push_back(cfg);
                                 return success();
                             });

    auto t = steady_clock::now();
    REQUIRE_FALSE(loop.runCycle(t).changed());
    REQUIRE(applied.empty());

    for (int i = 0; i < 10; ++i) stats->record(10.0, 0.0);
    auto d = loop.runCycle(t + seconds(2));
    REQUIRE(d.adjustment == Adjustment::Increase);
    REQUIRE(applied.size() == 1);
    REQUIRE(applied[0].targetBitrate == 2400000);
    REQUIRE(applied[0].width == 1920);
    REQUIRE(loop.current().targetBitrate == 2400000);
    REQUIRE(loop.lastDecision().has_value());
}

TEST_CASE("a rejected recommendation leaves the controller where it was", "[abr][loop]") {
    auto stats = std::make_shared<NetworkStats>();
    for (int i = 0; i < 10; ++i) stats->record(10.0, 0.0);

    int calls = 0;
    AdaptiveBitrateLoop loop(stats, BitrateController(ControllerConfig{}, QualityTier::High, 2000000),
                             video::EncoderConfig{}, [&calls](const video::EncoderConfig &) {
                                 ++calls;
                                 return Status::err(ErrorKind::ConfigError, "encoder busy");
                             });

    auto t = steady_clock::now();
    loop.runCycle(t);
    REQUIRE(calls == 1);
    REQUIRE(loop.current().targetBitrate == 2000000);

    // the same increase is attempted again on the next cycle
    loop.runCycle(t + seconds(2));
    REQUIRE(calls == 2);
    REQUIRE(loop.current().targetBitrate == 2000000);
}

TEST_CASE("an automatic tier switch changes resolution and fps", "[abr][loop]") {
    auto stats = std::make_shared<NetworkStats>();
    for (int i = 0; i < 10; ++i) stats->record(100.0, 0.2);

    std::vector<video::EncoderConfig> applied;
    const TierSpec &medium = tierSpec(QualityTier::Medium);
    video::EncoderConfig base;
    base.width = medium.width;
    base.height = medium.height;
    base.targetFps = medium.fps;

    ControllerConfig cfg;
    cfg.tierSwitchCycles = 3;
    AdaptiveBitrateLoop loop(stats, BitrateController(cfg, QualityTier::Medium, medium.minBitrate), base,
                             [&applied](const video::EncoderConfig &c) {
                                 applied.push_back(c);
                                 return success();
                             });

    auto t = steady_clock::now();
    for (int i = 0; i < 3; ++i) loop.runCycle(t + seconds(2 * i));

    REQUIRE(applied.size() == 1);
    const TierSpec &low = tierSpec(QualityTier::Low);
    REQUIRE(applied[0].width == low.width);
    REQUIRE(applied[0].height == low.height);
    REQUIRE(applied[0].targetFps == low.fps);
    REQUIRE(applied[0].targetBitrate >= low.minBitrate);
    REQUIRE(applied[0].targetBitrate <= low.maxBitrate);
}

TEST_CASE("bitrate loop thread starts and stops", "[abr][loop]") {
    auto stats = std::make_shared<NetworkStats>();
    ControllerConfig cfg;
    cfg.cycle = milliseconds(10);
    AdaptiveBitrateLoop loop(stats, BitrateController(cfg, QualityTier::High, 2000000), video::EncoderConfig{},
                             nullptr);
    loop.start();
    loop.start();
    REQUIRE(loop.running());
    std::this_thread::sleep_for(milliseconds(50));
    loop.stop();
    loop.stop();
    REQUIRE_FALSE(loop.running());
}
