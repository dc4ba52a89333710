#include <gtest/gtest.h>
#include <streamview/player/stats_sampler.hpp>

#include "../support/fakes.hpp"

namespace streamview::player::test {

using namespace std::chrono_literals;
using streamview::test::ManualScheduler;

TEST(StatsSamplerMathTest, ComputesBitrate) {
    auto kbps = StatsSampler::computeBitrateKbps({1000, 0.0}, {26000, 1000.0});
    ASSERT_TRUE(kbps.has_value());
    EXPECT_EQ(*kbps, 200);

    // 8 * 1500 bytes over 0.5 s is 24 kbps
    EXPECT_EQ(StatsSampler::computeBitrateKbps({0, 100.0}, {1500, 600.0}), 24);
}

TEST(StatsSamplerMathTest, NonIncreasingTimestampIsUnavailable) {
    EXPECT_FALSE(StatsSampler::computeBitrateKbps({1000, 1000.0}, {26000, 1000.0}).has_value());
    EXPECT_FALSE(StatsSampler::computeBitrateKbps({1000, 2000.0}, {26000, 1000.0}).has_value());
}

TEST(StatsSamplerMathTest, NonPositiveBitrateIsUnavailable) {
    EXPECT_FALSE(StatsSampler::computeBitrateKbps({5000, 0.0}, {5000, 1000.0}).has_value());
    EXPECT_FALSE(StatsSampler::computeBitrateKbps({5000, 0.0}, {1000, 1000.0}).has_value());
    // Rounds to zero
    EXPECT_FALSE(StatsSampler::computeBitrateKbps({0, 0.0}, {10, 1000.0}).has_value());
}

class StatsSamplerTest : public ::testing::Test {
protected:
    void SetUp() override {
        sampler = std::make_shared<StatsSampler>(scheduler);
    }

    void startSampling() {
        sampler->start(
            [this](peer::PeerConnection::StatsCallback callback) {
                ++requests;
                if (defer) {
                    pending.push_back(std::move(callback));
                    return;
                }
                callback(reports);
            },
            [this](const DerivedStats& stats) { published.push_back(stats); });
    }

    void setVideo(uint64_t bytes, double timestamp_ms) {
        reports = {
            peer::StatsReport{"inbound-rtp", "audio", 99999, timestamp_ms},
            peer::StatsReport{"inbound-rtp", "video", bytes, timestamp_ms}
        };
    }

    ManualScheduler scheduler;
    std::shared_ptr<StatsSampler> sampler;
    std::vector<peer::StatsReport> reports;
    std::vector<peer::PeerConnection::StatsCallback> pending;
    std::vector<DerivedStats> published;
    bool defer = false;
    int requests = 0;
};

TEST_F(StatsSamplerTest, SamplesOncePerInterval) {
    startSampling();
    EXPECT_TRUE(sampler->running());

    setVideo(1000, 0.0);
    scheduler.advance(999ms);
    EXPECT_EQ(requests, 0);
    scheduler.advance(1ms);
    EXPECT_EQ(requests, 1);
    ASSERT_EQ(published.size(), 1u);
    EXPECT_FALSE(published[0].bitrate_kbps.has_value());

    setVideo(26000, 1000.0);
    scheduler.advance(1000ms);
    ASSERT_EQ(published.size(), 2u);
    EXPECT_EQ(published[1].bitrate_kbps, 200);
    EXPECT_EQ(sampler->latest().bitrate_kbps, 200);
    ASSERT_TRUE(sampler->previousSample().has_value());
    EXPECT_EQ(sampler->previousSample()->bytes_received, 26000u);
}

TEST_F(StatsSamplerTest, OnlyLatestSampleIsKept) {
    startSampling();
    setVideo(0, 0.0);
    scheduler.advance(1000ms);
    setVideo(125000, 1000.0);
    scheduler.advance(1000ms);
    setVideo(250000, 2000.0);
    scheduler.advance(1000ms);

    EXPECT_EQ(published.back().bitrate_kbps, 1000);
    EXPECT_EQ(sampler->previousSample()->timestamp_ms, 2000.0);
}

TEST_F(StatsSamplerTest, ReportWithoutVideoIsSkipped) {
    startSampling();
    reports = {peer::StatsReport{"candidate-pair", "", 100, 0.0}};
    scheduler.advance(1000ms);

    EXPECT_TRUE(published.empty());
    EXPECT_FALSE(sampler->previousSample().has_value());
}

TEST_F(StatsSamplerTest, StopDiscardsBaseline) {
    startSampling();
    setVideo(1000, 0.0);
    scheduler.advance(1000ms);
    ASSERT_TRUE(sampler->previousSample().has_value());

    sampler->stop();
    EXPECT_FALSE(sampler->running());
    EXPECT_FALSE(sampler->previousSample().has_value());
    EXPECT_EQ(scheduler.pendingTimers(), 0u);

    startSampling();
    setVideo(26000, 1000.0);
    scheduler.advance(1000ms);
    EXPECT_FALSE(published.back().bitrate_kbps.has_value());
}

TEST_F(StatsSamplerTest, StaleResponseAfterStopIsIgnored) {
    defer = true;
    startSampling();
    scheduler.advance(1000ms);
    ASSERT_EQ(pending.size(), 1u);

    sampler->stop();
    setVideo(1000, 0.0);
    pending[0](reports);

    EXPECT_TRUE(published.empty());
    EXPECT_FALSE(sampler->previousSample().has_value());
}

TEST_F(StatsSamplerTest, ErrorResponseIsIgnored) {
    defer = true;
    startSampling();
    scheduler.advance(1000ms);
    ASSERT_EQ(pending.size(), 1u);

    pending[0](core::Result<std::vector<peer::StatsReport>>(core::ErrorCode::InvalidState, "closed"));
    EXPECT_TRUE(published.empty());
    EXPECT_TRUE(sampler->running());
}

} // namespace streamview::player::test
