#include <gtest/gtest.h>
#include "oracle/oracle_fusion.hpp"
#include "oracle/sim_oracle_feed.hpp"

using namespace dnmm;

class OracleFusionTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = OracleConfig{};
        config.max_age_sec = 30.0;
        config.secondary_max_age_sec = 60.0;
        config.secondary_max_age_sec_strict = 20.0;
        config.conf_cap_bps_spot = 250.0;
        config.conf_cap_bps_strict = 150.0;
        config.conf_weight_spread_bps = 20.0;
        config.conf_weight_sigma_bps = 10.0;
        config.conf_weight_secondary_bps = 30.0;
    }

    OracleFusion fusion() const { return OracleFusion(config, feed); }

    OracleConfig  config;
    SimOracleFeed feed;
};

TEST_F(OracleFusionTest, PriorityIsPrimaryEmaSecondary) {
    EXPECT_EQ(OracleFusion::kPriority[0], OracleSource::Primary);
    EXPECT_EQ(OracleFusion::kPriority[1], OracleSource::EmaFallback);
    EXPECT_EQ(OracleFusion::kPriority[2], OracleSource::Secondary);
}

TEST_F(OracleFusionTest, FreshPrimaryIsUsed) {
    feed.set_all(1.0, 10.0);

    auto ref = fusion().read_reference_price(OracleMode::Spot, 0.0);
    ASSERT_TRUE(ref.ok());
    EXPECT_DOUBLE_EQ(ref->mid, 1.0);
    EXPECT_FALSE(ref->used_fallback);
    EXPECT_EQ(ref->reason, FallbackReason::None);
    EXPECT_EQ(ref->reading.source, OracleSource::Primary);
    EXPECT_NEAR(ref->spread_bps, 10.0, 1e-9);
    ASSERT_TRUE(ref->secondary.has_value());
    EXPECT_DOUBLE_EQ(ref->secondary->mid, 1.0);
}

TEST_F(OracleFusionTest, ConfidenceIsWeightedBlendOfAvailableComponents) {
    feed.set_all(1.0, 10.0, 20.0);

    auto ref = fusion().read_reference_price(OracleMode::Spot, 0.0);
    ASSERT_TRUE(ref.ok());
    // (20 * 10 + 10 * 0 + 30 * 20) / 60 = 13.333
    EXPECT_NEAR(ref->conf_bps, 800.0 / 60.0, 1e-9);

    feed.clear_secondary();
    ref = fusion().read_reference_price(OracleMode::Spot, 5.0);
    ASSERT_TRUE(ref.ok());
    // Secondary missing: (20 * 10 + 10 * 5) / 30
    EXPECT_NEAR(ref->conf_bps, 250.0 / 30.0, 1e-9);
}

TEST_F(OracleFusionTest, ComponentsCappedByModeBeforeBlending) {
    feed.set_all(1.0, 1000.0);

    auto strict = fusion().read_reference_price(OracleMode::Strict, 0.0);
    ASSERT_TRUE(strict.ok());
    // Spread capped at 150: (20 * 150) / 60
    EXPECT_NEAR(strict->conf_bps, 50.0, 1e-9);

    auto spot = fusion().read_reference_price(OracleMode::Spot, 0.0);
    ASSERT_TRUE(spot.ok());
    // Spread capped at 250: (20 * 250) / 60
    EXPECT_NEAR(spot->conf_bps, 5000.0 / 60.0, 1e-9);
}

TEST_F(OracleFusionTest, CrossedBookDropsSpreadComponent) {
    feed.set_all(1.0, 10.0);
    feed.set_bid_ask(1.001, 0.999);

    auto ref = fusion().read_reference_price(OracleMode::Spot, 0.0);
    ASSERT_TRUE(ref.ok());
    EXPECT_DOUBLE_EQ(ref->spread_bps, 0.0);
    EXPECT_DOUBLE_EQ(ref->conf_bps, 0.0);
}

TEST_F(OracleFusionTest, StalePrimaryFallsBackToEma) {
    feed.set_all(1.0, 10.0);
    feed.set_primary(1.01, 31.0);

    auto ref = fusion().read_reference_price(OracleMode::Spot, 0.0);
    ASSERT_TRUE(ref.ok());
    EXPECT_DOUBLE_EQ(ref->mid, 1.0);
    EXPECT_TRUE(ref->used_fallback);
    EXPECT_EQ(ref->reason, FallbackReason::PrimaryStale);
    EXPECT_EQ(ref->reading.source, OracleSource::EmaFallback);
    // Spread component at the spot cap: (20 * 250 + 30 * 0) / 60
    EXPECT_NEAR(ref->conf_bps, 5000.0 / 60.0, 1e-9);
}

TEST_F(OracleFusionTest, EmaDisabledFallsThroughToSecondary) {
    config.allow_ema_fallback = false;
    feed.set_ema(1.0);
    feed.set_secondary(1.002, 5.0, 10.0);

    auto ref = fusion().read_reference_price(OracleMode::Spot, 0.0);
    ASSERT_TRUE(ref.ok());
    EXPECT_DOUBLE_EQ(ref->mid, 1.002);
    EXPECT_EQ(ref->reading.source, OracleSource::Secondary);
    EXPECT_EQ(ref->reason, FallbackReason::PrimaryUnset);
    EXPECT_EQ(fusion().read_source(OracleSource::EmaFallback, OracleMode::Spot).status,
              SourceStatus::Disabled);
}

TEST_F(OracleFusionTest, StaleOnlyReadingGivesOracleStale) {
    feed.set_primary(1.0, 45.0);

    auto ref = fusion().read_reference_price(OracleMode::Spot, 0.0);
    ASSERT_FALSE(ref.ok());
    EXPECT_EQ(ref.error().code, ErrorCode::OracleStale);
    EXPECT_DOUBLE_EQ(ref.error().value, 45.0);
    EXPECT_DOUBLE_EQ(ref.error().limit, 30.0);
}

TEST_F(OracleFusionTest, StaleSecondaryReportsItsOwnLimit) {
    feed.set_secondary(1.0, 5.0, 100.0);

    auto spot = fusion().read_reference_price(OracleMode::Spot, 0.0);
    ASSERT_FALSE(spot.ok());
    EXPECT_EQ(spot.error().code, ErrorCode::OracleStale);
    EXPECT_DOUBLE_EQ(spot.error().value, 100.0);
    EXPECT_DOUBLE_EQ(spot.error().limit, 60.0);

    auto strict = fusion().read_reference_price(OracleMode::Strict, 0.0);
    ASSERT_FALSE(strict.ok());
    EXPECT_DOUBLE_EQ(strict.error().limit, 20.0);
}

TEST_F(OracleFusionTest, FallbackCarriesPrimaryAge) {
    feed.set_primary(1.0, 45.0);
    feed.set_ema(1.0);

    auto ref = fusion().read_reference_price(OracleMode::Spot, 0.0);
    ASSERT_TRUE(ref.ok());
    EXPECT_EQ(ref->reason, FallbackReason::PrimaryStale);
    EXPECT_DOUBLE_EQ(ref->primary_age_sec, 45.0);
}

TEST_F(OracleFusionTest, NoReadingGivesMidUnset) {
    auto ref = fusion().read_reference_price(OracleMode::Spot, 0.0);
    ASSERT_FALSE(ref.ok());
    EXPECT_EQ(ref.error().code, ErrorCode::MidUnset);

    // A zero mid counts as unset, not stale
    feed.set_primary(0.0, 100.0);
    ref = fusion().read_reference_price(OracleMode::Spot, 0.0);
    ASSERT_FALSE(ref.ok());
    EXPECT_EQ(ref.error().code, ErrorCode::MidUnset);
}

TEST_F(OracleFusionTest, StrictModeTightensSecondaryAge) {
    feed.set_all(1.0, 10.0);
    feed.set_secondary(1.0, 0.0, 30.0);

    auto spot = fusion().read_reference_price(OracleMode::Spot, 0.0);
    ASSERT_TRUE(spot.ok());
    EXPECT_TRUE(spot->secondary.has_value());

    auto strict = fusion().read_reference_price(OracleMode::Strict, 0.0);
    ASSERT_TRUE(strict.ok());
    EXPECT_FALSE(strict->secondary.has_value());
}
