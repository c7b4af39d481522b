#include <gtest/gtest.h>
#include "engine/pricing_engine.hpp"
#include "oracle/sim_oracle_feed.hpp"
#include "preview/preview_snapshot.hpp"

#include <memory>

using namespace dnmm;

class PreviewTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = PoolConfig{};
        config.preview.max_age_sec = 10;
        reserves = ReserveState{.base_reserve = 1'000'000, .quote_reserve = 1'000'000,
                                .target_base = 1'000'000};
        feed.set_all(1.0, 10.0);
    }

    std::unique_ptr<PricingEngine> make_engine() {
        auto engine = std::make_unique<PricingEngine>(config, reserves, feed);
        engine->set_current_time(1000);
        engine->set_block(1);
        return engine;
    }

    PoolConfig    config;
    ReserveState  reserves;
    SimOracleFeed feed;
};

TEST_F(PreviewTest, NoSnapshotMeansMidUnset) {
    auto engine = make_engine();
    auto fees = engine->preview_fees({5000});
    ASSERT_FALSE(fees.ok());
    EXPECT_EQ(fees.error().code, ErrorCode::MidUnset);

    auto ladder = engine->preview_ladder();
    ASSERT_FALSE(ladder.ok());
    EXPECT_EQ(ladder.error().code, ErrorCode::MidUnset);
}

TEST_F(PreviewTest, PreviewFeeEqualsLiveFeeForReferenceSize) {
    auto engine = make_engine();
    ASSERT_TRUE(engine->swap(1000, 0, true, OracleMode::Spot, 2000).ok());

    // S0 = 5000 quote at mid 1.0 = 5000 base
    auto fees = engine->preview_fees({5000});
    ASSERT_TRUE(fees.ok());
    ASSERT_EQ(fees->bid_fee_bps.size(), 1u);
    ASSERT_EQ(fees->ask_fee_bps.size(), 1u);
    EXPECT_EQ(fees->snapshot_age_sec, 0u);

    auto bid = engine->quote(5000, true, OracleMode::Spot);
    auto ask = engine->quote(5000, false, OracleMode::Spot);
    ASSERT_TRUE(bid.ok());
    ASSERT_TRUE(ask.ok());
    EXPECT_DOUBLE_EQ(fees->bid_fee_bps[0], bid->fee_bps);
    EXPECT_DOUBLE_EQ(fees->ask_fee_bps[0], ask->fee_bps);

    // And a live swap of that size pays the same
    auto swap = engine->swap(5000, 0, true, OracleMode::Spot, 2000);
    ASSERT_TRUE(swap.ok());
    EXPECT_DOUBLE_EQ(swap->fill.fee_bps, fees->bid_fee_bps[0]);
}

TEST_F(PreviewTest, PreviewDoesNotMutate) {
    auto engine = make_engine();
    ASSERT_TRUE(engine->swap(1000, 0, true, OracleMode::Spot, 2000).ok());

    ReserveState before = engine->reserves();
    FeeState fee_before = engine->fee_state();
    uint64_t snapshots = engine->events().counters().snapshots;

    ASSERT_TRUE(engine->preview_fees({100, 1000, 10000}).ok());
    ASSERT_TRUE(engine->preview_ladder().ok());

    EXPECT_EQ(engine->reserves().base_reserve, before.base_reserve);
    EXPECT_EQ(engine->reserves().quote_reserve, before.quote_reserve);
    EXPECT_DOUBLE_EQ(engine->fee_state().last_fee_bps, fee_before.last_fee_bps);
    EXPECT_EQ(engine->events().counters().snapshots, snapshots);
}

TEST_F(PreviewTest, StaleSnapshotFailsInStrictMode) {
    auto engine = make_engine();
    ASSERT_TRUE(engine->swap(1000, 0, true, OracleMode::Spot, 2000).ok());

    engine->set_current_time(1010);
    EXPECT_TRUE(engine->preview_fees({5000}).ok());

    engine->set_current_time(1011);
    auto fees = engine->preview_fees({5000});
    ASSERT_FALSE(fees.ok());
    EXPECT_EQ(fees.error().code, ErrorCode::PreviewSnapshotStale);
    EXPECT_DOUBLE_EQ(fees.error().value, 11.0);
    EXPECT_DOUBLE_EQ(fees.error().limit, 10.0);
}

TEST_F(PreviewTest, StaleSnapshotServedBestEffortWhenNotStrict) {
    config.preview.revert_on_stale_preview = false;
    auto engine = make_engine();
    ASSERT_TRUE(engine->swap(1000, 0, true, OracleMode::Spot, 2000).ok());

    engine->set_current_time(1100);
    auto fees = engine->preview_fees({5000});
    ASSERT_TRUE(fees.ok());
    EXPECT_EQ(fees->snapshot_age_sec, 100u);
}

TEST_F(PreviewTest, LadderUsesFixedRungsAndFlagsFloorClamp) {
    // 30k of quote headroom: 10x S0 cannot fill on the bid side
    config.inventory.quote_floor = 970'000;
    auto engine = make_engine();
    ASSERT_TRUE(engine->swap(100, 0, true, OracleMode::Spot, 2000).ok());

    auto ladder = engine->preview_ladder();
    ASSERT_TRUE(ladder.ok());
    ASSERT_EQ(ladder->sizes.size(), 4u);
    EXPECT_EQ(ladder->sizes[0], 5000u);
    EXPECT_EQ(ladder->sizes[1], 10000u);
    EXPECT_EQ(ladder->sizes[2], 25000u);
    EXPECT_EQ(ladder->sizes[3], 50000u);
    EXPECT_DOUBLE_EQ(ladder->snapshot_mid, 1.0);
    EXPECT_EQ(ladder->snapshot_timestamp, 1000u);

    EXPECT_FALSE(ladder->bid_clamped[0]);
    EXPECT_FALSE(ladder->bid_clamped[2]);
    EXPECT_TRUE(ladder->bid_clamped[3]);
    for (bool clamped : ladder->ask_clamped) EXPECT_FALSE(clamped);

    // Size fee makes the ladder non-decreasing
    for (size_t i = 1; i < ladder->sizes.size(); ++i) {
        EXPECT_GE(ladder->bid_fee_bps[i], ladder->bid_fee_bps[i - 1]);
        EXPECT_GE(ladder->ask_fee_bps[i], ladder->ask_fee_bps[i - 1]);
    }
}

TEST_F(PreviewTest, LadderFlagsAomqClamp) {
    auto engine = make_engine();
    feed.set_secondary(0.996);
    ASSERT_TRUE(engine->swap(100, 0, true, OracleMode::Spot, 2000).ok());
    ASSERT_TRUE(engine->preview_snapshot_raw().soft_active);

    auto ladder = engine->preview_ladder(1000);
    ASSERT_TRUE(ladder.ok());
    for (size_t i = 0; i < ladder->sizes.size(); ++i) {
        EXPECT_TRUE(ladder->bid_clamped[i]);
        EXPECT_TRUE(ladder->ask_clamped[i]);
        EXPECT_GE(ladder->bid_fee_bps[i], 50.0);
    }
}

TEST_F(PreviewTest, RefreshPersistsSnapshotWithCooldown) {
    config.preview.snapshot_cooldown_sec = 30;
    auto engine = make_engine();

    ASSERT_TRUE(engine->refresh_preview_snapshot(OracleMode::Spot).ok());
    EXPECT_TRUE(engine->preview_snapshot_raw().valid);
    EXPECT_EQ(engine->preview_snapshot_raw().timestamp, 1000u);
    EXPECT_TRUE(engine->preview_fees({5000}).ok());

    engine->set_current_time(1020);
    auto early = engine->refresh_preview_snapshot(OracleMode::Spot);
    ASSERT_FALSE(early.ok());
    EXPECT_EQ(early.error().code, ErrorCode::PreviewSnapshotCooldown);

    engine->set_current_time(1030);
    ASSERT_TRUE(engine->refresh_preview_snapshot(OracleMode::Spot).ok());
    EXPECT_EQ(engine->preview_snapshot_raw().timestamp, 1030u);
    EXPECT_EQ(engine->events().counters().snapshots, 2u);
}

TEST_F(PreviewTest, RefreshFailsClosedOnBadOracle) {
    auto engine = make_engine();
    feed.set_secondary(1.02);
    auto result = engine->refresh_preview_snapshot(OracleMode::Spot);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::DivergenceHard);
    EXPECT_FALSE(engine->preview_snapshot_raw().valid);
}

TEST(PreviewSnapshotTest, ContextSurvivesSnapshot) {
    PricingContext ctx{.mid = 1.5, .conf_bps = 12.0, .spread_bps = 8.0, .sigma_bps = 20.0,
                       .secondary_conf_bps = 4.0, .haircut_bps = 7.0, .divergence_bps = 40.0,
                       .used_fallback = false, .soft_active = true};
    auto snap = make_snapshot(ctx, kRegimeSoftDivergence, 7, 1234);
    EXPECT_TRUE(snap.valid);
    EXPECT_EQ(snap.block, 7u);
    EXPECT_EQ(snap.timestamp, 1234u);
    EXPECT_EQ(snap.regime_flags, static_cast<uint32_t>(kRegimeSoftDivergence));

    auto back = to_context(snap);
    EXPECT_DOUBLE_EQ(back.mid, 1.5);
    EXPECT_DOUBLE_EQ(back.conf_bps, 12.0);
    EXPECT_DOUBLE_EQ(back.haircut_bps, 7.0);
    EXPECT_TRUE(back.soft_active);
}
