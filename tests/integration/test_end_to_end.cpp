#include <gtest/gtest.h>
#include "config/simulation_config.hpp"
#include "engine/pricing_engine.hpp"
#include "oracle/sim_oracle_feed.hpp"
#include "sim/simulation_runner.hpp"

#include <cmath>

using namespace dnmm;

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = PoolConfig{};
        config.inventory.recenter_threshold_bps = 750.0;
        config.inventory.recenter_cooldown_sec = 60;
        config.inventory.recenter_min_change_bps = 10.0;
        reserves = ReserveState{.base_reserve = 1000, .quote_reserve = 1000, .target_base = 1000};
    }

    PoolConfig    config;
    ReserveState  reserves;
    SimOracleFeed feed;
};

TEST_F(EndToEndTest, PriceMoveRecentersTargetOnce) {
    PricingEngine engine(config, reserves, feed);

    // First trade anchors the recenter price at 1.0
    feed.set_all(1.0, 10.0);
    engine.set_current_time(1000);
    engine.set_block(1);
    auto first = engine.swap(10, 0, true, OracleMode::Spot, 1000);
    ASSERT_TRUE(first.ok());
    EXPECT_FALSE(first->rebalance.has_value());
    EXPECT_EQ(engine.reserves().target_base, 1000u);

    // 1000 bps move clears the 750 bps threshold
    feed.set_all(1.1, 10.0);
    engine.set_current_time(1010);
    engine.set_block(2);
    auto second = engine.swap(10, 0, true, OracleMode::Spot, 1010);
    ASSERT_TRUE(second.ok());
    ASSERT_TRUE(second->rebalance.has_value());

    // target = floor((quote + base * price) / (2 * price)) on post-trade reserves
    const ReserveState& r = engine.reserves();
    double value = static_cast<double>(r.quote_reserve) + static_cast<double>(r.base_reserve) * 1.1;
    auto expected = static_cast<Amount>(std::floor(value / 2.2 + 1e-9));
    EXPECT_EQ(second->rebalance->new_target, expected);
    EXPECT_EQ(r.target_base, expected);
    EXPECT_GE(r.target_base, 950u);
    EXPECT_LE(r.target_base, 960u);
    EXPECT_EQ(second->rebalance->old_target, 1000u);
    EXPECT_EQ(second->rebalance->trigger, RecenterTrigger::Auto);
    EXPECT_DOUBLE_EQ(engine.recenter_state().last_rebalance_price, 1.1);

    // Small moves around the new anchor never retrigger, cooldown or not
    for (int i = 0; i < 5; ++i) {
        feed.set_all(i % 2 == 0 ? 1.11 : 1.1, 10.0);
        Timestamp ts = 1020 + static_cast<Timestamp>(i) * 40;
        engine.set_current_time(ts);
        engine.set_block(3 + i);
        auto trade = engine.swap(5, 0, i % 2 == 0, OracleMode::Spot, ts);
        ASSERT_TRUE(trade.ok());
        EXPECT_FALSE(trade->rebalance.has_value());
    }

    EXPECT_EQ(engine.events().counters().rebalances, 1u);
    ASSERT_EQ(engine.events().rebalances().size(), 1u);
    EXPECT_EQ(engine.reserves().target_base, expected);
}

TEST_F(EndToEndTest, DegradedOracleKeepsQuotingBothSides) {
    PricingEngine engine(config, reserves, feed);
    engine.set_current_time(1000);
    engine.set_block(1);

    // Stale primary, EMA still available
    feed.set_all(1.0, 10.0);
    feed.set_primary(1.0, 100.0);

    auto bid = engine.quote(100, true, OracleMode::Spot);
    auto ask = engine.quote(100, false, OracleMode::Spot);
    ASSERT_TRUE(bid.ok());
    ASSERT_TRUE(ask.ok());
    EXPECT_TRUE(bid->used_fallback);
    EXPECT_TRUE(ask->used_fallback);
    EXPECT_GT(bid->amount_out, 0u);
    EXPECT_GT(ask->amount_out, 0u);
    EXPECT_GE(bid->fee_bps, config.aomq.emergency_spread_bps);
    EXPECT_GE(ask->fee_bps, config.aomq.emergency_spread_bps);
    EXPECT_TRUE(bid->regime_flags & kRegimeFallback);
    EXPECT_TRUE(bid->regime_flags & kRegimeAomq);
    EXPECT_EQ(bid->reason, QuoteReason::Fallback);

    // Oversized trade is clamped to the minimum notional, not rejected
    ReserveState large{.base_reserve = 1'000'000, .quote_reserve = 1'000'000,
                       .target_base = 1'000'000};
    PricingEngine deep(config, large, feed);
    deep.set_current_time(1000);
    deep.set_block(1);
    auto swap = deep.swap(2000, 0, false, OracleMode::Spot, 1000);
    ASSERT_TRUE(swap.ok());
    EXPECT_EQ(swap->fill.reason, QuoteReason::AomqClamp);
    EXPECT_EQ(swap->fill.applied_in, 500u);
    EXPECT_EQ(swap->fill.leftover_in, 1500u);
    EXPECT_FALSE(swap->rebalance.has_value());
    EXPECT_EQ(deep.events().counters().fallback_swaps, 1u);
    EXPECT_EQ(deep.events().counters().aomq_activations, 1u);

    // Fresh primary: normal pricing resumes
    feed.set_primary(1.0);
    auto normal = deep.quote(2000, false, OracleMode::Spot);
    ASSERT_TRUE(normal.ok());
    EXPECT_FALSE(normal->used_fallback);
    EXPECT_EQ(normal->applied_in, 2000u);
    EXPECT_FALSE(normal->regime_flags & kRegimeFallback);
}

TEST_F(EndToEndTest, SimulationRespectsFloorsAndAccounting) {
    SimulationConfig sim;
    sim.pool.inventory.base_floor = 900'000;
    sim.pool.inventory.quote_floor = 900'000;
    sim.steps = 2000;
    sim.seed = 7;
    sim.swap_notional_mean = 20000.0;

    SimulationRunner runner(sim);
    runner.run();

    const auto& trades = runner.metrics().trades();
    ASSERT_FALSE(trades.empty());
    for (const auto& t : trades) {
        EXPECT_EQ(t.requested_in, t.applied_in + t.leftover_in);
        EXPECT_GE(t.base_reserve, sim.pool.inventory.base_floor);
        EXPECT_GE(t.quote_reserve, sim.pool.inventory.quote_floor);
        EXPECT_LE(t.fee_bps, sim.pool.fee.cap_bps);
    }

    auto summary = runner.metrics().compute_summary();
    const auto& counters = runner.engine().events().counters();
    EXPECT_EQ(counters.swaps, summary.fills);
    EXPECT_EQ(counters.partial_fills, summary.partial_fills);
    EXPECT_EQ(counters.fallback_swaps, summary.fallback_fills);
    EXPECT_EQ(summary.fills, trades.size());
    EXPECT_GE(summary.min_base_reserve, sim.pool.inventory.base_floor);
    EXPECT_GE(summary.min_quote_reserve, sim.pool.inventory.quote_floor);

    std::string report = runner.report();
    EXPECT_NE(report.find("Swaps"), std::string::npos);
}

TEST_F(EndToEndTest, SimulationIsDeterministicForSeed) {
    SimulationConfig sim;
    sim.steps = 300;
    sim.seed = 99;

    SimulationRunner a(sim);
    SimulationRunner b(sim);
    a.run();
    b.run();

    ASSERT_EQ(a.metrics().trades().size(), b.metrics().trades().size());
    EXPECT_EQ(a.engine().reserves().base_reserve, b.engine().reserves().base_reserve);
    EXPECT_EQ(a.engine().reserves().quote_reserve, b.engine().reserves().quote_reserve);
}
