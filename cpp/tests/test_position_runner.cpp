#include <gtest/gtest.h>

#include <vector>

#include "clpsim/position_variant.hpp"
#include "clpsim/tick_math.hpp"
#include "position_runner.hpp"
#include "rebalance_schedule.hpp"

using namespace clpsim;

namespace {

const uint256 kStepGrowth0("20000000000000000000000000000000");

std::vector<Snapshot> flat_series(size_t n, RealT price = RealT(100000)) {
    std::vector<Snapshot> out;
    for (size_t i = 0; i < n; ++i) {
        Snapshot s;
        s.timestamp = 1700000000ULL + i * 3600ULL;
        s.tick = price_to_tick(price, 6, 18);
        s.token0_price = price;
        s.token1_price = RealT(1) / price;
        s.fee_growth_global0_x128 = kStepGrowth0 * static_cast<unsigned>(i + 1);
        s.fee_growth_global1_x128 = uint256(0);
        s.liquidity = RealT(1e20);
        s.tvl_usd = RealT(5e7);
        out.push_back(s);
    }
    return out;
}

LiquidityPosition position_for(const std::vector<Snapshot>& series, const RangeType& range) {
    PositionConfig cfg;
    cfg.initial_amount = RealT(100000);
    cfg.range_type = range;
    cfg.initial_tick = series.front().tick;
    cfg.initial_token0_price = series.front().token0_price;
    cfg.initial_token1_price = series.front().token1_price;
    cfg.initial_tvl = series.front().tvl_usd;
    cfg.total_pool_liquidity = series.front().liquidity;
    cfg.token0_symbol = "WBTC";
    cfg.token1_symbol = "USDC";
    cfg.granularity = Granularity::Hourly;
    return make_position(ProtocolProfile::generic(), cfg);
}

} // namespace

TEST(PositionRunner, FixedIntervalRebalances) {
    const auto series = flat_series(6);
    PositionRunner runner(position_for(series, RangeType::percent(20)));
    IntervalSchedule schedule(2, {});
    const auto result = runner.run(series, schedule, RealT(3));

    EXPECT_EQ(result.rebalances, 2u);
    EXPECT_DOUBLE_EQ(static_cast<double>(result.gas_costs), 6.0);
    ASSERT_EQ(result.sub_positions.size(), 3u);
    for (const auto& sub : result.sub_positions) EXPECT_EQ(sub.duration, 2u);
    EXPECT_DOUBLE_EQ(static_cast<double>(result.sub_positions[2].gas_cost), 0.0);

    ASSERT_EQ(result.statuses.size(), 6u);
    EXPECT_EQ(result.statuses[0].notes, "Start");
    EXPECT_EQ(result.statuses[1].notes, "");
    EXPECT_EQ(result.statuses[2].notes, "Rebalanced");
    EXPECT_EQ(result.statuses[4].notes, "Rebalanced");
    EXPECT_EQ(result.statuses[5].notes, "End");
    EXPECT_EQ(result.statuses[5].rebalancing_actions, 2u);
    EXPECT_TRUE(runner.position().is_closed());
    EXPECT_EQ(result.data_points, 6u);
    EXPECT_DOUBLE_EQ(static_cast<double>(result.net_fees),
                     static_cast<double>(result.cumulative_fees - RealT(6)));
}

TEST(PositionRunner, NoScheduleMeansOneSubPosition) {
    const auto series = flat_series(5);
    PositionRunner runner(position_for(series, RangeType::full_range()));
    IntervalSchedule never(0, {});
    const auto result = runner.run(series, never, RealT(10), 0);

    EXPECT_EQ(result.rebalances, 0u);
    ASSERT_EQ(result.sub_positions.size(), 1u);
    EXPECT_EQ(result.sub_positions[0].duration, 5u);
    ASSERT_EQ(result.statuses.size(), 1u);
    EXPECT_EQ(result.statuses[0].notes, "End");
    EXPECT_NEAR(static_cast<double>(result.weighted_apr), static_cast<double>(result.running_apr), 1e-9);
}

TEST(PositionRunner, StatusEveryNthStep) {
    const auto series = flat_series(7);
    PositionRunner runner(position_for(series, RangeType::full_range()));
    IntervalSchedule never(0, {});
    const auto result = runner.run(series, never, RealT(0), 3);
    // steps 0, 3, 6 (6 is also the last)
    ASSERT_EQ(result.statuses.size(), 3u);
    EXPECT_EQ(result.statuses[0].notes, "Start");
    EXPECT_EQ(result.statuses[2].notes, "End");
}

TEST(PositionRunner, ExplicitSteps) {
    const auto series = flat_series(6);
    PositionRunner runner(position_for(series, RangeType::percent(20)));
    IntervalSchedule schedule(0, {0, 3, 9});
    const auto result = runner.run(series, schedule, RealT(0));
    EXPECT_EQ(result.rebalances, 1u);
    ASSERT_EQ(result.sub_positions.size(), 2u);
    EXPECT_EQ(result.sub_positions[0].duration, 3u);
    EXPECT_EQ(result.sub_positions[1].duration, 3u);
}

TEST(PositionRunner, OutOfRangeTrigger) {
    auto series = flat_series(4);
    const auto high = flat_series(1, RealT(130000)).front();
    series[1].tick = high.tick;
    series[1].token0_price = high.token0_price;
    series[1].token1_price = high.token1_price;

    PositionRunner runner(position_for(series, RangeType::percent(20)));
    OutOfRangeSchedule schedule(IntervalSchedule(0, {}));
    const auto result = runner.run(series, schedule, RealT(1));
    // out of range after step 1, re-ranged around 130k before step 2,
    // then out again once the price falls back to 100k
    EXPECT_EQ(result.rebalances, 2u);
    EXPECT_NEAR(static_cast<double>(result.final_range.price_lower), 90000.0, 1e-6);
}
