#include <gtest/gtest.h>

#include <limits>
#include <optional>
#include <stdexcept>

#include "clpsim/fee_accrual.hpp"
#include "clpsim/range_allocator.hpp"
#include "clpsim/tick_math.hpp"
#include "clpsim/types.hpp"

using namespace clpsim;

namespace {

const DecimalScale kScale{6, 18};

Snapshot snap_with_growth(uint64_t ts, const uint256& g0, const uint256& g1) {
    Snapshot s;
    s.timestamp = ts;
    s.tick = 161189;
    s.token0_price = RealT(100000);
    s.token1_price = RealT(0.00001);
    s.fee_growth_global0_x128 = g0;
    s.fee_growth_global1_x128 = g1;
    return s;
}

// token0 delta of 5 units per liquidity, token1 delta of 3 units
const uint256 kDelta0 = uint256(5000000) << 128;
const uint256 kDelta1 = uint256(3000000000000000000ULL) << 128;

} // namespace

TEST(ActiveLiquidity, FullRangeIsAlwaysHundred) {
    const PositionRange r{};
    EXPECT_EQ(FeeAccrualEngine::active_liquidity_percent(true, std::nullopt, std::nullopt, RealT(0), r, kScale), RealT(100));
    EXPECT_EQ(FeeAccrualEngine::active_liquidity_percent(true, RealT(-1), RealT(1e9), RealT(100000), r, kScale), RealT(100));
}

TEST(ActiveLiquidity, NoOverlapIsZero) {
    // 30% band around 100k tops out near 115k; the day traded 118k..125k
    const auto r = compute_position_range(RangeType::percent(30), RealT(100000), 60, kScale);
    EXPECT_EQ(FeeAccrualEngine::active_liquidity_percent(false, RealT(118000), RealT(125000), RealT(120000), r, kScale),
              RealT(0));
    EXPECT_EQ(FeeAccrualEngine::active_liquidity_percent(false, RealT(40000), RealT(50000), RealT(45000), r, kScale),
              RealT(0));
}

TEST(ActiveLiquidity, BandStraddlingBoundIsPartial) {
    const auto r = compute_position_range(RangeType::percent(30), RealT(100000), 60, kScale);
    const RealT pct = FeeAccrualEngine::active_liquidity_percent(false, RealT(110000), RealT(120000), RealT(118000), r, kScale);
    EXPECT_GT(pct, RealT(0));
    EXPECT_LT(pct, RealT(100));
    EXPECT_NEAR(static_cast<double>(pct), 52.41379, 1e-4);

    const auto wide = compute_position_range(RangeType::percent(50), RealT(100000), 60, kScale);
    const RealT pct2 = FeeAccrualEngine::active_liquidity_percent(false, RealT(120000), RealT(130000), RealT(125000), wide, kScale);
    EXPECT_GT(pct2, RealT(0));
    EXPECT_LT(pct2, RealT(100));
}

TEST(ActiveLiquidity, BandInsideRangeIsHundred) {
    const auto r = compute_position_range(RangeType::percent(50), RealT(100000), 60, kScale);
    EXPECT_EQ(FeeAccrualEngine::active_liquidity_percent(false, RealT(95000), RealT(105000), RealT(100000), r, kScale),
              RealT(100));
    EXPECT_EQ(FeeAccrualEngine::active_liquidity_percent(false, std::nullopt, std::nullopt, RealT(100000), r, kScale),
              RealT(100));
}

TEST(ActiveLiquidity, UnusableInputsAreZero) {
    const auto r = compute_position_range(RangeType::percent(50), RealT(100000), 60, kScale);
    const RealT nan = std::numeric_limits<RealT>::quiet_NaN();
    EXPECT_EQ(FeeAccrualEngine::active_liquidity_percent(false, RealT(0), RealT(105000), RealT(100000), r, kScale), RealT(0));
    EXPECT_EQ(FeeAccrualEngine::active_liquidity_percent(false, RealT(95000), RealT(-3), RealT(100000), r, kScale), RealT(0));
    EXPECT_EQ(FeeAccrualEngine::active_liquidity_percent(false, nan, RealT(105000), RealT(100000), r, kScale), RealT(0));
    EXPECT_EQ(FeeAccrualEngine::active_liquidity_percent(false, std::nullopt, std::nullopt, RealT(0), r, kScale), RealT(0));
    const RealT tiny = std::numeric_limits<RealT>::denorm_min();
    EXPECT_EQ(FeeAccrualEngine::active_liquidity_percent(false, tiny, RealT(105000), RealT(100000), r, kScale), RealT(0));
}

// The fraction only sees the period's extremes. A path that spends 90% of
// the period inside the range but briefly spikes to the far edge of the band
// still scores the tick-length ratio, here exactly one half.
TEST(ActiveLiquidity, HighLowApproximationIgnoresPath) {
    PositionRange r;
    r.tick_lower = 0;
    r.tick_upper = 1000;
    const DecimalScale flat{0, 0};
    const RealT low = tick_to_price(500, 0, 0);
    const RealT high = tick_to_price(-500, 0, 0);
    const RealT pct = FeeAccrualEngine::active_liquidity_percent(false, low, high, RealT(1), r, flat);
    EXPECT_NEAR(static_cast<double>(pct), 50.0, 0.2);
}

TEST(FeeAccrual, FormulaPerLeg) {
    FeeAccrualEngine engine(kScale);
    const uint256 zero = 0;
    // 5 * 2 * 0.5 + 3 * 2 * 0.5 * 10
    const RealT fees = engine.fees_for_interval(zero, kDelta0, zero, kDelta1, RealT(2), RealT(50), RealT(10));
    EXPECT_NEAR(static_cast<double>(fees), 35.0, 1e-9);
}

TEST(FeeAccrual, SubtractionIsExactOnLargeAccumulators) {
    FeeAccrualEngine engine(kScale);
    // baseline far beyond double precision; delta must survive intact
    const uint256 base = (uint256(1) << 250) + 12345;
    const RealT fees = engine.fees_for_interval(base, base + kDelta0, base, base, RealT(1), RealT(100), RealT(1));
    EXPECT_NEAR(static_cast<double>(fees), 5.0, 1e-9);
}

TEST(FeeAccrual, DecreasingAccumulatorThrowsInRawMath) {
    FeeAccrualEngine engine(kScale);
    EXPECT_THROW(engine.fees_for_interval(kDelta0, uint256(0), uint256(0), uint256(0), RealT(1), RealT(100), RealT(1)),
                 std::domain_error);
}

TEST(FeeAccrual, FirstSnapshotOnlySeeds) {
    FeeAccrualEngine engine(kScale);
    EXPECT_FALSE(engine.seeded());
    const RealT fees = engine.accrue(snap_with_growth(1, kDelta0 * 7, kDelta1 * 9), RealT(1e6), RealT(100), RealT(100000), false);
    EXPECT_EQ(fees, RealT(0));
    EXPECT_TRUE(engine.seeded());
    EXPECT_EQ(engine.previous_fee_growth0(), kDelta0 * 7);
    EXPECT_EQ(engine.previous_fee_growth1(), kDelta1 * 9);
}

TEST(FeeAccrual, IdenticalAccumulatorsEarnNothing) {
    for (RealT liquidity : {RealT(1), RealT(1e12), RealT(1e30)}) {
        FeeAccrualEngine engine(kScale);
        engine.accrue(snap_with_growth(1, kDelta0, kDelta1), liquidity, RealT(100), RealT(100000), false);
        const RealT fees = engine.accrue(snap_with_growth(2, kDelta0, kDelta1), liquidity, RealT(100), RealT(100000), false);
        EXPECT_EQ(fees, RealT(0));
    }
}

TEST(FeeAccrual, AccruesDeltaAfterSeed) {
    FeeAccrualEngine engine(kScale);
    engine.accrue(snap_with_growth(1, uint256(0), uint256(0)), RealT(2), RealT(100), RealT(10), false);
    const RealT fees = engine.accrue(snap_with_growth(2, kDelta0, kDelta1), RealT(2), RealT(100), RealT(10), false);
    EXPECT_NEAR(static_cast<double>(fees), 70.0, 1e-9);
}

TEST(FeeAccrual, SkipStillMovesBaseline) {
    FeeAccrualEngine engine(kScale);
    engine.accrue(snap_with_growth(1, uint256(0), uint256(0)), RealT(2), RealT(100), RealT(10), false);
    EXPECT_EQ(engine.accrue(snap_with_growth(2, kDelta0, kDelta1), RealT(2), RealT(100), RealT(10), true), RealT(0));
    EXPECT_EQ(engine.previous_fee_growth0(), kDelta0);
    // nothing accrued since the skipped step
    EXPECT_EQ(engine.accrue(snap_with_growth(3, kDelta0, kDelta1), RealT(2), RealT(100), RealT(10), false), RealT(0));
}

TEST(FeeAccrual, PoolResetDegradesToZero) {
    FeeAccrualEngine engine(kScale);
    engine.accrue(snap_with_growth(1, kDelta0 * 3, kDelta1 * 3), RealT(2), RealT(100), RealT(10), false);
    RealT fees = RealT(-1);
    EXPECT_NO_THROW(fees = engine.accrue(snap_with_growth(2, kDelta0, kDelta1), RealT(2), RealT(100), RealT(10), false));
    EXPECT_EQ(fees, RealT(0));
    EXPECT_EQ(engine.previous_fee_growth0(), kDelta0);
    // accrual resumes from the reset baseline
    fees = engine.accrue(snap_with_growth(3, kDelta0 * 2, kDelta1 * 2), RealT(2), RealT(100), RealT(10), false);
    EXPECT_NEAR(static_cast<double>(fees), 70.0, 1e-9);
}

TEST(FeeAccrual, MalformedAccumulatorKeepsBaseline) {
    FeeAccrualEngine engine(kScale);
    engine.accrue(snap_with_growth(1, uint256(0), uint256(0)), RealT(2), RealT(100), RealT(10), false);
    Snapshot bad = snap_with_growth(2, kDelta0, kDelta1);
    bad.fee_growth_global1_x128.reset();
    RealT fees = RealT(-1);
    EXPECT_NO_THROW(fees = engine.accrue(bad, RealT(2), RealT(100), RealT(10), false));
    EXPECT_EQ(fees, RealT(0));
    EXPECT_EQ(engine.previous_fee_growth0(), uint256(0));
    fees = engine.accrue(snap_with_growth(3, kDelta0, kDelta1), RealT(2), RealT(100), RealT(10), false);
    EXPECT_NEAR(static_cast<double>(fees), 70.0, 1e-9);
}

TEST(FeeAccrual, FirstUsableSnapshotSeedsAfterMalformedOnes) {
    FeeAccrualEngine engine(kScale);
    Snapshot bad = snap_with_growth(1, kDelta0, kDelta1);
    bad.fee_growth_global0_x128.reset();
    EXPECT_EQ(engine.accrue(bad, RealT(2), RealT(100), RealT(10), false), RealT(0));
    EXPECT_FALSE(engine.seeded());
    EXPECT_EQ(engine.accrue(snap_with_growth(2, kDelta0, kDelta1), RealT(2), RealT(100), RealT(10), false), RealT(0));
    EXPECT_TRUE(engine.seeded());
}
