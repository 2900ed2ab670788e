#include <gtest/gtest.h>

#include <stdexcept>

#include "clpsim/position_variant.hpp"
#include "clpsim/protocol_profile.hpp"
#include "clpsim/tick_math.hpp"

using namespace clpsim;

namespace {

PositionConfig usdc_cbbtc(const RangeType& range) {
    PositionConfig cfg;
    cfg.initial_amount = RealT(100000);
    cfg.range_type = range;
    cfg.initial_token0_price = RealT(100000);
    cfg.initial_token1_price = RealT(100000);
    cfg.initial_tick = price_to_tick(cfg.initial_token0_price, 6, 8);
    cfg.total_pool_liquidity = RealT(1e15);
    cfg.token0_symbol = "USDC";
    cfg.token1_symbol = "cbBTC";
    return cfg;
}

} // namespace

TEST(ProtocolProfile, Presets) {
    const auto g = ProtocolProfile::generic();
    EXPECT_EQ(g.name, "generic");
    EXPECT_EQ(g.tick_spacing, 60);
    EXPECT_EQ(g.decimals0, 6);
    EXPECT_EQ(g.decimals1, 18);

    const auto a = ProtocolProfile::aerodrome_slipstream();
    EXPECT_EQ(a.name, "aerodrome");
    EXPECT_EQ(a.tick_spacing, 2000);
    EXPECT_EQ(a.decimals0, 6);
    EXPECT_EQ(a.decimals1, 8);

    const auto u = ProtocolProfile::uniswap_v3(5);
    EXPECT_EQ(u.name, "uniswap-v3");
    EXPECT_EQ(u.tick_spacing, 10);
    EXPECT_EQ(u.scale().decimals1, 18);
}

TEST(ProtocolProfile, FeeTierSpacing) {
    EXPECT_EQ(tick_spacing_for_fee_tier(1), 1);
    EXPECT_EQ(tick_spacing_for_fee_tier(5), 10);
    EXPECT_EQ(tick_spacing_for_fee_tier(30), 60);
    EXPECT_EQ(tick_spacing_for_fee_tier(100), 200);
    EXPECT_THROW(tick_spacing_for_fee_tier(25), std::invalid_argument);
}

TEST(ProtocolProfile, LookupByName) {
    EXPECT_EQ(ProtocolProfile::from_name("aerodrome").tick_spacing, 2000);
    EXPECT_EQ(ProtocolProfile::from_name("uniswap-v3", 100).tick_spacing, 200);
    EXPECT_EQ(ProtocolProfile::from_name("generic").name, "generic");
    EXPECT_THROW(ProtocolProfile::from_name("curve"), std::invalid_argument);
}

TEST(PositionVariant, AppliesProfileDefaults) {
    auto cfg = usdc_cbbtc(RangeType::percent(20));
    cfg.protocol.tick_spacing = 7;   // replaced by the profile
    const auto pos = make_aerodrome_position(cfg);
    EXPECT_EQ(pos.tick_spacing(), 2000);
    EXPECT_EQ(pos.protocol().decimals1, 8);
    EXPECT_EQ(pos.range().tick_lower % 2000, 0);
    EXPECT_EQ(pos.range().tick_upper % 2000, 0);
    EXPECT_FALSE(pos.is_out_of_range());
}

TEST(PositionVariant, SameBehaviourAsDirectConstruction) {
    auto cfg = usdc_cbbtc(RangeType::percent(20));
    cfg.initial_tick = price_to_tick(cfg.initial_token0_price, 6, 18);
    const auto via_variant = make_uniswap_v3_position(cfg, 30);
    cfg.protocol = ProtocolProfile::uniswap_v3(30);
    const LiquidityPosition direct(cfg);
    EXPECT_EQ(via_variant.range().tick_lower, direct.range().tick_lower);
    EXPECT_EQ(via_variant.range().tick_upper, direct.range().tick_upper);
    EXPECT_EQ(via_variant.liquidity(), direct.liquidity());
    EXPECT_EQ(via_variant.volatile_amount(), direct.volatile_amount());
}

TEST(PositionVariant, UnknownFeeTierFails) {
    EXPECT_THROW(make_uniswap_v3_position(usdc_cbbtc(RangeType::full_range()), 42), std::invalid_argument);
}
