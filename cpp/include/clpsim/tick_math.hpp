// Tick <-> price conversion for base-1.0001 concentrated liquidity pools
#pragma once

#include <cstdint>
#include <optional>
#include <utility>

#include "real_type.hpp"

namespace clpsim {

constexpr int32_t MIN_TICK = -887272;
constexpr int32_t MAX_TICK = 887272;

// Decimal convention shared by allocation and liquidity math. Both sides must
// go through this struct so the 10^(decimals0 - decimals1) factor stays identical.
//
// Prices are quote per volatile unit. With adjustment() = 10^(decimals0 -
// decimals1) a raw sqrt price is in raw token0 per raw token1, so the volatile
// leg counts in 10^decimals1 and the quote leg in 10^decimals0.
struct DecimalScale {
    int decimals0{6};
    int decimals1{18};

    RealT adjustment() const;             // 10^(decimals0 - decimals1)
    RealT token0_unit() const;            // 10^decimals0
    RealT token1_unit() const;            // 10^decimals1
    RealT volatile_unit() const { return token1_unit(); }
    RealT quote_unit() const { return token0_unit(); }

    // sqrt(price * adjustment)
    RealT sqrt_price(RealT price) const;
    // sqrt(price * adjustment) * 2^96
    RealT sqrt_price_x96(RealT price) const;
};

RealT q96();

// price -> tick: invert, scale by 10^(decimals1 - decimals0), log base 1.0001,
// rounded to nearest. Throws std::domain_error on non-finite or non-positive price.
int32_t price_to_tick(RealT price, int decimals0, int decimals1);

// Same as price_to_tick, but nullopt where it would throw (including prices
// so extreme that the log tick overflows).
std::optional<int32_t> tick_for_price(RealT price, int decimals0, int decimals1);

// Exact reverse of price_to_tick (before rounding).
RealT tick_to_price(int32_t tick, int decimals0, int decimals1);

// Order two raw ticks and widen them outward to the tick spacing, clamped to
// [MIN_TICK, MAX_TICK]. Returns {lower, upper}.
std::pair<int32_t, int32_t> snap_tick_range(int32_t raw_a, int32_t raw_b, int32_t tick_spacing);

} // namespace clpsim
