#include "clpsim/range_allocator.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace clpsim {

namespace {

void require_positive_price(RealT price, const char* what) {
    if (!std::isfinite(price) || !(price > RealT(0))) {
        throw std::invalid_argument(std::string(what) + " must be finite and positive");
    }
}

} // namespace

RangeAllocation RangeAllocator::allocate(RealT investment,
                                         RealT price,
                                         RealT price_lower,
                                         RealT price_upper,
                                         const DecimalScale& scale) {
    require_positive_price(price, "price");
    require_positive_price(price_lower, "price_lower");
    require_positive_price(price_upper, "price_upper");
    if (!(price_lower < price_upper)) {
        throw std::invalid_argument("price_lower must be below price_upper");
    }
    if (investment < RealT(0)) {
        throw std::invalid_argument("investment must be non-negative");
    }

    const RealT adj = scale.adjustment();
    const RealT sp = scale.sqrt_price(price);
    const RealT sl = scale.sqrt_price(price_lower);
    const RealT sh = scale.sqrt_price(price_upper);

    RangeAllocation out;
    if (price <= price_lower) {
        const RealT delta = investment / ((RealT(1) / sl - RealT(1) / sh) * price);
        out.amount0 = delta * (RealT(1) / sl - RealT(1) / sh);
        out.amount1 = RealT(0);
    } else if (price >= price_upper) {
        const RealT delta = investment / (sh - sl);
        out.amount0 = RealT(0);
        out.amount1 = delta * (sh - sl);
    } else {
        const RealT delta = investment /
            (sp - sl + (RealT(1) / sp - RealT(1) / sh) * (price * adj));
        out.amount0 = delta * (RealT(1) / sp - RealT(1) / sh) * adj;
        out.amount1 = delta * (sp - sl);
    }
    out.liquidity = liquidity_for_amounts(price, price_lower, price_upper, out.amount0, out.amount1, scale);
    return out;
}

RangeAllocation RangeAllocator::allocate_full_range(RealT investment,
                                                    RealT price,
                                                    const DecimalScale& scale) {
    require_positive_price(price, "price");
    if (investment < RealT(0)) {
        throw std::invalid_argument("investment must be non-negative");
    }
    RangeAllocation out;
    out.amount1 = investment / RealT(2);
    out.amount0 = (investment / RealT(2)) / price;
    out.liquidity = liquidity_for_amounts(price,
                                          price * FULL_RANGE_LOW_FACTOR,
                                          price * FULL_RANGE_HIGH_FACTOR,
                                          out.amount0,
                                          out.amount1,
                                          scale);
    return out;
}

RangeAllocation RangeAllocator::allocate(const RangeType& type,
                                         const PositionRange& range,
                                         RealT investment,
                                         RealT price,
                                         const DecimalScale& scale) {
    if (type.is_full_range()) {
        return allocate_full_range(investment, price, scale);
    }
    return allocate(investment, price, range.price_lower, range.price_upper, scale);
}

RealT RangeAllocator::liquidity_for_amounts(RealT price,
                                            RealT price_a,
                                            RealT price_b,
                                            RealT amount0,
                                            RealT amount1,
                                            const DecimalScale& scale) {
    const RealT Q = q96();
    const RealT sa = scale.sqrt_price_x96(price_a);
    const RealT sb = scale.sqrt_price_x96(price_b);
    const RealT s_low = std::min(sa, sb);
    const RealT s_high = std::max(sa, sb);
    const RealT s_price = scale.sqrt_price_x96(price);
    const RealT unit0 = scale.volatile_unit();
    const RealT unit1 = scale.quote_unit();

    if (s_price <= s_low) {
        return amount0 / ((Q * (s_high - s_low) / s_high / s_low) / unit0);
    }
    if (s_price < s_high) {
        const RealT liq0 = amount0 / ((Q * (s_high - s_price) / s_high / s_price) / unit0);
        const RealT liq1 = amount1 / ((s_price - s_low) / Q / unit1);
        return std::min(liq0, liq1);
    }
    return amount1 / ((s_high - s_low) / Q / unit1);
}

PositionRange compute_position_range(const RangeType& type,
                                     RealT price,
                                     int32_t tick_spacing,
                                     const DecimalScale& scale) {
    PositionRange r;
    if (type.is_full_range()) {
        r.tick_lower = MIN_TICK;
        r.tick_upper = MAX_TICK;
        r.price_lower = RealT(0);
        r.price_upper = std::numeric_limits<RealT>::infinity();
        r.range_width = std::numeric_limits<RealT>::infinity();
        return r;
    }
    require_positive_price(price, "price");
    const RealT w = type.width_fraction();
    r.price_lower = price * (RealT(1) - w / RealT(2));
    r.price_upper = price * (RealT(1) + w / RealT(2));
    r.range_width = w;
    const int32_t raw_lower = price_to_tick(r.price_lower, scale.decimals0, scale.decimals1);
    const int32_t raw_upper = price_to_tick(r.price_upper, scale.decimals0, scale.decimals1);
    const auto ticks = snap_tick_range(raw_lower, raw_upper, tick_spacing);
    r.tick_lower = ticks.first;
    r.tick_upper = ticks.second;
    return r;
}

} // namespace clpsim
