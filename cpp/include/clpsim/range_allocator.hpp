// Three-region token allocation and liquidity units for a price range
#pragma once

#include "real_type.hpp"
#include "tick_math.hpp"
#include "types.hpp"

namespace clpsim {

// amount0: units of the priced (volatile) leg, held entirely below the range.
// amount1: quote units, held entirely above the range.
// In every region amount0 * price + amount1 == investment.
struct RangeAllocation {
    RealT amount0{0};
    RealT amount1{0};
    RealT liquidity{0};
};

// Full-range positions are valued against this finite band instead of (0, inf).
constexpr RealT FULL_RANGE_LOW_FACTOR = static_cast<RealT>(0.01);
constexpr RealT FULL_RANGE_HIGH_FACTOR = static_cast<RealT>(100);

class RangeAllocator {
public:
    // Token split for a bounded range. Throws std::invalid_argument if the
    // bounds are not 0 < price_lower < price_upper or price is not positive.
    static RangeAllocation allocate(RealT investment,
                                    RealT price,
                                    RealT price_lower,
                                    RealT price_upper,
                                    const DecimalScale& scale);

    // 50/50 split, liquidity measured over [0.01 * price, 100 * price].
    static RangeAllocation allocate_full_range(RealT investment,
                                               RealT price,
                                               const DecimalScale& scale);

    // Dispatch on the range type.
    static RangeAllocation allocate(const RangeType& type,
                                    const PositionRange& range,
                                    RealT investment,
                                    RealT price,
                                    const DecimalScale& scale);

    // Liquidity units from Q96 sqrt prices. Below the range only amount0 binds,
    // above only amount1, inside the smaller of the two estimates.
    static RealT liquidity_for_amounts(RealT price,
                                       RealT price_a,
                                       RealT price_b,
                                       RealT amount0,
                                       RealT amount1,
                                       const DecimalScale& scale);
};

// Range around `price` for the given type, ticks widened to the spacing.
PositionRange compute_position_range(const RangeType& type,
                                     RealT price,
                                     int32_t tick_spacing,
                                     const DecimalScale& scale);

} // namespace clpsim
