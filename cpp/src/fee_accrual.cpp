#include "clpsim/fee_accrual.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include "clpsim/trace.hpp"

namespace clpsim {

namespace {

// Q128 fixed point -> real units of the token
RealT q128_to_real(const uint256& v, RealT unit) {
    const long double raw = v.convert_to<long double>();
    return static_cast<RealT>(std::ldexp(raw, -128)) / unit;
}

} // namespace

RealT FeeAccrualEngine::active_liquidity_percent(bool full_range,
                                                 const std::optional<RealT>& low,
                                                 const std::optional<RealT>& high,
                                                 RealT price,
                                                 const PositionRange& range,
                                                 const DecimalScale& scale) {
    if (full_range) {
        return RealT(100);
    }
    const auto ta = tick_for_price(low.value_or(price), scale.decimals0, scale.decimals1);
    const auto tb = tick_for_price(high.value_or(price), scale.decimals0, scale.decimals1);
    if (!ta || !tb) {
        return RealT(0);
    }
    const int32_t band_lo = std::min(*ta, *tb);
    const int32_t band_hi = std::max(*ta, *tb);

    if (band_hi < range.tick_lower || band_lo > range.tick_upper) {
        return RealT(0);
    }
    if (band_hi == band_lo) {
        return RealT(100);
    }
    const RealT overlap = static_cast<RealT>(std::min(band_hi, range.tick_upper) -
                                             std::max(band_lo, range.tick_lower));
    const RealT pct = overlap / static_cast<RealT>(band_hi - band_lo) * RealT(100);
    if (!std::isfinite(pct)) return RealT(0);
    return std::clamp(pct, RealT(0), RealT(100));
}

RealT FeeAccrualEngine::fees_for_interval(const uint256& prev0,
                                          const uint256& cur0,
                                          const uint256& prev1,
                                          const uint256& cur1,
                                          RealT liquidity,
                                          RealT active_percent,
                                          RealT price) const {
    if (cur0 < prev0 || cur1 < prev1) {
        throw std::domain_error("fee growth accumulator decreased");
    }
    const RealT fg0 = q128_to_real(cur0 - prev0, scale_.token0_unit());
    const RealT fg1 = q128_to_real(cur1 - prev1, scale_.token1_unit());

    const RealT fee0 = fg0 * liquidity * active_percent / RealT(100);
    const RealT fee1 = fg1 * liquidity * active_percent / RealT(100);
    const RealT usd = fee0 + fee1 * price;
    if (!std::isfinite(usd)) {
        throw std::domain_error("non-finite fee income");
    }
    return usd;
}

RealT FeeAccrualEngine::accrue(const Snapshot& snapshot,
                               RealT liquidity,
                               RealT active_percent,
                               RealT price,
                               bool skip) {
    const bool usable = snapshot.fee_growth_global0_x128.has_value() &&
                        snapshot.fee_growth_global1_x128.has_value();
    if (!seeded_) {
        if (usable) {
            prev_fg0_ = *snapshot.fee_growth_global0_x128;
            prev_fg1_ = *snapshot.fee_growth_global1_x128;
            seeded_ = true;
        }
        return RealT(0);
    }

    RealT fees = RealT(0);
    if (!skip) {
        try {
            if (!usable) {
                throw std::invalid_argument("missing fee growth accumulator");
            }
            fees = fees_for_interval(prev_fg0_, *snapshot.fee_growth_global0_x128,
                                     prev_fg1_, *snapshot.fee_growth_global1_x128,
                                     liquidity, active_percent, price);
        } catch (const std::exception& e) {
            if (trace_enabled()) {
                std::cout << "TRACE fee_accrual_failed ts=" << snapshot.timestamp
                          << " reason=" << e.what() << "\n";
            }
            fees = RealT(0);
        }
    }

    if (usable) {
        prev_fg0_ = *snapshot.fee_growth_global0_x128;
        prev_fg1_ = *snapshot.fee_growth_global1_x128;
    }
    return fees;
}

} // namespace clpsim
