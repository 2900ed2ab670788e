// Fee income from global fee-growth accumulators
#pragma once

#include <optional>

#include "real_type.hpp"
#include "tick_math.hpp"
#include "types.hpp"

namespace clpsim {

class FeeAccrualEngine {
public:
    explicit FeeAccrualEngine(const DecimalScale& scale) : scale_(scale) {}

    // Percentage [0, 100] of the period the range overlapped the traded band.
    // Uses only the period's high/low (falling back to `price`), converted to
    // ticks. Inputs with no representable tick give 0; full range gives 100.
    static RealT active_liquidity_percent(bool full_range,
                                          const std::optional<RealT>& low,
                                          const std::optional<RealT>& high,
                                          RealT price,
                                          const PositionRange& range,
                                          const DecimalScale& scale);

    // Fee income in USD for the interval ending at `snapshot`; token1 fees are
    // converted at `price`. The first usable snapshot only seeds the baseline.
    // When `skip` is set (out of range or rebalance boundary) no fees are
    // computed but the baseline still moves. Never throws: a failed
    // computation yields 0.
    RealT accrue(const Snapshot& snapshot,
                 RealT liquidity,
                 RealT active_percent,
                 RealT price,
                 bool skip);

    // Raw fee math. Throws std::domain_error if an accumulator went backwards.
    RealT fees_for_interval(const uint256& prev0,
                            const uint256& cur0,
                            const uint256& prev1,
                            const uint256& cur1,
                            RealT liquidity,
                            RealT active_percent,
                            RealT price) const;

    bool seeded() const { return seeded_; }
    const uint256& previous_fee_growth0() const { return prev_fg0_; }
    const uint256& previous_fee_growth1() const { return prev_fg1_; }

private:
    DecimalScale scale_;
    bool seeded_{false};
    uint256 prev_fg0_{0};
    uint256 prev_fg1_{0};
};

} // namespace clpsim
