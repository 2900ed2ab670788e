#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "clpsim/position.hpp"
#include "clpsim/real_type.hpp"
#include "clpsim/types.hpp"
#include "rebalance_schedule.hpp"

namespace clpsim {

struct RunResult {
    std::vector<PositionStatus> statuses;
    std::vector<SubPositionResult> sub_positions;
    PositionRange final_range{};
    RealT final_liquidity{0};
    RealT final_lp_share{0};
    RealT cumulative_fees{0};
    RealT net_fees{0};
    RealT gas_costs{0};
    RealT running_apr{0};
    RealT gross_apr{0};
    RealT weighted_apr{0};
    size_t rebalances{0};
    size_t data_points{0};
};

class PositionRunner {
public:
    explicit PositionRunner(LiquidityPosition position)
        : position_(std::move(position)) {}

    // Rebalances happen at the previous snapshot's tick before the next one is
    // applied; the run ends with a closing rebalance. A status is kept every
    // `status_every` steps (0 = final step only).
    RunResult run(const std::vector<Snapshot>& snapshots,
                  RebalanceSchedule& schedule,
                  RealT gas_cost,
                  size_t status_every = 1) {
        RunResult result;
        for (size_t i = 0; i < snapshots.size(); ++i) {
            const auto& snap = snapshots[i];
            bool rebalanced = false;
            if (i > 0 && schedule.should_rebalance(i, position_, snap)) {
                const auto& prev = snapshots[i - 1];
                position_.rebalance(prev.tick, prev.tvl_usd, gas_cost);
                rebalanced = true;
            }
            position_.advance(snap, rebalanced);
            const bool last = (i + 1 == snapshots.size());
            if (last || (status_every && i % status_every == 0)) {
                result.statuses.push_back(position_.status(last));
            }
        }
        if (!snapshots.empty()) {
            const auto& tail = snapshots.back();
            position_.rebalance(tail.tick, tail.tvl_usd, RealT(0), true);
        }

        result.sub_positions = position_.completed_positions();
        result.final_range = position_.range();
        result.final_liquidity = position_.liquidity();
        result.final_lp_share = position_.lp_share();
        result.cumulative_fees = position_.cumulative_fees();
        result.net_fees = position_.net_fees();
        result.gas_costs = position_.total_gas_costs();
        result.running_apr = position_.running_apr();
        result.gross_apr = position_.gross_apr();
        result.weighted_apr = position_.weighted_apr();
        result.rebalances = position_.rebalance_count();
        result.data_points = position_.total_data_points();
        return result;
    }

    const LiquidityPosition& position() const { return position_; }

private:
    LiquidityPosition position_;
};

} // namespace clpsim
