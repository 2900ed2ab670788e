// Concentrated liquidity position over a historical snapshot series
//
// One position, one owner: the driver feeds snapshots in time order through
// advance() and decides when to call rebalance(). All metrics are derived on
// demand from the ledger kept here.
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "fee_accrual.hpp"
#include "protocol_profile.hpp"
#include "range_allocator.hpp"
#include "real_type.hpp"
#include "types.hpp"

namespace clpsim {

struct PositionConfig {
    RealT initial_amount{0};
    RangeType range_type{RangeType::full_range()};
    int32_t initial_tick{0};
    RealT initial_tvl{0};
    RealT initial_token0_price{0};
    RealT initial_token1_price{0};
    RealT total_pool_liquidity{0};
    std::string token0_symbol;
    std::string token1_symbol;
    Granularity granularity{Granularity::Daily};
    AprMode apr_mode{AprMode::Compounding};
    ProtocolProfile protocol{};
};

// Interval between two rebalances (or run start / end).
struct SubPositionResult {
    size_t duration{0};          // data points
    RealT fees{0};
    RealT gas_cost{0};
    RealT starting_capital{0};
};

struct PositionStatus {
    uint64_t timestamp{0};
    std::string asset_composition;
    std::string asset_amounts;
    RealT spot_price{0};
    RealT total_portfolio_value{0};
    RealT pnl{0};
    RealT return_pct{0};
    RealT apr{0};
    RealT net_gain_vs_hold{0};
    RealT capital_deployed{0};
    RealT lp_fees_earned{0};
    RealT net_fees_earned{0};
    RealT gas_fees_paid{0};
    RealT max_drawdown{0};
    RealT max_gain{0};
    RealT impermanent_loss{0};
    RealT time_in_range{0};
    size_t rebalancing_actions{0};
    std::string notes;           // "Start", "Rebalanced", "End" or empty
};

enum class PositionState { Active, Closed };

class LiquidityPosition {
public:
    // Throws std::invalid_argument on non-positive investment, price or pool
    // liquidity, and on a range that cannot be placed around the price.
    explicit LiquidityPosition(const PositionConfig& config);

    // Consume the next snapshot; returns the fee income for this step.
    RealT advance(const Snapshot& snapshot, bool was_rebalanced = false);

    // Close the current sub-position and roll its fees into capital. Unless
    // closing, re-range around the current price and redeploy that capital;
    // gas goes to the gas total. Throws before any change on bad gas.
    void rebalance(int32_t new_tick, RealT new_tvl, RealT gas_cost = RealT(0), bool is_closing = false);

    bool is_out_of_range(int32_t tick) const;
    bool is_out_of_range() const { return is_out_of_range(current_tick_); }

    RealT current_position_value() const;
    RealT total_portfolio_value() const;
    RealT hold_strategy_value() const;
    RealT impermanent_loss() const;
    RealT impermanent_loss(RealT current_price) const;

    RealT apr() const;
    RealT running_apr() const;
    RealT gross_apr() const;
    RealT weighted_apr() const;
    RealT time_in_range() const;
    RealT max_drawdown() const { return max_drawdown_pct_; }
    RealT max_gain() const;

    PositionStatus status(bool is_last_data_point = false) const;

    PositionState state() const { return state_; }
    bool is_closed() const { return state_ == PositionState::Closed; }

    RealT cumulative_fees() const { return cumulative_fees_; }
    RealT net_fees() const { return cumulative_fees_ - total_gas_costs_; }
    RealT total_gas_costs() const { return total_gas_costs_; }
    size_t rebalance_count() const { return rebalance_count_; }
    const std::vector<SubPositionResult>& completed_positions() const { return position_results_; }

    const RangeAllocation& balances() const { return balances_; }
    RealT volatile_amount() const { return balances_.amount0; }
    RealT quote_amount() const { return balances_.amount1; }
    RealT liquidity() const { return balances_.liquidity; }
    RealT lp_share() const { return lp_share_; }

    const PositionRange& range() const { return range_; }
    const RangeType& range_type() const { return config_.range_type; }
    int32_t tick_spacing() const { return config_.protocol.tick_spacing; }
    const ProtocolProfile& protocol() const { return config_.protocol; }

    size_t total_data_points() const { return total_data_points_; }
    size_t data_points_in_range() const { return data_points_in_range_; }
    size_t current_position_data_points() const { return current_position_data_points_; }
    size_t last_rebalance_data_point() const { return last_rebalance_data_point_; }
    RealT current_position_fees() const { return current_position_fees_; }
    RealT current_position_capital() const { return current_position_capital_; }
    RealT initial_investment() const { return config_.initial_amount; }

    int32_t current_tick() const { return current_tick_; }
    RealT current_token0_price() const { return current_token0_price_; }
    RealT current_token1_price() const { return current_token1_price_; }
    // Price of the leg whose symbol names BTC, token0 otherwise.
    RealT valuation_price() const;
    RealT pool_tvl() const { return pool_tvl_; }
    RealT total_pool_liquidity() const { return total_pool_liquidity_; }
    const FeeAccrualEngine& fee_engine() const { return fee_engine_; }

private:
    enum class VolatileLeg { Token0, Token1 };

    static VolatileLeg resolve_volatile_leg(const std::string& symbol0, const std::string& symbol1);

    void open_range(RealT investment, RealT price);
    RealT annualize(RealT net_return, size_t duration) const;
    void track_portfolio_value();

    PositionConfig config_;
    DecimalScale scale_;
    VolatileLeg volatile_leg_{VolatileLeg::Token0};
    PositionState state_{PositionState::Active};

    PositionRange range_{};
    RangeAllocation balances_{};
    RealT lp_share_{0};
    FeeAccrualEngine fee_engine_;

    RealT total_pool_liquidity_{0};
    RealT pool_tvl_{0};
    int32_t current_tick_{0};
    uint64_t current_timestamp_{0};
    RealT current_token0_price_{0};
    RealT current_token1_price_{0};
    RealT initial_valuation_price_{0};   // hold baseline, fixed at run start
    RealT entry_valuation_price_{0};     // IL baseline, reset on each rebalance

    RealT current_position_capital_{0};
    RealT cumulative_fees_{0};
    RealT uninvested_fees_{0};
    RealT total_gas_costs_{0};
    size_t rebalance_count_{0};
    size_t last_rebalance_data_point_{0};

    size_t total_data_points_{0};
    size_t data_points_in_range_{0};
    size_t current_position_data_points_{0};
    RealT current_position_fees_{0};
    bool current_was_rebalanced_{false};
    std::vector<SubPositionResult> position_results_;

    RealT peak_portfolio_value_{0};
    RealT max_drawdown_pct_{0};
};

} // namespace clpsim
