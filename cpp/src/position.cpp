#include "clpsim/position.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "clpsim/trace.hpp"

namespace clpsim {

namespace {

bool finite_positive(RealT v) {
    return std::isfinite(v) && v > RealT(0);
}

bool names_btc(std::string symbol) {
    std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return symbol.find("BTC") != std::string::npos;
}

} // namespace

LiquidityPosition::VolatileLeg LiquidityPosition::resolve_volatile_leg(const std::string& symbol0,
                                                                       const std::string& symbol1) {
    if (names_btc(symbol0)) return VolatileLeg::Token0;
    if (names_btc(symbol1)) return VolatileLeg::Token1;
    return VolatileLeg::Token0;
}

LiquidityPosition::LiquidityPosition(const PositionConfig& config)
    : config_(config),
      scale_(config.protocol.scale()),
      volatile_leg_(resolve_volatile_leg(config.token0_symbol, config.token1_symbol)),
      fee_engine_(config.protocol.scale()) {
    if (!finite_positive(config_.initial_amount)) {
        throw std::invalid_argument("initial amount must be positive");
    }
    if (!finite_positive(config_.initial_token0_price)) {
        throw std::invalid_argument("initial token0 price must be positive");
    }
    if (!finite_positive(config_.total_pool_liquidity)) {
        throw std::invalid_argument("total pool liquidity must be positive");
    }

    total_pool_liquidity_ = config_.total_pool_liquidity;
    pool_tvl_ = config_.initial_tvl;
    current_tick_ = config_.initial_tick;
    current_token0_price_ = config_.initial_token0_price;
    current_token1_price_ = config_.initial_token1_price;
    if (!finite_positive(valuation_price())) {
        throw std::invalid_argument("initial price of the volatile leg must be positive");
    }
    initial_valuation_price_ = valuation_price();
    entry_valuation_price_ = initial_valuation_price_;
    current_position_capital_ = config_.initial_amount;

    open_range(config_.initial_amount, current_token0_price_);
}

// Leaves the position untouched if the range or allocation throws.
void LiquidityPosition::open_range(RealT investment, RealT price) {
    PositionRange range = compute_position_range(config_.range_type, price, config_.protocol.tick_spacing, scale_);
    RangeAllocation balances = RangeAllocator::allocate(config_.range_type, range, investment, price, scale_);
    range_ = range;
    balances_ = balances;
    lp_share_ = balances_.liquidity / total_pool_liquidity_;
}

RealT LiquidityPosition::valuation_price() const {
    return volatile_leg_ == VolatileLeg::Token0 ? current_token0_price_ : current_token1_price_;
}

bool LiquidityPosition::is_out_of_range(int32_t tick) const {
    return tick < range_.tick_lower || tick > range_.tick_upper;
}

RealT LiquidityPosition::advance(const Snapshot& snapshot, bool was_rebalanced) {
    if (state_ == PositionState::Closed) {
        throw std::logic_error("advance called on a closed position");
    }
    ++total_data_points_;
    ++current_position_data_points_;
    current_was_rebalanced_ = was_rebalanced;
    current_tick_ = snapshot.tick;
    current_timestamp_ = snapshot.timestamp;

    // A price with no representable tick keeps the last good one and earns nothing.
    const bool price_ok = finite_positive(snapshot.token0_price) &&
                          tick_for_price(snapshot.token0_price, scale_.decimals0, scale_.decimals1).has_value();
    if (price_ok) {
        current_token0_price_ = snapshot.token0_price;
        if (finite_positive(snapshot.token1_price)) {
            current_token1_price_ = snapshot.token1_price;
        }
    }
    if (finite_positive(snapshot.liquidity)) total_pool_liquidity_ = snapshot.liquidity;
    if (finite_positive(snapshot.tvl_usd)) pool_tvl_ = snapshot.tvl_usd;

    const bool in_range = price_ok && !is_out_of_range(current_tick_) && !was_rebalanced;
    const RealT active_percent = price_ok
        ? FeeAccrualEngine::active_liquidity_percent(config_.range_type.is_full_range(),
                                                     snapshot.low, snapshot.high,
                                                     snapshot.token0_price, range_, scale_)
        : RealT(0);

    const RealT fees = fee_engine_.accrue(snapshot, balances_.liquidity, active_percent,
                                          current_token0_price_, !in_range);
    if (in_range) {
        ++data_points_in_range_;
    }
    cumulative_fees_ += fees;
    current_position_fees_ += fees;
    uninvested_fees_ += fees;
    track_portfolio_value();

    if (trace_enabled()) {
        std::cout << "TRACE advance ts=" << snapshot.timestamp
                  << " tick=" << current_tick_
                  << " in_range=" << (in_range ? 1 : 0)
                  << " active_pct=" << active_percent
                  << " fees=" << fees << "\n";
    }
    return fees;
}

void LiquidityPosition::track_portfolio_value() {
    const RealT total = total_portfolio_value();
    peak_portfolio_value_ = std::max(peak_portfolio_value_, total);
    // No drawdown is recorded until the portfolio has been above water.
    if (peak_portfolio_value_ > config_.initial_amount) {
        const RealT dd = (peak_portfolio_value_ - total) / peak_portfolio_value_ * RealT(100);
        max_drawdown_pct_ = std::max(max_drawdown_pct_, dd);
    }
}

void LiquidityPosition::rebalance(int32_t new_tick, RealT new_tvl, RealT gas_cost, bool is_closing) {
    if (state_ == PositionState::Closed) {
        throw std::logic_error("rebalance called on a closed position");
    }
    if (!std::isfinite(gas_cost) || gas_cost < RealT(0)) {
        throw std::invalid_argument("gas cost must be finite and non-negative");
    }
    // Fees roll into capital; gas is charged to the gas total only.
    const RealT capital = current_position_capital_ + current_position_fees_;
    if (!is_closing) {
        open_range(capital, current_token0_price_);
    }

    if (current_position_data_points_ > 0) {
        position_results_.push_back(SubPositionResult{
            current_position_data_points_,
            current_position_fees_,
            gas_cost,
            current_position_capital_,
        });
    }
    current_tick_ = new_tick;
    if (finite_positive(new_tvl)) pool_tvl_ = new_tvl;

    current_position_capital_ = capital;
    if (is_closing) {
        state_ = PositionState::Closed;
    } else {
        uninvested_fees_ = RealT(0);
        entry_valuation_price_ = valuation_price();
        total_gas_costs_ += gas_cost;
        ++rebalance_count_;
        last_rebalance_data_point_ = total_data_points_;
    }
    current_position_data_points_ = 0;
    current_position_fees_ = RealT(0);

    if (trace_enabled()) {
        std::cout << "TRACE rebalance ts=" << current_timestamp_
                  << " closing=" << (is_closing ? 1 : 0)
                  << " tick_lower=" << range_.tick_lower
                  << " tick_upper=" << range_.tick_upper
                  << " capital=" << current_position_capital_
                  << " gas=" << gas_cost << "\n";
    }
}

RealT LiquidityPosition::current_position_value() const {
    return balances_.amount1 + balances_.amount0 * valuation_price();
}

RealT LiquidityPosition::total_portfolio_value() const {
    return current_position_value() + uninvested_fees_;
}

RealT LiquidityPosition::hold_strategy_value() const {
    const RealT half = config_.initial_amount / RealT(2);
    return half + (half / initial_valuation_price_) * valuation_price();
}

RealT LiquidityPosition::impermanent_loss(RealT current_price) const {
    const RealT r = current_price / entry_valuation_price_;
    const RealT lp_value = RealT(2) * std::sqrt(r) / (RealT(1) + r);
    return (lp_value - RealT(1)) * RealT(100);
}

RealT LiquidityPosition::impermanent_loss() const {
    return impermanent_loss(valuation_price());
}

RealT LiquidityPosition::annualize(RealT net_return, size_t duration) const {
    return net_return * (periods_per_year(config_.granularity) / static_cast<RealT>(duration)) * RealT(100);
}

RealT LiquidityPosition::running_apr() const {
    if (total_data_points_ == 0) return RealT(0);
    return annualize(net_fees() / config_.initial_amount, total_data_points_);
}

RealT LiquidityPosition::gross_apr() const {
    if (total_data_points_ == 0) return RealT(0);
    return annualize(cumulative_fees_ / config_.initial_amount, total_data_points_);
}

RealT LiquidityPosition::weighted_apr() const {
    std::vector<SubPositionResult> all = position_results_;
    if (state_ == PositionState::Active && current_position_data_points_ > 0) {
        all.push_back(SubPositionResult{
            current_position_data_points_,
            current_position_fees_,
            RealT(0),
            current_position_capital_,
        });
    }

    RealT weighted_sum = RealT(0);
    size_t total_duration = 0;
    for (const auto& p : all) {
        const RealT net_apr = annualize((p.fees - p.gas_cost) / p.starting_capital, p.duration);
        weighted_sum += net_apr * static_cast<RealT>(p.duration);
        total_duration += p.duration;
    }
    return total_duration > 0 ? weighted_sum / static_cast<RealT>(total_duration) : RealT(0);
}

RealT LiquidityPosition::apr() const {
    if (config_.apr_mode == AprMode::Compounding && !position_results_.empty()) {
        return weighted_apr();
    }
    return running_apr();
}

RealT LiquidityPosition::time_in_range() const {
    if (total_data_points_ == 0) return RealT(0);
    return static_cast<RealT>(data_points_in_range_) / static_cast<RealT>(total_data_points_) * RealT(100);
}

RealT LiquidityPosition::max_gain() const {
    if (total_data_points_ == 0) return RealT(0);
    return (peak_portfolio_value_ - config_.initial_amount) / config_.initial_amount * RealT(100);
}

PositionStatus LiquidityPosition::status(bool is_last_data_point) const {
    PositionStatus s;
    s.timestamp = current_timestamp_;
    s.asset_composition = config_.token0_symbol + "," + config_.token1_symbol;
    {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(8) << balances_.amount0 << ","
            << std::setprecision(2) << balances_.amount1;
        s.asset_amounts = oss.str();
    }
    const RealT value = current_position_value();
    const RealT total = total_portfolio_value();
    s.spot_price = valuation_price();
    s.total_portfolio_value = total;
    s.pnl = total - config_.initial_amount;
    s.return_pct = s.pnl / config_.initial_amount * RealT(100);
    s.apr = apr();
    s.net_gain_vs_hold = total - hold_strategy_value();
    s.capital_deployed = value;
    s.lp_fees_earned = cumulative_fees_;
    s.net_fees_earned = net_fees();
    s.gas_fees_paid = total_gas_costs_;
    s.max_drawdown = max_drawdown_pct_;
    s.max_gain = max_gain();
    s.impermanent_loss = impermanent_loss();
    s.time_in_range = time_in_range();
    s.rebalancing_actions = rebalance_count_;
    if (total_data_points_ == 1) {
        s.notes = "Start";
    } else if (current_was_rebalanced_) {
        s.notes = "Rebalanced";
    } else if (is_last_data_point) {
        s.notes = "End";
    }
    return s;
}

} // namespace clpsim
