// Shared value types for the position simulator
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "real_type.hpp"

namespace clpsim {

enum class Granularity { Daily, Hourly };
enum class AprMode { Running, Compounding };

// Data points per year used to annualize returns.
RealT periods_per_year(Granularity g);

Granularity parse_granularity(const std::string& s);
AprMode parse_apr_mode(const std::string& s);
const char* to_string(Granularity g);
const char* to_string(AprMode m);

// "full-range" or a percentage width such as "50%" around the entry price.
class RangeType {
public:
    static RangeType full_range();
    static RangeType percent(RealT width_percent);
    // Throws std::invalid_argument on anything else.
    static RangeType parse(const std::string& s);

    bool is_full_range() const { return full_range_; }
    RealT width_percent() const { return width_percent_; }
    RealT width_fraction() const { return width_percent_ / RealT(100); }
    std::string str() const;

private:
    RangeType(bool full, RealT width) : full_range_(full), width_percent_(width) {}

    bool full_range_{true};
    RealT width_percent_{0};
};

struct PositionRange {
    int32_t tick_lower{0};
    int32_t tick_upper{0};
    RealT price_lower{0};
    RealT price_upper{0};
    RealT range_width{0};   // fraction of entry price; +inf for full range
};

// One pool observation. Not owned by the position.
struct Snapshot {
    uint64_t timestamp{0};           // unix seconds
    int32_t tick{0};
    RealT token0_price{0};
    RealT token1_price{0};
    std::optional<RealT> high;
    std::optional<RealT> low;
    // nullopt when the source value was missing or malformed
    std::optional<uint256> fee_growth_global0_x128;
    std::optional<uint256> fee_growth_global1_x128;
    RealT liquidity{0};
    RealT tvl_usd{0};
};

} // namespace clpsim
