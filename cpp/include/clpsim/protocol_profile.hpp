// Protocol-specific defaults for a concentrated liquidity position
#pragma once

#include <cstdint>
#include <string>

#include "tick_math.hpp"

namespace clpsim {

struct ProtocolProfile {
    std::string name{"generic"};
    int32_t tick_spacing{60};
    int decimals0{6};
    int decimals1{18};

    DecimalScale scale() const { return DecimalScale{decimals0, decimals1}; }

    static ProtocolProfile generic();
    // Aerodrome Slipstream USDC/cbBTC pools.
    static ProtocolProfile aerodrome_slipstream();
    // Uniswap V3; fee tier in basis points (1, 5, 30, 100).
    static ProtocolProfile uniswap_v3(int fee_bps);
    // "generic", "aerodrome" or "uniswap-v3". Throws std::invalid_argument.
    static ProtocolProfile from_name(const std::string& name, int fee_bps = 30);
};

// Uniswap V3 fee tier (bps) -> tick spacing. Throws std::invalid_argument.
int32_t tick_spacing_for_fee_tier(int fee_bps);

} // namespace clpsim
