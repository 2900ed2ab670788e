// Protocol flavours of a position: defaults only, no behaviour of their own
#pragma once

#include "position.hpp"
#include "protocol_profile.hpp"

namespace clpsim {

// Apply `profile` (tick spacing, decimals) to `config` and build the position.
LiquidityPosition make_position(const ProtocolProfile& profile, PositionConfig config);

LiquidityPosition make_aerodrome_position(PositionConfig config);
LiquidityPosition make_uniswap_v3_position(PositionConfig config, int fee_bps);

} // namespace clpsim
