#include "clpsim/position_variant.hpp"

#include <utility>

namespace clpsim {

LiquidityPosition make_position(const ProtocolProfile& profile, PositionConfig config) {
    config.protocol = profile;
    return LiquidityPosition(config);
}

LiquidityPosition make_aerodrome_position(PositionConfig config) {
    return make_position(ProtocolProfile::aerodrome_slipstream(), std::move(config));
}

LiquidityPosition make_uniswap_v3_position(PositionConfig config, int fee_bps) {
    return make_position(ProtocolProfile::uniswap_v3(fee_bps), std::move(config));
}

} // namespace clpsim
