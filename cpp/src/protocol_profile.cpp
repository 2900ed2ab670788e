#include "clpsim/protocol_profile.hpp"

#include <stdexcept>

namespace clpsim {

int32_t tick_spacing_for_fee_tier(int fee_bps) {
    switch (fee_bps) {
        case 1: return 1;
        case 5: return 10;
        case 30: return 60;
        case 100: return 200;
        default:
            throw std::invalid_argument("unsupported fee tier: " + std::to_string(fee_bps) + " bps");
    }
}

ProtocolProfile ProtocolProfile::generic() {
    return ProtocolProfile{};
}

ProtocolProfile ProtocolProfile::aerodrome_slipstream() {
    ProtocolProfile p;
    p.name = "aerodrome";
    p.tick_spacing = 2000;
    p.decimals0 = 6;   // USDC
    p.decimals1 = 8;   // cbBTC
    return p;
}

ProtocolProfile ProtocolProfile::uniswap_v3(int fee_bps) {
    ProtocolProfile p;
    p.name = "uniswap-v3";
    p.tick_spacing = tick_spacing_for_fee_tier(fee_bps);
    p.decimals0 = 6;
    p.decimals1 = 18;
    return p;
}

ProtocolProfile ProtocolProfile::from_name(const std::string& name, int fee_bps) {
    if (name == "generic") return generic();
    if (name == "aerodrome") return aerodrome_slipstream();
    if (name == "uniswap-v3") return uniswap_v3(fee_bps);
    throw std::invalid_argument("unknown protocol: " + name);
}

} // namespace clpsim
