#include "clpsim/tick_math.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace clpsim {

namespace {

constexpr RealT TICK_BASE = static_cast<RealT>(1.0001L);

RealT pow10(int exponent) {
    return std::pow(static_cast<RealT>(10), static_cast<RealT>(exponent));
}

int32_t clamp_tick(long long t) {
    if (t < MIN_TICK) return MIN_TICK;
    if (t > MAX_TICK) return MAX_TICK;
    return static_cast<int32_t>(t);
}

long long floor_div(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

long long ceil_div(long long a, long long b) {
    return -floor_div(-a, b);
}

} // namespace

RealT DecimalScale::adjustment() const { return pow10(decimals0 - decimals1); }
RealT DecimalScale::token0_unit() const { return pow10(decimals0); }
RealT DecimalScale::token1_unit() const { return pow10(decimals1); }

RealT DecimalScale::sqrt_price(RealT price) const {
    return std::sqrt(price * adjustment());
}

RealT DecimalScale::sqrt_price_x96(RealT price) const {
    return sqrt_price(price) * q96();
}

RealT q96() {
    return std::ldexp(static_cast<RealT>(1), 96);
}

namespace {

// NaN for an unusable price or a tick that does not fit a finite real.
RealT raw_tick(RealT price, int decimals0, int decimals1) {
    if (!std::isfinite(price) || !(price > RealT(0))) {
        return std::numeric_limits<RealT>::quiet_NaN();
    }
    const RealT value = (RealT(1) / price) * pow10(decimals1 - decimals0);
    const RealT raw = std::log(value) / std::log(TICK_BASE);
    return std::isfinite(raw) ? raw : std::numeric_limits<RealT>::quiet_NaN();
}

} // namespace

int32_t price_to_tick(RealT price, int decimals0, int decimals1) {
    if (!std::isfinite(price) || !(price > RealT(0))) {
        throw std::domain_error("price_to_tick: price must be finite and positive");
    }
    const RealT raw = raw_tick(price, decimals0, decimals1);
    if (std::isnan(raw)) {
        throw std::domain_error("price_to_tick: tick out of representable range");
    }
    return clamp_tick(std::llround(raw));
}

std::optional<int32_t> tick_for_price(RealT price, int decimals0, int decimals1) {
    const RealT raw = raw_tick(price, decimals0, decimals1);
    if (std::isnan(raw)) return std::nullopt;
    return clamp_tick(std::llround(raw));
}

RealT tick_to_price(int32_t tick, int decimals0, int decimals1) {
    return pow10(decimals1 - decimals0) / std::pow(TICK_BASE, static_cast<RealT>(tick));
}

std::pair<int32_t, int32_t> snap_tick_range(int32_t raw_a, int32_t raw_b, int32_t tick_spacing) {
    if (tick_spacing <= 0) {
        throw std::invalid_argument("tick spacing must be positive, got " + std::to_string(tick_spacing));
    }
    const long long s = tick_spacing;
    const long long lower = std::min(floor_div(raw_a, s) * s, floor_div(raw_b, s) * s);
    const long long upper = std::max(ceil_div(raw_a, s) * s, ceil_div(raw_b, s) * s);
    return {clamp_tick(lower), clamp_tick(upper)};
}

} // namespace clpsim
