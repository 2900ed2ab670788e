#include "clpsim/types.hpp"

#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace clpsim {

RealT periods_per_year(Granularity g) {
    return g == Granularity::Daily ? RealT(365) : RealT(8760);
}

Granularity parse_granularity(const std::string& s) {
    if (s == "daily") return Granularity::Daily;
    if (s == "hourly") return Granularity::Hourly;
    throw std::invalid_argument("unknown granularity: " + s);
}

AprMode parse_apr_mode(const std::string& s) {
    if (s == "running") return AprMode::Running;
    if (s == "compounding") return AprMode::Compounding;
    throw std::invalid_argument("unknown apr mode: " + s);
}

const char* to_string(Granularity g) {
    return g == Granularity::Daily ? "daily" : "hourly";
}

const char* to_string(AprMode m) {
    return m == AprMode::Running ? "running" : "compounding";
}

RangeType RangeType::full_range() {
    return RangeType(true, std::numeric_limits<RealT>::infinity());
}

RangeType RangeType::percent(RealT width_percent) {
    // price_lower = p * (1 - w/2) must stay positive
    if (!std::isfinite(width_percent) || !(width_percent > RealT(0)) || !(width_percent < RealT(200))) {
        std::ostringstream oss;
        oss << "range width must be in (0%, 200%), got " << width_percent << "%";
        throw std::invalid_argument(oss.str());
    }
    return RangeType(false, width_percent);
}

RangeType RangeType::parse(const std::string& s) {
    if (s == "full-range") return full_range();
    if (s.size() < 2 || s.back() != '%') {
        throw std::invalid_argument("range type must be 'full-range' or '<width>%': " + s);
    }
    const std::string num = s.substr(0, s.size() - 1);
    char* end = nullptr;
    const double v = std::strtod(num.c_str(), &end);
    if (end == num.c_str() || *end != '\0') {
        throw std::invalid_argument("range type must be 'full-range' or '<width>%': " + s);
    }
    return percent(static_cast<RealT>(v));
}

std::string RangeType::str() const {
    if (full_range_) return "full-range";
    std::ostringstream oss;
    oss << width_percent_ << "%";
    return oss.str();
}

} // namespace clpsim
