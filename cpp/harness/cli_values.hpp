// Number parsing for command-line flags and environment knobs
#pragma once

#include <cerrno>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <optional>
#include <string>

#include "clpsim/real_type.hpp"

namespace clpsim {

// Unsigned decimal count. Signs, trailing characters and overflow give nullopt.
inline std::optional<size_t> parse_count(const std::string& text) {
    if (text.empty() || text[0] == '-' || text[0] == '+') return std::nullopt;
    errno = 0;
    char* end = nullptr;
    const unsigned long long n = std::strtoull(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || errno == ERANGE) return std::nullopt;
    return static_cast<size_t>(n);
}

// Finite real with nothing after it.
inline std::optional<RealT> parse_amount(const std::string& text) {
    if (text.empty()) return std::nullopt;
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0' || !std::isfinite(v)) return std::nullopt;
    return static_cast<RealT>(v);
}

} // namespace clpsim
