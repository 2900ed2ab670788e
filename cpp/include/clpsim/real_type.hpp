#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#if defined(CLPSIM_REAL_LONG_DOUBLE)
#  define CLPSIM_REAL_TYPE long double
#else
#  define CLPSIM_REAL_TYPE double
#endif

namespace clpsim {

using RealT = CLPSIM_REAL_TYPE;

// Q128 fee-growth accumulators are uint256 on-chain; keep them exact.
using uint256 = boost::multiprecision::uint256_t;

} // namespace clpsim
