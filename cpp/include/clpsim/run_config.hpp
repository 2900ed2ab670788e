// Backtest run configuration (JSON)
#pragma once

#include <boost/json/value.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "position.hpp"
#include "protocol_profile.hpp"
#include "real_type.hpp"
#include "types.hpp"

namespace clpsim {

struct RunSpec {
    std::string tag;
    ProtocolProfile profile;
    // Market fields (initial tick, prices, TVL, pool liquidity) come from the
    // first snapshot, see initial_config().
    PositionConfig position;
    RealT pool_liquidity{0};          // used when snapshots carry no liquidity
    size_t rebalance_every{0};        // data points, 0 = never
    std::vector<size_t> rebalance_at; // explicit step indices
    bool rebalance_when_out_of_range{false};
    RealT gas_cost_usd{0};
};

struct RunInput {
    std::vector<RunSpec> runs;
    std::filesystem::path data_path;
    std::filesystem::path config_dir;
    std::string raw_data_path;
};

// Object with "meta" and "positions", a bare array of entries, or a single
// entry. Throws std::runtime_error / std::invalid_argument on bad input.
RunInput parse_run_config(const boost::json::value& root, const std::filesystem::path& config_dir);
RunInput load_run_file(const std::filesystem::path& path);

// Position config for `spec` seeded from the first snapshot of the series.
PositionConfig initial_config(const RunSpec& spec, const Snapshot& first);

} // namespace clpsim
