// Pool snapshot loading from subgraph-style JSON
#pragma once

#include <boost/json/value.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "real_type.hpp"
#include "types.hpp"

namespace clpsim {

// Whole file parsed as JSON. Throws std::runtime_error naming the path if it
// cannot be read or parsed.
boost::json::value read_json_file(const std::filesystem::path& path);

// Numbers or numeric strings; anything else is 0.
RealT to_real(const boost::json::value& v);

// Unix seconds; values above 1e10 are taken as milliseconds. nullopt for
// negative, fractional-string or non-numeric input.
std::optional<uint64_t> parse_timestamp(const boost::json::value& v);

// Decimal string or unsigned integer. nullopt if malformed or negative.
std::optional<uint256> parse_uint256(const boost::json::value& v);

// Accepts an array of rows, or an object holding one under "data",
// "poolDayDatas", "poolHourDatas" or "snapshots" (one level of nesting, as in
// a GraphQL response). Rows without a usable timestamp, token0Price or tick
// (inside [MIN_TICK, MAX_TICK]) are dropped.
// Result is sorted by timestamp; `limit` (0 = all) keeps the earliest rows.
std::vector<Snapshot> parse_snapshots(const boost::json::value& root, size_t limit = 0);
std::vector<Snapshot> parse_snapshot_text(const std::string& text, size_t limit = 0);

// Throws std::runtime_error if the file cannot be read.
std::vector<Snapshot> load_snapshots(const std::filesystem::path& path, size_t limit = 0);

} // namespace clpsim
