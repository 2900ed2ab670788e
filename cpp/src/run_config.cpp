#include "clpsim/run_config.hpp"

#include <boost/json.hpp>

#include <stdexcept>
#include <utility>

#include "clpsim/snapshot_io.hpp"

namespace json = boost::json;
namespace fs = std::filesystem;

namespace clpsim {

namespace {

std::string as_text(const json::value& v) {
    return v.as_string().c_str();
}

void parse_position_entry(const json::object& entry, RunSpec& spec) {
    if (auto* v = entry.if_contains("tag")) spec.tag = as_text(*v);
    if (auto* v = entry.if_contains("initial_amount")) spec.position.initial_amount = to_real(*v);
    if (auto* v = entry.if_contains("range")) spec.position.range_type = RangeType::parse(as_text(*v));

    std::string protocol = "generic";
    int fee_bps = 30;
    if (auto* v = entry.if_contains("protocol")) protocol = as_text(*v);
    if (auto* v = entry.if_contains("fee_bps")) fee_bps = static_cast<int>(to_real(*v));
    spec.profile = ProtocolProfile::from_name(protocol, fee_bps);
    if (auto* v = entry.if_contains("tick_spacing")) spec.profile.tick_spacing = static_cast<int32_t>(to_real(*v));
    if (auto* v = entry.if_contains("decimals0")) spec.profile.decimals0 = static_cast<int>(to_real(*v));
    if (auto* v = entry.if_contains("decimals1")) spec.profile.decimals1 = static_cast<int>(to_real(*v));
    if (spec.profile.tick_spacing <= 0) {
        throw std::invalid_argument("tick_spacing must be positive");
    }

    if (auto* v = entry.if_contains("token0_symbol")) spec.position.token0_symbol = as_text(*v);
    if (auto* v = entry.if_contains("token1_symbol")) spec.position.token1_symbol = as_text(*v);
    if (auto* v = entry.if_contains("granularity")) spec.position.granularity = parse_granularity(as_text(*v));
    if (auto* v = entry.if_contains("apr_mode")) spec.position.apr_mode = parse_apr_mode(as_text(*v));

    if (auto* v = entry.if_contains("rebalance_every")) spec.rebalance_every = static_cast<size_t>(to_real(*v));
    if (auto* v = entry.if_contains("rebalance_at")) {
        for (const auto& step : v->as_array()) {
            spec.rebalance_at.push_back(static_cast<size_t>(to_real(step)));
        }
    }
    if (auto* v = entry.if_contains("rebalance_when_out_of_range")) spec.rebalance_when_out_of_range = v->as_bool();
    if (auto* v = entry.if_contains("gas_cost_usd")) spec.gas_cost_usd = to_real(*v);
    if (auto* v = entry.if_contains("pool_liquidity")) spec.pool_liquidity = to_real(*v);
}

RunSpec parse_tagged_entry(const json::value& entry, size_t index) {
    if (!entry.is_object()) {
        throw std::runtime_error("position entry " + std::to_string(index) + " is not an object");
    }
    RunSpec spec;
    parse_position_entry(entry.as_object(), spec);
    if (spec.tag.empty()) spec.tag = "position_" + std::to_string(index);
    return spec;
}

} // namespace

RunInput parse_run_config(const json::value& root, const fs::path& config_dir) {
    RunInput input;
    input.config_dir = config_dir;

    if (root.is_object()) {
        const auto& obj = root.as_object();
        if (auto* meta = obj.if_contains("meta")) {
            if (auto* df = meta->as_object().if_contains("datafile")) {
                input.raw_data_path = as_text(*df);
                fs::path raw = input.raw_data_path;
                if (!raw.is_absolute()) {
                    raw = input.config_dir / raw;
                }
                input.data_path = fs::absolute(raw);
            }
        }
        if (auto* positions = obj.if_contains("positions")) {
            const auto& arr = positions->as_array();
            input.runs.reserve(arr.size());
            for (const auto& entry : arr) {
                input.runs.push_back(parse_tagged_entry(entry, input.runs.size()));
            }
            return input;
        }
        if (obj.contains("initial_amount")) {
            input.runs.push_back(parse_tagged_entry(root, 0));
            return input;
        }
    }

    if (root.is_array()) {
        const auto& arr = root.as_array();
        input.runs.reserve(arr.size());
        for (const auto& entry : arr) {
            input.runs.push_back(parse_tagged_entry(entry, input.runs.size()));
        }
        return input;
    }

    throw std::runtime_error("run config must be an object with a 'positions' array or an array of entries");
}

RunInput load_run_file(const fs::path& path) {
    return parse_run_config(read_json_file(path), path.parent_path());
}

PositionConfig initial_config(const RunSpec& spec, const Snapshot& first) {
    PositionConfig cfg = spec.position;
    cfg.initial_tick = first.tick;
    cfg.initial_tvl = first.tvl_usd;
    cfg.initial_token0_price = first.token0_price;
    cfg.initial_token1_price = first.token1_price;
    cfg.total_pool_liquidity = first.liquidity > RealT(0) ? first.liquidity : spec.pool_liquidity;
    if (!(cfg.total_pool_liquidity > RealT(0))) {
        throw std::runtime_error(spec.tag + ": no pool liquidity in the first snapshot and no pool_liquidity override");
    }
    return cfg;
}

} // namespace clpsim
