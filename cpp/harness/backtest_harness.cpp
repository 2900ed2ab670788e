#include <boost/json.hpp>

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "clpsim/position_variant.hpp"
#include "clpsim/real_type.hpp"
#include "clpsim/run_config.hpp"
#include "clpsim/snapshot_io.hpp"
#include "cli_values.hpp"
#include "position_runner.hpp"
#include "rebalance_schedule.hpp"

namespace json = boost::json;
namespace fs = std::filesystem;

using clpsim::RealT;

namespace {

struct Options {
    fs::path config_path;
    std::optional<fs::path> data_override;
    std::optional<fs::path> output_path;
    size_t limit_snapshots{0};
    size_t threads{std::max<size_t>(1, std::thread::hardware_concurrency())};
    std::optional<RealT> gas_override;
    std::optional<size_t> rebalance_every_override;
};

bool env_flag(const char* name) {
    const char* v = std::getenv(name);
    return v && std::string(v) == "1";
}

// Count from the environment, or `fallback` if unset or malformed.
size_t env_size(const char* name, size_t fallback) {
    const char* v = std::getenv(name);
    if (!v) return fallback;
    const auto n = clpsim::parse_count(v);
    if (!n) {
        std::cerr << "warning: ignoring " << name << "=" << v << "\n";
        return fallback;
    }
    return *n;
}

Options parse_cli(int argc, char** argv) {
    Options opts;
    opts.threads = std::max<size_t>(1, env_size("CPP_THREADS", opts.threads));
    bool explicit_path = (argc >= 2 && argv[1][0] != '-');
    if (explicit_path) {
        opts.config_path = fs::absolute(fs::path(argv[1]));
    } else {
        opts.config_path = fs::absolute(fs::path("run_data/positions.json"));
    }
    int start_idx = explicit_path ? 2 : 1;
    for (int i = start_idx; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next_value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::runtime_error("missing value for " + arg);
            return argv[++i];
        };
        auto next_size = [&](size_t& dst) {
            const std::string text = next_value();
            const auto n = clpsim::parse_count(text);
            if (!n) throw std::runtime_error("invalid count for " + arg + ": " + text);
            dst = *n;
        };
        if (arg == "--data" && i + 1 < argc) {
            opts.data_override = fs::absolute(fs::path(argv[++i]));
        } else if (arg == "--output" && i + 1 < argc) {
            opts.output_path = fs::absolute(fs::path(argv[++i]));
        } else if (arg == "--limit") {
            next_size(opts.limit_snapshots);
        } else if (arg == "--threads") {
            next_size(opts.threads);
            if (opts.threads == 0) opts.threads = 1;
        } else if (arg == "--gas") {
            const std::string text = next_value();
            const auto gas = clpsim::parse_amount(text);
            if (!gas || *gas < RealT(0)) throw std::runtime_error("invalid amount for " + arg + ": " + text);
            opts.gas_override = *gas;
        } else if (arg == "--rebalance-every") {
            size_t every = 0;
            next_size(every);
            opts.rebalance_every_override = every;
        } else {
            throw std::runtime_error("unknown argument: " + arg);
        }
    }
    return opts;
}

json::object status_to_json(const clpsim::PositionStatus& s) {
    json::object o;
    o["timestamp"] = s.timestamp;
    o["asset_composition"] = s.asset_composition;
    o["asset_amounts"] = s.asset_amounts;
    o["spot_price"] = static_cast<double>(s.spot_price);
    o["total_portfolio_value"] = static_cast<double>(s.total_portfolio_value);
    o["pnl"] = static_cast<double>(s.pnl);
    o["return_pct"] = static_cast<double>(s.return_pct);
    o["apr"] = static_cast<double>(s.apr);
    o["net_gain_vs_hold"] = static_cast<double>(s.net_gain_vs_hold);
    o["capital_deployed"] = static_cast<double>(s.capital_deployed);
    o["lp_fees_earned"] = static_cast<double>(s.lp_fees_earned);
    o["net_fees_earned"] = static_cast<double>(s.net_fees_earned);
    o["gas_fees_paid"] = static_cast<double>(s.gas_fees_paid);
    o["max_drawdown"] = static_cast<double>(s.max_drawdown);
    o["max_gain"] = static_cast<double>(s.max_gain);
    o["impermanent_loss"] = static_cast<double>(s.impermanent_loss);
    o["time_in_range"] = static_cast<double>(s.time_in_range);
    o["rebalancing_actions"] = static_cast<uint64_t>(s.rebalancing_actions);
    o["notes"] = s.notes;
    return o;
}

json::object result_to_json(const clpsim::RunSpec& spec, const clpsim::RunResult& r) {
    json::object run;
    run["tag"] = spec.tag;
    run["success"] = true;
    run["protocol"] = spec.profile.name;
    run["tick_spacing"] = static_cast<int64_t>(spec.profile.tick_spacing);
    run["range"] = spec.position.range_type.str();
    run["granularity"] = clpsim::to_string(spec.position.granularity);
    run["apr_mode"] = clpsim::to_string(spec.position.apr_mode);
    run["data_points"] = static_cast<uint64_t>(r.data_points);
    run["tick_lower"] = static_cast<int64_t>(r.final_range.tick_lower);
    run["tick_upper"] = static_cast<int64_t>(r.final_range.tick_upper);
    // inf bounds of a full-range position are not representable in JSON
    if (!spec.position.range_type.is_full_range()) {
        run["price_lower"] = static_cast<double>(r.final_range.price_lower);
        run["price_upper"] = static_cast<double>(r.final_range.price_upper);
    }
    run["liquidity"] = static_cast<double>(r.final_liquidity);
    run["lp_share"] = static_cast<double>(r.final_lp_share);
    run["cumulative_fees"] = static_cast<double>(r.cumulative_fees);
    run["net_fees"] = static_cast<double>(r.net_fees);
    run["gas_costs"] = static_cast<double>(r.gas_costs);
    run["running_apr"] = static_cast<double>(r.running_apr);
    run["gross_apr"] = static_cast<double>(r.gross_apr);
    run["weighted_apr"] = static_cast<double>(r.weighted_apr);
    run["rebalances"] = static_cast<uint64_t>(r.rebalances);

    json::array subs;
    subs.reserve(r.sub_positions.size());
    for (const auto& p : r.sub_positions) {
        json::object o;
        o["duration"] = static_cast<uint64_t>(p.duration);
        o["fees"] = static_cast<double>(p.fees);
        o["gas_cost"] = static_cast<double>(p.gas_cost);
        o["starting_capital"] = static_cast<double>(p.starting_capital);
        subs.push_back(std::move(o));
    }
    run["sub_positions"] = std::move(subs);

    json::array statuses;
    statuses.reserve(r.statuses.size());
    for (const auto& s : r.statuses) statuses.push_back(status_to_json(s));
    run["statuses"] = std::move(statuses);
    return run;
}

clpsim::RunResult run_one(const clpsim::RunSpec& spec,
                          const std::vector<clpsim::Snapshot>& snapshots,
                          size_t status_every) {
    const auto cfg = clpsim::initial_config(spec, snapshots.front());
    clpsim::PositionRunner runner(clpsim::make_position(spec.profile, cfg));
    clpsim::IntervalSchedule interval(spec.rebalance_every, spec.rebalance_at);
    if (spec.rebalance_when_out_of_range) {
        clpsim::OutOfRangeSchedule schedule(interval);
        return runner.run(snapshots, schedule, spec.gas_cost_usd, status_every);
    }
    return runner.run(snapshots, interval, spec.gas_cost_usd, status_every);
}

} // namespace

int main(int argc, char** argv) {
    try {
        const Options opts = parse_cli(argc, argv);
        clpsim::RunInput input = clpsim::load_run_file(opts.config_path);
        if (input.runs.empty()) {
            throw std::runtime_error("no positions found in config");
        }
        if (opts.data_override) {
            input.data_path = *opts.data_override;
            input.raw_data_path = opts.data_override->string();
        }
        if (input.data_path.empty()) {
            throw std::runtime_error("run config missing meta.datafile and no --data override provided");
        }
        if (!fs::exists(input.data_path) && !input.raw_data_path.empty()) {
            fs::path alt = fs::absolute(fs::path(input.raw_data_path));
            if (fs::exists(alt)) {
                input.data_path = alt;
            }
        }
        if (!fs::exists(input.data_path)) {
            throw std::runtime_error("data file not found: " + input.data_path.string());
        }
        for (auto& spec : input.runs) {
            if (opts.gas_override) spec.gas_cost_usd = *opts.gas_override;
            if (opts.rebalance_every_override) spec.rebalance_every = *opts.rebalance_every_override;
        }

        const auto snapshots = clpsim::load_snapshots(input.data_path, opts.limit_snapshots);
        if (snapshots.empty()) {
            throw std::runtime_error("no usable snapshots loaded");
        }
        std::cout << "Loaded " << input.runs.size() << " positions and " << snapshots.size()
                  << " snapshots from " << input.data_path << "\n";

        const size_t status_every = env_flag("SAVE_LAST_ONLY") ? 0 : env_size("SNAPSHOT_EVERY", 1);
        const size_t thread_count = std::max<size_t>(1, std::min(opts.threads, input.runs.size()));
        std::vector<json::object> run_summaries(input.runs.size());
        std::atomic<size_t> next_idx{0};
        std::mutex io_mu;

        auto worker = [&]() {
            while (true) {
                const size_t idx = next_idx.fetch_add(1);
                if (idx >= input.runs.size()) break;
                const auto& spec = input.runs[idx];
                json::object run;
                bool ok = true;
                try {
                    run = result_to_json(spec, run_one(spec, snapshots, status_every));
                } catch (const std::exception& e) {
                    ok = false;
                    run = json::object{};
                    run["tag"] = spec.tag;
                    run["success"] = false;
                    run["error"] = e.what();
                }
                run_summaries[idx] = std::move(run);
                {
                    std::lock_guard<std::mutex> lk(io_mu);
                    std::cout << (ok ? "completed " : "failed ") << spec.tag
                              << " (" << (idx + 1) << "/" << input.runs.size() << ")\n";
                }
            }
        };

        std::vector<std::thread> threads;
        threads.reserve(thread_count);
        for (size_t t = 0; t < thread_count; ++t) {
            threads.emplace_back(worker);
        }
        for (auto& th : threads) th.join();

        json::object meta;
        meta["config"] = opts.config_path.string();
        meta["data_file"] = input.data_path.string();
        meta["snapshots"] = static_cast<uint64_t>(snapshots.size());
        meta["first_timestamp"] = snapshots.front().timestamp;
        meta["last_timestamp"] = snapshots.back().timestamp;
        meta["threads"] = static_cast<uint64_t>(thread_count);
        meta["status_every"] = static_cast<uint64_t>(status_every);

        json::object output;
        output["metadata"] = meta;
        json::array runs;
        runs.reserve(run_summaries.size());
        for (auto& r : run_summaries) runs.push_back(std::move(r));
        output["runs"] = std::move(runs);

        if (opts.output_path) {
            std::ofstream out(*opts.output_path, std::ios::binary);
            if (!out) throw std::runtime_error("failed to open output file: " + opts.output_path->string());
            out << json::serialize(output) << "\n";
            std::cout << "wrote " << opts.output_path->string() << "\n";
        } else {
            std::cout << json::serialize(output) << std::endl;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << '\n';
        return 1;
    }
}
