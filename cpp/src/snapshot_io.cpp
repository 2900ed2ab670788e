#include <boost/json.hpp>
#include <boost/json/src.hpp>

#include "clpsim/snapshot_io.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "clpsim/tick_math.hpp"
#include "clpsim/trace.hpp"

namespace json = boost::json;
namespace fs = std::filesystem;

namespace clpsim {

namespace {

// uint256 tops out at 78 decimal digits
constexpr size_t MAX_UINT256_DIGITS = 78;
// 1e10 seconds is year 2286; anything larger is a millisecond stamp
constexpr uint64_t MILLISECOND_THRESHOLD = 10000000000ULL;

// Whole decimal integer, optionally signed; nullopt on trailing garbage or overflow.
std::optional<long long> parse_integer_text(const json::string& text) {
    const std::string s = text.c_str();
    if (s.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    const long long n = std::strtoll(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0' || errno == ERANGE) return std::nullopt;
    return n;
}

std::optional<long long> parse_integer(const json::value& v) {
    if (v.is_int64()) return v.as_int64();
    if (v.is_uint64()) {
        const uint64_t u = v.as_uint64();
        if (u > static_cast<uint64_t>(std::numeric_limits<long long>::max())) return std::nullopt;
        return static_cast<long long>(u);
    }
    if (v.is_double()) {
        const double d = v.as_double();
        if (!std::isfinite(d) || std::fabs(d) > 9.0e18) return std::nullopt;
        return std::llround(d);
    }
    if (v.is_string()) return parse_integer_text(v.as_string());
    return std::nullopt;
}

// Ticks outside [MIN_TICK, MAX_TICK] are rejected, not clamped.
std::optional<int32_t> parse_tick(const json::value& v) {
    const auto t = parse_integer(v);
    if (!t || *t < MIN_TICK || *t > MAX_TICK) return std::nullopt;
    return static_cast<int32_t>(*t);
}

std::optional<RealT> positive_field(const json::object& o, const char* key) {
    if (auto* v = o.if_contains(key)) {
        const RealT r = to_real(*v);
        if (std::isfinite(r) && r > RealT(0)) return r;
    }
    return std::nullopt;
}

const json::array* find_rows(const json::value& root) {
    if (root.is_array()) return &root.as_array();
    if (!root.is_object()) return nullptr;
    const auto& obj = root.as_object();
    for (const char* key : {"data", "poolDayDatas", "poolHourDatas", "snapshots"}) {
        auto* v = obj.if_contains(key);
        if (!v) continue;
        if (v->is_array()) return &v->as_array();
        if (v->is_object()) {
            if (const json::array* nested = find_rows(*v)) return nested;
        }
    }
    return nullptr;
}

} // namespace

json::value read_json_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("cannot open " + path.string());
    std::ostringstream text;
    text << in.rdbuf();
    if (in.bad()) throw std::runtime_error("read error on " + path.string());

    json::error_code ec;
    json::value root = json::parse(text.str(), ec);
    if (ec) throw std::runtime_error(path.string() + ": invalid JSON (" + ec.message() + ")");
    return root;
}

RealT to_real(const json::value& v) {
    if (v.is_double()) return static_cast<RealT>(v.as_double());
    if (v.is_int64())  return static_cast<RealT>(v.as_int64());
    if (v.is_uint64()) return static_cast<RealT>(v.as_uint64());
    if (v.is_string()) return static_cast<RealT>(std::strtold(v.as_string().c_str(), nullptr));
    return RealT(0);
}

std::optional<uint64_t> parse_timestamp(const json::value& v) {
    const auto t = parse_integer(v);
    if (!t || *t < 0) return std::nullopt;
    uint64_t seconds = static_cast<uint64_t>(*t);
    if (seconds > MILLISECOND_THRESHOLD) seconds /= 1000ULL;
    return seconds;
}

std::optional<uint256> parse_uint256(const json::value& v) {
    if (v.is_uint64()) return uint256(v.as_uint64());
    if (v.is_int64()) {
        const int64_t i = v.as_int64();
        if (i < 0) return std::nullopt;
        return uint256(static_cast<uint64_t>(i));
    }
    if (!v.is_string()) return std::nullopt;
    const std::string s = v.as_string().c_str();
    if (s.empty() || s.size() > MAX_UINT256_DIGITS) return std::nullopt;
    if (!std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    return uint256(s.c_str());
}

std::vector<Snapshot> parse_snapshots(const json::value& root, size_t limit) {
    const json::array* arr = find_rows(root);
    if (!arr) throw std::runtime_error("expected snapshots array");

    std::vector<Snapshot> out;
    out.reserve(arr->size());
    size_t skipped = 0;
    for (const auto& row : *arr) {
        if (!row.is_object()) {
            ++skipped;
            continue;
        }
        const auto& o = row.as_object();
        std::optional<uint64_t> ts;
        for (const char* key : {"date", "periodStartUnix", "timestamp"}) {
            if (auto* v = o.if_contains(key)) {
                ts = parse_timestamp(*v);
                break;
            }
        }
        std::optional<int32_t> tick;
        if (auto* v = o.if_contains("tick")) tick = parse_tick(*v);
        const auto price0 = positive_field(o, "token0Price");
        if (!ts || !tick || !price0) {
            ++skipped;
            continue;
        }
        Snapshot s;
        s.timestamp = *ts;
        s.tick = *tick;
        s.token0_price = *price0;
        s.token1_price = positive_field(o, "token1Price").value_or(RealT(0));
        s.high = positive_field(o, "high");
        s.low = positive_field(o, "low");
        if (auto* v = o.if_contains("feeGrowthGlobal0X128")) s.fee_growth_global0_x128 = parse_uint256(*v);
        if (auto* v = o.if_contains("feeGrowthGlobal1X128")) s.fee_growth_global1_x128 = parse_uint256(*v);
        s.liquidity = positive_field(o, "liquidity").value_or(RealT(0));
        s.tvl_usd = positive_field(o, "tvlUSD").value_or(RealT(0));
        out.push_back(std::move(s));
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const Snapshot& a, const Snapshot& b) { return a.timestamp < b.timestamp; });
    if (limit && out.size() > limit) out.resize(limit);

    if (trace_enabled()) {
        std::cout << "TRACE snapshots_parsed rows=" << arr->size()
                  << " kept=" << out.size() << " skipped=" << skipped << "\n";
    }
    return out;
}

std::vector<Snapshot> parse_snapshot_text(const std::string& text, size_t limit) {
    return parse_snapshots(json::parse(text), limit);
}

std::vector<Snapshot> load_snapshots(const fs::path& path, size_t limit) {
    return parse_snapshots(read_json_file(path), limit);
}

} // namespace clpsim
