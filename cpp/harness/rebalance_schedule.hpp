#pragma once

#include <cstddef>
#include <set>
#include <utility>
#include <vector>

#include "clpsim/position.hpp"
#include "clpsim/types.hpp"

namespace clpsim {

// Decides, before snapshot `step` is applied, whether to re-range the
// position. Lives outside the core: the position only executes the call.
class RebalanceSchedule {
public:
    virtual ~RebalanceSchedule() = default;
    virtual bool should_rebalance(size_t step,
                                  const LiquidityPosition& position,
                                  const Snapshot& next) = 0;
};

class IntervalSchedule : public RebalanceSchedule {
public:
    IntervalSchedule(size_t every, const std::vector<size_t>& explicit_steps)
        : every_(every), steps_(explicit_steps.begin(), explicit_steps.end()) {}

    bool should_rebalance(size_t step, const LiquidityPosition&, const Snapshot&) override {
        if (step == 0) return false;
        if (every_ && step % every_ == 0) return true;
        return steps_.count(step) > 0;
    }

private:
    size_t every_{0};
    std::set<size_t> steps_;
};

// Re-range once the position sits outside its band; wraps another schedule.
class OutOfRangeSchedule : public RebalanceSchedule {
public:
    explicit OutOfRangeSchedule(IntervalSchedule fallback) : fallback_(std::move(fallback)) {}

    bool should_rebalance(size_t step, const LiquidityPosition& position, const Snapshot& next) override {
        if (step == 0) return false;
        if (!position.range_type().is_full_range() && position.is_out_of_range()) return true;
        return fallback_.should_rebalance(step, position, next);
    }

private:
    IntervalSchedule fallback_;
};

} // namespace clpsim
