#pragma once

#include "../common/types.hpp"
#include <deque>
#include <optional>
#include <cstddef>

namespace rateline {
namespace core {

// Sliding window of (interval, iterations) samples. Capacity is a runtime
// value: the engine widens it once warm-up is over.
class RateWindow {
public:
    explicit RateWindow(size_t capacity);
    
    void push(const common::RateSample& sample);
    void clear();
    
    void setCapacity(size_t capacity);
    size_t capacity() const { return capacity_; }
    size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }
    
    const common::RateSample& front() const { return samples_.front(); }
    const common::RateSample& back() const { return samples_.back(); }
    
    // sum(iterations) / sum(intervals); nullopt when the interval sum is not positive.
    std::optional<double> simpleRate() const;
    
    // Exponential moving average recomputed over the whole window, oldest
    // sample first. Samples with a non-positive interval carry no rate and are
    // skipped; nullopt when none is usable.
    std::optional<double> emaRate(double alpha) const;

private:
    size_t capacity_;
    std::deque<common::RateSample> samples_;
    
    void evictOverflow(size_t keep);
};

}}
