#include "rateline/core/rate_window.hpp"
#include <algorithm>

namespace rateline {
namespace core {

RateWindow::RateWindow(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {}

void RateWindow::push(const common::RateSample& sample) {
    evictOverflow(capacity_ - 1);
    samples_.push_back(sample);
}

void RateWindow::clear() {
    samples_.clear();
}

void RateWindow::setCapacity(size_t capacity) {
    capacity_ = std::max<size_t>(capacity, 1);
    evictOverflow(capacity_);
}

void RateWindow::evictOverflow(size_t keep) {
    while (samples_.size() > keep) {
        samples_.pop_front();
    }
}

std::optional<double> RateWindow::simpleRate() const {
    double total_time = 0.0;
    int64_t total_iterations = 0;
    
    for (const auto& sample : samples_) {
        total_time += sample.interval_seconds;
        total_iterations += sample.iterations;
    }
    
    if (total_time <= 0.0) {
        return std::nullopt;
    }
    return static_cast<double>(total_iterations) / total_time;
}

std::optional<double> RateWindow::emaRate(double alpha) const {
    std::optional<double> rate;
    
    for (const auto& sample : samples_) {
        if (sample.interval_seconds <= 0.0) {
            continue;
        }
        
        double r = static_cast<double>(sample.iterations) / sample.interval_seconds;
        if (!rate) {
            rate = r;
        } else {
            rate = alpha * r + (1.0 - alpha) * *rate;
        }
    }
    
    return rate;
}

}}
