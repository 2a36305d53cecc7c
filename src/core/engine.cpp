#include "rateline/core/engine.hpp"
#include "rateline/core/error_codes.hpp"
#include "rateline/common/logger.hpp"
#include <algorithm>
#include <cmath>

namespace rateline {
namespace core {

using common::EngineState;
using common::Snapshot;

ProgressEngine::ProgressEngine(const EngineOptions& options, std::shared_ptr<common::Clock> clock)
    : options_(options),
      clock_(clock ? std::move(clock) : common::SystemClock::shared()),
      total_(options.total),
      window_(constants::engine::INITIAL_WINDOW_CAPACITY) {
    validate(options_);
    
    start_time_ = clock_->wallNow();
    last_report_time_ = start_time_;
    elapsed_start_ = clock_->monotonicNow();
}

void ProgressEngine::validate(const EngineOptions& options) {
    if (!(options.alpha > 0.0 && options.alpha <= 1.0)) {
        common::ErrorContext ctx;
        ctx.component = "Engine";
        ctx.details["alpha"] = std::to_string(options.alpha);
        throw EngineError(CoreErrorCode::INVALID_ALPHA, ctx);
    }
    
    if (options.target_redraws_per_second < 1) {
        common::ErrorContext ctx;
        ctx.component = "Engine";
        ctx.details["target_redraws_per_second"] = std::to_string(options.target_redraws_per_second);
        throw EngineError(CoreErrorCode::INVALID_REDRAW_RATE, ctx);
    }
}

std::optional<Snapshot> ProgressEngine::report(int64_t current, int64_t total) {
    total_ = total;
    return report(current);
}

std::optional<Snapshot> ProgressEngine::report(int64_t current) {
    current_ = current;
    
    if (state_ == EngineState::FINISHED) {
        return std::nullopt;
    }
    
    if (current % redraw_period_ != 0) {
        return std::nullopt;
    }
    
    return accept(current);
}

std::optional<Snapshot> ProgressEngine::step() {
    return report(current_ + 1);
}

std::optional<Snapshot> ProgressEngine::finish() {
    if (state_ == EngineState::FINISHED) {
        return std::nullopt;
    }
    
    if (total_ <= 0) {
        total_ = std::max<int64_t>(current_, 0);
    }
    
    current_ = total_;
    Snapshot snapshot = accept(total_);
    
    snapshot.percent = 100.0;
    snapshot.current = total_;
    snapshot.remaining_seconds = 0.0;
    snapshot.fill_fraction = 1.0;
    
    state_ = EngineState::FINISHED;
    snapshot.state = state_;
    
    common::Logger::instance().debug("[Engine] Finished | total={} | updates={} | elapsed={:.3f}s",
                                     total_, updates_issued_, snapshot.elapsed_seconds);
    return snapshot;
}

void ProgressEngine::reset() {
    total_ = options_.total;
    current_ = 0;
    previous_current_ = 0;
    
    start_time_ = clock_->wallNow();
    last_report_time_ = start_time_;
    elapsed_start_ = clock_->monotonicNow();
    
    window_.clear();
    window_.setCapacity(constants::engine::INITIAL_WINDOW_CAPACITY);
    
    redraw_period_ = constants::engine::MIN_REDRAW_PERIOD;
    updates_issued_ = 0;
    last_rate_.reset();
    previous_rendered_width_ = 0;
    state_ = EngineState::FRESH;
}

void ProgressEngine::setRedrawPeriod(int64_t period) {
    redraw_period_ = std::clamp(period,
                                constants::engine::MIN_REDRAW_PERIOD,
                                constants::engine::MAX_REDRAW_PERIOD);
}

Snapshot ProgressEngine::accept(int64_t current) {
    ++updates_issued_;
    
    if (updates_issued_ > constants::engine::WARMUP_UPDATES) {
        if (state_ != EngineState::TUNED) {
            common::Logger::instance().debug("[Engine] Warm-up complete | updates={}", updates_issued_);
        }
        state_ = EngineState::TUNED;
    } else {
        state_ = EngineState::WARMING;
    }
    
    double elapsed = common::secondsBetween(elapsed_start_, clock_->monotonicNow());
    
    int64_t iterations = current - previous_current_;
    previous_current_ = current;
    
    auto now = clock_->wallNow();
    double interval = common::secondsBetween(last_report_time_, now);
    last_report_time_ = now;
    
    if (iterations < 0) {
        common::Logger::instance().debug("[Engine] Progress moved backwards | current={} | delta={}",
                                         current, iterations);
    }
    
    window_.push(common::RateSample{interval, iterations});
    
    auto rate = smoothedRate();
    if (rate) {
        last_rate_ = rate;
    } else {
        rate = last_rate_;
    }
    
    if (updates_issued_ > constants::engine::WARMUP_UPDATES) {
        retune(current, elapsed);
    }
    
    return buildSnapshot(current, elapsed, rate);
}

std::optional<double> ProgressEngine::smoothedRate() const {
    if (options_.use_exponential_moving_average) {
        return window_.emaRate(options_.alpha);
    }
    return window_.simpleRate();
}

void ProgressEngine::retune(int64_t current, double elapsed) {
    window_.setCapacity(constants::engine::TUNED_WINDOW_CAPACITY);
    
    if (elapsed <= 0.0) {
        return;
    }
    
    double per_redraw = static_cast<double>(current) / elapsed / options_.target_redraws_per_second;
    if (!std::isfinite(per_redraw)) {
        return;
    }
    
    per_redraw = std::clamp(per_redraw,
                            static_cast<double>(constants::engine::MIN_REDRAW_PERIOD),
                            static_cast<double>(constants::engine::MAX_REDRAW_PERIOD));
    
    int64_t period = std::clamp<int64_t>(std::llround(per_redraw),
                                         constants::engine::MIN_REDRAW_PERIOD,
                                         constants::engine::MAX_REDRAW_PERIOD);
    
    if (period != redraw_period_) {
        common::Logger::instance().debug("[Engine] Redraw period retuned | from={} | to={} | elapsed={:.3f}s",
                                         redraw_period_, period, elapsed);
        redraw_period_ = period;
    }
}

Snapshot ProgressEngine::buildSnapshot(int64_t current, double elapsed, std::optional<double> rate) const {
    Snapshot snapshot;
    snapshot.total = total_;
    snapshot.current = current;
    snapshot.elapsed_seconds = elapsed;
    snapshot.rate = rate.value_or(0.0);
    snapshot.label = label_;
    snapshot.previous_rendered_width = previous_rendered_width_;
    snapshot.state = state_;
    
    if (total_ <= 0) {
        return snapshot;
    }
    
    snapshot.percent = static_cast<double>(current) * 100.0 / static_cast<double>(total_);
    if (rate && *rate > 0.0) {
        snapshot.remaining_seconds = static_cast<double>(total_ - current) / *rate;
    }
    
    // The next accepted update would overshoot or never land on total.
    if (total_ - current <= redraw_period_) {
        snapshot.percent = 100.0;
        snapshot.current = total_;
        snapshot.remaining_seconds = 0.0;
    }
    
    snapshot.fill_fraction = static_cast<double>(snapshot.current) / static_cast<double>(total_);
    return snapshot;
}

}}
