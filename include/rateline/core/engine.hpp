#pragma once

#include "../common/types.hpp"
#include "../common/clock.hpp"
#include "../common/constants.hpp"
#include "rate_window.hpp"
#include <string>
#include <memory>
#include <optional>
#include <chrono>
#include <cstdint>

namespace rateline {
namespace core {

struct EngineOptions {
    bool use_exponential_moving_average = constants::config_defaults::USE_EMA;
    double alpha = constants::config_defaults::ALPHA;
    int64_t total = constants::engine::UNKNOWN_TOTAL;
    int target_redraws_per_second = constants::config_defaults::PRINTS_PER_SECOND;
};

// Rate estimation and adaptive refresh for one progress line.
//
// report() gates updates on a redraw period, samples the time and iteration
// deltas between accepted updates into a sliding window, smooths them into a
// rate and returns a snapshot for a renderer. After warm-up the period is
// retuned so that accepted updates land roughly target_redraws_per_second
// times per second.
//
// Single-owner object: one thread drives a given instance.
class ProgressEngine {
public:
    explicit ProgressEngine(const EngineOptions& options = EngineOptions{},
                            std::shared_ptr<common::Clock> clock = nullptr);

    std::optional<common::Snapshot> report(int64_t current);
    std::optional<common::Snapshot> report(int64_t current, int64_t total);
    std::optional<common::Snapshot> step();

    // Forces a final 100% snapshot, bypassing the redraw gate. Returns
    // nullopt when the engine has already finished.
    std::optional<common::Snapshot> finish();

    void reset();

    void setLabel(const std::string& text) { label_ = text; }
    const std::string& label() const { return label_; }

    // Total used from the next report on; <= 0 means unknown.
    void setTotal(int64_t total) { total_ = total; }
    void setRedrawPeriod(int64_t period);
    void recordRenderedWidth(size_t width) { previous_rendered_width_ = width; }
    size_t renderedWidth() const { return previous_rendered_width_; }

    const EngineOptions& options() const { return options_; }
    common::EngineState state() const { return state_; }
    int64_t current() const { return current_; }
    int64_t total() const { return total_; }
    int64_t redrawPeriod() const { return redraw_period_; }
    int64_t updatesIssued() const { return updates_issued_; }
    const RateWindow& window() const { return window_; }
    std::optional<double> lastRate() const { return last_rate_; }
    bool isFinished() const { return state_ == common::EngineState::FINISHED; }

private:
    EngineOptions options_;
    std::shared_ptr<common::Clock> clock_;

    int64_t total_;
    int64_t current_ = 0;
    int64_t previous_current_ = 0;

    std::chrono::system_clock::time_point start_time_;
    std::chrono::system_clock::time_point last_report_time_;
    std::chrono::steady_clock::time_point elapsed_start_;

    RateWindow window_;
    int64_t redraw_period_ = constants::engine::MIN_REDRAW_PERIOD;
    int64_t updates_issued_ = 0;
    std::optional<double> last_rate_;

    std::string label_;
    size_t previous_rendered_width_ = 0;
    common::EngineState state_ = common::EngineState::FRESH;

    common::Snapshot accept(int64_t current);
    std::optional<double> smoothedRate() const;
    void retune(int64_t current, double elapsed);
    common::Snapshot buildSnapshot(int64_t current, double elapsed, std::optional<double> rate) const;

    static void validate(const EngineOptions& options);
};

}}
