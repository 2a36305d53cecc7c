#include "rateline/progress/progress_bar.hpp"
#include "rateline/format/theme.hpp"

namespace rateline {
namespace progress {

ProgressBarOptions ProgressBarOptions::fromConfig(const common::BarConfig& config) {
    ProgressBarOptions options;
    
    options.engine.use_exponential_moving_average = config.use_ema;
    options.engine.alpha = config.alpha;
    options.engine.target_redraws_per_second = config.prints_per_second;
    
    options.render.width = config.width;
    options.render.use_color = config.use_color;
    options.render.theme = format::Theme::resolve(config.theme);
    
    return options;
}

ProgressBar::ProgressBar(const ProgressBarOptions& options, std::ostream& out)
    : ProgressBar(std::make_unique<format::ConsoleRenderer>(out, options.render), options.engine) {}

ProgressBar::ProgressBar(std::unique_ptr<format::Renderer> renderer,
                         const core::EngineOptions& options,
                         std::shared_ptr<common::Clock> clock)
    : renderer_(std::move(renderer)),
      engine_(options, std::move(clock)) {}

bool ProgressBar::progress(int64_t current) {
    return draw(engine_.report(current));
}

bool ProgressBar::progress(int64_t current, int64_t total) {
    return draw(engine_.report(current, total));
}

bool ProgressBar::step() {
    return draw(engine_.step());
}

void ProgressBar::finish() {
    if (draw(engine_.finish())) {
        renderer_->finishLine();
    }
}

void ProgressBar::reset() {
    engine_.reset();
}

void ProgressBar::printLine(const std::string& text) {
    renderer_->printLine(text, engine_.renderedWidth());
    engine_.recordRenderedWidth(0);
}

bool ProgressBar::draw(const std::optional<common::Snapshot>& snapshot) {
    if (!snapshot) {
        return false;
    }
    
    engine_.recordRenderedWidth(renderer_->draw(*snapshot));
    return true;
}

}}
