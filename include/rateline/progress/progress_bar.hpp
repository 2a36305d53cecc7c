#pragma once

#include "../core/engine.hpp"
#include "../format/renderer.hpp"
#include "../format/console_renderer.hpp"
#include "../common/config.hpp"
#include <iostream>
#include <memory>
#include <string>

namespace rateline {
namespace progress {

struct ProgressBarOptions {
    core::EngineOptions engine;
    format::RenderOptions render;
    
    static ProgressBarOptions fromConfig(const common::BarConfig& config);
};

// Engine plus renderer: every accepted report is drawn, skipped reports cost
// only the gate check.
class ProgressBar {
public:
    explicit ProgressBar(const ProgressBarOptions& options = ProgressBarOptions{},
                         std::ostream& out = std::cerr);
    ProgressBar(std::unique_ptr<format::Renderer> renderer,
                const core::EngineOptions& options = core::EngineOptions{},
                std::shared_ptr<common::Clock> clock = nullptr);
    
    // Each returns true when the report was drawn.
    bool progress(int64_t current);
    bool progress(int64_t current, int64_t total);
    bool step();
    
    // Draws the final 100% line and ends it. No-op when already finished.
    void finish();
    
    void reset();
    void setLabel(const std::string& text) { engine_.setLabel(text); }
    void setTheme(const format::Theme& theme) { renderer_->setTheme(theme); }
    
    // Clears the bar and prints text on its own line; the bar reappears on
    // the next drawn report.
    void printLine(const std::string& text);
    
    core::ProgressEngine& engine() { return engine_; }
    const core::ProgressEngine& engine() const { return engine_; }

private:
    std::unique_ptr<format::Renderer> renderer_;
    core::ProgressEngine engine_;
    
    bool draw(const std::optional<common::Snapshot>& snapshot);
};

}}
