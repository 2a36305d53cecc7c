#pragma once

#include "renderer.hpp"
#include "theme.hpp"
#include "../common/constants.hpp"
#include <ostream>
#include <string>

namespace rateline {
namespace format {

struct RenderOptions {
    int width = constants::config_defaults::BAR_WIDTH;
    bool use_color = constants::config_defaults::BAR_USE_COLOR;
    Theme theme;
};

// Single-line bar redrawn in place with a carriage return:
//
//   ████████▌      | 21.3% [ 213 / 1,000 | 2s < 7s | 106.50it/s ] label
class ConsoleRenderer : public Renderer {
public:
    ConsoleRenderer(std::ostream& out, const RenderOptions& options = RenderOptions{});
    
    size_t draw(const common::Snapshot& snapshot) override;
    void finishLine() override;
    void printLine(const std::string& text, size_t previous_width) override;
    
    // The line without the leading carriage return and erase padding.
    std::string format(const common::Snapshot& snapshot) const;
    std::string formatBar(double fill_fraction, bool complete) const;
    
    void setTheme(const Theme& theme) override { options_.theme = theme; }
    const RenderOptions& options() const { return options_; }

private:
    std::ostream& out_;
    RenderOptions options_;
    
    std::string colorize(const std::string& text, const char* color_code) const;
};

}
}
