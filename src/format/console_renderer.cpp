#include "rateline/format/console_renderer.hpp"
#include "rateline/format/format_utils.hpp"
#include "rateline/core/error_codes.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cmath>

namespace rateline {
namespace format {

namespace {
    constexpr const char* COLOR_BAR = "\033[32m";
    constexpr const char* COLOR_PERCENT = "\033[1m\033[31m";
    constexpr const char* COLOR_STATS = "\033[34m";
    constexpr const char* COLOR_RESET = "\033[0m";
    constexpr const char* RIGHT_PAD = "|";
}

ConsoleRenderer::ConsoleRenderer(std::ostream& out, const RenderOptions& options)
    : out_(out),
      options_(options) {
    if (options_.width < 1) {
        common::ErrorContext ctx;
        ctx.component = "ConsoleRenderer";
        ctx.details["width"] = std::to_string(options_.width);
        throw core::EngineError(core::CoreErrorCode::INVALID_WIDTH, ctx);
    }
}

size_t ConsoleRenderer::draw(const common::Snapshot& snapshot) {
    std::string line = format(snapshot);
    size_t width = displayWidth(line);
    
    out_ << "\r" << line;
    if (snapshot.previous_rendered_width > width) {
        out_ << std::string(snapshot.previous_rendered_width - width, ' ');
    }
    out_ << std::flush;
    
    return width;
}

void ConsoleRenderer::finishLine() {
    out_ << "\n" << std::flush;
}

void ConsoleRenderer::printLine(const std::string& text, size_t previous_width) {
    out_ << "\r" << std::string(previous_width, ' ') << "\r" << text << "\n" << std::flush;
}

std::string ConsoleRenderer::formatBar(double fill_fraction, bool complete) const {
    double fraction = std::isfinite(fill_fraction) ? std::clamp(fill_fraction, 0.0, 1.0) : 0.0;
    
    auto cells = static_cast<size_t>(options_.width);
    double fills = fraction * static_cast<double>(cells);
    auto whole = std::min(static_cast<size_t>(fills), cells);
    
    std::string bar = repeatString(options_.theme.full(), whole);
    size_t empty_cells = cells - whole;
    
    if (!complete && whole < cells) {
        bar += options_.theme.partial(fills - static_cast<double>(whole));
        --empty_cells;
    }
    
    bar += repeatString(options_.theme.empty(), empty_cells);
    return bar;
}

std::string ConsoleRenderer::format(const common::Snapshot& snapshot) const {
    bool known_total = snapshot.total > 0;
    
    std::ostringstream oss;
    oss << colorize(formatBar(snapshot.fill_fraction, snapshot.isComplete()), COLOR_BAR);
    oss << RIGHT_PAD;
    
    std::ostringstream percent;
    percent << " " << std::fixed << std::setprecision(1) << snapshot.percent << "% ";
    oss << colorize(percent.str(), COLOR_PERCENT);
    
    std::ostringstream stats;
    stats << "[ " << formatCount(snapshot.current) << " / "
          << (known_total ? formatCount(snapshot.total) : "?") << " | "
          << formatSeconds(snapshot.elapsed_seconds) << " < "
          << (known_total ? formatSeconds(snapshot.remaining_seconds) : "?") << " | "
          << formatRate(snapshot.rate) << " ] ";
    oss << colorize(stats.str(), COLOR_STATS);
    
    if (!snapshot.label.empty()) {
        oss << sanitizeLabel(snapshot.label) << " ";
    }
    
    return oss.str();
}

std::string ConsoleRenderer::colorize(const std::string& text, const char* color_code) const {
    if (!options_.use_color) return text;
    return color_code + text + COLOR_RESET;
}

}
}
