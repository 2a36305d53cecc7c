#include <gtest/gtest.h>

#include "rateline/format/console_renderer.hpp"
#include "rateline/format/format_utils.hpp"
#include "rateline/core/error_codes.hpp"

#include <sstream>

using rateline::common::Snapshot;
using rateline::core::EngineError;
using rateline::format::ConsoleRenderer;
using rateline::format::RenderOptions;
using rateline::format::Theme;

namespace {

RenderOptions narrow(int width, bool color = false) {
    RenderOptions options;
    options.width = width;
    options.use_color = color;
    return options;
}

Snapshot quarterDone() {
    Snapshot snapshot;
    snapshot.current = 25;
    snapshot.total = 100;
    snapshot.percent = 25.0;
    snapshot.fill_fraction = 0.25;
    snapshot.elapsed_seconds = 1.0;
    snapshot.remaining_seconds = 3.0;
    snapshot.rate = 25.0;
    return snapshot;
}

}

TEST(ConsoleRenderer, RejectsNonPositiveWidth) {
    std::ostringstream out;
    EXPECT_THROW(ConsoleRenderer renderer(out, narrow(0)), EngineError);
}

TEST(ConsoleRenderer, FormatsBarAndStatistics) {
    std::ostringstream out;
    ConsoleRenderer renderer(out, narrow(10));
    
    EXPECT_EQ("██=       | 25.0% [ 25 / 100 | 1s < 3s | 25.00it/s ] ",
              renderer.format(quarterDone()));
}

TEST(ConsoleRenderer, AppendsSanitizedLabel) {
    std::ostringstream out;
    ConsoleRenderer renderer(out, narrow(10));
    
    Snapshot snapshot = quarterDone();
    snapshot.label = "copy\nfiles";
    
    std::string line = renderer.format(snapshot);
    EXPECT_EQ("copy files ", line.substr(line.size() - 11));
}

TEST(ConsoleRenderer, UnknownTotalShowsPlaceholders) {
    std::ostringstream out;
    ConsoleRenderer renderer(out, narrow(4));
    
    Snapshot snapshot;
    snapshot.current = 1500;
    snapshot.total = -1;
    snapshot.elapsed_seconds = 2.0;
    
    EXPECT_EQ("    | 0.0% [ 1,500 / ? | 2s < ? | ?it/s ] ", renderer.format(snapshot));
}

TEST(ConsoleRenderer, BarFillsEveryCellWhenComplete) {
    std::ostringstream out;
    ConsoleRenderer renderer(out, narrow(5));
    
    EXPECT_EQ("█████", renderer.formatBar(1.0, true));
    EXPECT_EQ("     ", renderer.formatBar(0.0, false));
    EXPECT_EQ("     ", renderer.formatBar(-3.0, false));
}

TEST(ConsoleRenderer, BarKeepsWidthWithPartialCell) {
    std::ostringstream out;
    RenderOptions options = narrow(8);
    options.theme = Theme::blocks();
    ConsoleRenderer renderer(out, options);
    
    std::string bar = renderer.formatBar(0.5625, false);
    EXPECT_EQ("████▌   ", bar);
    EXPECT_EQ(8u, rateline::format::displayWidth(bar));
}

TEST(ConsoleRenderer, DrawPadsOverLongerPreviousLine) {
    std::ostringstream out;
    ConsoleRenderer renderer(out, narrow(10));
    
    Snapshot snapshot = quarterDone();
    std::string line = renderer.format(snapshot);
    snapshot.previous_rendered_width = line.size() + 5;
    
    size_t width = renderer.draw(snapshot);
    
    EXPECT_EQ(rateline::format::displayWidth(line), width);
    EXPECT_EQ("\r" + line + std::string(5 + line.size() - width, ' '), out.str());
}

TEST(ConsoleRenderer, ColorDoesNotChangeDisplayWidth) {
    std::ostringstream plain_out;
    std::ostringstream color_out;
    ConsoleRenderer plain(plain_out, narrow(10));
    ConsoleRenderer colored(color_out, narrow(10, true));
    
    std::string colored_line = colored.format(quarterDone());
    
    EXPECT_NE(colored_line.find("\033[32m"), std::string::npos);
    EXPECT_EQ(plain.draw(quarterDone()), colored.draw(quarterDone()));
}

TEST(ConsoleRenderer, PrintLineClearsBar) {
    std::ostringstream out;
    ConsoleRenderer renderer(out, narrow(10));
    
    renderer.printLine("checkpoint", 4);
    EXPECT_EQ("\r    \rcheckpoint\n", out.str());
}

TEST(ConsoleRenderer, FinishLineEndsLine) {
    std::ostringstream out;
    ConsoleRenderer renderer(out, narrow(10));
    
    renderer.finishLine();
    EXPECT_EQ("\n", out.str());
}

TEST(ConsoleRenderer, SetThemeSwitchesGlyphs) {
    std::ostringstream out;
    ConsoleRenderer renderer(out, narrow(3));
    renderer.setTheme(Theme::basic());
    
    EXPECT_EQ("###", renderer.formatBar(1.0, true));
}
