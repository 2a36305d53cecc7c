#include <gtest/gtest.h>

#include "manual_clock.hpp"
#include "recording_renderer.hpp"
#include "rateline/progress/progress_bar.hpp"
#include "rateline/core/error_codes.hpp"
#include "rateline/common/config.hpp"

#include <memory>
#include <sstream>

using rateline::common::BarConfig;
using rateline::core::EngineError;
using rateline::core::EngineOptions;
using rateline::format::Theme;
using rateline::progress::ProgressBar;
using rateline::progress::ProgressBarOptions;
using rateline::testing::ManualClock;
using rateline::testing::RecordingRenderer;
using rateline::testing::RenderLog;

namespace {

class ProgressBarTest : public ::testing::Test {
protected:
    RenderLog log_;
    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>();
    
    std::unique_ptr<ProgressBar> makeBar(int64_t total) {
        EngineOptions options;
        options.total = total;
        return std::make_unique<ProgressBar>(std::make_unique<RecordingRenderer>(log_), options, clock_);
    }
};

}

TEST_F(ProgressBarTest, DrawsOnlyAcceptedReports) {
    auto bar = makeBar(100);
    bar->engine().setRedrawPeriod(5);
    
    int drawn = 0;
    for (int64_t i = 0; i < 20; ++i) {
        clock_->advance(0.01);
        if (bar->progress(i)) {
            ++drawn;
        }
    }
    
    EXPECT_EQ(4, drawn);
    EXPECT_EQ(4u, log_.drawn.size());
    EXPECT_EQ(15, log_.drawn.back().current);
}

TEST_F(ProgressBarTest, RenderedWidthFeedsNextSnapshot) {
    auto bar = makeBar(10);
    
    clock_->advance(0.1);
    bar->progress(1);
    clock_->advance(0.1);
    bar->progress(2);
    
    ASSERT_EQ(2u, log_.drawn.size());
    EXPECT_EQ(0u, log_.drawn[0].previous_rendered_width);
    EXPECT_EQ(42u, log_.drawn[1].previous_rendered_width);
}

TEST_F(ProgressBarTest, FinishDrawsOnceAndEndsLine) {
    auto bar = makeBar(3);
    
    clock_->advance(0.1);
    bar->progress(0);
    bar->finish();
    bar->finish();
    
    ASSERT_EQ(2u, log_.drawn.size());
    EXPECT_DOUBLE_EQ(100.0, log_.drawn.back().percent);
    EXPECT_EQ(1, log_.finished_lines);
    EXPECT_FALSE(bar->progress(3));
}

TEST_F(ProgressBarTest, PrintLineClearsPreviousWidth) {
    auto bar = makeBar(10);
    
    clock_->advance(0.1);
    bar->progress(1);
    bar->printLine("checkpoint");
    clock_->advance(0.1);
    bar->progress(2);
    
    ASSERT_EQ(1u, log_.printed.size());
    EXPECT_EQ("checkpoint", log_.printed[0].first);
    EXPECT_EQ(42u, log_.printed[0].second);
    EXPECT_EQ(0u, log_.drawn.back().previous_rendered_width);
}

TEST_F(ProgressBarTest, StepAndLabel) {
    auto bar = makeBar(10);
    bar->setLabel("files");
    
    clock_->advance(0.1);
    EXPECT_TRUE(bar->step());
    
    ASSERT_EQ(1u, log_.drawn.size());
    EXPECT_EQ(1, log_.drawn[0].current);
    EXPECT_EQ("files", log_.drawn[0].label);
}

TEST_F(ProgressBarTest, ProgressWithTotalUpdatesTotal) {
    auto bar = makeBar(10);
    
    clock_->advance(0.1);
    bar->progress(7, 20);
    
    ASSERT_EQ(1u, log_.drawn.size());
    EXPECT_DOUBLE_EQ(35.0, log_.drawn[0].percent);
}

TEST_F(ProgressBarTest, ResetStartsOver) {
    auto bar = makeBar(2);
    bar->finish();
    bar->reset();
    
    clock_->advance(0.1);
    EXPECT_TRUE(bar->progress(0));
    EXPECT_FALSE(bar->engine().isFinished());
}

TEST_F(ProgressBarTest, ThemeIsForwardedToRenderer) {
    auto bar = makeBar(10);
    bar->setTheme(Theme::basic());
    
    ASSERT_EQ(1u, log_.themes.size());
    EXPECT_EQ("#", log_.themes[0]);
}

TEST(ProgressBarOptions, FromConfig) {
    BarConfig config{60, "blocks", true, 25, false, 0.3};
    
    auto options = ProgressBarOptions::fromConfig(config);
    
    EXPECT_EQ(60, options.render.width);
    EXPECT_TRUE(options.render.use_color);
    EXPECT_EQ("▏", options.render.theme.glyph(1));
    EXPECT_EQ(25, options.engine.target_redraws_per_second);
    EXPECT_FALSE(options.engine.use_exponential_moving_average);
    EXPECT_DOUBLE_EQ(0.3, options.engine.alpha);
}

TEST(ProgressBarOptions, FromConfigRejectsUnknownTheme) {
    BarConfig config{40, "rainbow", false, 10, true, 0.1};
    EXPECT_THROW(ProgressBarOptions::fromConfig(config), EngineError);
}

TEST(ProgressBarConsole, WritesFinalLine) {
    std::ostringstream out;
    ProgressBarOptions options;
    options.engine.total = 3;
    options.render.width = 6;
    
    ProgressBar bar(options, out);
    bar.setLabel("demo");
    for (int64_t i = 0; i < 3; ++i) {
        bar.progress(i);
    }
    bar.finish();
    
    std::string text = out.str();
    EXPECT_EQ('\r', text.front());
    EXPECT_EQ('\n', text.back());
    EXPECT_NE(text.find("██████| 100.0% [ 3 / 3 |"), std::string::npos);
    EXPECT_NE(text.find("demo"), std::string::npos);
}
