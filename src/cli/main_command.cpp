#include "main_command.hpp"
#include "rateline/common/config.hpp"
#include "rateline/common/constants.hpp"
#include "rateline/common/logger.hpp"
#include "rateline/format/json_formatter.hpp"
#include <iostream>
#include <unistd.h>

namespace rateline {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

bool MainCommand::validateArguments() const {
    if (width_ < 0) {
        std::cerr << "Error: --width must be positive\n";
        return false;
    }
    if (alpha_ < 0.0 || alpha_ > 1.0) {
        std::cerr << "Error: --alpha must be in (0, 1]\n";
        return false;
    }
    if (prints_per_second_ < 0) {
        std::cerr << "Error: --rate must be positive\n";
        return false;
    }
    return true;
}

void MainCommand::addBarOptions(CLI::App* subcommand) {
    subcommand->add_option("-w,--width", width_, "Bar width in cells");
    subcommand->add_option("-t,--theme", theme_, "Theme: ascii, basic, blocks or 9 glyphs");
    subcommand->add_option("-a,--alpha", alpha_, "EMA smoothing factor in (0, 1]");
    subcommand->add_option("-r,--rate", prints_per_second_, "Target redraws per second");
    subcommand->add_flag("--simple", simple_, "Use a simple average instead of EMA");
    subcommand->add_flag("--color", color_, "Force colored output");
    subcommand->add_flag("--no-color", no_color_, "Disable colored output");
    subcommand->add_flag("-j,--json", json_output_, "Emit one JSON object per update on stdout");
}

progress::ProgressBarOptions MainCommand::resolveBarOptions(int64_t total) const {
    common::BarConfig bar = common::Config::instance().global().bar;
    
    if (width_ > 0) bar.width = width_;
    if (!theme_.empty()) bar.theme = theme_;
    if (alpha_ > 0.0) bar.alpha = alpha_;
    if (prints_per_second_ > 0) bar.prints_per_second = prints_per_second_;
    if (simple_) bar.use_ema = false;
    
    if (color_) {
        bar.use_color = true;
    } else if (no_color_ || !isTerminal(STDERR_FILENO)) {
        bar.use_color = false;
    }
    
    auto options = progress::ProgressBarOptions::fromConfig(bar);
    options.engine.total = total;
    
    common::Logger::instance().debug("[CLI] Bar options | width={} | theme={} | ema={} | alpha={} | rate={}",
                                     bar.width, bar.theme, bar.use_ema, bar.alpha, bar.prints_per_second);
    return options;
}

std::unique_ptr<progress::ProgressBar> MainCommand::createBar(int64_t total) const {
    auto options = resolveBarOptions(total);
    
    if (json_output_) {
        return std::make_unique<progress::ProgressBar>(
            std::make_unique<format::JsonLinesRenderer>(std::cout), options.engine);
    }
    
    return std::make_unique<progress::ProgressBar>(options, std::cerr);
}

bool MainCommand::isTerminal(int fd) {
    return isatty(fd) != 0;
}

}}
