#include "lines_command.hpp"
#include "rateline/common/logger.hpp"
#include "rateline/core/error_codes.hpp"
#include "rateline/progress/wrap.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <thread>

namespace rateline {
namespace cli {

LinesCommand::LinesCommand() : was_called_(false) {}

void LinesCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("input", input_path_, "Input file, '-' for stdin")
              ->capture_default_str();
    subcommand->add_option("--delay-us", delay_us_, "Simulated work per line in microseconds");
    subcommand->add_option("-l,--label", label_, "Label shown after the statistics");
    subcommand->add_flag("-e,--echo", echo_, "Print every line above the bar");
    addBarOptions(subcommand);
    
    subcommand->callback([this]() { was_called_ = true; });
}

bool LinesCommand::wasCalled() const {
    return was_called_;
}

bool LinesCommand::readLines(std::vector<std::string>& lines) const {
    if (input_path_ == "-") {
        std::string line;
        while (std::getline(std::cin, line)) {
            lines.push_back(line);
        }
        return true;
    }
    
    std::ifstream file(input_path_);
    if (!file) {
        common::Logger::instance().error("[Lines] Open failed | path={}", input_path_);
        return false;
    }
    
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return true;
}

int LinesCommand::execute() {
    if (!validateArguments() || delay_us_ < 0) {
        return 1;
    }
    
    std::vector<std::string> lines;
    if (!readLines(lines)) {
        std::cerr << "Error: cannot read " << input_path_ << "\n";
        return 1;
    }
    
    std::unique_ptr<progress::ProgressBar> bar;
    try {
        bar = createBar(static_cast<int64_t>(lines.size()));
    } catch (const core::EngineError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    
    bar->setLabel(label_.empty() ? input_path_ : label_);
    
    size_t bytes = 0;
    size_t non_empty = 0;
    
    for (const auto& line : progress::wrap(lines, *bar)) {
        if (delay_us_ > 0) {
            std::this_thread::sleep_for(std::chrono::microseconds(delay_us_));
        }
        
        bytes += line.size() + 1;
        if (!line.empty()) {
            ++non_empty;
        }
        
        if (echo_) {
            bar->printLine(line);
        }
    }
    
    common::Logger::instance().info("[Lines] Done | path={} | lines={} | bytes={}",
                                    input_path_, lines.size(), bytes);
    
    if (!json_output_) {
        std::cout << "lines=" << lines.size()
                  << " non_empty=" << non_empty
                  << " bytes=" << bytes << "\n";
    }
    return 0;
}

}}
