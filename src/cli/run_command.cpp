#include "run_command.hpp"
#include "rateline/common/logger.hpp"
#include "rateline/core/error_codes.hpp"
#include <chrono>
#include <iostream>
#include <random>
#include <thread>

namespace rateline {
namespace cli {

RunCommand::RunCommand() : was_called_(false) {}

void RunCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("-n,--total", total_, "Number of units to process")
              ->capture_default_str();
    subcommand->add_option("-d,--delay-ms", delay_ms_, "Simulated work per unit in milliseconds")
              ->capture_default_str();
    subcommand->add_option("--jitter-ms", jitter_ms_, "Random extra work per unit, up to this many milliseconds");
    subcommand->add_option("-l,--label", label_, "Label shown after the statistics");
    subcommand->add_flag("--grow", grow_, "Grow the total by half once the loop is halfway through");
    subcommand->add_option("--checkpoint", checkpoint_, "Print a line every N units");
    subcommand->add_option("--seed", seed_, "Seed for the jitter generator");
    addBarOptions(subcommand);
    
    subcommand->callback([this]() { was_called_ = true; });
}

bool RunCommand::wasCalled() const {
    return was_called_;
}

bool RunCommand::validateArguments() const {
    if (total_ < 0) {
        std::cerr << "Error: --total must not be negative\n";
        return false;
    }
    if (delay_ms_ < 0.0 || jitter_ms_ < 0.0) {
        std::cerr << "Error: delays must not be negative\n";
        return false;
    }
    return MainCommand::validateArguments();
}

int RunCommand::execute() {
    if (!validateArguments()) {
        return 1;
    }
    
    std::unique_ptr<progress::ProgressBar> bar;
    try {
        bar = createBar(total_);
    } catch (const core::EngineError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    
    if (!label_.empty()) {
        bar->setLabel(label_);
    }
    
    std::mt19937 generator(seed_);
    std::uniform_real_distribution<double> jitter(0.0, jitter_ms_);
    
    int64_t total = total_;
    bool grown = false;
    
    common::Logger::instance().info("[Run] Starting | total={} | delay_ms={} | jitter_ms={}",
                                    total, delay_ms_, jitter_ms_);
    
    for (int64_t i = 0; i < total; ++i) {
        double work_ms = delay_ms_ + (jitter_ms_ > 0.0 ? jitter(generator) : 0.0);
        if (work_ms > 0.0) {
            std::this_thread::sleep_for(std::chrono::duration<double, std::milli>(work_ms));
        }
        
        if (grow_ && !grown && i >= total / 2) {
            total += total / 2;
            grown = true;
            common::Logger::instance().info("[Run] Total grown | total={}", total);
        }
        
        if (checkpoint_ > 0 && i > 0 && i % checkpoint_ == 0) {
            bar->printLine("checkpoint " + std::to_string(i));
        }
        
        bar->progress(i, total);
    }
    
    bar->finish();
    
    common::Logger::instance().info("[Run] Done | total={} | updates={}",
                                    total, bar->engine().updatesIssued());
    return 0;
}

}}
