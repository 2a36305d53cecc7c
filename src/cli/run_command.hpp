#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>
#include <cstdint>

namespace rateline {
namespace cli {

// Drives a bar over a synthetic counted loop.
class RunCommand : public MainCommand {
public:
    RunCommand();
    
    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    bool was_called_;
    int64_t total_ = 1000;
    double delay_ms_ = 2.0;
    double jitter_ms_ = 0.0;
    std::string label_;
    bool grow_ = false;
    int64_t checkpoint_ = 0;
    unsigned int seed_ = 0;
    
    bool validateArguments() const override;
};

}}
