#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>
#include <vector>

namespace rateline {
namespace cli {

// Iterates the lines of a file (or stdin) through the progress wrapper.
class LinesCommand : public MainCommand {
public:
    LinesCommand();
    
    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    bool was_called_;
    std::string input_path_ = "-";
    int delay_us_ = 0;
    std::string label_;
    bool echo_ = false;
    
    bool readLines(std::vector<std::string>& lines) const;
};

}}
