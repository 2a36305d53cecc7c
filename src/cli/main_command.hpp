#pragma once

#include "rateline/progress/progress_bar.hpp"
#include <CLI/CLI.hpp>
#include <memory>
#include <string>

namespace rateline {
namespace cli {

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();
    
    virtual bool validateArguments() const;

protected:
    CLI::App* subcommand_ = nullptr;
    
    int width_ = 0;
    std::string theme_;
    bool color_ = false;
    bool no_color_ = false;
    bool simple_ = false;
    double alpha_ = 0.0;
    int prints_per_second_ = 0;
    bool json_output_ = false;
    
    // Flags shared by every command that draws a bar. Unset flags fall back
    // to the loaded configuration.
    void addBarOptions(CLI::App* subcommand);
    progress::ProgressBarOptions resolveBarOptions(int64_t total) const;
    std::unique_ptr<progress::ProgressBar> createBar(int64_t total) const;
    
    static bool isTerminal(int fd);
};

}}
