#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace rateline {
namespace cli {

class ConfigCommand : public MainCommand {
public:
    ConfigCommand();
    
    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    bool was_called_;
    
    CLI::App* init_cmd_ = nullptr;
    bool force_ = false;
    
    CLI::App* show_cmd_ = nullptr;
    CLI::App* validate_cmd_ = nullptr;
    CLI::App* path_cmd_ = nullptr;
    
    int executeInit();
    int executeShow();
    int executeValidate();
    int executePath();
};

}}
