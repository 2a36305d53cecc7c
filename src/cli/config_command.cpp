#include "config_command.hpp"
#include "rateline/common/config.hpp"
#include "rateline/common/logger.hpp"
#include "rateline/common/paths.hpp"
#include "rateline/config/validator.hpp"
#include "rateline/core/error_codes.hpp"
#include <filesystem>
#include <iostream>

namespace rateline {
namespace cli {

ConfigCommand::ConfigCommand() : was_called_(false) {}

void ConfigCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    subcommand->callback([this]() { was_called_ = true; });
    
    init_cmd_ = subcommand->add_subcommand("init", "Write a configuration file with default values");
    init_cmd_->add_flag("-f,--force", force_, "Overwrite an existing file");
    init_cmd_->callback([this]() { was_called_ = true; });
    
    show_cmd_ = subcommand->add_subcommand("show", "Show the configuration file");
    show_cmd_->callback([this]() { was_called_ = true; });
    
    validate_cmd_ = subcommand->add_subcommand("validate", "Validate the configuration file");
    validate_cmd_->callback([this]() { was_called_ = true; });
    
    path_cmd_ = subcommand->add_subcommand("path", "Print the configuration file path");
    path_cmd_->callback([this]() { was_called_ = true; });
}

bool ConfigCommand::wasCalled() const {
    return was_called_;
}

int ConfigCommand::execute() {
    if (init_cmd_->parsed()) {
        return executeInit();
    } else if (show_cmd_->parsed()) {
        return executeShow();
    } else if (validate_cmd_->parsed()) {
        return executeValidate();
    } else if (path_cmd_->parsed()) {
        return executePath();
    }
    
    std::cout << subcommand_->help() << std::endl;
    return 0;
}

int ConfigCommand::executeInit() {
    auto& config = common::Config::instance();
    std::string config_path = config.getConfigPath();
    
    if (std::filesystem::exists(config_path) && !force_) {
        std::cerr << "Configuration file already exists: " << config_path << "\n";
        std::cerr << "Use --force to overwrite it.\n";
        return 1;
    }
    
    config.global() = common::Config::createDefaultConfig();
    if (!config.save(config_path)) {
        common::ErrorContext ctx;
        ctx.component = "Config";
        ctx.details["path"] = config_path;
        std::cerr << "\033[31mError: "
                  << common::describeError(core::CoreErrorCode::CONFIG_WRITE_FAILED, ctx)
                  << "\033[0m\n";
        return 1;
    }
    
    std::cout << "Configuration written: " << config_path << "\n";
    std::cout << "To log to a file, set global.log_file, e.g. "
              << common::PathManager::instance().getDefaultLogFile() << "\n";
    return 0;
}

int ConfigCommand::executeShow() {
    auto& config = common::Config::instance();
    const auto& global = config.global();
    std::string config_path = config.getConfigPath();
    
    bool from_file = std::filesystem::exists(config_path);
    std::cout << "# source: " << (from_file ? config_path : "built-in defaults") << "\n\n";
    
    std::cout << "[global]\n"
              << "log_level = \"" << common::Config::toString(global.log_level) << "\"\n"
              << "log_file = \"" << global.log_file << "\"\n\n";
    
    std::cout << std::boolalpha
              << "[bar]\n"
              << "width = " << global.bar.width << "\n"
              << "theme = \"" << global.bar.theme << "\"\n"
              << "use_color = " << global.bar.use_color << "\n"
              << "prints_per_second = " << global.bar.prints_per_second << "\n"
              << "use_ema = " << global.bar.use_ema << "\n"
              << "alpha = " << global.bar.alpha << "\n\n";
    
    std::cout << "[logging]\n"
              << "rotation_size_mb = " << global.logging.rotation_size_mb << "\n"
              << "max_files = " << global.logging.max_files << "\n"
              << "format = \"" << (global.logging.format == common::LogFormat::JSON ? "json" : "text") << "\"\n";
    
    if (!from_file) {
        std::cout << "\n# run 'rateline config init' to write these to " << config_path << "\n";
    }
    return 0;
}

int ConfigCommand::executeValidate() {
    std::string config_path = common::Config::instance().getConfigPath();
    
    config::ConfigValidator validator;
    auto result = validator.validateFile(config_path);
    
    for (const auto& error : result.errors) {
        std::cerr << config_path << ": error: " << error << "\n";
    }
    for (const auto& warning : result.warnings) {
        std::cerr << config_path << ": warning: " << warning << "\n";
    }
    
    std::cout << config_path << ": " << (result.is_valid ? "ok" : "invalid")
              << " (" << result.errors.size() << " errors, "
              << result.warnings.size() << " warnings)\n";
    
    return result.is_valid ? 0 : 1;
}

int ConfigCommand::executePath() {
    std::cout << common::Config::instance().getConfigPath() << "\n";
    return 0;
}

}}
