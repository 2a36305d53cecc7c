#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "rateline/common/config.hpp"
#include "rateline/common/constants.hpp"
#include "rateline/common/logger.hpp"
#include "rateline/core/error_codes.hpp"
#include "cli/main_command.hpp"
#include "cli/run_command.hpp"
#include "cli/lines_command.hpp"
#include "cli/config_command.hpp"

// The configuration has to be loaded before the subcommands are set up,
// so --config is picked out of argv ahead of the real parse.
std::string find_config_argument(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            return argv[i + 1];
        }
        const std::string prefix = "--config=";
        if (arg.compare(0, prefix.size(), prefix) == 0) {
            return arg.substr(prefix.size());
        }
    }
    return "";
}

int main(int argc, char** argv) {
    try {
        CLI::App app{rateline::constants::system::APPLICATION_NAME, "rateline"};
        app.set_version_flag("--version,-v", rateline::constants::version::getFullVersion());
        app.require_subcommand(0, 1);
        
        std::string config_file = find_config_argument(argc, argv);
        bool verbose = false;
        app.add_option("-c,--config", config_file, "Configuration file");
        app.add_flag("--verbose", verbose, "Log debug messages");
        
        auto& config = rateline::common::Config::instance();
        if (!config.load(config_file)) {
            rateline::common::ErrorContext ctx;
            ctx.component = "Config";
            ctx.details["path"] = config.getConfigPath();
            std::cerr << "\033[33mWarning: "
                      << rateline::common::describeError(rateline::core::CoreErrorCode::CONFIG_PARSE_FAILED, ctx)
                      << ", using defaults\033[0m\n";
        }
        
        if (!config.global().log_file.empty()) {
            rateline::common::Logger::instance().initialize(
                rateline::common::LogMode::FILE_ONLY,
                config.global().log_file,
                config.global().log_level,
                config.global().logging
            );
        } else {
            rateline::common::Logger::instance().initialize(
                rateline::common::LogMode::CONSOLE_ONLY,
                "",
                config.global().log_level,
                config.global().logging
            );
        }
        
        auto run_cmd = std::make_unique<rateline::cli::RunCommand>();
        auto lines_cmd = std::make_unique<rateline::cli::LinesCommand>();
        auto config_cmd = std::make_unique<rateline::cli::ConfigCommand>();
        
        run_cmd->setup(app.add_subcommand("run", "Drive a bar over a simulated workload"));
        lines_cmd->setup(app.add_subcommand("lines", "Show progress while reading lines"));
        config_cmd->setup(app.add_subcommand("config", "Manage configuration"));
        
        CLI11_PARSE(app, argc, argv);
        
        if (verbose) {
            rateline::common::Logger::instance().setLevel(rateline::common::LogLevel::DEBUG);
        }
        
        int exit_code = 0;
        if (run_cmd->wasCalled()) {
            exit_code = run_cmd->execute();
        } else if (lines_cmd->wasCalled()) {
            exit_code = lines_cmd->execute();
        } else if (config_cmd->wasCalled()) {
            exit_code = config_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
        }
        
        rateline::common::Logger::instance().shutdown();
        return exit_code;
        
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        rateline::common::Logger::instance().shutdown();
        return 1;
    }
}
