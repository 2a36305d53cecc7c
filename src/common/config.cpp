#include "rateline/common/config.hpp"
#include "rateline/common/constants.hpp"
#include "rateline/common/paths.hpp"
#include "rateline/common/logger.hpp"
#include <toml.hpp>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <unistd.h>

namespace rateline {
namespace common {

namespace {

double findNumber(const toml::value& section, const std::string& key) {
    const auto& v = toml::find(section, key);
    if (v.is_integer()) {
        return static_cast<double>(v.as_integer());
    }
    return toml::get<double>(v);
}

void applyToml(const toml::value& data, GlobalConfig& config) {
    if (data.contains("global")) {
        auto global_section = data.at("global");

        if (global_section.contains("log_level")) {
            auto level = Config::parseLogLevel(toml::find<std::string>(global_section, "log_level"));
            if (level) {
                config.log_level = *level;
            } else {
                Logger::instance().warn("[Config] Unknown log_level ignored");
            }
        }
        if (global_section.contains("log_file")) {
            config.log_file = toml::find<std::string>(global_section, "log_file");
        }
    }

    if (data.contains("bar")) {
        auto bar_section = data.at("bar");

        if (bar_section.contains("width")) {
            config.bar.width = toml::find<int>(bar_section, "width");
        }
        if (bar_section.contains("theme")) {
            config.bar.theme = toml::find<std::string>(bar_section, "theme");
        }
        if (bar_section.contains("use_color")) {
            config.bar.use_color = toml::find<bool>(bar_section, "use_color");
        }
        if (bar_section.contains("prints_per_second")) {
            config.bar.prints_per_second = toml::find<int>(bar_section, "prints_per_second");
        }
        if (bar_section.contains("use_ema")) {
            config.bar.use_ema = toml::find<bool>(bar_section, "use_ema");
        }
        if (bar_section.contains("alpha")) {
            config.bar.alpha = findNumber(bar_section, "alpha");
        }
    }

    if (data.contains("logging")) {
        auto logging_section = data.at("logging");

        if (logging_section.contains("rotation_size_mb")) {
            config.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
        }
        if (logging_section.contains("max_files")) {
            config.logging.max_files = toml::find<size_t>(logging_section, "max_files");
        }
        if (logging_section.contains("format")) {
            std::string format_str = toml::find<std::string>(logging_section, "format");
            config.logging.format = format_str == "json" ? LogFormat::JSON : LogFormat::TEXT;
        }
    }
}

}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;

    GlobalConfig config;

    config.log_level = LogLevel::WARN;
    config.log_file = "";

    config.bar.width = BAR_WIDTH;
    config.bar.theme = BAR_THEME;
    config.bar.use_color = BAR_USE_COLOR;
    config.bar.prints_per_second = PRINTS_PER_SECOND;
    config.bar.use_ema = USE_EMA;
    config.bar.alpha = ALPHA;

    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;

    return config;
}

std::string Config::toString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

std::optional<LogLevel> Config::parseLogLevel(const std::string& text) {
    if (text == "DEBUG") return LogLevel::DEBUG;
    if (text == "INFO") return LogLevel::INFO;
    if (text == "WARN") return LogLevel::WARN;
    if (text == "ERROR") return LogLevel::ERROR;
    return std::nullopt;
}

std::optional<std::string> Config::findBestConfig() const {
    auto paths = PathManager::instance().getConfigSearchPaths();

    for (const auto& path : paths) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }

    return std::nullopt;
}

std::string Config::getConfigPath() const {
    if (!current_config_path_.empty()) {
        return current_config_path_;
    }
    return PathManager::instance().getConfigFile();
}

bool Config::load(const std::string& config_file) {
    global_ = createDefaultConfig();

    std::string effective_config_file = config_file;
    if (effective_config_file.empty()) {
        auto best = findBestConfig();
        if (!best) {
            current_config_path_.clear();
            Logger::instance().debug("[Config] No configuration file found, using defaults");
            return true;
        }
        effective_config_file = *best;
    }

    current_config_path_ = effective_config_file;

    if (!std::filesystem::exists(effective_config_file)) {
        Logger::instance().debug("[Config] File not found | path={}", effective_config_file);
        return true;
    }

    return tryLoadTomlFile(effective_config_file);
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().warn("[Config] File not readable | path={}", path);
        return false;
    }

    try {
        auto data = toml::parse(path);
        applyToml(data, global_);

        Logger::instance().info("[Config] Loaded | path={}", path);
        return true;
    } catch (const std::exception& e) {
        global_ = createDefaultConfig();
        Logger::instance().error("[Config] Parse failed | path={} | error={}", path, e.what());
        return false;
    }
}

bool Config::loadFromString(const std::string& toml_text) {
    global_ = createDefaultConfig();

    try {
        std::istringstream stream(toml_text);
        auto data = toml::parse(stream, "inline");
        applyToml(data, global_);
        return true;
    } catch (const std::exception& e) {
        global_ = createDefaultConfig();
        Logger::instance().error("[Config] Parse failed | source=inline | error={}", e.what());
        return false;
    }
}

bool Config::save(const std::string& config_file) {
    try {
        std::string effective_config_file = config_file.empty() ? getConfigPath() : config_file;

        std::filesystem::path parent = std::filesystem::path(effective_config_file).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }

        toml::value data = toml::table{
            {"global", toml::table{
                {"log_level", toString(global_.log_level)},
                {"log_file", global_.log_file}
            }},
            {"bar", toml::table{
                {"width", global_.bar.width},
                {"theme", global_.bar.theme},
                {"use_color", global_.bar.use_color},
                {"prints_per_second", global_.bar.prints_per_second},
                {"use_ema", global_.bar.use_ema},
                {"alpha", global_.bar.alpha}
            }},
            {"logging", toml::table{
                {"rotation_size_mb", global_.logging.rotation_size_mb},
                {"max_files", global_.logging.max_files},
                {"format", global_.logging.format == LogFormat::JSON ? "json" : "text"}
            }}
        };

        std::ofstream file(effective_config_file);
        if (!file) {
            Logger::instance().error("[Config] File open failed | path={}", effective_config_file);
            return false;
        }

        file << toml::format(data);
        file.close();

        current_config_path_ = effective_config_file;

        Logger::instance().info("[Config] Saved | path={}", effective_config_file);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Save failed | error={}", e.what());
        return false;
    }
}

}}
