#pragma once

#include <string>
#include <optional>
#include <cstddef>

namespace rateline {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct BarConfig {
    int width;
    std::string theme;
    bool use_color;
    int prints_per_second;
    bool use_ema;
    double alpha;
};

struct LoggingConfig {
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct GlobalConfig {
    LogLevel log_level;
    std::string log_file;
    BarConfig bar;
    LoggingConfig logging;
};

class Config {
public:
    static Config& instance();
    
    // Resets to defaults, then overlays the first readable file from the
    // search path (or config_file when given). Returns false only when a
    // file exists but cannot be parsed; defaults stay in effect.
    bool load(const std::string& config_file = "");
    bool loadFromString(const std::string& toml_text);
    bool save(const std::string& config_file = "");
    
    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }
    
    std::optional<std::string> findBestConfig() const;
    std::string getConfigPath() const;
    
    static GlobalConfig createDefaultConfig();
    static std::string toString(LogLevel level);
    static std::optional<LogLevel> parseLogLevel(const std::string& text);

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;
    
    bool tryLoadTomlFile(const std::string& path);
};

}}
