#pragma once

#include <string>
#include <cstddef>
#include <cstdint>

namespace rateline {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.0.0";
    
    inline std::string getFullVersion() {
        return std::string("rateline v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "rateline";
    constexpr const char* LOGGER_NAME = "rateline";
    constexpr const char* CONFIG_ENV = "RATELINE_CONFIG";
}

namespace engine {
    constexpr size_t INITIAL_WINDOW_CAPACITY = 50;
    constexpr size_t TUNED_WINDOW_CAPACITY = 75;
    constexpr int64_t WARMUP_UPDATES = 10;
    constexpr int64_t MIN_REDRAW_PERIOD = 1;
    constexpr int64_t MAX_REDRAW_PERIOD = 500000;
    constexpr int64_t UNKNOWN_TOTAL = -1;
}

namespace themes {
    constexpr size_t GLYPH_COUNT = 9;
    constexpr const char* ASCII = "ascii";
    constexpr const char* BASIC = "basic";
    constexpr const char* BLOCKS = "blocks";
}

namespace limits {
    constexpr int MAX_BAR_WIDTH = 1000;
    constexpr int MAX_PRINTS_PER_SECOND = 1000;
    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 3;
}

namespace config_defaults {
    constexpr int BAR_WIDTH = 40;
    constexpr const char* BAR_THEME = themes::ASCII;
    constexpr bool BAR_USE_COLOR = false;
    constexpr int PRINTS_PER_SECOND = 10;
    constexpr bool USE_EMA = true;
    constexpr double ALPHA = 0.1;
    
    constexpr size_t LOG_ROTATION_SIZE_MB = limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    constexpr size_t LOG_MAX_FILES = limits::DEFAULT_LOG_MAX_FILES;
}

}
}
