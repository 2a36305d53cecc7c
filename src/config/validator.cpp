#include "rateline/config/validator.hpp"
#include "rateline/common/constants.hpp"
#include "rateline/common/logger.hpp"
#include "rateline/core/error_codes.hpp"
#include "rateline/format/theme.hpp"
#include <filesystem>

namespace rateline {
namespace config {

ValidationResult ConfigValidator::validate(const common::GlobalConfig& config) {
    ValidationResult result;
    
    common::Logger::instance().debug("[Validator] Starting validation");
    
    if (config.bar.width < 1 || config.bar.width > constants::limits::MAX_BAR_WIDTH) {
        result.errors.push_back("bar.width: Must be between 1-" +
                                std::to_string(constants::limits::MAX_BAR_WIDTH));
        result.is_valid = false;
    }
    
    if (!validateAlpha(config.bar.alpha)) {
        result.errors.push_back("bar.alpha: Must be greater than 0 and at most 1");
        result.is_valid = false;
    }
    
    if (config.bar.prints_per_second < 1) {
        result.errors.push_back("bar.prints_per_second: Must be >= 1");
        result.is_valid = false;
    } else if (config.bar.prints_per_second > constants::limits::MAX_PRINTS_PER_SECOND) {
        result.warnings.push_back(
            "bar.prints_per_second: Very high value, terminal writes may dominate the workload"
        );
    }
    
    if (!validateTheme(config.bar.theme)) {
        result.errors.push_back("bar.theme: Expected ascii, basic, blocks or exactly 9 glyphs");
        result.is_valid = false;
    }
    
    if (!config.bar.use_ema && config.bar.alpha != constants::config_defaults::ALPHA) {
        result.warnings.push_back("bar.alpha: Ignored because use_ema is false");
    }
    
    if (!config.log_file.empty() &&
        !canCreateDirectory(std::filesystem::path(config.log_file).parent_path().string())) {
        result.errors.push_back("log_file: Cannot create parent directory");
        result.is_valid = false;
    }
    
    if (config.logging.rotation_size_mb < 1) {
        result.errors.push_back("logging.rotation_size_mb: Must be >= 1");
        result.is_valid = false;
    }
    
    if (config.logging.max_files < 1) {
        result.errors.push_back("logging.max_files: Must be >= 1");
        result.is_valid = false;
    }
    
    if (result.is_valid) {
        common::Logger::instance().info("[Validator] Passed | warnings={}", result.warnings.size());
    } else {
        common::Logger::instance().error("[Validator] Failed | errors={}", result.errors.size());
    }
    
    return result;
}

ValidationResult ConfigValidator::validateFile(const std::string& path) {
    ValidationResult result;
    
    if (!std::filesystem::exists(path)) {
        result.errors.push_back("Configuration file does not exist");
        result.is_valid = false;
        common::Logger::instance().error("[Validator] File not found | path={}", path);
        return result;
    }
    
    auto& config = common::Config::instance();
    if (!config.load(path)) {
        result.errors.push_back("Failed to parse configuration file");
        result.is_valid = false;
        common::Logger::instance().error("[Validator] Parse failed | path={}", path);
        return result;
    }
    
    return validate(config.global());
}

bool ConfigValidator::validateAlpha(double alpha) {
    return alpha > 0.0 && alpha <= 1.0;
}

bool ConfigValidator::validateTheme(const std::string& theme) {
    try {
        format::Theme::resolve(theme);
        return true;
    } catch (const core::EngineError& e) {
        common::Logger::instance().debug("[Validator] Theme rejected | error={}", e.what());
        return false;
    }
}

bool ConfigValidator::canCreateDirectory(const std::string& path) {
    if (path.empty()) return true;
    
    std::error_code ec;
    std::filesystem::path p(path);
    
    if (std::filesystem::exists(p, ec)) {
        return std::filesystem::is_directory(p, ec);
    }
    
    auto parent = p.parent_path();
    if (parent.empty() || parent == p) return true;
    
    if (std::filesystem::exists(parent, ec)) {
        auto perms = std::filesystem::status(parent, ec).permissions();
        return !ec && (perms & std::filesystem::perms::owner_write) != std::filesystem::perms::none;
    }
    
    return canCreateDirectory(parent.string());
}

}}
