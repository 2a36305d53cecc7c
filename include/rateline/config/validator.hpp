#pragma once

#include "../common/config.hpp"
#include <string>
#include <vector>

namespace rateline {
namespace config {

struct ValidationResult {
    bool is_valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

class ConfigValidator {
public:
    ValidationResult validate(const common::GlobalConfig& config);
    ValidationResult validateFile(const std::string& path);
    
    static bool validateAlpha(double alpha);
    static bool validateTheme(const std::string& theme);
    static bool canCreateDirectory(const std::string& path);
};

}}
