#include "rateline/common/paths.hpp"
#include "rateline/common/constants.hpp"
#include <cstdlib>
#include <cstring>

namespace rateline {
namespace common {

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

std::vector<std::string> PathManager::getConfigSearchPaths() const {
    std::vector<std::string> paths;
    
    if (const char* env = std::getenv(constants::system::CONFIG_ENV)) {
        if (strlen(env) > 0) {
            paths.push_back(env);
        }
    }
    
    paths.push_back(getConfigFile());
    
    return paths;
}

std::string PathManager::getConfigDir() const {
    std::string base = getXdgConfigHome();
    if (base.empty()) {
        return "./config";
    }
    return base + "/rateline";
}

std::string PathManager::getLogDir() const {
    std::string base = getXdgStateHome();
    if (base.empty()) {
        return "./logs";
    }
    return base + "/rateline";
}

std::string PathManager::getConfigFile() const {
    return getConfigDir() + "/config.toml";
}

std::string PathManager::getDefaultLogFile() const {
    return getLogDir() + "/rateline.log";
}

std::string PathManager::getXdgConfigHome() const {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && strlen(xdg) > 0) {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/.config" : "";
}

std::string PathManager::getXdgStateHome() const {
    const char* xdg = std::getenv("XDG_STATE_HOME");
    if (xdg && strlen(xdg) > 0) {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/.local/state" : "";
}

}}
