#pragma once

#include <string>
#include <vector>

namespace rateline {
namespace common {

// XDG locations for the per-user configuration and log files.
class PathManager {
public:
    static PathManager& instance();
    
    std::string getConfigDir() const;
    std::string getLogDir() const;
    
    std::string getConfigFile() const;
    std::string getDefaultLogFile() const;
    
    // $RATELINE_CONFIG first, then the XDG config file.
    std::vector<std::string> getConfigSearchPaths() const;

private:
    PathManager() = default;
    
    std::string getXdgConfigHome() const;
    std::string getXdgStateHome() const;
};

}}
