#pragma once

#include <string>
#include <vector>

namespace fluttersec {
namespace common {

enum class InstallMode {
    SYSTEM,
    USER
};

class PathManager {
public:
    static PathManager& instance();

    InstallMode detectMode();

    std::string getConfigDir() const;
    std::string getLogDir() const;
    std::string getConfigFile() const;
    std::vector<std::string> getConfigSearchPaths() const;

private:
    PathManager();
    InstallMode mode_;

    std::string getXdgConfigHome() const;
    std::string getXdgStateHome() const;
};

}}
