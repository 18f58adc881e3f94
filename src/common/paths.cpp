#include "fluttersec/common/paths.hpp"
#include "fluttersec/common/constants.hpp"
#include <unistd.h>
#include <cstdlib>
#include <cstring>

namespace fluttersec {
namespace common {

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

PathManager::PathManager() {
    mode_ = detectMode();
}

InstallMode PathManager::detectMode() {
    const char* home = std::getenv("HOME");
    if (getuid() == 0 && (!home || std::strlen(home) == 0)) {
        return InstallMode::SYSTEM;
    }
    return InstallMode::USER;
}

std::vector<std::string> PathManager::getConfigSearchPaths() const {
    std::vector<std::string> paths;

    if (const char* env = std::getenv(constants::system::CONFIG_ENV)) {
        if (std::strlen(env) > 0) {
            paths.push_back(env);
        }
    }

    std::string xdg = getXdgConfigHome();
    if (!xdg.empty()) {
        paths.push_back(xdg + "/fluttersec/config.toml");
    }
    paths.push_back("/etc/fluttersec/config.toml");

    return paths;
}

std::string PathManager::getConfigDir() const {
    if (mode_ == InstallMode::SYSTEM) {
        return "/etc/fluttersec";
    }
    return getXdgConfigHome() + "/fluttersec";
}

std::string PathManager::getLogDir() const {
    if (mode_ == InstallMode::SYSTEM) {
        return "/var/log/fluttersec";
    }
    return getXdgStateHome() + "/fluttersec";
}

std::string PathManager::getConfigFile() const {
    return getConfigDir() + "/config.toml";
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
