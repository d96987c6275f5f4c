#include "deploy/Deployment.hpp"
#include "config/Config.hpp"

#include <fstream>

namespace sg::deploy {

std::string readVersion(const std::filesystem::path& dir, const std::string& versionFile) {
    std::ifstream in(dir / versionFile);
    if (!in.is_open()) return UNKNOWN_VERSION;

    std::string line;
    if (!std::getline(in, line)) return UNKNOWN_VERSION;

    const auto first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos) return UNKNOWN_VERSION;
    const auto last = line.find_last_not_of(" \t\r");
    return line.substr(first, last - first + 1);
}

std::filesystem::path currentDeployment(const config::DeploymentConfig& cnf) {
    return cnf.deployments_dir / cnf.current_link;
}

}
