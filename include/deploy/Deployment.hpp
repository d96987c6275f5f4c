#pragma once

#include <filesystem>
#include <string>

namespace sg::config { struct DeploymentConfig; }

namespace sg::deploy {

inline constexpr const char* UNKNOWN_VERSION = "unknown";

// First line of <dir>/<versionFile>, trimmed; UNKNOWN_VERSION when absent or empty.
std::string readVersion(const std::filesystem::path& dir, const std::string& versionFile = "VERSION");

std::filesystem::path currentDeployment(const config::DeploymentConfig& cnf);

}
