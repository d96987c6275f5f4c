#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace sg::config {

Config loadConfig(const std::filesystem::path& path, const bool required) {
    Config cfg;

    if (!std::filesystem::exists(path)) {
        if (required) throw std::runtime_error("Config file not found: " + path.string());
        return cfg;
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse config file " + path.string() + ": " + e.what());
    }

    cfg.source = path;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config file " + path.string() + " must contain a YAML mapping");

    if (auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
    if (auto node = root["migrations"]) YAML::convert<MigrationsConfig>::decode(node, cfg.migrations);
    if (auto node = root["deployment"]) YAML::convert<DeploymentConfig>::decode(node, cfg.deployment);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

}
