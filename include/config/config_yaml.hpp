#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace sg::config;

template<>
struct convert<DatabaseConfig> {
    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("zulip");
        rhs.user = node["user"].as<std::string>("zulip");
        rhs.password = node["password"].as<std::string>("");
        rhs.connect_timeout_seconds = node["connect_timeout_seconds"].as<unsigned int>(10);
        return true;
    }
};

template<>
struct convert<MigrationsConfig> {
    static bool decode(const Node& node, MigrationsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.table = node["table"].as<std::string>("django_migrations");
        rhs.namespace_column = node["namespace_column"].as<std::string>("app");
        rhs.name_column = node["name_column"].as<std::string>("name");
        return true;
    }
};

template<>
struct convert<DeploymentConfig> {
    static bool decode(const Node& node, DeploymentConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.deployments_dir = node["deployments_dir"].as<std::string>("/srv/deployments");
        rhs.current_link = node["current_link"].as<std::string>("current");
        rhs.version_file = node["version_file"].as<std::string>("VERSION");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.schemaguard = spdlog::level::from_str(node["schemaguard"].as<std::string>("info"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("warn"));
        rhs.gate = spdlog::level::from_str(node["gate"].as<std::string>("info"));
        rhs.migrations = spdlog::level::from_str(node["migrations"].as<std::string>("info"));
        rhs.config = spdlog::level::from_str(node["config"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("warn"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("info"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_file = node["log_file"].as<std::string>("");
        if (const auto levels = node["log_levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

} // namespace YAML
