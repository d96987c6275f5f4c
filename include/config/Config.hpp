#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace sg::config {

inline constexpr const char* DEFAULT_CONFIG_PATH = "/etc/schemaguard/config.yaml";

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "zulip";
    std::string user = "zulip";
    std::string password; // empty = rely on peer/ident auth or ~/.pgpass
    unsigned int connect_timeout_seconds = 10;
};

// Where the applied-migration bookkeeping table lives.
struct MigrationsConfig {
    std::string table = "django_migrations";
    std::string namespace_column = "app";
    std::string name_column = "name";
};

struct DeploymentConfig {
    std::filesystem::path deployments_dir = "/srv/deployments";
    std::string current_link = "current";
    std::string version_file = "VERSION";
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum schemaguard = spdlog::level::info;
    spdlog::level::level_enum db          = spdlog::level::warn;  // Connection failures, bad bookkeeping rows
    spdlog::level::level_enum gate        = spdlog::level::info;
    spdlog::level::level_enum migrations  = spdlog::level::info;
    spdlog::level::level_enum config      = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::warn;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_file; // empty = console only
    LogLevelsConfig levels;
};

struct Config {
    DatabaseConfig database;
    MigrationsConfig migrations;
    DeploymentConfig deployment;
    LoggingConfig logging;

    std::filesystem::path source; // file this was loaded from, if any
};

// Throws if the file is missing and `required` is set, or if it does not parse.
Config loadConfig(const std::filesystem::path& path, bool required = true);

}
