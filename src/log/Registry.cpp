#include "log/Registry.hpp"
#include "config/Config.hpp"

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace sg::log {

void Registry::init(const sg::config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[log::Registry] Already initialized, ignoring second init()");
        return;
    }

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    // optional file sink (append)
    if (!cnf.log_file.empty()) {
        namespace fs = std::filesystem;
        if (const auto dir = cnf.log_file.parent_path(); !dir.empty() && !fs::exists(dir)) fs::create_directories(dir);
        file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(cnf.log_file.string(), /*truncate=*/false);
        file_sink_->set_level(cnf.levels.file_log_level);
        file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("schemaguard", sub_levels.schemaguard);
    makeLogger("db",          sub_levels.db);
    makeLogger("gate",        sub_levels.gate);
    makeLogger("migrations",  sub_levels.migrations);
    makeLogger("config",      sub_levels.config);

    initialized_ = true;
    get("schemaguard")->debug("[log::Registry] Initialized");
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[log::Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[log::Registry] Logger not found: " + name);
    }
    return logger;
}

void Registry::setConsoleLevel(const spdlog::level::level_enum level) {
    if (!initialized_) return;
    console_sink_->set_level(level);
    // Loggers filter before sinks do, so widen any that would hide the new level.
    spdlog::apply_all([&](const std::shared_ptr<spdlog::logger>& lg) {
        if (lg->level() > level) lg->set_level(level);
    });
}

}
