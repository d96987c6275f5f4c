#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace sg::config {
struct LoggingConfig;
}

namespace sg::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const sg::config::LoggingConfig& cnf);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> schemaguard() { return get("schemaguard"); }
    static std::shared_ptr<spdlog::logger> db()          { return get("db"); }
    static std::shared_ptr<spdlog::logger> gate()        { return get("gate"); }
    static std::shared_ptr<spdlog::logger> migrations()  { return get("migrations"); }
    static std::shared_ptr<spdlog::logger> config()      { return get("config"); }

    static void setConsoleLevel(spdlog::level::level_enum level);

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink_;
};

}
