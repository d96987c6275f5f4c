#pragma once

#include "config/Config.hpp"

#include <filesystem>

namespace sg::config {

// Holds the configuration `main` loaded. Components take the sections they
// need as explicit parameters; only the entry point reads from here.
class ConfigRegistry {
public:
    static void init(const std::filesystem::path& path = DEFAULT_CONFIG_PATH);
    static void init(Config config);
    static const Config& get();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
};

}
