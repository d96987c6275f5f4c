#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace sg::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    // The default location is optional; an explicitly named file is not.
    const bool required = path != std::filesystem::path(DEFAULT_CONFIG_PATH);
    init(loadConfig(path, required));
    if (config_.source.empty()) config_.source = path;
}

void ConfigRegistry::init(Config config) {
    config_ = std::move(config);
    initialized_ = true;
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

}
