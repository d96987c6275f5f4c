#pragma once

#include <cstdint>

namespace sg::gate {

class ConfigStore;

enum class GateOutcome : uint8_t {
    Persisted, // no configured value existed; the observed one was stored
    Match
};

const char* to_string(GateOutcome outcome);

class VersionGate {
public:
    static constexpr unsigned int MIN_SUPPORTED_MAJOR_VERSION = 12;

    explicit VersionGate(ConfigStore& store, unsigned int minimum = MIN_SUPPORTED_MAJOR_VERSION);

    // Throws check::ConfigurationMismatch or check::UnsupportedEngineVersion.
    GateOutcome check(unsigned int observedMajor) const;

private:
    ConfigStore& store_;
    unsigned int minimum_;
};

}
