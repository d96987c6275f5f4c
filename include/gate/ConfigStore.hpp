#pragma once

#include <optional>

namespace sg::gate {

/*
 * Persisted engine-version setting consulted by the VersionGate.
 *
 * Implementations must make persistMajorVersion() atomic with respect to
 * concurrent invocations of the gate (two upgrade attempts racing on a first
 * run). The gate itself takes no locks.
 */
class ConfigStore {
public:
    virtual ~ConfigStore() = default;

    // std::nullopt when unset. A stored 0 is treated as unset as well.
    [[nodiscard]] virtual std::optional<unsigned int> configuredMajorVersion() const = 0;
    virtual void persistMajorVersion(unsigned int version) = 0;
};

}
