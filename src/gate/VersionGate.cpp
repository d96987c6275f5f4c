#include "gate/VersionGate.hpp"
#include "gate/ConfigStore.hpp"
#include "check/Errors.hpp"
#include "log/Registry.hpp"

namespace sg::gate {

const char* to_string(const GateOutcome outcome) {
    switch (outcome) {
        case GateOutcome::Persisted: return "persisted";
        case GateOutcome::Match: return "match";
    }
    return "unknown";
}

VersionGate::VersionGate(ConfigStore& store, const unsigned int minimum) : store_(store), minimum_(minimum) {}

GateOutcome VersionGate::check(const unsigned int observedMajor) const {
    const auto configured = store_.configuredMajorVersion();
    const bool unset = !configured || *configured == 0;

    if (unset) {
        log::Registry::gate()->info("[VersionGate] No configured PostgreSQL version, recording observed {}", observedMajor);
        store_.persistMajorVersion(observedMajor);
    }

    // Always judged on the observed value, whatever the configuration says.
    if (observedMajor < minimum_) throw check::UnsupportedEngineVersion(observedMajor, minimum_);

    if (!unset && *configured != observedMajor) throw check::ConfigurationMismatch(*configured, observedMajor);

    const auto outcome = unset ? GateOutcome::Persisted : GateOutcome::Match;
    log::Registry::gate()->debug("[VersionGate] PostgreSQL {} accepted ({})", observedMajor, to_string(outcome));
    return outcome;
}

}
