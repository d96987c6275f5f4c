#pragma once

#include "gate/VersionGate.hpp"
#include "migration/Reconciler.hpp"

#include <filesystem>
#include <string>

namespace sg::engine { class Probe; }
namespace sg::gate { class ConfigStore; }

namespace sg::runtime {

struct CheckInputs {
    std::filesystem::path targetDir;   // deployment about to be activated
    std::filesystem::path currentDir;  // deployment currently running
    std::string versionFile = "VERSION";
};

struct Report {
    migration::ReconciliationResult result;
    std::string currentVersion, targetVersion;
};

/*
 * Runs the gates top to bottom: engine version first, then migration history.
 * The first failing gate throws a check::CheckError and nothing after it runs.
 */
class Checker {
public:
    Checker(engine::Probe& probe, gate::ConfigStore& store, CheckInputs inputs);

    gate::GateOutcome runGate() const;
    [[nodiscard]] migration::ReconciliationResult reconcileTarget() const;

    // Returns only when every gate passed.
    Report run() const;

private:
    engine::Probe& probe_;
    gate::ConfigStore& store_;
    CheckInputs inputs_;
};

}
