#include "runtime/Checker.hpp"
#include "check/Errors.hpp"
#include "deploy/Deployment.hpp"
#include "engine/Probe.hpp"
#include "gate/ConfigStore.hpp"
#include "migration/GraphLoader.hpp"
#include "migration/LegacyExceptions.hpp"
#include "log/Registry.hpp"

namespace sg::runtime {

Checker::Checker(engine::Probe& probe, gate::ConfigStore& store, CheckInputs inputs)
    : probe_(probe), store_(store), inputs_(std::move(inputs)) {}

gate::GateOutcome Checker::runGate() const {
    const auto observed = probe_.majorVersion();
    log::Registry::gate()->debug("[Checker] Server reports PostgreSQL {}", observed);
    return gate::VersionGate(store_).check(observed);
}

migration::ReconciliationResult Checker::reconcileTarget() const {
    const auto applied = probe_.appliedMigrations();
    const auto graph = migration::GraphLoader::load(inputs_.targetDir);
    const auto exceptions = migration::LegacyExceptions::forTarget(inputs_.targetDir);

    log::Registry::migrations()->debug("[Checker] Reconciling {} applied migrations against {} target entries "
                                       "and {} legacy exceptions", applied.size(), graph.size(), exceptions.size());

    return migration::Reconciler::reconcile(applied, graph, exceptions);
}

Report Checker::run() const {
    runGate();

    Report report{reconcileTarget(),
                  deploy::readVersion(inputs_.currentDir, inputs_.versionFile),
                  deploy::readVersion(inputs_.targetDir, inputs_.versionFile)};

    if (!report.result.compatible())
        throw check::MigrationIncompatibility(std::move(report.result), std::move(report.currentVersion),
                                              std::move(report.targetVersion), inputs_.targetDir);

    log::Registry::schemaguard()->info("[Checker] {} (version {}) is compatible with the applied migration history",
                                       inputs_.targetDir.string(), report.targetVersion);
    return report;
}

}
