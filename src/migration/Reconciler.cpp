#include "migration/Reconciler.hpp"

#include <algorithm>
#include <iterator>
#include <nlohmann/json.hpp>

using namespace sg::migration;
using namespace sg::migration::model;

ReconciliationResult Reconciler::reconcile(const AppliedSet& applied,
                                           const Graph& graph,
                                           const MigrationSet& legacyExceptions) {
    const auto known = accountedFor(graph, legacyExceptions);

    ReconciliationResult result;
    std::ranges::set_difference(applied, known, std::back_inserter(result.missing));
    return result;
}

MigrationSet Reconciler::accountedFor(const Graph& graph, const MigrationSet& legacyExceptions) {
    MigrationSet known(legacyExceptions.begin(), legacyExceptions.end());
    for (const auto& [id, entry] : graph) {
        known.insert(id);
        known.insert(entry.replaces.begin(), entry.replaces.end());
    }
    return known;
}

void sg::migration::to_json(nlohmann::json& j, const ReconciliationResult& r) {
    j = nlohmann::json{
        {"compatible", r.compatible()},
        {"missing", r.missing}
    };
}
