#pragma once

#include "migration/model/GraphEntry.hpp"
#include "migration/model/MigrationId.hpp"

#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace sg::migration {

struct ReconciliationResult {
    // Sorted by namespace, then name. Empty means compatible.
    std::vector<model::MigrationId> missing;

    [[nodiscard]] bool compatible() const { return missing.empty(); }
};

/*
 * Decides whether every applied migration is still accounted for by the target:
 * either it is a graph key, it appears in some entry's `replaces` list, or it is
 * a known legacy exception. Pure; never throws for any input shape.
 */
class Reconciler {
public:
    [[nodiscard]] static ReconciliationResult reconcile(const model::AppliedSet& applied,
                                                        const model::Graph& graph,
                                                        const model::MigrationSet& legacyExceptions);

    // Union of graph keys, their `replaces` lists and the legacy exceptions.
    [[nodiscard]] static model::MigrationSet accountedFor(const model::Graph& graph,
                                                          const model::MigrationSet& legacyExceptions);
};

void to_json(nlohmann::json& j, const ReconciliationResult& r);

}
