#pragma once

#include "migration/model/MigrationId.hpp"

#include <map>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace sg::migration::model {

struct GraphEntry {
    MigrationId id;
    std::vector<MigrationId> replaces; // historical ids squashed or folded into this one

    GraphEntry() = default;
    explicit GraphEntry(MigrationId id, std::vector<MigrationId> replaces = {})
        : id(std::move(id)), replaces(std::move(replaces)) {}
};

using Graph = std::map<MigrationId, GraphEntry>;

void to_json(nlohmann::json& j, const GraphEntry& e);
void from_json(const nlohmann::json& j, GraphEntry& e);

}
