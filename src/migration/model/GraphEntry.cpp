#include "migration/model/GraphEntry.hpp"

#include <nlohmann/json.hpp>

using namespace sg::migration::model;

void sg::migration::model::to_json(nlohmann::json& j, const GraphEntry& e) {
    j = nlohmann::json{
        {"namespace", e.id.ns},
        {"name", e.id.name},
        {"replaces", e.replaces}
    };
}

void sg::migration::model::from_json(const nlohmann::json& j, GraphEntry& e) {
    j.at("namespace").get_to(e.id.ns);
    j.at("name").get_to(e.id.name);
    e.replaces = j.value("replaces", std::vector<MigrationId>{});
}
