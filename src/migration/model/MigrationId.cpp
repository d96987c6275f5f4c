#include "migration/model/MigrationId.hpp"

#include <stdexcept>
#include <pqxx/row>
#include <nlohmann/json.hpp>

using namespace sg::migration::model;

MigrationId::MigrationId(const pqxx::row& row)
    : ns(row[0].as<std::string>()),
      name(row[1].as<std::string>()) {}

MigrationId sg::migration::model::parseMigrationId(const std::string& dotted) {
    const auto dot = dotted.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == dotted.size())
        throw std::invalid_argument("Invalid migration identifier '" + dotted + "', expected <namespace>.<name>");
    return {dotted.substr(0, dot), dotted.substr(dot + 1)};
}

void sg::migration::model::to_json(nlohmann::json& j, const MigrationId& id) {
    j = nlohmann::json{
        {"namespace", id.ns},
        {"name", id.name}
    };
}

// Accepts either {"namespace": .., "name": ..} or a two-element [ns, name] array.
void sg::migration::model::from_json(const nlohmann::json& j, MigrationId& id) {
    if (j.is_array()) {
        if (j.size() != 2) throw std::invalid_argument("Migration identifier array must have exactly two elements");
        j.at(0).get_to(id.ns);
        j.at(1).get_to(id.name);
        return;
    }

    j.at("namespace").get_to(id.ns);
    j.at("name").get_to(id.name);
}
