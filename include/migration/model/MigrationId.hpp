#pragma once

#include <compare>
#include <set>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace pqxx {
    class row;
}

namespace sg::migration::model {

// (namespace, name) pair; identity is exact match on both parts.
struct MigrationId {
    std::string ns, name;

    MigrationId() = default;
    MigrationId(std::string ns, std::string name) : ns(std::move(ns)), name(std::move(name)) {}
    explicit MigrationId(const pqxx::row& row);

    auto operator<=>(const MigrationId&) const = default;
    bool operator==(const MigrationId&) const = default;

    [[nodiscard]] std::string str() const { return ns + "." + name; }
};

// Ordered by namespace then name, which is also the report order.
using AppliedSet = std::set<MigrationId>;
using MigrationSet = std::set<MigrationId>;

MigrationId parseMigrationId(const std::string& dotted);

void to_json(nlohmann::json& j, const MigrationId& id);
void from_json(const nlohmann::json& j, MigrationId& id);

}

