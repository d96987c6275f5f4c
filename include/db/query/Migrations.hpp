#pragma once

#include "migration/model/MigrationId.hpp"

namespace sg::config { struct MigrationsConfig; }

namespace sg::db::query {

class Migrations {
public:
    // Every (namespace, name) row of the bookkeeping table. A database without
    // the table has applied nothing.
    [[nodiscard]] static migration::model::AppliedSet listApplied(const config::MigrationsConfig& cnf);
    [[nodiscard]] static bool tableExists(const config::MigrationsConfig& cnf);
};

}
