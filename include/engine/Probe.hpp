#pragma once

#include "migration/model/MigrationId.hpp"

namespace sg::engine {

// Read-only view of the live database the checker gates against.
class Probe {
public:
    virtual ~Probe() = default;

    [[nodiscard]] virtual unsigned int majorVersion() = 0;
    [[nodiscard]] virtual migration::model::AppliedSet appliedMigrations() = 0;
};

}
