#pragma once

#include "engine/Probe.hpp"
#include "config/Config.hpp"

namespace sg::db {

class PostgresProbe final : public engine::Probe {
public:
    explicit PostgresProbe(config::MigrationsConfig cnf) : cnf_(std::move(cnf)) {}

    [[nodiscard]] unsigned int majorVersion() override;
    [[nodiscard]] migration::model::AppliedSet appliedMigrations() override;

private:
    config::MigrationsConfig cnf_;
};

}
