#include "db/PostgresProbe.hpp"
#include "db/query/Migrations.hpp"
#include "db/query/Server.hpp"

namespace sg::db {

unsigned int PostgresProbe::majorVersion() { return query::Server::majorVersion(); }

migration::model::AppliedSet PostgresProbe::appliedMigrations() { return query::Migrations::listApplied(cnf_); }

}
