#include "db/query/Migrations.hpp"
#include "db/Transactions.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

using namespace sg::migration::model;

namespace sg::db::query {

bool Migrations::tableExists(const config::MigrationsConfig& cnf) {
    return Transactions::exec("Migrations::tableExists", [&](pqxx::work& txn) {
        return !txn.exec_params("SELECT to_regclass($1)", txn.quote_name(cnf.table)).one_field().is_null();
    });
}

AppliedSet Migrations::listApplied(const config::MigrationsConfig& cnf) {
    if (!tableExists(cnf)) {
        log::Registry::db()->warn("[Migrations] Bookkeeping table '{}' does not exist; treating as empty", cnf.table);
        return {};
    }

    return Transactions::exec("Migrations::listApplied", [&](pqxx::work& txn) {
        const auto sql = "SELECT " + txn.quote_name(cnf.namespace_column) + ", " + txn.quote_name(cnf.name_column) +
                         " FROM " + txn.quote_name(cnf.table);

        AppliedSet applied;
        for (const auto& row : txn.exec(sql)) applied.emplace(row);

        log::Registry::db()->debug("[Migrations] {} applied migrations recorded in '{}'", applied.size(), cnf.table);
        return applied;
    });
}

}
