#pragma once

#include "db/DBConnection.hpp"
#include "log/Registry.hpp"

#include <memory>
#include <pqxx/pqxx>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace sg::db {

// One connection per process; the checker runs a single synchronous pass.
class Transactions {
  public:
    static inline std::unique_ptr<DBConnection> conn_;

    static void init(const config::DatabaseConfig& cnf) { conn_ = std::make_unique<DBConnection>(cnf); }
    static void shutdown() { conn_.reset(); }

    template <typename Func>
    static auto exec(const std::string& ctx, Func&& func) -> decltype(func(std::declval<pqxx::work&>())) {
        if (!conn_) throw std::runtime_error("Transactions not initialized!");

        log::Registry::db()->trace("[Transactions::exec] Starting transaction: {}", ctx);
        pqxx::work txn(conn_->get());

        try {
            if constexpr (std::is_void_v<decltype(func(txn))>) {
                func(txn);
                txn.commit();
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
            } else {
                auto result = func(txn);
                txn.commit();
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                return result;
            }
        } catch (const std::exception& e) {
            log::Registry::db()->error("[Transactions::exec] Exception in transaction context '{}', rolling back: {}",
                                       ctx, e.what());
            throw;
        }

        if constexpr (!std::is_void_v<decltype(func(txn))>) {
            // Compiler satisfaction token
            throw std::logic_error("Unreachable path in Transactions::exec");
        }
    }
};

}
