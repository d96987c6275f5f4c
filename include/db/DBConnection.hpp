#pragma once

#include <memory>
#include <string>
#include <pqxx/connection>

namespace sg::config {
struct DatabaseConfig;
}

namespace sg::db {

class DBConnection {
  public:
    explicit DBConnection(const config::DatabaseConfig& cnf);
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;

  private:
    std::string description_; // never includes the password
    std::unique_ptr<pqxx::connection> conn_;
};

std::string escapeUriComponent(const std::string& s);
std::string connectionString(const config::DatabaseConfig& cnf);

} // namespace sg::db
