#include "db/DBConnection.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

#include <cctype>
#include <fmt/core.h>

namespace sg::db {

std::string escapeUriComponent(const std::string& s) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') out += static_cast<char>(c);
        else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::string connectionString(const config::DatabaseConfig& cnf) {
    std::string auth = escapeUriComponent(cnf.user);
    if (!cnf.password.empty()) auth += ":" + escapeUriComponent(cnf.password);
    return fmt::format("postgresql://{}@{}:{}/{}?connect_timeout={}",
                       auth, escapeUriComponent(cnf.host), cnf.port, escapeUriComponent(cnf.name),
                       cnf.connect_timeout_seconds);
}

DBConnection::DBConnection(const config::DatabaseConfig& cnf)
    : description_(fmt::format("{}@{}:{}/{}", cnf.user, cnf.host, cnf.port, cnf.name)) {
    log::Registry::db()->debug("[DBConnection] Connecting to {}", description_);
    conn_ = std::make_unique<pqxx::connection>(connectionString(cnf));
    if (!conn_->is_open()) throw std::runtime_error("Failed to open database connection to " + description_);
}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const { return *conn_; }

} // namespace sg::db
