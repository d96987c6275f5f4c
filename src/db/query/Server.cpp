#include "db/query/Server.hpp"
#include "db/Transactions.hpp"

namespace sg::db::query {

unsigned int Server::majorVersion() {
    return Transactions::exec("Server::majorVersion", [&](pqxx::work& txn) {
        const auto num = txn.exec("SELECT current_setting('server_version_num')::int").one_field().as<int>();
        if (num <= 0) throw std::runtime_error("Unexpected server_version_num: " + std::to_string(num));
        return static_cast<unsigned int>(num / 10000);
    });
}

}
