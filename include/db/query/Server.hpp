#pragma once

namespace sg::db::query {

class Server {
public:
    // server_version_num / 10000, i.e. the major version on PostgreSQL 10+.
    [[nodiscard]] static unsigned int majorVersion();
};

}
