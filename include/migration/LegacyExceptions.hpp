#pragma once

#include "migration/model/MigrationId.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace sg::migration {

// Applied ids that are safe to ignore although no current entry explains them:
// the owning component was removed or renamed, or old squash metadata was
// incomplete. Supplied by the target as data, never hard-coded here.
struct LegacyExceptionGroup {
    std::string ns;
    std::vector<std::string> names;
    std::string reason;
};

class LegacyExceptions {
public:
    static constexpr const char* FILE_NAME = "legacy_exceptions.yaml";

    // Absent file yields no groups.
    [[nodiscard]] static std::vector<LegacyExceptionGroup> load(const std::filesystem::path& path);
    [[nodiscard]] static std::vector<LegacyExceptionGroup> parse(const std::string& yaml,
                                                                 const std::string& origin = "<string>");

    [[nodiscard]] static model::MigrationSet flatten(const std::vector<LegacyExceptionGroup>& groups);

    // <target>/migrations/legacy_exceptions.yaml, flattened.
    [[nodiscard]] static model::MigrationSet forTarget(const std::filesystem::path& targetDir);
};

}
