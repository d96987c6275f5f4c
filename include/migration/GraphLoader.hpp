#pragma once

#include "migration/model/GraphEntry.hpp"

#include <filesystem>
#include <istream>

namespace sg::migration {

/*
 * Builds the target codebase's migration graph from its `migrations/`
 * directory. Two layouts are understood:
 *
 *   migrations/manifest.json              explicit list of entries
 *   migrations/<namespace>/<name>.sql     one file per migration; header lines
 *                                         of the form `-- replaces: ns.name, ...`
 *                                         declare what the file supersedes
 *
 * The manifest wins when both are present. A key declared twice is an error.
 */
class GraphLoader {
public:
    static constexpr const char* MIGRATIONS_DIR = "migrations";
    static constexpr const char* MANIFEST_FILE = "manifest.json";

    [[nodiscard]] static model::Graph load(const std::filesystem::path& targetDir);

    [[nodiscard]] static model::Graph fromManifest(const std::filesystem::path& manifest);
    [[nodiscard]] static model::Graph fromManifest(std::istream& in, const std::string& origin = "<stream>");
    [[nodiscard]] static model::Graph fromDirectory(const std::filesystem::path& migrationsDir);

    // `-- replaces:` declarations from the leading comment block of a SQL file.
    [[nodiscard]] static std::vector<model::MigrationId> parseReplacesHeader(std::istream& sql);
};

}
