#include "migration/GraphLoader.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string_view>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace sg::migration::model;

namespace sg::migration {

namespace {

constexpr std::string_view REPLACES_TAG = "replaces:";

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

void insertEntry(Graph& graph, GraphEntry entry, const std::string& origin) {
    const auto id = entry.id;
    if (id.ns.empty() || id.name.empty())
        throw std::runtime_error("Migration with empty namespace or name in " + origin);
    if (!graph.emplace(id, std::move(entry)).second)
        throw std::runtime_error("Migration " + id.str() + " is declared more than once in " + origin);
}

std::vector<fs::path> sortedChildren(const fs::path& dir, const bool directories) {
    std::vector<fs::path> out;
    for (const auto& e : fs::directory_iterator(dir)) {
        if (directories ? e.is_directory() : (e.is_regular_file() && e.path().extension() == ".sql"))
            out.push_back(e.path());
    }
    std::ranges::sort(out, [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return out;
}

}

Graph GraphLoader::load(const fs::path& targetDir) {
    const auto dir = targetDir / MIGRATIONS_DIR;
    if (!fs::is_directory(dir)) throw std::runtime_error("No migrations directory under " + targetDir.string());

    Graph graph;
    if (const auto manifest = dir / MANIFEST_FILE; fs::exists(manifest)) graph = fromManifest(manifest);
    else graph = fromDirectory(dir);

    log::Registry::migrations()->debug("[GraphLoader] Loaded {} migrations from {}", graph.size(), dir.string());
    return graph;
}

Graph GraphLoader::fromManifest(const fs::path& manifest) {
    std::ifstream in(manifest);
    if (!in.is_open()) throw std::runtime_error("Failed to open migration manifest: " + manifest.string());
    return fromManifest(in, manifest.string());
}

Graph GraphLoader::fromManifest(std::istream& in, const std::string& origin) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed migration manifest " + origin + ": " + e.what());
    }

    if (!j.is_object() || !j.contains("migrations") || !j["migrations"].is_array())
        throw std::runtime_error("Migration manifest " + origin + " must be an object with a 'migrations' array");

    Graph graph;
    for (const auto& item : j["migrations"]) {
        GraphEntry entry;
        try {
            item.get_to(entry);
        } catch (const std::exception& e) {
            throw std::runtime_error("Invalid entry in migration manifest " + origin + ": " + e.what());
        }
        insertEntry(graph, std::move(entry), origin);
    }
    return graph;
}

Graph GraphLoader::fromDirectory(const fs::path& migrationsDir) {
    if (!fs::is_directory(migrationsDir))
        throw std::runtime_error("Migrations path is not a directory: " + migrationsDir.string());

    Graph graph;
    for (const auto& nsDir : sortedChildren(migrationsDir, true)) {
        const auto ns = nsDir.filename().string();
        for (const auto& file : sortedChildren(nsDir, false)) {
            std::ifstream in(file);
            if (!in.is_open()) throw std::runtime_error("Failed to open migration file: " + file.string());
            std::vector<MigrationId> replaces;
            try {
                replaces = parseReplacesHeader(in);
            } catch (const std::invalid_argument& e) {
                throw std::runtime_error("Invalid replaces header in migration file " + file.string() + ": " + e.what());
            }
            insertEntry(graph, GraphEntry({ns, file.stem().string()}, std::move(replaces)), file.string());
        }
    }
    return graph;
}

std::vector<MigrationId> GraphLoader::parseReplacesHeader(std::istream& sql) {
    std::vector<MigrationId> replaces;
    std::string line;

    while (std::getline(sql, line)) {
        auto sv = trim(line);
        if (sv.empty()) continue;
        if (!sv.starts_with("--")) break; // header ends at the first statement

        sv = trim(sv.substr(2));
        if (!sv.starts_with(REPLACES_TAG)) continue;
        sv.remove_prefix(REPLACES_TAG.size());

        while (!sv.empty()) {
            const auto comma = sv.find(',');
            const auto token = trim(sv.substr(0, comma));
            if (!token.empty()) replaces.push_back(parseMigrationId(std::string(token)));
            if (comma == std::string_view::npos) break;
            sv.remove_prefix(comma + 1);
        }
    }

    return replaces;
}

}
