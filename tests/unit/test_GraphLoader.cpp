#include <gtest/gtest.h>
#include "migration/GraphLoader.hpp"
#include "TempDir.hpp"

#include <sstream>

using namespace sg::migration;
using namespace sg::migration::model;
using sg::test::TempDir;

TEST(GraphLoaderTest, ManifestEntriesWithBothReplacesForms) {
    std::istringstream in(R"({
        "migrations": [
            {"namespace": "zerver", "name": "0001_initial"},
            {"namespace": "zerver", "name": "0002_squashed",
             "replaces": [["zerver", "0002_a"], {"namespace": "zerver", "name": "0003_b"}]}
        ]
    })");

    const auto graph = GraphLoader::fromManifest(in);
    ASSERT_EQ(graph.size(), 2u);
    EXPECT_TRUE(graph.at({"zerver", "0001_initial"}).replaces.empty());

    const auto& squashed = graph.at({"zerver", "0002_squashed"});
    const std::vector<MigrationId> expected{{"zerver", "0002_a"}, {"zerver", "0003_b"}};
    EXPECT_EQ(squashed.replaces, expected);
}

TEST(GraphLoaderTest, ManifestDuplicateKeyIsRejected) {
    std::istringstream in(R"({"migrations": [
        {"namespace": "app", "name": "0001"},
        {"namespace": "app", "name": "0001", "replaces": [["app", "0000"]]}
    ]})");
    EXPECT_THROW((void)GraphLoader::fromManifest(in), std::runtime_error);
}

TEST(GraphLoaderTest, MalformedManifestsAreRejected) {
    std::istringstream notJson("{ migrations: ");
    EXPECT_THROW((void)GraphLoader::fromManifest(notJson), std::runtime_error);

    std::istringstream noList(R"({"entries": []})");
    EXPECT_THROW((void)GraphLoader::fromManifest(noList), std::runtime_error);

    std::istringstream badReplaces(R"({"migrations": [{"namespace": "a", "name": "1", "replaces": [["a"]]}]})");
    EXPECT_THROW((void)GraphLoader::fromManifest(badReplaces), std::runtime_error);

    std::istringstream emptyName(R"({"migrations": [{"namespace": "a", "name": ""}]})");
    EXPECT_THROW((void)GraphLoader::fromManifest(emptyName), std::runtime_error);
}

TEST(GraphLoaderTest, ReplacesHeaderParsing) {
    std::istringstream sql(
        "-- Squash of the early auth tables\n"
        "--   replaces: zerver.0001_initial, zerver.0002_django_1_8\n"
        "\n"
        "-- replaces: zerver.0003_custom_indexes\n"
        "CREATE TABLE foo (id int);\n"
        "-- replaces: zerver.9999_ignored_after_statements\n");

    const auto replaces = GraphLoader::parseReplacesHeader(sql);
    const std::vector<MigrationId> expected{
        {"zerver", "0001_initial"}, {"zerver", "0002_django_1_8"}, {"zerver", "0003_custom_indexes"}};
    EXPECT_EQ(replaces, expected);
}

TEST(GraphLoaderTest, ReplacesHeaderRejectsUndottedIds) {
    std::istringstream sql("-- replaces: 0001_initial\n");
    EXPECT_THROW((void)GraphLoader::parseReplacesHeader(sql), std::invalid_argument);
}

TEST(GraphLoaderTest, DirectoryLayoutOneNamespacePerSubdirectory) {
    TempDir dir;
    dir.write("migrations/zerver/0001_initial.sql", "CREATE TABLE a (id int);\n");
    dir.write("migrations/zerver/0002_squashed.sql", "-- replaces: zerver.0002_x, zerver.0003_y\nSELECT 1;\n");
    dir.write("migrations/analytics/0001_initial.sql", "SELECT 1;\n");
    dir.write("migrations/analytics/README.md", "not a migration\n");
    dir.write("migrations/legacy_exceptions.yaml", "legacy_exceptions: []\n");

    const auto graph = GraphLoader::load(dir.path());
    ASSERT_EQ(graph.size(), 3u);
    EXPECT_TRUE(graph.contains({"analytics", "0001_initial"}));
    EXPECT_TRUE(graph.contains({"zerver", "0001_initial"}));

    const std::vector<MigrationId> expected{{"zerver", "0002_x"}, {"zerver", "0003_y"}};
    EXPECT_EQ(graph.at({"zerver", "0002_squashed"}).replaces, expected);
}

TEST(GraphLoaderTest, MalformedReplacesHeaderNamesTheFile) {
    TempDir dir;
    dir.write("migrations/zerver/0001_initial.sql", "SELECT 1;\n");
    const auto bad = dir.write("migrations/zerver/0002_squashed.sql", "-- replaces: 0001_initial\nSELECT 1;\n");

    try {
        (void)GraphLoader::load(dir.path());
        FAIL() << "expected a malformed replaces header to be rejected";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find(bad.string()), std::string::npos) << e.what();
        EXPECT_NE(std::string(e.what()).find("0001_initial"), std::string::npos) << e.what();
    }
}

TEST(GraphLoaderTest, ManifestTakesPrecedenceOverDirectory) {
    TempDir dir;
    dir.write("migrations/zerver/0001_initial.sql", "SELECT 1;\n");
    dir.write("migrations/manifest.json", R"({"migrations": [{"namespace": "app", "name": "0001"}]})");

    const auto graph = GraphLoader::load(dir.path());
    ASSERT_EQ(graph.size(), 1u);
    EXPECT_TRUE(graph.contains({"app", "0001"}));
}

TEST(GraphLoaderTest, MissingMigrationsDirectoryIsAnError) {
    TempDir dir;
    EXPECT_THROW((void)GraphLoader::load(dir.path()), std::runtime_error);
}
