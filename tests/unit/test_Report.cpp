#include <gtest/gtest.h>
#include "report/Report.hpp"
#include "check/Errors.hpp"
#include "deploy/Deployment.hpp"
#include "TempDir.hpp"

#include <nlohmann/json.hpp>

using namespace sg;
using sg::test::TempDir;

namespace {

migration::ReconciliationResult missingOf(std::vector<migration::model::MigrationId> ids) {
    migration::ReconciliationResult r;
    r.missing = std::move(ids);
    return r;
}

}

TEST(ReportTest, IncompatibilityLinesListEachMissingMigration) {
    const check::MigrationIncompatibility e(missingOf({{"analytics", "0020"}, {"zerver", "0500_x"}}),
                                            "8.4", "9.0", "/srv/deployments/next");
    const auto lines = report::incompatibilityLines(e);

    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], report::MISSING_HEADER);
    EXPECT_EQ(lines[1], "  analytics 0020");
    EXPECT_EQ(lines[2], "  zerver 0500_x");
    EXPECT_EQ(lines[3], "This is not an upgrade -- the current deployment (version 8.4) contains 2 database "
                        "migrations which /srv/deployments/next (version 9.0) does not.");
}

TEST(ReportTest, JsonReport) {
    const runtime::Report r{missingOf({{"zerver", "0500_x"}}), "8.4", "9.0"};
    const auto j = report::toJson(r);

    EXPECT_FALSE(j.at("compatible").get<bool>());
    ASSERT_EQ(j.at("missing").size(), 1u);
    EXPECT_EQ(j.at("missing")[0].at("namespace").get<std::string>(), "zerver");
    EXPECT_EQ(j.at("missing")[0].at("name").get<std::string>(), "0500_x");
    EXPECT_EQ(j.at("current_version").get<std::string>(), "8.4");
    EXPECT_EQ(j.at("target_version").get<std::string>(), "9.0");

    EXPECT_TRUE(report::toJson({{}, "9.0", "9.0"}).at("compatible").get<bool>());
}

TEST(ReportTest, LogFailureAcceptsEveryErrorKind) {
    EXPECT_NO_THROW(report::logFailure(check::ConfigurationMismatch(13, 14)));
    EXPECT_NO_THROW(report::logFailure(check::UnsupportedEngineVersion(11, 12)));
    EXPECT_NO_THROW(report::logFailure(check::MigrationIncompatibility(missingOf({{"a", "1"}}), "1", "2", "/t")));
}

TEST(DeploymentTest, ReadVersionTrimsFirstLine) {
    TempDir dir;
    dir.write("VERSION", "  9.0-rc1 \r\nsecond line\n");
    EXPECT_EQ(deploy::readVersion(dir.path()), "9.0-rc1");
}

TEST(DeploymentTest, ReadVersionFallsBackToUnknown) {
    TempDir dir;
    EXPECT_EQ(deploy::readVersion(dir.path()), deploy::UNKNOWN_VERSION);
    dir.write("VERSION", "\n");
    EXPECT_EQ(deploy::readVersion(dir.path()), deploy::UNKNOWN_VERSION);
    dir.write("ZULIP_VERSION", "10.1\n");
    EXPECT_EQ(deploy::readVersion(dir.path(), "ZULIP_VERSION"), "10.1");
}

TEST(MigrationIdTest, ParseDottedIdentifiers) {
    EXPECT_EQ(migration::model::parseMigrationId("zerver.0001_initial"),
              migration::model::MigrationId("zerver", "0001_initial"));
    // Only the first dot separates namespace from name.
    EXPECT_EQ(migration::model::parseMigrationId("app.0002_v1.2").name, "0002_v1.2");
    EXPECT_THROW((void)migration::model::parseMigrationId("nodot"), std::invalid_argument);
    EXPECT_THROW((void)migration::model::parseMigrationId(".x"), std::invalid_argument);
    EXPECT_THROW((void)migration::model::parseMigrationId("x."), std::invalid_argument);
}
