#include "check/Errors.hpp"

#include <fmt/core.h>

namespace sg::check {

ConfigurationMismatch::ConfigurationMismatch(const unsigned int configured, const unsigned int observed)
    : CheckError(fmt::format("Configured PostgreSQL version {} does not match the running PostgreSQL version {}",
                             configured, observed)),
      configured(configured), observed(observed) {}

UnsupportedEngineVersion::UnsupportedEngineVersion(const unsigned int observed, const unsigned int minimum)
    : CheckError(fmt::format("PostgreSQL {} is not supported; upgrades require PostgreSQL {} or newer",
                             observed, minimum)),
      observed(observed), minimum(minimum) {}

MigrationIncompatibility::MigrationIncompatibility(migration::ReconciliationResult result,
                                                   std::string currentVersion,
                                                   std::string targetVersion,
                                                   std::filesystem::path targetPath)
    : CheckError(fmt::format("This is not an upgrade -- the current deployment (version {}) contains {} database "
                             "migrations which {} (version {}) does not.",
                             currentVersion, result.missing.size(), targetPath.string(), targetVersion)),
      result(std::move(result)),
      currentVersion(std::move(currentVersion)),
      targetVersion(std::move(targetVersion)),
      targetPath(std::move(targetPath)) {}

}
