#include "report/Report.hpp"
#include "check/Errors.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace sg::report {

std::vector<std::string> incompatibilityLines(const check::MigrationIncompatibility& e) {
    std::vector<std::string> lines;
    lines.reserve(e.result.missing.size() + 2);
    lines.emplace_back(MISSING_HEADER);
    for (const auto& id : e.result.missing) lines.push_back(fmt::format("  {} {}", id.ns, id.name));
    lines.emplace_back(e.what());
    return lines;
}

void logFailure(const check::CheckError& e) {
    if (const auto* m = dynamic_cast<const check::MigrationIncompatibility*>(&e)) {
        for (const auto& line : incompatibilityLines(*m)) log::Registry::migrations()->error("{}", line);
        return;
    }

    const auto logger = log::Registry::gate();
    logger->critical("{}", e.what());

    if (const auto* mm = dynamic_cast<const check::ConfigurationMismatch*>(&e))
        logger->critical("Verify that the database is the intended cluster, then set postgresql.version to {} "
                         "in the configuration file by hand.", mm->observed);
    else if (const auto* u = dynamic_cast<const check::UnsupportedEngineVersion*>(&e))
        logger->critical("Upgrade PostgreSQL to version {} or newer before upgrading.", u->minimum);
}

nlohmann::json toJson(const runtime::Report& report) {
    nlohmann::json j = report.result;
    j["current_version"] = report.currentVersion;
    j["target_version"] = report.targetVersion;
    return j;
}

}
