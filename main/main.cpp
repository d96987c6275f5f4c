// CLI
#include "cli/Options.hpp"

// Config
#include "config/ConfigRegistry.hpp"
#include "config/YamlConfigStore.hpp"

// Database
#include "db/Transactions.hpp"
#include "db/PostgresProbe.hpp"

// Checks
#include "check/Errors.hpp"
#include "deploy/Deployment.hpp"
#include "report/Report.hpp"
#include "runtime/Checker.hpp"

// Misc
#include "log/Registry.hpp"

// Libraries
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace sg::config;
using namespace sg::runtime;
using sg::cli::EXIT_USAGE;

int main(int argc, char** argv) {
    const auto opts = sg::cli::parseArgs(argc, argv);
    if (!opts) {
        sg::cli::printUsage(stderr);
        return EXIT_USAGE;
    }
    if (opts->help) {
        sg::cli::printUsage(stdout);
        return EXIT_SUCCESS;
    }

    try {
        ConfigRegistry::init(opts->configPath);
        sg::log::Registry::init(ConfigRegistry::get().logging);
    } catch (const std::exception& e) {
        fmt::print(stderr, "[-] Failed to initialize schemaguard: {}\n", e.what());
        return EXIT_FAILURE;
    }

    if (opts->verbose) sg::log::Registry::setConsoleLevel(spdlog::level::debug);

    const auto& cnf = ConfigRegistry::get();

    try {
        const auto target = opts->targetDir.empty() ? std::filesystem::current_path()
                                                    : std::filesystem::absolute(opts->targetDir);

        sg::db::Transactions::init(cnf.database);
        sg::db::PostgresProbe probe(cnf.migrations);
        YamlConfigStore store(cnf.source);

        const Checker checker(probe, store, {target, sg::deploy::currentDeployment(cnf.deployment),
                                             cnf.deployment.version_file});
        const auto report = checker.run();

        sg::db::Transactions::shutdown();
        if (opts->json) fmt::print("{}\n", sg::report::toJson(report).dump(2));
        return EXIT_SUCCESS;
    } catch (const sg::check::MigrationIncompatibility& e) {
        sg::report::logFailure(e);
        if (opts->json)
            fmt::print("{}\n", sg::report::toJson({e.result, e.currentVersion, e.targetVersion}).dump(2));
    } catch (const sg::check::CheckError& e) {
        sg::report::logFailure(e);
    } catch (const std::exception& e) {
        sg::log::Registry::schemaguard()->error("[-] {}", e.what());
    }

    sg::db::Transactions::shutdown();
    return EXIT_FAILURE;
}
