#include "cli/Options.hpp"
#include "config/Config.hpp"

#include <string>
#include <string_view>
#include <fmt/core.h>

namespace sg::cli {

std::optional<Options> parseArgs(const int argc, const char* const* argv) {
    Options opts;
    opts.configPath = config::DEFAULT_CONFIG_PATH;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        const auto matches = [&](const std::string_view flag) {
            return arg == flag || (arg.starts_with(flag) && arg.size() > flag.size() && arg[flag.size()] == '=');
        };
        const auto value = [&](const std::string_view flag) -> std::optional<std::string> {
            if (arg == flag) {
                if (i + 1 >= argc) return std::nullopt;
                return std::string(argv[++i]);
            }
            return std::string(arg.substr(flag.size() + 1)); // --flag=value
        };

        if (arg == "-h" || arg == "--help") opts.help = true;
        else if (arg == "-v" || arg == "--verbose") opts.verbose = true;
        else if (arg == "--json") opts.json = true;
        else if (matches("--config")) {
            const auto v = value("--config");
            if (!v || v->empty()) return std::nullopt;
            opts.configPath = *v;
        } else if (matches("--target")) {
            const auto v = value("--target");
            if (!v || v->empty()) return std::nullopt;
            opts.targetDir = *v;
        } else {
            fmt::print(stderr, "schemaguard: unknown argument '{}'\n", arg);
            return std::nullopt;
        }
    }
    return opts;
}

void printUsage(std::FILE* out) {
    fmt::print(out,
        "usage: schemaguard [--config PATH] [--target DIR] [--json] [-v] [-h]\n"
        "\n"
        "Refuses an upgrade whose target deployment does not account for every\n"
        "database migration already applied, or whose PostgreSQL server is\n"
        "unsupported or differs from the configured version.\n"
        "\n"
        "  --config PATH   configuration file (default {})\n"
        "  --target DIR    deployment to be activated (default: working directory)\n"
        "  --json          print a machine-readable report on stdout\n"
        "  -v, --verbose   log progress to the console\n"
        "  -h, --help      show this help\n",
        config::DEFAULT_CONFIG_PATH);
}

}
