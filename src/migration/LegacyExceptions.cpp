#include "migration/LegacyExceptions.hpp"
#include "migration/GraphLoader.hpp"
#include "log/Registry.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace YAML {

using sg::migration::LegacyExceptionGroup;

template<>
struct convert<LegacyExceptionGroup> {
    // `names` may be a list or a single `name`.
    static bool decode(const Node& node, LegacyExceptionGroup& rhs) {
        if (!node.IsMap() || !node["namespace"]) return false;
        rhs.ns = node["namespace"].as<std::string>();
        rhs.names.clear();
        if (const auto names = node["names"]) {
            if (!names.IsSequence()) return false;
            rhs.names = names.as<std::vector<std::string>>();
        }
        if (const auto name = node["name"]) rhs.names.push_back(name.as<std::string>());
        rhs.reason = node["reason"].as<std::string>("");
        return !rhs.ns.empty() && !rhs.names.empty();
    }
};

}

namespace sg::migration {

namespace {

std::vector<LegacyExceptionGroup> decodeRoot(const YAML::Node& root, const std::string& origin) {
    std::vector<LegacyExceptionGroup> groups;
    if (!root || root.IsNull()) return groups;

    const auto list = root.IsMap() ? root["legacy_exceptions"] : YAML::Node();
    if (!list || list.IsNull()) return groups;
    if (!list.IsSequence())
        throw std::runtime_error("'legacy_exceptions' in " + origin + " must be a list");

    for (const auto& item : list) {
        LegacyExceptionGroup group;
        if (!YAML::convert<LegacyExceptionGroup>::decode(item, group))
            throw std::runtime_error("Invalid legacy exception group in " + origin +
                                     ": each needs a 'namespace' and at least one name");
        groups.push_back(std::move(group));
    }
    return groups;
}

}

std::vector<LegacyExceptionGroup> LegacyExceptions::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        log::Registry::migrations()->debug("[LegacyExceptions] No exception list at {}", path.string());
        return {};
    }

    try {
        return decodeRoot(YAML::LoadFile(path.string()), path.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse " + path.string() + ": " + e.what());
    }
}

std::vector<LegacyExceptionGroup> LegacyExceptions::parse(const std::string& yaml, const std::string& origin) {
    try {
        return decodeRoot(YAML::Load(yaml), origin);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse " + origin + ": " + e.what());
    }
}

model::MigrationSet LegacyExceptions::flatten(const std::vector<LegacyExceptionGroup>& groups) {
    model::MigrationSet out;
    for (const auto& g : groups)
        for (const auto& name : g.names) out.emplace(g.ns, name);
    return out;
}

model::MigrationSet LegacyExceptions::forTarget(const std::filesystem::path& targetDir) {
    const auto set = flatten(load(targetDir / GraphLoader::MIGRATIONS_DIR / FILE_NAME));
    log::Registry::migrations()->debug("[LegacyExceptions] {} legacy exceptions for {}", set.size(), targetDir.string());
    return set;
}

}
