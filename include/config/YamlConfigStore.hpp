#pragma once

#include "gate/ConfigStore.hpp"

#include <filesystem>

namespace sg::config {

/*
 * File-backed gate::ConfigStore over the `postgresql.version` key of the YAML
 * config. Writes edit only that scalar in the file text, keeping comments, and
 * replace the file via a sibling temp file and rename(2), so a
 * reader never observes a partial document. Two processes persisting at once
 * are not serialised; the last rename wins, and both wrote the value they
 * observed from the same server.
 */
class YamlConfigStore final : public gate::ConfigStore {
public:
    explicit YamlConfigStore(std::filesystem::path path);

    [[nodiscard]] std::optional<unsigned int> configuredMajorVersion() const override;
    void persistMajorVersion(unsigned int version) override;

private:
    std::filesystem::path path_;
};

}
