#pragma once

#include "gate/ConfigStore.hpp"

#include <vector>

namespace sg::test {

class FakeConfigStore final : public gate::ConfigStore {
public:
    explicit FakeConfigStore(std::optional<unsigned int> configured = std::nullopt) : configured_(configured) {}

    [[nodiscard]] std::optional<unsigned int> configuredMajorVersion() const override { return configured_; }

    void persistMajorVersion(const unsigned int version) override {
        persisted.push_back(version);
        configured_ = version;
    }

    std::vector<unsigned int> persisted;

private:
    std::optional<unsigned int> configured_;
};

}
