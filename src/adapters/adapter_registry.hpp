#pragma once

#include <map>
#include <memory>
#include <vector>

#include "adapters/runtime_adapter.hpp"
#include "config/config_schema.hpp"

namespace vizrun::adapters {

class AdapterRegistry {
public:
    void Register(std::unique_ptr<RuntimeAdapter> adapter);
    const RuntimeAdapter* Get(execution::Language language) const;
    bool Has(execution::Language language) const;
    std::vector<execution::Language> List() const;

private:
    std::map<execution::Language, std::unique_ptr<RuntimeAdapter>> adapters_;
};

// Registers an adapter for every runtime enabled in the configuration.
AdapterRegistry CreateDefaultRegistry(const config::RuntimesConfig& runtimes);

}  // namespace vizrun::adapters
