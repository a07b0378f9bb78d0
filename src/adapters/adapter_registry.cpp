#include "adapters/adapter_registry.hpp"

#include "adapters/python_adapter.hpp"
#include "adapters/r_adapter.hpp"
#include "utils/logging.hpp"

namespace vizrun::adapters {

void AdapterRegistry::Register(std::unique_ptr<RuntimeAdapter> adapter) {
    const auto language = adapter->GetLanguage();
    adapters_[language] = std::move(adapter);
}

const RuntimeAdapter* AdapterRegistry::Get(execution::Language language) const {
    auto it = adapters_.find(language);
    if (it == adapters_.end()) {
        return nullptr;
    }
    return it->second.get();
}

bool AdapterRegistry::Has(execution::Language language) const {
    return adapters_.find(language) != adapters_.end();
}

std::vector<execution::Language> AdapterRegistry::List() const {
    std::vector<execution::Language> languages;
    for (const auto& [language, _] : adapters_) {
        languages.push_back(language);
    }
    return languages;
}

AdapterRegistry CreateDefaultRegistry(const config::RuntimesConfig& runtimes) {
    AdapterRegistry registry;
    if (runtimes.python.enabled) {
        registry.Register(std::make_unique<PythonAdapter>(runtimes.python.command));
    }
    if (runtimes.r.enabled) {
        registry.Register(std::make_unique<RAdapter>(runtimes.r.command));
    }
    for (const auto language : registry.List()) {
        utils::LogDebug("adapter", "registered", {{"language", execution::ToString(language)}});
    }
    return registry;
}

}  // namespace vizrun::adapters
