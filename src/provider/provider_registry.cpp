#include "provider/provider_registry.hpp"
#include "core/error.hpp"

#include <format>
#include <stdexcept>

namespace promptguard {

// ============================================================================
// ProviderRegistry
// ============================================================================

ProviderRegistry& ProviderRegistry::instance() {
    static ProviderRegistry registry;
    return registry;
}

void ProviderRegistry::register_provider(const std::string& name, Factory factory) {
    if (name.empty()) {
        throw std::invalid_argument("Provider name must not be empty");
    }
    if (!factory) {
        throw std::invalid_argument(std::format("Provider '{}' registered without a factory", name));
    }
    factories_[name] = std::move(factory);
}

std::unique_ptr<ILlmProvider> ProviderRegistry::create(const std::string& name,
                                                       const LlmConfig& config) const {
    const auto it = factories_.find(name);
    if (it == factories_.end()) {
        std::string available;
        for (const auto& [registered, _] : factories_) {
            if (!available.empty()) available += ", ";
            available += registered;
        }
        throw UnsupportedProvider(std::format(
            "Provider '{}' not found. Available providers: {}", name, available));
    }
    auto provider = it->second(config);
    if (!provider) {
        throw std::runtime_error(std::format("Provider factory for '{}' returned null", name));
    }
    return provider;
}

bool ProviderRegistry::has_provider(const std::string& name) const {
    return factories_.contains(name);
}

std::vector<std::string> ProviderRegistry::provider_names() const {
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& [name, _] : factories_) {
        names.push_back(name);
    }
    return names;
}

} // namespace promptguard
