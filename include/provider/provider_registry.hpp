#pragma once

#include "provider/llm_provider.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace promptguard {

/**
 * @brief Registry for LLM providers
 *
 * Providers are registered by name during startup, before the first request
 * is served; afterwards the registry is only read.
 *
 * Usage:
 *   // Registration (in main.cpp):
 *   ProviderRegistry::instance().register_provider(
 *       "openai", [](const LlmConfig& c) { return std::make_unique<OpenAiProvider>(c); });
 *
 *   // Creation:
 *   auto provider = ProviderRegistry::instance().create("openai", config.llm);
 */
class ProviderRegistry {
public:
    using Factory = std::function<std::unique_ptr<ILlmProvider>(const LlmConfig&)>;

    static ProviderRegistry& instance();

    void register_provider(const std::string& name, Factory factory);

    /**
     * @brief Construct a provider by name
     * @throws UnsupportedProvider if nothing is registered under @p name
     */
    [[nodiscard]] std::unique_ptr<ILlmProvider> create(const std::string& name,
                                                       const LlmConfig& config) const;

    [[nodiscard]] bool has_provider(const std::string& name) const;

    /// Registered names, sorted.
    [[nodiscard]] std::vector<std::string> provider_names() const;

private:
    std::map<std::string, Factory> factories_;
};

} // namespace promptguard
