#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace promptguard {

/**
 * @brief Versioned detection prompt
 *
 * Implementations are stateless: render() must return byte-identical output
 * for identical input. The wording of a released version never changes; a new
 * wording is a new version.
 */
class IPromptTemplate {
public:
    virtual ~IPromptTemplate() = default;

    /// Version identifier, e.g. "v1"
    [[nodiscard]] virtual std::string version() const = 0;

    /// Full instruction prompt embedding the text under analysis.
    [[nodiscard]] virtual std::string render(std::string_view text) const = 0;
};

/**
 * @brief Version -> template lookup
 *
 * Populated at startup (built-in templates come pre-registered via
 * with_builtin_templates()). Lookups are safe to run concurrently with each
 * other; registration is expected to finish before the first request.
 *
 * Usage:
 *   auto registry = PromptTemplateRegistry::with_builtin_templates();
 *   const auto prompt = registry->get("v2").render(text);
 */
class PromptTemplateRegistry {
public:
    PromptTemplateRegistry() = default;

    PromptTemplateRegistry(const PromptTemplateRegistry&) = delete;
    PromptTemplateRegistry& operator=(const PromptTemplateRegistry&) = delete;
    PromptTemplateRegistry(PromptTemplateRegistry&&) = delete;
    PromptTemplateRegistry& operator=(PromptTemplateRegistry&&) = delete;

    /// Registry holding v1, v2 and v3.
    [[nodiscard]] static std::unique_ptr<PromptTemplateRegistry> with_builtin_templates();

    /// Process-wide registry with the built-in templates.
    static PromptTemplateRegistry& instance();

    /**
     * @brief Add a template under its version()
     * @throws std::invalid_argument if the version is empty or already registered
     */
    void register_template(std::unique_ptr<IPromptTemplate> tmpl);

    /**
     * @brief Look up a template
     * @throws UnknownTemplateVersion if no template has this version
     */
    [[nodiscard]] const IPromptTemplate& get(const std::string& version) const;

    [[nodiscard]] bool has(const std::string& version) const;

    /// Registered versions, sorted.
    [[nodiscard]] std::vector<std::string> versions() const;

private:
    std::unordered_map<std::string, std::unique_ptr<IPromptTemplate>> templates_;
    mutable std::shared_mutex mutex_;
};

} // namespace promptguard
