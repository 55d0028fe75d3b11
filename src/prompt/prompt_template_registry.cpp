#include "prompt/prompt_template.hpp"
#include "prompt/builtin_templates.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <stdexcept>

namespace promptguard {

std::unique_ptr<PromptTemplateRegistry> PromptTemplateRegistry::with_builtin_templates() {
    auto registry = std::make_unique<PromptTemplateRegistry>();
    registry->register_template(std::make_unique<DetectorPromptV1>());
    registry->register_template(std::make_unique<DetectorPromptV2>());
    registry->register_template(std::make_unique<DetectorPromptV3>());
    return registry;
}

PromptTemplateRegistry& PromptTemplateRegistry::instance() {
    static const std::unique_ptr<PromptTemplateRegistry> registry = with_builtin_templates();
    return *registry;
}

void PromptTemplateRegistry::register_template(std::unique_ptr<IPromptTemplate> tmpl) {
    if (!tmpl) {
        throw std::invalid_argument("Cannot register a null prompt template");
    }
    auto version = tmpl->version();
    if (version.empty()) {
        throw std::invalid_argument("Prompt template version must not be empty");
    }

    std::unique_lock lock(mutex_);
    if (templates_.contains(version)) {
        throw std::invalid_argument(
            std::format("Prompt version {} is already registered", version));
    }
    templates_.emplace(std::move(version), std::move(tmpl));
}

const IPromptTemplate& PromptTemplateRegistry::get(const std::string& version) const {
    std::shared_lock lock(mutex_);
    const auto it = templates_.find(version);
    if (it == templates_.end()) {
        throw UnknownTemplateVersion(version);
    }
    return *it->second;
}

bool PromptTemplateRegistry::has(const std::string& version) const {
    std::shared_lock lock(mutex_);
    return templates_.contains(version);
}

std::vector<std::string> PromptTemplateRegistry::versions() const {
    std::vector<std::string> result;
    {
        std::shared_lock lock(mutex_);
        result.reserve(templates_.size());
        for (const auto& [version, _] : templates_) {
            result.push_back(version);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace promptguard
