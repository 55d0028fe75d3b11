#pragma once

#include "config/config_types.hpp"
#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace promptguard {

/// System instruction sent alongside every rendered detection prompt.
inline constexpr const char* kDetectorSystemPrompt =
    "You are a cybersecurity assistant that detects prompt injection attacks.";

/**
 * @brief LLM backend capable of producing a raw classification completion
 *
 * One implementation per backend, registered by name in ProviderRegistry.
 * Implementations must be safe to call from several request threads at once.
 */
class ILlmProvider {
public:
    virtual ~ILlmProvider() = default;

    /// Registry name, e.g. "openai"
    [[nodiscard]] virtual std::string name() const = 0;

    /**
     * @brief Send the detector system prompt plus @p prompt to the model
     * @param prompt Rendered detection prompt (user message)
     * @param model Model identifier; empty = provider default
     * @param timeout Per-call bound; nullopt = provider default
     * @return Raw completion text
     * @throws ProviderError on transport, auth, quota or protocol failure
     */
    [[nodiscard]] virtual std::string complete(
        const std::string& prompt,
        const std::string& model,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt) = 0;

    /**
     * @brief Normalize previously stored raw text (audits, evaluation runs)
     *
     * Same rules as a fresh classification, but a failure yields the
     * "error" verdict shape instead of the -1.0 confidence sentinel.
     */
    [[nodiscard]] virtual ClassificationVerdict reprocess(
        const std::string& raw_response,
        const std::string& prompt_version,
        const std::string& model_version) const;
};

} // namespace promptguard
