#pragma once

#include "core/types.hpp"
#include "prompt/prompt_template.hpp"
#include "provider/llm_provider.hpp"
#include "storage/record_store.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace promptguard {

/**
 * @brief Classification pipeline: template -> provider -> normalizer -> record
 *
 * classify() stages:
 *   1. resolve default model / prompt version
 *   2. reject a provider name other than the supported one (UnsupportedProvider)
 *   3. look up the prompt template (UnknownTemplateVersion)
 *   4. render the prompt
 *   5. call the provider (ProviderError propagates)
 *   6. normalize the raw completion
 *   7. assign request id and timestamp
 *   8. append a ClassificationRecord to the store; failures are logged only
 *   9. assemble the result
 *
 * Stages 2, 3 and 5 are the only ones that throw. The service keeps no
 * per-request state and may be called concurrently.
 */
class ClassificationService {
public:
    struct Config {
        std::string default_model = "gpt-4.1-nano";
        std::string default_prompt_version = "v1";
        std::string supported_provider = "openai";
    };

    /**
     * @param provider Backend used for every request (required)
     * @param store Record destination; nullptr disables persistence
     * @param templates Prompt templates; must outlive the service
     */
    ClassificationService(Config config,
                          std::shared_ptr<ILlmProvider> provider,
                          std::shared_ptr<IRecordStore> store = nullptr,
                          const PromptTemplateRegistry& templates = PromptTemplateRegistry::instance());

    [[nodiscard]] ClassificationResult classify(const ClassificationRequest& request);

    /// Normalize stored raw text through the provider's reprocessing path.
    [[nodiscard]] ClassificationVerdict reprocess(const std::string& raw_response,
                                                  const std::string& prompt_version,
                                                  const std::string& model_version) const;

    [[nodiscard]] const Config& config() const { return config_; }

    struct Stats {
        uint64_t total_requests = 0;
        uint64_t rejected_requests = 0;
        uint64_t provider_failures = 0;
        uint64_t malicious = 0;
        uint64_t parse_failures = 0;
        uint64_t persistence_failures = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    void record(const ClassificationRecord& rec);

    Config config_;
    std::shared_ptr<ILlmProvider> provider_;
    std::shared_ptr<IRecordStore> store_;
    const PromptTemplateRegistry& templates_;

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> rejected_requests_{0};
    std::atomic<uint64_t> provider_failures_{0};
    std::atomic<uint64_t> malicious_{0};
    std::atomic<uint64_t> parse_failures_{0};
    std::atomic<uint64_t> persistence_failures_{0};
};

} // namespace promptguard
