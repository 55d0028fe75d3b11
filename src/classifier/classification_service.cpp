#include "classifier/classification_service.hpp"
#include "classifier/response_normalizer.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace promptguard {

// ============================================================================
// Construction
// ============================================================================

ClassificationService::ClassificationService(Config config,
                                             std::shared_ptr<ILlmProvider> provider,
                                             std::shared_ptr<IRecordStore> store,
                                             const PromptTemplateRegistry& templates)
    : config_(std::move(config)),
      provider_(std::move(provider)),
      store_(std::move(store)),
      templates_(templates) {
    if (!provider_) {
        throw std::invalid_argument("ClassificationService requires an LLM provider");
    }
}

// ============================================================================
// Pipeline
// ============================================================================

ClassificationResult ClassificationService::classify(const ClassificationRequest& request) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    // 1. Defaults (absent or empty)
    const std::string model_version = (request.model_version && !request.model_version->empty())
        ? *request.model_version : config_.default_model;
    const std::string prompt_version = (request.prompt_version && !request.prompt_version->empty())
        ? *request.prompt_version : config_.default_prompt_version;

    // 2. Provider check (before any network call)
    if (request.provider && *request.provider != config_.supported_provider) {
        rejected_requests_.fetch_add(1, std::memory_order_relaxed);
        throw UnsupportedProvider(std::format(
            "Provider '{}' is not supported. Only '{}' is available.",
            *request.provider, config_.supported_provider));
    }

    // 3-4. Template
    const IPromptTemplate* tmpl = nullptr;
    try {
        tmpl = &templates_.get(prompt_version);
    } catch (const UnknownTemplateVersion&) {
        rejected_requests_.fetch_add(1, std::memory_order_relaxed);
        throw;
    }
    const auto prompt = tmpl->render(request.text);

    // 5. Provider call
    std::string raw_response;
    try {
        raw_response = provider_->complete(prompt, model_version, request.timeout);
    } catch (const ProviderError&) {
        provider_failures_.fetch_add(1, std::memory_order_relaxed);
        throw;
    }

    // 6. Normalize
    auto verdict = ResponseNormalizer::normalize(raw_response);
    if (verdict.confidence == ResponseNormalizer::kParseFailureConfidence) {
        parse_failures_.fetch_add(1, std::memory_order_relaxed);
    } else if (verdict.classification == Classification::MALICIOUS) {
        malicious_.fetch_add(1, std::memory_order_relaxed);
    }

    // 7. Identity
    ClassificationResult result;
    result.request_id = utils::generate_uuid();
    result.timestamp = utils::now();

    utils::log::info(std::format(
        "Classification {}: {} (confidence={}, severity='{}', model={}, prompt={})",
        result.request_id, classification_to_string(verdict.classification),
        verdict.confidence, severity_to_string(verdict.severity),
        model_version, prompt_version));

    // 8. Best-effort record
    if (store_) {
        ClassificationRecord rec;
        rec.request_id = result.request_id;
        rec.input_text = request.text;
        rec.classification = verdict.classification;
        rec.confidence = verdict.confidence;
        rec.model_version = model_version;
        rec.prompt_version = prompt_version;
        rec.raw_response = verdict.raw_response;
        rec.created_at = result.timestamp;
        record(rec);
    }

    // 9. Result
    result.text = request.text;
    result.classification = verdict.classification;
    result.confidence = verdict.confidence;
    result.reasoning = std::move(verdict.reasoning);
    result.severity = verdict.severity;
    result.model_version = model_version;
    result.prompt_version = prompt_version;
    return result;
}

void ClassificationService::record(const ClassificationRecord& rec) {
    try {
        store_->append(rec);
    } catch (const std::exception& e) {
        persistence_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Database logging error ({}) for request {}: {}",
                                      store_->name(), rec.request_id, e.what()));
    }
}

ClassificationVerdict ClassificationService::reprocess(const std::string& raw_response,
                                                       const std::string& prompt_version,
                                                       const std::string& model_version) const {
    return provider_->reprocess(raw_response, prompt_version, model_version);
}

// ============================================================================
// Stats
// ============================================================================

ClassificationService::Stats ClassificationService::get_stats() const {
    return {
        total_requests_.load(std::memory_order_relaxed),
        rejected_requests_.load(std::memory_order_relaxed),
        provider_failures_.load(std::memory_order_relaxed),
        malicious_.load(std::memory_order_relaxed),
        parse_failures_.load(std::memory_order_relaxed),
        persistence_failures_.load(std::memory_order_relaxed)
    };
}

} // namespace promptguard
