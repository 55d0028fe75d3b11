#include "provider/llm_provider.hpp"
#include "classifier/response_normalizer.hpp"
#include "core/utils.hpp"

#include <format>

namespace promptguard {

ClassificationVerdict ILlmProvider::reprocess(
    const std::string& raw_response,
    const std::string& prompt_version,
    const std::string& model_version) const {
    utils::log::debug(std::format("Reprocessing stored response (provider={}, prompt={}, model={})",
                                  name(), prompt_version, model_version));
    return ResponseNormalizer::reprocess(raw_response);
}

} // namespace promptguard
