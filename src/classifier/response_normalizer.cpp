#include "classifier/response_normalizer.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

namespace promptguard {

using json = nlohmann::json;

// ============================================================================
// Public entry points
// ============================================================================

ClassificationVerdict ResponseNormalizer::normalize(std::string_view raw_response) {
    try {
        return parse(raw_response);
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Failed to parse LLM response ({}): {}",
                                     e.what(), utils::truncate(raw_response, 200)));
        ClassificationVerdict verdict;
        verdict.classification = Classification::BENIGN;
        verdict.confidence = kParseFailureConfidence;
        verdict.reasoning = std::string(kParseFailureReasoning);
        verdict.severity = Severity::NONE;
        verdict.raw_response = std::string(raw_response);
        return verdict;
    }
}

ClassificationVerdict ResponseNormalizer::reprocess(std::string_view raw_response) {
    try {
        return parse(raw_response);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Error processing LLM response: {}", e.what()));
        ClassificationVerdict verdict;
        verdict.classification = Classification::ERROR;
        verdict.confidence = 0.0;
        verdict.reasoning = std::string(kReprocessFailurePrefix) + e.what();
        verdict.severity = Severity::NONE;
        verdict.raw_response = std::string(raw_response);
        return verdict;
    }
}

Severity ResponseNormalizer::derive_severity(double confidence) {
    if (confidence >= kHighSeverityThreshold) return Severity::HIGH;
    if (confidence >= kMediumSeverityThreshold) return Severity::MEDIUM;
    return Severity::LOW;
}

// ============================================================================
// Parsing
// ============================================================================

std::string_view ResponseNormalizer::strip_code_fence(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\n\r");
    if (first == std::string_view::npos) return text;
    text.remove_prefix(first);
    const auto last = text.find_last_not_of(" \t\n\r");
    text = text.substr(0, last + 1);

    if (!text.starts_with("```") || text.size() < 6 || !text.ends_with("```")) {
        return text;
    }
    const auto body_start = text.find('\n');
    if (body_start == std::string_view::npos) return text;
    return text.substr(body_start + 1, text.size() - 3 - (body_start + 1));
}

ClassificationVerdict ResponseNormalizer::parse(std::string_view raw_response) {
    const auto body = strip_code_fence(raw_response);
    const json doc = json::parse(body.begin(), body.end());

    if (!doc.is_object()) {
        throw std::runtime_error(
            std::format("expected a JSON object, got {}", doc.type_name()));
    }

    ClassificationVerdict verdict;
    verdict.raw_response = std::string(raw_response);

    // classification: default benign
    if (const auto it = doc.find("classification"); it != doc.end() && !it->is_null()) {
        if (!it->is_string()) {
            throw std::runtime_error("'classification' is not a string");
        }
        const auto label = utils::to_lower(utils::trim(it->get<std::string>()));
        const auto parsed = parse_classification(label);
        if (!parsed || *parsed == Classification::ERROR) {
            throw std::runtime_error(
                std::format("unknown classification '{}'", label));
        }
        verdict.classification = *parsed;
    }

    // confidence: default 0.0, clamped into [0, 1]
    if (const auto it = doc.find("confidence"); it != doc.end() && !it->is_null()) {
        if (!it->is_number()) {
            throw std::runtime_error("'confidence' is not a number");
        }
        const double value = it->get<double>();
        if (!std::isfinite(value)) {
            throw std::runtime_error("'confidence' is not finite");
        }
        verdict.confidence = std::clamp(value, 0.0, 1.0);
    }

    // reasoning: default text
    verdict.reasoning = std::string(kDefaultReasoning);
    if (const auto it = doc.find("reasoning"); it != doc.end() && !it->is_null()) {
        if (!it->is_string()) {
            throw std::runtime_error("'reasoning' is not a string");
        }
        verdict.reasoning = it->get<std::string>();
    }

    // severity: only meaningful for malicious verdicts
    if (verdict.classification == Classification::MALICIOUS) {
        std::optional<Severity> provided;
        if (const auto it = doc.find("severity"); it != doc.end() && it->is_string()) {
            provided = parse_severity(utils::to_lower(utils::trim(it->get<std::string>())));
        }
        verdict.severity = (provided && *provided != Severity::NONE)
            ? *provided
            : derive_severity(verdict.confidence);
    }

    return verdict;
}

} // namespace promptguard
