#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace promptguard {

// ============================================================================
// Basic Enums
// ============================================================================

enum class Classification {
    BENIGN,
    MALICIOUS,
    ERROR       // reprocessing failed; never produced by a fresh classification
};

enum class Severity {
    NONE,       // serialized as ""
    LOW,
    MEDIUM,
    HIGH
};

// ============================================================================
// Verdict
// ============================================================================

/**
 * @brief Structured outcome of one classification, built by ResponseNormalizer.
 *
 * confidence is in [0, 1] for a parsed response; -1.0 marks a response that
 * could not be parsed on the fresh classification path.
 */
struct ClassificationVerdict {
    Classification classification = Classification::BENIGN;
    double confidence = 0.0;
    std::string reasoning;
    Severity severity = Severity::NONE;
    std::string raw_response;
};

// ============================================================================
// Persisted Record
// ============================================================================

struct ClassificationRecord {
    std::string request_id;
    std::string input_text;
    Classification classification = Classification::BENIGN;
    double confidence = 0.0;
    std::string model_version;
    std::string prompt_version;
    std::string raw_response;
    std::chrono::system_clock::time_point created_at;
};

// ============================================================================
// Service Request / Result
// ============================================================================

struct ClassificationRequest {
    std::string text;
    std::optional<std::string> model_version;
    std::optional<std::string> prompt_version;
    std::optional<std::string> provider;
    std::optional<std::chrono::milliseconds> timeout;   // nullopt = provider default
};

struct ClassificationResult {
    std::string text;
    Classification classification = Classification::BENIGN;
    double confidence = 0.0;
    std::string reasoning;
    Severity severity = Severity::NONE;
    std::string model_version;
    std::string prompt_version;
    std::string request_id;
    std::chrono::system_clock::time_point timestamp;
};

// ============================================================================
// String Conversions
// ============================================================================

[[nodiscard]] inline const char* classification_to_string(Classification c) {
    switch (c) {
        case Classification::BENIGN:    return "benign";
        case Classification::MALICIOUS: return "malicious";
        case Classification::ERROR:     return "error";
        default:                        return "error";
    }
}

[[nodiscard]] inline std::optional<Classification> parse_classification(std::string_view s) {
    if (s == "benign") return Classification::BENIGN;
    if (s == "malicious") return Classification::MALICIOUS;
    if (s == "error") return Classification::ERROR;
    return std::nullopt;
}

[[nodiscard]] inline const char* severity_to_string(Severity s) {
    switch (s) {
        case Severity::NONE:   return "";
        case Severity::LOW:    return "low";
        case Severity::MEDIUM: return "medium";
        case Severity::HIGH:   return "high";
        default:               return "";
    }
}

[[nodiscard]] inline std::optional<Severity> parse_severity(std::string_view s) {
    if (s.empty()) return Severity::NONE;
    if (s == "low") return Severity::LOW;
    if (s == "medium") return Severity::MEDIUM;
    if (s == "high") return Severity::HIGH;
    return std::nullopt;
}

} // namespace promptguard
