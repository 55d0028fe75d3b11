#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>

namespace promptguard {

/**
 * @brief Turns raw LLM completion text into a ClassificationVerdict
 *
 * Expected input is a single JSON object:
 *   {"classification": "malicious"|"benign", "confidence": 0.0-1.0,
 *    "reasoning": "...", "severity": "low"|"medium"|"high"}
 *
 * Missing fields take defaults (benign, 0.0, "No reasoning provided").
 * A malicious verdict without a usable severity gets one derived from
 * confidence; any other verdict carries an empty severity.
 *
 * Two entry points with different failure shapes:
 * - normalize():  fresh provider output. Failure -> benign, confidence -1.0,
 *                 "Error parsing response".
 * - reprocess():  previously stored raw text. Failure -> error, confidence 0,
 *                 "Error processing response: <cause>".
 * Neither throws.
 */
class ResponseNormalizer {
public:
    static constexpr double kParseFailureConfidence = -1.0;
    static constexpr double kHighSeverityThreshold = 0.8;
    static constexpr double kMediumSeverityThreshold = 0.5;

    static constexpr std::string_view kDefaultReasoning = "No reasoning provided";
    static constexpr std::string_view kParseFailureReasoning = "Error parsing response";
    static constexpr std::string_view kReprocessFailurePrefix = "Error processing response: ";

    [[nodiscard]] static ClassificationVerdict normalize(std::string_view raw_response);

    [[nodiscard]] static ClassificationVerdict reprocess(std::string_view raw_response);

    /// >= 0.8 high, >= 0.5 medium, otherwise low.
    [[nodiscard]] static Severity derive_severity(double confidence);

private:
    /**
     * @brief Strict parse shared by both entry points
     * @throws std::exception describing why the text is unusable
     */
    static ClassificationVerdict parse(std::string_view raw_response);

    /// Strip an enclosing ```/```json markdown fence, if any.
    static std::string_view strip_code_fence(std::string_view text);
};

} // namespace promptguard
