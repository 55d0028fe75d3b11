#pragma once

#include <stdexcept>
#include <string>

namespace promptguard {

/**
 * @brief Error categories for the classification pipeline
 *
 * CLIENT_ERROR      - rejected request (unknown provider, unknown prompt version)
 * PROVIDER_ERROR    - LLM backend failed (network, auth, quota, bad payload)
 * PERSISTENCE_ERROR - record store failed (contained by the service)
 * INTERNAL_ERROR    - anything else
 */
enum class ErrorCategory {
    CLIENT_ERROR,
    PROVIDER_ERROR,
    PERSISTENCE_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::CLIENT_ERROR:      return "client_error";
        case ErrorCategory::PROVIDER_ERROR:    return "provider_error";
        case ErrorCategory::PERSISTENCE_ERROR: return "persistence_error";
        case ErrorCategory::INTERNAL_ERROR:    return "internal_error";
        default:                               return "unknown";
    }
}

/**
 * @brief Base class for all errors raised by the detector
 */
class DetectorError : public std::runtime_error {
public:
    DetectorError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const { return category_; }

private:
    ErrorCategory category_;
};

class UnknownTemplateVersion : public DetectorError {
public:
    explicit UnknownTemplateVersion(const std::string& version)
        : DetectorError(ErrorCategory::CLIENT_ERROR,
                        "Prompt version " + version + " not found"),
          version_(version) {}

    [[nodiscard]] const std::string& version() const { return version_; }

private:
    std::string version_;
};

class UnsupportedProvider : public DetectorError {
public:
    explicit UnsupportedProvider(const std::string& message)
        : DetectorError(ErrorCategory::CLIENT_ERROR, message) {}
};

class ProviderError : public DetectorError {
public:
    explicit ProviderError(const std::string& message)
        : DetectorError(ErrorCategory::PROVIDER_ERROR, message) {}
};

class PersistenceError : public DetectorError {
public:
    explicit PersistenceError(const std::string& message)
        : DetectorError(ErrorCategory::PERSISTENCE_ERROR, message) {}
};

} // namespace promptguard
