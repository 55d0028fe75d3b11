#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>

namespace promptguard {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads prompt_guard.toml into a DetectorConfig
 *
 * String values may reference environment variables as ${VAR_NAME}; unset
 * variables expand to the empty string and an unclosed "${" is a load error.
 * Missing sections and keys keep their defaults. When [llm].api_key ends up
 * empty, OPENAI_API_KEY from the environment is used.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        DetectorConfig config;

        static LoadResult ok(DetectorConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to prompt_guard.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check cross-field constraints
     * @return Empty string if valid, otherwise the first problem found
     */
    [[nodiscard]] static std::string validate(const DetectorConfig& config);

private:
    static LoadResult build(toml::table& root);

    static AppConfig extract_app(const toml::table& root);
    static ServerConfig extract_server(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static LlmConfig extract_llm(const toml::table& root);
    static ClassifierConfig extract_classifier(const toml::table& root);
    static DatabaseConfig extract_database(const toml::table& root);
    static AuditConfig extract_audit(const toml::table& root);
};

} // namespace promptguard
