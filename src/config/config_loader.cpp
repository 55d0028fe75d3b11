#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <limits>
#include <stdexcept>

using namespace std::string_literals;

namespace promptguard {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Narrow a TOML integer, mapping anything outside [lo, hi] to 0.
 */
template <typename T>
T checked_narrow(int64_t value, int64_t lo, int64_t hi) {
    return (value >= lo && value <= hi) ? static_cast<T>(value) : T{0};
}

constexpr int64_t kIntMax = std::numeric_limits<int>::max();
constexpr int64_t kUint32Max = std::numeric_limits<uint32_t>::max();

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    if (!std::filesystem::exists(config_path)) {
        return LoadResult::error(std::format("Config file not found: {}", config_path));
    }
    try {
        auto root = toml::parse_file(config_path);
        return build(root);
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error in {} (line {}): {}",
            config_path, e.source().begin.line, e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load {}: {}", config_path, e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto root = toml::parse(toml_content);
        return build(root);
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error (line {}): {}",
            e.source().begin.line, e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::build(toml::table& root) {
    expand_env_vars_recursive(root);

    DetectorConfig cfg;
    cfg.app = extract_app(root);
    cfg.server = extract_server(root);
    cfg.logging = extract_logging(root);
    cfg.llm = extract_llm(root);
    cfg.classifier = extract_classifier(root);
    cfg.database = extract_database(root);
    cfg.audit = extract_audit(root);

    if (cfg.llm.api_key.empty()) {
        if (const char* key = std::getenv("OPENAI_API_KEY")) {
            cfg.llm.api_key = key;
        }
    }

    if (auto problem = validate(cfg); !problem.empty()) {
        return LoadResult::error(std::move(problem));
    }
    return LoadResult::ok(std::move(cfg));
}

std::string ConfigLoader::validate(const DetectorConfig& config) {
    if (config.server.port == 0) {
        return "server.port must be between 1 and 65535";
    }
    if (config.server.thread_pool_size == 0) {
        return "server.threads must be positive";
    }
    if (config.server.max_text_length == 0) {
        return "server.max_text_length must be positive";
    }
    if (!utils::log::parse_level(config.logging.level)) {
        return std::format("logging.level '{}' is not one of debug, info, warn, error",
                           config.logging.level);
    }
    if (config.llm.provider.empty()) {
        return "llm.provider must not be empty";
    }
    if (config.llm.timeout_ms == 0) {
        return "llm.timeout_ms must be positive";
    }
    if (config.llm.temperature < 0.0 || config.llm.temperature > 2.0) {
        return std::format("llm.temperature {} is outside [0, 2]", config.llm.temperature);
    }
    if (config.llm.max_tokens <= 0) {
        return "llm.max_tokens must be positive";
    }
    if (config.classifier.default_prompt_version.empty()) {
        return "classifier.default_prompt_version must not be empty";
    }
    if (config.classifier.supported_provider.empty()) {
        return "classifier.supported_provider must not be empty";
    }
    if (config.database.enabled && config.database.port == 0) {
        return "database.port must be between 1 and 65535";
    }
    if (config.database.enabled && config.database.statement_timeout_ms == 0) {
        return "database.statement_timeout_ms must be positive";
    }
    if (config.audit.max_files < 1) {
        return "audit.max_files must be positive";
    }
    if (config.audit.file_enabled && config.audit.output_file.empty()) {
        return "audit.output_file must be set when audit.file_enabled is true";
    }
    return "";
}

// ---- Section extractors ----------------------------------------------------

AppConfig ConfigLoader::extract_app(const toml::table& root) {
    AppConfig cfg;
    const auto* app = root["app"].as_table();
    if (!app) return cfg;
    const auto& a = *app;

    cfg.name = a["name"].value_or(cfg.name);
    cfg.version = a["version"].value_or(cfg.version);
    return cfg;
}

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or("0.0.0.0"s);
    cfg.port = checked_narrow<uint16_t>(s["port"].value_or(int64_t{8000}), 1, 65535);
    cfg.thread_pool_size = static_cast<size_t>(std::max<int64_t>(0, s["threads"].value_or(int64_t{8})));
    cfg.request_timeout = std::chrono::milliseconds(s["request_timeout_ms"].value_or(int64_t{60000}));
    cfg.max_text_length = static_cast<size_t>(
        std::max<int64_t>(0, s["max_text_length"].value_or(int64_t{32768})));
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

LlmConfig ConfigLoader::extract_llm(const toml::table& root) {
    LlmConfig cfg;
    const auto* llm = root["llm"].as_table();
    if (!llm) return cfg;
    const auto& l = *llm;

    cfg.provider = l["provider"].value_or(cfg.provider);
    cfg.endpoint = l["endpoint"].value_or(cfg.endpoint);
    cfg.api_key = l["api_key"].value_or(""s);
    cfg.default_model = l["default_model"].value_or(cfg.default_model);
    cfg.temperature = l["temperature"].value_or(cfg.temperature);
    cfg.timeout_ms = checked_narrow<uint32_t>(l["timeout_ms"].value_or(int64_t{30000}), 1, kUint32Max);
    cfg.max_tokens = checked_narrow<int>(l["max_tokens"].value_or(int64_t{512}), 1, kIntMax);
    return cfg;
}

ClassifierConfig ConfigLoader::extract_classifier(const toml::table& root) {
    ClassifierConfig cfg;
    const auto* classifier = root["classifier"].as_table();
    if (!classifier) return cfg;
    const auto& c = *classifier;

    cfg.default_prompt_version = c["default_prompt_version"].value_or(cfg.default_prompt_version);
    cfg.supported_provider = c["supported_provider"].value_or(cfg.supported_provider);
    return cfg;
}

DatabaseConfig ConfigLoader::extract_database(const toml::table& root) {
    DatabaseConfig cfg;
    const auto* database = root["database"].as_table();
    if (!database) return cfg;
    const auto& d = *database;

    cfg.enabled = d["enabled"].value_or(true);
    cfg.connection_string = d["connection_string"].value_or(""s);
    cfg.host = d["host"].value_or(cfg.host);
    cfg.port = checked_narrow<uint16_t>(d["port"].value_or(int64_t{5432}), 1, 65535);
    cfg.name = d["name"].value_or(cfg.name);
    cfg.user = d["user"].value_or(cfg.user);
    cfg.password = d["password"].value_or(cfg.password);
    cfg.connect_timeout_seconds = checked_narrow<uint32_t>(
        d["connect_timeout_seconds"].value_or(int64_t{5}), 0, kUint32Max);
    cfg.statement_timeout_ms = checked_narrow<uint32_t>(
        d["statement_timeout_ms"].value_or(int64_t{5000}), 1, kIntMax);
    cfg.init_schema = d["init_schema"].value_or(true);
    return cfg;
}

AuditConfig ConfigLoader::extract_audit(const toml::table& root) {
    AuditConfig cfg;
    const auto* audit = root["audit"].as_table();
    if (!audit) return cfg;
    const auto& a = *audit;

    cfg.file_enabled = a["file_enabled"].value_or(false);
    cfg.output_file = a["output_file"].value_or(cfg.output_file);
    cfg.max_file_size_mb = static_cast<size_t>(
        std::max<int64_t>(1, a["max_file_size_mb"].value_or(int64_t{100})));
    cfg.max_files = checked_narrow<int>(a["max_files"].value_or(int64_t{10}), 1, kIntMax);
    return cfg;
}

} // namespace promptguard
