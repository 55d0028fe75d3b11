#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace promptguard {

// ============================================================================
// Configuration Types (mirror the TOML sections)
// ============================================================================

struct AppConfig {
    std::string name = "Prompt Injection Detector";
    std::string version = "0.1.0";
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8000;
    size_t thread_pool_size = 8;
    std::chrono::milliseconds request_timeout{60000};
    size_t max_text_length = 32768;   // bytes
};

struct LoggingConfig {
    std::string level = "info";
};

struct LlmConfig {
    std::string provider = "openai";
    std::string endpoint = "https://api.openai.com";
    std::string api_key;
    std::string default_model = "gpt-4.1-nano";
    double temperature = 0.1;
    uint32_t timeout_ms = 30000;
    int max_tokens = 512;
};

struct ClassifierConfig {
    std::string default_prompt_version = "v1";
    std::string supported_provider = "openai";
};

struct DatabaseConfig {
    bool enabled = true;
    std::string connection_string;   // libpq conninfo or URI; empty = build from parts
    std::string host = "db";
    uint16_t port = 5432;
    std::string name = "prompt_security";
    std::string user = "postgres";
    std::string password = "postgres";
    uint32_t connect_timeout_seconds = 5;
    uint32_t statement_timeout_ms = 5000;   // server-side cap on each statement
    bool init_schema = true;

    /// connection_string if set, otherwise a postgresql:// URI from the parts.
    [[nodiscard]] std::string effective_connection_string() const {
        if (!connection_string.empty()) return connection_string;
        return "postgresql://" + user + ":" + password + "@" + host + ":" +
               std::to_string(port) + "/" + name;
    }
};

struct AuditConfig {
    bool file_enabled = false;
    std::string output_file = "logs/prompt_logs.jsonl";
    size_t max_file_size_mb = 100;
    int max_files = 10;
};

// ============================================================================
// DetectorConfig - Complete parsed configuration
// ============================================================================

struct DetectorConfig {
    AppConfig app;
    ServerConfig server;
    LoggingConfig logging;
    LlmConfig llm;
    ClassifierConfig classifier;
    DatabaseConfig database;
    AuditConfig audit;
};

} // namespace promptguard
