#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "classifier/classification_service.hpp"
#include "prompt/prompt_template.hpp"
#include "provider/openai_provider.hpp"
#include "provider/provider_registry.hpp"
#include "server/http_server.hpp"
#include "storage/file_record_store.hpp"
#include "storage/pg_record_store.hpp"
#include "storage/record_store.hpp"

#include <memory>
#include <csignal>
#include <cstdlib>
#include <format>

using namespace promptguard;

// Global instance for signal handling
std::shared_ptr<HttpServer> g_server;

// =========================================================================
// Explicit Provider Registration (ensures linker includes provider objects)
// =========================================================================

static void register_providers() {
    ProviderRegistry::instance().register_provider(
        OpenAiProvider::kName,
        [](const LlmConfig& config) { return std::make_unique<OpenAiProvider>(config); });
}

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (g_server) {
        g_server->stop();
    }
}

// =========================================================================
// Record stores: PostgreSQL (prompt_logs) and optional JSONL file
// =========================================================================

static std::shared_ptr<IRecordStore> build_record_store(const DetectorConfig& cfg) {
    auto composite = std::make_shared<CompositeRecordStore>();

    if (cfg.database.enabled) {
        auto pg = std::make_unique<PgRecordStore>(PgRecordStore::Config{
            cfg.database.effective_connection_string(),
            cfg.database.connect_timeout_seconds,
            cfg.database.statement_timeout_ms});
        if (cfg.database.init_schema) {
            try {
                pg->init_schema();
            } catch (const std::exception& e) {
                // Records keep being attempted; the table may appear later.
                utils::log::error(std::format("Database initialization error: {}", e.what()));
            }
        }
        composite->add(std::move(pg));
    }

    if (cfg.audit.file_enabled) {
        FileRecordStore::Config file_cfg;
        file_cfg.output_file = cfg.audit.output_file;
        file_cfg.max_file_size_bytes = cfg.audit.max_file_size_mb * 1024 * 1024;
        file_cfg.max_files = cfg.audit.max_files;
        composite->add(std::make_unique<FileRecordStore>(std::move(file_cfg)));
    }

    if (composite->empty()) {
        return nullptr;
    }
    return composite;
}

int main(int argc, char* argv[]) {
    try {
        register_providers();

        utils::log::info("Prompt Injection Detector starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // =====================================================================
        // [1/5] Configuration
        // =====================================================================
        std::string config_file = "config/prompt_guard.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/5] Loading configuration from {}", config_file));

        auto config_result = ConfigLoader::load_from_file(config_file);
        DetectorConfig cfg;
        if (config_result.success) {
            cfg = std::move(config_result.config);
        } else {
            utils::log::warn(std::format("{} - using defaults", config_result.error_message));
            if (const char* key = std::getenv("OPENAI_API_KEY")) {
                cfg.llm.api_key = key;
            }
        }

        if (auto level = utils::log::parse_level(cfg.logging.level)) {
            utils::log::set_level(*level);
        }

        // =====================================================================
        // [2/5] Prompt templates
        // =====================================================================
        const auto& templates = PromptTemplateRegistry::instance();
        const auto versions = templates.versions();
        std::string version_list;
        for (const auto& v : versions) {
            if (!version_list.empty()) version_list += ", ";
            version_list += v;
        }
        utils::log::info(std::format("[2/5] Prompt templates: {} (default {})",
            version_list, cfg.classifier.default_prompt_version));
        if (!templates.has(cfg.classifier.default_prompt_version)) {
            utils::log::warn(std::format("Default prompt version {} is not registered",
                cfg.classifier.default_prompt_version));
        }

        // =====================================================================
        // [3/5] LLM provider
        // =====================================================================
        std::shared_ptr<ILlmProvider> provider =
            ProviderRegistry::instance().create(cfg.llm.provider, cfg.llm);
        utils::log::info(std::format("[3/5] LLM provider: {} (model {}, timeout {}ms)",
            provider->name(), cfg.llm.default_model, cfg.llm.timeout_ms));
        if (cfg.llm.api_key.empty()) {
            utils::log::warn("No API key configured; classification requests will fail");
        }

        // =====================================================================
        // [4/5] Record stores
        // =====================================================================
        auto store = build_record_store(cfg);
        utils::log::info(std::format("[4/5] Record store: {}",
            store ? store->name() : "disabled"));

        // =====================================================================
        // [5/5] Classification service + HTTP server
        // =====================================================================
        ClassificationService::Config service_cfg;
        service_cfg.default_model = cfg.llm.default_model;
        service_cfg.default_prompt_version = cfg.classifier.default_prompt_version;
        service_cfg.supported_provider = cfg.classifier.supported_provider;

        auto service = std::make_shared<ClassificationService>(
            std::move(service_cfg), provider, store, templates);

        g_server = std::make_shared<HttpServer>(service, cfg.server, cfg.app);
        utils::log::info(std::format("[5/5] Server ready on http://{}:{}",
            cfg.server.host, cfg.server.port));

        // Start HTTP server (blocking)
        g_server->start();

        const auto stats = service->get_stats();
        utils::log::info(std::format(
            "Served {} requests ({} rejected, {} provider failures, {} malicious, "
            "{} parse failures, {} persistence failures)",
            stats.total_requests, stats.rejected_requests, stats.provider_failures,
            stats.malicious, stats.parse_failures, stats.persistence_failures));

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
