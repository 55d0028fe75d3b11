#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace promptguard;

TEST_CASE("ConfigLoader: empty document keeps defaults", "[config]") {
    ::unsetenv("OPENAI_API_KEY");

    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.server.port == 8000);
    CHECK(cfg.server.host == "0.0.0.0");
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.llm.provider == "openai");
    CHECK(cfg.llm.default_model == "gpt-4.1-nano");
    CHECK(cfg.llm.api_key.empty());
    CHECK(cfg.classifier.default_prompt_version == "v1");
    CHECK(cfg.classifier.supported_provider == "openai");
    CHECK(cfg.database.enabled);
    CHECK(cfg.database.statement_timeout_ms == 5000);
    CHECK(cfg.database.effective_connection_string() ==
          "postgresql://postgres:postgres@db:5432/prompt_security");
    CHECK_FALSE(cfg.audit.file_enabled);
}

TEST_CASE("ConfigLoader: full document", "[config]") {
    const std::string toml = R"(
[app]
name = "detector"
version = "1.2.3"

[server]
host = "127.0.0.1"
port = 9000
threads = 4
request_timeout_ms = 15000
max_text_length = 1024

[logging]
level = "debug"

[llm]
endpoint = "http://localhost:11434"
api_key = "sk-inline"
default_model = "gpt-4o-mini"
temperature = 0.0
timeout_ms = 5000
max_tokens = 256

[classifier]
default_prompt_version = "v3"

[database]
enabled = false
connection_string = "host=pg dbname=logs"
connect_timeout_seconds = 2
statement_timeout_ms = 1500

[audit]
file_enabled = true
output_file = "/tmp/records.jsonl"
max_file_size_mb = 5
max_files = 3
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.app.name == "detector");
    CHECK(cfg.app.version == "1.2.3");
    CHECK(cfg.server.host == "127.0.0.1");
    CHECK(cfg.server.port == 9000);
    CHECK(cfg.server.thread_pool_size == 4);
    CHECK(cfg.server.request_timeout == std::chrono::milliseconds(15000));
    CHECK(cfg.server.max_text_length == 1024);
    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.llm.endpoint == "http://localhost:11434");
    CHECK(cfg.llm.api_key == "sk-inline");
    CHECK(cfg.llm.default_model == "gpt-4o-mini");
    CHECK(cfg.llm.temperature == Catch::Approx(0.0));
    CHECK(cfg.llm.timeout_ms == 5000);
    CHECK(cfg.llm.max_tokens == 256);
    CHECK(cfg.classifier.default_prompt_version == "v3");
    CHECK_FALSE(cfg.database.enabled);
    CHECK(cfg.database.effective_connection_string() == "host=pg dbname=logs");
    CHECK(cfg.database.connect_timeout_seconds == 2);
    CHECK(cfg.database.statement_timeout_ms == 1500);
    CHECK(cfg.audit.file_enabled);
    CHECK(cfg.audit.output_file == "/tmp/records.jsonl");
    CHECK(cfg.audit.max_file_size_mb == 5);
    CHECK(cfg.audit.max_files == 3);
}

TEST_CASE("ConfigLoader: env expansion", "[config][env]") {

    SECTION("Variable is substituted") {
        ::setenv("PG_TEST_API_KEY", "sk-from-env", 1);
        auto result = ConfigLoader::load_from_string(R"(
[llm]
api_key = "${PG_TEST_API_KEY}"
)");
        REQUIRE(result.success);
        CHECK(result.config.llm.api_key == "sk-from-env");
        ::unsetenv("PG_TEST_API_KEY");
    }

    SECTION("Missing variable expands to empty") {
        ::unsetenv("PG_TEST_MISSING_XYZ");
        auto result = ConfigLoader::load_from_string(R"(
[database]
connection_string = "host=db password=${PG_TEST_MISSING_XYZ} dbname=x"
)");
        REQUIRE(result.success);
        CHECK(result.config.database.connection_string == "host=db password= dbname=x");
    }

    SECTION("Unclosed ${ is a load error") {
        auto result = ConfigLoader::load_from_string(R"(
[llm]
api_key = "${UNCLOSED"
)");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("Unclosed env var") != std::string::npos);
    }

    SECTION("OPENAI_API_KEY fills an empty api_key") {
        ::setenv("OPENAI_API_KEY", "sk-fallback", 1);
        auto result = ConfigLoader::load_from_string("[llm]\nprovider = \"openai\"\n");
        REQUIRE(result.success);
        CHECK(result.config.llm.api_key == "sk-fallback");
        ::unsetenv("OPENAI_API_KEY");
    }
}

TEST_CASE("ConfigLoader: validation", "[config]") {

    SECTION("Port zero") {
        auto result = ConfigLoader::load_from_string("[server]\nport = 0\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("server.port") != std::string::npos);
    }

    SECTION("Port out of range") {
        CHECK_FALSE(ConfigLoader::load_from_string("[server]\nport = 70000\n").success);
    }

    SECTION("Database port out of range") {
        auto result = ConfigLoader::load_from_string("[database]\nport = 70000\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("database.port") != std::string::npos);
        CHECK_FALSE(ConfigLoader::load_from_string("[database]\nport = -1\n").success);
    }

    SECTION("Zero statement timeout") {
        auto result = ConfigLoader::load_from_string("[database]\nstatement_timeout_ms = 0\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("statement_timeout_ms") != std::string::npos);
    }

    SECTION("max_tokens beyond int range") {
        auto result = ConfigLoader::load_from_string("[llm]\nmax_tokens = 5000000000\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("max_tokens") != std::string::npos);
        CHECK_FALSE(ConfigLoader::load_from_string("[llm]\nmax_tokens = -4294966784\n").success);
    }

    SECTION("LLM timeout beyond 32 bits") {
        CHECK_FALSE(ConfigLoader::load_from_string("[llm]\ntimeout_ms = 4294967296\n").success);
    }

    SECTION("max_files must be positive") {
        auto result = ConfigLoader::load_from_string("[audit]\nmax_files = 0\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("max_files") != std::string::npos);
        CHECK_FALSE(ConfigLoader::load_from_string("[audit]\nmax_files = 4294967297\n").success);
    }

    SECTION("Zero LLM timeout") {
        auto result = ConfigLoader::load_from_string("[llm]\ntimeout_ms = 0\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("timeout_ms") != std::string::npos);
    }

    SECTION("Temperature outside [0, 2]") {
        CHECK_FALSE(ConfigLoader::load_from_string("[llm]\ntemperature = 2.5\n").success);
        CHECK_FALSE(ConfigLoader::load_from_string("[llm]\ntemperature = -0.1\n").success);
        CHECK(ConfigLoader::load_from_string("[llm]\ntemperature = 2.0\n").success);
    }

    SECTION("Unknown log level") {
        auto result = ConfigLoader::load_from_string("[logging]\nlevel = \"verbose\"\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("verbose") != std::string::npos);
    }

    SECTION("Empty default prompt version") {
        CHECK_FALSE(ConfigLoader::load_from_string(
            "[classifier]\ndefault_prompt_version = \"\"\n").success);
    }

    SECTION("validate() accepts the defaults") {
        CHECK(ConfigLoader::validate(DetectorConfig{}).empty());
    }
}

TEST_CASE("ConfigLoader: syntax errors and files", "[config]") {

    SECTION("Malformed TOML") {
        auto result = ConfigLoader::load_from_string("[server\nport = 1");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("TOML parse error") != std::string::npos);
    }

    SECTION("Missing file") {
        auto result = ConfigLoader::load_from_file("/nonexistent/prompt_guard.toml");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("not found") != std::string::npos);
    }

    SECTION("Load from file") {
        const auto path = std::filesystem::temp_directory_path() / "prompt_guard_config_test.toml";
        {
            std::ofstream out(path);
            out << "[server]\nport = 8123\n[classifier]\ndefault_prompt_version = \"v2\"\n";
        }
        auto result = ConfigLoader::load_from_file(path.string());
        REQUIRE(result.success);
        CHECK(result.config.server.port == 8123);
        CHECK(result.config.classifier.default_prompt_version == "v2");
        std::filesystem::remove(path);
    }
}
