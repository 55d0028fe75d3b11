#pragma once

#include "storage/record_store.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace promptguard {

/**
 * @brief PostgreSQL record store (table prompt_logs)
 *
 * All libpq calls are encapsulated here. Every operation opens its own
 * short-lived connection, so no connection is held between requests or
 * across the provider call.
 *
 * Schema (created by init_schema()):
 *   prompt_logs(id SERIAL PK, request_id, input_text, classification,
 *               confidence, model_version, prompt_version, raw_response,
 *               created_at TIMESTAMPTZ)
 *   idx_prompt_logs_request_id (non-unique)
 */
class PgRecordStore : public IRecordStore {
public:
    struct Config {
        std::string connection_string;
        uint32_t connect_timeout_seconds = 5;
        uint32_t statement_timeout_ms = 5000;
    };

    explicit PgRecordStore(Config config);

    /**
     * @brief Keyword/value pairs handed to PQconnectdbParams.
     *
     * The connection string goes in as "dbname" (expanded by libpq) and
     * statement_timeout is applied through the "options" keyword, so every
     * statement on the connection is cancelled server-side after the limit.
     */
    [[nodiscard]] static std::vector<std::pair<std::string, std::string>>
    connection_params(const Config& config);

    /// Create table and index if missing. @throws PersistenceError
    void init_schema();

    void append(const ClassificationRecord& record) override;

    /// All records logged under @p request_id, oldest first. @throws PersistenceError
    [[nodiscard]] std::vector<ClassificationRecord> find(const std::string& request_id);

    [[nodiscard]] std::string name() const override;

    static constexpr const char* kCreateTableSql =
        "CREATE TABLE IF NOT EXISTS prompt_logs ("
        " id SERIAL PRIMARY KEY,"
        " request_id VARCHAR(255) NOT NULL,"
        " input_text TEXT NOT NULL,"
        " classification VARCHAR(50) NOT NULL,"
        " confidence FLOAT NOT NULL,"
        " model_version VARCHAR(50) NOT NULL,"
        " prompt_version VARCHAR(50) NOT NULL,"
        " raw_response TEXT,"
        " created_at TIMESTAMP WITH TIME ZONE DEFAULT CURRENT_TIMESTAMP)";

    static constexpr const char* kCreateIndexSql =
        "CREATE INDEX IF NOT EXISTS idx_prompt_logs_request_id ON prompt_logs(request_id)";

    static constexpr const char* kInsertSql =
        "INSERT INTO prompt_logs"
        " (request_id, input_text, classification, confidence,"
        "  model_version, prompt_version, raw_response, created_at)"
        " VALUES ($1, $2, $3, $4, $5, $6, $7, $8)";

    // Explicit column list: columns added later stay out of existing reads
    static constexpr const char* kSelectByRequestIdSql =
        "SELECT request_id, input_text, classification, confidence,"
        " model_version, prompt_version, COALESCE(raw_response, ''),"
        " EXTRACT(EPOCH FROM created_at)"
        " FROM prompt_logs WHERE request_id = $1 ORDER BY id";

private:
    Config config_;
};

} // namespace promptguard
