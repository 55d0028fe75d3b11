#include "storage/pg_record_store.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <libpq-fe.h>

#include <array>
#include <format>
#include <memory>
#include <vector>

namespace promptguard {

namespace {

struct PgConnCloser {
    void operator()(PGconn* conn) const { PQfinish(conn); }
};
struct PgResultClearer {
    void operator()(PGresult* res) const { PQclear(res); }
};

using PgConnPtr = std::unique_ptr<PGconn, PgConnCloser>;
using PgResultPtr = std::unique_ptr<PGresult, PgResultClearer>;

std::string last_error(PGconn* conn) {
    return utils::trim(PQerrorMessage(conn));
}

PgConnPtr connect(const PgRecordStore::Config& config) {
    const auto params = PgRecordStore::connection_params(config);
    std::vector<const char*> keywords;
    std::vector<const char*> values;
    for (const auto& [key, value] : params) {
        keywords.push_back(key.c_str());
        values.push_back(value.c_str());
    }
    keywords.push_back(nullptr);
    values.push_back(nullptr);

    PgConnPtr conn(PQconnectdbParams(keywords.data(), values.data(), /*expand_dbname=*/1));
    if (!conn) {
        throw PersistenceError("PostgreSQL connection allocation failed");
    }
    if (PQstatus(conn.get()) != CONNECTION_OK) {
        throw PersistenceError(std::format("PostgreSQL connection failed: {}",
                                           last_error(conn.get())));
    }
    return conn;
}

void exec_command(PGconn* conn, const char* sql) {
    PgResultPtr res(PQexec(conn, sql));
    if (!res || PQresultStatus(res.get()) != PGRES_COMMAND_OK) {
        throw PersistenceError(std::format("PostgreSQL command failed: {}", last_error(conn)));
    }
}

} // anonymous namespace

PgRecordStore::PgRecordStore(Config config)
    : config_(std::move(config)) {}

std::vector<std::pair<std::string, std::string>>
PgRecordStore::connection_params(const Config& config) {
    return {
        {"dbname", config.connection_string},
        {"connect_timeout", std::to_string(config.connect_timeout_seconds)},
        {"options", std::format("-c statement_timeout={}", config.statement_timeout_ms)}
    };
}

void PgRecordStore::init_schema() {
    auto conn = connect(config_);
    exec_command(conn.get(), kCreateTableSql);
    exec_command(conn.get(), kCreateIndexSql);
    utils::log::info("Database schema initialized (prompt_logs)");
}

void PgRecordStore::append(const ClassificationRecord& record) {
    const auto confidence = std::format("{}", record.confidence);
    const auto created_at = utils::format_timestamp(record.created_at);

    const std::array<const char*, 8> params = {
        record.request_id.c_str(),
        record.input_text.c_str(),
        classification_to_string(record.classification),
        confidence.c_str(),
        record.model_version.c_str(),
        record.prompt_version.c_str(),
        record.raw_response.c_str(),
        created_at.c_str()
    };

    auto conn = connect(config_);
    PgResultPtr res(PQexecParams(conn.get(), kInsertSql,
                                 static_cast<int>(params.size()),
                                 nullptr, params.data(), nullptr, nullptr, 0));
    if (!res || PQresultStatus(res.get()) != PGRES_COMMAND_OK) {
        throw PersistenceError(std::format("Insert into prompt_logs failed: {}",
                                           last_error(conn.get())));
    }
}

std::vector<ClassificationRecord> PgRecordStore::find(const std::string& request_id) {
    const std::array<const char*, 1> params = {request_id.c_str()};

    auto conn = connect(config_);
    PgResultPtr res(PQexecParams(conn.get(), kSelectByRequestIdSql, 1,
                                 nullptr, params.data(), nullptr, nullptr, 0));
    if (!res || PQresultStatus(res.get()) != PGRES_TUPLES_OK) {
        throw PersistenceError(std::format("Select from prompt_logs failed: {}",
                                           last_error(conn.get())));
    }

    std::vector<ClassificationRecord> records;
    const int nrows = PQntuples(res.get());
    records.reserve(static_cast<size_t>(nrows));

    for (int i = 0; i < nrows; ++i) {
        auto text = [&](int col) { return std::string(PQgetvalue(res.get(), i, col)); };

        ClassificationRecord rec;
        rec.request_id = text(0);
        rec.input_text = text(1);
        rec.classification = parse_classification(text(2)).value_or(Classification::ERROR);
        rec.confidence = std::stod(text(3));
        rec.model_version = text(4);
        rec.prompt_version = text(5);
        rec.raw_response = text(6);
        if (!PQgetisnull(res.get(), i, 7)) {
            const auto epoch = std::chrono::duration<double>(std::stod(text(7)));
            rec.created_at = std::chrono::system_clock::time_point(
                std::chrono::duration_cast<std::chrono::system_clock::duration>(epoch));
        }
        records.push_back(std::move(rec));
    }
    return records;
}

std::string PgRecordStore::name() const {
    return "postgresql:prompt_logs";
}

} // namespace promptguard
