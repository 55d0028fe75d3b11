#pragma once

#include "storage/record_store.hpp"

#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>

namespace promptguard {

/**
 * @brief JSONL record log with size-based rotation
 *
 * One JSON object per line:
 *   {"request_id":..., "input_text":..., "classification":..., "confidence":...,
 *    "model_version":..., "prompt_version":..., "raw_response":..., "created_at":...}
 *
 * Rotated files are named output_file.1, output_file.2, ...; files beyond
 * max_files are deleted. Appends from concurrent requests are serialized by
 * an internal mutex held only for the duration of one write.
 */
class FileRecordStore : public IRecordStore {
public:
    struct Config {
        std::string output_file = "logs/prompt_logs.jsonl";
        size_t max_file_size_bytes = 100ULL * 1024 * 1024;  // 100MB
        int max_files = 10;
    };

    /// @throws PersistenceError if the file cannot be opened
    explicit FileRecordStore(Config config);
    ~FileRecordStore() override;

    FileRecordStore(const FileRecordStore&) = delete;
    FileRecordStore& operator=(const FileRecordStore&) = delete;

    void append(const ClassificationRecord& record) override;
    [[nodiscard]] std::string name() const override;

    /// Serialized form of one record (no trailing newline).
    [[nodiscard]] static std::string to_json_line(const ClassificationRecord& record);

    [[nodiscard]] size_t rotation_count() const;

private:
    void open_stream();
    void rotate_file();

    Config config_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t rotation_count_ = 0;
    mutable std::mutex mutex_;
};

} // namespace promptguard
