#include "storage/file_record_store.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <format>

namespace promptguard {

FileRecordStore::FileRecordStore(Config config)
    : config_(std::move(config)) {
    const auto parent = std::filesystem::path(config_.output_file).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
    open_stream();
}

FileRecordStore::~FileRecordStore() {
    std::lock_guard lock(mutex_);
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

std::string FileRecordStore::to_json_line(const ClassificationRecord& record) {
    const nlohmann::json doc = {
        {"request_id", record.request_id},
        {"input_text", record.input_text},
        {"classification", classification_to_string(record.classification)},
        {"confidence", record.confidence},
        {"model_version", record.model_version},
        {"prompt_version", record.prompt_version},
        {"raw_response", record.raw_response},
        {"created_at", utils::format_timestamp(record.created_at)}
    };
    // replace: raw model output may carry invalid UTF-8
    return doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void FileRecordStore::append(const ClassificationRecord& record) {
    auto line = to_json_line(record);
    line += '\n';

    std::lock_guard lock(mutex_);
    if (file_stream_.is_open() && current_file_size_ >= config_.max_file_size_bytes) {
        rotate_file();
    }
    // A failed open or reopen leaves the stream closed; retry on every append.
    if (!file_stream_.is_open()) {
        open_stream();
    }

    file_stream_.write(line.data(), static_cast<std::streamsize>(line.size()));
    file_stream_.flush();
    if (!file_stream_.good()) {
        file_stream_.clear();
        throw PersistenceError("Failed to write record to " + config_.output_file);
    }
    current_file_size_ += line.size();
}

std::string FileRecordStore::name() const {
    return "file:" + config_.output_file;
}

size_t FileRecordStore::rotation_count() const {
    std::lock_guard lock(mutex_);
    return rotation_count_;
}

void FileRecordStore::open_stream() {
    file_stream_.clear();
    file_stream_.open(config_.output_file, std::ios::app);
    if (!file_stream_.is_open()) {
        throw PersistenceError("Failed to open record file: " + config_.output_file);
    }

    std::error_code ec;
    const auto file_size = std::filesystem::file_size(config_.output_file, ec);
    current_file_size_ = ec ? 0 : static_cast<size_t>(file_size);
}

void FileRecordStore::rotate_file() {
    file_stream_.flush();
    file_stream_.close();

    std::error_code ec;
    std::filesystem::remove(std::format("{}.{}", config_.output_file, config_.max_files), ec);

    // .N -> .N+1, missing files are fine
    for (int i = config_.max_files - 1; i >= 1; --i) {
        std::filesystem::rename(std::format("{}.{}", config_.output_file, i),
                                std::format("{}.{}", config_.output_file, i + 1), ec);
    }
    std::filesystem::rename(config_.output_file, config_.output_file + ".1", ec);

    ++rotation_count_;
    file_stream_.clear();
    file_stream_.open(config_.output_file, std::ios::app);
    if (!file_stream_.is_open()) {
        utils::log::error(std::format("Cannot reopen record file {} after rotation",
                                      config_.output_file));
        return;
    }
    current_file_size_ = 0;
    utils::log::info(std::format("Rotated record file {} (rotation #{})",
                                 config_.output_file, rotation_count_));
}

} // namespace promptguard
