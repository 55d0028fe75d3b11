#pragma once

#include "core/error.hpp"
#include "storage/record_store.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace promptguard::testing {

/**
 * @brief In-memory record store with optional failure
 */
class MockRecordStore : public IRecordStore {
public:
    explicit MockRecordStore(bool should_succeed = true,
                             std::string label = "mock")
        : should_succeed_(should_succeed), label_(std::move(label)) {}

    void append(const ClassificationRecord& record) override {
        append_count_.fetch_add(1, std::memory_order_relaxed);
        if (!should_succeed_) {
            throw PersistenceError("Mock failure: " + label_);
        }
        std::lock_guard lock(mutex_);
        records_.push_back(record);
    }

    [[nodiscard]] std::string name() const override { return label_; }

    [[nodiscard]] uint64_t append_count() const {
        return append_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::vector<ClassificationRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    void set_should_succeed(bool v) { should_succeed_ = v; }

private:
    std::atomic<bool> should_succeed_;
    std::string label_;
    mutable std::mutex mutex_;
    std::vector<ClassificationRecord> records_;
    std::atomic<uint64_t> append_count_{0};
};

} // namespace promptguard::testing
