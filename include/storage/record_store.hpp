#pragma once

#include "core/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace promptguard {

/**
 * @brief Append-only destination for ClassificationRecords
 *
 * append() is called from request threads, possibly concurrently, and must
 * not keep connections or locks alive between calls. Records are never
 * updated or deleted through this interface.
 */
class IRecordStore {
public:
    virtual ~IRecordStore() = default;

    /// @throws PersistenceError if the record could not be written
    virtual void append(const ClassificationRecord& record) = 0;

    /// Human-readable store name for logging (e.g. "file:/var/log/prompt_logs.jsonl")
    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief Writes every record to each child store
 *
 * All children are attempted; if any fails, a PersistenceError naming the
 * failed stores is raised after the loop.
 */
class CompositeRecordStore : public IRecordStore {
public:
    void add(std::unique_ptr<IRecordStore> store);

    void append(const ClassificationRecord& record) override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] size_t size() const { return stores_.size(); }
    [[nodiscard]] bool empty() const { return stores_.empty(); }

private:
    std::vector<std::unique_ptr<IRecordStore>> stores_;
};

} // namespace promptguard
