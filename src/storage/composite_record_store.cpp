#include "storage/record_store.hpp"
#include "core/error.hpp"

#include <format>

namespace promptguard {

void CompositeRecordStore::add(std::unique_ptr<IRecordStore> store) {
    if (store) {
        stores_.push_back(std::move(store));
    }
}

void CompositeRecordStore::append(const ClassificationRecord& record) {
    std::string failures;
    for (const auto& store : stores_) {
        try {
            store->append(record);
        } catch (const PersistenceError& e) {
            if (!failures.empty()) failures += "; ";
            failures += std::format("{}: {}", store->name(), e.what());
        }
    }
    if (!failures.empty()) {
        throw PersistenceError(failures);
    }
}

std::string CompositeRecordStore::name() const {
    std::string result = "composite[";
    for (size_t i = 0; i < stores_.size(); ++i) {
        if (i > 0) result += ",";
        result += stores_[i]->name();
    }
    result += "]";
    return result;
}

} // namespace promptguard
