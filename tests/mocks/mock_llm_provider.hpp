#pragma once

#include "core/error.hpp"
#include "provider/llm_provider.hpp"

#include <atomic>
#include <mutex>
#include <string>

namespace promptguard::testing {

/**
 * @brief Mock LLM provider returning canned text or failing on demand
 */
class MockLlmProvider : public ILlmProvider {
public:
    explicit MockLlmProvider(std::string response = "",
                             bool should_fail = false)
        : response_(std::move(response)), should_fail_(should_fail) {}

    [[nodiscard]] std::string name() const override { return "mock"; }

    [[nodiscard]] std::string complete(
        const std::string& prompt,
        const std::string& model,
        std::optional<std::chrono::milliseconds> timeout) override {
        call_count_.fetch_add(1, std::memory_order_relaxed);
        std::lock_guard lock(mutex_);
        last_prompt_ = prompt;
        last_model_ = model;
        last_timeout_ = timeout;
        if (should_fail_) {
            throw ProviderError("Mock provider failure");
        }
        return response_;
    }

    [[nodiscard]] uint64_t call_count() const {
        return call_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::string last_prompt() const {
        std::lock_guard lock(mutex_);
        return last_prompt_;
    }

    [[nodiscard]] std::string last_model() const {
        std::lock_guard lock(mutex_);
        return last_model_;
    }

    [[nodiscard]] std::optional<std::chrono::milliseconds> last_timeout() const {
        std::lock_guard lock(mutex_);
        return last_timeout_;
    }

    void set_response(std::string response) {
        std::lock_guard lock(mutex_);
        response_ = std::move(response);
    }

    void set_should_fail(bool v) { should_fail_ = v; }

private:
    mutable std::mutex mutex_;
    std::string response_;
    std::atomic<bool> should_fail_;
    std::string last_prompt_;
    std::string last_model_;
    std::optional<std::chrono::milliseconds> last_timeout_;
    std::atomic<uint64_t> call_count_{0};
};

} // namespace promptguard::testing
