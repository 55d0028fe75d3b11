#pragma once

#include "provider/llm_provider.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace promptguard {

/**
 * @brief OpenAI-compatible chat completions backend
 *
 * POSTs {model, temperature, max_tokens, messages:[system, user]} to
 * <endpoint>/v1/chat/completions via httplib::Client and returns
 * choices[0].message.content. Any failure surfaces as ProviderError;
 * retries are left to the caller.
 */
class OpenAiProvider : public ILlmProvider {
public:
    static constexpr const char* kName = "openai";
    static constexpr const char* kCompletionsPath = "/v1/chat/completions";

    explicit OpenAiProvider(LlmConfig config);

    [[nodiscard]] std::string name() const override { return kName; }

    [[nodiscard]] std::string complete(
        const std::string& prompt,
        const std::string& model,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt) override;

    // Request/response codec (for testing)
    /// @throws nlohmann::json::type_error if a string is not valid UTF-8
    [[nodiscard]] static std::string build_request_body(const std::string& system_prompt,
                                                        const std::string& user_prompt,
                                                        const std::string& model,
                                                        double temperature,
                                                        int max_tokens);

    /// @throws ProviderError if the payload has no choices[0].message.content string
    [[nodiscard]] static std::string extract_content(const std::string& response_body);

    struct Stats {
        uint64_t api_calls = 0;
        uint64_t api_errors = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    [[noreturn]] void fail(const std::string& message);

    LlmConfig config_;

    std::atomic<uint64_t> api_calls_{0};
    std::atomic<uint64_t> api_errors_{0};
};

} // namespace promptguard
