#include "provider/openai_provider.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <format>

namespace promptguard {

using json = nlohmann::json;

// ============================================================================
// Construction
// ============================================================================

OpenAiProvider::OpenAiProvider(LlmConfig config)
    : config_(std::move(config)) {}

// ============================================================================
// Request / Response Codec
// ============================================================================

std::string OpenAiProvider::build_request_body(const std::string& system_prompt,
                                               const std::string& user_prompt,
                                               const std::string& model,
                                               double temperature,
                                               int max_tokens) {
    json body = {
        {"model", model},
        {"temperature", temperature},
        {"max_tokens", max_tokens},
        {"messages", json::array({
            {{"role", "system"}, {"content", system_prompt}},
            {{"role", "user"}, {"content", user_prompt}}
        })}
    };
    return body.dump();
}

std::string OpenAiProvider::extract_content(const std::string& response_body) {
    // {"choices":[{"message":{"content":"..."}}]}
    const json doc = json::parse(response_body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        throw ProviderError("Completion payload is not valid JSON");
    }

    const auto choices = doc.find("choices");
    if (choices == doc.end() || !choices->is_array() || choices->empty()) {
        throw ProviderError("Completion payload has no choices");
    }

    const auto& first = (*choices)[0];
    if (!first.is_object() || !first.contains("message") || !first["message"].is_object()) {
        throw ProviderError("Completion payload has no message");
    }

    const auto& message = first["message"];
    const auto content = message.find("content");
    if (content == message.end() || !content->is_string()) {
        throw ProviderError("Completion message has no text content");
    }
    return content->get<std::string>();
}

// ============================================================================
// API Call
// ============================================================================

std::string OpenAiProvider::complete(const std::string& prompt,
                                     const std::string& model,
                                     std::optional<std::chrono::milliseconds> timeout) {
    api_calls_.fetch_add(1, std::memory_order_relaxed);

    if (config_.api_key.empty()) {
        fail("No API key configured");
    }
    if (config_.endpoint.empty()) {
        fail("No endpoint configured");
    }

    const auto& model_name = model.empty() ? config_.default_model : model;
    std::string body;
    try {
        body = build_request_body(kDetectorSystemPrompt, prompt, model_name,
                                  config_.temperature, config_.max_tokens);
    } catch (const json::exception& e) {
        fail(std::format("Cannot encode request: {}", e.what()));
    }
    const auto call_timeout = timeout.value_or(std::chrono::milliseconds(config_.timeout_ms));

    httplib::Client cli(config_.endpoint);
    cli.set_connection_timeout(call_timeout);
    cli.set_read_timeout(call_timeout);
    cli.set_write_timeout(call_timeout);

    const httplib::Headers headers = {
        {"Authorization", "Bearer " + config_.api_key}
    };

    const utils::Timer timer;
    const auto res = cli.Post(kCompletionsPath, headers, body, "application/json");

    if (!res) {
        fail(std::format("HTTP request failed: {}", httplib::to_string(res.error())));
    }

    if (res->status != 200) {
        fail(std::format("API error: HTTP {} - {}", res->status,
                         utils::truncate(res->body, 200)));
    }

    try {
        auto content = extract_content(res->body);
        utils::log::debug(std::format("OpenAI completion for model {} in {}ms",
                                      model_name, timer.elapsed_ms().count()));
        return content;
    } catch (const ProviderError&) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        throw;
    }
}

void OpenAiProvider::fail(const std::string& message) {
    api_errors_.fetch_add(1, std::memory_order_relaxed);
    utils::log::error(std::format("Error calling OpenAI API: {}", message));
    throw ProviderError(message);
}

// ============================================================================
// Stats
// ============================================================================

OpenAiProvider::Stats OpenAiProvider::get_stats() const {
    return {
        api_calls_.load(std::memory_order_relaxed),
        api_errors_.load(std::memory_order_relaxed)
    };
}

} // namespace promptguard
