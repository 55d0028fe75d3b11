#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <format>
#include <optional>
#include <stdexcept>

namespace promptguard {

namespace {

/// Malformed request body; rendered as a 400.
class BadRequest : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::optional<std::string> optional_string_field(const nlohmann::json& body, const char* key) {
    const auto it = body.find(key);
    if (it == body.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw BadRequest(std::format("Field '{}' must be a string", key));
    }
    return it->get<std::string>();
}

ClassificationRequest parse_classify_body(const std::string& body, size_t max_text_length) {
    const auto doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw BadRequest("Request body must be a JSON object");
    }

    const auto text = doc.find("text");
    if (text == doc.end() || !text->is_string()) {
        throw BadRequest("Field 'text' is required and must be a string");
    }

    ClassificationRequest request;
    request.text = text->get<std::string>();
    if (request.text.size() > max_text_length) {
        throw BadRequest(std::format("Field 'text' exceeds {} bytes", max_text_length));
    }
    request.model_version = optional_string_field(doc, "model_version");
    request.prompt_version = optional_string_field(doc, "prompt_version");
    request.provider = optional_string_field(doc, "provider");
    return request;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

HttpServer::HttpServer(std::shared_ptr<ClassificationService> service,
                       ServerConfig server_config,
                       AppConfig app_config)
    : service_(std::move(service)),
      server_config_(std::move(server_config)),
      app_config_(std::move(app_config)) {
    if (!service_) {
        throw std::invalid_argument("HttpServer requires a classification service");
    }
}

HttpServer::~HttpServer() = default;

// ============================================================================
// start(): create server, register routes, listen
// ============================================================================

void HttpServer::start() {
    httplib::Server* svr = nullptr;
    {
        std::lock_guard lock(server_mutex_);
        server_ = std::make_unique<httplib::Server>();
        svr = server_.get();
    }

    const size_t pool_size = server_config_.thread_pool_size;
    svr->new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    const auto timeout = server_config_.request_timeout;
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout);
    const auto usecs = std::chrono::duration_cast<std::chrono::microseconds>(timeout - secs);
    svr->set_read_timeout(static_cast<time_t>(secs.count()), static_cast<time_t>(usecs.count()));
    svr->set_write_timeout(static_cast<time_t>(secs.count()), static_cast<time_t>(usecs.count()));

    register_routes(*svr);

    utils::log::info(std::format("Starting {} on {}:{} ({} threads)",
        app_config_.name, server_config_.host, server_config_.port, pool_size));

    if (!svr->listen(server_config_.host, server_config_.port)) {
        throw std::runtime_error(std::format("Failed to start HTTP server on {}:{}",
            server_config_.host, server_config_.port));
    }
}

void HttpServer::stop() {
    std::lock_guard lock(server_mutex_);
    if (server_) {
        server_->stop();
    }
    utils::log::info("Server stopped");
}

// ============================================================================
// Route registration
// ============================================================================

void HttpServer::register_routes(httplib::Server& svr) {
    svr.Post(http::kClassifyPath, [this](const httplib::Request& req, httplib::Response& res) {
        send(res, handle_classify(req.body));
    });
    svr.Get(http::kHealthPath, [this](const httplib::Request&, httplib::Response& res) {
        send(res, handle_health());
    });
    svr.Get(http::kRootPath, [this](const httplib::Request&, httplib::Response& res) {
        send(res, handle_root());
    });
}

void HttpServer::send(httplib::Response& res, const Reply& reply) {
    res.status = reply.status;
    res.set_content(reply.body, http::kJsonContentType);
}

HttpServer::Reply HttpServer::error_reply(int status, const std::string& detail) {
    return {status, nlohmann::json{{"detail", detail}}.dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace)};
}

// ============================================================================
// Handlers
// ============================================================================

HttpServer::Reply HttpServer::handle_classify(const std::string& body) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    try {
        const auto request = parse_classify_body(body, server_config_.max_text_length);
        const auto result = service_->classify(request);
        return {http::kStatusOk, result_to_json(result)};
    } catch (const BadRequest& e) {
        client_errors_.fetch_add(1, std::memory_order_relaxed);
        return error_reply(http::kStatusBadRequest, e.what());
    } catch (const DetectorError& e) {
        if (e.category() == ErrorCategory::CLIENT_ERROR) {
            client_errors_.fetch_add(1, std::memory_order_relaxed);
            return error_reply(http::kStatusBadRequest, e.what());
        }
        server_errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Classification failed ({}): {}",
            error_category_to_string(e.category()), e.what()));
        const int status = e.category() == ErrorCategory::PROVIDER_ERROR
            ? http::kStatusBadGateway : http::kStatusInternalError;
        return error_reply(status, e.what());
    } catch (const std::exception& e) {
        server_errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Classification failed: {}", e.what()));
        return error_reply(http::kStatusInternalError, e.what());
    }
}

HttpServer::Reply HttpServer::handle_health() const {
    return {http::kStatusOk, R"({"status":"healthy"})"};
}

HttpServer::Reply HttpServer::handle_root() const {
    const nlohmann::json body = {
        {"message", "Prompt Injection Detection API"},
        {"version", app_config_.version}
    };
    return {http::kStatusOk, body.dump()};
}

std::string HttpServer::result_to_json(const ClassificationResult& result) {
    const nlohmann::json body = {
        {"text", result.text},
        {"classification", classification_to_string(result.classification)},
        {"confidence", result.confidence},
        {"reasoning", result.reasoning},
        {"severity", severity_to_string(result.severity)},
        {"model_version", result.model_version},
        {"prompt_version", result.prompt_version},
        {"request_id", result.request_id},
        {"timestamp", utils::format_timestamp(result.timestamp)}
    };
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

HttpServer::HttpStats HttpServer::get_http_stats() const {
    return {
        requests_.load(std::memory_order_relaxed),
        client_errors_.load(std::memory_order_relaxed),
        server_errors_.load(std::memory_order_relaxed)
    };
}

} // namespace promptguard
