#pragma once

#include "classifier/classification_service.hpp"
#include "config/config_types.hpp"
#include "core/types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace promptguard {

/**
 * @brief HTTP front end for the classification service
 *
 * Routes:
 *   POST /api/v1/classify  classify one text
 *   GET  /health           liveness
 *   GET  /                 service banner
 *
 * Error bodies are {"detail": "..."}. Client mistakes (bad body, unsupported
 * provider, unknown prompt version) map to 400, provider failures to 502 and
 * anything else to 500.
 */
class HttpServer {
public:
    /// Status code and JSON body produced by a handler.
    struct Reply {
        int status;
        std::string body;
    };

    HttpServer(std::shared_ptr<ClassificationService> service,
               ServerConfig server_config,
               AppConfig app_config = {});
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Blocks in listen() until stop() is called. Throws if the bind fails.
    void start();
    void stop();

    // ── Transport-independent handlers ──────────────────────────────────
    [[nodiscard]] Reply handle_classify(const std::string& body);
    [[nodiscard]] Reply handle_health() const;
    [[nodiscard]] Reply handle_root() const;

    /// Wire form of a result; timestamp is ISO-8601.
    [[nodiscard]] static std::string result_to_json(const ClassificationResult& result);

    struct HttpStats {
        uint64_t requests;
        uint64_t client_errors;
        uint64_t server_errors;
    };
    [[nodiscard]] HttpStats get_http_stats() const;

private:
    void register_routes(httplib::Server& svr);
    static void send(httplib::Response& res, const Reply& reply);
    static Reply error_reply(int status, const std::string& detail);

    std::shared_ptr<ClassificationService> service_;
    const ServerConfig server_config_;
    const AppConfig app_config_;

    std::mutex server_mutex_;
    std::unique_ptr<httplib::Server> server_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> client_errors_{0};
    std::atomic<uint64_t> server_errors_{0};
};

} // namespace promptguard
