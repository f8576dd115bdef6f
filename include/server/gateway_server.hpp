#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace lmgate {

class Dispatcher;
class IBackendClient;
class StatusReporter;
class ShutdownCoordinator;
struct Error;

/**
 * @brief OpenAI-compatible HTTP front of the gateway
 *
 * Routes:
 *   POST /v1/chat/completions  admission-gated, buffered or SSE relay
 *   GET  /v1/models            backend list, static fallback
 *   GET  /v1/queue/status      saturation snapshot
 *   GET  /health               gateway + backend probe
 *   GET  /                     service metadata
 *   *    /v1/{path}            ungated pass-through
 *
 * Connections run on a HandlerPool: a queued caller keeps its worker while
 * it waits, and status or health requests get another one immediately.
 */
class GatewayServer {
public:
    struct Config {
        std::string host = "0.0.0.0";
        int port = 8000;                                    // 0 binds an ephemeral port
        size_t threads = 64;                                // warm workers; more start on demand
        std::chrono::milliseconds idle_thread_timeout{30'000};
        std::chrono::milliseconds request_timeout{300'000};  // pass-through calls
        std::chrono::milliseconds probe_timeout{5000};
        std::string default_model = "gpt-oss-20b";
        std::chrono::seconds retry_after{5};
    };

    GatewayServer(Config config,
                  std::shared_ptr<Dispatcher> dispatcher,
                  std::shared_ptr<IBackendClient> backend,
                  std::shared_ptr<StatusReporter> reporter,
                  std::shared_ptr<ShutdownCoordinator> shutdown);
    ~GatewayServer();

    GatewayServer(const GatewayServer&) = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;

    /**
     * @brief Bind and serve. Blocks until stop().
     * @throws std::runtime_error if the address cannot be bound
     */
    void start();

    /// Stop listening; in-flight handlers finish first. Safe from any thread.
    void stop();

    /// True once the listener accepts connections
    [[nodiscard]] bool is_running() const;

    /// Port actually bound (differs from Config::port when that is 0)
    [[nodiscard]] int bound_port() const { return bound_port_.load(std::memory_order_acquire); }

    struct Stats {
        uint64_t chat_requests;
        uint64_t streamed;
        uint64_t passthrough;
        uint64_t errors;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    // ── Route registration (called from start()) ────────────────────────
    void register_routes(httplib::Server& svr);

    // ── Handler methods (one per endpoint) ──────────────────────────────
    void handle_chat_completions(const httplib::Request& req, httplib::Response& res);
    void handle_models(const httplib::Request& req, httplib::Response& res);
    void handle_queue_status(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_root(const httplib::Request& req, httplib::Response& res);
    void handle_passthrough(const httplib::Request& req, httplib::Response& res);

    // ── Helpers ─────────────────────────────────────────────────────────
    void write_error(httplib::Response& res, const Error& error);

    // ── Members ─────────────────────────────────────────────────────────
    const Config config_;
    std::shared_ptr<Dispatcher> dispatcher_;
    std::shared_ptr<IBackendClient> backend_;
    std::shared_ptr<StatusReporter> reporter_;
    std::shared_ptr<ShutdownCoordinator> shutdown_;

    mutable std::mutex server_mutex_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<int> bound_port_{0};

    std::atomic<uint64_t> chat_requests_{0};
    std::atomic<uint64_t> streamed_{0};
    std::atomic<uint64_t> passthrough_{0};
    std::atomic<uint64_t> errors_{0};
};

} // namespace lmgate
