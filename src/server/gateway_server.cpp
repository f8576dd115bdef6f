#include "server/gateway_server.hpp"
#include "server/error_response.hpp"
#include "server/handler_pool.hpp"
#include "server/http_constants.hpp"
#include "server/shutdown_coordinator.hpp"
#include "server/status_reporter.hpp"
#include "backend/ibackend_client.hpp"
#include "dispatch/dispatcher.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <chrono>
#include <format>
#include <stdexcept>

namespace lmgate {

namespace {

/// Keeps a streaming relay and its in-flight registration alive until
/// httplib is done with the response
struct RelayState {
    std::unique_ptr<RelaySession> session;
    ShutdownCoordinator::RequestGuard guard;
};

RequestQueue::DisconnectProbe make_disconnect_probe(const httplib::Request& req) {
    if (!req.is_connection_closed) {
        return {};
    }
    return [&req] { return req.is_connection_closed(); };
}

} // anonymous namespace

GatewayServer::GatewayServer(Config config,
                             std::shared_ptr<Dispatcher> dispatcher,
                             std::shared_ptr<IBackendClient> backend,
                             std::shared_ptr<StatusReporter> reporter,
                             std::shared_ptr<ShutdownCoordinator> shutdown)
    : config_(std::move(config)),
      dispatcher_(std::move(dispatcher)),
      backend_(std::move(backend)),
      reporter_(std::move(reporter)),
      shutdown_(std::move(shutdown)) {
    if (!dispatcher_ || !backend_ || !reporter_ || !shutdown_) {
        throw std::invalid_argument("GatewayServer: all components are required");
    }
}

GatewayServer::~GatewayServer() {
    stop();
}

// ============================================================================
// start(): create server, register routes, listen
// ============================================================================

void GatewayServer::start() {
    httplib::Server* svr_ptr = nullptr;
    {
        std::lock_guard lock(server_mutex_);
        if (stop_requested_.load(std::memory_order_acquire)) {
            return;
        }
        server_ = std::make_unique<httplib::Server>();
        svr_ptr = server_.get();
    }
    auto& svr = *svr_ptr;

    // Every accepted connection gets a worker at once; config_.threads stay warm
    const size_t core_threads = config_.threads;
    const auto idle_timeout = config_.idle_thread_timeout;
    svr.new_task_queue = [core_threads, idle_timeout] {
        return new HandlerPool(core_threads, idle_timeout);
    };

    svr.set_exception_handler([this](const httplib::Request& req, httplib::Response& res,
                                     std::exception_ptr ep) {
        std::string what = "unknown exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            // non-std exception; reported below as unknown
        }
        utils::log::error(std::format("Unhandled exception in {} {}: {}", req.method, req.path, what));
        write_error(res, Error{ErrorCategory::INTERNAL_ERROR, what, 0, "", ""});
    });

    register_routes(svr);

    int port = config_.port;
    if (port == 0) {
        port = svr.bind_to_any_port(config_.host);
        if (port < 0) {
            throw std::runtime_error(std::format("Failed to bind {}:<any>", config_.host));
        }
    } else if (!svr.bind_to_port(config_.host, port)) {
        throw std::runtime_error(std::format("Failed to bind {}:{}", config_.host, port));
    }
    bound_port_.store(port, std::memory_order_release);

    utils::log::info(std::format("Starting lmgate on {}:{} ({} core threads)",
        config_.host, port, config_.threads));

    if (!svr.listen_after_bind() && !stop_requested_.load(std::memory_order_acquire)) {
        throw std::runtime_error("Failed to start HTTP server");
    }
}

void GatewayServer::stop() {
    std::lock_guard lock(server_mutex_);
    if (stop_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (server_) {
        server_->stop();
        utils::log::info("Server stopped");
    }
}

bool GatewayServer::is_running() const {
    std::lock_guard lock(server_mutex_);
    return server_ && server_->is_running();
}

GatewayServer::Stats GatewayServer::get_stats() const {
    return {
        .chat_requests = chat_requests_.load(std::memory_order_relaxed),
        .streamed = streamed_.load(std::memory_order_relaxed),
        .passthrough = passthrough_.load(std::memory_order_relaxed),
        .errors = errors_.load(std::memory_order_relaxed),
    };
}

// ============================================================================
// Route registration
// ============================================================================

void GatewayServer::register_routes(httplib::Server& svr) {
    svr.Post("/v1/chat/completions", [this](const httplib::Request& req, httplib::Response& res) {
        handle_chat_completions(req, res);
    });
    svr.Get("/v1/models", [this](const httplib::Request& req, httplib::Response& res) {
        handle_models(req, res);
    });
    svr.Get("/v1/queue/status", [this](const httplib::Request& req, httplib::Response& res) {
        handle_queue_status(req, res);
    });
    svr.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    svr.Get("/", [this](const httplib::Request& req, httplib::Response& res) {
        handle_root(req, res);
    });

    // Pass-through last: httplib tries handlers in registration order
    const auto passthrough = [this](const httplib::Request& req, httplib::Response& res) {
        handle_passthrough(req, res);
    };
    static constexpr const char* kPassthroughPattern = R"(/v1/(.+))";
    svr.Get(kPassthroughPattern, passthrough);
    svr.Post(kPassthroughPattern, passthrough);
    svr.Put(kPassthroughPattern, passthrough);
    svr.Patch(kPassthroughPattern, passthrough);
    svr.Delete(kPassthroughPattern, passthrough);
    svr.Options(kPassthroughPattern, passthrough);
}

// ============================================================================
// Handlers
// ============================================================================

void GatewayServer::handle_chat_completions(const httplib::Request& req, httplib::Response& res) {
    const auto arrival = std::chrono::steady_clock::now();
    chat_requests_.fetch_add(1, std::memory_order_relaxed);

    auto guard = shutdown_->enter();
    if (!guard.entered()) {
        write_error(res, Error{ErrorCategory::SHUTTING_DOWN, "gateway is shutting down", 0, "", ""});
        return;
    }

    auto payload = dispatcher_->prepare(req.body);
    if (payload.is_error()) {
        write_error(res, payload.error_info());
        return;
    }

    const auto probe = make_disconnect_probe(req);

    if (!payload.value().streaming) {
        auto completion = dispatcher_->complete(payload.value(), arrival, probe);
        if (completion.is_error()) {
            write_error(res, completion.error_info());
            return;
        }
        res.status = completion.value().status;
        res.set_content(std::move(completion.value().body), completion.value().content_type);
        return;
    }

    auto opened = dispatcher_->open_stream(payload.value(), arrival, probe);
    if (opened.is_error()) {
        write_error(res, opened.error_info());
        return;
    }
    streamed_.fetch_add(1, std::memory_order_relaxed);

    auto state = std::make_shared<RelayState>();
    state->session = std::move(opened.value());
    state->guard = std::move(guard);

    res.status = state->session->status();
    res.set_header("Cache-Control", "no-cache");
    res.set_header("X-Accel-Buffering", "no");

    res.set_chunked_content_provider(
        state->session->content_type(),
        [state](size_t /*offset*/, httplib::DataSink& sink) {
            const auto write = [&sink](std::string_view data) {
                return sink.write(data.data(), data.size());
            };
            const auto gone = [&sink] { return !sink.is_writable(); };
            const RequestState outcome = state->session->pump(write, gone);
            if (outcome == RequestState::CANCELLED) {
                return false;
            }
            sink.done();
            return true;
        },
        [state](bool /*success*/) {
            // Drops the lease (if pump never ran) and leaves the in-flight set
            state->session.reset();
            state->guard = {};
        });
}

void GatewayServer::handle_models(const httplib::Request& /*req*/, httplib::Response& res) {
    auto reply = list_backend_models(*backend_, config_.probe_timeout, config_.default_model);
    res.status = reply.status;
    res.set_content(std::move(reply.body), reply.content_type);
}

void GatewayServer::handle_queue_status(const httplib::Request& /*req*/, httplib::Response& res) {
    res.set_content(reporter_->to_json(reporter_->snapshot()), http::kJsonContentType);
}

void GatewayServer::handle_health(const httplib::Request& /*req*/, httplib::Response& res) {
    const auto backend = check_backend_health(*backend_, config_.probe_timeout);
    const auto snap = reporter_->snapshot();
    res.set_content(std::format(
        R"({{"status":"{}","backend":{},"queue":{},)"
        R"("config":{{"max_concurrent_requests":{},"default_model":"{}"}}}})",
        shutdown_->is_shutting_down() ? "shutting_down" : "ok",
        backend_health_to_json(backend),
        StatusReporter::core_fields_json(snap),
        snap.capacity,
        utils::escape_json(config_.default_model)), http::kJsonContentType);
}

void GatewayServer::handle_root(const httplib::Request& /*req*/, httplib::Response& res) {
    res.set_content(std::format(
        R"({{"service":"{}","version":"{}","endpoints":{{)"
        R"("chat_completions":"/v1/chat/completions","models":"/v1/models",)"
        R"("queue_status":"/v1/queue/status","health":"/health"}}}})",
        http::kServiceName, http::kServiceVersion), http::kJsonContentType);
}

void GatewayServer::handle_passthrough(const httplib::Request& req, httplib::Response& res) {
    passthrough_.fetch_add(1, std::memory_order_relaxed);

    ForwardRequest forward;
    forward.method = req.method;
    forward.target = req.target.empty() ? req.path : req.target;
    forward.body = req.body;
    forward.content_type = req.get_header_value("Content-Type");
    forward.timeout = config_.request_timeout;

    auto reply = backend_->forward(forward);
    if (reply.is_error()) {
        // Pass-through reports every transport failure as a bad gateway
        write_error(res, Error{ErrorCategory::BACKEND_UNAVAILABLE,
            std::format("Backend error: {}", reply.error_message()), 0, "", ""});
        return;
    }

    res.status = reply.value().status;
    const std::string content_type = reply.value().content_type.empty()
        ? std::string(http::kJsonContentType) : reply.value().content_type;
    res.set_content(std::move(reply.value().body), content_type);
}

// ============================================================================
// Helpers
// ============================================================================

void GatewayServer::write_error(httplib::Response& res, const Error& error) {
    errors_.fetch_add(1, std::memory_order_relaxed);
    auto response = make_error_response(error, config_.retry_after);
    res.status = response.status;
    if (response.retry_after) {
        res.set_header(http::kRetryAfterHeader, *response.retry_after);
    }
    res.set_content(std::move(response.body), response.content_type);
}

} // namespace lmgate
