#include "admission/admission_gate.hpp"
#include "admission/request_queue.hpp"
#include "backend/http_backend_client.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "dispatch/dispatcher.hpp"
#include "registration/dns_registrar.hpp"
#include "server/gateway_server.hpp"
#include "server/shutdown_coordinator.hpp"
#include "server/status_reporter.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <format>
#include <thread>

using namespace lmgate;

// Global instances for signal handling
std::shared_ptr<GatewayServer> g_server;
std::shared_ptr<ShutdownCoordinator> g_shutdown;
std::shared_ptr<RequestQueue> g_queue;

namespace {

// Written by the signal handler, read by the shutdown watcher
volatile std::sig_atomic_t g_signal = 0;
std::atomic<bool> g_exiting{false};

} // anonymous namespace

void signal_handler(int signal) {
    g_signal = signal;
}

// Runs the shutdown sequence outside signal context
void shutdown_watcher() {
    while (g_signal == 0 && !g_exiting.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (g_signal == 0) {
        return;
    }

    utils::log::info(std::format("Received signal {}, shutting down...", static_cast<int>(g_signal)));

    // Stop accepting new chat requests, release everyone still queued
    g_shutdown->initiate_shutdown();
    g_queue->close();

    // Wait for in-flight requests to drain
    const bool drained = g_shutdown->wait_for_drain();
    if (drained) {
        utils::log::info("All in-flight requests drained");
    } else {
        utils::log::warn(std::format("Shutdown timeout: {} requests still in flight",
            g_shutdown->in_flight_count()));
    }

    g_server->stop();
}

int main(int argc, char* argv[]) {
    std::thread watcher;
    int exit_code = 0;

    try {
        utils::log::info("lmgate starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // [1/5] Configuration
        std::string config_file = "config/gateway.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        ConfigLoader::LoadResult loaded;
        if (std::filesystem::exists(config_file)) {
            utils::log::info(std::format("[1/5] Loading configuration from {}", config_file));
            loaded = ConfigLoader::load_from_file(config_file);
        } else {
            utils::log::info(std::format(
                "[1/5] {} not found, using defaults and environment", config_file));
            loaded = ConfigLoader::load_defaults();
        }
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return 1;
        }
        const GatewayConfig& cfg = loaded.config;
        if (const auto level = utils::log::parse_level(cfg.logging.level)) {
            utils::log::set_level(*level);
        }

        // [2/5] Backend
        auto backend = std::make_shared<HttpBackendClient>(HttpBackendClient::Config{
            .base_url = cfg.backend.url,
            .max_buffered_bytes = cfg.backend.max_buffered_bytes,
        });
        utils::log::info(std::format("[2/5] Backend: {} (request timeout {}s)",
            cfg.backend.url,
            std::chrono::duration<double>(cfg.backend.request_timeout).count()));

        // [3/5] Admission
        auto gate = std::make_shared<AdmissionGate>(cfg.admission.max_concurrent);
        g_queue = std::make_shared<RequestQueue>(gate, RequestQueue::Config{
            .poll_interval = cfg.admission.disconnect_poll,
        });
        utils::log::info(std::format("[3/5] Admission: max_concurrent={}, FIFO queue",
            cfg.admission.max_concurrent));

        auto dispatcher = std::make_shared<Dispatcher>(g_queue, backend, Dispatcher::Config{
            .request_timeout = cfg.backend.request_timeout,
            .default_model = cfg.models.default_model,
            .disconnect_poll = cfg.admission.disconnect_poll,
        });
        auto reporter = std::make_shared<StatusReporter>(g_queue, cfg.backend.url);

        g_shutdown = std::make_shared<ShutdownCoordinator>(ShutdownCoordinator::Config{
            .shutdown_timeout = cfg.server.shutdown_timeout,
        });

        // [4/5] DNS
        DnsRegistrar dns(cfg.dns, cfg.server.port);
        utils::log::info("[4/5] DNS registration...");
        const auto dns_outcome = dns.register_service();
        utils::log::debug(std::format("DNS registration: {}", dns_outcome_to_string(dns_outcome)));

        // [5/5] HTTP server
        g_server = std::make_shared<GatewayServer>(GatewayServer::Config{
            .host = cfg.server.host,
            .port = cfg.server.port,
            .threads = static_cast<size_t>(cfg.server.threads),
            .request_timeout = cfg.backend.request_timeout,
            .probe_timeout = cfg.backend.probe_timeout,
            .default_model = cfg.models.default_model,
        }, dispatcher, backend, reporter, g_shutdown);
        utils::log::info(std::format("[5/5] Server ready on http://{}:{}",
            cfg.server.host, cfg.server.port));

        watcher = std::thread(shutdown_watcher);

        // Start HTTP server (blocking)
        g_server->start();

        dns.deregister();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        exit_code = 1;
    }

    g_exiting.store(true, std::memory_order_release);
    if (watcher.joinable()) {
        watcher.join();
    }
    utils::log::info("lmgate stopped");
    return exit_code;
}
