#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace lmgate {

// ============================================================================
// Gateway configuration (mirrors TOML hierarchy)
// ============================================================================

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    int threads = 64;                                   // warm handler workers; more start on demand
    std::chrono::milliseconds shutdown_timeout{30000};
};

struct BackendConfig {
    std::string url = "http://127.0.0.1:8080";
    std::chrono::milliseconds request_timeout{300'000}; // queue wait + backend call
    std::chrono::milliseconds probe_timeout{5000};      // /health and /v1/models
    size_t max_buffered_bytes = 1024 * 1024;            // per-stream read-ahead
};

struct AdmissionConfig {
    uint32_t max_concurrent = 4;
    std::chrono::milliseconds disconnect_poll{100};
};

struct ModelsConfig {
    std::string default_model = "gpt-oss-20b";
};

struct DnsConfig {
    bool register_on_startup = false;
    std::string api_url = "https://dns.internal.jerkytreats.dev";
    std::string domain_base = "internal.jerkytreats.dev";
    std::string service_name = "chat";
    std::string target_device = "leviathan";
};

struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief Complete gateway configuration. Immutable once loaded.
 */
struct GatewayConfig {
    ServerConfig server;
    BackendConfig backend;
    AdmissionConfig admission;
    ModelsConfig models;
    DnsConfig dns;
    LoggingConfig logging;
};

} // namespace lmgate
