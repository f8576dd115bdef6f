#include "backend/ibackend_client.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <format>

namespace lmgate {

BackendHealth check_backend_health(IBackendClient& client, std::chrono::milliseconds timeout) {
    BackendHealth health;
    auto result = client.fetch("/health", timeout);
    if (result.is_error()) {
        health.error = result.error_message();
        utils::log::debug(std::format("Backend health probe failed: {}", health.error));
        return health;
    }
    // Any HTTP answer means the backend process is up; its body says how it feels
    health.reachable = true;
    health.body = std::move(result.value().body);
    return health;
}

BackendReply list_backend_models(IBackendClient& client,
                                 std::chrono::milliseconds timeout,
                                 const std::string& default_model) {
    auto result = client.fetch("/v1/models", timeout);
    if (result.is_ok()) {
        auto reply = std::move(result.value());
        if (reply.content_type.empty()) {
            reply.content_type = "application/json";
        }
        return reply;
    }

    utils::log::warn(std::format("Model listing unavailable ({}), serving configured default",
        result.error_message()));

    BackendReply fallback;
    fallback.status = 200;
    fallback.content_type = "application/json";
    fallback.body = std::format(
        R"({{"object":"list","data":[{{"id":"{}","object":"model","owned_by":"local"}}]}})",
        utils::escape_json(default_model));
    return fallback;
}

std::string backend_health_to_json(const BackendHealth& health) {
    if (!health.reachable) {
        return std::format(R"({{"status":"error","error":"{}"}})",
            utils::escape_json(health.error));
    }

    // Embed the backend's JSON as-is; anything else is carried as a string
    std::string detail;
    try {
        detail = JsonValue::parse(health.body).dump();
    } catch (const JsonValue::parse_error&) {
        detail = std::format("\"{}\"", utils::escape_json(health.body));
    }
    return std::format(R"({{"status":"ok","llama_server":{}}})", detail);
}

} // namespace lmgate
