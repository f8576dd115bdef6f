#pragma once

#include "config/config_types.hpp"

#include <chrono>
#include <string>

namespace lmgate {

/**
 * @brief One-shot self-registration with the tailnet DNS API
 *
 * POSTs {name, port, service_name, target_device} to
 * {api_url}/add-record/. Best effort: every failure is logged and the
 * gateway keeps serving. The API has no delete endpoint, so
 * deregister() only logs.
 */
class DnsRegistrar {
public:
    enum class Outcome {
        SKIPPED,        // registration disabled
        REGISTERED,     // 2xx
        REJECTED,       // API answered non-2xx
        UNREACHABLE     // transport failure
    };

    static constexpr std::chrono::seconds kRequestTimeout{10};
    static constexpr const char* kServiceTag = "lmserver";

    DnsRegistrar(DnsConfig config, int port);

    Outcome register_service();
    void deregister();

    [[nodiscard]] std::string payload_json() const;
    [[nodiscard]] std::string full_domain() const;

private:
    const DnsConfig config_;
    const int port_;
};

[[nodiscard]] const char* dns_outcome_to_string(DnsRegistrar::Outcome outcome);

} // namespace lmgate
