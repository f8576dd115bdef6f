#include "registration/dns_registrar.hpp"
#include "core/url.hpp"
#include "core/utils.hpp"
#include "server/http_constants.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>

namespace lmgate {

const char* dns_outcome_to_string(DnsRegistrar::Outcome outcome) {
    switch (outcome) {
        case DnsRegistrar::Outcome::SKIPPED:     return "skipped";
        case DnsRegistrar::Outcome::REGISTERED:  return "registered";
        case DnsRegistrar::Outcome::REJECTED:    return "rejected";
        case DnsRegistrar::Outcome::UNREACHABLE: return "unreachable";
        default:                                 return "unknown";
    }
}

DnsRegistrar::DnsRegistrar(DnsConfig config, int port)
    : config_(std::move(config)), port_(port) {}

std::string DnsRegistrar::payload_json() const {
    return std::format(
        R"({{"name":"{}","port":{},"service_name":"{}","target_device":"{}"}})",
        utils::escape_json(config_.service_name), port_, kServiceTag,
        utils::escape_json(config_.target_device));
}

std::string DnsRegistrar::full_domain() const {
    return std::format("{}.{}", config_.service_name, config_.domain_base);
}

DnsRegistrar::Outcome DnsRegistrar::register_service() {
    if (!config_.register_on_startup) {
        utils::log::info("DNS registration disabled, skipping");
        return Outcome::SKIPPED;
    }

    const auto base = parse_base_url(config_.api_url);
    if (!base) {
        utils::log::warn(std::format("DNS registration failed: invalid API URL '{}'", config_.api_url));
        return Outcome::UNREACHABLE;
    }

    httplib::Client client(base->origin());
    client.set_connection_timeout(kRequestTimeout);
    client.set_read_timeout(kRequestTimeout);
    client.set_write_timeout(kRequestTimeout);

    auto res = client.Post(base->join("/add-record/"), payload_json(), http::kJsonContentType);
    if (!res) {
        utils::log::warn(std::format("DNS registration failed (network error): {}",
            httplib::to_string(res.error())));
        utils::log::warn("Service will continue without DNS registration");
        return Outcome::UNREACHABLE;
    }
    if (res->status < 200 || res->status >= 300) {
        utils::log::error(std::format("DNS registration failed with status {}: {}",
            res->status, res->body));
        return Outcome::REJECTED;
    }

    utils::log::info(std::format("Registered with DNS: {} -> :{}", full_domain(), port_));
    return Outcome::REGISTERED;
}

void DnsRegistrar::deregister() {
    if (!config_.register_on_startup) return;
    utils::log::info(std::format(
        "DNS deregistration not supported by the API; {} stays registered", full_domain()));
}

} // namespace lmgate
