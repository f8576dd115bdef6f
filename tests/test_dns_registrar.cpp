#include <catch2/catch_test_macros.hpp>
#include "registration/dns_registrar.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <mutex>
#include <thread>

using namespace lmgate;

namespace {

/**
 * @brief Loopback DNS API that records what it was sent
 */
class FakeDnsApi {
public:
    explicit FakeDnsApi(int status) {
        server_.Post("/add-record/", [this, status](const httplib::Request& req, httplib::Response& res) {
            {
                std::lock_guard lock(mutex_);
                body_ = req.body;
                content_type_ = req.get_header_value("Content-Type");
                ++hits_;
            }
            res.status = status;
            res.set_content(status < 300 ? R"({"ok":true})" : R"({"detail":"duplicate"})",
                            "application/json");
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        REQUIRE(port_ > 0);
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~FakeDnsApi() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    [[nodiscard]] std::string url() const { return std::format("http://127.0.0.1:{}", port_); }

    [[nodiscard]] std::string body() const { std::lock_guard lock(mutex_); return body_; }
    [[nodiscard]] std::string content_type() const { std::lock_guard lock(mutex_); return content_type_; }
    [[nodiscard]] int hits() const { std::lock_guard lock(mutex_); return hits_; }

private:
    httplib::Server server_;
    int port_ = 0;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::string body_;
    std::string content_type_;
    int hits_ = 0;
};

DnsConfig enabled_config(const std::string& api_url) {
    DnsConfig cfg;
    cfg.register_on_startup = true;
    cfg.api_url = api_url;
    cfg.domain_base = "internal.example.dev";
    cfg.service_name = "chat";
    cfg.target_device = "gpu-box";
    return cfg;
}

} // anonymous namespace

TEST_CASE("DnsRegistrar: payload and domain", "[dns]") {
    DnsRegistrar registrar(enabled_config("https://dns.example"), 8000);
    CHECK(registrar.payload_json() ==
          R"({"name":"chat","port":8000,"service_name":"lmserver","target_device":"gpu-box"})");
    CHECK(registrar.full_domain() == "chat.internal.example.dev");
}

TEST_CASE("DnsRegistrar: disabled registration is skipped", "[dns]") {
    DnsConfig cfg;
    cfg.register_on_startup = false;
    DnsRegistrar registrar(cfg, 8000);
    CHECK(registrar.register_service() == DnsRegistrar::Outcome::SKIPPED);
    registrar.deregister();
}

TEST_CASE("DnsRegistrar: successful registration posts the record", "[dns][http]") {
    FakeDnsApi api(200);
    DnsRegistrar registrar(enabled_config(api.url()), 8123);

    CHECK(registrar.register_service() == DnsRegistrar::Outcome::REGISTERED);
    CHECK(api.hits() == 1);
    CHECK(api.body() == registrar.payload_json());
    CHECK(api.content_type() == "application/json");
}

TEST_CASE("DnsRegistrar: API rejection is reported, not thrown", "[dns][http]") {
    FakeDnsApi api(409);
    DnsRegistrar registrar(enabled_config(api.url()), 8000);
    CHECK(registrar.register_service() == DnsRegistrar::Outcome::REJECTED);
    CHECK(api.hits() == 1);
}

TEST_CASE("DnsRegistrar: unreachable API is reported, not thrown", "[dns][http]") {
    SECTION("nothing listening") {
        DnsRegistrar registrar(enabled_config("http://127.0.0.1:1"), 8000);
        CHECK(registrar.register_service() == DnsRegistrar::Outcome::UNREACHABLE);
    }

    SECTION("malformed API URL") {
        DnsRegistrar registrar(enabled_config("dns.example"), 8000);
        CHECK(registrar.register_service() == DnsRegistrar::Outcome::UNREACHABLE);
    }
}

TEST_CASE("DnsRegistrar: outcome names", "[dns]") {
    CHECK(std::string(dns_outcome_to_string(DnsRegistrar::Outcome::SKIPPED)) == "skipped");
    CHECK(std::string(dns_outcome_to_string(DnsRegistrar::Outcome::REGISTERED)) == "registered");
    CHECK(std::string(dns_outcome_to_string(DnsRegistrar::Outcome::REJECTED)) == "rejected");
    CHECK(std::string(dns_outcome_to_string(DnsRegistrar::Outcome::UNREACHABLE)) == "unreachable");
}
