#include <catch2/catch_test_macros.hpp>
#include "backend/http_backend_client.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <chrono>
#include <cstring>
#include <format>
#include <stdexcept>
#include <thread>

using namespace lmgate;
using namespace std::chrono_literals;

namespace {

using Clock = std::chrono::steady_clock;

/**
 * @brief Stand-in for llama-server on an ephemeral loopback port
 */
class FakeLlamaServer {
public:
    FakeLlamaServer() {
        server_.Post("/v1/chat/completions", [](const httplib::Request& req, httplib::Response& res) {
            if (req.get_header_value("Accept") != "text/event-stream") {
                res.set_content(req.body, "application/json");
                return;
            }
            res.set_chunked_content_provider("text/event-stream",
                [](size_t /*offset*/, httplib::DataSink& sink) {
                    for (const char* event : {"data: {\"n\":1}\n\n", "data: {\"n\":2}\n\n", "data: [DONE]\n\n"}) {
                        sink.write(event, std::strlen(event));
                    }
                    sink.done();
                    return true;
                });
        });
        server_.Post("/v1/fail", [](const httplib::Request&, httplib::Response& res) {
            res.status = 500;
            res.set_content("boom", "text/plain");
        });
        server_.Post("/v1/slow", [](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(500ms);
            res.set_content("{}", "application/json");
        });
        server_.Post("/v1/endless", [](const httplib::Request&, httplib::Response& res) {
            res.set_chunked_content_provider("text/event-stream",
                [](size_t /*offset*/, httplib::DataSink& sink) {
                    for (int i = 0; i < 500 && sink.is_writable(); ++i) {
                        const std::string event = std::format("data: {}\n\n", i);
                        if (!sink.write(event.data(), event.size())) return false;
                        std::this_thread::sleep_for(10ms);
                    }
                    sink.done();
                    return true;
                });
        });
        server_.Post("/v1/embeddings", [](const httplib::Request& req, httplib::Response& res) {
            res.status = 201;
            res.set_content(std::format("embedded:{}:{}", req.get_param_value("dim"), req.body),
                            "text/plain");
        });
        server_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"status":"ok"})", "application/json");
        });
        server_.Get("/api/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"status":"prefixed"})", "application/json");
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        REQUIRE(port_ > 0);
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~FakeLlamaServer() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    [[nodiscard]] std::string url(const std::string& prefix = "") const {
        return std::format("http://127.0.0.1:{}{}", port_, prefix);
    }

private:
    httplib::Server server_;
    int port_ = 0;
    std::thread thread_;
};

UpstreamCall make_call(std::string path, std::string payload, bool streaming,
                       std::chrono::milliseconds timeout = 5000ms) {
    UpstreamCall call;
    call.path = std::move(path);
    call.payload = std::move(payload);
    call.streaming = streaming;
    call.deadline = Clock::now() + timeout;
    call.timeout = timeout;
    return call;
}

struct Drained {
    int status = 0;
    std::string content_type;
    std::string body;
    StreamEvent last;
};

// Read until END or FAILED
Drained drain(IChunkStream& stream) {
    Drained out;
    const auto give_up = Clock::now() + 10s;
    for (;;) {
        StreamEvent event = stream.next(give_up);
        switch (event.kind) {
            case StreamEvent::Kind::HEAD:
                out.status = event.status;
                out.content_type = event.content_type;
                break;
            case StreamEvent::Kind::CHUNK:
                out.body += event.data;
                break;
            case StreamEvent::Kind::END:
            case StreamEvent::Kind::FAILED:
            case StreamEvent::Kind::PENDING:
                out.last = std::move(event);
                return out;
        }
    }
}

} // anonymous namespace

TEST_CASE("HttpBackendClient: rejects a malformed base URL", "[backend]") {
    CHECK_THROWS_AS(HttpBackendClient(HttpBackendClient::Config{.base_url = "localhost:8080"}),
                    std::invalid_argument);
    CHECK_THROWS_AS(HttpBackendClient(HttpBackendClient::Config{.base_url = "ftp://host"}),
                    std::invalid_argument);
    CHECK_NOTHROW(HttpBackendClient(HttpBackendClient::Config{.base_url = "http://127.0.0.1:8080"}));
}

TEST_CASE("HttpBackendClient: buffered chat call", "[backend][http]") {
    FakeLlamaServer server;
    HttpBackendClient client(HttpBackendClient::Config{.base_url = server.url()});

    const std::string payload = R"({"model":"m","stream":false,"messages":[]})";
    auto stream = client.call(make_call("/v1/chat/completions", payload, false));
    const auto result = drain(*stream);

    CHECK(result.status == 200);
    CHECK(result.content_type.starts_with("application/json"));
    CHECK(result.body == payload);
    CHECK(result.last.kind == StreamEvent::Kind::END);
    CHECK(client.get_stats().calls == 1);

    SECTION("reading past the end is an error") {
        const auto after = stream->next(Clock::now() + 10ms);
        CHECK(after.kind == StreamEvent::Kind::FAILED);
        CHECK(after.error.category == ErrorCategory::INTERNAL_ERROR);
    }
}

TEST_CASE("HttpBackendClient: streamed chat call keeps SSE framing", "[backend][http][stream]") {
    FakeLlamaServer server;
    HttpBackendClient client(HttpBackendClient::Config{.base_url = server.url()});

    auto stream = client.call(make_call("/v1/chat/completions", R"({"stream":true})", true));
    const auto result = drain(*stream);

    CHECK(result.status == 200);
    CHECK(result.content_type.starts_with("text/event-stream"));
    CHECK(result.body == "data: {\"n\":1}\n\ndata: {\"n\":2}\n\ndata: [DONE]\n\n");
    CHECK(result.last.kind == StreamEvent::Kind::END);
}

TEST_CASE("HttpBackendClient: non-2xx answer is delivered, not a transport failure", "[backend][http]") {
    FakeLlamaServer server;
    HttpBackendClient client(HttpBackendClient::Config{.base_url = server.url()});

    auto stream = client.call(make_call("/v1/fail", "{}", false));
    const auto result = drain(*stream);

    CHECK(result.status == 500);
    CHECK(result.body == "boom");
    CHECK(result.last.kind == StreamEvent::Kind::END);
}

TEST_CASE("HttpBackendClient: connection refused is backend_unavailable", "[backend][http]") {
    // Port 1 on loopback has no listener
    HttpBackendClient client(HttpBackendClient::Config{.base_url = "http://127.0.0.1:1"});

    auto stream = client.call(make_call("/v1/chat/completions", "{}", false));
    const auto result = drain(*stream);
    REQUIRE(result.last.kind == StreamEvent::Kind::FAILED);
    CHECK(result.last.error.category == ErrorCategory::BACKEND_UNAVAILABLE);

    auto fetched = client.fetch("/health", 500ms);
    REQUIRE(fetched.is_error());
    CHECK(fetched.error_category() == ErrorCategory::BACKEND_UNAVAILABLE);
    CHECK(client.get_stats().transport_errors == 1);
}

TEST_CASE("HttpBackendClient: read timeout at the deadline is backend_timeout", "[backend][http][timeout]") {
    FakeLlamaServer server;
    HttpBackendClient client(HttpBackendClient::Config{.base_url = server.url()});

    auto stream = client.call(make_call("/v1/slow", "{}", false, 100ms));
    const auto result = drain(*stream);
    REQUIRE(result.last.kind == StreamEvent::Kind::FAILED);
    CHECK(result.last.error.category == ErrorCategory::BACKEND_TIMEOUT);
}

TEST_CASE("HttpBackendClient: abort stops an endless stream", "[backend][http][stream]") {
    FakeLlamaServer server;
    HttpBackendClient client(HttpBackendClient::Config{.base_url = server.url()});

    auto stream = client.call(make_call("/v1/endless", "{}", true));
    const auto head = stream->next(Clock::now() + 5s);
    REQUIRE(head.kind == StreamEvent::Kind::HEAD);
    const auto first = stream->next(Clock::now() + 5s);
    REQUIRE(first.kind == StreamEvent::Kind::CHUNK);

    const auto start = Clock::now();
    stream->abort();
    const auto after = stream->next(Clock::now() + 5s);
    CHECK(after.kind == StreamEvent::Kind::FAILED);
    CHECK(after.error.category == ErrorCategory::CANCELLED_BY_CLIENT);

    // Joining the reader thread must not wait for the backend to finish
    stream.reset();
    CHECK(Clock::now() - start < 2s);
}

TEST_CASE("HttpBackendClient: small buffer still delivers every byte", "[backend][http][stream]") {
    FakeLlamaServer server;
    HttpBackendClient client(HttpBackendClient::Config{.base_url = server.url(),
                                                       .max_buffered_bytes = 4});

    auto stream = client.call(make_call("/v1/chat/completions", "{}", true));
    std::this_thread::sleep_for(50ms);  // let the reader fill the buffer
    const auto result = drain(*stream);
    CHECK(result.body == "data: {\"n\":1}\n\ndata: {\"n\":2}\n\ndata: [DONE]\n\n");
}

TEST_CASE("HttpBackendClient: forward relays method, query and status verbatim", "[backend][http][passthrough]") {
    FakeLlamaServer server;
    HttpBackendClient client(HttpBackendClient::Config{.base_url = server.url()});

    ForwardRequest request;
    request.method = "POST";
    request.target = "/v1/embeddings?dim=8";
    request.body = "text";
    request.timeout = 2000ms;

    auto reply = client.forward(request);
    REQUIRE(reply.is_ok());
    CHECK(reply.value().status == 201);
    CHECK(reply.value().body == "embedded:8:text");
    CHECK(reply.value().content_type.starts_with("text/plain"));

    SECTION("unknown route is still a reply") {
        request.target = "/v1/nowhere";
        auto missing = client.forward(request);
        REQUIRE(missing.is_ok());
        CHECK(missing.value().status == 404);
    }
}

TEST_CASE("HttpBackendClient: fetch honours the base URL prefix", "[backend][http]") {
    FakeLlamaServer server;

    HttpBackendClient plain(HttpBackendClient::Config{.base_url = server.url()});
    auto health = plain.fetch("/health", 1000ms);
    REQUIRE(health.is_ok());
    CHECK(health.value().body == R"({"status":"ok"})");

    HttpBackendClient prefixed(HttpBackendClient::Config{.base_url = server.url("/api/")});
    auto prefixed_health = prefixed.fetch("/health", 1000ms);
    REQUIRE(prefixed_health.is_ok());
    CHECK(prefixed_health.value().body == R"({"status":"prefixed"})");
}

TEST_CASE("Backend inspection: health and model listing", "[backend][http]") {
    SECTION("reachable backend") {
        FakeLlamaServer server;
        HttpBackendClient client(HttpBackendClient::Config{.base_url = server.url()});

        const auto health = check_backend_health(client, 1000ms);
        CHECK(health.reachable);
        CHECK(backend_health_to_json(health) ==
              R"({"status":"ok","llama_server":{"status":"ok"}})");

        // No /v1/models route: the backend's 404 is relayed
        const auto models = list_backend_models(client, 1000ms, "gpt-oss-20b");
        CHECK(models.status == 404);
    }

    SECTION("unreachable backend") {
        HttpBackendClient client(HttpBackendClient::Config{.base_url = "http://127.0.0.1:1"});

        const auto health = check_backend_health(client, 200ms);
        CHECK_FALSE(health.reachable);
        CHECK(backend_health_to_json(health).starts_with(R"({"status":"error","error":)"));

        const auto models = list_backend_models(client, 200ms, "gpt-oss-20b");
        CHECK(models.status == 200);
        CHECK(models.body ==
              R"({"object":"list","data":[{"id":"gpt-oss-20b","object":"model","owned_by":"local"}]})");
    }
}
