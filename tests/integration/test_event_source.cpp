#include <catch2/catch.hpp>
#include <eventline/sse/event_source.hpp>
#include <eventline/runtime/event_loop.hpp>

#include "../support/sse_test_server.hpp"
#include "../test_main.cpp"  // For scaled timeouts

#include <cerrno>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using namespace eventline;
using namespace eventline::sse;
using namespace eventline::test;

namespace {

struct collected {
    int opens = 0;
    std::vector<message_event> messages;
    std::vector<error_event> errors;

    void attach(event_source& source) {
        source.on_open([this](const event&) { ++opens; });
        source.on_message([this](const event& ev) {
            messages.push_back(std::get<message_event>(ev));
        });
        source.on_error([this](const event& ev) {
            errors.push_back(std::get<error_event>(ev));
        });
    }
};

} // namespace

TEST_CASE("event_source receives events and resumes with lastEventId", "[integration][event_source]") {
    runtime::event_loop loop;
    sse_test_server server(loop);
    server.add_response(scripted_response{.chunks = {
        serialize_event({.id = "1", .data = "one"}),
        serialize_event({.id = "2", .type = "update", .data = "two\nlines"}),
    }});
    server.add_response(scripted_response{
        .chunks = {serialize_event({.id = "3", .data = "three"})},
        .keep_open = true});

    event_source source(loop, server.url("/events?topic=a"));
    collected got;
    got.attach(source);
    std::vector<std::string> updates;
    source.add_event_listener("update", [&](const event& ev) {
        updates.push_back(std::get<message_event>(ev).data);
    });

    REQUIRE(source.state() == ready_state::connecting);
    REQUIRE(loop.run_until([&] { return got.messages.size() == 2; }, scaled_ms(5000)));

    CHECK(got.opens == 2);
    CHECK(source.state() == ready_state::open);
    CHECK(source.last_event_id() == "3");

    // "message" handlers see only the default type
    CHECK(got.messages[0].data == "one");
    CHECK(got.messages[0].last_event_id == "1");
    CHECK(got.messages[1].data == "three");
    CHECK(updates == std::vector<std::string>{"two\nlines"});

    // The end of the first stream is reported once, without details
    REQUIRE(got.errors.size() == 1);
    CHECK_FALSE(got.errors[0].response);
    CHECK_FALSE(got.errors[0].error);

    REQUIRE(server.requests().size() == 2);
    CHECK(server.requests()[0].starts_with("GET /events?topic=a HTTP/1.1\r\n"));
    CHECK(server.requests()[1].starts_with("GET /events?topic=a&lastEventId=2 HTTP/1.1\r\n"));
}

TEST_CASE("event_source retries after a rejected response", "[integration][event_source]") {
    runtime::event_loop loop;
    sse_test_server server(loop);
    server.add_response(scripted_response{
        .head = "HTTP/1.1 503 Service Unavailable\r\n"
                "Content-Length: 0\r\n"
                "\r\n"});
    server.add_response(scripted_response{
        .chunks = {serialize_event({.data = "back"})},
        .keep_open = true});

    event_source source(loop, server.url());
    collected got;
    got.attach(source);

    REQUIRE(loop.run_until([&] { return got.messages.size() == 1; }, scaled_ms(5000)));
    CHECK(got.messages[0].data == "back");
    CHECK(got.opens == 1);

    // The rejected response, then the notice that a retry is scheduled
    REQUIRE(got.errors.size() == 2);
    REQUIRE(got.errors[0].response);
    CHECK(got.errors[0].response->status == 503);
    CHECK(got.errors[0].response->status_text == "Service Unavailable");
    CHECK_FALSE(got.errors[1].response);
    CHECK_FALSE(got.errors[1].error);
    CHECK(server.accepted() == 2);
}

TEST_CASE("event_source close stops the stream", "[integration][event_source]") {
    runtime::event_loop loop;
    sse_test_server server(loop);
    server.add_response(scripted_response{
        .chunks = {serialize_event({.data = "first"}), serialize_event({.data = "second"})},
        .gap = std::chrono::milliseconds(10),
        .keep_open = true});

    event_source source(loop, server.url());
    collected got;
    got.attach(source);
    source.add_event_listener("message", [&](const event&) { source.close(); });

    REQUIRE(loop.run_until([&] { return server.finished() == 1; }, scaled_ms(5000)));
    CHECK(source.state() == ready_state::closed);
    REQUIRE(got.messages.size() == 1);
    CHECK(got.messages[0].data == "first");

    loop.run_for(scaled_ms(50));
    CHECK(got.messages.size() == 1);
    CHECK(got.errors.empty());
    CHECK(server.accepted() == 1);
}

TEST_CASE("event_source sends credentials when enabled", "[integration][event_source]") {
    runtime::event_loop loop;
    sse_test_server server(loop);
    server.add_response(scripted_response{.keep_open = true});

    client_config config;
    config.with_credentials = true;
    config.headers.add("X-Client", "tests");
    http_transport_config transport_config;
    transport_config.cookie = "a=b";

    auto url = "http://u:p@127.0.0.1:" + std::to_string(server.port()) + "/events";
    event_source source(loop, url, config, transport_config);
    collected got;
    got.attach(source);
    REQUIRE(source.with_credentials());

    REQUIRE(loop.run_until([&] { return got.opens == 1; }, scaled_ms(5000)));
    REQUIRE(server.requests().size() == 1);
    const auto& head = server.requests()[0];
    CHECK(head.find("\r\nAuthorization: Basic dTpw") != std::string::npos);
    CHECK(head.find("\r\nCookie: a=b") != std::string::npos);
    CHECK(head.find("\r\nX-Client: tests") != std::string::npos);
}

TEST_CASE("event_source reconnects a silent stream", "[integration][event_source][heartbeat]") {
    runtime::event_loop loop;
    sse_test_server server(loop);
    server.add_response(scripted_response{.keep_open = true});

    client_config config;
    config.heartbeat_timeout = std::chrono::milliseconds(1000);
    event_source source(loop, server.url(), config);
    collected got;
    got.attach(source);

    REQUIRE(loop.run_until([&] { return !got.errors.empty(); }, scaled_ms(5000)));
    REQUIRE(got.errors[0].error);
    CHECK(got.errors[0].error->code == ETIMEDOUT);
    CHECK(got.errors[0].error->message ==
          "No activity within 1000 milliseconds. 0 chars received. Reconnecting.");
    CHECK(source.state() == ready_state::connecting);

    REQUIRE(loop.run_until([&] { return got.opens == 2; }, scaled_ms(5000)));
    CHECK(server.accepted() == 2);
}

TEST_CASE("event_source rejects unusable URLs", "[integration][event_source]") {
    runtime::event_loop loop;
    CHECK_THROWS_AS(event_source(loop, ""), std::invalid_argument);
    CHECK_THROWS_AS(event_source(loop, "ftp://127.0.0.1/feed"), std::invalid_argument);
    CHECK_THROWS_AS(event_source(loop, "/relative/path"), std::invalid_argument);
}
