#include <catch2/catch.hpp>
#include <eventline/http/response_parser.hpp>
#include <eventline/http/http_common.hpp>

#include <string>

using namespace eventline::http;

TEST_CASE("HTTP response parser - basic head", "[http][parser]") {
    response_head_parser parser;

    std::string response =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/event-stream\r\n"
        "Cache-Control: no-cache\r\n"
        "\r\n"
        "data: first\n\n";

    auto [result, consumed] = parser.parse(response);

    REQUIRE(result == parse_result::complete);
    REQUIRE(parser.status_code() == 200);
    REQUIRE(parser.status_text() == "OK");
    REQUIRE(parser.version() == "HTTP/1.1");
    REQUIRE(parser.headers().get("content-type") == "text/event-stream");
    REQUIRE(response.substr(consumed) == "data: first\n\n");
}

TEST_CASE("HTTP response parser - byte by byte", "[http][parser]") {
    response_head_parser parser;

    std::string response =
        "HTTP/1.1 404 Not Found\n"
        "X-A: 1\n"
        "\n";

    parse_result result = parse_result::need_more;
    for (size_t i = 0; i < response.size(); ++i) {
        auto [r, consumed] = parser.parse(std::string_view(response).substr(i, 1));
        REQUIRE(consumed == 1);
        result = r;
        if (i + 1 < response.size()) {
            REQUIRE(result == parse_result::need_more);
        }
    }
    REQUIRE(result == parse_result::complete);
    REQUIRE(parser.status_code() == 404);
    REQUIRE(parser.status_text() == "Not Found");
    REQUIRE(parser.headers().get("X-A") == "1");
}

TEST_CASE("HTTP response parser - interim responses are skipped", "[http][parser]") {
    response_head_parser parser;

    std::string response =
        "HTTP/1.1 100 Continue\r\n"
        "\r\n"
        "HTTP/1.1 103 Early Hints\r\n"
        "Link: </style.css>\r\n"
        "\r\n"
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/event-stream\r\n"
        "\r\n";

    auto [result, consumed] = parser.parse(response);

    REQUIRE(result == parse_result::complete);
    REQUIRE(consumed == response.size());
    REQUIRE(parser.status_code() == 200);
    REQUIRE_FALSE(parser.headers().contains("Link"));
}

TEST_CASE("HTTP response parser - headers", "[http][parser]") {
    response_head_parser parser;

    std::string response =
        "HTTP/1.1 200 OK\r\n"
        "Set-Cookie: a=1\r\n"
        "Set-Cookie: b=2\r\n"
        "X-Folded: first\r\n"
        "   second\r\n"
        "X-Space:    padded   \r\n"
        "\r\n";

    auto [result, consumed] = parser.parse(response);

    REQUIRE(result == parse_result::complete);
    auto headers = parser.take_headers();
    REQUIRE(headers.size() == 4);
    REQUIRE(headers.get("set-cookie") == "a=1");
    REQUIRE(headers.get("X-Folded") == "first second");
    REQUIRE(headers.get("X-Space") == "padded");
}

TEST_CASE("HTTP response parser - status line without reason", "[http][parser]") {
    response_head_parser parser;
    auto [result, consumed] = parser.parse("HTTP/1.0 204\r\n\r\n");
    REQUIRE(result == parse_result::complete);
    REQUIRE(parser.status_code() == 204);
    REQUIRE(parser.status_text().empty());
}

TEST_CASE("HTTP response parser - errors", "[http][parser][errors]") {
    SECTION("not HTTP") {
        response_head_parser parser;
        auto [result, consumed] = parser.parse("SSH-2.0-OpenSSH\r\n");
        REQUIRE(result == parse_result::error);
        REQUIRE(parser.has_error());
        REQUIRE_FALSE(parser.error_message().empty());
    }

    SECTION("bad status code") {
        response_head_parser parser;
        auto [result, consumed] = parser.parse("HTTP/1.1 2000 OK\r\n\r\n");
        REQUIRE(result == parse_result::error);
    }

    SECTION("header without colon") {
        response_head_parser parser;
        auto [result, consumed] = parser.parse("HTTP/1.1 200 OK\r\nbroken\r\n\r\n");
        REQUIRE(result == parse_result::error);
    }

    SECTION("head too large") {
        response_head_parser parser(64);
        std::string response = "HTTP/1.1 200 OK\r\nX-Long: " + std::string(100, 'a') + "\r\n\r\n";
        auto [result, consumed] = parser.parse(response);
        REQUIRE(result == parse_result::error);
        REQUIRE(std::string(parser.error_message()).find("64") != std::string::npos);
    }
}

TEST_CASE("HTTP body decoder - framing selection", "[http][body]") {
    REQUIRE(body_decoder::for_response(200, {}).framing() == body_framing::until_close);
    REQUIRE(body_decoder::for_response(204, {}).framing() == body_framing::none);
    REQUIRE(body_decoder::for_response(304, {{"Content-Length", "10"}}).framing() == body_framing::none);
    REQUIRE(body_decoder::for_response(200, {{"Content-Length", "10"}}).framing() == body_framing::content_length);
    REQUIRE(body_decoder::for_response(200, {{"Transfer-Encoding", "gzip, chunked"}}).framing() ==
            body_framing::chunked);
    REQUIRE(body_decoder::for_response(200, {{"Transfer-Encoding", "chunked"}, {"Content-Length", "3"}})
                .framing() == body_framing::chunked);
    REQUIRE(body_decoder::for_response(200, {{"Transfer-Encoding", "gzip"}}).framing() ==
            body_framing::until_close);
}

TEST_CASE("HTTP body decoder - content length", "[http][body]") {
    auto decoder = body_decoder::for_response(200, {{"Content-Length", "5"}});
    std::string out;

    REQUIRE(decoder.decode("abc", out) == parse_result::need_more);
    REQUIRE_FALSE(decoder.finish_on_close());
    REQUIRE(decoder.decode("defgh", out) == parse_result::complete);
    REQUIRE(out == "abcde");
    REQUIRE(decoder.done());
    REQUIRE(decoder.finish_on_close());

    auto bad = body_decoder::for_response(200, {{"Content-Length", "12x"}});
    REQUIRE(bad.decode("data", out) == parse_result::error);
    REQUIRE_FALSE(bad.done());
}

TEST_CASE("HTTP body decoder - chunked", "[http][body]") {
    std::string wire =
        "7\r\ndata: a\r\n"
        "3;ext=1\r\n\n\n\n\r\n"
        "0\r\n"
        "Trailer: x\r\n"
        "\r\n";

    SECTION("whole") {
        auto decoder = body_decoder::for_response(200, {{"Transfer-Encoding", "chunked"}});
        std::string out;
        REQUIRE(decoder.decode(wire, out) == parse_result::complete);
        REQUIRE(out == "data: a\n\n\n");
    }

    SECTION("byte by byte") {
        auto decoder = body_decoder::for_response(200, {{"Transfer-Encoding", "chunked"}});
        std::string out;
        parse_result result = parse_result::need_more;
        for (char c : wire) {
            result = decoder.decode(std::string_view(&c, 1), out);
            REQUIRE(result != parse_result::error);
        }
        REQUIRE(result == parse_result::complete);
        REQUIRE(out == "data: a\n\n\n");
    }

    SECTION("closing mid-body is not a clean end") {
        auto decoder = body_decoder::for_response(200, {{"Transfer-Encoding", "chunked"}});
        std::string out;
        REQUIRE(decoder.decode("7\r\ndata", out) == parse_result::need_more);
        REQUIRE_FALSE(decoder.finish_on_close());
    }

    SECTION("bad chunk size") {
        auto decoder = body_decoder::for_response(200, {{"Transfer-Encoding", "chunked"}});
        std::string out;
        REQUIRE(decoder.decode("zz\r\n", out) == parse_result::error);
        REQUIRE_FALSE(decoder.error_message().empty());
    }

    SECTION("missing CRLF after data") {
        auto decoder = body_decoder::for_response(200, {{"Transfer-Encoding", "chunked"}});
        std::string out;
        REQUIRE(decoder.decode("2\r\nabXY\r\n", out) == parse_result::error);
    }
}

TEST_CASE("HTTP body decoder - until close", "[http][body]") {
    auto decoder = body_decoder::for_response(200, {});
    std::string out;
    REQUIRE(decoder.decode("any", out) == parse_result::need_more);
    REQUIRE(decoder.decode(" bytes", out) == parse_result::need_more);
    REQUIRE(out == "any bytes");
    REQUIRE(decoder.finish_on_close());
}
