#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

#include "http/ChunkBufferPool.hpp"
#include "http/ResponseFormatter.hpp"
#include "http/Transport.hpp"

using namespace http;

TEST_CASE("ResponseFormatter - texts", "[http][formatter]") {

    SECTION("Head without authentication") {
        ResponseHead head;
        head.status_code = 201;
        head.reason = "Created";
        head.headers = {{"Location", "/items/1"}};
        REQUIRE(formatResponseHead(head, "https://api.test/items", AuthType::None) ==
                "Status: 201 Created\nRequest URL: https://api.test/items\n\nResponse Headers:\n"
                "  Location: /items/1\n\nResponse Body:\n");
    }

    SECTION("Head with authentication") {
        ResponseHead head;
        head.status_code = 200;
        head.reason = "OK";
        auto text = formatResponseHead(head, "https://api.test/", AuthType::ApiKey);
        REQUIRE(text.find("Request URL: https://api.test/\nAuthentication: ApiKey\n") != std::string::npos);
    }

    SECTION("JSON content types") {
        REQUIRE(isJsonContentType("application/json"));
        REQUIRE(isJsonContentType("application/problem+JSON; charset=utf-8"));
        REQUIRE_FALSE(isJsonContentType("text/plain"));
        REQUIRE_FALSE(isJsonContentType(""));
    }

    SECTION("Pretty printing leaves invalid input untouched") {
        std::string out = "unchanged";
        REQUIRE_FALSE(tryPrettyPrintJson("{oops", out));
        REQUIRE(out == "unchanged");
        REQUIRE(tryPrettyPrintJson("[1]", out));
        REQUIRE(out == "[\n  1\n]");
    }

    SECTION("Error and notice texts") {
        REQUIRE(truncationNotice(10 * 1024 * 1024) == "\n[Response truncated - exceeded 10MB limit]\n");
        REQUIRE(errorText("boom", "https://x.test/") == "Error: boom\n\nRequest URL: https://x.test/");
        REQUIRE(timeoutText(250, "https://x.test/") ==
                "Error: Request timed out after 250 ms\n\nRequest URL: https://x.test/");
        REQUIRE(cancelledText() == "Request was cancelled.");
        REQUIRE(completionMessage("POST", std::chrono::milliseconds(42), 1536) ==
                "HTTP POST completed. Time: 42 ms, Size: 1.5 KB");
    }
}

TEST_CASE("ChunkBufferPool - reuse", "[http][pool]") {
    ChunkBufferPool pool(1024, 2);
    REQUIRE(pool.chunkSize() == 1024);

    SECTION("Released buffers are handed out again") {
        {
            auto a = pool.acquire();
            auto b = pool.acquire();
            REQUIRE(a.get() != b.get());
        }
        REQUIRE(pool.stats().available == 2);
        auto c = pool.acquire();
        REQUIRE(pool.stats().pool_hits == 1);
        REQUIRE(pool.stats().available == 1);
    }

    SECTION("Retention is bounded") {
        {
            auto a = pool.acquire();
            auto b = pool.acquire();
            auto c = pool.acquire();
        }
        REQUIRE(pool.stats().available == 2);
        REQUIRE(pool.stats().acquisitions == 3);
    }
}

TEST_CASE("ResponseHead - header lookup", "[http][transport]") {
    ResponseHead head;
    head.headers = {{"Content-Type", "application/json"}, {"X-Trace", "a"}, {"x-trace", "b"}};

    REQUIRE(head.headerValue("content-type") == "application/json");
    REQUIRE(head.headerValue("X-TRACE") == "a");
    REQUIRE(head.headerValue("Missing").empty());
}
