#include <catch2/catch.hpp>

#include "bulkget/range_negotiator.hpp"
#include "test_support.hpp"

using namespace bulkget;
using bulkget::test::FakeHttpClient;

namespace {

HttpResponseHead partialResponse(const std::string& content_range) {
    HttpResponseHead head;
    head.status = 206;
    head.headers["Content-Range"] = content_range;
    return head;
}

} // namespace

TEST_CASE("Range headers", "[range]") {
    REQUIRE(RangeNegotiator::buildRangeHeader(0) == "bytes=0-");
    REQUIRE(RangeNegotiator::buildRangeHeader(1024) == "bytes=1024-");
    REQUIRE(RangeNegotiator::buildRangeHeader(100, 199) == "bytes=100-199");
    REQUIRE(RangeNegotiator::buildRangeHeader(5, 5) == "bytes=5-5");

    REQUIRE_THROWS_AS(RangeNegotiator::buildRangeHeader(10, 9), TransferError);
}

TEST_CASE("Content-Range parsing", "[range]") {
    const auto full = RangeNegotiator::parseContentRange("bytes 100-199/1000");
    REQUIRE(full);
    REQUIRE(full->start == 100);
    REQUIRE(full->end == 199);
    REQUIRE(full->total == std::optional<std::uint64_t>(1000));

    const auto unknown_total = RangeNegotiator::parseContentRange("BYTES 0-9/*");
    REQUIRE(unknown_total);
    REQUIRE_FALSE(unknown_total->total);

    REQUIRE_FALSE(RangeNegotiator::parseContentRange("bytes 10-5/100"));
    REQUIRE_FALSE(RangeNegotiator::parseContentRange("bytes */100"));
    REQUIRE_FALSE(RangeNegotiator::parseContentRange("items 0-9/10"));
    REQUIRE_FALSE(RangeNegotiator::parseContentRange(""));
}

TEST_CASE("Range response validation", "[range]") {
    SECTION("a matching 206 is accepted") {
        const auto result = RangeNegotiator::validateRangeResponse(partialResponse("bytes 500-999/1000"), 500);
        REQUIRE(result.valid);
        REQUIRE(result.content_range->total == std::optional<std::uint64_t>(1000));
    }

    SECTION("a 200 means the range was ignored") {
        HttpResponseHead head;
        head.status = 200;
        const auto result = RangeNegotiator::validateRangeResponse(head, 500);
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.reason == "Server returned 200 instead of 206");
    }

    SECTION("a 206 without Content-Range") {
        HttpResponseHead head;
        head.status = 206;
        const auto result = RangeNegotiator::validateRangeResponse(head, 500);
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.reason == "No Content-Range header in response");
    }

    SECTION("a malformed Content-Range") {
        const auto result = RangeNegotiator::validateRangeResponse(partialResponse("bytes=500-999"), 500);
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.reason == "Invalid Content-Range format");
    }

    SECTION("a range starting elsewhere") {
        const auto result = RangeNegotiator::validateRangeResponse(partialResponse("bytes 0-999/1000"), 500);
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.reason == "Range mismatch: expected 500, got 0");
    }
}

TEST_CASE("HEAD probe", "[range]") {
    FakeHttpClient client;
    const RangeNegotiator negotiator(client, HttpRequestOptions{});

    SECTION("reports range support, size and validators") {
        FakeHttpClient::Resource r;
        r.body = std::string(1234, 'x');
        r.etag = "\"abc\"";
        r.last_modified = "Wed, 21 Oct 2015 07:28:00 GMT";
        client.serve("https://example.com/f", r);

        const auto probe = negotiator.probe("https://example.com/f");
        REQUIRE(probe.supports_range);
        REQUIRE(probe.content_length == std::optional<std::uint64_t>(1234));
        REQUIRE(probe.validators.etag == std::optional<std::string>("\"abc\""));
        REQUIRE(probe.validators.last_modified);
    }

    SECTION("no Accept-Ranges means no range support") {
        FakeHttpClient::Resource r;
        r.body = "data";
        r.accept_ranges = false;
        client.serve("https://example.com/f", r);
        REQUIRE_FALSE(negotiator.probe("https://example.com/f").supports_range);
    }

    SECTION("HEAD not allowed leaves the size unknown") {
        FakeHttpClient::Resource r;
        r.body = "data";
        r.head_status = 405;
        client.serve("https://example.com/f", r);

        const auto probe = negotiator.probe("https://example.com/f");
        REQUIRE_FALSE(probe.supports_range);
        REQUIRE_FALSE(probe.content_length);
    }

    SECTION("a missing resource is an HTTP error") {
        try {
            (void)negotiator.probe("https://example.com/missing");
            FAIL("probe should throw");
        } catch (const TransferError& ex) {
            REQUIRE(ex.kind() == ErrorKind::Http);
            REQUIRE(ex.httpStatus() == 404);
        }
    }
}

TEST_CASE("Response headers are case-insensitive", "[range]") {
    HttpResponseHead head;
    head.headers["content-length"] = "77";
    REQUIRE(head.header("Content-Length") == std::optional<std::string>("77"));
    REQUIRE(parseContentLength(head) == std::optional<std::uint64_t>(77));

    head.headers["CONTENT-LENGTH"] = "abc";
    REQUIRE(head.headers.size() == 1);
    REQUIRE_FALSE(parseContentLength(head));
}
