#pragma once

#include "http_client.hpp"
#include "options.hpp"
#include "transfer_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace bulkget {

struct ContentRange {
    std::uint64_t start{0};
    std::uint64_t end{0};
    std::optional<std::uint64_t> total; // absent for "*"
};

struct RangeProbe {
    bool supports_range{false};
    std::optional<std::uint64_t> content_length;
    Validators validators;
};

struct RangeValidation {
    bool valid{false};
    std::string reason;
    std::optional<ContentRange> content_range;
};

class RangeNegotiator {
public:
    RangeNegotiator(HttpClient& client, HttpRequestOptions options)
        : client_(client), options_(std::move(options)) {}

    // HEAD probe. 405/501 answer with an unknown-size, non-resumable probe;
    // other 4xx/5xx throw TransferError (Http).
    [[nodiscard]] RangeProbe probe(const std::string& url) const;

    // "bytes=<start>-" or "bytes=<start>-<end>".
    [[nodiscard]] static std::string buildRangeHeader(std::uint64_t start,
                                                      std::optional<std::uint64_t> end = std::nullopt);

    [[nodiscard]] static RangeValidation validateRangeResponse(const HttpResponseHead& response,
                                                               std::uint64_t expected_start);

    [[nodiscard]] static std::optional<ContentRange> parseContentRange(const std::string& value);

private:
    HttpClient& client_;
    HttpRequestOptions options_;
};

// Decimal Content-Length, or nullopt when absent or not a number.
[[nodiscard]] std::optional<std::uint64_t> parseContentLength(const HttpResponseHead& head);

} // namespace bulkget
