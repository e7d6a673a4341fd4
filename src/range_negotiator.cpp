#include "bulkget/range_negotiator.hpp"
#include "bulkget/error.hpp"
#include "bulkget/log.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

#include <fmt/format.h>

namespace bulkget {

namespace {

std::optional<std::uint64_t> parseUnsigned(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

std::optional<std::uint64_t> parseContentLength(const HttpResponseHead& head) {
    const auto value = head.header("Content-Length");
    if (!value) {
        return std::nullopt;
    }
    return parseUnsigned(*value);
}

RangeProbe RangeNegotiator::probe(const std::string& url) const {
    const HttpResponseHead head = client_.head(url, options_);

    RangeProbe result;
    if (head.status == 405 || head.status == 501) {
        logger()->debug("{} does not support HEAD ({}), size unknown", url, head.status);
        return result;
    }
    if (head.status >= 400) {
        throw TransferError::http(head.status, url);
    }

    if (const auto ranges = head.header("Accept-Ranges")) {
        result.supports_range = lowercase(*ranges).find("bytes") != std::string::npos;
    }
    result.content_length = parseContentLength(head);
    result.validators.etag = head.header("ETag");
    result.validators.last_modified = head.header("Last-Modified");

    logger()->debug("Probe {}: ranges={} length={} etag={}", url, result.supports_range,
                    result.content_length ? std::to_string(*result.content_length) : "unknown",
                    result.validators.etag.value_or("none"));
    return result;
}

std::string RangeNegotiator::buildRangeHeader(std::uint64_t start, std::optional<std::uint64_t> end) {
    if (!end) {
        return fmt::format("bytes={}-", start);
    }
    if (*end < start) {
        throw TransferError::validation(fmt::format("Invalid byte range {}-{}", start, *end));
    }
    return fmt::format("bytes={}-{}", start, *end);
}

std::optional<ContentRange> RangeNegotiator::parseContentRange(const std::string& value) {
    static const std::regex pattern(R"(^\s*bytes\s+(\d+)-(\d+)/(\d+|\*)\s*$)", std::regex::icase);
    std::smatch match;
    if (!std::regex_match(value, match, pattern)) {
        return std::nullopt;
    }

    const auto start = parseUnsigned(match[1].str());
    const auto end = parseUnsigned(match[2].str());
    if (!start || !end || *end < *start) {
        return std::nullopt;
    }

    ContentRange range{*start, *end, std::nullopt};
    if (match[3].str() != "*") {
        range.total = parseUnsigned(match[3].str());
        if (!range.total) {
            return std::nullopt;
        }
    }
    return range;
}

RangeValidation RangeNegotiator::validateRangeResponse(const HttpResponseHead& response,
                                                       std::uint64_t expected_start) {
    RangeValidation result;
    if (response.status != 206) {
        result.reason = fmt::format("Server returned {} instead of 206", response.status);
        return result;
    }

    const auto header = response.header("Content-Range");
    if (!header) {
        result.reason = "No Content-Range header in response";
        return result;
    }

    const auto range = parseContentRange(*header);
    if (!range) {
        result.reason = "Invalid Content-Range format";
        return result;
    }
    if (range->start != expected_start) {
        result.reason = fmt::format("Range mismatch: expected {}, got {}", expected_start, range->start);
        return result;
    }

    result.valid = true;
    result.content_range = range;
    return result;
}

} // namespace bulkget
