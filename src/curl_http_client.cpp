#include "bulkget/curl_http_client.hpp"
#include "bulkget/detail/curl_utils.hpp"
#include "bulkget/error.hpp"
#include "bulkget/log.hpp"

#include <cstdlib>
#include <exception>
#include <string>

#include <fmt/format.h>

namespace bulkget {

namespace {

struct ExchangeContext {
    HttpResponseHead head;
    const HttpClient::HeadHandler* on_head{nullptr};
    const HttpClient::DataHandler* on_data{nullptr};
    bool head_delivered{false};
    bool aborted{false};
    std::exception_ptr error;
};

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

// Every "HTTP/" status line starts a new response (redirects, 100 Continue),
// so only the final response's headers survive.
size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<ExchangeContext*>(userdata);
    const size_t total = size * nitems;
    const std::string line = trim(std::string(buffer, total));

    if (line.rfind("HTTP/", 0) == 0) {
        ctx->head.headers.clear();
        const auto space = line.find(' ');
        ctx->head.status = space == std::string::npos ? 0 : std::strtol(line.c_str() + space + 1, nullptr, 10);
        return total;
    }

    const auto colon = line.find(':');
    if (colon != std::string::npos) {
        ctx->head.headers[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
    }
    return total;
}

bool deliverHead(ExchangeContext& ctx) {
    ctx.head_delivered = true;
    if (ctx.on_head && !(*ctx.on_head)(ctx.head)) {
        ctx.aborted = true;
        return false;
    }
    return true;
}

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<ExchangeContext*>(userdata);
    const size_t total = size * nmemb;
    // handler exceptions must not unwind through libcurl
    try {
        if (!ctx->head_delivered && !deliverHead(*ctx)) {
            return 0;
        }
        if (total == 0) {
            return 0;
        }
        if (ctx->on_data && !(*ctx->on_data)(ptr, total)) {
            ctx->aborted = true;
            return 0;
        }
    } catch (...) {
        ctx->error = std::current_exception();
        return 0;
    }
    return total;
}

void applyOptions(CURL* curl, const std::string& url, const HttpRequestOptions& options, char* error_buffer) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options.low_speed_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.verify_tls ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);

    long resolve = CURL_IPRESOLVE_WHATEVER;
    if (options.ip_family == IpFamily::V4) {
        resolve = CURL_IPRESOLVE_V4;
    } else if (options.ip_family == IpFamily::V6) {
        resolve = CURL_IPRESOLVE_V6;
    }
    curl_easy_setopt(curl, CURLOPT_IPRESOLVE, resolve);
}

TransferError curlFailure(CURLcode code, const char* error_buffer, const std::string& url) {
    const std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(code);
    return TransferError::network(fmt::format("Request to {} failed: {}", url, detail));
}

} // namespace

CurlHttpClient::CurlHttpClient() {
    detail::ensureCurlInitialized();
}

HttpResponseHead CurlHttpClient::head(const std::string& url, const HttpRequestOptions& options) {
    auto curl = detail::makeCurlHandle();
    char error_buffer[CURL_ERROR_SIZE] = {};
    ExchangeContext ctx;

    applyOptions(curl.get(), url, options, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw curlFailure(res, error_buffer, url);
    }

    long code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
    ctx.head.status = code;
    logger()->debug("HEAD {} -> {}", url, code);
    return ctx.head;
}

HttpFetchOutcome CurlHttpClient::get(const std::string& url,
                                     const std::vector<std::string>& extra_headers,
                                     const HttpRequestOptions& options,
                                     const HeadHandler& on_head,
                                     const DataHandler& on_data) {
    auto curl = detail::makeCurlHandle();
    char error_buffer[CURL_ERROR_SIZE] = {};
    ExchangeContext ctx;
    ctx.on_head = &on_head;
    ctx.on_data = &on_data;

    detail::CurlHeaderList header_list{nullptr, &curl_slist_free_all};
    for (const auto& line : extra_headers) {
        curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
        if (!appended) {
            throw TransferError::network("Failed to build request headers");
        }
        header_list.release();
        header_list.reset(appended);
    }

    applyOptions(curl.get(), url, options, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    if (header_list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    }
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &headerCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);

    const CURLcode res = curl_easy_perform(curl.get());
    if (ctx.error) {
        std::rethrow_exception(ctx.error);
    }

    HttpFetchOutcome outcome;
    if (ctx.aborted) {
        outcome.head = std::move(ctx.head);
        outcome.aborted_by_handler = true;
        return outcome;
    }
    if (res != CURLE_OK) {
        throw curlFailure(res, error_buffer, url);
    }

    long code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
    ctx.head.status = code;
    // empty body: the head was never handed over
    if (!ctx.head_delivered) {
        deliverHead(ctx);
    }
    outcome.head = std::move(ctx.head);
    outcome.aborted_by_handler = ctx.aborted;
    return outcome;
}

} // namespace bulkget
