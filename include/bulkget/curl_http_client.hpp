#pragma once

#include "http_client.hpp"

namespace bulkget {

// libcurl transport. Every call uses its own easy handle, so one instance can
// serve all worker threads.
class CurlHttpClient final : public HttpClient {
public:
    CurlHttpClient();

    HttpResponseHead head(const std::string& url, const HttpRequestOptions& options) override;

    HttpFetchOutcome get(const std::string& url,
                         const std::vector<std::string>& extra_headers,
                         const HttpRequestOptions& options,
                         const HeadHandler& on_head,
                         const DataHandler& on_data) override;
};

} // namespace bulkget
