#pragma once

#include "options.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bulkget {

struct CaseInsensitiveLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

struct HttpResponseHead {
    long status{0};
    HeaderMap headers;

    [[nodiscard]] std::optional<std::string> header(const std::string& name) const;
};

struct HttpFetchOutcome {
    HttpResponseHead head;
    // A handler returned false; the body was not read to the end.
    bool aborted_by_handler{false};
};

// Transport seam for HTTP. Implementations throw TransferError (Network) when
// the exchange itself fails; any status code is returned to the caller.
class HttpClient {
public:
    // Called once with the final response head before the first body byte.
    // Returning false stops the transfer.
    using HeadHandler = std::function<bool(const HttpResponseHead&)>;
    // Returning false stops the transfer.
    using DataHandler = std::function<bool(const char* data, std::size_t size)>;

    virtual ~HttpClient() = default;

    virtual HttpResponseHead head(const std::string& url, const HttpRequestOptions& options) = 0;

    // `extra_headers` are complete header lines, e.g. "Range: bytes=100-".
    // Exceptions thrown by the handlers propagate out of get().
    virtual HttpFetchOutcome get(const std::string& url,
                                 const std::vector<std::string>& extra_headers,
                                 const HttpRequestOptions& options,
                                 const HeadHandler& on_head,
                                 const DataHandler& on_data) = 0;
};

} // namespace bulkget
