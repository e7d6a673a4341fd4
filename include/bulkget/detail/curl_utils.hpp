#pragma once

#include <memory>

#include <curl/curl.h>

namespace bulkget::detail {

// curl_global_init once per process, cleaned up at exit.
void ensureCurlInitialized();

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

[[nodiscard]] CurlHandle makeCurlHandle();

} // namespace bulkget::detail
