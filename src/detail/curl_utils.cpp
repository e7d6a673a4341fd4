#include "bulkget/detail/curl_utils.hpp"
#include "bulkget/error.hpp"

#include <cstdlib>
#include <mutex>

namespace bulkget::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw TransferError::network("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlHandle makeCurlHandle() {
    ensureCurlInitialized();
    CurlHandle handle{curl_easy_init(), &curl_easy_cleanup};
    if (!handle) {
        throw TransferError::network("Failed to allocate curl handle");
    }
    return handle;
}

} // namespace bulkget::detail
