#include "bulkget/url.hpp"
#include "bulkget/error.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>

#include <curl/curl.h>

namespace bulkget {

namespace {

using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

struct CurlStringDeleter {
    void operator()(char* p) const noexcept { curl_free(p); }
};

std::optional<std::string> urlPart(CURLU* handle, CURLUPart part, unsigned int flags) {
    char* raw = nullptr;
    if (curl_url_get(handle, part, &raw, flags) != CURLUE_OK || !raw) {
        return std::nullopt;
    }
    std::unique_ptr<char, CurlStringDeleter> owned{raw};
    return std::string{owned.get()};
}

} // namespace

ParsedUrl parseUrl(const std::string& url) {
    UrlHandle handle{curl_url(), &curl_url_cleanup};
    if (!handle) {
        throw TransferError::validation("Cannot allocate URL parser");
    }

    const CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), CURLU_NON_SUPPORT_SCHEME);
    if (rc != CURLUE_OK) {
        throw TransferError::validation("Invalid URL '" + url + "': " + curl_url_strerror(rc));
    }

    ParsedUrl parsed;
    parsed.scheme = urlPart(handle.get(), CURLUPART_SCHEME, 0).value_or("");
    std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    parsed.user = urlPart(handle.get(), CURLUPART_USER, CURLU_URLDECODE).value_or("");
    parsed.password = urlPart(handle.get(), CURLUPART_PASSWORD, CURLU_URLDECODE);
    parsed.host = urlPart(handle.get(), CURLUPART_HOST, 0).value_or("");
    parsed.path = urlPart(handle.get(), CURLUPART_PATH, CURLU_URLDECODE).value_or("/");

    if (const auto port = urlPart(handle.get(), CURLUPART_PORT, 0)) {
        try {
            const int value = std::stoi(*port);
            if (value < 1 || value > 65535) {
                throw TransferError::validation("Invalid port in URL '" + url + "'");
            }
            parsed.port = static_cast<std::uint16_t>(value);
        } catch (const std::logic_error&) {
            throw TransferError::validation("Invalid port in URL '" + url + "'");
        }
    }

    if (parsed.host.empty()) {
        throw TransferError::validation("Invalid URL '" + url + "': missing hostname");
    }
    if (parsed.path.empty()) {
        parsed.path = "/";
    }
    return parsed;
}

std::optional<Protocol> protocolForScheme(const std::string& scheme) {
    if (scheme == "http" || scheme == "https") {
        return Protocol::Http;
    }
    if (scheme == "sftp") {
        return Protocol::Sftp;
    }
    return std::nullopt;
}

std::string filenameFromPath(const std::string& path) {
    const auto slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    if (name.empty() || name == "." || name == "..") {
        return "download";
    }
    return name;
}

} // namespace bulkget
