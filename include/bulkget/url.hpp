#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace bulkget {

enum class Protocol { Http, Sftp };

struct ParsedUrl {
    std::string scheme;   // lower-case, without "://"
    std::string user;     // percent-decoded
    std::optional<std::string> password;
    std::string host;     // IPv6 literals keep their brackets
    std::optional<std::uint16_t> port;
    std::string path;     // percent-decoded, always starts with '/'

    [[nodiscard]] bool isIpv6Literal() const { return !host.empty() && host.front() == '['; }
};

// Parses an absolute URL; throws TransferError (Validation) on malformed input.
ParsedUrl parseUrl(const std::string& url);

// Maps a URL scheme to the transfer variant that handles it.
[[nodiscard]] std::optional<Protocol> protocolForScheme(const std::string& scheme);

// Last path segment, or "download" when the path has none.
[[nodiscard]] std::string filenameFromPath(const std::string& path);

} // namespace bulkget
