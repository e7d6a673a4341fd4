#include "bulkget/error.hpp"

#include <fmt/format.h>

namespace bulkget {

const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::Validation:
        return "validation";
    case ErrorKind::Network:
        return "network";
    case ErrorKind::Http:
        return "http";
    case ErrorKind::Authentication:
        return "authentication";
    case ErrorKind::ResumeIntegrity:
        return "resume-integrity";
    case ErrorKind::Filesystem:
        return "filesystem";
    case ErrorKind::Configuration:
        return "configuration";
    case ErrorKind::Unknown:
        break;
    }
    return "unknown";
}

TransferError TransferError::http(long status, const std::string& url) {
    return TransferError(ErrorKind::Http, fmt::format("HTTP {} for {}", status, url), status);
}

TransferError TransferError::filesystem(const std::string& operation,
                                        const std::string& path,
                                        const std::string& reason) {
    return TransferError(ErrorKind::Filesystem,
                         fmt::format("Cannot {} '{}': {}", operation, path, reason));
}

} // namespace bulkget
