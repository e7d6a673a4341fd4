#pragma once

#include <stdexcept>
#include <string>

namespace bulkget {

enum class ErrorKind {
    Validation,
    Network,
    Http,
    Authentication,
    ResumeIntegrity,
    Filesystem,
    Configuration,
    Unknown
};

[[nodiscard]] const char* errorKindName(ErrorKind kind) noexcept;

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message, long http_status = 0)
        : std::runtime_error(message), kind_(kind), http_status_(http_status) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] long httpStatus() const noexcept { return http_status_; }

    static TransferError validation(const std::string& message) {
        return TransferError(ErrorKind::Validation, message);
    }
    static TransferError network(const std::string& message) {
        return TransferError(ErrorKind::Network, message);
    }
    static TransferError http(long status, const std::string& url);
    static TransferError filesystem(const std::string& operation,
                                    const std::string& path,
                                    const std::string& reason);

private:
    ErrorKind kind_;
    long http_status_;
};

} // namespace bulkget
