#pragma once

#include "sftp_session.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace bulkget {

// Live SFTP sessions keyed by "user@host:port". A cached session is pinged
// before reuse and replaced when the ping fails. Transfers that share a
// session are serialized on it through the Lease.
class SftpConnectionCache {
    struct Entry {
        std::timed_mutex mutex;
        std::unique_ptr<SftpSession> session;
    };

public:
    class Lease {
    public:
        Lease(Lease&&) noexcept = default;
        Lease& operator=(Lease&&) noexcept = default;

        [[nodiscard]] SftpSession& session() const { return *entry_->session; }

        // Drops the session so the next acquire reconnects.
        void discard();

    private:
        friend class SftpConnectionCache;
        Lease(std::shared_ptr<Entry> entry, std::unique_lock<std::timed_mutex> lock)
            : entry_(std::move(entry)), lock_(std::move(lock)) {}

        std::shared_ptr<Entry> entry_;
        std::unique_lock<std::timed_mutex> lock_;
    };

    explicit SftpConnectionCache(SftpSessionFactory factory);
    ~SftpConnectionCache();

    SftpConnectionCache(const SftpConnectionCache&) = delete;
    SftpConnectionCache& operator=(const SftpConnectionCache&) = delete;

    // Blocks while another transfer holds the same session. Throws
    // TransferError when a new connection cannot be established.
    Lease acquire(const SftpEndpoint& endpoint,
                  const SshCredentials& credentials,
                  const std::optional<std::string>& url_password);

    // Disconnects every idle session; busy ones get `wait` to finish first.
    void closeAll(std::chrono::milliseconds wait = std::chrono::milliseconds(2000));

    [[nodiscard]] std::size_t size() const;

private:
    SftpSessionFactory factory_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace bulkget
