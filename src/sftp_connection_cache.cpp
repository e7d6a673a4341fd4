#include "bulkget/sftp_connection_cache.hpp"
#include "bulkget/error.hpp"
#include "bulkget/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <vector>

namespace bulkget {

namespace {

std::filesystem::path homeDirectory() {
    const char* home = std::getenv("HOME");
    return home ? std::filesystem::path(home) : std::filesystem::path();
}

} // namespace

void SftpConnectionCache::Lease::discard() {
    if (entry_ && entry_->session) {
        entry_->session->disconnect();
        entry_->session.reset();
    }
}

SftpConnectionCache::SftpConnectionCache(SftpSessionFactory factory) : factory_(std::move(factory)) {}

SftpConnectionCache::~SftpConnectionCache() {
    closeAll();
}

SftpConnectionCache::Lease SftpConnectionCache::acquire(const SftpEndpoint& endpoint,
                                                        const SshCredentials& credentials,
                                                        const std::optional<std::string>& url_password) {
    const std::string key = endpoint.key();
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = entries_[key];
        if (!slot) {
            slot = std::make_shared<Entry>();
        }
        entry = slot;
    }

    std::unique_lock<std::timed_mutex> session_lock(entry->mutex);
    if (entry->session) {
        std::string err;
        if (entry->session->isConnected() && entry->session->ping(err)) {
            logger()->debug("Reusing SFTP connection {}", key);
            return Lease(std::move(entry), std::move(session_lock));
        }
        logger()->warn("Cached SFTP connection {} is unhealthy ({}), reconnecting", key, err);
        entry->session->disconnect();
        entry->session.reset();
    }

    auto session = factory_();
    if (!session) {
        throw TransferError::network("No SFTP session available for " + key);
    }
    connectSession(*session, endpoint, credentials, buildAuthPlan(credentials, url_password, homeDirectory()));
    logger()->debug("Opened SFTP connection {}", key);
    entry->session = std::move(session);
    return Lease(std::move(entry), std::move(session_lock));
}

void SftpConnectionCache::closeAll(std::chrono::milliseconds wait) {
    std::map<std::string, std::shared_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.swap(entries_);
    }

    for (auto& [key, entry] : entries) {
        std::unique_lock<std::timed_mutex> session_lock(entry->mutex, std::defer_lock);
        if (!session_lock.try_lock_for(wait)) {
            logger()->warn("SFTP connection {} still busy, leaving it open", key);
            continue;
        }
        if (entry->session) {
            entry->session->disconnect();
            entry->session.reset();
            logger()->debug("Closed SFTP connection {}", key);
        }
    }
}

std::size_t SftpConnectionCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace bulkget
