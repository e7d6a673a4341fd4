#pragma once

#include "options.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bulkget {

struct SftpEndpoint {
    std::string host;
    std::uint16_t port{22};
    std::string username;

    // Connection cache key, "user@host:port".
    [[nodiscard]] std::string key() const;
};

struct RemoteStat {
    std::uint64_t size{0};
    std::int64_t mtime{0};
    bool is_file{false};
};

struct AuthAttempt {
    enum class Kind { KeyMaterial, KeyFile, Password };

    Kind kind{Kind::Password};
    std::string secret; // PEM text, key path or password
    std::optional<std::string> passphrase;
    std::string label;  // for log lines, never the secret
};

// Ordered authentication attempts: in-memory key, key file, password (explicit,
// else the one embedded in the URL), then the default keys under `home`/.ssh.
[[nodiscard]] std::vector<AuthAttempt> buildAuthPlan(const SshCredentials& credentials,
                                                     const std::optional<std::string>& url_password,
                                                     const std::filesystem::path& home);

// Low-level SFTP adapter. Methods report failure through `err` and a false
// return; the transfer layer turns that into TransferError.
class SftpSession {
public:
    // Returning false stops the read.
    using ChunkSink = std::function<bool(const char* data, std::size_t size)>;

    virtual ~SftpSession() = default;

    // TCP connect, SSH handshake and host key verification.
    virtual bool open(const SftpEndpoint& endpoint, const SshCredentials& credentials, std::string& err) = 0;
    virtual bool authenticate(const SftpEndpoint& endpoint, const AuthAttempt& attempt, std::string& err) = 0;
    virtual bool startSftp(std::string& err) = 0;

    // Cheap round trip used before reusing a cached session.
    virtual bool ping(std::string& err) = 0;
    virtual bool stat(const std::string& path, RemoteStat& out, std::string& err) = 0;
    // Streams the file from `offset` to EOF into `sink`.
    virtual bool read(const std::string& path, std::uint64_t offset, const ChunkSink& sink, std::string& err) = 0;

    virtual void disconnect() = 0;
    [[nodiscard]] virtual bool isConnected() const = 0;
};

using SftpSessionFactory = std::function<std::unique_ptr<SftpSession>()>;

// open, then the auth plan in order until one succeeds, then startSftp.
// Throws TransferError (Network or Authentication).
void connectSession(SftpSession& session,
                    const SftpEndpoint& endpoint,
                    const SshCredentials& credentials,
                    const std::vector<AuthAttempt>& plan);

} // namespace bulkget
