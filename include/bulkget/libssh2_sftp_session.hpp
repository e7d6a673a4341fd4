#pragma once

#include "sftp_session.hpp"

#include <string>

struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace bulkget {

// libssh2 backend: owns the TCP socket, the SSH session and the SFTP channel.
class Libssh2SftpSession final : public SftpSession {
public:
    Libssh2SftpSession();
    ~Libssh2SftpSession() override;

    Libssh2SftpSession(const Libssh2SftpSession&) = delete;
    Libssh2SftpSession& operator=(const Libssh2SftpSession&) = delete;

    bool open(const SftpEndpoint& endpoint, const SshCredentials& credentials, std::string& err) override;
    bool authenticate(const SftpEndpoint& endpoint, const AuthAttempt& attempt, std::string& err) override;
    bool startSftp(std::string& err) override;

    bool ping(std::string& err) override;
    bool stat(const std::string& path, RemoteStat& out, std::string& err) override;
    bool read(const std::string& path, std::uint64_t offset, const ChunkSink& sink, std::string& err) override;

    void disconnect() override;
    [[nodiscard]] bool isConnected() const override { return session_ != nullptr; }

private:
    bool tcpConnect(const std::string& host, std::uint16_t port, std::string& err);
    bool verifyHostKey(const SftpEndpoint& endpoint, const SshCredentials& credentials, std::string& err);
    std::string lastError() const;

    int sock_{-1};
    _LIBSSH2_SESSION* session_{nullptr};
    _LIBSSH2_SFTP* sftp_{nullptr};
};

} // namespace bulkget
