#include "bulkget/libssh2_sftp_session.hpp"
#include "bulkget/log.hpp"

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cerrno>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <fmt/format.h>

namespace bulkget {

namespace {

constexpr std::size_t kReadChunk = 64 * 1024;

void ensureLibssh2Initialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (libssh2_init(0) != 0) {
            logger()->error("libssh2_init failed");
            return;
        }
        std::atexit([] { libssh2_exit(); });
    });
}

using KnownHosts = std::unique_ptr<LIBSSH2_KNOWNHOSTS, decltype(&libssh2_knownhost_free)>;

struct SftpHandleCloser {
    void operator()(LIBSSH2_SFTP_HANDLE* handle) const noexcept {
        if (handle) {
            libssh2_sftp_close(handle);
        }
    }
};

int knownHostKeyType(int hostkey_type) {
    switch (hostkey_type) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
    default:
        return LIBSSH2_KNOWNHOST_KEY_UNKNOWN;
    }
}

std::string sftpErrorText(unsigned long code) {
    switch (code) {
    case LIBSSH2_FX_NO_SUCH_FILE:
        return "no such file";
    case LIBSSH2_FX_PERMISSION_DENIED:
        return "permission denied";
    case LIBSSH2_FX_FAILURE:
        return "failure";
    case LIBSSH2_FX_CONNECTION_LOST:
        return "connection lost";
    default:
        return fmt::format("SFTP status {}", code);
    }
}

std::string defaultKnownHostsPath() {
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/.ssh/known_hosts" : std::string();
}

} // namespace

Libssh2SftpSession::Libssh2SftpSession() {
    ensureLibssh2Initialized();
}

Libssh2SftpSession::~Libssh2SftpSession() {
    disconnect();
}

bool Libssh2SftpSession::tcpConnect(const std::string& host, std::uint16_t port, std::string& err) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const std::string port_text = std::to_string(port);
    addrinfo* res = nullptr;
    const int gai = ::getaddrinfo(host.c_str(), port_text.c_str(), &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> addresses{res, &::freeaddrinfo};

    int last_errno = 0;
    for (auto* rp = addresses.get(); rp != nullptr; rp = rp->ai_next) {
        const int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) {
            last_errno = errno;
            continue;
        }
        int on = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
#if defined(__linux__)
        int idle = 60, interval = 10, count = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &interval, sizeof(interval));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &count, sizeof(count));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            return true;
        }
        last_errno = errno;
        ::close(s);
    }
    err = fmt::format("cannot connect to {}:{}: {}", host, port,
                      std::error_code(last_errno, std::generic_category()).message());
    return false;
}

bool Libssh2SftpSession::open(const SftpEndpoint& endpoint, const SshCredentials& credentials, std::string& err) {
    disconnect();
    if (!tcpConnect(endpoint.host, endpoint.port, err)) {
        return false;
    }

    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, static_cast<long>(credentials.connect_timeout.count() * 1000));

    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed: " + lastError();
        return false;
    }
    libssh2_keepalive_config(session_, 1, 30);

    return verifyHostKey(endpoint, credentials, err);
}

bool Libssh2SftpSession::verifyHostKey(const SftpEndpoint& endpoint,
                                       const SshCredentials& credentials,
                                       std::string& err) {
    if (credentials.known_hosts_policy == KnownHostsPolicy::Off) {
        return true;
    }

    KnownHosts known{libssh2_knownhost_init(session_), &libssh2_knownhost_free};
    if (!known) {
        err = "cannot initialize known_hosts";
        return false;
    }

    const std::string path = credentials.known_hosts_path.value_or(defaultKnownHostsPath());
    const bool loaded = !path.empty() &&
                        libssh2_knownhost_readfile(known.get(), path.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    if (!loaded && credentials.known_hosts_policy == KnownHostsPolicy::Strict) {
        err = fmt::format("known_hosts '{}' is missing or unreadable", path);
        return false;
    }

    size_t key_length = 0;
    int key_type = 0;
    const char* host_key = libssh2_session_hostkey(session_, &key_length, &key_type);
    if (!host_key || key_length == 0) {
        err = "server sent no host key";
        return false;
    }

    const int algorithm = knownHostKeyType(key_type);
    libssh2_knownhost* match = nullptr;
    // a plain host also matches hashed known_hosts entries
    const int check = libssh2_knownhost_checkp(known.get(), endpoint.host.c_str(), endpoint.port, host_key,
                                               key_length,
                                               LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | algorithm,
                                               &match);

    switch (check) {
    case LIBSSH2_KNOWNHOST_CHECK_MATCH:
        return true;
    case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
        err = fmt::format("host key for {} does not match known_hosts", endpoint.host);
        return false;
    case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
        if (credentials.known_hosts_policy == KnownHostsPolicy::Strict) {
            err = fmt::format("host {} is not in known_hosts", endpoint.host);
            return false;
        }
        break;
    default:
        err = fmt::format("host key check failed for {}", endpoint.host);
        return false;
    }

    // accept-new: remember the key for next time
    const std::string host_entry =
        endpoint.port == 22 ? endpoint.host : fmt::format("[{}]:{}", endpoint.host, endpoint.port);
    if (path.empty() ||
        libssh2_knownhost_addc(known.get(), host_entry.c_str(), nullptr, host_key, key_length, nullptr, 0,
                               LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | algorithm,
                               nullptr) != 0 ||
        libssh2_knownhost_writefile(known.get(), path.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
        logger()->warn("Accepted new host key for {} but could not record it in '{}'", endpoint.host, path);
    } else {
        logger()->info("Added host key for {} to '{}'", endpoint.host, path);
    }
    return true;
}

bool Libssh2SftpSession::authenticate(const SftpEndpoint& endpoint, const AuthAttempt& attempt, std::string& err) {
    if (!session_) {
        err = "not connected";
        return false;
    }

    const char* passphrase = attempt.passphrase ? attempt.passphrase->c_str() : nullptr;
    const auto user_length = static_cast<unsigned int>(endpoint.username.size());
    int rc = -1;
    switch (attempt.kind) {
    case AuthAttempt::Kind::KeyMaterial:
        rc = libssh2_userauth_publickey_frommemory(session_, endpoint.username.c_str(), user_length, nullptr, 0,
                                                   attempt.secret.data(), attempt.secret.size(), passphrase);
        break;
    case AuthAttempt::Kind::KeyFile:
        rc = libssh2_userauth_publickey_fromfile(session_, endpoint.username.c_str(), nullptr,
                                                 attempt.secret.c_str(), passphrase);
        break;
    case AuthAttempt::Kind::Password:
        rc = libssh2_userauth_password(session_, endpoint.username.c_str(), attempt.secret.c_str());
        break;
    }

    if (rc != 0) {
        err = lastError();
        return false;
    }
    return true;
}

bool Libssh2SftpSession::startSftp(std::string& err) {
    if (!session_) {
        err = "not connected";
        return false;
    }
    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = "libssh2_sftp_init failed: " + lastError();
        return false;
    }
    return true;
}

bool Libssh2SftpSession::ping(std::string& err) {
    if (!sftp_) {
        err = "SFTP channel is closed";
        return false;
    }
    char buffer[1024];
    if (libssh2_sftp_realpath(sftp_, ".", buffer, sizeof(buffer)) < 0) {
        err = "realpath failed: " + lastError();
        return false;
    }
    return true;
}

bool Libssh2SftpSession::stat(const std::string& path, RemoteStat& out, std::string& err) {
    if (!sftp_) {
        err = "SFTP channel is closed";
        return false;
    }
    LIBSSH2_SFTP_ATTRIBUTES attrs{};
    if (libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned int>(path.size()), LIBSSH2_SFTP_STAT,
                             &attrs) != 0) {
        err = fmt::format("stat '{}' failed: {}", path, sftpErrorText(libssh2_sftp_last_error(sftp_)));
        return false;
    }

    out.size = (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) ? attrs.filesize : 0;
    out.mtime = (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) ? static_cast<std::int64_t>(attrs.mtime) : 0;
    out.is_file = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) ? LIBSSH2_SFTP_S_ISREG(attrs.permissions) : true;
    return true;
}

bool Libssh2SftpSession::read(const std::string& path, std::uint64_t offset, const ChunkSink& sink,
                              std::string& err) {
    if (!sftp_) {
        err = "SFTP channel is closed";
        return false;
    }

    std::unique_ptr<LIBSSH2_SFTP_HANDLE, SftpHandleCloser> handle{libssh2_sftp_open_ex(
        sftp_, path.c_str(), static_cast<unsigned int>(path.size()), LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE)};
    if (!handle) {
        err = fmt::format("open '{}' failed: {}", path, sftpErrorText(libssh2_sftp_last_error(sftp_)));
        return false;
    }
    if (offset > 0) {
        libssh2_sftp_seek64(handle.get(), static_cast<libssh2_uint64_t>(offset));
    }

    std::vector<char> buffer(kReadChunk);
    for (;;) {
        const ssize_t n = libssh2_sftp_read(handle.get(), buffer.data(), buffer.size());
        if (n == 0) {
            return true;
        }
        if (n < 0) {
            err = fmt::format("read '{}' failed: {}", path, lastError());
            return false;
        }
        if (!sink(buffer.data(), static_cast<std::size_t>(n))) {
            err = "read aborted";
            return false;
        }
    }
}

void Libssh2SftpSession::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
}

std::string Libssh2SftpSession::lastError() const {
    if (!session_) {
        return "no session";
    }
    char* message = nullptr;
    int length = 0;
    libssh2_session_last_error(session_, &message, &length, 0);
    return message && length > 0 ? std::string(message, static_cast<std::size_t>(length)) : "unknown error";
}

} // namespace bulkget
