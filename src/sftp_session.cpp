#include "bulkget/sftp_session.hpp"
#include "bulkget/error.hpp"
#include "bulkget/log.hpp"

#include <system_error>

#include <fmt/format.h>

namespace fs = std::filesystem;

namespace bulkget {

std::string SftpEndpoint::key() const {
    return fmt::format("{}@{}:{}", username, host, port);
}

std::vector<AuthAttempt> buildAuthPlan(const SshCredentials& credentials,
                                       const std::optional<std::string>& url_password,
                                       const fs::path& home) {
    std::vector<AuthAttempt> plan;
    if (credentials.private_key) {
        plan.push_back({AuthAttempt::Kind::KeyMaterial, *credentials.private_key, credentials.passphrase,
                        "private key"});
    }
    if (credentials.private_key_path) {
        plan.push_back({AuthAttempt::Kind::KeyFile, *credentials.private_key_path, credentials.passphrase,
                        "key file " + *credentials.private_key_path});
    }
    if (credentials.password) {
        plan.push_back({AuthAttempt::Kind::Password, *credentials.password, std::nullopt, "password"});
    } else if (url_password) {
        plan.push_back({AuthAttempt::Kind::Password, *url_password, std::nullopt, "URL password"});
    }

    if (!home.empty()) {
        for (const char* name : {"id_rsa", "id_ed25519", "id_ecdsa"}) {
            const fs::path candidate = home / ".ssh" / name;
            std::error_code ec;
            if (!fs::is_regular_file(candidate, ec)) {
                continue;
            }
            if (credentials.private_key_path && fs::path(*credentials.private_key_path) == candidate) {
                continue;
            }
            plan.push_back({AuthAttempt::Kind::KeyFile, candidate.string(), credentials.passphrase,
                            "key file " + candidate.string()});
        }
    }
    return plan;
}

void connectSession(SftpSession& session,
                    const SftpEndpoint& endpoint,
                    const SshCredentials& credentials,
                    const std::vector<AuthAttempt>& plan) {
    std::string err;
    if (!session.open(endpoint, credentials, err)) {
        session.disconnect();
        throw TransferError::network(fmt::format("Cannot connect to {}: {}", endpoint.key(), err));
    }

    if (plan.empty()) {
        session.disconnect();
        throw TransferError(ErrorKind::Authentication,
                            fmt::format("No authentication method available for {}", endpoint.key()));
    }

    bool authenticated = false;
    std::string last_error;
    for (const auto& attempt : plan) {
        err.clear();
        if (session.authenticate(endpoint, attempt, err)) {
            logger()->debug("Authenticated to {} with {}", endpoint.key(), attempt.label);
            authenticated = true;
            break;
        }
        logger()->debug("Authentication with {} failed for {}: {}", attempt.label, endpoint.key(), err);
        last_error = err;
        if (!session.isConnected()) {
            break;
        }
    }
    if (!authenticated) {
        session.disconnect();
        throw TransferError(ErrorKind::Authentication,
                            fmt::format("Authentication failed for {}: {}", endpoint.key(), last_error));
    }

    err.clear();
    if (!session.startSftp(err)) {
        session.disconnect();
        throw TransferError::network(fmt::format("Cannot start SFTP on {}: {}", endpoint.key(), err));
    }
}

} // namespace bulkget
