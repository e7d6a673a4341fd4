#include "bulkget/sftp_transfer.hpp"
#include "bulkget/error.hpp"
#include "bulkget/log.hpp"

#include <cstdlib>
#include <optional>
#include <string>

#include <fmt/format.h>

namespace fs = std::filesystem;

namespace bulkget {

namespace {

std::string defaultUser() {
    if (const char* user = std::getenv("USER"); user && *user) {
        return user;
    }
    return "anonymous";
}

ParsedUrl parseSftpUrl(const std::string& url) {
    ParsedUrl parsed = parseUrl(url);
    if (protocolForScheme(parsed.scheme) != Protocol::Sftp) {
        throw TransferError::validation("Not an SFTP URL: " + url);
    }
    if (parsed.path.empty() || parsed.path.back() == '/') {
        throw TransferError::validation("SFTP URL has no file path: " + url);
    }
    return parsed;
}

} // namespace

SftpEndpoint SftpTransfer::endpointFor(const ParsedUrl& url) {
    SftpEndpoint endpoint;
    endpoint.host = url.host;
    if (url.isIpv6Literal() && endpoint.host.size() > 2 && endpoint.host.back() == ']') {
        endpoint.host = endpoint.host.substr(1, endpoint.host.size() - 2);
    }
    if (endpoint.host.empty()) {
        throw TransferError::validation("SFTP URL has no host");
    }
    endpoint.port = url.port.value_or(22);
    endpoint.username = url.user.empty() ? defaultUser() : url.user;
    return endpoint;
}

RemoteFileInfo SftpTransfer::statRemote(SftpConnectionCache::Lease& lease, const std::string& path) {
    RemoteStat stat;
    std::string err;
    if (!lease.session().stat(path, stat, err)) {
        if (!lease.session().isConnected()) {
            lease.discard();
        }
        throw TransferError::network(err);
    }
    if (!stat.is_file) {
        throw TransferError::validation(fmt::format("Remote path '{}' is not a regular file", path));
    }

    RemoteFileInfo info;
    info.size = stat.size;
    info.supports_resume = true;
    info.validators.last_modified = std::to_string(stat.mtime);
    return info;
}

RemoteFileInfo SftpTransfer::fetchFileInfo(const std::string& url) {
    const ParsedUrl parsed = parseSftpUrl(url);
    auto lease = cache_.acquire(endpointFor(parsed), options_.ssh, parsed.password);
    return statRemote(lease, parsed.path);
}

TransferResult SftpTransfer::transfer(const TransferRequest& request) {
    const ParsedUrl parsed = parseSftpUrl(request.url);
    const SftpEndpoint endpoint = endpointFor(parsed);
    const std::string filename = filenameFromPath(parsed.path);

    auto lease = cache_.acquire(endpoint, request.protocol_options.ssh, parsed.password);
    const RemoteFileInfo remote = statRemote(lease, parsed.path);
    const std::uint64_t total_size = remote.size.value_or(0);

    PathClaim claim;
    LocalFile file;
    fs::path target = kStdoutName;
    std::uint64_t offset = 0;
    if (request.output_to_stdout) {
        file = LocalFile::standardOutput();
    } else {
        const LocalPlan plan = planLocalTarget(request, filename, remote);
        if (plan.decision.is_already_complete) {
            return alreadyCompleteResult(request, filename, plan, remote);
        }
        target = plan.target;
        if (plan.claimed) {
            claim.hold(target);
        }
        offset = plan.decision.can_resume ? plan.decision.resume_from_offset : 0;
        file = LocalFile::open(target, offset > 0);
        if (offset == 0) {
            rememberFreshTransfer(request, target, total_size, remote.validators);
        }
    }

    logger()->info("[{}/{}] {} {} -> {}", request.index, request.total, offset > 0 ? "Resuming" : "Downloading",
                   request.url, target.string());
    sink_.onStart({filename, total_size, request.index, request.total, offset > 0, offset});
    ProgressTicker ticker(sink_, request.protocol_options.progress, filename, request.index, offset, total_size);

    std::string err;
    const bool ok = lease.session().read(parsed.path, offset,
                                         [&](const char* data, std::size_t size) {
                                             file.write(data, size);
                                             ticker.onChunk(size);
                                             return true;
                                         },
                                         err);
    if (!ok) {
        // a failed read leaves the channel in an unknown state
        lease.discard();
        throw TransferError::network(fmt::format("SFTP read of {} failed: {}", request.url, err));
    }

    file.close();
    const std::uint64_t received = offset + ticker.transferred();
    if (received < total_size) {
        throw TransferError::network(
            fmt::format("SFTP read of {} ended early: received {} of {} bytes", request.url, received, total_size));
    }
    if (request.resume_enabled && !request.output_to_stdout) {
        store_.invalidate(request.url, target.parent_path());
    }
    claim.keep();
    return completedResult(request, filename, target, total_size, ticker, offset);
}

} // namespace bulkget
