#pragma once

#include "protocol_transfer.hpp"
#include "sftp_connection_cache.hpp"
#include "url.hpp"

#include <utility>

namespace bulkget {

// sftp://[user[:password]@]host[:port]/path over a cached session; resumes
// with a positional read from the local size.
class SftpTransfer final : public ProtocolTransfer {
public:
    SftpTransfer(SftpConnectionCache& cache,
                 const TransferMetadataStore& store,
                 ProgressSink& sink,
                 ProtocolOptions options)
        : ProtocolTransfer(store, sink, std::move(options)), cache_(cache) {}

    RemoteFileInfo fetchFileInfo(const std::string& url) override;
    TransferResult transfer(const TransferRequest& request) override;

    // Throws TransferError (Validation) for a URL without host or file path.
    [[nodiscard]] static SftpEndpoint endpointFor(const ParsedUrl& url);

private:
    static RemoteFileInfo statRemote(SftpConnectionCache::Lease& lease, const std::string& path);

    SftpConnectionCache& cache_;
};

} // namespace bulkget
