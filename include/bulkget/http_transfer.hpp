#pragma once

#include "http_client.hpp"
#include "protocol_transfer.hpp"

#include <optional>
#include <utility>

namespace bulkget {

// HTTP/HTTPS: HEAD probe, then a GET that resumes with a Range header when the
// stored state and the server agree.
class HttpTransfer final : public ProtocolTransfer {
public:
    HttpTransfer(HttpClient& client, const TransferMetadataStore& store, ProgressSink& sink, ProtocolOptions options)
        : ProtocolTransfer(store, sink, std::move(options)), client_(client) {}

    RemoteFileInfo fetchFileInfo(const std::string& url) override;
    TransferResult transfer(const TransferRequest& request) override;

private:
    RemoteFileInfo probe(const std::string& url, const HttpRequestOptions& options);

    // nullopt when the server rejected the range request; nothing was written then.
    std::optional<TransferResult> fetch(const TransferRequest& request,
                                        const HttpRequestOptions& options,
                                        const std::string& filename,
                                        const RemoteFileInfo& remote,
                                        const std::filesystem::path& target,
                                        std::uint64_t offset);

    // Fresh download into a claimed path; the empty claim is released if it fails.
    TransferResult fetchClaimed(const TransferRequest& request,
                                const HttpRequestOptions& options,
                                const std::string& filename,
                                const RemoteFileInfo& remote,
                                const std::filesystem::path& target);

    TransferResult fetchToStdout(const TransferRequest& request,
                                 const HttpRequestOptions& options,
                                 const std::string& filename,
                                 const RemoteFileInfo& remote);

    HttpClient& client_;
};

} // namespace bulkget
