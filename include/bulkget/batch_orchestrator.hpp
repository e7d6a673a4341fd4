#pragma once

#include "concurrency_gate.hpp"
#include "history.hpp"
#include "http_client.hpp"
#include "metadata_store.hpp"
#include "options.hpp"
#include "progress.hpp"
#include "sftp_connection_cache.hpp"
#include "transfer_types.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace bulkget {

// Fans a URL list out through the ConcurrencyGate and folds the outcomes.
class BatchOrchestrator {
public:
    BatchOrchestrator(HttpClient& http, SftpConnectionCache& sftp, ProgressSink& sink, HistorySink* history = nullptr);

    // One result per URL, in input order. Throws TransferError (Validation)
    // before any transfer starts when the options or the URL list are unusable.
    std::vector<TransferResult> run(const std::vector<std::string>& urls,
                                    const std::filesystem::path& destination,
                                    const BatchOptions& options);

    // Statistics of the most recent run().
    [[nodiscard]] BatchStatistics statistics() const;

    [[nodiscard]] static BatchStatistics summarize(const std::vector<TransferResult>& results, double elapsed_ms);

    void closeConnections();

    [[nodiscard]] const ConcurrencyGate& gate() const { return gate_; }

private:
    TransferResult runOne(const TransferRequest& request, ProgressSink& sink, const BatchOptions& options);
    void settle(const TransferResult& result, ProgressSink& sink);
    void collectGarbage(const std::filesystem::path& destination, const BatchOptions& options);

    HttpClient& http_;
    SftpConnectionCache& sftp_;
    ProgressSink& sink_;
    HistorySink* history_;
    TransferMetadataStore store_;
    ConcurrencyGate gate_;

    mutable std::mutex stats_mutex_;
    BatchStatistics last_stats_;
};

} // namespace bulkget
