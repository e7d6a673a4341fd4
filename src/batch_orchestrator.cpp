#include "bulkget/batch_orchestrator.hpp"
#include "bulkget/error.hpp"
#include "bulkget/http_transfer.hpp"
#include "bulkget/log.hpp"
#include "bulkget/sftp_transfer.hpp"
#include "bulkget/url.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <system_error>

#include <fmt/format.h>

namespace fs = std::filesystem;

namespace bulkget {

namespace {

double millisecondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

TransferResult failedResult(const TransferRequest& request, ErrorKind kind, const std::string& message) {
    TransferResult result;
    result.url = request.url;
    result.index = request.index;
    result.success = false;
    result.error_kind = kind;
    result.error_message = message;
    return result;
}

} // namespace

BatchOrchestrator::BatchOrchestrator(HttpClient& http, SftpConnectionCache& sftp, ProgressSink& sink,
                                     HistorySink* history)
    : http_(http), sftp_(sftp), sink_(sink), history_(history) {}

std::vector<TransferResult> BatchOrchestrator::run(const std::vector<std::string>& urls,
                                                   const fs::path& destination,
                                                   const BatchOptions& options) {
    options.validate();
    if (urls.empty()) {
        throw TransferError::validation("No URLs to download");
    }
    if (options.output_to_stdout && urls.size() != 1) {
        throw TransferError::validation("Writing to stdout requires exactly one URL");
    }

    const fs::path dest = destination.empty() ? fs::path(".") : destination;
    if (!options.output_to_stdout) {
        std::error_code ec;
        fs::create_directories(dest, ec);
        if (ec) {
            logger()->warn("Cannot create destination '{}': {}", dest.string(), ec.message());
        }
    }

    NullProgressSink quiet_sink;
    ProgressSink& sink = options.quiet_mode || options.output_to_stdout ? static_cast<ProgressSink&>(quiet_sink)
                                                                        : sink_;

    gate_.setLimit(options.max_concurrent);
    const auto started = std::chrono::steady_clock::now();

    std::vector<std::future<TransferResult>> pending;
    pending.reserve(urls.size());
    for (std::size_t i = 0; i < urls.size(); ++i) {
        TransferRequest request;
        request.url = urls[i];
        request.destination_dir = dest;
        request.resume_enabled = options.enable_resume && !options.output_to_stdout;
        request.output_to_stdout = options.output_to_stdout;
        request.index = i + 1;
        request.total = urls.size();
        request.protocol_options = options.protocol;

        pending.push_back(gate_.acquireAndRun([this, request, &sink, &options]() {
            TransferResult result = runOne(request, sink, options);
            settle(result, sink);
            return result;
        }));
    }

    std::vector<TransferResult> results;
    results.reserve(pending.size());
    for (std::size_t i = 0; i < pending.size(); ++i) {
        try {
            results.push_back(pending[i].get());
        } catch (const std::exception& ex) {
            TransferRequest request;
            request.url = urls[i];
            request.index = i + 1;
            results.push_back(failedResult(request, ErrorKind::Unknown, ex.what()));
        }
    }

    const BatchStatistics stats = summarize(results, millisecondsSince(started));
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        last_stats_ = stats;
    }
    logger()->info("Batch finished: {} succeeded, {} failed, {} bytes in {:.0f} ms", stats.succeeded, stats.failed,
                   stats.total_bytes, stats.total_elapsed_ms);

    if (options.enable_resume && !options.output_to_stdout) {
        collectGarbage(dest, options);
    }
    return results;
}

TransferResult BatchOrchestrator::runOne(const TransferRequest& request, ProgressSink& sink,
                                         const BatchOptions& options) {
    const auto started = std::chrono::steady_clock::now();
    TransferResult result;
    try {
        const auto protocol = protocolForScheme(parseUrl(request.url).scheme);
        if (!protocol) {
            throw TransferError::validation("Unsupported protocol in " + request.url);
        }

        std::unique_ptr<ProtocolTransfer> transfer;
        if (*protocol == Protocol::Http) {
            transfer = std::make_unique<HttpTransfer>(http_, store_, sink, options.protocol);
        } else {
            transfer = std::make_unique<SftpTransfer>(sftp_, store_, sink, options.protocol);
        }
        return transfer->transfer(request);
    } catch (const TransferError& ex) {
        result = failedResult(request, ex.kind(), ex.what());
    } catch (const std::exception& ex) {
        result = failedResult(request, ErrorKind::Unknown, ex.what());
    }
    result.duration_ms = millisecondsSince(started);
    return result;
}

void BatchOrchestrator::settle(const TransferResult& result, ProgressSink& sink) {
    if (!result.success) {
        logger()->error("[{}] {} failed ({}): {}", result.index, result.url,
                        errorKindName(result.error_kind.value_or(ErrorKind::Unknown)), result.error_message);
        sink.onError({result.error_message, result.url});
    }

    if (!history_) {
        return;
    }
    try {
        history_->record(HistoryRecord::fromResult(result));
    } catch (const std::exception& ex) {
        logger()->warn("Could not record history for {}: {}", result.url, ex.what());
    }
}

BatchStatistics BatchOrchestrator::summarize(const std::vector<TransferResult>& results, double elapsed_ms) {
    BatchStatistics stats;
    stats.attempted = results.size();
    stats.total_elapsed_ms = elapsed_ms;

    double throughput_sum = 0.0;
    std::size_t throughput_count = 0;
    for (const auto& result : results) {
        if (!result.success) {
            ++stats.failed;
            continue;
        }
        ++stats.succeeded;
        stats.total_bytes += result.byte_count;
        if (result.resumed) {
            ++stats.resumed_count;
        }
        if (result.already_complete) {
            ++stats.already_complete_count;
        }
        if (result.throughput_bytes_per_sec > 0.0) {
            throughput_sum += result.throughput_bytes_per_sec;
            ++throughput_count;
        }
    }
    stats.average_throughput = throughput_count > 0 ? throughput_sum / static_cast<double>(throughput_count) : 0.0;
    return stats;
}

BatchStatistics BatchOrchestrator::statistics() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return last_stats_;
}

void BatchOrchestrator::collectGarbage(const fs::path& destination, const BatchOptions& options) {
    try {
        const auto live = store_.listAll(destination);
        const auto purged = store_.purgeOlderThan(destination, options.metadata_retention);
        logger()->debug("Resume metadata in '{}': {} live, {} purged", destination.string(), live.size(), purged);
    } catch (const std::exception& ex) {
        logger()->warn("Resume metadata cleanup in '{}' failed: {}", destination.string(), ex.what());
    }
}

void BatchOrchestrator::closeConnections() {
    sftp_.closeAll();
}

} // namespace bulkget
