#include "bulkget/http_transfer.hpp"
#include "bulkget/error.hpp"
#include "bulkget/log.hpp"
#include "bulkget/range_negotiator.hpp"
#include "bulkget/url.hpp"

#include <fmt/format.h>

namespace fs = std::filesystem;

namespace bulkget {

namespace {

HttpRequestOptions effectiveOptions(const ParsedUrl& url, HttpRequestOptions options) {
    if (url.isIpv6Literal()) {
        options.ip_family = IpFamily::V6;
    }
    return options;
}

bool isSuccess(long status) {
    return status >= 200 && status < 300;
}

void checkComplete(const std::string& url, std::uint64_t received, std::uint64_t expected) {
    if (expected > 0 && received < expected) {
        throw TransferError::network(
            fmt::format("Connection closed early for {}: received {} of {} bytes", url, received, expected));
    }
}

} // namespace

RemoteFileInfo HttpTransfer::fetchFileInfo(const std::string& url) {
    return probe(url, effectiveOptions(parseUrl(url), options_.http));
}

RemoteFileInfo HttpTransfer::probe(const std::string& url, const HttpRequestOptions& options) {
    const RangeNegotiator negotiator(client_, options);
    const RangeProbe result = negotiator.probe(url);

    RemoteFileInfo info;
    info.size = result.content_length;
    info.supports_resume = result.supports_range;
    info.validators = result.validators;
    return info;
}

TransferResult HttpTransfer::transfer(const TransferRequest& request) {
    const ParsedUrl parsed = parseUrl(request.url);
    if (protocolForScheme(parsed.scheme) != Protocol::Http) {
        throw TransferError::validation("Not an HTTP URL: " + request.url);
    }
    const HttpRequestOptions options = effectiveOptions(parsed, request.protocol_options.http);
    const std::string filename = filenameFromPath(parsed.path);

    const RemoteFileInfo remote = probe(request.url, options);
    if (request.output_to_stdout) {
        return fetchToStdout(request, options, filename, remote);
    }

    const LocalPlan plan = planLocalTarget(request, filename, remote);
    if (plan.decision.is_already_complete) {
        return alreadyCompleteResult(request, filename, plan, remote);
    }

    if (plan.decision.can_resume && plan.decision.resume_from_offset > 0) {
        if (auto result = fetch(request, options, filename, remote, plan.target, plan.decision.resume_from_offset)) {
            return *result;
        }
        // the stale partial stays where it is; start over beside it
        const fs::path fresh_target = ResumePlanner::claimUniquePath(plan.target);
        logger()->warn("[{}/{}] Restarting {} as {}", request.index, request.total, request.url,
                       fresh_target.string());
        store_.invalidate(request.url, request.destination_dir);
        return fetchClaimed(request, options, filename, remote, fresh_target);
    }

    if (plan.claimed) {
        return fetchClaimed(request, options, filename, remote, plan.target);
    }
    return *fetch(request, options, filename, remote, plan.target, 0);
}

TransferResult HttpTransfer::fetchClaimed(const TransferRequest& request,
                                          const HttpRequestOptions& options,
                                          const std::string& filename,
                                          const RemoteFileInfo& remote,
                                          const fs::path& target) {
    PathClaim claim;
    claim.hold(target);
    TransferResult result = *fetch(request, options, filename, remote, target, 0);
    claim.keep();
    return result;
}

std::optional<TransferResult> HttpTransfer::fetch(const TransferRequest& request,
                                                  const HttpRequestOptions& options,
                                                  const std::string& filename,
                                                  const RemoteFileInfo& remote,
                                                  const fs::path& target,
                                                  std::uint64_t offset) {
    const bool resuming = offset > 0;
    std::vector<std::string> headers;
    if (resuming) {
        headers.push_back("Range: " + RangeNegotiator::buildRangeHeader(offset));
    }

    LocalFile file;
    std::optional<ProgressTicker> ticker;
    std::optional<std::string> rejection;
    std::uint64_t expected_total = 0;

    const auto on_head = [&](const HttpResponseHead& head) {
        if (resuming) {
            const RangeValidation validation = RangeNegotiator::validateRangeResponse(head, offset);
            if (!validation.valid) {
                rejection = validation.reason;
                return false;
            }
            expected_total = validation.content_range->total.value_or(remote.size.value_or(0));
        } else {
            if (!isSuccess(head.status)) {
                throw TransferError::http(head.status, request.url);
            }
            expected_total = parseContentLength(head).value_or(remote.size.value_or(0));
        }

        file = LocalFile::open(target, resuming);
        if (!resuming && remote.supports_resume) {
            Validators validators = remote.validators;
            if (validators.empty()) {
                validators.etag = head.header("ETag");
                validators.last_modified = head.header("Last-Modified");
            }
            rememberFreshTransfer(request, target, expected_total, validators);
        }

        logger()->info("[{}/{}] {} {} -> {}", request.index, request.total, resuming ? "Resuming" : "Downloading",
                       request.url, target.string());
        sink_.onStart({filename, expected_total, request.index, request.total, resuming, offset});
        ticker.emplace(sink_, request.protocol_options.progress, filename, request.index, offset, expected_total);
        return true;
    };

    const auto on_data = [&](const char* data, std::size_t size) {
        file.write(data, size);
        ticker->onChunk(size);
        return true;
    };

    const HttpFetchOutcome outcome = client_.get(request.url, headers, options, on_head, on_data);
    if (rejection) {
        logger()->warn("[{}/{}] Range resume of {} rejected: {}", request.index, request.total, request.url,
                       *rejection);
        return std::nullopt;
    }
    if (outcome.aborted_by_handler || !ticker) {
        throw TransferError::network("Transfer of " + request.url + " ended without a response body");
    }

    file.close();
    checkComplete(request.url, offset + ticker->transferred(), expected_total);
    if (request.resume_enabled) {
        store_.invalidate(request.url, target.parent_path());
    }
    return completedResult(request, filename, target, expected_total, *ticker, offset);
}

TransferResult HttpTransfer::fetchToStdout(const TransferRequest& request,
                                           const HttpRequestOptions& options,
                                           const std::string& filename,
                                           const RemoteFileInfo& remote) {
    LocalFile out;
    std::optional<ProgressTicker> ticker;
    std::uint64_t expected_total = 0;

    const auto on_head = [&](const HttpResponseHead& head) {
        if (!isSuccess(head.status)) {
            throw TransferError::http(head.status, request.url);
        }
        expected_total = parseContentLength(head).value_or(remote.size.value_or(0));
        out = LocalFile::standardOutput();
        sink_.onStart({filename, expected_total, request.index, request.total, false, 0});
        ticker.emplace(sink_, request.protocol_options.progress, filename, request.index, 0, expected_total);
        return true;
    };
    const auto on_data = [&](const char* data, std::size_t size) {
        out.write(data, size);
        ticker->onChunk(size);
        return true;
    };

    const HttpFetchOutcome outcome = client_.get(request.url, {}, options, on_head, on_data);
    if (outcome.aborted_by_handler || !ticker) {
        throw TransferError::network("Transfer of " + request.url + " ended without a response body");
    }
    out.close();
    checkComplete(request.url, ticker->transferred(), expected_total);
    return completedResult(request, filename, kStdoutName, expected_total, *ticker, 0);
}

} // namespace bulkget
