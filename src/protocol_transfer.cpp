#include "bulkget/protocol_transfer.hpp"
#include "bulkget/error.hpp"
#include "bulkget/log.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

namespace fs = std::filesystem;

namespace bulkget {

ProgressTicker::ProgressTicker(ProgressSink& sink,
                               const ProgressPolicy& policy,
                               std::string filename,
                               std::size_t index,
                               std::uint64_t resume_offset,
                               std::uint64_t total_size)
    : sink_(sink),
      policy_(policy),
      filename_(std::move(filename)),
      index_(index),
      resume_offset_(resume_offset),
      total_size_(total_size),
      started_(std::chrono::steady_clock::now()),
      last_tick_(started_) {}

void ProgressTicker::onChunk(std::size_t bytes) {
    transferred_ += bytes;
    ++chunks_since_tick_;

    const auto now = std::chrono::steady_clock::now();
    if (now - last_tick_ < policy_.interval && chunks_since_tick_ < policy_.chunk_interval) {
        return;
    }

    const double seconds = std::chrono::duration<double>(now - last_tick_).count();
    const auto delta = transferred_ - transferred_at_last_tick_;
    sink_.onProgress({filename_, index_, resume_offset_ + transferred_, total_size_,
                      seconds > 0.0 ? static_cast<double>(delta) / seconds : 0.0});

    last_tick_ = now;
    transferred_at_last_tick_ = transferred_;
    chunks_since_tick_ = 0;
}

double ProgressTicker::elapsedSeconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
}

LocalFile LocalFile::open(const fs::path& path, bool append) {
    LocalFile file;
    file.name_ = path.string();
    file.file_.reset(std::fopen(file.name_.c_str(), append ? "ab" : "wb"));
    if (!file.file_) {
        throw TransferError::filesystem(append ? "append to" : "create", file.name_, std::strerror(errno));
    }
    return file;
}

LocalFile LocalFile::standardOutput() {
    LocalFile file;
    file.name_ = kStdoutName;
    file.file_ = std::unique_ptr<FILE, FileDeleter>(stdout, FileDeleter{false});
    return file;
}

void LocalFile::write(const char* data, std::size_t size) {
    if (!file_) {
        throw TransferError::filesystem("write", name_, "file is not open");
    }
    if (std::fwrite(data, 1, size, file_.get()) != size) {
        throw TransferError::filesystem("write", name_, std::strerror(errno));
    }
}

void LocalFile::close() {
    if (!file_) {
        return;
    }
    const bool flushed = std::fflush(file_.get()) == 0;
    const int flush_errno = errno;
    file_.reset();
    if (!flushed) {
        throw TransferError::filesystem("write", name_, std::strerror(flush_errno));
    }
}

ProtocolTransfer::LocalPlan ProtocolTransfer::planLocalTarget(const TransferRequest& request,
                                                              const std::string& filename,
                                                              const RemoteFileInfo& remote) const {
    LocalPlan plan;
    plan.target = request.destination_dir / filename;
    if (!request.resume_enabled) {
        plan.decision.reason = "Resume disabled";
        plan.target = ResumePlanner::claimUniquePath(plan.target);
        plan.claimed = true;
        return plan;
    }

    const ResumePlanner planner(store_, request.protocol_options.resume_without_validators);
    plan.target = planner.preferredTarget(request.url, plan.target);
    plan.decision = planner.decide(request.url, plan.target, remote);
    logger()->debug("Resume check for {}: {}", request.url, plan.decision.reason);

    if (!plan.decision.can_resume && !plan.decision.is_already_complete) {
        plan.target = ResumePlanner::claimUniquePath(plan.target);
        plan.claimed = true;
    }
    return plan;
}

void ProtocolTransfer::rememberFreshTransfer(const TransferRequest& request,
                                             const fs::path& target,
                                             std::uint64_t total_size,
                                             const Validators& validators) const {
    if (!request.resume_enabled || total_size == 0) {
        return;
    }
    TransferMetadata metadata;
    metadata.url = request.url;
    metadata.local_file_path = target;
    metadata.total_size = total_size;
    metadata.created_at = std::chrono::system_clock::now();
    metadata.validators = validators;
    store_.save(metadata);
}

TransferResult ProtocolTransfer::alreadyCompleteResult(const TransferRequest& request,
                                                       const std::string& filename,
                                                       const LocalPlan& plan,
                                                       const RemoteFileInfo& remote) {
    logger()->info("[{}/{}] {} is already complete", request.index, request.total, plan.target.string());

    TransferResult result;
    result.url = request.url;
    result.index = request.index;
    result.success = true;
    result.file_path = plan.target;
    result.total_size = remote.size.value_or(plan.decision.resume_from_offset);
    result.already_complete = true;
    result.resume_offset = plan.decision.resume_from_offset;

    // the record has served its purpose
    store_.invalidate(request.url, request.destination_dir);
    sink_.onComplete({filename, request.index, result.total_size, 0.0, 0.0});
    return result;
}

TransferResult ProtocolTransfer::completedResult(const TransferRequest& request,
                                                 const std::string& filename,
                                                 const fs::path& file_path,
                                                 std::uint64_t total_size,
                                                 const ProgressTicker& ticker,
                                                 std::uint64_t resume_offset) {
    const double seconds = ticker.elapsedSeconds();

    TransferResult result;
    result.url = request.url;
    result.index = request.index;
    result.success = true;
    result.file_path = file_path;
    result.byte_count = ticker.transferred();
    result.total_size = total_size > 0 ? total_size : resume_offset + result.byte_count;
    result.duration_ms = seconds * 1000.0;
    result.throughput_bytes_per_sec = seconds > 0.0 ? static_cast<double>(result.byte_count) / seconds : 0.0;
    result.resumed = resume_offset > 0;
    result.resume_offset = resume_offset;

    sink_.onComplete({filename, request.index, result.total_size, seconds, result.throughput_bytes_per_sec});
    logger()->info("[{}/{}] Saved {} ({} bytes{})", request.index, request.total, file_path.string(),
                   result.byte_count, result.resumed ? ", resumed" : "");
    return result;
}

} // namespace bulkget
