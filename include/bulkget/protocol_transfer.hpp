#pragma once

#include "metadata_store.hpp"
#include "options.hpp"
#include "progress.hpp"
#include "resume_planner.hpp"
#include "transfer_types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>

namespace bulkget {

// Emits onProgress every `interval` or every `chunk_interval` chunks.
class ProgressTicker {
public:
    ProgressTicker(ProgressSink& sink,
                   const ProgressPolicy& policy,
                   std::string filename,
                   std::size_t index,
                   std::uint64_t resume_offset,
                   std::uint64_t total_size);

    void onChunk(std::size_t bytes);

    // Bytes received in this attempt only.
    [[nodiscard]] std::uint64_t transferred() const { return transferred_; }
    [[nodiscard]] double elapsedSeconds() const;

private:
    ProgressSink& sink_;
    ProgressPolicy policy_;
    std::string filename_;
    std::size_t index_;
    std::uint64_t resume_offset_;
    std::uint64_t total_size_;

    std::chrono::steady_clock::time_point started_;
    std::chrono::steady_clock::time_point last_tick_;
    std::uint64_t transferred_{0};
    std::uint64_t transferred_at_last_tick_{0};
    std::size_t chunks_since_tick_{0};
};

// Output file opened for truncate or append, or standard output.
class LocalFile {
public:
    LocalFile() = default;

    // Throws TransferError (Filesystem).
    static LocalFile open(const std::filesystem::path& path, bool append);
    static LocalFile standardOutput();

    [[nodiscard]] bool isOpen() const { return file_ != nullptr; }

    // Throws TransferError (Filesystem) on a short write.
    void write(const char* data, std::size_t size);
    // Flushes and closes; throws TransferError (Filesystem) when the flush fails.
    void close();

private:
    struct FileDeleter {
        bool owned{true};
        void operator()(FILE* fp) const noexcept {
            if (fp && owned) {
                std::fclose(fp);
            }
        }
    };

    std::unique_ptr<FILE, FileDeleter> file_{nullptr, FileDeleter{}};
    std::string name_;
};

// One transfer contract over HTTP and SFTP.
class ProtocolTransfer {
public:
    ProtocolTransfer(const TransferMetadataStore& store, ProgressSink& sink, ProtocolOptions options)
        : store_(store), sink_(sink), options_(std::move(options)) {}
    virtual ~ProtocolTransfer() = default;

    virtual RemoteFileInfo fetchFileInfo(const std::string& url) = 0;

    // Throws TransferError when the transfer fails.
    virtual TransferResult transfer(const TransferRequest& request) = 0;

protected:
    struct LocalPlan {
        std::filesystem::path target;
        ResumeDecision decision;
        // `target` was created empty for this transfer.
        bool claimed{false};
    };

    // Picks the write path and resume decision. Anything that will not resume
    // gets a freshly claimed path that no other file or transfer uses.
    [[nodiscard]] LocalPlan planLocalTarget(const TransferRequest& request,
                                            const std::string& filename,
                                            const RemoteFileInfo& remote) const;

    // Persists resume state before the first byte of a fresh download.
    void rememberFreshTransfer(const TransferRequest& request,
                               const std::filesystem::path& target,
                               std::uint64_t total_size,
                               const Validators& validators) const;

    [[nodiscard]] TransferResult alreadyCompleteResult(const TransferRequest& request,
                                                       const std::string& filename,
                                                       const LocalPlan& plan,
                                                       const RemoteFileInfo& remote);

    [[nodiscard]] TransferResult completedResult(const TransferRequest& request,
                                                 const std::string& filename,
                                                 const std::filesystem::path& file_path,
                                                 std::uint64_t total_size,
                                                 const ProgressTicker& ticker,
                                                 std::uint64_t resume_offset);

    const TransferMetadataStore& store_;
    ProgressSink& sink_;
    ProtocolOptions options_;
};

inline constexpr const char* kStdoutName = "stdout";

} // namespace bulkget
