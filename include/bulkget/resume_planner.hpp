#pragma once

#include "metadata_store.hpp"
#include "transfer_types.hpp"

#include <filesystem>
#include <string>
#include <utility>

namespace bulkget {

// Resume eligibility shared by every protocol.
class ResumePlanner {
public:
    ResumePlanner(const TransferMetadataStore& store, bool resume_without_validators)
        : store_(store), resume_without_validators_(resume_without_validators) {}

    // Combines the local file, the stored record and live remote info. A validator
    // mismatch invalidates the stored record.
    [[nodiscard]] ResumeDecision decide(const std::string& url,
                                        const std::filesystem::path& target,
                                        const RemoteFileInfo& remote) const;

    // Where an earlier attempt for `url` left its partial file, when that was a
    // renamed sibling of `target`; otherwise `target`.
    [[nodiscard]] std::filesystem::path preferredTarget(const std::string& url,
                                                        const std::filesystem::path& target) const;

    // Creates an empty file at the first free name of `path`, `path.1`, `path.2`, ...
    // and returns it. Creation is exclusive, so two callers never get the same name.
    [[nodiscard]] static std::filesystem::path claimUniquePath(const std::filesystem::path& path);

private:
    const TransferMetadataStore& store_;
    bool resume_without_validators_;
};

// Deletes a claimed path that is still empty. Used when a transfer fails before writing.
void releaseUnusedClaim(const std::filesystem::path& path) noexcept;

// Releases a claimed path on scope exit unless the transfer kept it.
class PathClaim {
public:
    PathClaim() = default;
    ~PathClaim() {
        if (!path_.empty()) {
            releaseUnusedClaim(path_);
        }
    }
    PathClaim(const PathClaim&) = delete;
    PathClaim& operator=(const PathClaim&) = delete;

    void hold(std::filesystem::path path) { path_ = std::move(path); }
    void keep() { path_.clear(); }

private:
    std::filesystem::path path_;
};

} // namespace bulkget
