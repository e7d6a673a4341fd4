#include "bulkget/resume_planner.hpp"
#include "bulkget/log.hpp"

#include <cerrno>
#include <cstdio>
#include <system_error>

namespace fs = std::filesystem;

namespace bulkget {

namespace {

ResumeDecision refuse(std::string reason) {
    ResumeDecision decision;
    decision.reason = std::move(reason);
    return decision;
}

bool differs(const std::optional<std::string>& stored, const std::optional<std::string>& live) {
    return stored && live && *stored != *live;
}

bool matches(const std::optional<std::string>& stored, const std::optional<std::string>& live) {
    return stored && live && *stored == *live;
}

} // namespace

ResumeDecision ResumePlanner::decide(const std::string& url,
                                     const fs::path& target,
                                     const RemoteFileInfo& remote) const {
    if (!remote.supports_resume) {
        return refuse("Server does not support resume");
    }

    std::error_code ec;
    const auto status = fs::status(target, ec);
    if (ec || !fs::exists(status)) {
        return refuse("Partial file not found");
    }
    if (!fs::is_regular_file(status)) {
        return refuse("Target is not a regular file");
    }
    const auto local_size = fs::file_size(target, ec);
    if (ec) {
        return refuse("File check failed: " + ec.message());
    }

    const auto metadata = store_.load(url, target.parent_path());
    if (!metadata) {
        return refuse("No resume metadata found");
    }
    if (metadata->local_file_path.lexically_normal() != target.lexically_normal()) {
        return refuse("File path mismatch");
    }

    const auto& stored = metadata->validators;
    const auto& live = remote.validators;
    if (differs(stored.etag, live.etag)) {
        store_.invalidate(url, target.parent_path());
        return refuse("File changed on server (ETag mismatch)");
    }
    if (differs(stored.last_modified, live.last_modified)) {
        store_.invalidate(url, target.parent_path());
        return refuse("File changed on server (Last-Modified mismatch)");
    }
    if (remote.size && metadata->total_size != 0 && *remote.size != metadata->total_size) {
        store_.invalidate(url, target.parent_path());
        return refuse("File changed on server (size mismatch)");
    }

    const bool validated = matches(stored.etag, live.etag) || matches(stored.last_modified, live.last_modified);
    if (!validated) {
        if (!resume_without_validators_) {
            return refuse("No validator available to confirm the partial file");
        }
        logger()->debug("Resuming {} without a matching validator", url);
    }

    const std::uint64_t expected = remote.size.value_or(metadata->total_size);
    if (expected > 0 && local_size >= expected) {
        ResumeDecision decision;
        decision.reason = "File already complete";
        decision.is_already_complete = true;
        decision.resume_from_offset = local_size;
        return decision;
    }

    ResumeDecision decision;
    decision.can_resume = true;
    decision.reason = "Partial download found";
    decision.resume_from_offset = local_size;
    return decision;
}

fs::path ResumePlanner::preferredTarget(const std::string& url, const fs::path& target) const {
    const auto metadata = store_.load(url, target.parent_path());
    if (!metadata) {
        return target;
    }
    const fs::path recorded = metadata->local_file_path.lexically_normal();
    const fs::path wanted = target.lexically_normal();
    if (recorded.parent_path() != wanted.parent_path() ||
        recorded.filename().string().rfind(wanted.filename().string(), 0) != 0) {
        return target;
    }
    return metadata->local_file_path;
}

fs::path ResumePlanner::claimUniquePath(const fs::path& path) {
    fs::path candidate = path;
    for (unsigned counter = 1;; ++counter) {
        // "x" fails with EEXIST when the name is taken, even by a concurrent transfer
        if (FILE* fp = std::fopen(candidate.c_str(), "wbx")) {
            std::fclose(fp);
            return candidate;
        }
        // any other failure is reported when the file is opened for writing
        if (errno != EEXIST) {
            return candidate;
        }
        candidate = path;
        candidate += "." + std::to_string(counter);
    }
}

void releaseUnusedClaim(const fs::path& path) noexcept {
    std::error_code ec;
    if (fs::is_regular_file(path, ec) && fs::file_size(path, ec) == 0 && !ec) {
        fs::remove(path, ec);
    }
}

} // namespace bulkget
