#include <catch2/catch.hpp>

#include "bulkget/resume_planner.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <set>
#include <thread>
#include <vector>

using namespace bulkget;
using bulkget::test::TempDir;
using bulkget::test::readFile;
using bulkget::test::writeFile;

namespace fs = std::filesystem;

namespace {

const std::string kUrl = "https://example.com/f.bin";

RemoteFileInfo remoteInfo(std::uint64_t size, std::optional<std::string> etag = std::string("\"v1\"")) {
    RemoteFileInfo remote;
    remote.size = size;
    remote.supports_resume = true;
    remote.validators.etag = std::move(etag);
    return remote;
}

void saveRecord(const TransferMetadataStore& store,
                const fs::path& target,
                std::uint64_t total,
                std::optional<std::string> etag = std::string("\"v1\""),
                std::optional<std::string> last_modified = std::nullopt) {
    TransferMetadata metadata;
    metadata.url = kUrl;
    metadata.local_file_path = target;
    metadata.total_size = total;
    metadata.created_at = std::chrono::system_clock::now();
    metadata.validators.etag = std::move(etag);
    metadata.validators.last_modified = std::move(last_modified);
    REQUIRE(store.save(metadata));
}

} // namespace

TEST_CASE("Resume decisions", "[resume]") {
    TempDir dir;
    TransferMetadataStore store;
    const ResumePlanner planner(store, true);
    const fs::path target = dir / "f.bin";

    SECTION("server without range support") {
        writeFile(target, "partial");
        saveRecord(store, target, 100);
        auto remote = remoteInfo(100);
        remote.supports_resume = false;

        const auto decision = planner.decide(kUrl, target, remote);
        REQUIRE_FALSE(decision.can_resume);
        REQUIRE(decision.reason == "Server does not support resume");
    }

    SECTION("no partial file") {
        saveRecord(store, target, 100);
        const auto decision = planner.decide(kUrl, target, remoteInfo(100));
        REQUIRE_FALSE(decision.can_resume);
        REQUIRE(decision.reason == "Partial file not found");
    }

    SECTION("a directory in the way") {
        fs::create_directories(target);
        const auto decision = planner.decide(kUrl, target, remoteInfo(100));
        REQUIRE_FALSE(decision.can_resume);
        REQUIRE(decision.reason == "Target is not a regular file");
    }

    SECTION("partial file without a record") {
        writeFile(target, "partial");
        const auto decision = planner.decide(kUrl, target, remoteInfo(100));
        REQUIRE_FALSE(decision.can_resume);
        REQUIRE(decision.reason == "No resume metadata found");
    }

    SECTION("record written for another file") {
        writeFile(target, "partial");
        saveRecord(store, dir / "other.bin", 100);
        const auto decision = planner.decide(kUrl, target, remoteInfo(100));
        REQUIRE_FALSE(decision.can_resume);
        REQUIRE(decision.reason == "File path mismatch");
    }

    SECTION("matching ETag resumes from the local size") {
        writeFile(target, std::string(40, 'x'));
        saveRecord(store, target, 100);
        const auto decision = planner.decide(kUrl, target, remoteInfo(100));
        REQUIRE(decision.can_resume);
        REQUIRE_FALSE(decision.is_already_complete);
        REQUIRE(decision.resume_from_offset == 40);
        REQUIRE(decision.reason == "Partial download found");
    }

    SECTION("changed ETag refuses and drops the record") {
        writeFile(target, std::string(40, 'x'));
        saveRecord(store, target, 100);
        const auto decision = planner.decide(kUrl, target, remoteInfo(100, std::string("\"v2\"")));
        REQUIRE_FALSE(decision.can_resume);
        REQUIRE(decision.reason == "File changed on server (ETag mismatch)");
        REQUIRE_FALSE(store.load(kUrl, dir.path()));
    }

    SECTION("changed Last-Modified refuses and drops the record") {
        writeFile(target, std::string(40, 'x'));
        saveRecord(store, target, 100, std::nullopt, std::string("Mon, 01 Jan 2024 00:00:00 GMT"));
        auto remote = remoteInfo(100, std::nullopt);
        remote.validators.last_modified = "Tue, 02 Jan 2024 00:00:00 GMT";

        const auto decision = planner.decide(kUrl, target, remote);
        REQUIRE_FALSE(decision.can_resume);
        REQUIRE(decision.reason == "File changed on server (Last-Modified mismatch)");
        REQUIRE_FALSE(store.load(kUrl, dir.path()));
    }

    SECTION("changed size refuses and drops the record") {
        writeFile(target, std::string(40, 'x'));
        saveRecord(store, target, 100);
        const auto decision = planner.decide(kUrl, target, remoteInfo(150));
        REQUIRE_FALSE(decision.can_resume);
        REQUIRE(decision.reason == "File changed on server (size mismatch)");
        REQUIRE_FALSE(store.load(kUrl, dir.path()));
    }

    SECTION("a full local file is already complete") {
        writeFile(target, std::string(100, 'x'));
        saveRecord(store, target, 100);
        const auto decision = planner.decide(kUrl, target, remoteInfo(100));
        REQUIRE_FALSE(decision.can_resume);
        REQUIRE(decision.is_already_complete);
        REQUIRE(decision.reason == "File already complete");
    }

    SECTION("an unknown remote size falls back to the recorded total") {
        writeFile(target, std::string(100, 'x'));
        saveRecord(store, target, 100);
        auto remote = remoteInfo(0);
        remote.size.reset();
        REQUIRE(planner.decide(kUrl, target, remote).is_already_complete);
    }
}

TEST_CASE("Resume without validators", "[resume]") {
    TempDir dir;
    TransferMetadataStore store;
    const fs::path target = dir / "f.bin";
    writeFile(target, std::string(10, 'x'));
    saveRecord(store, target, 100, std::nullopt);
    const auto remote = remoteInfo(100, std::nullopt);

    SECTION("allowed by default") {
        const ResumePlanner planner(store, true);
        const auto decision = planner.decide(kUrl, target, remote);
        REQUIRE(decision.can_resume);
        REQUIRE(decision.resume_from_offset == 10);
    }

    SECTION("refused when validators are required") {
        const ResumePlanner planner(store, false);
        const auto decision = planner.decide(kUrl, target, remote);
        REQUIRE_FALSE(decision.can_resume);
        REQUIRE(decision.reason == "No validator available to confirm the partial file");
        // nothing changed on the server, the record stays
        REQUIRE(store.load(kUrl, dir.path()));
    }
}

TEST_CASE("Preferred target follows a renamed partial", "[resume]") {
    TempDir dir;
    TransferMetadataStore store;
    const ResumePlanner planner(store, true);
    const fs::path target = dir / "f.bin";

    REQUIRE(planner.preferredTarget(kUrl, target) == target);

    saveRecord(store, dir / "f.bin.1", 100);
    REQUIRE(planner.preferredTarget(kUrl, target) == dir / "f.bin.1");

    saveRecord(store, dir / "unrelated.bin", 100);
    REQUIRE(planner.preferredTarget(kUrl, target) == target);
}

TEST_CASE("Claimed paths never collide", "[resume]") {
    TempDir dir;
    const fs::path target = dir / "f.bin";

    REQUIRE(ResumePlanner::claimUniquePath(target) == target);
    REQUIRE(fs::exists(target));
    REQUIRE(fs::file_size(target) == 0);

    REQUIRE(ResumePlanner::claimUniquePath(target) == dir / "f.bin.1");

    writeFile(dir / "f.bin.2", "b");
    REQUIRE(ResumePlanner::claimUniquePath(target) == dir / "f.bin.3");
    REQUIRE(readFile(dir / "f.bin.2") == "b");
}

TEST_CASE("Concurrent claims of one name get distinct paths", "[resume]") {
    TempDir dir;
    const fs::path target = dir / "f.bin";

    std::vector<fs::path> claimed(8);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < claimed.size(); ++i) {
        threads.emplace_back([&, i]() { claimed[i] = ResumePlanner::claimUniquePath(target); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    const std::set<fs::path> distinct(claimed.begin(), claimed.end());
    REQUIRE(distinct.size() == claimed.size());
    REQUIRE(distinct.count(target) == 1);
}

TEST_CASE("Unused claims are released", "[resume]") {
    TempDir dir;
    const fs::path claimed = ResumePlanner::claimUniquePath(dir / "f.bin");
    {
        PathClaim claim;
        claim.hold(claimed);
    }
    REQUIRE_FALSE(fs::exists(claimed));

    const fs::path written = ResumePlanner::claimUniquePath(dir / "g.bin");
    writeFile(written, "partial");
    {
        PathClaim claim;
        claim.hold(written);
    }
    REQUIRE(readFile(written) == "partial");

    const fs::path kept = ResumePlanner::claimUniquePath(dir / "empty.bin");
    {
        PathClaim claim;
        claim.hold(kept);
        claim.keep();
    }
    REQUIRE(fs::exists(kept));
}
