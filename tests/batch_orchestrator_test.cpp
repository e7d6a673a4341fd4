#include <catch2/catch.hpp>

#include "bulkget/batch_orchestrator.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <set>
#include <stdexcept>

using namespace bulkget;
using namespace bulkget::test;

namespace fs = std::filesystem;

namespace {

class RecordingHistory final : public HistorySink {
public:
    void record(const HistoryRecord& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.push_back(entry);
    }

    std::vector<HistoryRecord> entries;

private:
    std::mutex mutex_;
};

class BrokenHistory final : public HistorySink {
public:
    void record(const HistoryRecord&) override { throw std::runtime_error("disk full"); }
};

struct BatchFixture {
    TempDir dir;
    FakeHttpClient http;
    FakeSftpServer sftp_server;
    SftpConnectionCache cache{fakeSftpFactory(sftp_server)};
    RecordingProgressSink sink;

    fs::path destination() const { return dir / "out"; }

    std::string serveFile(const std::string& name, std::size_t size) {
        const std::string url = "https://example.com/" + name;
        FakeHttpClient::Resource r;
        r.body = makeBody(size, static_cast<char>('a' + size % 7));
        http.serve(url, r);
        return url;
    }
};

} // namespace

TEST_CASE_METHOD(BatchFixture, "Batch of five with two slots", "[batch]") {
    http.get_delay = std::chrono::milliseconds(20);
    std::vector<std::string> urls;
    std::uint64_t expected_bytes = 0;
    for (std::size_t i = 1; i <= 5; ++i) {
        urls.push_back(serveFile("file" + std::to_string(i) + ".bin", i * 100));
        expected_bytes += i * 100;
    }

    BatchOptions options;
    options.max_concurrent = 2;
    BatchOrchestrator orchestrator(http, cache, sink);
    const auto results = orchestrator.run(urls, destination(), options);

    REQUIRE(results.size() == 5);
    for (std::size_t i = 0; i < results.size(); ++i) {
        REQUIRE(results[i].success);
        REQUIRE(results[i].url == urls[i]);
        REQUIRE(results[i].index == i + 1);
        REQUIRE(fs::file_size(results[i].file_path) == (i + 1) * 100);
    }
    REQUIRE(http.maxInFlight() <= 2);

    const auto stats = orchestrator.statistics();
    REQUIRE(stats.attempted == 5);
    REQUIRE(stats.succeeded == 5);
    REQUIRE(stats.failed == 0);
    REQUIRE(stats.total_bytes == expected_bytes);
    REQUIRE(stats.total_elapsed_ms > 0.0);

    REQUIRE(sink.starts.size() == 5);
    REQUIRE(sink.completes.size() == 5);
    REQUIRE(sink.errors.empty());
    REQUIRE(orchestrator.gate().getStats().limit == 2);
}

TEST_CASE_METHOD(BatchFixture, "Same file name from two hosts lands in two files", "[batch]") {
    http.get_delay = std::chrono::milliseconds(200);
    const std::vector<std::string> urls = {"https://a.example/f.bin", "https://b.example/f.bin"};
    FakeHttpClient::Resource a;
    a.body = std::string(100, 'A');
    http.serve(urls[0], a);
    FakeHttpClient::Resource b;
    b.body = std::string(100, 'B');
    http.serve(urls[1], b);

    BatchOptions options;
    options.max_concurrent = 2;
    BatchOrchestrator orchestrator(http, cache, sink);
    const auto results = orchestrator.run(urls, destination(), options);

    REQUIRE(results.size() == 2);
    REQUIRE(results[0].success);
    REQUIRE(results[1].success);
    REQUIRE(results[0].file_path != results[1].file_path);
    REQUIRE(readFile(results[0].file_path) == a.body);
    REQUIRE(readFile(results[1].file_path) == b.body);

    std::set<fs::path> names;
    for (const auto& entry : fs::directory_iterator(destination())) {
        if (entry.is_regular_file()) {
            names.insert(entry.path().filename());
        }
    }
    REQUIRE(names == std::set<fs::path>{"f.bin", "f.bin.1"});
}

TEST_CASE_METHOD(BatchFixture, "Batch rejects unusable input before any transfer", "[batch]") {
    const auto a = serveFile("a.bin", 10);
    const auto b = serveFile("b.bin", 10);
    BatchOrchestrator orchestrator(http, cache, sink);
    BatchOptions options;

    SECTION("standard output with two URLs") {
        options.output_to_stdout = true;
        try {
            (void)orchestrator.run({a, b}, destination(), options);
            FAIL("run should throw");
        } catch (const TransferError& ex) {
            REQUIRE(ex.kind() == ErrorKind::Validation);
        }
    }

    SECTION("no URLs") {
        REQUIRE_THROWS_AS(orchestrator.run({}, destination(), options), TransferError);
    }

    SECTION("zero concurrency") {
        options.max_concurrent = 0;
        REQUIRE_THROWS_AS(orchestrator.run({a}, destination(), options), TransferError);
    }

    REQUIRE(http.headCount() == 0);
    REQUIRE(http.getRequests().empty());
    REQUIRE(sink.starts.empty());
}

TEST_CASE_METHOD(BatchFixture, "Batch keeps going past a failed URL", "[batch]") {
    const auto good = serveFile("good.bin", 64);
    RecordingHistory history;
    BatchOrchestrator orchestrator(http, cache, sink, &history);

    const auto results = orchestrator.run({"ftp://example.com/x.bin", good, "https://example.com/missing.bin"},
                                          destination(), BatchOptions{});

    REQUIRE(results.size() == 3);
    REQUIRE_FALSE(results[0].success);
    REQUIRE(results[0].error_kind == std::optional<ErrorKind>(ErrorKind::Validation));
    REQUIRE(results[1].success);
    REQUIRE_FALSE(results[2].success);
    REQUIRE(results[2].error_kind == std::optional<ErrorKind>(ErrorKind::Http));

    const auto stats = orchestrator.statistics();
    REQUIRE(stats.succeeded == 1);
    REQUIRE(stats.failed == 2);
    REQUIRE(stats.total_bytes == 64);

    REQUIRE(sink.errors.size() == 2);
    REQUIRE(history.entries.size() == 3);
    std::size_t failures = 0;
    for (const auto& entry : history.entries) {
        if (!entry.success) {
            ++failures;
            REQUIRE(entry.error);
        }
    }
    REQUIRE(failures == 2);
}

TEST_CASE_METHOD(BatchFixture, "Batch mixes HTTP and SFTP", "[batch]") {
    const auto http_url = serveFile("web.bin", 300);
    sftp_server.accepted_secrets = {"pw"};
    sftp_server.files["/srv/remote.bin"] = {makeBody(500), 1700000000, true};

    BatchOptions options;
    options.protocol.ssh.password = "pw";
    BatchOrchestrator orchestrator(http, cache, sink);
    const auto results =
        orchestrator.run({http_url, "sftp://dave@files.example.com/srv/remote.bin"}, destination(), options);

    REQUIRE(results[0].success);
    REQUIRE(results[1].success);
    REQUIRE(results[1].file_path == destination() / "remote.bin");
    REQUIRE(orchestrator.statistics().total_bytes == 800);

    orchestrator.closeConnections();
    REQUIRE(cache.size() == 0);
}

TEST_CASE_METHOD(BatchFixture, "Batch with a failing history sink still succeeds", "[batch]") {
    const auto url = serveFile("a.bin", 32);
    BrokenHistory history;
    BatchOrchestrator orchestrator(http, cache, sink, &history);

    const auto results = orchestrator.run({url}, destination(), BatchOptions{});
    REQUIRE(results.at(0).success);
}

TEST_CASE_METHOD(BatchFixture, "Quiet batch reports no progress", "[batch]") {
    const auto url = serveFile("a.bin", 32);
    BatchOptions options;
    options.quiet_mode = true;
    BatchOrchestrator orchestrator(http, cache, sink);

    const auto results = orchestrator.run({url, "ftp://example.com/b"}, destination(), options);

    REQUIRE(results[0].success);
    REQUIRE_FALSE(results[1].success);
    REQUIRE(sink.starts.empty());
    REQUIRE(sink.completes.empty());
    REQUIRE(sink.errors.empty());
}

TEST_CASE_METHOD(BatchFixture, "Batch sweeps stale resume records", "[batch]") {
    const auto url = serveFile("a.bin", 32);
    const fs::path dest = destination();
    fs::create_directories(dest);

    TransferMetadataStore store;
    TransferMetadata stale;
    stale.url = "https://example.com/abandoned.bin";
    stale.local_file_path = dest / "abandoned.bin";
    stale.total_size = 100;
    writeFile(stale.local_file_path, "partial");
    REQUIRE(store.save(stale));
    const auto record = TransferMetadataStore::recordPath(stale.url, dest);
    fs::last_write_time(record, fs::file_time_type::clock::now() - std::chrono::hours(24 * 30));

    BatchOrchestrator orchestrator(http, cache, sink);
    (void)orchestrator.run({url}, dest, BatchOptions{});

    REQUIRE_FALSE(fs::exists(record));
    // the partial itself is left alone
    REQUIRE(fs::exists(stale.local_file_path));
}

TEST_CASE("Batch statistics", "[batch]") {
    std::vector<TransferResult> results(4);
    results[0].success = true;
    results[0].byte_count = 100;
    results[0].throughput_bytes_per_sec = 1000.0;
    results[1].success = true;
    results[1].byte_count = 50;
    results[1].resumed = true;
    results[1].throughput_bytes_per_sec = 3000.0;
    results[2].success = true;
    results[2].already_complete = true;
    results[3].success = false;
    results[3].byte_count = 999;

    const auto stats = BatchOrchestrator::summarize(results, 250.0);
    REQUIRE(stats.attempted == 4);
    REQUIRE(stats.succeeded == 3);
    REQUIRE(stats.failed == 1);
    REQUIRE(stats.resumed_count == 1);
    REQUIRE(stats.already_complete_count == 1);
    REQUIRE(stats.total_bytes == 150);
    REQUIRE(stats.total_elapsed_ms == 250.0);
    REQUIRE(stats.average_throughput == Approx(2000.0));
}
