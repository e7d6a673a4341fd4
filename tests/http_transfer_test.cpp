#include <catch2/catch.hpp>

#include "bulkget/http_transfer.hpp"
#include "test_support.hpp"

#include <filesystem>

using namespace bulkget;
using namespace bulkget::test;

namespace fs = std::filesystem;

namespace {

const std::string kUrl = "https://example.com/files/f.bin";

struct HttpFixture {
    TempDir dir;
    TransferMetadataStore store;
    RecordingProgressSink sink;
    FakeHttpClient client;
    HttpTransfer transfer{client, store, sink, ProtocolOptions{}};
    std::string body = makeBody(1000);

    HttpFixture() {
        FakeHttpClient::Resource r;
        r.body = body;
        r.etag = "\"v1\"";
        client.serve(kUrl, r);
    }

    TransferRequest request(bool resume = true) const {
        TransferRequest req;
        req.url = kUrl;
        req.destination_dir = dir.path();
        req.resume_enabled = resume;
        return req;
    }

    void leavePartial(std::size_t bytes, const std::string& etag = "\"v1\"") {
        writeFile(dir / "f.bin", body.substr(0, bytes));
        TransferMetadata metadata;
        metadata.url = kUrl;
        metadata.local_file_path = dir / "f.bin";
        metadata.total_size = body.size();
        metadata.created_at = std::chrono::system_clock::now();
        metadata.validators.etag = etag;
        REQUIRE(store.save(metadata));
    }

    bool sentRange(std::size_t request_index) const {
        const auto requests = client.getRequests();
        for (const auto& line : requests.at(request_index).headers) {
            if (line.rfind("Range:", 0) == 0) {
                return true;
            }
        }
        return false;
    }
};

} // namespace

TEST_CASE_METHOD(HttpFixture, "HTTP fresh download", "[http]") {
    const auto result = transfer.transfer(request());

    REQUIRE(result.success);
    REQUIRE(result.file_path == dir / "f.bin");
    REQUIRE(readFile(result.file_path) == body);
    REQUIRE(result.byte_count == 1000);
    REQUIRE(result.total_size == 1000);
    REQUIRE_FALSE(result.resumed);
    REQUIRE_FALSE(sentRange(0));

    REQUIRE(sink.starts.size() == 1);
    REQUIRE_FALSE(sink.starts[0].is_resume);
    REQUIRE(sink.starts[0].total_size == 1000);
    REQUIRE(sink.completes.size() == 1);
    REQUIRE_FALSE(sink.progress.empty());
    for (std::size_t i = 1; i < sink.progress.size(); ++i) {
        REQUIRE(sink.progress[i].bytes_downloaded >= sink.progress[i - 1].bytes_downloaded);
    }
    REQUIRE(sink.progress.back().bytes_downloaded <= 1000);

    // a finished download leaves no resume record behind
    REQUIRE_FALSE(store.load(kUrl, dir.path()));
}

TEST_CASE_METHOD(HttpFixture, "HTTP resume continues a partial file", "[http]") {
    leavePartial(300);

    const auto result = transfer.transfer(request());

    REQUIRE(result.success);
    REQUIRE(result.file_path == dir / "f.bin");
    REQUIRE(readFile(result.file_path) == body);
    REQUIRE(result.resumed);
    REQUIRE(result.resume_offset == 300);
    REQUIRE(result.byte_count == 700);

    const auto requests = client.getRequests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].headers == std::vector<std::string>{"Range: bytes=300-"});

    REQUIRE(sink.starts.size() == 1);
    REQUIRE(sink.starts[0].is_resume);
    REQUIRE(sink.starts[0].resume_from_offset == 300);
    REQUIRE_FALSE(sink.progress.empty());
    REQUIRE(sink.progress.front().bytes_downloaded > 300);
    REQUIRE_FALSE(store.load(kUrl, dir.path()));
}

TEST_CASE_METHOD(HttpFixture, "HTTP resume refused when the ETag changed", "[http]") {
    leavePartial(300, "\"old\"");
    const std::string stale = readFile(dir / "f.bin");

    const auto result = transfer.transfer(request());

    REQUIRE(result.success);
    REQUIRE_FALSE(result.resumed);
    REQUIRE(result.file_path == dir / "f.bin.1");
    REQUIRE(readFile(result.file_path) == body);
    REQUIRE(readFile(dir / "f.bin") == stale);
    REQUIRE_FALSE(sentRange(0));
}

TEST_CASE_METHOD(HttpFixture, "HTTP resume falls back when the server ignores the range", "[http]") {
    FakeHttpClient::Resource r;
    r.body = body;
    r.etag = "\"v1\"";
    r.honor_range = false;
    client.serve(kUrl, r);
    leavePartial(300);
    const std::string stale = readFile(dir / "f.bin");

    const auto result = transfer.transfer(request());

    REQUIRE(result.success);
    REQUIRE_FALSE(result.resumed);
    REQUIRE(result.file_path == dir / "f.bin.1");
    REQUIRE(readFile(result.file_path) == body);
    REQUIRE(readFile(dir / "f.bin") == stale);

    REQUIRE(client.getRequests().size() == 2);
    REQUIRE(sentRange(0));
    REQUIRE_FALSE(sentRange(1));
    REQUIRE_FALSE(store.load(kUrl, dir.path()));
}

TEST_CASE_METHOD(HttpFixture, "HTTP download already complete", "[http]") {
    leavePartial(body.size());

    const auto result = transfer.transfer(request());

    REQUIRE(result.success);
    REQUIRE(result.already_complete);
    REQUIRE(result.duration_ms == 0.0);
    REQUIRE(result.byte_count == 0);
    REQUIRE(result.total_size == 1000);
    REQUIRE(client.getRequests().empty());
    REQUIRE(client.headCount() == 1);
    REQUIRE(sink.completes.size() == 1);
    REQUIRE(sink.starts.empty());
    REQUIRE_FALSE(store.load(kUrl, dir.path()));
}

TEST_CASE_METHOD(HttpFixture, "HTTP downloads never overwrite an existing file", "[http]") {
    writeFile(dir / "f.bin", "keep me");

    const auto first = transfer.transfer(request(false));
    const auto second = transfer.transfer(request(false));

    REQUIRE(first.file_path == dir / "f.bin.1");
    REQUIRE(second.file_path == dir / "f.bin.2");
    REQUIRE(readFile(dir / "f.bin") == "keep me");
    REQUIRE(readFile(first.file_path) == body);
    REQUIRE(readFile(second.file_path) == body);
    REQUIRE_FALSE(fs::exists(dir / TransferMetadataStore::kDirectoryName));
}

TEST_CASE_METHOD(HttpFixture, "HTTP without range support starts over beside the partial", "[http]") {
    FakeHttpClient::Resource r;
    r.body = body;
    r.accept_ranges = false;
    client.serve(kUrl, r);
    leavePartial(300);

    const auto result = transfer.transfer(request());

    REQUIRE(result.file_path == dir / "f.bin.1");
    REQUIRE_FALSE(result.resumed);
    REQUIRE_FALSE(sentRange(0));
    REQUIRE(readFile(dir / "f.bin").size() == 300);
}

TEST_CASE_METHOD(HttpFixture, "HTTP body shorter than announced", "[http]") {
    FakeHttpClient::Resource r;
    r.body = body;
    r.etag = "\"v1\"";
    r.truncate_after = 500;
    client.serve(kUrl, r);

    try {
        (void)transfer.transfer(request());
        FAIL("transfer should throw");
    } catch (const TransferError& ex) {
        REQUIRE(ex.kind() == ErrorKind::Network);
    }

    // the partial and its record stay for the next attempt
    REQUIRE(readFile(dir / "f.bin").size() == 500);
    const auto record = store.load(kUrl, dir.path());
    REQUIRE(record);
    REQUIRE(record->total_size == 1000);
    REQUIRE(record->validators.etag == std::optional<std::string>("\"v1\""));
}

TEST_CASE_METHOD(HttpFixture, "HTTP errors carry the status", "[http]") {
    auto req = request();
    req.url = "https://example.com/missing.bin";

    try {
        (void)transfer.transfer(req);
        FAIL("transfer should throw");
    } catch (const TransferError& ex) {
        REQUIRE(ex.kind() == ErrorKind::Http);
        REQUIRE(ex.httpStatus() == 404);
    }
    REQUIRE_FALSE(fs::exists(dir / "missing.bin"));
}

TEST_CASE_METHOD(HttpFixture, "HTTP failure before the body leaves no empty file", "[http]") {
    FakeHttpClient::Resource r;
    r.body = body;
    r.get_status = 503;
    client.serve(kUrl, r);

    try {
        (void)transfer.transfer(request());
        FAIL("transfer should throw");
    } catch (const TransferError& ex) {
        REQUIRE(ex.httpStatus() == 503);
    }
    REQUIRE_FALSE(fs::exists(dir / "f.bin"));
}

TEST_CASE_METHOD(HttpFixture, "HTTP download continues when resume state cannot be written", "[http]") {
    // a regular file where the metadata directory belongs
    writeFile(dir / TransferMetadataStore::kDirectoryName, "in the way");

    TransferMetadata metadata;
    metadata.url = kUrl;
    metadata.local_file_path = dir / "f.bin";
    metadata.total_size = body.size();
    REQUIRE_FALSE(store.save(metadata));

    const auto result = transfer.transfer(request());

    REQUIRE(result.success);
    REQUIRE(result.file_path == dir / "f.bin");
    REQUIRE(readFile(result.file_path) == body);
    REQUIRE(fs::is_regular_file(dir / TransferMetadataStore::kDirectoryName));
}

TEST_CASE_METHOD(HttpFixture, "HTTP to standard output", "[http]") {
    FakeHttpClient::Resource r;
    r.body = "bulkget stdout check\n";
    client.serve(kUrl, r);

    auto req = request(false);
    req.output_to_stdout = true;
    const auto result = transfer.transfer(req);

    REQUIRE(result.success);
    REQUIRE(result.file_path == fs::path("stdout"));
    REQUIRE(result.byte_count == r.body.size());
    REQUIRE(fs::is_empty(dir.path()));
}

TEST_CASE_METHOD(HttpFixture, "HTTP progress cadence follows the chunk interval", "[http]") {
    client.chunk_size = 100;
    auto req = request();
    req.protocol_options.progress.chunk_interval = 1;
    req.protocol_options.progress.interval = std::chrono::minutes(1);

    (void)transfer.transfer(req);

    REQUIRE(sink.progress.size() == 10);
    REQUIRE(sink.progress.back().bytes_downloaded == 1000);
}

TEST_CASE_METHOD(HttpFixture, "HTTP file info", "[http]") {
    const auto info = transfer.fetchFileInfo(kUrl);
    REQUIRE(info.size == std::optional<std::uint64_t>(1000));
    REQUIRE(info.supports_resume);
    REQUIRE(info.validators.etag == std::optional<std::string>("\"v1\""));
}
