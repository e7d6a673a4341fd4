#include "bulkget/metadata_store.hpp"
#include "bulkget/log.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>

namespace fs = std::filesystem;

namespace bulkget {

namespace {

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", tm);
}

std::chrono::system_clock::time_point parseTimestamp(const std::string& text) {
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return {};
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

std::optional<std::string> optionalString(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

bool readFile(const fs::path& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

bool isRecordFile(const fs::directory_entry& entry) {
    std::error_code ec;
    return entry.is_regular_file(ec) && entry.path().extension() == TransferMetadataStore::kExtension;
}

} // namespace

std::string TransferMetadataStore::urlHash(const std::string& url) {
    using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    DigestContext ctx{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), url.data(), url.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
        throw std::runtime_error("Failed to compute MD5 digest");
    }

    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        hex += fmt::format("{:02x}", digest[i]);
    }
    return hex;
}

fs::path TransferMetadataStore::recordPath(const std::string& url, const fs::path& destination) {
    return destination / kDirectoryName / (urlHash(url) + kExtension);
}

std::string TransferMetadataStore::serialize(const TransferMetadata& metadata) {
    nlohmann::json j;
    j["url"] = metadata.url;
    j["filePath"] = metadata.local_file_path.string();
    j["totalSize"] = metadata.total_size;
    j["createdAt"] = formatTimestamp(metadata.created_at);
    j["etag"] = metadata.validators.etag ? nlohmann::json(*metadata.validators.etag) : nlohmann::json(nullptr);
    j["lastModified"] = metadata.validators.last_modified
                            ? nlohmann::json(*metadata.validators.last_modified)
                            : nlohmann::json(nullptr);
    j["version"] = 1;
    return j.dump(2);
}

TransferMetadata TransferMetadataStore::deserialize(const std::string& text) {
    const auto j = nlohmann::json::parse(text);

    TransferMetadata metadata;
    metadata.url = j.at("url").get<std::string>();
    metadata.local_file_path = j.at("filePath").get<std::string>();
    metadata.total_size = j.at("totalSize").get<std::uint64_t>();
    if (j.contains("createdAt") && j["createdAt"].is_string()) {
        metadata.created_at = parseTimestamp(j["createdAt"].get<std::string>());
    }
    metadata.validators.etag = optionalString(j, "etag");
    metadata.validators.last_modified = optionalString(j, "lastModified");
    return metadata;
}

bool TransferMetadataStore::save(const TransferMetadata& metadata) const {
    const fs::path destination = metadata.local_file_path.parent_path();
    std::error_code ec;
    fs::create_directories(destination / kDirectoryName, ec);
    if (ec) {
        logger()->warn("Failed to create resume metadata directory in '{}': {}", destination.string(), ec.message());
        return false;
    }

    try {
        const fs::path path = recordPath(metadata.url, destination);
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            logger()->warn("Failed to open resume metadata '{}' for writing", path.string());
            return false;
        }
        out << serialize(metadata);
        out.close();
        if (!out) {
            logger()->warn("Failed to write resume metadata '{}'", path.string());
            return false;
        }
        logger()->debug("Saved resume metadata for {} -> {}", metadata.url, path.string());
        return true;
    } catch (const std::exception& ex) {
        logger()->warn("Failed to save resume metadata for {}: {}", metadata.url, ex.what());
        return false;
    }
}

std::optional<TransferMetadata> TransferMetadataStore::load(const std::string& url,
                                                            const fs::path& destination) const {
    std::string text;
    if (!readFile(recordPath(url, destination), text)) {
        return std::nullopt;
    }
    try {
        return deserialize(text);
    } catch (const std::exception& ex) {
        logger()->debug("Ignoring malformed resume metadata for {}: {}", url, ex.what());
        return std::nullopt;
    }
}

void TransferMetadataStore::invalidate(const std::string& url, const fs::path& destination) const {
    std::error_code ec;
    fs::remove(recordPath(url, destination), ec);
    if (ec) {
        logger()->debug("Could not remove resume metadata for {}: {}", url, ec.message());
    }
}

std::vector<TransferMetadataStore::ResumableEntry>
TransferMetadataStore::listAll(const fs::path& destination) const {
    std::vector<ResumableEntry> entries;
    std::error_code ec;
    fs::directory_iterator it(destination / kDirectoryName, ec);
    if (ec) {
        return entries;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        if (!isRecordFile(entry)) {
            continue;
        }
        std::string text;
        if (!readFile(entry.path(), text)) {
            continue;
        }

        TransferMetadata metadata;
        try {
            metadata = deserialize(text);
        } catch (const std::exception&) {
            continue;
        }

        std::error_code size_ec;
        const auto size = fs::file_size(metadata.local_file_path, size_ec);
        if (size_ec) {
            // partial file is gone, the record can never be used again
            std::error_code rm_ec;
            fs::remove(entry.path(), rm_ec);
            logger()->debug("Removed orphaned resume metadata '{}'", entry.path().string());
            continue;
        }
        entries.push_back({std::move(metadata), static_cast<std::uint64_t>(size), entry.path()});
    }
    return entries;
}

std::size_t TransferMetadataStore::purgeOlderThan(const fs::path& destination,
                                                  std::chrono::system_clock::duration age) const {
    std::size_t removed = 0;
    std::error_code ec;
    fs::directory_iterator it(destination / kDirectoryName, ec);
    if (ec) {
        return removed;
    }

    const auto now = fs::file_time_type::clock::now();
    const auto max_age = std::chrono::duration_cast<fs::file_time_type::duration>(age);
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        if (!isRecordFile(entry)) {
            continue;
        }
        std::error_code time_ec;
        const auto written = fs::last_write_time(entry.path(), time_ec);
        if (time_ec || now - written <= max_age) {
            continue;
        }
        std::error_code rm_ec;
        if (fs::remove(entry.path(), rm_ec)) {
            ++removed;
        }
    }
    if (removed > 0) {
        logger()->debug("Purged {} stale resume record(s) in '{}'", removed, destination.string());
    }
    return removed;
}

} // namespace bulkget
