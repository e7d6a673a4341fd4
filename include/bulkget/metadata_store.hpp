#pragma once

#include "transfer_types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bulkget {

// Sidecar resume records: <destination>/.bulkget-resume/<md5(url)>.bulkget-meta
class TransferMetadataStore {
public:
    static constexpr const char* kDirectoryName = ".bulkget-resume";
    static constexpr const char* kExtension = ".bulkget-meta";

    struct ResumableEntry {
        TransferMetadata metadata;
        std::uint64_t current_size{0};
        std::filesystem::path record_path;
    };

    // Writes the record next to metadata.local_file_path. Returns false (and logs)
    // when the record cannot be written; the caller keeps transferring.
    bool save(const TransferMetadata& metadata) const;

    [[nodiscard]] std::optional<TransferMetadata> load(const std::string& url,
                                                       const std::filesystem::path& destination) const;

    void invalidate(const std::string& url, const std::filesystem::path& destination) const;

    // Records whose target file still exists. Orphaned records are deleted.
    std::vector<ResumableEntry> listAll(const std::filesystem::path& destination) const;

    // Deletes records last written more than `age` ago. Returns how many were removed.
    std::size_t purgeOlderThan(const std::filesystem::path& destination,
                               std::chrono::system_clock::duration age) const;

    [[nodiscard]] static std::filesystem::path recordPath(const std::string& url,
                                                          const std::filesystem::path& destination);
    [[nodiscard]] static std::string urlHash(const std::string& url);

    [[nodiscard]] static std::string serialize(const TransferMetadata& metadata);
    // Throws on malformed input.
    [[nodiscard]] static TransferMetadata deserialize(const std::string& text);
};

} // namespace bulkget
