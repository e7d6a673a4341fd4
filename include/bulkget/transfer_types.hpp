#pragma once

#include "error.hpp"
#include "options.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace bulkget {

struct Validators {
    std::optional<std::string> etag;
    std::optional<std::string> last_modified;

    [[nodiscard]] bool empty() const { return !etag && !last_modified; }
};

struct RemoteFileInfo {
    std::optional<std::uint64_t> size;
    bool supports_resume{false};
    Validators validators;
};

struct TransferRequest {
    std::string url;
    std::filesystem::path destination_dir;
    bool resume_enabled{true};
    bool output_to_stdout{false};
    std::size_t index{1};
    std::size_t total{1};
    ProtocolOptions protocol_options;
};

struct TransferMetadata {
    std::string url;
    std::filesystem::path local_file_path;
    std::uint64_t total_size{0};
    std::chrono::system_clock::time_point created_at{};
    Validators validators;
};

struct ResumeDecision {
    bool can_resume{false};
    std::string reason;
    std::uint64_t resume_from_offset{0};
    bool is_already_complete{false};
};

struct TransferResult {
    std::string url;
    std::size_t index{0};
    bool success{false};
    std::filesystem::path file_path;
    std::uint64_t total_size{0};
    std::uint64_t byte_count{0};
    double duration_ms{0.0};
    double throughput_bytes_per_sec{0.0};
    bool resumed{false};
    std::uint64_t resume_offset{0};
    bool already_complete{false};
    std::optional<ErrorKind> error_kind;
    std::string error_message;
};

struct BatchStatistics {
    std::size_t attempted{0};
    std::size_t succeeded{0};
    std::size_t failed{0};
    std::size_t resumed_count{0};
    std::size_t already_complete_count{0};
    std::uint64_t total_bytes{0};
    double total_elapsed_ms{0.0};
    double average_throughput{0.0};
};

} // namespace bulkget
