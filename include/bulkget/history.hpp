#pragma once

#include "transfer_types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace bulkget {

struct HistoryRecord {
    std::chrono::system_clock::time_point timestamp{};
    std::string url;
    std::string file_path;
    bool success{false};
    std::uint64_t size{0};
    double duration_ms{0.0};
    std::optional<std::string> error;
    bool resumed{false};
    bool already_complete{false};

    [[nodiscard]] static HistoryRecord fromResult(const TransferResult& result);
};

// Receives one record per settled transfer.
class HistorySink {
public:
    virtual ~HistorySink() = default;
    // May throw; the caller logs and carries on.
    virtual void record(const HistoryRecord& entry) = 0;
};

// Appends one JSON object per line.
class JsonlHistoryLog final : public HistorySink {
public:
    explicit JsonlHistoryLog(std::filesystem::path path) : path_(std::move(path)) {}

    void record(const HistoryRecord& entry) override;

    [[nodiscard]] static std::string toJsonLine(const HistoryRecord& entry);

private:
    std::filesystem::path path_;
    std::mutex mutex_;
};

} // namespace bulkget
