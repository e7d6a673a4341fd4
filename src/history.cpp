#include "bulkget/history.hpp"
#include "bulkget/error.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <system_error>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace bulkget {

HistoryRecord HistoryRecord::fromResult(const TransferResult& result) {
    HistoryRecord entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.url = result.url;
    entry.file_path = result.file_path.string();
    entry.success = result.success;
    entry.size = result.success ? result.total_size : result.byte_count;
    entry.duration_ms = result.duration_ms;
    if (!result.success) {
        entry.error = result.error_message;
    }
    entry.resumed = result.resumed;
    entry.already_complete = result.already_complete;
    return entry;
}

std::string JsonlHistoryLog::toJsonLine(const HistoryRecord& entry) {
    const std::time_t t = std::chrono::system_clock::to_time_t(entry.timestamp);
    std::tm tm{};
    gmtime_r(&t, &tm);

    nlohmann::json j;
    j["timestamp"] = fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", tm);
    j["url"] = entry.url;
    j["filePath"] = entry.file_path;
    j["status"] = entry.success ? "success" : "failed";
    j["size"] = entry.size;
    j["durationMs"] = entry.duration_ms;
    j["error"] = entry.error ? nlohmann::json(*entry.error) : nlohmann::json(nullptr);
    j["resumed"] = entry.resumed;
    j["alreadyComplete"] = entry.already_complete;
    return j.dump();
}

void JsonlHistoryLog::record(const HistoryRecord& entry) {
    const std::string line = toJsonLine(entry);

    std::lock_guard<std::mutex> lock(mutex_);
    if (path_.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path_.parent_path(), ec);
    }
    std::ofstream out(path_, std::ios::app);
    if (!out.is_open()) {
        throw TransferError::filesystem("open", path_.string(), std::strerror(errno));
    }
    out << line << '\n';
    if (!out) {
        throw TransferError::filesystem("append to", path_.string(), "write failed");
    }
}

} // namespace bulkget
