#pragma once

#include "progress.hpp"
#include "transfer_types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace bulkget {

// Redraws a panel with one line per transfer on every event.
class ConsoleProgress final : public ProgressSink {
public:
    explicit ConsoleProgress(std::ostream& out);

    void onStart(const StartEvent& event) override;
    void onProgress(const ProgressEvent& event) override;
    void onComplete(const CompleteEvent& event) override;
    void onError(const ErrorEvent& event) override;

    void printSummary(const BatchStatistics& stats);

    static std::string formatSize(std::uint64_t bytes);

private:
    struct Line {
        std::string filename;
        std::uint64_t total_bytes{0};
        std::uint64_t downloaded_bytes{0};
        double throughput{0.0};
        bool resumed{false};
        bool done{false};
    };

    std::string buildProgressPanel() const;
    static std::string formatTaskLine(const Line& line);
    void redrawPanel();

    std::ostream& out_;
    std::mutex mutex_;
    std::map<std::size_t, Line> lines_;
    std::vector<std::string> errors_;
    std::size_t total_tasks_{0};
    std::size_t previous_lines_{0};
};

} // namespace bulkget
