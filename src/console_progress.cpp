#include "bulkget/console_progress.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace bulkget {

ConsoleProgress::ConsoleProgress(std::ostream& out) : out_(out) {}

void ConsoleProgress::onStart(const StartEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& line = lines_[event.index];
    line.filename = event.filename;
    line.total_bytes = event.total_size;
    line.downloaded_bytes = event.resume_from_offset;
    line.resumed = event.is_resume;
    total_tasks_ = std::max(total_tasks_, event.total);
    redrawPanel();
}

void ConsoleProgress::onProgress(const ProgressEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& line = lines_[event.index];
    line.filename = event.filename;
    line.total_bytes = event.total_size;
    line.downloaded_bytes = event.bytes_downloaded;
    line.throughput = event.instantaneous_throughput;
    redrawPanel();
}

void ConsoleProgress::onComplete(const CompleteEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& line = lines_[event.index];
    line.filename = event.filename;
    line.total_bytes = event.total_size;
    line.downloaded_bytes = event.total_size;
    line.throughput = event.throughput;
    line.done = true;
    redrawPanel();
}

void ConsoleProgress::onError(const ErrorEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    errors_.push_back(fmt::format("{}: {}", event.url, event.message));
    redrawPanel();
}

void ConsoleProgress::printSummary(const BatchStatistics& stats) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << fmt::format("Done: {} succeeded, {} failed ({} resumed, {} already complete)\n", stats.succeeded,
                        stats.failed, stats.resumed_count, stats.already_complete_count);
    out_ << fmt::format("Transferred {} in {:.1f} s, average {}/s\n", formatSize(stats.total_bytes),
                        stats.total_elapsed_ms / 1000.0,
                        formatSize(static_cast<std::uint64_t>(stats.average_throughput)));
    out_.flush();
}

std::string ConsoleProgress::buildProgressPanel() const {
    std::string panel;
    panel.reserve(lines_.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("bulkget ({} transfers)\n", std::max(total_tasks_, lines_.size()));
    panel.append("--------------------------------------------------\n");

    std::uint64_t total_all = 0;
    std::uint64_t downloaded_all = 0;
    for (const auto& [index, line] : lines_) {
        panel += formatTaskLine(line);
        panel.push_back('\n');
        total_all += line.total_bytes;
        downloaded_all += line.downloaded_bytes;
    }

    panel.append("--------------------------------------------------\n");
    if (total_all > 0) {
        const double ratio = static_cast<double>(downloaded_all) / static_cast<double>(total_all);
        panel += fmt::format("Overall: {:>3}%", static_cast<int>(std::min(ratio, 1.0) * 100.0));
    } else {
        panel.append("Overall: N/A");
    }
    panel.push_back('\n');
    for (const auto& error : errors_) {
        panel += fmt::format("  ❌ {}\n", error);
    }
    panel.append("==================================================\n");
    return panel;
}

std::string ConsoleProgress::formatTaskLine(const Line& line) {
    std::string display_name = line.filename.empty() ? "(unnamed)" : line.filename;
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }

    if (line.total_bytes == 0) {
        if (line.done) {
            return fmt::format("{:<20} {}  ✅ Done", display_name, formatSize(line.downloaded_bytes));
        }
        return fmt::format("{:<20} [{}] {}/s", display_name, formatSize(line.downloaded_bytes),
                           formatSize(static_cast<std::uint64_t>(line.throughput)));
    }

    const double ratio =
        std::min(1.0, static_cast<double>(line.downloaded_bytes) / static_cast<double>(line.total_bytes));
    const int percent = static_cast<int>(ratio * 100.0);
    constexpr int bar_width = 30;
    const int bar_pos = static_cast<int>(ratio * bar_width);

    std::string bar;
    bar.reserve(static_cast<std::size_t>(bar_width) * 3);
    for (int i = 0; i < bar_width; ++i) {
        bar += (i < bar_pos) ? "█" : "░";
    }

    std::string text = fmt::format("{:<20} [{}] {:>3}% ({}/{})", display_name, bar, percent,
                                   formatSize(line.downloaded_bytes), formatSize(line.total_bytes));
    if (line.done) {
        text.append(line.resumed ? "  ✅ Done (resumed)" : "  ✅ Done");
    } else if (line.throughput > 0.0) {
        text += fmt::format(" {}/s", formatSize(static_cast<std::uint64_t>(line.throughput)));
    }
    return text;
}

std::string ConsoleProgress::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

void ConsoleProgress::redrawPanel() {
    const std::string panel = buildProgressPanel();
    const auto current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines_ = current_lines;
}

} // namespace bulkget
