#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace bulkget {

struct StartEvent {
    std::string filename;
    std::uint64_t total_size{0};
    std::size_t index{0};
    std::size_t total{0};
    bool is_resume{false};
    std::uint64_t resume_from_offset{0};
};

struct ProgressEvent {
    std::string filename;
    std::size_t index{0};
    std::uint64_t bytes_downloaded{0}; // cumulative, including the resume offset
    std::uint64_t total_size{0};
    double instantaneous_throughput{0.0};
};

struct CompleteEvent {
    std::string filename;
    std::size_t index{0};
    std::uint64_t total_size{0};
    double elapsed_seconds{0.0};
    double throughput{0.0};
};

struct ErrorEvent {
    std::string message;
    std::string url;
};

// Receives transfer events from worker threads; implementations synchronize themselves.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    virtual void onStart(const StartEvent& event) = 0;
    virtual void onProgress(const ProgressEvent& event) = 0;
    virtual void onComplete(const CompleteEvent& event) = 0;
    virtual void onError(const ErrorEvent& event) = 0;
};

class NullProgressSink final : public ProgressSink {
public:
    void onStart(const StartEvent&) override {}
    void onProgress(const ProgressEvent&) override {}
    void onComplete(const CompleteEvent&) override {}
    void onError(const ErrorEvent&) override {}
};

} // namespace bulkget
