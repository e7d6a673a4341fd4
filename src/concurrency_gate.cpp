#include "bulkget/concurrency_gate.hpp"

#include <algorithm>

namespace bulkget {

ConcurrencyGate::ConcurrencyGate(std::size_t max_concurrent)
    : limit_(std::max<std::size_t>(1, max_concurrent)) {}

ConcurrencyGate::~ConcurrencyGate() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    work_cv_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void ConcurrencyGate::setLimit(std::size_t n) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        limit_ = std::max<std::size_t>(1, n);
        spawnWorkersLocked();
    }
    work_cv_.notify_all();
}

ConcurrencyGate::Stats ConcurrencyGate::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {running_, queue_.size(), limit_, workers_};
}

void ConcurrencyGate::waitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return running_ == 0 && queue_.empty(); });
}

void ConcurrencyGate::enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(job));
        spawnWorkersLocked();
    }
    work_cv_.notify_one();
}

void ConcurrencyGate::spawnWorkersLocked() {
    const std::size_t wanted = std::min(limit_, running_ + queue_.size());
    while (workers_ < wanted) {
        ++workers_;
        threads_.emplace_back([this] { workerLoop(); });
    }
}

void ConcurrencyGate::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        // workers beyond a lowered limit stay parked here until the limit rises again
        work_cv_.wait(lock, [this] { return (stopping_ && queue_.empty()) || (!queue_.empty() && running_ < limit_); });

        if (queue_.empty()) {
            break;
        }

        auto job = std::move(queue_.front());
        queue_.pop_front();
        ++running_;

        lock.unlock();
        job();
        lock.lock();

        --running_;
        if (running_ == 0 && queue_.empty()) {
            idle_cv_.notify_all();
        }
        work_cv_.notify_all();
    }
    --workers_;
}

} // namespace bulkget
