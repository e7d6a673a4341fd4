#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace bulkget {

// Runs at most `limit` tasks at a time on worker threads; the rest wait in FIFO order.
class ConcurrencyGate {
public:
    struct Stats {
        std::size_t running{0};
        std::size_t queued{0};
        std::size_t limit{0};
        // Worker threads alive, never more than the highest limit set.
        std::size_t workers{0};
    };

    explicit ConcurrencyGate(std::size_t max_concurrent = 3);
    ~ConcurrencyGate();

    ConcurrencyGate(const ConcurrencyGate&) = delete;
    ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;

    // The future carries the task's value, or the exception it threw.
    template <typename F>
    auto acquireAndRun(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto future = task->get_future();
        enqueue([task]() { (*task)(); });
        return future;
    }

    void setLimit(std::size_t n);
    [[nodiscard]] Stats getStats() const;
    void waitIdle();

private:
    void enqueue(std::function<void()> job);
    void spawnWorkersLocked();
    void workerLoop();

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<std::function<void()>> queue_;
    std::vector<std::thread> threads_;
    std::size_t limit_;
    std::size_t running_{0};
    std::size_t workers_{0};
    bool stopping_{false};
};

} // namespace bulkget
