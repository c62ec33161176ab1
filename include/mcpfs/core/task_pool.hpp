#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace mcpfs {

// ---------------------------------------------------------------------------
// TaskPool: fixed set of worker threads draining a FIFO of tasks.
//
// Tasks must not throw; an escaping exception is logged and dropped.
// Shutdown() stops accepting work, runs what is already queued, and joins.
// ---------------------------------------------------------------------------
class TaskPool {
public:
    explicit TaskPool(std::size_t workers);
    ~TaskPool();

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    // Returns false once Shutdown() has begun.
    bool Submit(std::function<void()> task);

    void Shutdown();

    [[nodiscard]] std::size_t Workers() const noexcept { return threads_.size(); }

    // Tasks queued or running.
    [[nodiscard]] std::size_t Outstanding() const;

private:
    void WorkerLoop();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> queue_;
    std::size_t running_ = 0;
    bool stopping_ = false;
    std::vector<std::thread> threads_;
};

} // namespace mcpfs
