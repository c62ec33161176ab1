#include <mcpfs/core/task_pool.hpp>

#include <mcpfs/core/log.hpp>

#include <exception>
#include <string>

namespace mcpfs {

TaskPool::TaskPool(std::size_t workers) {
    if (workers == 0) workers = 1;
    threads_.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        threads_.emplace_back([this] { WorkerLoop(); });
    }
}

TaskPool::~TaskPool() {
    Shutdown();
}

bool TaskPool::Submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return false;
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void TaskPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

std::size_t TaskPool::Outstanding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size() + running_;
}

void TaskPool::WorkerLoop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return; // stopping and drained
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            ++running_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            LogError("pool", std::string("Task threw: ") + e.what());
        } catch (...) {
            LogError("pool", "Task threw a non-standard exception");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        --running_;
    }
}

} // namespace mcpfs
