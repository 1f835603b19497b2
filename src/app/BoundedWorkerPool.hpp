#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace app {

// Fixed set of threads draining a bounded FIFO. submit() blocks while the
// queue is full so producers cannot run ahead of the workers.
class BoundedWorkerPool {
public:
    using Task = std::function<void()>;

    BoundedWorkerPool(std::size_t threads, std::size_t queueCapacity);
    ~BoundedWorkerPool();

    BoundedWorkerPool(const BoundedWorkerPool&) = delete;
    BoundedWorkerPool& operator=(const BoundedWorkerPool&) = delete;

    // Returns false once the pool is shut down. Tasks must not throw.
    bool submit(Task task);

    // Runs what is already queued, then joins the workers.
    void shutdown();

    std::size_t threadCount() const noexcept { return workers_.size(); }

private:
    void workerLoop_();

    const std::size_t capacity_;
    std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::deque<Task> queue_;
    bool stopping_ = false;
    std::vector<std::thread> workers_;
};

}  // namespace app
