#include "app/BoundedWorkerPool.hpp"

#include <stdexcept>
#include <utility>

#include "common/Log.hpp"

namespace app {

BoundedWorkerPool::BoundedWorkerPool(std::size_t threads, std::size_t queueCapacity)
    : capacity_(queueCapacity == 0 ? 1 : queueCapacity) {
    if (threads == 0) {
        throw std::invalid_argument("BoundedWorkerPool needs at least one thread");
    }
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this]() { workerLoop_(); });
    }
    LOG_DEBUG("Worker pool started with " << threads << " threads, queue capacity " << capacity_);
}

BoundedWorkerPool::~BoundedWorkerPool() {
    shutdown();
}

bool BoundedWorkerPool::submit(Task task) {
    std::unique_lock<std::mutex> lock(mutex_);
    notFull_.wait(lock, [this]() { return stopping_ || queue_.size() < capacity_; });
    if (stopping_) {
        return false;
    }
    queue_.push_back(std::move(task));
    lock.unlock();
    notEmpty_.notify_one();
    return true;
}

void BoundedWorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
    }
    notEmpty_.notify_all();
    notFull_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void BoundedWorkerPool::workerLoop_() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            notEmpty_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        notFull_.notify_one();
        try {
            task();
        } catch (const std::exception& ex) {
            LOG_ERR("Worker task failed: " << ex.what());
        }
    }
}

}  // namespace app
