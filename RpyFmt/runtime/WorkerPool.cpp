//
// WorkerPool.cpp
// rpyfmt Runtime - Bounded Worker Pool Implementation
//

#include "WorkerPool.h"
#include <algorithm>
#include <utility>

namespace RpyFmt {

// =============================================================================
// WorkerPool
// =============================================================================

WorkerPool::WorkerPool(size_t threadCount)
    : stopping_(false) {
    if (threadCount == 0) {
        threadCount = std::max(1u, std::thread::hardware_concurrency());
    }
    threads_.reserve(threadCount);
    for (size_t i = 0; i < threadCount; i++) {
        threads_.emplace_back(&WorkerPool::workerLoop, this);
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push(std::move(task));
    }
    condVar_.notify_one();
}

size_t WorkerPool::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    condVar_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void WorkerPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condVar_.wait(lock, [this]() {
                return stopping_ || !tasks_.empty();
            });

            // Drain the queue before exiting
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        task();
    }
}

// =============================================================================
// TaskGroup
// =============================================================================

TaskGroup::TaskGroup(WorkerPool& pool)
    : pool_(pool), outstanding_(0) {
}

TaskGroup::~TaskGroup() {
    // Tasks reference this group; never leave while they run
    std::unique_lock<std::mutex> lock(mutex_);
    condVar_.wait(lock, [this]() { return outstanding_ == 0; });
}

void TaskGroup::run(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outstanding_++;
    }

    pool_.submit([this, task]() {
        std::exception_ptr error;
        try {
            task();
        } catch (...) {
            error = std::current_exception();
        }
        finishOne(error);
    });
}

void TaskGroup::finishOne(std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (error && !firstError_) {
        firstError_ = error;
    }
    outstanding_--;
    if (outstanding_ == 0) {
        condVar_.notify_all();
    }
}

void TaskGroup::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    condVar_.wait(lock, [this]() { return outstanding_ == 0; });

    if (firstError_) {
        std::exception_ptr error = firstError_;
        firstError_ = nullptr;
        std::rethrow_exception(error);
    }
}

} // namespace RpyFmt
