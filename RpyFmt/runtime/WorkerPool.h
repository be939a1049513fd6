//
// WorkerPool.h
// rpyfmt Runtime - Bounded Worker Pool
//
// A fixed set of threads draining a shared task queue. One pool is created
// per run and shared by every document's dispatch stage. TaskGroup tracks a
// batch of tasks so a caller can wait for exactly the work it submitted.
//

#ifndef RPYFMT_WORKER_POOL_H
#define RPYFMT_WORKER_POOL_H

#include <queue>
#include <vector>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <functional>
#include <exception>
#include <cstddef>

namespace RpyFmt {

// Thread-safe pool of worker threads
class WorkerPool {
public:
    // threadCount of 0 uses the hardware concurrency (at least one thread)
    explicit WorkerPool(size_t threadCount = 0);
    ~WorkerPool();

    // Queue a task for execution on a worker thread
    // Thread-safe
    void submit(std::function<void()> task);

    // Number of worker threads
    size_t getThreadCount() const { return threads_.size(); }

    // Tasks waiting to start
    // Thread-safe
    size_t pendingCount() const;

    // Finish queued work and join all threads. Called by the destructor.
    void shutdown();

private:
    void workerLoop();

    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable condVar_;
    bool stopping_;

    // Disable copy and assignment
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
};

// A batch of tasks submitted to a pool.
// The first exception thrown by any task is rethrown from wait().
class TaskGroup {
public:
    explicit TaskGroup(WorkerPool& pool);
    ~TaskGroup();

    // Submit a task belonging to this group
    void run(std::function<void()> task);

    // Block until every task of the group has finished
    void wait();

private:
    void finishOne(std::exception_ptr error);

    WorkerPool& pool_;
    size_t outstanding_;
    std::exception_ptr firstError_;
    std::mutex mutex_;
    std::condition_variable condVar_;

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;
};

} // namespace RpyFmt

#endif // RPYFMT_WORKER_POOL_H
