/*
 * docgate - Worker pool for tool invocations
 */
#ifndef DOCGATE_CORE_THREAD_POOL_HPP
#define DOCGATE_CORE_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>

namespace docgate {

// Fixed-size pool. Tasks run in FIFO order of pickup; no ordering is
// guaranteed between tasks running on different workers.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 4);
    ~ThreadPool();

    // False once the pool has been shut down
    bool enqueue(const std::function<void()>& task);

    // Block until the queue is empty and no task is running
    void wait_idle();

    // Drains queued tasks, then joins the workers
    void shutdown();

private:
    void worker();

    std::vector<std::thread> threads_;
    std::queue<std::function<void()> > tasks_;
    size_t active_;
    bool stop_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable idle_;
};

} // namespace docgate

#endif // DOCGATE_CORE_THREAD_POOL_HPP
