/*
 * bashgate C++17 - Thread Pool
 *
 * Fixed set of workers draining a FIFO of tasks. Each dispatched tool call
 * is one task; a long-running command only ties up its own worker.
 */
#ifndef bashgate_CORE_THREAD_POOL_HPP
#define bashgate_CORE_THREAD_POOL_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>
#include <cstddef>

namespace bashgate {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads);
    ~ThreadPool();

    // Queue a task. Returns false once shutdown() has begun.
    bool submit(std::function<void()> task);

    // Tasks queued but not yet picked up by a worker
    size_t pending() const;

    size_t size() const { return workers_.size(); }

    // Run everything already queued, then join the workers. Idempotent.
    void shutdown();

private:
    ThreadPool(const ThreadPool&);
    ThreadPool& operator=(const ThreadPool&);

    void worker_loop();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()> > tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_;
};

} // namespace bashgate

#endif // bashgate_CORE_THREAD_POOL_HPP
