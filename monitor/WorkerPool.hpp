#pragma once

#include <atomic>
#include <functional>
#include <thread>
#include <vector>
#include "../common/ThreadSafeQueue.hpp"

namespace lan_watch::monitor
{
    // Fixed set of threads draining one task queue. The thread count is the
    // probing concurrency ceiling.
    class WorkerPool
    {
    public:
        using Task = std::function<void()>;

        explicit WorkerPool(size_t threads);
        ~WorkerPool();

        WorkerPool(const WorkerPool &) = delete;
        WorkerPool &operator=(const WorkerPool &) = delete;

        bool Submit(Task task);

        // Runs the tasks already queued, then joins every thread.
        void Shutdown();

        size_t ThreadCount() const { return m_threads.size(); }

    private:
        void WorkerLoop();

        common::ThreadSafeQueue<Task> m_queue;
        std::vector<std::thread> m_threads;
        std::atomic<bool> m_stopped;
    };
}
