#include "WorkerPool.hpp"
#include <iostream>

namespace lan_watch::monitor
{
    WorkerPool::WorkerPool(size_t threads) : m_stopped(false)
    {
        if (threads == 0)
            threads = 1;

        m_threads.reserve(threads);
        for (size_t i = 0; i < threads; ++i)
            m_threads.emplace_back(&WorkerPool::WorkerLoop, this);
    }

    WorkerPool::~WorkerPool()
    {
        Shutdown();
    }

    bool WorkerPool::Submit(Task task)
    {
        if (m_stopped)
            return false;
        return m_queue.Push(std::move(task));
    }

    void WorkerPool::Shutdown()
    {
        if (m_stopped.exchange(true))
            return;

        m_queue.Shutdown();
        for (auto &thread : m_threads)
        {
            if (thread.joinable())
                thread.join();
        }
    }

    void WorkerPool::WorkerLoop()
    {
        while (auto task = m_queue.Pop())
        {
            try
            {
                (*task)();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[WorkerPool] Task failed: " << e.what() << "\n";
            }
        }
    }
}
