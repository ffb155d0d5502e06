#include <catch2/catch.hpp>
#include "monitor/WorkerPool.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using lan_watch::monitor::WorkerPool;

TEST_CASE("WorkerPool runs every queued task before shutting down", "[pool]")
{
    std::atomic<int> ran{0};
    WorkerPool pool(4);
    REQUIRE(pool.ThreadCount() == 4);

    for (int i = 0; i < 100; ++i)
        REQUIRE(pool.Submit([&ran] { ++ran; }));
    pool.Shutdown();

    REQUIRE(ran == 100);
    REQUIRE_FALSE(pool.Submit([&ran] { ++ran; }));
}

TEST_CASE("WorkerPool never exceeds its thread count", "[pool]")
{
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    {
        WorkerPool pool(3);
        for (int i = 0; i < 12; ++i)
        {
            pool.Submit([&]
                        {
                int now = ++active;
                int seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now))
                {
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                --active; });
        }
    }
    REQUIRE(peak <= 3);
    REQUIRE(peak >= 1);
}

TEST_CASE("WorkerPool survives a throwing task", "[pool]")
{
    std::atomic<int> ran{0};
    WorkerPool pool(0);
    REQUIRE(pool.ThreadCount() == 1);

    pool.Submit([] { throw std::runtime_error("boom"); });
    pool.Submit([&ran] { ++ran; });
    pool.Shutdown();
    REQUIRE(ran == 1);
}
