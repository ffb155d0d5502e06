#include "ScanOrchestrator.hpp"
#include <algorithm>
#include <iostream>
#include <optional>

namespace lan_watch::monitor
{
    namespace
    {
        // Shared between RunCycle and its device tasks; tasks may outlive the
        // cycle when it is abandoned at the deadline.
        struct CycleState
        {
            std::mutex mutex;
            std::condition_variable cv;
            std::vector<std::optional<DeviceSnapshot>> results;
            size_t remaining = 0;
            bool abandoned = false;
        };

        void FinishTask(CycleState &state, size_t index, std::optional<DeviceSnapshot> result)
        {
            {
                std::lock_guard<std::mutex> lock(state.mutex);
                if (result && !state.abandoned)
                    state.results[index] = std::move(result);
                --state.remaining;
            }
            state.cv.notify_all();
        }
    }

    ScanOrchestrator::ScanOrchestrator(common::AppConfig config, std::shared_ptr<DeviceProber> prober,
                                       std::shared_ptr<common::Clock> clock)
        : m_config(std::move(config)),
          m_prober(std::move(prober)),
          m_clock(std::move(clock)),
          m_store(SeedFleet(m_config.devices, m_config.scan_interval_seconds, m_clock->Now())),
          m_pool(static_cast<size_t>(std::max(1, m_config.max_concurrency))),
          m_cycleRunning(false),
          m_stopping(false),
          m_startedCycles(0),
          m_completedCycles(0),
          m_running(false)
    {
    }

    ScanOrchestrator::~ScanOrchestrator()
    {
        Stop();
    }

    void ScanOrchestrator::SetCycleCallback(CycleCallback callback)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_callback = std::move(callback);
    }

    void ScanOrchestrator::Start()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping)
            throw ScanUnavailableError("scan orchestrator already stopped");
        if (m_running.exchange(true))
            return;

        std::cout << "[Scan] Scheduler started: " << m_config.devices.size() << " devices every "
                  << m_config.scan_interval_seconds << "s\n";
        m_scheduler = std::thread(&ScanOrchestrator::ScheduleLoop, this);
    }

    void ScanOrchestrator::Stop()
    {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (!m_stopping)
            {
                m_stopping = true;
                m_cv.notify_all();
            }
            m_cv.wait(lock, [this]
                      { return !m_cycleRunning; });
        }

        if (m_scheduler.joinable())
            m_scheduler.join();
        if (m_running.exchange(false))
            std::cout << "[Scan] Scheduler stopped\n";
        m_pool.Shutdown();
    }

    std::shared_ptr<const FleetSnapshot> ScanOrchestrator::GetCurrentSnapshot() const
    {
        return m_store.Read();
    }

    std::shared_ptr<const FleetSnapshot> ScanOrchestrator::TriggerScanNow()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        const uint64_t target = m_startedCycles + 1;
        while (true)
        {
            if (m_completedCycles >= target)
                return m_store.Read();
            if (m_stopping)
                throw ScanUnavailableError("scan orchestrator stopped");
            if (!m_cycleRunning)
                return RunLocked(lock);
            m_cv.wait(lock);
        }
    }

    std::shared_ptr<const FleetSnapshot> ScanOrchestrator::RunLocked(std::unique_lock<std::mutex> &lock)
    {
        m_cycleRunning = true;
        const uint64_t cycle = ++m_startedCycles;
        CycleCallback callback = m_callback;
        lock.unlock();

        std::shared_ptr<const FleetSnapshot> published;
        try
        {
            auto previous = m_store.Read();
            published = std::make_shared<const FleetSnapshot>(RunCycle(m_config.devices, *previous));
            m_store.Publish(published);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Scan] Cycle " << cycle << " failed: " << e.what() << "\n";
            lock.lock();
            m_cycleRunning = false;
            m_cv.notify_all();
            throw;
        }

        if (callback)
        {
            try
            {
                callback(published);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Scan] Cycle callback failed: " << e.what() << "\n";
            }
        }

        lock.lock();
        m_cycleRunning = false;
        ++m_completedCycles;
        m_cv.notify_all();
        return published;
    }

    FleetSnapshot ScanOrchestrator::RunCycle(const std::vector<common::DeviceConfig> &configs,
                                             const FleetSnapshot &previous)
    {
        const auto started = std::chrono::steady_clock::now();
        const auto deadline = started + std::chrono::seconds(std::max(1, m_config.cycle_deadline_seconds));

        auto state = std::make_shared<CycleState>();
        state->results.resize(configs.size());
        state->remaining = configs.size();

        std::shared_ptr<DeviceProber> prober = m_prober;
        for (size_t i = 0; i < configs.size(); ++i)
        {
            const common::DeviceConfig &config = configs[i];
            std::optional<DeviceSnapshot> prior;
            if (const DeviceSnapshot *p = previous.Find(config.id))
                prior = *p;

            auto task = [state, prober, config, prior, i]()
            {
                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    if (state->abandoned)
                    {
                        --state->remaining;
                        return;
                    }
                }
                try
                {
                    FinishTask(*state, i, prober->Probe(config, prior ? &*prior : nullptr));
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[Scan] " << config.id << " probe failed: " << e.what() << "\n";
                    FinishTask(*state, i, std::nullopt);
                }
            };
            bool queued = m_pool.Submit(std::move(task));
            if (!queued)
                FinishTask(*state, i, std::nullopt);
        }

        std::vector<std::optional<DeviceSnapshot>> results;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            state->cv.wait_until(lock, deadline, [&state]
                                 { return state->remaining == 0; });
            state->abandoned = true;
            results = std::move(state->results);
        }

        const common::Timestamp now = m_clock->Now();
        FleetSnapshot fleet;
        fleet.cycle = previous.cycle + 1;
        fleet.scan_interval_seconds = m_config.scan_interval_seconds;
        fleet.generated_at = std::max(now, previous.generated_at + std::chrono::duration_cast<common::Timestamp::duration>(
                                                                       std::chrono::microseconds(1)));
        fleet.devices.reserve(configs.size());

        size_t up = 0;
        for (size_t i = 0; i < configs.size(); ++i)
        {
            if (results[i])
            {
                if (results[i]->up)
                    ++up;
                fleet.devices.push_back(std::move(*results[i]));
                continue;
            }
            std::cout << "[Scan] " << configs[i].id << " missed the cycle deadline\n";
            fleet.devices.push_back(UnreachableSnapshot(configs[i], previous.Find(configs[i].id), now));
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        std::cout << "[Scan] Cycle " << fleet.cycle << ": " << up << "/" << configs.size() << " up in "
                  << elapsed.count() << " ms\n";
        return fleet;
    }

    void ScanOrchestrator::ScheduleLoop()
    {
        const auto interval = std::chrono::seconds(std::max(1, m_config.scan_interval_seconds));
        auto next = std::chrono::steady_clock::now();

        std::unique_lock<std::mutex> lock(m_mutex);
        while (!m_stopping)
        {
            if (!m_cycleRunning)
            {
                try
                {
                    RunLocked(lock);
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[Scan] Scheduled cycle failed: " << e.what() << "\n";
                }
            }

            // Fixed cadence: ticks missed while a cycle overran are skipped.
            const auto now = std::chrono::steady_clock::now();
            next += interval;
            while (next <= now)
                next += interval;

            m_cv.wait_until(lock, next, [this]
                            { return m_stopping; });
        }
    }
}
