#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include "DeviceProber.hpp"
#include "Snapshot.hpp"
#include "StateStore.hpp"
#include "WorkerPool.hpp"
#include "../common/Clock.hpp"
#include "../common/DeviceConfig.hpp"

namespace lan_watch::monitor
{
    // Raised by TriggerScanNow() once the orchestrator has been stopped.
    class ScanUnavailableError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Runs scan cycles over the configured fleet, on a fixed schedule and on
    // demand, and publishes each result to the state store. One cycle runs at
    // a time.
    class ScanOrchestrator
    {
    public:
        using CycleCallback = std::function<void(const std::shared_ptr<const FleetSnapshot> &)>;

        ScanOrchestrator(common::AppConfig config, std::shared_ptr<DeviceProber> prober,
                         std::shared_ptr<common::Clock> clock);
        ~ScanOrchestrator();

        ScanOrchestrator(const ScanOrchestrator &) = delete;
        ScanOrchestrator &operator=(const ScanOrchestrator &) = delete;

        // Called after every publish, from the thread that ran the cycle. Set before Start().
        void SetCycleCallback(CycleCallback callback);

        // Scheduled mode: first cycle immediately, then every scan interval.
        void Start();

        // Waits for an in-flight cycle, then stops the scheduler and the workers.
        void Stop();

        bool IsRunning() const { return m_running; }

        // Blocks until a cycle started after this call has been published and
        // returns it. Throws ScanUnavailableError after Stop().
        std::shared_ptr<const FleetSnapshot> TriggerScanNow();

        std::shared_ptr<const FleetSnapshot> GetCurrentSnapshot() const;

        // One probing pass over configs. Devices that miss the cycle deadline
        // are folded as unreachable. Does not publish.
        FleetSnapshot RunCycle(const std::vector<common::DeviceConfig> &configs, const FleetSnapshot &previous);

        const common::AppConfig &Config() const { return m_config; }

    private:
        void ScheduleLoop();

        // Runs one cycle as the sole runner. lock is held on entry and on return.
        std::shared_ptr<const FleetSnapshot> RunLocked(std::unique_lock<std::mutex> &lock);

        common::AppConfig m_config;
        std::shared_ptr<DeviceProber> m_prober;
        std::shared_ptr<common::Clock> m_clock;
        StateStore m_store;
        WorkerPool m_pool;
        CycleCallback m_callback;

        std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_cycleRunning;
        bool m_stopping;
        uint64_t m_startedCycles;
        uint64_t m_completedCycles;

        std::atomic<bool> m_running;
        std::thread m_scheduler;
    };
}
