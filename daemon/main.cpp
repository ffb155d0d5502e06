#include "../common/ConfigLoader.hpp"
#include "../common/WakeOnLan.hpp"
#include "../monitor/DeviceProber.hpp"
#include "../monitor/ScanOrchestrator.hpp"
#include "../monitor/SnapshotJson.hpp"
#include "../probes/Gns3Installation.hpp"
#include <chrono>
#include <csignal>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

using namespace lan_watch;

namespace
{
    volatile std::sig_atomic_t g_stopRequested = 0;

    void HandleSignal(int)
    {
        g_stopRequested = 1;
    }

    struct Options
    {
        std::optional<std::string> configPath;
        std::string statusFile;
        bool once = false;
        std::string wakeId;
    };

    void PrintUsage(const char *argv0)
    {
        std::cerr << "Usage: " << argv0 << " [--config PATH] [--status-file PATH] [--once] [--wake ID]\n";
    }

    bool ParseArgs(int argc, char **argv, Options &options)
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            if (arg == "--once")
            {
                options.once = true;
            }
            else if ((arg == "--config" || arg == "--status-file" || arg == "--wake") && i + 1 < argc)
            {
                std::string value = argv[++i];
                if (arg == "--config")
                    options.configPath = value;
                else if (arg == "--status-file")
                    options.statusFile = value;
                else
                    options.wakeId = value;
            }
            else
            {
                return false;
            }
        }
        return true;
    }

    // Written next to the target and renamed over it so readers never see a partial file.
    void WriteStatusFile(const std::string &path, const nlohmann::json &doc)
    {
        const std::string tmp = path + ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out)
                throw std::runtime_error("cannot write " + tmp);
            out << doc.dump(2) << "\n";
        }
        if (std::rename(tmp.c_str(), path.c_str()) != 0)
            throw std::runtime_error("cannot rename " + tmp + " to " + path);
    }

    std::unique_ptr<monitor::ScanOrchestrator> CreateOrchestrator(const common::AppConfig &config)
    {
        auto clock = std::make_shared<common::SystemClock>();
        auto prober = std::make_shared<monitor::DeviceProber>(monitor::CreateDefaultProbes(config.timeouts),
                                                              config.timeouts, clock);
        return std::make_unique<monitor::ScanOrchestrator>(config, prober, clock);
    }

    int Wake(const common::AppConfig &config, const std::string &id)
    {
        const common::DeviceConfig *device = nullptr;
        for (const auto &d : config.devices)
        {
            if (d.id == id)
                device = &d;
        }
        if (!device)
        {
            std::cerr << "[Daemon] Unknown device: " << id << "\n";
            return 1;
        }

        std::string mac = device->mac;
        if (mac.empty())
        {
            std::cout << "[Daemon] No MAC configured for " << id << ", scanning to learn it\n";
            auto orchestrator = CreateOrchestrator(config);
            auto fleet = orchestrator->TriggerScanNow();
            const monitor::DeviceSnapshot *snapshot = fleet->Find(id);
            if (snapshot && snapshot->mac)
                mac = *snapshot->mac;
        }
        if (mac.empty())
        {
            std::cerr << "[Daemon] No MAC known for " << id << "\n";
            return 1;
        }

        common::SendMagicPacket(mac, device->broadcast);
        std::cout << "[Daemon] Magic packet sent to " << mac << " ("
                  << (device->broadcast.empty() ? "255.255.255.255" : device->broadcast) << ")\n";
        return 0;
    }
}

int main(int argc, char **argv)
{
    Options options;
    if (!ParseArgs(argc, argv, options))
    {
        PrintUsage(argv[0]);
        return 2;
    }

    try
    {
        common::AppConfig config = common::ConfigLoader::LoadFromEnvironment(options.configPath);

        if (!options.wakeId.empty())
            return Wake(config, options.wakeId);

        auto orchestrator = CreateOrchestrator(config);

        // Checked once: the local install does not change while the daemon runs.
        const probes::Gns3Installation gns3 = probes::CheckGns3Installation();
        std::cout << "[Daemon] Local GNS3 " << (gns3.installed ? "found" : "not found") << "\n";

        if (options.once)
        {
            auto fleet = orchestrator->TriggerScanNow();
            const nlohmann::json doc = monitor::StatusDocument(*fleet, gns3);
            if (!options.statusFile.empty())
                WriteStatusFile(options.statusFile, doc);
            std::cout << doc.dump(2) << "\n";
            return 0;
        }

        const std::string statusFile = options.statusFile;
        if (!statusFile.empty())
        {
            orchestrator->SetCycleCallback([statusFile, gns3](const std::shared_ptr<const monitor::FleetSnapshot> &fleet)
                                           { WriteStatusFile(statusFile, monitor::StatusDocument(*fleet, gns3)); });
        }

        std::signal(SIGINT, HandleSignal);
        std::signal(SIGTERM, HandleSignal);

        orchestrator->Start();
        while (!g_stopRequested)
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

        std::cout << "[Daemon] Shutting down...\n";
        orchestrator->Stop();
    }
    catch (const common::ConfigError &e)
    {
        std::cerr << "Fatal Config Error: " << e.what() << '\n';
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal Daemon Error: " << e.what() << '\n';
        return -1;
    }

    return 0;
}
