#include "MetricsParser.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cstdint>
#include <map>
#include <sstream>

namespace lan_watch::probes
{
    namespace
    {
        std::vector<std::string> Lines(const std::string &text)
        {
            std::vector<std::string> lines;
            std::istringstream ss(text);
            std::string line;
            while (std::getline(ss, line))
            {
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                lines.push_back(line);
            }
            return lines;
        }

        std::string FirstToken(const std::string &line)
        {
            std::istringstream ss(line);
            std::string token;
            ss >> token;
            return token;
        }

        bool AllDigits(const std::string &s)
        {
            return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
        }

        struct CpuSample
        {
            uint64_t idle = 0;
            uint64_t total = 0;
        };

        std::optional<CpuSample> ParseCpuLine(const std::string &line)
        {
            std::istringstream ss(line);
            std::string label;
            ss >> label;
            if (label != "cpu")
                return std::nullopt;

            std::vector<uint64_t> fields;
            std::string token;
            while (ss >> token)
            {
                if (!AllDigits(token))
                    return std::nullopt;
                fields.push_back(std::stoull(token));
            }
            if (fields.size() < 4)
                return std::nullopt;

            CpuSample sample;
            sample.idle = fields[3] + (fields.size() > 4 ? fields[4] : 0); // idle + iowait
            for (auto v : fields)
                sample.total += v;
            return sample;
        }

        std::optional<double> KbValue(const std::string &value)
        {
            std::string digits;
            for (char c : value)
            {
                if (std::isdigit(static_cast<unsigned char>(c)))
                    digits.push_back(c);
            }
            if (digits.empty())
                return std::nullopt;
            return std::stod(digits);
        }
    }

    std::optional<int> ParseWhoSessions(const std::string &who, const std::string &monitorUser)
    {
        int total = 0;
        int others = 0;
        for (const auto &line : Lines(who))
        {
            std::string user = FirstToken(line);
            if (user.empty())
                continue;
            ++total;
            if (user != monitorUser)
                ++others;
        }
        if (total == 0)
            return std::nullopt;
        return others;
    }

    std::optional<int> ParseUptimeUsers(const std::string &uptime)
    {
        std::istringstream ss(uptime);
        std::string previous;
        std::string token;
        while (ss >> token)
        {
            if (token.compare(0, 4, "user") == 0 && AllDigits(previous))
                return std::stoi(previous);
            previous = token;
        }
        return std::nullopt;
    }

    int CountUserSessions(const std::string &who, const std::string &user)
    {
        int count = 0;
        for (const auto &line : Lines(who))
        {
            if (!user.empty() && FirstToken(line) == user)
                ++count;
        }
        return count;
    }

    std::optional<double> ParseCpuSamples(const std::string &statOutput)
    {
        std::vector<CpuSample> samples;
        for (const auto &line : Lines(statOutput))
        {
            if (line.compare(0, 4, "cpu ") != 0)
                continue;
            auto sample = ParseCpuLine(line);
            if (!sample)
                return std::nullopt;
            samples.push_back(*sample);
        }
        if (samples.size() < 2)
            return std::nullopt;

        const CpuSample &first = samples[0];
        const CpuSample &second = samples[1];
        double deltaIdle = second.idle > first.idle ? static_cast<double>(second.idle - first.idle) : 0.0;
        double deltaTotal = second.total > first.total ? static_cast<double>(second.total - first.total) : 1.0;
        return 100.0 * (1.0 - deltaIdle / deltaTotal);
    }

    std::optional<double> ParseMemInfo(const std::string &meminfo)
    {
        std::map<std::string, std::string> info;
        for (const auto &line : Lines(meminfo))
        {
            size_t colon = line.find(':');
            if (colon == std::string::npos)
                continue;
            info[line.substr(0, colon)] = line.substr(colon + 1);
        }

        auto total = info.count("MemTotal") ? KbValue(info["MemTotal"]) : std::nullopt;
        auto available = info.count("MemAvailable") ? KbValue(info["MemAvailable"]) : std::nullopt;
        if (!total || !available || *total <= 0.0)
            return std::nullopt;
        return 100.0 * (1.0 - *available / *total);
    }

    std::optional<double> ParseDiskUsage(const std::string &df)
    {
        auto lines = Lines(df);
        if (lines.size() < 2)
            return std::nullopt;

        std::istringstream ss(lines[1]);
        std::vector<std::string> cols;
        std::string col;
        while (ss >> col)
            cols.push_back(col);
        if (cols.size() < 5)
            return std::nullopt;

        std::string use = cols[4];
        if (!use.empty() && use.back() == '%')
            use.pop_back();
        if (!AllDigits(use))
            return std::nullopt;
        return std::stod(use);
    }

    std::vector<std::string> ParseIpv4Addresses(const std::string &text)
    {
        std::string normalized = text;
        std::replace(normalized.begin(), normalized.end(), '/', ' ');

        std::vector<std::string> addresses;
        std::istringstream ss(normalized);
        std::string token;
        std::string previous;
        while (ss >> token)
        {
            bool isBroadcast = previous == "brd";
            previous = token;
            if (isBroadcast || std::count(token.begin(), token.end(), '.') != 3)
                continue;
            if (!std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c) || c == '.'; }))
                continue;
            in_addr addr{};
            if (inet_pton(AF_INET, token.c_str(), &addr) != 1)
                continue;
            if (token.compare(0, 4, "127.") == 0 || token.compare(0, 8, "169.254.") == 0)
                continue;
            if (std::find(addresses.begin(), addresses.end(), token) == addresses.end())
                addresses.push_back(token);
        }
        return addresses;
    }
}
