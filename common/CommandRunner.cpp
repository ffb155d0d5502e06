#include "CommandRunner.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace lan_watch::common
{
    namespace
    {
        using Clock = std::chrono::steady_clock;

        int RemainingMs(Clock::time_point deadline)
        {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
            return left > 0 ? static_cast<int>(left) : 0;
        }

        void KillAndReap(pid_t pid)
        {
            kill(pid, SIGKILL);
            int status = 0;
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
            {
            }
        }
    }

    ProbeResult<CommandOutput> RunCommand(const std::vector<std::string> &argv,
                                          std::chrono::milliseconds timeout)
    {
        if (argv.empty())
            return ProbeResult<CommandOutput>::Failure(FailureKind::ProbeError, "empty command");

        // Everything the child touches is prepared before fork.
        std::vector<char *> args;
        args.reserve(argv.size() + 1);
        for (const auto &arg : argv)
            args.push_back(const_cast<char *>(arg.c_str()));
        args.push_back(nullptr);

        int fds[2];
        if (pipe2(fds, O_CLOEXEC) != 0)
            return ProbeResult<CommandOutput>::Failure(FailureKind::ProbeError, std::string("pipe: ") + std::strerror(errno));

        pid_t pid = fork();
        if (pid < 0)
        {
            int err = errno;
            close(fds[0]);
            close(fds[1]);
            return ProbeResult<CommandOutput>::Failure(FailureKind::ProbeError, std::string("fork: ") + std::strerror(err));
        }

        if (pid == 0)
        {
            dup2(fds[1], STDOUT_FILENO);
            int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0)
                dup2(devnull, STDERR_FILENO);
            execvp(args[0], args.data());
            _exit(127);
        }

        close(fds[1]);
        const auto deadline = Clock::now() + timeout;

        CommandOutput result;
        char buf[4096];
        bool eof = false;
        while (!eof)
        {
            int waitMs = RemainingMs(deadline);
            if (waitMs == 0)
            {
                close(fds[0]);
                KillAndReap(pid);
                return ProbeResult<CommandOutput>::Failure(FailureKind::Timeout, argv[0] + " timed out");
            }

            pollfd pfd{};
            pfd.fd = fds[0];
            pfd.events = POLLIN;
            int r = poll(&pfd, 1, waitMs);
            if (r < 0 && errno == EINTR)
                continue;
            if (r <= 0)
                continue;

            ssize_t n = read(fds[0], buf, sizeof(buf));
            if (n > 0)
                result.output.append(buf, static_cast<size_t>(n));
            else if (n == 0 || errno != EINTR)
                eof = true;
        }
        close(fds[0]);

        // stdout is closed; give the child until the deadline to exit.
        while (true)
        {
            int status = 0;
            pid_t w = waitpid(pid, &status, WNOHANG);
            if (w == pid)
            {
                result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
                return ProbeResult<CommandOutput>::Success(std::move(result));
            }
            if (w < 0 && errno != EINTR)
                return ProbeResult<CommandOutput>::Failure(FailureKind::ProbeError, std::string("waitpid: ") + std::strerror(errno));
            if (RemainingMs(deadline) == 0)
            {
                KillAndReap(pid);
                return ProbeResult<CommandOutput>::Failure(FailureKind::Timeout, argv[0] + " did not exit in time");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }
}
