// process_runner.cpp - External command execution for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <yakumo/common/process_runner.hpp>
#include <yakumo/common/utils.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <thread>

namespace Yakumo::Utils {
    namespace {
        // Closes both ends of a pipe pair that is still open
        struct PipePair {
            int fds[2] = {-1, -1};

            ~PipePair() {
                for (int& fd : fds) {
                    if (fd >= 0) {
                        ::close(fd);
                        fd = -1;
                    }
                }
            }

            void closeEnd(int i) {
                if (fds[i] >= 0) {
                    ::close(fds[i]);
                    fds[i] = -1;
                }
            }
        };

        int decodeStatus(int status) {
            if (WIFEXITED(status))
                return WEXITSTATUS(status);
            if (WIFSIGNALED(status))
                return 128 + WTERMSIG(status);
            return -1;
        }

        int waitForChild(pid_t pid) {
            int status = 0;
            while (waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) {
                    return -1;
                }
            }
            return decodeStatus(status);
        }

        // Reaps the child if it exits before the deadline. False means it is still running.
        bool reapUntil(pid_t pid, std::chrono::steady_clock::time_point deadline, int& exitStatus) {
            for (;;) {
                int status = 0;
                pid_t done = waitpid(pid, &status, WNOHANG);
                if (done == pid) {
                    exitStatus = decodeStatus(status);
                    return true;
                }
                if (done < 0 && errno != EINTR) {
                    exitStatus = -1;
                    return true;
                }
                if (std::chrono::steady_clock::now() >= deadline)
                    return false;
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
        }
    }

    CommandResult ProcessRunner::run(const std::vector<std::string>& argv) {
        CommandResult result;
        if (argv.empty()) {
            result.err = "empty command";
            return result;
        }

        // Copy the arguments to mutable structures before forking
        std::vector<std::vector<char>> argvData;
        std::vector<char*> rawArgv;
        argvData.reserve(argv.size());
        for (const auto& arg : argv) {
            argvData.emplace_back(arg.begin(), arg.end());
            argvData.back().push_back('\0');
        }
        for (auto& arg : argvData) {
            rawArgv.push_back(arg.data());
        }
        rawArgv.push_back(nullptr);

        const bool pathSearch = argv[0].find('/') == std::string::npos;

        PipePair outPipe, errPipe;
        if (pipe2(outPipe.fds, O_CLOEXEC) != 0 || pipe2(errPipe.fds, O_CLOEXEC) != 0) {
            result.err = std::string("pipe2: ") + std::strerror(errno);
            return result;
        }

        pid_t pid = fork();
        if (pid < 0) {
            result.err = std::string("fork: ") + std::strerror(errno);
            return result;
        }

        if (pid == 0) {
            // Child: only async-signal-safe calls from here on
            dup2(outPipe.fds[1], STDOUT_FILENO);
            dup2(errPipe.fds[1], STDERR_FILENO);
            if (pathSearch)
                execvp(rawArgv[0], rawArgv.data());
            else
                execv(rawArgv[0], rawArgv.data());

            static const char msg[] = "exec failed\n";
            ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
            (void)ignored;
            _exit(127);
        }

        result.started = true;
        outPipe.closeEnd(1);
        errPipe.closeEnd(1);

        const auto deadline = std::chrono::steady_clock::now() + mTimeout;
        char buf[4096];

        while (outPipe.fds[0] >= 0 || errPipe.fds[0] >= 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                result.timedOut = true;
                break;
            }

            pollfd pfds[2];
            nfds_t count = 0;
            int* owners[2];
            std::string* sinks[2];
            if (outPipe.fds[0] >= 0) {
                pfds[count] = {outPipe.fds[0], POLLIN, 0};
                owners[count] = &outPipe.fds[0];
                sinks[count] = &result.out;
                count++;
            }
            if (errPipe.fds[0] >= 0) {
                pfds[count] = {errPipe.fds[0], POLLIN, 0};
                owners[count] = &errPipe.fds[0];
                sinks[count] = &result.err;
                count++;
            }

            int ready = poll(pfds, count, static_cast<int>(remaining.count()));
            if (ready < 0) {
                if (errno == EINTR)
                    continue;
                result.err += std::string("poll: ") + std::strerror(errno);
                result.timedOut = true; // Treat as a hung child, it gets killed below
                break;
            }

            for (nfds_t i = 0; i < count; ++i) {
                if (!(pfds[i].revents & (POLLIN | POLLHUP | POLLERR)))
                    continue;

                ssize_t n = read(pfds[i].fd, buf, sizeof(buf));
                if (n > 0) {
                    sinks[i]->append(buf, static_cast<size_t>(n));
                } else if (n == 0 || errno != EINTR) {
                    ::close(*owners[i]);
                    *owners[i] = -1;
                }
            }
        }

        // The child may close its output and keep running
        if (!result.timedOut && !reapUntil(pid, deadline, result.exitStatus)) {
            result.timedOut = true;
        }

        if (result.timedOut) {
            kill(pid, SIGKILL);
            waitForChild(pid);
            result.exitStatus = -1;
            warn("Command timed out after " + std::to_string(mTimeout.count()) + " ms and was killed: " + joinCommand(argv));
            return result;
        }

        return result;
    }
}
