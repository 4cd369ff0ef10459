// process_runner.hpp - External command execution for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace Yakumo::Utils {
    struct CommandResult {
        bool started = false;   // fork/exec succeeded
        bool timedOut = false;  // Killed after the deadline
        int exitStatus = -1;    // Exit code, or 128 + signal number
        std::string out;
        std::string err;

        bool succeeded() const { return started && !timedOut && exitStatus == 0; }
    };

    // Runs a command given as argv. Abstract so the nft provider can be driven by a scripted runner in tests.
    class CommandRunner {
        public:
            virtual ~CommandRunner() = default;
            virtual CommandResult run(const std::vector<std::string>& argv) = 0;
    };

    // fork + exec without a shell. The child is killed if it outlives the timeout.
    class ProcessRunner : public CommandRunner {
        public:
            explicit ProcessRunner(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
                : mTimeout(timeout) {}

            CommandResult run(const std::vector<std::string>& argv) override;

            std::chrono::milliseconds timeout() const { return mTimeout; }

        private:
            std::chrono::milliseconds mTimeout;
    };
}
