// panic_handler.hpp - Panic Handler for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <iostream>
#include <fstream>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <functional>
#include <string>

#include <execinfo.h>
#include <unistd.h>
#include <sys/utsname.h>

namespace Yakumo::Utils {
    // Writes yakumo_panic.txt on fatal signals and uncaught exceptions.
    // SIGINT/SIGTERM are not trapped, the server closes its sessions on those.
    //
    // A crash skips session teardown, so the forwarding rules stay in the kernel. The state dumper
    // registered by the server lists them so an operator can clean up by hand.
    class PanicHandler {
    public:
        using StateDumper = std::function<void(std::ostream&)>;

        static void init(StateDumper dumper = nullptr) {
            stateDumper() = std::move(dumper);

            std::set_terminate(terminateHandler);
            for (int sig : {SIGSEGV, SIGABRT, SIGFPE, SIGILL, SIGBUS}) {
                std::signal(sig, signalHandler);
            }
        }

    private:
        static StateDumper& stateDumper() {
            static StateDumper dumper;
            return dumper;
        }

        static const char* signalName(int signal) {
            switch (signal) {
                case SIGSEGV: return "Segmentation Fault";
                case SIGABRT: return "Abort (SIGABRT)";
                case SIGFPE:  return "Floating Point Exception";
                case SIGILL:  return "Illegal Instruction";
                case SIGBUS:  return "Bus Error";
                default:      return "Unknown Fatal Signal";
            }
        }

        static void signalHandler(int signal) {
            // Restore the default action so a fault inside the dump itself ends the process
            std::signal(signal, SIG_DFL);
            panic(signalName(signal));
            std::_Exit(128 + signal);
        }

        static void terminateHandler() {
            std::string reason = "Unknown termination cause";
            if (auto eptr = std::current_exception()) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& e) {
                    reason = std::string("Unhandled exception: ") + e.what();
                } catch (...) {
                    reason = "Unhandled non-standard exception";
                }
            }
            panic(reason);
            std::_Exit(EXIT_FAILURE);
        }

        static void writeBacktrace(std::ostream& out) {
            void* frames[64];
            int count = backtrace(frames, 64);
            char** symbols = backtrace_symbols(frames, count);
            if (!symbols) {
                out << "(no symbols)\n";
                return;
            }
            for (int i = 0; i < count; ++i) {
                out << "#" << i << " " << symbols[i] << "\n";
            }
            free(symbols);
        }

        static void writeHost(std::ostream& out) {
            struct utsname host;
            if (uname(&host) == 0) {
                out << "Host: " << host.nodename << ", " << host.sysname << " " << host.release << " (" << host.machine << ")\n";
            }
            out << "PID: " << getpid() << ", UID: " << getuid() << "\n";
        }

        static void panic(const std::string& reason) {
            std::cerr << "\n***\033[31m YAKUMO PANIC \033[0m***\n";
            std::cerr << "Reason: " << reason << "\n";

            std::ofstream dump("yakumo_panic.txt", std::ios::trunc);
            if (!dump.is_open()) {
                std::cerr << "Could not write yakumo_panic.txt\n";
                return;
            }

            std::time_t now = std::time(nullptr);
            char stamp[64];
            std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", std::localtime(&now));

            dump << "==== YAKUMO PANIC ====\n";
            dump << "Time: " << stamp << "\n";
            dump << "Reason: " << reason << "\n";
            writeHost(dump);
            dump << "---- Forwarding state ----\n";
            if (stateDumper())
                stateDumper()(dump);
            else
                dump << "(not available)\n";
            dump << "---- Backtrace ----\n";
            writeBacktrace(dump);
            dump << "======================\n";

            std::cerr << "Forwarding rules of open sessions were left in place, see yakumo_panic.txt\n";
        }
    };
}
