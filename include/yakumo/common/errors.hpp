// errors.hpp - Error types for Yakumo
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace Yakumo {
    // Base of every error the session manager reports to its callers
    class Error : public std::runtime_error {
        public:
            using std::runtime_error::runtime_error;
    };

    // Malformed client input. Nothing was changed.
    class ValidationError : public Error {
        public:
            using Error::Error;
    };

    // No free ingress port. Nothing was changed.
    class ResourceExhausted : public Error {
        public:
            using Error::Error;
    };

    // Unknown session ID
    class NotFound : public Error {
        public:
            using Error::Error;
    };

    // The packet filter could not be reached (bootstrap or health probe)
    class ProviderUnavailable : public Error {
        public:
            using Error::Error;
    };

    // An install step failed. Rollback has been attempted and the port released when this is thrown.
    class ProvisioningError : public Error {
        public:
            ProvisioningError(const std::string& step, const std::string& diagnostic)
                : Error("Provisioning failed at step '" + step + "': " + diagnostic),
                  mStep(step), mDiagnostic(diagnostic) {}

            const std::string& step() const { return mStep; }
            const std::string& diagnostic() const { return mDiagnostic; }

        private:
            std::string mStep;
            std::string mDiagnostic;
    };

    // One or more teardown steps failed. The session is gone and its port was released anyway.
    class TeardownError : public Error {
        public:
            TeardownError(const std::string& sessionID, std::vector<std::string> failures)
                : Error(mSummarize(sessionID, failures)),
                  mSessionID(sessionID), mFailures(std::move(failures)) {}

            const std::string& sessionID() const { return mSessionID; }
            const std::vector<std::string>& failures() const { return mFailures; }

        private:
            static std::string mSummarize(const std::string& sessionID, const std::vector<std::string>& failures) {
                std::string msg = "Teardown of session " + sessionID + " finished with " + std::to_string(failures.size()) + " failed step(s)";
                if (!failures.empty())
                    msg += ", first: " + failures.front();
                return msg;
            }

            std::string mSessionID;
            std::vector<std::string> mFailures;
    };
}
