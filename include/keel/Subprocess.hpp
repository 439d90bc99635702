#pragma once
#include <string>
#include <utility>
#include <vector>

namespace keel {
    using EnvPairs = std::vector<std::pair<std::string, std::string> >;

    struct CaptureResult {
        int exit_code = -1;
        std::string output; // raw standard output, untrimmed
    };

    // Run `cmd` through /bin/sh -c, inheriting cwd, environment and standard streams,
    // with `exports` added to the child's environment.
    // Returns the exit status, 128 + signal number when the child was killed,
    // or -1 when the process could not be started or waited for.
    int run_shell(const std::string &cmd, const EnvPairs &exports = {});

    // Run `cmd` through /bin/sh -c and collect its standard output.
    // Standard error stays attached to the parent's.
    CaptureResult capture_shell(const std::string &cmd);
} // namespace keel
