#pragma once
#include <iosfwd>

namespace keel {
    constexpr int kExitUsage = 2;
    constexpr int kExitInterrupted = 130;
    constexpr int kExitInternal = 1;

    /**
     * @brief The keel command line: load the Keelfile, plan, run.
     *
     * Help, plans and command echo go to `out`; diagnostics go to `err`.
     * Returns 0 on success, the failing command's exit status, kExitUsage for
     * usage, parse and resolution errors, kExitInterrupted when interrupted, and
     * kExitInternal for any other failure.
     */
    int run_cli(int argc, char **argv, std::ostream &out, std::ostream &err, bool color = false);
} // namespace keel
