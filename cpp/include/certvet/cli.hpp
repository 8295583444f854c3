#pragma once

namespace certvet::cli
{
    // Process exit codes
    inline constexpr int kExitOK = 0;
    inline constexpr int kExitTrustFail = 1;  // at least one store rejected the chain
    inline constexpr int kExitInputError = 2; // bad arguments, config, data or network failure

    /** Parse arguments, dispatch the subcommand and return the exit code. */
    int run(int argc, char *argv[]);

} // namespace certvet::cli
