#pragma once

#include <QString>

namespace driftwatch {

class ScanCli
{
public:
    // Runs one scan and renders the result. Returns the process exit code:
    // 0 on a completed scan (changes or not), 1 on usage errors,
    // 2 when the monitored directory is unavailable, 3 on any other failure.
    int run(int argc, char *argv[]);

    static constexpr int kExitOk = 0;
    static constexpr int kExitUsage = 1;
    static constexpr int kExitDirectoryUnavailable = 2;
    static constexpr int kExitFailure = 3;
};

} // namespace driftwatch
