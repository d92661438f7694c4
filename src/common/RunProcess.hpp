//===----------------------------------------------------------------------===//
//
// Part of the Perc project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: common/RunProcess.hpp
// Purpose: Run a compiled program or the perc binary from a test and collect
//          what it printed together with how it ended.
// Key invariants: exitCode is -1 only when the child could not be started;
//                 a child killed by a signal reports 128 + signal.
// Ownership/Lifetime: Arguments are copied into the command line.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace perc::common
{

struct RunResult
{
    int exitCode = 0;
    std::string out; ///< Standard output, followed by stderr when merged.
};

struct RunOptions
{
    /// @brief File fed to the child's standard input.
    std::optional<std::string> stdinPath;

    /// @brief Capture standard error into RunResult::out as well.
    bool mergeStderr = false;
};

/// @brief Run `argv[0] argv[1..]` through the host shell and wait for it.
RunResult runProcess(const std::vector<std::string> &argv, const RunOptions &options = {});

} // namespace perc::common
